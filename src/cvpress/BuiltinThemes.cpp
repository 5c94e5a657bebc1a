#include "cvpress/ThemeRegistry.hpp"

namespace cvpress {

// Shared section markup. Every named section sits behind an exists() guard,
// so a section missing from the context leaves no heading.
static const char* kSectionsHtml = R"HTML(
{% if exists("work") %}
<section class="work">
<h2>{{ escape(work.title) }}</h2>
{% for e in work.entries %}
<div class="entry">
{% if existsIn(e, "heading") %}<h3>{{ escape(e.heading) }}</h3>{% endif %}
{% if existsIn(e, "dates") %}<p class="dates">{{ escape(e.dates) }}</p>{% endif %}
{% if existsIn(e, "location") %}<p class="where">{{ escape(e.location) }}</p>{% endif %}
{% if existsIn(e, "summary") %}<p>{{ escape(e.summary) }}</p>{% endif %}
<ul>
{% if existsIn(e, "highlights") %}{% for h in e.highlights %}<li>{{ escape(h) }}</li>
{% endfor %}{% endif %}
</ul>
</div>
{% endfor %}
</section>
{% endif %}
{% if exists("education") %}
<section class="education">
<h2>{{ escape(education.title) }}</h2>
{% for e in education.entries %}
<div class="entry">
{% if existsIn(e, "heading") %}<h3>{{ escape(e.heading) }}</h3>{% endif %}
{% if existsIn(e, "dates") %}<p class="dates">{{ escape(e.dates) }}</p>{% endif %}
{% if existsIn(e, "score") %}<p>Score: {{ escape(e.score) }}</p>{% endif %}
<ul>
{% if existsIn(e, "courses") %}{% for c in e.courses %}<li>{{ escape(c) }}</li>
{% endfor %}{% endif %}
</ul>
</div>
{% endfor %}
</section>
{% endif %}
{% if exists("projects") %}
<section class="projects">
<h2>{{ escape(projects.title) }}</h2>
{% for e in projects.entries %}
<div class="entry">
{% if existsIn(e, "heading") %}<h3>{{ escape(e.heading) }}</h3>{% endif %}
{% if existsIn(e, "dates") %}<p class="dates">{{ escape(e.dates) }}</p>{% endif %}
{% if existsIn(e, "description") %}<p>{{ escape(e.description) }}</p>{% endif %}
<ul>
{% if existsIn(e, "highlights") %}{% for h in e.highlights %}<li>{{ escape(h) }}</li>
{% endfor %}{% endif %}
</ul>
{% if existsIn(e, "keywords_text") %}<p class="keywords">{{ escape(e.keywords_text) }}</p>{% endif %}
</div>
{% endfor %}
</section>
{% endif %}
{% if exists("skills") %}
<section class="skills">
<h2>{{ escape(skills.title) }}</h2>
<ul>
{% for e in skills.entries %}<li>{% if existsIn(e, "name") %}<strong>{{ escape(e.name) }}</strong>{% endif %}{% if existsIn(e, "level") %} ({{ escape(e.level) }}){% endif %}{% if existsIn(e, "keywords_text") %}: {{ escape(e.keywords_text) }}{% endif %}</li>
{% endfor %}
</ul>
</section>
{% endif %}
{% if exists("extra_sections") %}{% for x in extra_sections %}
<section class="extra" id="{{ escape(x.id) }}">
<h2>{{ escape(x.title) }}</h2>
{{ x.html }}
</section>
{% endfor %}{% endif %}
)HTML";

static const char* kHeaderHtml = R"HTML(<!doctype html>
<html>
<head>
<meta charset="utf-8"/>
<title>{% if exists("basics") %}{% if existsIn(basics, "name") %}{{ escape(basics.name) }}{% else %}Resume{% endif %}{% else %}Resume{% endif %}</title>
<style>
{{ css }}
</style>
</head>
<body>
{% if exists("basics") %}
<header>
{% if existsIn(basics, "name") %}<h1>{{ escape(basics.name) }}</h1>{% endif %}
{% if existsIn(basics, "label") %}<p class="label">{{ escape(basics.label) }}</p>{% endif %}
<p class="contact">{% if existsIn(basics, "email") %}<span>{{ escape(basics.email) }}</span> {% endif %}{% if existsIn(basics, "phone") %}<span>{{ escape(basics.phone) }}</span> {% endif %}{% if existsIn(basics, "url") %}<span>{{ escape(basics.url) }}</span> {% endif %}{% if existsIn(basics, "location") %}<span>{% if existsIn(basics.location, "city") %}{{ escape(basics.location.city) }}{% endif %}{% if existsIn(basics.location, "region") %}, {{ escape(basics.location.region) }}{% endif %}</span>{% endif %}</p>
{% if existsIn(basics, "profiles") %}{% for p in basics.profiles %}<p class="profile">{% if existsIn(p, "network") %}{{ escape(p.network) }}: {% endif %}{% if existsIn(p, "username") %}{{ escape(p.username) }}{% endif %}</p>
{% endfor %}{% endif %}
</header>
{% if existsIn(basics, "summary") %}
<section class="summary">
<h2>Summary</h2>
<p>{{ escape(basics.summary) }}</p>
</section>
{% endif %}
{% endif %}
)HTML";

static const char* kFooterHtml = "</body>\n</html>\n";

static const char* kDefaultCss =
    "body { font-family: Helvetica, Arial, sans-serif; font-size: 10pt; line-height: 1.3; margin: 0.75in; }\n"
    "h1 { font-size: 20pt; margin: 0 0 4px 0; }\n"
    "h2 { font-size: 14pt; margin: 14px 0 6px 0; border-bottom: 1px solid #444; }\n"
    "h3 { font-size: 11.5pt; margin: 8px 0 2px 0; }\n"
    ".label, .dates, .where { color: #555; margin: 0 0 2px 0; }\n"
    "ul { margin: 2px 0 6px 18px; padding: 0; }\n"
    "dt { font-weight: bold; }\n";

static const char* kMinimalCss =
    "body { font-family: sans-serif; font-size: 10pt; margin: 0.75in; }\n"
    "h2 { font-size: 12pt; text-transform: uppercase; letter-spacing: 1px; }\n"
    "h3 { font-size: 10.5pt; margin: 6px 0 0 0; }\n";

static const char* kClassicCss =
    "body { font-family: Georgia, 'Times New Roman', serif; font-size: 10.5pt; margin: 0.75in; }\n"
    "header { text-align: center; }\n"
    "h1 { font-variant: small-caps; font-size: 22pt; margin: 0; }\n"
    "h2 { font-variant: small-caps; border-bottom: 2px solid #000; }\n"
    ".dates { font-style: italic; }\n";

// Minimal layout: name, contact line, then sections without the summary block.
static const char* kMinimalHeaderHtml = R"HTML(<!doctype html>
<html>
<head>
<meta charset="utf-8"/>
<style>
{{ css }}
</style>
</head>
<body>
{% if exists("basics") %}
{% if existsIn(basics, "name") %}<h1>{{ escape(basics.name) }}</h1>{% endif %}
<p>{% if existsIn(basics, "email") %}{{ escape(basics.email) }} {% endif %}{% if existsIn(basics, "phone") %}{{ escape(basics.phone) }} {% endif %}{% if existsIn(basics, "url") %}{{ escape(basics.url) }}{% endif %}</p>
{% endif %}
)HTML";

std::vector<Theme> builtin_themes() {
    std::vector<Theme> themes;
    themes.push_back(Theme{"default", std::string(kHeaderHtml) + kSectionsHtml + kFooterHtml, kDefaultCss});
    themes.push_back(Theme{"minimal", std::string(kMinimalHeaderHtml) + kSectionsHtml + kFooterHtml, kMinimalCss});
    themes.push_back(Theme{"classic", std::string(kHeaderHtml) + kSectionsHtml + kFooterHtml, kClassicCss});
    return themes;
}

}  // namespace cvpress
