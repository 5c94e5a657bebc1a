#include "cvpress/ContextBuilder.hpp"

#include "cvpress/TextUtil.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace cvpress {

using ojson = nlohmann::ordered_json;

bool is_empty_value(const ojson& v) {
    std::vector<const ojson*> pending{&v};
    while (!pending.empty()) {
        const ojson* cur = pending.back();
        pending.pop_back();
        switch (cur->type()) {
            case ojson::value_t::null:
            case ojson::value_t::discarded:
                break;
            case ojson::value_t::string:
                if (!textutil::is_blank(cur->get_ref<const std::string&>())) return false;
                break;
            case ojson::value_t::array:
            case ojson::value_t::object:
                for (const auto& item : *cur) pending.push_back(&item);
                break;
            default:
                // numbers and booleans always carry a value
                return false;
        }
    }
    return true;
}

// Non-blank scalar leaves of v, in document order, joined with ", ".
static std::string leaf_text(const ojson& v) {
    std::string out;
    std::vector<const ojson*> pending{&v};
    while (!pending.empty()) {
        const ojson* cur = pending.back();
        pending.pop_back();
        if (cur->is_structured()) {
            // reversed so the first child is taken next
            std::vector<const ojson*> children;
            for (const auto& item : *cur) children.push_back(&item);
            for (auto it = children.rbegin(); it != children.rend(); ++it) pending.push_back(*it);
            continue;
        }
        if (is_empty_value(*cur)) continue;
        if (!out.empty()) out += ", ";
        out += cur->is_string() ? cur->get<std::string>() : cur->dump();
    }
    return out;
}

namespace {

struct PruneFrame {
    const ojson* src;
    ojson::const_iterator it;
    ojson out;
};

}  // namespace

static void attach(PruneFrame& f, ojson value) {
    if (!value.is_null()) {
        if (f.out.is_array()) f.out.push_back(std::move(value));
        else f.out[f.it.key()] = std::move(value);
    }
    ++f.it;
}

static PruneFrame open_frame(const ojson& v) {
    return PruneFrame{&v, v.cbegin(), v.is_array() ? ojson::array() : ojson::object()};
}

ojson prune_value(const ojson& v) {
    if (!v.is_structured()) return is_empty_value(v) ? ojson(nullptr) : v;

    std::vector<PruneFrame> stack;
    stack.push_back(open_frame(v));

    while (true) {
        PruneFrame& top = stack.back();

        if (top.it == top.src->cend()) {
            ojson done = top.out.empty() ? ojson(nullptr) : std::move(top.out);
            stack.pop_back();
            if (stack.empty()) return done;
            attach(stack.back(), std::move(done));
            continue;
        }

        const ojson& child = *top.it;
        if (!child.is_structured()) {
            attach(top, is_empty_value(child) ? ojson(nullptr) : child);
        } else if (stack.size() < kMaxNestingDepth) {
            stack.push_back(open_frame(child));
        } else {
            const std::string text = leaf_text(child);
            attach(top, text.empty() ? ojson(nullptr) : ojson(text));
        }
    }
}

std::string title_from_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());

    bool word_start = true;
    for (char c : key) {
        if (c == '_' || c == '-' || c == ' ') {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            word_start = true;
            continue;
        }
        const unsigned char uc = static_cast<unsigned char>(c);
        if (word_start) out.push_back(static_cast<char>(std::toupper(uc)));
        else out.push_back(static_cast<char>(std::tolower(uc)));
        word_start = false;
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

static std::string scalar_text(const ojson& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

static void append_fragment(std::string& out, const ojson& v, bool top) {
    if (v.is_array()) {
        out += "<ul>";
        for (const auto& item : v) {
            out += "<li>";
            append_fragment(out, item, false);
            out += "</li>";
        }
        out += "</ul>";
        return;
    }

    if (v.is_object()) {
        out += "<dl>";
        for (const auto& kv : v.items()) {
            out += "<dt>" + textutil::html_escape(kv.key()) + "</dt><dd>";
            append_fragment(out, kv.value(), false);
            out += "</dd>";
        }
        out += "</dl>";
        return;
    }

    const std::string text = textutil::html_escape(scalar_text(v));
    if (top) out += "<p>" + text + "</p>";
    else out += text;
}

std::string extra_section_html(const ojson& value) {
    std::string out;
    append_fragment(out, prune_value(value), true);
    return out;
}

// ---- typed sections -> json ----

static void put(ojson& j, const char* key, const std::string& value) {
    if (!value.empty()) j[key] = value;
}

static void put(ojson& j, const char* key, const std::vector<std::string>& values) {
    if (values.empty()) return;
    ojson arr = ojson::array();
    for (const auto& v : values) arr.push_back(v);
    j[key] = std::move(arr);
}

static std::string join_nonempty(const std::string& a, const char* sep, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + sep + b;
}

static std::string date_range(const ojson& entry) {
    const std::string start = entry.value("startDate", "");
    const std::string end = entry.value("endDate", "");
    if (start.empty() && end.empty()) return "";
    if (end.empty()) return start + " \xE2\x80\x93 Present";
    return join_nonempty(start, " \xE2\x80\x93 ", end);
}

static ojson basics_to_json(const Basics& b) {
    ojson j = ojson::object();
    put(j, "name", b.name);
    put(j, "label", b.label);
    put(j, "email", b.email);
    put(j, "phone", b.phone);
    put(j, "url", b.url);
    put(j, "summary", b.summary);

    ojson loc = ojson::object();
    put(loc, "address", b.location.address);
    put(loc, "postalCode", b.location.postal_code);
    put(loc, "city", b.location.city);
    put(loc, "region", b.location.region);
    put(loc, "countryCode", b.location.country_code);
    j["location"] = std::move(loc);

    ojson profiles = ojson::array();
    for (const auto& p : b.profiles) {
        ojson pj = ojson::object();
        put(pj, "network", p.network);
        put(pj, "username", p.username);
        put(pj, "url", p.url);
        profiles.push_back(std::move(pj));
    }
    j["profiles"] = std::move(profiles);

    return j;
}

static ojson work_to_json(const WorkEntry& w) {
    ojson j = ojson::object();
    put(j, "name", w.name);
    put(j, "position", w.position);
    put(j, "location", w.location);
    put(j, "url", w.url);
    put(j, "startDate", w.start_date);
    put(j, "endDate", w.end_date);
    put(j, "summary", w.summary);
    put(j, "highlights", w.highlights);
    return j;
}

static ojson education_to_json(const EducationEntry& e) {
    ojson j = ojson::object();
    put(j, "institution", e.institution);
    put(j, "area", e.area);
    put(j, "studyType", e.study_type);
    put(j, "startDate", e.start_date);
    put(j, "endDate", e.end_date);
    put(j, "score", e.score);
    put(j, "courses", e.courses);
    return j;
}

static ojson project_to_json(const ProjectEntry& p) {
    ojson j = ojson::object();
    put(j, "name", p.name);
    put(j, "description", p.description);
    put(j, "url", p.url);
    put(j, "startDate", p.start_date);
    put(j, "endDate", p.end_date);
    put(j, "highlights", p.highlights);
    put(j, "keywords", p.keywords);
    return j;
}

static ojson skill_to_json(const SkillEntry& s) {
    ojson j = ojson::object();
    put(j, "name", s.name);
    put(j, "level", s.level);
    put(j, "keywords", s.keywords);
    return j;
}

// Derived display fields. Only computed from values that survived pruning.
static void decorate_work(ojson& e) {
    put(e, "heading", join_nonempty(e.value("position", ""), " \xE2\x80\x94 ", e.value("name", "")));
    put(e, "dates", date_range(e));
}

static void decorate_education(ojson& e) {
    const std::string degree = join_nonempty(e.value("studyType", ""), " in ", e.value("area", ""));
    put(e, "heading", join_nonempty(degree, " \xE2\x80\x94 ", e.value("institution", "")));
    put(e, "dates", date_range(e));
}

static void decorate_project(ojson& e) {
    put(e, "heading", e.value("name", ""));
    put(e, "dates", date_range(e));
    if (e.contains("keywords")) {
        std::string joined;
        for (const auto& k : e["keywords"]) joined = join_nonempty(joined, ", ", k.get<std::string>());
        put(e, "keywords_text", joined);
    }
}

static void decorate_skill(ojson& e) {
    if (e.contains("keywords")) {
        std::string joined;
        for (const auto& k : e["keywords"]) joined = join_nonempty(joined, ", ", k.get<std::string>());
        put(e, "keywords_text", joined);
    }
}

template <typename Entry, typename ToJson, typename Decorate>
static void add_section(ojson& ctx, const char* key, const char* title,
                        const std::vector<Entry>& entries, ToJson to_json, Decorate decorate) {
    ojson kept = ojson::array();
    for (const auto& entry : entries) {
        ojson e = prune_value(to_json(entry));
        if (e.is_null()) continue;
        decorate(e);
        kept.push_back(std::move(e));
    }

    // empty sections are omitted entirely, not rendered as a bare heading
    if (kept.empty()) return;

    ojson section = ojson::object();
    section["title"] = title;
    section["entries"] = std::move(kept);
    ctx[key] = std::move(section);
}

ojson build_context(const ResumeContent& content) {
    ojson ctx = ojson::object();

    ojson basics = prune_value(basics_to_json(content.basics));
    if (!basics.is_null()) ctx["basics"] = std::move(basics);

    add_section(ctx, "work", "Experience", content.work, work_to_json, decorate_work);
    add_section(ctx, "education", "Education", content.education, education_to_json, decorate_education);
    add_section(ctx, "projects", "Projects", content.projects, project_to_json, decorate_project);
    add_section(ctx, "skills", "Skills", content.skills, skill_to_json, decorate_skill);

    ojson extras = ojson::array();
    for (const auto& sec : content.extra_sections) {
        ojson value = prune_value(sec.value);
        if (value.is_null()) continue;

        ojson e = ojson::object();
        e["id"] = sec.key;
        e["title"] = sec.title.empty() ? title_from_key(sec.key) : sec.title;
        e["html"] = extra_section_html(value);
        e["value"] = std::move(value);
        extras.push_back(std::move(e));
    }
    if (!extras.empty()) ctx["extra_sections"] = std::move(extras);

    return ctx;
}

}  // namespace cvpress
