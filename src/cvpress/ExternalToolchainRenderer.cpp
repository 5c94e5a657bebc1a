#include "cvpress/ExternalToolchainRenderer.hpp"

#include "backend/ProcUtil.hpp"
#include "cvpress/ContextBuilder.hpp"
#include "cvpress/Errors.hpp"
#include "cvpress/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace cvpress {

using ojson = nlohmann::ordered_json;

const std::vector<std::string>& rendercv_themes() {
    static const std::vector<std::string> themes{
        "classic", "sb2nov", "moderncv", "engineeringresumes", "engineeringclassic"};
    return themes;
}

// YYYY, YYYY-MM or YYYY-MM-DD; RenderCV rejects anything else in start_date/end_date
static bool is_iso_date(const std::string& s) {
    if (s.size() != 4 && s.size() != 7 && s.size() != 10) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) {
            if (s[i] != '-') return false;
        } else if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

// Structured dates when RenderCV can parse them, a free-text "date" otherwise.
static void put_dates(ojson& entry, const std::string& start, const std::string& end) {
    const std::string s = textutil::trim_copy(start);
    const std::string e = textutil::trim_copy(end);
    if (s.empty() && e.empty()) return;

    const bool end_ok = e.empty() || is_iso_date(e) || textutil::to_lower_copy(e) == "present";
    if (!s.empty() && is_iso_date(s) && end_ok) {
        entry["start_date"] = s;
        entry["end_date"] = is_iso_date(e) ? e : std::string("present");
        return;
    }

    if (s.empty()) entry["date"] = e;
    else entry["date"] = s + " \xE2\x80\x93 " + (e.empty() ? "Present" : e);
}

static void put_if(ojson& entry, const char* key, const std::string& value) {
    if (!textutil::is_blank(value)) entry[key] = value;
}

static ojson string_list(const std::vector<std::string>& items) {
    ojson out = ojson::array();
    for (const auto& s : items) {
        if (!textutil::is_blank(s)) out.push_back(s);
    }
    return out;
}

static std::string inline_text(const ojson& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        std::string out;
        for (const auto& item : v) {
            if (!out.empty()) out += ", ";
            out += inline_text(item);
        }
        return out;
    }
    if (v.is_object()) {
        std::string out;
        for (const auto& kv : v.items()) {
            if (!out.empty()) out += "; ";
            out += title_from_key(kv.key()) + ": " + inline_text(kv.value());
        }
        return out;
    }
    return v.dump();
}

// Extra sections become lists of text entries.
static ojson text_entries(const ojson& value) {
    ojson out = ojson::array();
    if (value.is_array()) {
        for (const auto& item : value) out.push_back(inline_text(item));
    } else if (value.is_object()) {
        for (const auto& kv : value.items()) out.push_back(title_from_key(kv.key()) + ": " + inline_text(kv.value()));
    } else {
        out.push_back(inline_text(value));
    }
    return out;
}

static ojson experience_section(const std::vector<WorkEntry>& work, std::vector<std::string>& warnings) {
    ojson out = ojson::array();
    for (size_t i = 0; i < work.size(); ++i) {
        const WorkEntry& w = work[i];
        ojson e = ojson::object();

        if (!textutil::is_blank(w.name) && !textutil::is_blank(w.position)) {
            e["company"] = w.name;
            e["position"] = w.position;
        } else if (!textutil::is_blank(w.name) || !textutil::is_blank(w.position)) {
            e["name"] = textutil::is_blank(w.name) ? w.position : w.name;
            warnings.push_back("work entry " + std::to_string(i) + " lacks a company or position; rendered as a plain entry");
        } else {
            warnings.push_back("work entry " + std::to_string(i) + " has neither company nor position; skipped");
            continue;
        }

        put_if(e, "location", w.location);
        put_dates(e, w.start_date, w.end_date);
        put_if(e, "summary", w.summary);
        ojson hl = string_list(w.highlights);
        if (!hl.empty()) e["highlights"] = hl;
        out.push_back(e);
    }
    return out;
}

static ojson education_section(const std::vector<EducationEntry>& education, std::vector<std::string>& warnings) {
    ojson out = ojson::array();
    for (size_t i = 0; i < education.size(); ++i) {
        const EducationEntry& ed = education[i];
        ojson e = ojson::object();

        if (!textutil::is_blank(ed.institution) && !textutil::is_blank(ed.area)) {
            e["institution"] = ed.institution;
            e["area"] = ed.area;
            put_if(e, "degree", ed.study_type);
        } else if (!textutil::is_blank(ed.institution) || !textutil::is_blank(ed.area)) {
            e["name"] = textutil::is_blank(ed.institution) ? ed.area : ed.institution;
            warnings.push_back("education entry " + std::to_string(i) + " lacks an institution or area; rendered as a plain entry");
        } else {
            warnings.push_back("education entry " + std::to_string(i) + " has neither institution nor area; skipped");
            continue;
        }

        put_dates(e, ed.start_date, ed.end_date);
        ojson hl = string_list(ed.courses);
        if (!textutil::is_blank(ed.score)) hl.push_back("Score: " + ed.score);
        if (!hl.empty()) e["highlights"] = hl;
        out.push_back(e);
    }
    return out;
}

static ojson project_section(const std::vector<ProjectEntry>& projects, std::vector<std::string>& warnings) {
    ojson out = ojson::array();
    for (size_t i = 0; i < projects.size(); ++i) {
        const ProjectEntry& p = projects[i];
        if (textutil::is_blank(p.name)) {
            warnings.push_back("project " + std::to_string(i) + " has no name; skipped");
            continue;
        }

        ojson e = ojson::object();
        e["name"] = p.name;
        put_dates(e, p.start_date, p.end_date);
        put_if(e, "summary", p.description);

        ojson hl = string_list(p.highlights);
        const ojson kw = string_list(p.keywords);
        if (!kw.empty()) hl.push_back("Keywords: " + inline_text(kw));
        if (!hl.empty()) e["highlights"] = hl;
        out.push_back(e);
    }
    return out;
}

static ojson skill_section(const std::vector<SkillEntry>& skills, std::vector<std::string>& warnings) {
    ojson out = ojson::array();
    for (size_t i = 0; i < skills.size(); ++i) {
        const SkillEntry& s = skills[i];
        if (textutil::is_blank(s.name)) {
            warnings.push_back("skill " + std::to_string(i) + " has no name; skipped");
            continue;
        }

        std::string details = inline_text(string_list(s.keywords));
        if (details.empty()) details = s.level;
        if (details.empty()) {
            out.push_back(s.name);
            continue;
        }
        out.push_back(ojson{{"label", s.name}, {"details", details}});
    }
    return out;
}

RenderCvDocument to_rendercv(const ResumeContent& content, const RenderingConfig& config) {
    RenderCvDocument doc;
    const Basics& b = content.basics;

    ojson cv = ojson::object();
    if (textutil::is_blank(b.name)) {
        cv["name"] = "Unnamed";
        doc.warnings.push_back("missing 'name' in basics, using 'Unnamed'");
    } else {
        cv["name"] = b.name;
    }

    std::string location = b.location.city;
    if (!textutil::is_blank(b.location.region)) {
        if (!location.empty()) location += ", ";
        location += b.location.region;
    }
    put_if(cv, "location", location);
    put_if(cv, "email", b.email);
    put_if(cv, "phone", b.phone);
    put_if(cv, "website", b.url);

    ojson networks = ojson::array();
    for (const auto& p : b.profiles) {
        if (textutil::is_blank(p.network) || textutil::is_blank(p.username)) continue;
        networks.push_back(ojson{{"network", p.network}, {"username", p.username}});
    }
    if (!networks.empty()) cv["social_networks"] = networks;

    ojson sections = ojson::object();
    if (!textutil::is_blank(b.summary)) sections["summary"] = ojson::array({b.summary});

    auto add_section = [&sections](const std::string& title, ojson entries) {
        if (!entries.empty()) sections[title] = std::move(entries);
    };
    add_section("experience", experience_section(content.work, doc.warnings));
    add_section("education", education_section(content.education, doc.warnings));
    add_section("projects", project_section(content.projects, doc.warnings));
    add_section("skills", skill_section(content.skills, doc.warnings));

    for (const auto& x : content.extra_sections) {
        const ojson value = prune_value(x.value);
        if (value.is_null()) continue;
        const std::string title = x.title.empty() ? title_from_key(x.key) : x.title;
        if (sections.contains(title)) {
            doc.warnings.push_back("extra section '" + x.key + "' collides with '" + title + "'; skipped");
            continue;
        }
        sections[title] = text_entries(value);
    }

    if (!sections.empty()) cv["sections"] = sections;

    const auto& themes = rendercv_themes();
    std::string theme = "classic";
    if (std::find(themes.begin(), themes.end(), config.theme) != themes.end()) {
        theme = config.theme;
    } else if (config.theme != "default" && !config.theme.empty()) {
        doc.warnings.push_back("theme '" + config.theme + "' is not a RenderCV theme (available: " +
                               join_names(themes) + "); using 'classic'");
    }

    doc.document["cv"] = cv;
    doc.document["design"] = ojson{{"theme", theme}};
    return doc;
}

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

ExternalToolchainRenderer::ExternalToolchainRenderer(std::string program) : program_(std::move(program)) {}

std::string ExternalToolchainRenderer::render(const ResumeContent& content, const RenderingConfig& config) const {
    const fs::path exe = procutil::find_executable(program_);
    if (exe.empty()) {
        throw BackendUnavailableError("external-toolchain format needs '" + program_ +
                                      "' on PATH (pip install \"rendercv[full]\")");
    }

    const RenderCvDocument doc = to_rendercv(content, config);
    for (const auto& w : doc.warnings) std::cerr << "warning: rendercv: " << w << "\n";

    procutil::ScopedTempDir tmp("cvpress-rendercv");
    const fs::path yaml_path = tmp.path() / "resume.yaml";
    const fs::path pdf_path = tmp.path() / "resume.pdf";

    {
        // JSON is a subset of YAML
        std::ofstream out(yaml_path, std::ios::out | std::ios::binary | std::ios::trunc);
        out << doc.document.dump(2) << "\n";
        out.flush();
        if (!out) throw BackendFailureError("cannot write RenderCV input: " + yaml_path.string());
    }

    const std::vector<std::string> argv{
        exe.string(), "render", yaml_path.string(),
        "--pdf-path", pdf_path.string(),
        "--dont-generate-markdown", "--dont-generate-html", "--dont-generate-png"};

    const procutil::ProcResult res = procutil::run_capture(argv, tmp.path());
    if (!res.launched) throw BackendFailureError(program_ + ": failed to launch " + exe.string());
    if (res.exit_code != 0) {
        std::string out = textutil::trim_copy(res.output);
        if (out.size() > 400) out = out.substr(out.size() - 400);
        throw BackendFailureError(program_ + " exited with code " + std::to_string(res.exit_code) +
                                  (out.empty() ? "" : ": " + out));
    }

    std::string pdf = read_all(pdf_path);
    if (pdf.empty()) throw BackendFailureError(program_ + " produced no PDF");
    return pdf;
}

}  // namespace cvpress
