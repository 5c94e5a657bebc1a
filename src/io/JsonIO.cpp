#include "io/JsonIO.hpp"

#include "cvpress/ContextBuilder.hpp"
#include "cvpress/Errors.hpp"

#include <fstream>
#include <sstream>

using ojson = nlohmann::ordered_json;
using cvpress::InputError;

static void require_object(const ojson& j, const std::string& where) {
    if (!j.is_object()) {
        throw InputError(where + " must be an object");
    }
}

static void require_array(const ojson& j, const std::string& where) {
    if (!j.is_array()) {
        throw InputError(where + " must be an array");
    }
}

// Strings as-is, numbers as written (a GPA of 3.8 is still a score).
static std::string opt_string(const ojson& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return "";
}

static std::vector<std::string> opt_string_array(const ojson& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
        else if (v.is_number()) out.push_back(v.dump());
    }
    return out;
}

static cvpress::Basics parse_basics(const ojson& j) {
    require_object(j, "root.basics");

    cvpress::Basics b;
    b.name    = opt_string(j, "name");
    b.label   = opt_string(j, "label");
    b.email   = opt_string(j, "email");
    b.phone   = opt_string(j, "phone");
    b.url     = opt_string(j, "url");
    if (b.url.empty()) b.url = opt_string(j, "website");
    b.summary = opt_string(j, "summary");

    if (j.contains("location")) {
        const ojson& loc = j.at("location");
        if (loc.is_object()) {
            b.location.address      = opt_string(loc, "address");
            b.location.postal_code  = opt_string(loc, "postalCode");
            b.location.city         = opt_string(loc, "city");
            b.location.region       = opt_string(loc, "region");
            b.location.country_code = opt_string(loc, "countryCode");
        } else if (loc.is_string()) {
            b.location.city = loc.get<std::string>();
        }
    }

    if (j.contains("profiles") && j.at("profiles").is_array()) {
        for (const auto& pj : j.at("profiles")) {
            if (!pj.is_object()) continue;
            cvpress::Profile p;
            p.network  = opt_string(pj, "network");
            p.username = opt_string(pj, "username");
            p.url      = opt_string(pj, "url");
            b.profiles.push_back(p);
        }
    }
    return b;
}

static cvpress::WorkEntry parse_work(const ojson& j, const std::string& where) {
    require_object(j, where);

    cvpress::WorkEntry w;
    w.name       = opt_string(j, "name");
    if (w.name.empty()) w.name = opt_string(j, "company");
    w.position   = opt_string(j, "position");
    w.location   = opt_string(j, "location");
    w.url        = opt_string(j, "url");
    w.start_date = opt_string(j, "startDate");
    w.end_date   = opt_string(j, "endDate");
    w.summary    = opt_string(j, "summary");
    w.highlights = opt_string_array(j, "highlights");
    return w;
}

static cvpress::EducationEntry parse_education(const ojson& j, const std::string& where) {
    require_object(j, where);

    cvpress::EducationEntry e;
    e.institution = opt_string(j, "institution");
    e.area        = opt_string(j, "area");
    e.study_type  = opt_string(j, "studyType");
    e.start_date  = opt_string(j, "startDate");
    e.end_date    = opt_string(j, "endDate");
    e.score       = opt_string(j, "score");
    e.courses     = opt_string_array(j, "courses");
    return e;
}

static cvpress::ProjectEntry parse_project(const ojson& j, const std::string& where) {
    require_object(j, where);

    cvpress::ProjectEntry p;
    p.name        = opt_string(j, "name");
    p.description = opt_string(j, "description");
    p.url         = opt_string(j, "url");
    p.start_date  = opt_string(j, "startDate");
    p.end_date    = opt_string(j, "endDate");
    p.highlights  = opt_string_array(j, "highlights");
    p.keywords    = opt_string_array(j, "keywords");
    return p;
}

static cvpress::SkillEntry parse_skill(const ojson& j, const std::string& where) {
    require_object(j, where);

    cvpress::SkillEntry s;
    s.name     = opt_string(j, "name");
    s.level    = opt_string(j, "level");
    s.keywords = opt_string_array(j, "keywords");
    return s;
}

template <typename T, typename Parse>
static std::vector<T> parse_list(const ojson& root, const char* key, Parse parse) {
    std::vector<T> out;
    if (!root.contains(key)) return out;

    const std::string where = std::string("root.") + key;
    const ojson& arr = root.at(key);
    require_array(arr, where);
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        out.push_back(parse(arr.at(i), oss.str()));
    }
    return out;
}

static bool is_core_key(const std::string& key) {
    return key == "basics" || key == "work" || key == "education" || key == "projects" || key == "skills";
}

static bool is_metadata_key(const std::string& key) {
    return key == "meta" || key == "$schema";
}

cvpress::ResumeContent resume_content_from_json(const ojson& j) {
    require_object(j, "root");

    cvpress::ResumeContent rc;
    if (j.contains("basics")) rc.basics = parse_basics(j.at("basics"));
    rc.work      = parse_list<cvpress::WorkEntry>(j, "work", parse_work);
    rc.education = parse_list<cvpress::EducationEntry>(j, "education", parse_education);
    rc.projects  = parse_list<cvpress::ProjectEntry>(j, "projects", parse_project);
    rc.skills    = parse_list<cvpress::SkillEntry>(j, "skills", parse_skill);

    for (const auto& kv : j.items()) {
        if (is_core_key(kv.key()) || is_metadata_key(kv.key())) continue;
        cvpress::ExtraSection x;
        x.key   = kv.key();
        x.title = cvpress::title_from_key(kv.key());
        // normalized here so no consumer walks unbounded nesting
        x.value = cvpress::prune_value(kv.value());
        rc.extra_sections.push_back(std::move(x));
    }
    return rc;
}

std::string read_text_file(const std::string& path, const std::string& what) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw InputError("failed to open " + what + " file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

template <typename Json>
static Json parse_json_file(const std::string& path, const std::string& what) {
    const std::string text = read_text_file(path, what);
    try {
        return Json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError("failed to parse " + what + " JSON (" + path + "): " + e.what());
    }
}

cvpress::ResumeContent load_resume_content(const std::string& path) {
    return resume_content_from_json(parse_json_file<ojson>(path, "resume"));
}

cvpress::RenderingConfig load_rendering_config(const std::string& path, cvpress::RenderingConfig base) {
    const nlohmann::json j = parse_json_file<nlohmann::json>(path, "config");
    if (!j.is_object()) throw InputError("config must be an object: " + path);
    return cvpress::rendering_config_from_json(j, std::move(base));
}
