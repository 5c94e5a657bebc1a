#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include "cvpress/Models.hpp"
#include "backend/NativeBackend.hpp"

namespace fixtures {

// basics.name = Alice, one job, no education, "volunteering": "Red Cross"
inline cvpress::ResumeContent alice() {
    cvpress::ResumeContent c;
    c.basics.name = "Alice";
    c.basics.email = "alice@example.com";

    cvpress::WorkEntry w;
    w.name = "Acme Corp";
    w.position = "Engineer";
    w.start_date = "2020-01";
    w.highlights = {"Shipped the billing service", "Cut build times in half"};
    c.work.push_back(w);

    cvpress::ExtraSection x;
    x.key = "volunteering";
    x.title = "Volunteering";
    x.value = "Red Cross";
    c.extra_sections.push_back(x);
    return c;
}

// Enough text to spill over several pages.
inline cvpress::ResumeContent long_resume(int jobs) {
    cvpress::ResumeContent c = alice();
    c.work.clear();
    for (int i = 0; i < jobs; ++i) {
        cvpress::WorkEntry w;
        w.name = "Company " + std::to_string(i);
        w.position = "Position " + std::to_string(i);
        w.start_date = "2010-01";
        w.end_date = "2011-01";
        w.summary = "Worked on distributed systems, storage engines and assorted tooling for internal teams.";
        for (int h = 0; h < 4; ++h) w.highlights.push_back("Highlight number " + std::to_string(h) + " for job " + std::to_string(i));
        c.work.push_back(w);
    }
    return c;
}

// `depth` arrays wrapped around `leaf`, built without recursion
inline nlohmann::ordered_json nested_arrays(int depth, const std::string& leaf) {
    nlohmann::ordered_json v = leaf;
    for (int i = 0; i < depth; ++i) {
        nlohmann::ordered_json wrap = nlohmann::ordered_json::array();
        wrap.push_back(std::move(v));
        v = std::move(wrap);
    }
    return v;
}

// extra section "notes" holding nested_arrays(depth, "deep")
inline cvpress::ResumeContent deeply_nested(int depth) {
    cvpress::ResumeContent c;
    c.basics.name = "Nest";
    cvpress::ExtraSection x;
    x.key = "notes";
    x.value = nested_arrays(depth, "deep");
    c.extra_sections.push_back(std::move(x));
    return c;
}

inline void write_file(const std::filesystem::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
    out << text;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Executable shell script for exercising subprocess paths.
inline std::filesystem::path write_script(const std::filesystem::path& p, const std::string& body) {
    write_file(p, "#!/bin/sh\n" + body);
    std::filesystem::permissions(p, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
    return p;
}

// Scripted backend for PdfRenderer tests.
class FakeBackend final : public backend::NativeBackend {
public:
    explicit FakeBackend(backend::BackendResult result) : result_(std::move(result)) {}

    std::string name() const override { return "fake"; }
    backend::BackendResult try_render(const std::string& markup, const cvpress::RenderingConfig&) const override {
        ++calls;
        last_markup = markup;
        return result_;
    }

    mutable int calls = 0;
    mutable std::string last_markup;

private:
    backend::BackendResult result_;
};

}  // namespace fixtures
