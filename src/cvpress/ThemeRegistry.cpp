#include "cvpress/ThemeRegistry.hpp"

#include "cvpress/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace cvpress {

static bool read_text_file(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static std::string first_existing_css(const fs::path& dir, const std::vector<std::string>& names) {
    for (const auto& n : names) {
        std::string css;
        if (fs::is_regular_file(dir / n) && read_text_file(dir / n, css)) return css;
    }
    return "";
}

ThemeRegistry::ThemeRegistry() {
    for (auto& t : builtin_themes()) add(std::move(t));
}

ThemeRegistry::ThemeRegistry(const fs::path& themes_dir) : ThemeRegistry() {
    if (!fs::is_directory(themes_dir)) {
        throw InputError("themes directory does not exist: " + themes_dir.string());
    }
    discover(themes_dir);
}

void ThemeRegistry::add(Theme theme) {
    if (contains(theme.name)) return;
    themes_.push_back(std::move(theme));
}

void ThemeRegistry::discover(const fs::path& dir) {
    std::vector<fs::path> entries;
    for (const auto& e : fs::directory_iterator(dir)) entries.push_back(e.path());
    std::sort(entries.begin(), entries.end());

    for (const auto& p : entries) {
        Theme t;

        if (fs::is_directory(p)) {
            const fs::path index = p / "index.html";
            if (!fs::is_regular_file(index)) continue;
            if (!read_text_file(index, t.template_text)) {
                std::cerr << "warning: cannot read theme template " << index.string() << "\n";
                continue;
            }
            t.name = p.filename().string();
            t.css = first_existing_css(p, {"styles.css", "style.css"});
        } else if (fs::is_regular_file(p) && p.extension() == ".html") {
            if (!read_text_file(p, t.template_text)) {
                std::cerr << "warning: cannot read theme template " << p.string() << "\n";
                continue;
            }
            t.name = p.stem().string();
            t.css = first_existing_css(p.parent_path(), {p.stem().string() + ".css"});
        } else {
            continue;
        }

        add(std::move(t));
    }
}

const Theme* ThemeRegistry::find(const std::string& name) const {
    for (const auto& t : themes_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::vector<std::string> ThemeRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(themes_.size());
    for (const auto& t : themes_) out.push_back(t.name);
    return out;
}

ResolvedTemplate ThemeRegistry::resolve(const std::string& theme_name, const std::string& custom_template) const {
    ResolvedTemplate r;

    if (!custom_template.empty()) {
        r.text = custom_template;
        r.custom = true;
        // keep the named theme's stylesheet available to custom templates
        if (const Theme* t = find(theme_name)) r.css = t->css;
        return r;
    }

    const Theme* t = find(theme_name);
    if (!t) {
        t = find(kDefaultTheme);
        r.fell_back = true;
    }

    r.theme_name = t->name;
    r.text = t->template_text;
    r.css = t->css;
    return r;
}

}  // namespace cvpress
