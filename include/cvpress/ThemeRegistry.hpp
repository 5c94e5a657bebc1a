#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace cvpress {

struct Theme {
    std::string name;
    std::string template_text;
    std::string css;
};

struct ResolvedTemplate {
    std::string theme_name;          // theme actually used ("" for custom templates)
    std::string text;
    std::string css;
    bool custom = false;             // caller-supplied template text
    bool fell_back = false;          // requested theme unknown, default used
};

// Name -> template text. Filled once at construction and never mutated after,
// so concurrent reads need no locking.
class ThemeRegistry {
public:
    static constexpr const char* kDefaultTheme = "default";

    // Built-in themes only.
    ThemeRegistry();

    // Built-ins plus themes discovered in `themes_dir`:
    //   <dir>/<name>/index.html (+ styles.css or style.css)
    //   <dir>/<name>.html       (+ <name>.css)
    // Discovered themes never replace a built-in. Throws InputError if the directory is missing.
    explicit ThemeRegistry(const std::filesystem::path& themes_dir);

    const Theme* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Registration order: built-ins first.
    std::vector<std::string> names() const;

    // Custom template text wins; unknown names resolve to the default theme with fell_back set.
    ResolvedTemplate resolve(const std::string& theme_name, const std::string& custom_template) const;

private:
    std::vector<Theme> themes_;

    void add(Theme theme);
    void discover(const std::filesystem::path& dir);
};

// Bundled themes, in registration order.
std::vector<Theme> builtin_themes();

}  // namespace cvpress
