#include "commands/catalog.hpp"

#include "cvpress/Pipeline.hpp"
#include "cvpress/ThemeRegistry.hpp"

#include <iostream>
#include <memory>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_formats(int, char**) {
    for (const auto& name : cvpress::default_registry().list()) std::cout << name << "\n";
    return 0;
}

int cmd_themes(int argc, char** argv) {
    const std::string themes_dir = get_arg(argc, argv, "--themes-dir", "");

    try {
        std::unique_ptr<cvpress::ThemeRegistry> themes = themes_dir.empty()
            ? std::make_unique<cvpress::ThemeRegistry>()
            : std::make_unique<cvpress::ThemeRegistry>(themes_dir);
        for (const auto& name : themes->names()) std::cout << name << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
