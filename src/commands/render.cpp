#include "commands/render.hpp"

#include "cvpress/Errors.hpp"
#include "cvpress/Pipeline.hpp"
#include "io/JsonIO.hpp"

#include <ctime>
#include <iostream>
#include <memory>
#include <string>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int render_usage() {
    std::cerr
        << "usage:\n"
        << "  cvpress render --resume <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --format <name>              default: binary (see: cvpress formats)\n"
        << "  --theme <name>               default: default (see: cvpress themes)\n"
        << "  --template <file>            template text, overrides --theme\n"
        << "  --css <file>                 stylesheet, overrides the theme stylesheet\n"
        << "  --themes-dir <dir>           extra themes\n"
        << "  --config <path>              JSON rendering config; flags override it\n"
        << "  --page <letter|a4>           default: letter\n"
        << "  --out <path>                 default: stdout\n"
        << "  --no-native                  skip the HTML->PDF converter probe\n"
        << "  --strict-theme               unknown theme is an error\n"
        << "  --timestamp                  record the creation time in PDF output\n";
    return 1;
}

int cmd_render(int argc, char** argv) {
    const std::string resume_path = get_arg(argc, argv, "--resume", "");
    if (resume_path.empty()) {
        std::cerr << "error: missing --resume\n";
        return render_usage();
    }

    try {
        cvpress::RenderingConfig cfg;
        const std::string config_path = get_arg(argc, argv, "--config", "");
        if (!config_path.empty()) cfg = load_rendering_config(config_path, cfg);

        cfg.format = get_arg(argc, argv, "--format", cfg.format);
        cfg.theme = get_arg(argc, argv, "--theme", cfg.theme);
        cfg.page_size = get_arg(argc, argv, "--page", cfg.page_size);
        cfg.output_path = get_arg(argc, argv, "--out", cfg.output_path);
        if (has_flag(argc, argv, "--no-native")) cfg.native_backend = false;
        if (has_flag(argc, argv, "--strict-theme")) cfg.strict_theme = true;

        const std::string template_path = get_arg(argc, argv, "--template", "");
        if (!template_path.empty()) cfg.custom_template = read_text_file(template_path, "template");
        const std::string css_path = get_arg(argc, argv, "--css", "");
        if (!css_path.empty()) cfg.custom_css = read_text_file(css_path, "stylesheet");

        cvpress::RendererDeps deps;
        const std::string themes_dir = get_arg(argc, argv, "--themes-dir", "");
        if (!themes_dir.empty()) deps.themes = std::make_shared<const cvpress::ThemeRegistry>(themes_dir);
        if (has_flag(argc, argv, "--timestamp")) deps.clock = [] { return std::time(nullptr); };

        cvpress::RendererRegistry registry;
        cvpress::register_builtin_renderers(registry, deps);

        const cvpress::ResumeContent content = load_resume_content(resume_path);
        const std::string bytes = cvpress::render_resume(content, cfg, registry);

        if (cfg.output_path.empty()) {
            std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            std::cout.flush();
            return std::cout ? 0 : 1;
        }

        std::cout << "RESUME: " << resume_path << "\n";
        std::cout << "FORMAT: " << cfg.format << "\n";
        std::cout << "THEME: " << (cfg.custom_template.empty() ? cfg.theme : template_path) << "\n";
        std::cout << "OUT: " << cfg.output_path << "\n";
        std::cout << "BYTES: " << bytes.size() << "\n";
        return 0;
    } catch (const cvpress::UnknownFormatError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: render failed: " << e.what() << "\n";
        return 1;
    }
}
