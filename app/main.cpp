#include "commands/catalog.hpp"
#include "commands/inspect.hpp"
#include "commands/render.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  cvpress render --resume <path> [args]\n"
        << "  cvpress formats\n"
        << "  cvpress themes [--themes-dir <dir>]\n"
        << "  cvpress inspect <file.pdf>\n"
        << "  cvpress help\n";
    return 1;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  cvpress render --resume <path> [options]\n"
        << "\n"
        << "output:\n"
        << "  --format <name>              markup|html, binary|pdf, external-toolchain|pdf-rendercv,\n"
        << "                               markdown|md (default: binary)\n"
        << "  --out <path>                 default: stdout\n"
        << "  --page <letter|a4>           default: letter\n"
        << "  --timestamp                  record the creation time in PDF output\n"
        << "\n"
        << "look:\n"
        << "  --theme <name>               default: default\n"
        << "  --themes-dir <dir>           extra themes (<name>/index.html or <name>.html)\n"
        << "  --template <file>            template text, overrides --theme\n"
        << "  --css <file>                 overrides the theme stylesheet\n"
        << "  --strict-theme               unknown theme is an error instead of a warning\n"
        << "\n"
        << "config:\n"
        << "  --config <path>              JSON RenderingConfig; flags override it\n"
        << "  --no-native                  skip weasyprint/wkhtmltopdf, use the built-in PDF writer\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    if (cmd == "render" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_render_help();

    if (cmd == "render")  return cmd_render(argc - 1, argv + 1);
    if (cmd == "formats") return cmd_formats(argc - 1, argv + 1);
    if (cmd == "themes")  return cmd_themes(argc - 1, argv + 1);
    if (cmd == "inspect") return cmd_inspect(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
