#include "commands/inspect.hpp"

#include "io/JsonIO.hpp"
#include "pdf/Inspect.hpp"

#include <iostream>
#include <string>

int cmd_inspect(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n  cvpress inspect <file.pdf>\n";
        return 1;
    }
    const std::string path = argv[1];

    std::string bytes;
    try {
        bytes = read_text_file(path, "PDF");
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    const pdf::InspectReport r = pdf::inspect(bytes);

    std::cout << "FILE: " << path << "\n";
    std::cout << "BYTES: " << bytes.size() << "\n";
    std::cout << "HEADER: " << (r.header_ok ? "ok" : "bad") << "\n";
    std::cout << "EOF: " << (r.eof_ok ? "ok" : "bad") << "\n";
    std::cout << "OBJECTS: " << r.objects << "\n";
    std::cout << "XREF_ENTRIES: " << r.xref_entries << "\n";
    std::cout << "TRAILER_SIZE: " << r.declared_size << "\n";
    std::cout << "ROOT: " << r.root_id << "\n";
    std::cout << "PAGES: " << r.pages << "\n";

    if (!r.ok()) {
        for (const auto& p : r.problems) std::cerr << "- " << p << "\n";
        std::cerr << "inspect failed: " << r.problems.size() << " problem(s)\n";
        return 1;
    }
    std::cout << "STATUS: ok\n";
    return 0;
}
