#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pdf {

// Structural summary of a PDF produced by write_document().
struct InspectReport {
    bool header_ok = false;          // starts with %PDF-
    bool eof_ok = false;             // ends with %%EOF (optionally followed by EOL)
    std::size_t xref_offset = 0;
    int declared_size = 0;           // trailer /Size
    int xref_entries = 0;            // entries in the xref subsection, free entry included
    int objects = 0;                 // "endobj" terminators found in the body
    int pages = 0;                   // /Count of the Pages object
    int root_id = 0;
    std::vector<std::size_t> offsets; // in-use entries, index = id - 1
    std::vector<std::string> problems;

    bool ok() const { return problems.empty(); }
};

// Never throws; anything unexpected is reported in `problems`.
InspectReport inspect(const std::string& bytes);

}  // namespace pdf
