#pragma once

#include <cstddef>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include "pdf/TextLayout.hpp"

namespace pdf {

// Optional Info dictionary. When every field is empty no Info object is
// written. creation_date is the only non-deterministic input.
struct DocumentInfo {
    std::string title;
    std::string producer;
    std::string creation_date;       // "D:YYYYMMDDHHmmSSZ", see pdf_date()

    bool empty() const { return title.empty() && producer.empty() && creation_date.empty(); }
};

// Appends numbered objects to one buffer and records where each begins.
// Ids must be written in order 1, 2, 3, ...
class ObjectWriter {
public:
    ObjectWriter();                  // writes the file header

    void begin_object(int id);
    void write(const std::string& s);
    void end_object();

    // `extra_dict` is spliced into the stream dictionary after /Length.
    void write_stream_object(int id, const std::string& data, const std::string& extra_dict = "");

    // Cross-reference table, trailer, startxref and %%EOF. info_id 0 means no Info.
    void finish(int root_id, int info_id = 0);

    std::size_t object_count() const { return offsets_.size(); }
    std::size_t offset_of(int id) const { return offsets_.at(static_cast<std::size_t>(id) - 1); }

    std::string take() { return std::move(buf_); }

private:
    std::string buf_;
    std::vector<std::size_t> offsets_;
    int open_id_ = 0;
    bool finished_ = false;
};

// UTF-8 -> WinAnsi literal string, parenthesized and escaped.
// Unmappable code points become '?'; bytes >= 0x80 are written as octal escapes.
std::string encode_text(const std::string& utf8);

// Fixed two-decimal precision with trailing zeros trimmed, C locale.
std::string format_number(float v);

std::string content_stream(const Page& page);

std::string pdf_date(std::time_t t);

// Object ids: 1 Catalog, 2 Pages, 3 Font, then Page/Contents pairs in page
// order, then Info when present.
std::string write_document(const std::vector<Page>& pages, const PageProfile& profile,
                           const DocumentInfo& info = {});

// layout() + write_document(). Never fails for any input text.
std::string serialize(const std::vector<TextFragment>& fragments, const PageProfile& profile,
                      const DocumentInfo& info = {});

}  // namespace pdf
