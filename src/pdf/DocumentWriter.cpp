#include "pdf/DocumentWriter.hpp"

#include "cvpress/TextUtil.hpp"

#include <cstdio>
#include <stdexcept>

namespace pdf {

// The second line marks the file as binary for transfer tools.
static const char kHeader[] = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

ObjectWriter::ObjectWriter() {
    buf_.reserve(8192);
    buf_.append(kHeader, sizeof(kHeader) - 1);
}

void ObjectWriter::begin_object(int id) {
    // ids are assigned by write_document; an out-of-order id is a programming error
    if (open_id_ != 0 || finished_ || id != static_cast<int>(offsets_.size()) + 1) {
        throw std::logic_error("pdf: object " + std::to_string(id) + " written out of order");
    }
    offsets_.push_back(buf_.size());
    open_id_ = id;
    buf_ += std::to_string(id) + " 0 obj\n";
}

void ObjectWriter::write(const std::string& s) {
    buf_ += s;
}

void ObjectWriter::end_object() {
    buf_ += "\nendobj\n";
    open_id_ = 0;
}

void ObjectWriter::write_stream_object(int id, const std::string& data, const std::string& extra_dict) {
    begin_object(id);
    buf_ += "<< /Length " + std::to_string(data.size());
    if (!extra_dict.empty()) buf_ += " " + extra_dict;
    buf_ += " >>\nstream\n";
    buf_ += data;
    buf_ += "\nendstream";
    end_object();
}

void ObjectWriter::finish(int root_id, int info_id) {
    if (open_id_ != 0 || finished_) throw std::logic_error("pdf: finish() with an open object");

    const std::size_t xref_offset = buf_.size();
    const std::size_t size = offsets_.size() + 1;  // + the free entry for object 0

    buf_ += "xref\n0 " + std::to_string(size) + "\n";
    buf_ += "0000000000 65535 f \n";
    char entry[32];
    for (std::size_t off : offsets_) {
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", off);
        buf_ += entry;
    }

    buf_ += "trailer\n<< /Size " + std::to_string(size) + " /Root " + std::to_string(root_id) + " 0 R";
    if (info_id > 0) buf_ += " /Info " + std::to_string(info_id) + " 0 R";
    buf_ += " >>\nstartxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";

    finished_ = true;
}

static int winansi_byte(char32_t cp) {
    if (cp == '\t' || cp == '\n' || cp == '\r') return ' ';
    if (cp < 0x20) return -1;
    if (cp < 0x80) return static_cast<int>(cp);
    if (cp >= 0xA0 && cp <= 0xFF) return static_cast<int>(cp);

    switch (cp) {
        case 0x20AC: return 0x80;
        case 0x201A: return 0x82;
        case 0x0192: return 0x83;
        case 0x201E: return 0x84;
        case 0x2026: return 0x85;
        case 0x2020: return 0x86;
        case 0x2021: return 0x87;
        case 0x02C6: return 0x88;
        case 0x2030: return 0x89;
        case 0x0160: return 0x8A;
        case 0x2039: return 0x8B;
        case 0x0152: return 0x8C;
        case 0x017D: return 0x8E;
        case 0x2018: return 0x91;
        case 0x2019: return 0x92;
        case 0x201C: return 0x93;
        case 0x201D: return 0x94;
        case 0x2022: return 0x95;
        case 0x2013: return 0x96;
        case 0x2014: return 0x97;
        case 0x02DC: return 0x98;
        case 0x2122: return 0x99;
        case 0x0161: return 0x9A;
        case 0x203A: return 0x9B;
        case 0x0153: return 0x9C;
        case 0x017E: return 0x9E;
        case 0x0178: return 0x9F;
        default:     return '?';
    }
}

std::string encode_text(const std::string& utf8) {
    std::string out = "(";
    out.reserve(utf8.size() + 8);

    for (char32_t cp : textutil::utf8_decode(utf8)) {
        const int b = winansi_byte(cp);
        if (b < 0) continue;  // other control characters are dropped

        if (b == '\\' || b == '(' || b == ')') {
            out += '\\';
            out += static_cast<char>(b);
        } else if (b >= 0x80) {
            char esc[8];
            std::snprintf(esc, sizeof(esc), "\\%03o", b);
            out += esc;
        } else {
            out += static_cast<char>(b);
        }
    }

    out += ")";
    return out;
}

std::string format_number(float v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(v));
    std::string s = buf;

    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::string content_stream(const Page& page) {
    std::string out;
    for (const auto& line : page.lines) {
        out += "BT /F1 " + format_number(metrics(line.style).size) + " Tf ";
        out += format_number(line.x) + " " + format_number(line.y) + " Td ";
        out += encode_text(line.text);
        out += " Tj ET\n";
    }
    return out;
}

std::string pdf_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "D:%Y%m%d%H%M%SZ", &tm);
    return buf;
}

std::string write_document(const std::vector<Page>& pages_in, const PageProfile& profile, const DocumentInfo& info) {
    // an empty document still gets one blank page
    std::vector<Page> blank(1);
    const std::vector<Page>& pages = pages_in.empty() ? blank : pages_in;

    const int kCatalog = 1;
    const int kPages = 2;
    const int kFont = 3;
    const int first_page = 4;
    const int page_count = static_cast<int>(pages.size());
    const int info_id = info.empty() ? 0 : first_page + 2 * page_count;

    auto page_id = [&](int i) { return first_page + 2 * i; };
    auto contents_id = [&](int i) { return first_page + 2 * i + 1; };

    ObjectWriter w;

    w.begin_object(kCatalog);
    w.write("<< /Type /Catalog /Pages " + std::to_string(kPages) + " 0 R >>");
    w.end_object();

    w.begin_object(kPages);
    std::string kids;
    for (int i = 0; i < page_count; ++i) {
        if (i) kids += " ";
        kids += std::to_string(page_id(i)) + " 0 R";
    }
    w.write("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(page_count) + " >>");
    w.end_object();

    w.begin_object(kFont);
    w.write("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>");
    w.end_object();

    const std::string media_box = "[0 0 " + format_number(profile.width) + " " + format_number(profile.height) + "]";

    for (int i = 0; i < page_count; ++i) {
        w.begin_object(page_id(i));
        w.write("<< /Type /Page /Parent " + std::to_string(kPages) + " 0 R /MediaBox " + media_box +
                " /Resources << /Font << /F1 " + std::to_string(kFont) + " 0 R >> >>" +
                " /Contents " + std::to_string(contents_id(i)) + " 0 R >>");
        w.end_object();

        w.write_stream_object(contents_id(i), content_stream(pages[static_cast<size_t>(i)]));
    }

    if (info_id) {
        w.begin_object(info_id);
        std::string dict = "<<";
        if (!info.title.empty()) dict += " /Title " + encode_text(info.title);
        if (!info.producer.empty()) dict += " /Producer " + encode_text(info.producer);
        if (!info.creation_date.empty()) dict += " /CreationDate " + encode_text(info.creation_date);
        dict += " >>";
        w.write(dict);
        w.end_object();
    }

    w.finish(kCatalog, info_id);
    return w.take();
}

std::string serialize(const std::vector<TextFragment>& fragments, const PageProfile& profile, const DocumentInfo& info) {
    return write_document(layout(fragments, profile), profile, info);
}

}  // namespace pdf
