#include "pdf/Inspect.hpp"

#include <cctype>
#include <cstdlib>

namespace pdf {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Integer following `key` (after whitespace) searching from `from`; -1 if absent.
static long read_int_after(const std::string& s, const std::string& key, std::size_t from = 0) {
    const std::size_t k = s.find(key, from);
    if (k == std::string::npos) return -1;
    std::size_t i = k + key.size();
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return -1;
    return std::strtol(s.c_str() + i, nullptr, 10);
}

static int count_occurrences(const std::string& s, const std::string& needle) {
    int n = 0;
    std::size_t pos = 0;
    while ((pos = s.find(needle, pos)) != std::string::npos) {
        ++n;
        pos += needle.size();
    }
    return n;
}

InspectReport inspect(const std::string& bytes) {
    InspectReport r;

    r.header_ok = bytes.compare(0, 5, "%PDF-") == 0;
    if (!r.header_ok) r.problems.push_back("missing %PDF- header");

    r.eof_ok = ends_with(bytes, "%%EOF") || ends_with(bytes, "%%EOF\n") || ends_with(bytes, "%%EOF\r\n");
    if (!r.eof_ok) r.problems.push_back("missing %%EOF marker");

    const std::size_t sx = bytes.rfind("startxref");
    if (sx == std::string::npos) {
        r.problems.push_back("missing startxref");
        return r;
    }
    const long xref_at = read_int_after(bytes, "startxref", sx);
    if (xref_at < 0 || static_cast<std::size_t>(xref_at) >= bytes.size() ||
        bytes.compare(static_cast<std::size_t>(xref_at), 4, "xref") != 0) {
        r.problems.push_back("startxref does not point at the xref table");
        return r;
    }
    r.xref_offset = static_cast<std::size_t>(xref_at);

    // "xref\n0 N\n" then N fixed-width 20-byte entries
    std::size_t i = r.xref_offset + 4;
    while (i < bytes.size() && std::isspace(static_cast<unsigned char>(bytes[i]))) ++i;
    char* end = nullptr;
    const long first = std::strtol(bytes.c_str() + i, &end, 10);
    const long count = std::strtol(end, &end, 10);
    if (first != 0 || count <= 0) {
        r.problems.push_back("unexpected xref subsection header");
        return r;
    }
    r.xref_entries = static_cast<int>(count);

    std::size_t p = static_cast<std::size_t>(end - bytes.c_str());
    while (p < bytes.size() && (bytes[p] == '\r' || bytes[p] == '\n')) ++p;

    for (long id = 0; id < count; ++id) {
        const std::size_t at = p + static_cast<std::size_t>(id) * 20;
        if (at + 20 > bytes.size()) {
            r.problems.push_back("xref table truncated");
            return r;
        }
        const std::string entry = bytes.substr(at, 20);
        const char kind = entry[17];
        if (id == 0) {
            if (kind != 'f') r.problems.push_back("xref entry 0 is not free");
            continue;
        }
        if (kind != 'n') {
            r.problems.push_back("xref entry " + std::to_string(id) + " is not in use");
            continue;
        }

        const std::size_t off = static_cast<std::size_t>(std::strtoul(entry.substr(0, 10).c_str(), nullptr, 10));
        r.offsets.push_back(off);

        const std::string expect = std::to_string(id) + " 0 obj";
        if (off >= bytes.size() || bytes.compare(off, expect.size(), expect) != 0) {
            r.problems.push_back("xref offset for object " + std::to_string(id) + " does not point at its header");
        }
    }

    const std::size_t tr = bytes.find("trailer", r.xref_offset);
    if (tr == std::string::npos) {
        r.problems.push_back("missing trailer");
        return r;
    }
    r.declared_size = static_cast<int>(read_int_after(bytes, "/Size", tr));
    r.root_id = static_cast<int>(read_int_after(bytes, "/Root", tr));
    if (r.declared_size != r.xref_entries) r.problems.push_back("trailer /Size does not match the xref table");
    if (r.root_id <= 0 || r.root_id >= r.xref_entries) r.problems.push_back("trailer /Root does not resolve");

    // content text is always inside a string literal, so a line-initial endobj is a real terminator
    r.objects = count_occurrences(bytes.substr(0, r.xref_offset), "\nendobj\n");
    if (r.objects != r.xref_entries - 1) r.problems.push_back("object count does not match the xref table");

    const std::size_t pages_at = bytes.find("/Type /Pages");
    if (pages_at != std::string::npos) r.pages = static_cast<int>(read_int_after(bytes, "/Count", pages_at));
    if (r.pages <= 0) r.problems.push_back("no pages");

    return r;
}

}  // namespace pdf
