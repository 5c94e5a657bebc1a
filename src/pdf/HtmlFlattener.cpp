#include "pdf/HtmlFlattener.hpp"

#include "cvpress/TextUtil.hpp"

#include <cctype>
#include <cstdlib>
#include <utility>

namespace pdf {

namespace {

struct Tag {
    std::string name;                // lowercase, no attributes
    bool closing = false;
    bool self_closing = false;
};

Tag parse_tag(const std::string& body) {
    Tag t;
    size_t i = 0;
    while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) ++i;
    if (i < body.size() && body[i] == '/') {
        t.closing = true;
        ++i;
    }
    while (i < body.size()) {
        const unsigned char c = static_cast<unsigned char>(body[i]);
        if (std::isspace(c) || c == '/' || c == '>') break;
        t.name.push_back(static_cast<char>(std::tolower(c)));
        ++i;
    }
    if (!body.empty() && body.back() == '/') t.self_closing = true;
    return t;
}

bool is_skipped(const std::string& name) {
    return name == "head" || name == "style" || name == "script" || name == "title";
}

// Tags that end the current run of text.
bool is_block(const std::string& name) {
    static const char* kBlocks[] = {
        "h1", "h2", "h3", "h4", "h5", "h6", "p", "li", "ul", "ol", "dl", "dt", "dd",
        "div", "section", "header", "footer", "article", "br", "tr", "td", "th",
        "table", "blockquote", "pre", "hr", "body", "html"
    };
    for (const char* b : kBlocks) {
        if (name == b) return true;
    }
    return false;
}

// Blocks that set a style for their contents.
bool style_for(const std::string& name, Style& out) {
    if (name == "h1") { out = Style::Title; return true; }
    if (name == "h2") { out = Style::Heading; return true; }
    if (name == "h3" || name == "h4" || name == "h5" || name == "h6" || name == "dt") {
        out = Style::Subheading;
        return true;
    }
    if (name == "li") { out = Style::Bullet; return true; }
    if (name == "p" || name == "dd" || name == "div" || name == "td" || name == "th" || name == "pre") {
        out = Style::Body;
        return true;
    }
    return false;
}

class Flattener {
public:
    std::vector<TextFragment> run(const std::string& html) {
        size_t i = 0;
        while (i < html.size()) {
            if (html[i] != '<') {
                const size_t next = html.find('<', i);
                const size_t end = (next == std::string::npos) ? html.size() : next;
                if (skip_depth_ == 0) text_ += html.substr(i, end - i);
                i = end;
                continue;
            }

            if (html.compare(i, 4, "<!--") == 0) {
                const size_t end = html.find("-->", i + 4);
                i = (end == std::string::npos) ? html.size() : end + 3;
                continue;
            }

            const size_t close = html.find('>', i + 1);
            if (close == std::string::npos) {
                // stray '<' with no tag end: keep it as text
                if (skip_depth_ == 0) text_ += html.substr(i);
                break;
            }

            const std::string body = html.substr(i + 1, close - i - 1);
            i = close + 1;

            if (!body.empty() && (body[0] == '!' || body[0] == '?')) continue;  // doctype, processing instruction

            handle_tag(parse_tag(body));
        }

        flush();
        return std::move(out_);
    }

private:
    std::vector<TextFragment> out_;
    std::vector<std::pair<std::string, Style>> styles_;
    std::string text_;
    int skip_depth_ = 0;

    Style current_style() const {
        return styles_.empty() ? Style::Body : styles_.back().second;
    }

    void flush() {
        const std::vector<std::string> words = textutil::split_words(decode_entities(text_));
        text_.clear();
        if (words.empty()) return;

        TextFragment f;
        f.style = current_style();
        for (size_t k = 0; k < words.size(); ++k) {
            if (k) f.text += ' ';
            f.text += words[k];
        }
        out_.push_back(std::move(f));
    }

    void handle_tag(const Tag& t) {
        if (t.name.empty()) return;

        if (is_skipped(t.name)) {
            if (t.self_closing) return;
            if (t.closing) {
                if (skip_depth_ > 0) --skip_depth_;
            } else {
                ++skip_depth_;
            }
            return;
        }
        if (skip_depth_ > 0) return;

        if (!is_block(t.name)) return;  // inline tags (strong, em, span, a) only wrap text

        flush();

        Style s = Style::Body;
        if (!style_for(t.name, s) || t.self_closing) return;

        if (!t.closing) {
            styles_.emplace_back(t.name, s);
            return;
        }

        // pop back to the matching open tag; unmatched closers are ignored
        for (size_t k = styles_.size(); k > 0; --k) {
            if (styles_[k - 1].first == t.name) {
                styles_.resize(k - 1);
                break;
            }
        }
    }
};

}  // namespace

std::string decode_entities(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            out.push_back(s[i++]);
            continue;
        }

        const size_t semi = s.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back(s[i++]);
            continue;
        }

        const std::string name = s.substr(i + 1, semi - i - 1);
        bool known = true;

        if (name == "amp") out += '&';
        else if (name == "lt") out += '<';
        else if (name == "gt") out += '>';
        else if (name == "quot") out += '"';
        else if (name == "apos") out += '\'';
        else if (name == "nbsp") out += ' ';
        else if (name.size() > 1 && name[0] == '#') {
            const bool hex = name[1] == 'x' || name[1] == 'X';
            const std::string digits = name.substr(hex ? 2 : 1);
            char* end = nullptr;
            const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (digits.empty() || *end != '\0' || cp == 0 || cp > 0x10FFFF) known = false;
            else textutil::utf8_append(out, static_cast<char32_t>(cp));
        } else {
            known = false;
        }

        if (known) {
            i = semi + 1;
        } else {
            out.push_back(s[i++]);
        }
    }

    return out;
}

std::vector<TextFragment> flatten_html(const std::string& html) {
    return Flattener().run(html);
}

std::vector<TextFragment> flatten_text(const std::string& text) {
    std::vector<TextFragment> out;

    size_t i = 0;
    while (i < text.size()) {
        size_t j = text.find('\n', i);
        if (j == std::string::npos) j = text.size();
        std::string line = text.substr(i, j - i);
        i = j + 1;

        if (textutil::is_blank(line)) continue;
        out.push_back(TextFragment{textutil::trim_copy(line), Style::Body});
    }

    return out;
}

}  // namespace pdf
