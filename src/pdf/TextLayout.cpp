#include "pdf/TextLayout.hpp"

#include "cvpress/TextUtil.hpp"

namespace pdf {

const StyleMetrics& metrics(Style style) {
    static const StyleMetrics kTitle{20.0f, 26.0f, 0.0f};
    static const StyleMetrics kHeading{14.0f, 19.0f, 8.0f};
    static const StyleMetrics kSubheading{11.5f, 15.0f, 4.0f};
    static const StyleMetrics kBody{10.0f, 13.0f, 0.0f};
    static const StyleMetrics kBullet{10.0f, 13.0f, 0.0f};

    switch (style) {
        case Style::Title:      return kTitle;
        case Style::Heading:    return kHeading;
        case Style::Subheading: return kSubheading;
        case Style::Bullet:     return kBullet;
        case Style::Body:
        default:                return kBody;
    }
}

static const std::vector<PageProfile>& profiles() {
    static const std::vector<PageProfile> kProfiles = {
        PageProfile{"letter", 612.0f, 792.0f, 54.0f, 54.0f, 54.0f, 54.0f},
        PageProfile{"a4", 595.0f, 842.0f, 54.0f, 54.0f, 54.0f, 54.0f},
    };
    return kProfiles;
}

const PageProfile* find_page_profile(const std::string& name) {
    const std::string key = textutil::to_lower_copy(name);
    for (const auto& p : profiles()) {
        if (p.name == key) return &p;
    }
    return nullptr;
}

const PageProfile& default_page_profile() {
    return profiles().front();
}

std::vector<std::string> page_profile_names() {
    std::vector<std::string> out;
    for (const auto& p : profiles()) out.push_back(p.name);
    return out;
}

float estimate_width(const std::string& text, Style style) {
    return static_cast<float>(textutil::utf8_length(text)) * metrics(style).size * kAverageCharWidth;
}

std::vector<LayoutLine> wrap_fragment(const TextFragment& fragment, float usable_width) {
    std::vector<LayoutLine> out;

    const std::vector<std::string> words = textutil::split_words(fragment.text);
    if (words.empty()) return out;

    const bool bullet = fragment.style == Style::Bullet;
    const std::string marker = bullet ? kBulletMarker : "";
    // continuation lines of a bullet hang under the text, not the marker
    const float first_indent = bullet ? kBulletIndent : 0.0f;
    const float next_indent = bullet ? kBulletIndent + estimate_width(marker, fragment.style) : 0.0f;

    auto emit = [&](const std::string& text) {
        LayoutLine line;
        const bool first = out.empty();
        line.text = first ? marker + text : text;
        line.style = fragment.style;
        line.indent = first ? first_indent : next_indent;
        line.starts_fragment = first;
        out.push_back(std::move(line));
    };

    auto fits = [&](const std::string& text) {
        const bool first = out.empty();
        const float avail = usable_width - (first ? first_indent : next_indent);
        const std::string shown = first ? marker + text : text;
        return estimate_width(shown, fragment.style) <= avail;
    };

    std::string cur;
    for (const auto& w : words) {
        const std::string candidate = cur.empty() ? w : cur + " " + w;
        if (fits(candidate)) {
            cur = candidate;
        } else if (cur.empty()) {
            // over-wide word: alone on its line, never truncated
            cur = w;
        } else {
            emit(cur);
            cur = w;
        }
    }
    if (!cur.empty()) emit(cur);

    return out;
}

std::vector<Page> paginate(const std::vector<LayoutLine>& lines, const PageProfile& profile) {
    std::vector<Page> pages(1);
    const float usable = profile.usable_height();
    float used = 0.0f;

    for (const auto& line : lines) {
        const StyleMetrics& m = metrics(line.style);
        float before = (line.starts_fragment && used > 0.0f) ? m.space_before : 0.0f;

        if (used + before + m.line_height > usable && !pages.back().lines.empty()) {
            pages.emplace_back();
            used = 0.0f;
            before = 0.0f;   // no leading gap at the top of a page
        }

        PlacedLine placed;
        placed.text = line.text;
        placed.style = line.style;
        placed.x = profile.margin_left + line.indent;
        placed.y = profile.height - profile.margin_top - (used + before) - m.size;
        pages.back().lines.push_back(std::move(placed));

        used += before + m.line_height;
    }

    return pages;
}

std::vector<Page> layout(const std::vector<TextFragment>& fragments, const PageProfile& profile) {
    std::vector<LayoutLine> lines;
    for (const auto& f : fragments) {
        std::vector<LayoutLine> wrapped = wrap_fragment(f, profile.usable_width());
        lines.insert(lines.end(), wrapped.begin(), wrapped.end());
    }
    return paginate(lines, profile);
}

}  // namespace pdf
