#pragma once

#include <string>
#include <vector>

namespace pdf {

enum class Style {
    Title,
    Heading,
    Subheading,
    Body,
    Bullet
};

struct StyleMetrics {
    float size = 10.0f;              // font size (pt)
    float line_height = 13.0f;       // baseline-to-baseline advance (pt)
    float space_before = 0.0f;       // extra gap before a fragment of this style (pt)
};

const StyleMetrics& metrics(Style style);

// Page size and margins, all in points.
struct PageProfile {
    std::string name;
    float width = 612.0f;
    float height = 792.0f;
    float margin_left = 54.0f;
    float margin_right = 54.0f;
    float margin_top = 54.0f;
    float margin_bottom = 54.0f;

    float usable_width() const { return width - margin_left - margin_right; }
    float usable_height() const { return height - margin_top - margin_bottom; }
};

// nullptr for unknown names
const PageProfile* find_page_profile(const std::string& name);
const PageProfile& default_page_profile();
std::vector<std::string> page_profile_names();

// Average glyph advance as a fraction of the font size. Every code point is
// treated as this wide, which overestimates Helvetica for most text.
constexpr float kAverageCharWidth = 0.5f;

constexpr float kBulletIndent = 10.0f;
constexpr const char* kBulletMarker = "\xE2\x80\xA2 ";   // "• "

struct TextFragment {
    std::string text;                // UTF-8
    Style style = Style::Body;
};

// One wrapped output line, not yet placed on a page.
struct LayoutLine {
    std::string text;
    Style style = Style::Body;
    float indent = 0.0f;             // from the left margin
    bool starts_fragment = false;
};

struct PlacedLine {
    std::string text;
    Style style = Style::Body;
    float x = 0.0f;
    float y = 0.0f;                  // baseline, PDF coordinates (origin bottom-left)
};

struct Page {
    std::vector<PlacedLine> lines;
};

float estimate_width(const std::string& text, Style style);

// Greedy wrap. Words are never split; a word wider than the line stays alone
// on its own line. Blank fragments produce no lines.
std::vector<LayoutLine> wrap_fragment(const TextFragment& fragment, float usable_width);

// Always returns at least one page.
std::vector<Page> paginate(const std::vector<LayoutLine>& lines, const PageProfile& profile);

std::vector<Page> layout(const std::vector<TextFragment>& fragments, const PageProfile& profile);

}  // namespace pdf
