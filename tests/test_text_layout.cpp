#include <gtest/gtest.h>

#include "cvpress/TextUtil.hpp"
#include "pdf/TextLayout.hpp"

#include <set>

using namespace pdf;

static std::string words_text(int n) {
    std::string s;
    for (int i = 0; i < n; ++i) {
        if (i) s += ' ';
        s += "word" + std::to_string(i % 97);
    }
    return s;
}

static std::string strip_marker(const std::string& line) {
    const std::string marker = kBulletMarker;
    return line.compare(0, marker.size(), marker) == 0 ? line.substr(marker.size()) : line;
}

// --- profiles and metrics ---

TEST(TextLayout, PageProfiles) {
    const PageProfile* letter = find_page_profile("letter");
    ASSERT_NE(letter, nullptr);
    EXPECT_FLOAT_EQ(letter->width, 612.0f);
    EXPECT_FLOAT_EQ(letter->height, 792.0f);
    EXPECT_FLOAT_EQ(letter->usable_width(), 504.0f);

    const PageProfile* a4 = find_page_profile("A4");
    ASSERT_NE(a4, nullptr);
    EXPECT_FLOAT_EQ(a4->height, 842.0f);

    EXPECT_EQ(find_page_profile("legal"), nullptr);
    EXPECT_EQ(default_page_profile().name, "letter");
}

TEST(TextLayout, WidthCountsCodePoints) {
    EXPECT_FLOAT_EQ(estimate_width("abcd", Style::Body), 4 * 10.0f * kAverageCharWidth);
    // "é" is two bytes but one glyph
    EXPECT_FLOAT_EQ(estimate_width("\xC3\xA9", Style::Body), estimate_width("e", Style::Body));
}

// --- wrapping ---

TEST(TextLayout, BlankFragmentProducesNoLines) {
    EXPECT_TRUE(wrap_fragment(TextFragment{"   \n\t", Style::Body}, 500.0f).empty());
}

TEST(TextLayout, WrapNeverSplitsWords) {
    const std::string text = words_text(300);
    const std::vector<std::string> input = textutil::split_words(text);
    const std::set<std::string> vocabulary(input.begin(), input.end());

    const auto lines = wrap_fragment(TextFragment{text, Style::Body}, 200.0f);
    ASSERT_GT(lines.size(), 1u);

    std::vector<std::string> output;
    for (const auto& l : lines) {
        for (const auto& w : textutil::split_words(l.text)) {
            EXPECT_TRUE(vocabulary.count(w)) << "split word: " << w;
            output.push_back(w);
        }
    }
    EXPECT_EQ(output, input);
}

TEST(TextLayout, LinesFitUnlessSingleOverWideWord) {
    std::string text = words_text(120) + " " + std::string(150, 'x') + " " + words_text(40);
    for (Style style : {Style::Body, Style::Heading, Style::Bullet}) {
        const float width = 300.0f;
        const auto lines = wrap_fragment(TextFragment{text, style}, width);
        for (const auto& l : lines) {
            const float avail = width - l.indent;
            const std::string shown = l.text;
            if (estimate_width(shown, style) > avail) {
                EXPECT_EQ(textutil::split_words(strip_marker(shown)).size(), 1u) << shown;
            }
        }
    }
}

TEST(TextLayout, OverWideWordSitsAlone) {
    const std::string huge(200, 'w');
    const auto lines = wrap_fragment(TextFragment{"a " + huge + " b", Style::Body}, 100.0f);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, "a");
    EXPECT_EQ(lines[1].text, huge);
    EXPECT_EQ(lines[2].text, "b");
}

TEST(TextLayout, BulletMarkerOnFirstLineOnly) {
    const auto lines = wrap_fragment(TextFragment{words_text(80), Style::Bullet}, 200.0f);
    ASSERT_GT(lines.size(), 1u);
    EXPECT_EQ(lines[0].text.compare(0, std::string(kBulletMarker).size(), kBulletMarker), 0);
    EXPECT_TRUE(lines[0].starts_fragment);
    EXPECT_FLOAT_EQ(lines[0].indent, kBulletIndent);
    for (size_t i = 1; i < lines.size(); ++i) {
        EXPECT_NE(lines[i].text.compare(0, std::string(kBulletMarker).size(), kBulletMarker), 0);
        EXPECT_FALSE(lines[i].starts_fragment);
        EXPECT_GT(lines[i].indent, kBulletIndent);
    }
}

// --- pagination ---

TEST(TextLayout, NoInputStillYieldsOnePage) {
    const auto pages = layout({}, default_page_profile());
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_TRUE(pages[0].lines.empty());
}

TEST(TextLayout, PaginationIsMonotonic) {
    const PageProfile& profile = default_page_profile();
    size_t previous = 0;
    for (int n = 0; n <= 6000; n += 250) {
        const auto pages = layout({TextFragment{words_text(n), Style::Body}}, profile);
        EXPECT_GE(pages.size(), previous) << "words: " << n;
        previous = pages.size();
    }
    EXPECT_GT(previous, 1u);
}

TEST(TextLayout, LinesStayInsideMargins) {
    const PageProfile& profile = default_page_profile();
    std::vector<TextFragment> frags;
    for (int i = 0; i < 40; ++i) {
        frags.push_back(TextFragment{"Heading " + std::to_string(i), Style::Heading});
        frags.push_back(TextFragment{words_text(60), Style::Body});
        frags.push_back(TextFragment{words_text(25), Style::Bullet});
    }

    const auto pages = layout(frags, profile);
    ASSERT_GT(pages.size(), 1u);
    for (const auto& page : pages) {
        ASSERT_FALSE(page.lines.empty());
        float prev_y = profile.height;
        for (const auto& line : page.lines) {
            EXPECT_LT(line.y, prev_y);
            EXPECT_GE(line.y, profile.margin_bottom - metrics(line.style).line_height);
            EXPECT_LE(line.y, profile.height - profile.margin_top);
            EXPECT_GE(line.x, profile.margin_left);
            prev_y = line.y;
        }
    }
}

TEST(TextLayout, HeadingGapDroppedAtTopOfPage) {
    const PageProfile& profile = default_page_profile();
    const auto pages = layout({TextFragment{"Experience", Style::Heading}}, profile);
    ASSERT_EQ(pages[0].lines.size(), 1u);
    const float expected = profile.height - profile.margin_top - metrics(Style::Heading).size;
    EXPECT_FLOAT_EQ(pages[0].lines[0].y, expected);
}
