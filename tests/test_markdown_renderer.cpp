#include <gtest/gtest.h>

#include "cvpress/MarkdownRenderer.hpp"
#include "Fixtures.hpp"

using namespace cvpress;

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

TEST(MarkdownRenderer, RendersNameSectionsAndBullets) {
    const std::string md = MarkdownRenderer().render(fixtures::alice(), RenderingConfig{});

    EXPECT_EQ(md.compare(0, 8, "# Alice\n"), 0);
    EXPECT_TRUE(contains(md, "alice@example.com"));
    EXPECT_TRUE(contains(md, "## Experience\n"));
    EXPECT_TRUE(contains(md, "**Engineer \xE2\x80\x94 Acme Corp**"));
    EXPECT_TRUE(contains(md, "- Shipped the billing service\n"));
    EXPECT_FALSE(contains(md, "## Education"));
    EXPECT_TRUE(contains(md, "## Volunteering\n\nRed Cross\n"));
}

TEST(MarkdownRenderer, SkillsAreOneLineEach) {
    ResumeContent c;
    SkillEntry s;
    s.name = "Languages";
    s.keywords = {"C++", "Python"};
    c.skills.push_back(s);

    const std::string md = MarkdownRenderer().render(c, RenderingConfig{});
    EXPECT_TRUE(contains(md, "## Skills\n\n- **Languages**: C++, Python\n"));
}

TEST(MarkdownRenderer, NestedExtraSections) {
    ResumeContent c;
    ExtraSection x;
    x.key = "awards";
    x.value = nlohmann::ordered_json::parse(R"([{"title": "Best Paper", "year": 2021}, "Dean's list"])");
    c.extra_sections.push_back(x);

    nlohmann::ordered_json section = nlohmann::ordered_json::object();
    section["title"] = "Awards";
    section["value"] = x.value;
    nlohmann::ordered_json ctx = nlohmann::ordered_json::object();
    ctx["extra_sections"] = nlohmann::ordered_json::array({section});

    const std::string md = render_markdown(ctx);
    EXPECT_TRUE(contains(md, "## Awards\n"));
    EXPECT_TRUE(contains(md, "  - **title**: Best Paper\n"));
    EXPECT_TRUE(contains(md, "  - **year**: 2021\n"));
    EXPECT_TRUE(contains(md, "- Dean's list\n"));

    EXPECT_EQ(MarkdownRenderer().render(c, RenderingConfig{}), md);
}

TEST(MarkdownRenderer, EmptyContentRendersNothing) {
    EXPECT_EQ(MarkdownRenderer().render(ResumeContent{}, RenderingConfig{}), "");
}
