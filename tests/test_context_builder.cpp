#include <gtest/gtest.h>

#include "cvpress/ContextBuilder.hpp"
#include "Fixtures.hpp"

#include <chrono>

using namespace cvpress;
using ojson = nlohmann::ordered_json;

// --- emptiness predicates ---

TEST(ContextBuilder, EmptyValuePerType) {
    EXPECT_TRUE(is_empty_value(ojson()));
    EXPECT_TRUE(is_empty_value(ojson("")));
    EXPECT_TRUE(is_empty_value(ojson(" \t\n")));
    EXPECT_TRUE(is_empty_value(ojson::array()));
    EXPECT_TRUE(is_empty_value(ojson::object()));
    EXPECT_TRUE(is_empty_value(ojson::parse(R"([{"a": ""}, [], {"b": [null]}])")));

    EXPECT_FALSE(is_empty_value(ojson(0)));
    EXPECT_FALSE(is_empty_value(ojson(false)));
    EXPECT_FALSE(is_empty_value(ojson("x")));
}

TEST(ContextBuilder, PruneDropsEmptyMembersRecursively) {
    const ojson in = ojson::parse(R"({"a": "", "b": {"c": [], "d": "keep"}, "e": ["", "x", {}], "f": 0})");
    const ojson out = prune_value(in);

    EXPECT_EQ(out, ojson::parse(R"({"b": {"d": "keep"}, "e": ["x"], "f": 0})"));
    EXPECT_TRUE(prune_value(ojson::parse(R"({"a": {"b": ""}})")).is_null());
}

TEST(ContextBuilder, TitleFromKey) {
    EXPECT_EQ(title_from_key("volunteering"), "Volunteering");
    EXPECT_EQ(title_from_key("side_projects"), "Side Projects");
    EXPECT_EQ(title_from_key("open-source"), "Open Source");
    EXPECT_EQ(title_from_key("__x__"), "X");
}

// --- extra section fragments ---

TEST(ContextBuilder, ExtraSectionHtmlShapes) {
    EXPECT_EQ(extra_section_html(ojson("Red Cross")), "<p>Red Cross</p>");
    EXPECT_EQ(extra_section_html(ojson::parse(R"(["a", "b"])")), "<ul><li>a</li><li>b</li></ul>");
    EXPECT_EQ(extra_section_html(ojson::parse(R"({"k": "v"})")), "<dl><dt>k</dt><dd>v</dd></dl>");
    EXPECT_EQ(extra_section_html(ojson::parse(R"([{"org": "X", "years": 2}])")),
              "<ul><li><dl><dt>org</dt><dd>X</dd><dt>years</dt><dd>2</dd></dl></li></ul>");
}

TEST(ContextBuilder, ExtraSectionHtmlIsEscaped) {
    EXPECT_EQ(extra_section_html(ojson("<b>Tom & Jerry</b>")), "<p>&lt;b&gt;Tom &amp; Jerry&lt;/b&gt;</p>");
    EXPECT_EQ(extra_section_html(ojson::parse(R"({"<k>": "'q'"})")),
              "<dl><dt>&lt;k&gt;</dt><dd>&#39;q&#39;</dd></dl>");
}

// --- build_context ---

TEST(ContextBuilder, EmptyContentYieldsEmptyContext) {
    const ojson ctx = build_context(ResumeContent{});
    EXPECT_TRUE(ctx.is_object());
    EXPECT_TRUE(ctx.empty());
}

TEST(ContextBuilder, SectionWithOnlyBlankEntriesIsOmitted) {
    ResumeContent c;
    c.basics.name = "Bob";
    c.work.push_back(WorkEntry{});
    WorkEntry blank;
    blank.summary = "   ";
    blank.highlights = {"", " "};
    c.work.push_back(blank);

    const ojson ctx = build_context(c);
    EXPECT_FALSE(ctx.contains("work"));
    EXPECT_FALSE(ctx.contains("education"));
    EXPECT_EQ(ctx["basics"]["name"], "Bob");
}

TEST(ContextBuilder, BlankLeavesArePruned) {
    ResumeContent c;
    c.basics.name = "Bob";
    c.basics.email = "  ";
    c.basics.profiles.push_back(Profile{});

    const ojson ctx = build_context(c);
    EXPECT_FALSE(ctx["basics"].contains("email"));
    EXPECT_FALSE(ctx["basics"].contains("profiles"));
    EXPECT_FALSE(ctx["basics"].contains("location"));
}

TEST(ContextBuilder, WorkSectionCarriesTitleAndDerivedFields) {
    const ojson ctx = build_context(fixtures::alice());

    ASSERT_TRUE(ctx.contains("work"));
    EXPECT_EQ(ctx["work"]["title"], "Experience");
    ASSERT_EQ(ctx["work"]["entries"].size(), 1u);

    const ojson& e = ctx["work"]["entries"][0];
    EXPECT_EQ(e["heading"], "Engineer \xE2\x80\x94 Acme Corp");
    EXPECT_EQ(e["dates"], "2020-01 \xE2\x80\x93 Present");
    EXPECT_EQ(e["highlights"].size(), 2u);
}

TEST(ContextBuilder, EducationHeadingJoinsDegreeAndInstitution) {
    ResumeContent c;
    EducationEntry ed;
    ed.institution = "MIT";
    ed.area = "Physics";
    ed.study_type = "BSc";
    ed.start_date = "2010";
    ed.end_date = "2014";
    c.education.push_back(ed);

    const ojson ctx = build_context(c);
    const ojson& e = ctx["education"]["entries"][0];
    EXPECT_EQ(e["heading"], "BSc in Physics \xE2\x80\x94 MIT");
    EXPECT_EQ(e["dates"], "2010 \xE2\x80\x93 2014");
}

TEST(ContextBuilder, SkillKeywordsAreJoined) {
    ResumeContent c;
    SkillEntry s;
    s.name = "Languages";
    s.keywords = {"C++", "", "Rust"};
    c.skills.push_back(s);

    const ojson ctx = build_context(c);
    EXPECT_EQ(ctx["skills"]["entries"][0]["keywords_text"], "C++, Rust");
}

TEST(ContextBuilder, ExtraSectionsKeepEncounterOrder) {
    ResumeContent c;
    for (const char* key : {"zeta", "alpha", "middle_one"}) {
        ExtraSection x;
        x.key = key;
        x.value = std::string("value of ") + key;
        c.extra_sections.push_back(x);
    }

    const ojson ctx = build_context(c);
    ASSERT_EQ(ctx["extra_sections"].size(), 3u);
    EXPECT_EQ(ctx["extra_sections"][0]["id"], "zeta");
    EXPECT_EQ(ctx["extra_sections"][1]["id"], "alpha");
    EXPECT_EQ(ctx["extra_sections"][2]["id"], "middle_one");
    EXPECT_EQ(ctx["extra_sections"][2]["title"], "Middle One");
    EXPECT_EQ(ctx["extra_sections"][0]["html"], "<p>value of zeta</p>");
}

TEST(ContextBuilder, EmptyExtraSectionIsDropped) {
    ResumeContent c;
    ExtraSection empty;
    empty.key = "awards";
    empty.value = ojson::array({"", ojson::object()});
    c.extra_sections.push_back(empty);

    ExtraSection kept;
    kept.key = "interests";
    kept.value = ojson::array({"chess"});
    c.extra_sections.push_back(kept);

    const ojson ctx = build_context(c);
    ASSERT_EQ(ctx["extra_sections"].size(), 1u);
    EXPECT_EQ(ctx["extra_sections"][0]["id"], "interests");
}

// --- pathological nesting ---

TEST(ContextBuilder, PruneCapsNestingAndKeepsLeaves) {
    const ojson v = ojson::parse(R"({"a": [[["x", ""], {"b": 2}]], "c": null})");
    EXPECT_EQ(prune_value(v), ojson::parse(R"({"a": [[["x"], {"b": 2}]]})"));

    const ojson pruned = prune_value(fixtures::nested_arrays(100, "deep"));
    const ojson* cur = &pruned;
    std::size_t depth = 0;
    while (cur->is_array()) {
        ASSERT_EQ(cur->size(), 1u);
        ++depth;
        cur = &(*cur)[0];
    }
    EXPECT_EQ(depth, kMaxNestingDepth);
    EXPECT_EQ(*cur, "deep");
}

TEST(ContextBuilder, DeeplyNestedExtraSectionIsTotal) {
    const ResumeContent c = fixtures::deeply_nested(50000);
    EXPECT_FALSE(is_empty_value(c.extra_sections[0].value));

    const auto started = std::chrono::steady_clock::now();
    const ojson ctx = build_context(c);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(ctx["extra_sections"].size(), 1u);
    EXPECT_NE(ctx["extra_sections"][0]["html"].get<std::string>().find("deep"), std::string::npos);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 5);
}
