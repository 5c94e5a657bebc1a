#include <gtest/gtest.h>

#include "backend/ProcUtil.hpp"
#include "cvpress/Errors.hpp"
#include "cvpress/ThemeRegistry.hpp"
#include "Fixtures.hpp"

#include <algorithm>

using namespace cvpress;
namespace fs = std::filesystem;

static bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// --- built-ins ---

TEST(ThemeRegistry, BuiltinsAreRegisteredInOrder) {
    ThemeRegistry reg;
    const std::vector<std::string> names = reg.names();
    ASSERT_GE(names.size(), 3u);
    EXPECT_EQ(names[0], "default");
    EXPECT_TRUE(has(names, "minimal"));
    EXPECT_TRUE(has(names, "classic"));
}

TEST(ThemeRegistry, EveryBuiltinHasTemplateAndCss) {
    for (const auto& t : builtin_themes()) {
        EXPECT_FALSE(t.template_text.empty()) << t.name;
        EXPECT_FALSE(t.css.empty()) << t.name;
        EXPECT_NE(t.template_text.find("{{ css }}"), std::string::npos) << t.name;
    }
}

// --- resolve ---

TEST(ThemeRegistry, KnownThemeResolvesToItself) {
    ThemeRegistry reg;
    const ResolvedTemplate r = reg.resolve("classic", "");
    EXPECT_EQ(r.theme_name, "classic");
    EXPECT_FALSE(r.fell_back);
    EXPECT_FALSE(r.custom);
    EXPECT_EQ(r.text, reg.find("classic")->template_text);
}

TEST(ThemeRegistry, UnknownThemeFallsBackToDefault) {
    ThemeRegistry reg;
    const ResolvedTemplate r = reg.resolve("no-such-theme", "");
    EXPECT_TRUE(r.fell_back);
    EXPECT_EQ(r.theme_name, "default");
    EXPECT_EQ(r.text, reg.find("default")->template_text);
}

TEST(ThemeRegistry, CustomTemplateIsVerbatim) {
    ThemeRegistry reg;
    const ResolvedTemplate r = reg.resolve("no-such-theme", "<p>{{ basics.name }}</p>");
    EXPECT_TRUE(r.custom);
    EXPECT_FALSE(r.fell_back);
    EXPECT_EQ(r.text, "<p>{{ basics.name }}</p>");
    EXPECT_TRUE(r.css.empty());

    const ResolvedTemplate styled = reg.resolve("minimal", "x");
    EXPECT_EQ(styled.css, reg.find("minimal")->css);
}

// --- discovery ---

TEST(ThemeRegistry, DiscoversThemesFromDirectory) {
    procutil::ScopedTempDir tmp("cvpress-themes-test");
    fs::create_directory(tmp.path() / "fancy");
    fixtures::write_file(tmp.path() / "fancy" / "index.html", "<h1>{{ basics.name }}</h1>");
    fixtures::write_file(tmp.path() / "fancy" / "styles.css", "h1 { color: red; }");
    fixtures::write_file(tmp.path() / "plain.html", "<p>plain</p>");
    fixtures::write_file(tmp.path() / "plain.css", "p { margin: 0; }");
    fixtures::write_file(tmp.path() / "notes.txt", "not a theme");
    fs::create_directory(tmp.path() / "empty-dir");

    ThemeRegistry reg(tmp.path());
    ASSERT_TRUE(reg.contains("fancy"));
    ASSERT_TRUE(reg.contains("plain"));
    EXPECT_FALSE(reg.contains("notes"));
    EXPECT_FALSE(reg.contains("empty-dir"));

    EXPECT_EQ(reg.find("fancy")->css, "h1 { color: red; }");
    EXPECT_EQ(reg.find("plain")->template_text, "<p>plain</p>");
    EXPECT_EQ(reg.find("plain")->css, "p { margin: 0; }");
}

TEST(ThemeRegistry, DiscoveredThemeNeverReplacesBuiltin) {
    procutil::ScopedTempDir tmp("cvpress-themes-test");
    fixtures::write_file(tmp.path() / "default.html", "hijacked");

    ThemeRegistry reg(tmp.path());
    EXPECT_NE(reg.find("default")->template_text, "hijacked");
}

TEST(ThemeRegistry, MissingDirectoryThrows) {
    const fs::path missing("/nonexistent/cvpress/themes");
    EXPECT_THROW({ ThemeRegistry reg(missing); }, InputError);
}
