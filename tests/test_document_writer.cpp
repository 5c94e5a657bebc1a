#include <gtest/gtest.h>

#include "pdf/DocumentWriter.hpp"
#include "pdf/Inspect.hpp"

#include <stdexcept>

using namespace pdf;

static std::vector<TextFragment> sample_fragments(int paragraphs) {
    std::vector<TextFragment> out;
    out.push_back(TextFragment{"Alice", Style::Title});
    for (int i = 0; i < paragraphs; ++i) {
        out.push_back(TextFragment{"Section " + std::to_string(i), Style::Heading});
        out.push_back(TextFragment{"Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor "
                                   "incididunt ut labore et dolore magna aliqua.", Style::Body});
        out.push_back(TextFragment{"A bullet point with (parentheses) and a back\\slash", Style::Bullet});
    }
    return out;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// --- file structure ---

TEST(DocumentWriter, HeaderAndEofMarkers) {
    const std::string pdf = serialize(sample_fragments(2), default_page_profile());
    EXPECT_EQ(pdf.compare(0, 9, "%PDF-1.4\n"), 0);
    EXPECT_TRUE(ends_with(pdf, "%%EOF\n"));
}

TEST(DocumentWriter, XrefOffsetsPointAtObjectHeaders) {
    const std::string pdf = serialize(sample_fragments(60), default_page_profile());
    const InspectReport r = inspect(pdf);

    for (const auto& p : r.problems) ADD_FAILURE() << p;
    ASSERT_TRUE(r.ok());
    for (size_t i = 0; i < r.offsets.size(); ++i) {
        const std::string expect = std::to_string(i + 1) + " 0 obj";
        EXPECT_EQ(pdf.compare(r.offsets[i], expect.size(), expect), 0) << "object " << i + 1;
    }
}

TEST(DocumentWriter, TrailerSizeMatchesObjectCount) {
    const std::string pdf = serialize(sample_fragments(60), default_page_profile());
    const InspectReport r = inspect(pdf);
    ASSERT_TRUE(r.ok());

    ASSERT_GT(r.pages, 1);
    // catalog, pages, font, then a page + contents pair per page
    EXPECT_EQ(r.objects, 3 + 2 * r.pages);
    EXPECT_EQ(r.declared_size, r.objects + 1);
    EXPECT_EQ(r.root_id, 1);
}

TEST(DocumentWriter, InfoObjectIsAppendedLast) {
    DocumentInfo info;
    info.title = "Alice";
    info.producer = "cvpress";
    info.creation_date = pdf_date(0);
    EXPECT_EQ(info.creation_date, "D:19700101000000Z");

    const std::string pdf = serialize(sample_fragments(1), default_page_profile(), info);
    const InspectReport r = inspect(pdf);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.objects, 3 + 2 * r.pages + 1);

    const std::string info_ref = "/Info " + std::to_string(r.objects) + " 0 R";
    EXPECT_NE(pdf.find(info_ref), std::string::npos);
    EXPECT_NE(pdf.find("/CreationDate (D:19700101000000Z)"), std::string::npos);
}

TEST(DocumentWriter, EmptyInputStillHasOnePage) {
    const std::string pdf = serialize({}, default_page_profile());
    const InspectReport r = inspect(pdf);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.pages, 1);
    EXPECT_EQ(r.objects, 5);

    EXPECT_TRUE(inspect(write_document({}, default_page_profile())).ok());
}

TEST(DocumentWriter, MediaBoxFollowsProfile) {
    const std::string pdf = serialize(sample_fragments(1), *find_page_profile("a4"));
    EXPECT_NE(pdf.find("/MediaBox [0 0 595 842]"), std::string::npos);
}

// --- determinism ---

TEST(DocumentWriter, IdenticalInputIsByteIdentical) {
    DocumentInfo info;
    info.title = "Alice";
    info.creation_date = pdf_date(1700000000);

    const std::string a = serialize(sample_fragments(30), default_page_profile(), info);
    const std::string b = serialize(sample_fragments(30), default_page_profile(), info);
    EXPECT_EQ(a, b);
}

// --- text encoding ---

TEST(DocumentWriter, LiteralStringsAreEscaped) {
    EXPECT_EQ(encode_text("a(b)c\\d"), "(a\\(b\\)c\\\\d)");
    EXPECT_EQ(encode_text("tab\there"), "(tab here)");
    EXPECT_EQ(encode_text("bell\x07"), "(bell)");
}

TEST(DocumentWriter, WinAnsiMapping) {
    // e-acute is Latin-1, the en dash and bullet live in the 0x80 block
    EXPECT_EQ(encode_text("\xC3\xA9"), "(\\351)");
    EXPECT_EQ(encode_text("\xE2\x80\x93"), "(\\226)");
    EXPECT_EQ(encode_text("\xE2\x80\xA2"), "(\\225)");
    // CJK has no WinAnsi code
    EXPECT_EQ(encode_text("\xE6\xBC\xA2"), "(?)");
}

TEST(DocumentWriter, NumbersUseFixedPrecision) {
    EXPECT_EQ(format_number(612.0f), "612");
    EXPECT_EQ(format_number(11.5f), "11.5");
    EXPECT_EQ(format_number(0.126f), "0.13");
    EXPECT_EQ(format_number(-0.001f), "0");
}

TEST(DocumentWriter, PathologicalTextStillProducesValidFile) {
    std::vector<TextFragment> frags;
    frags.push_back(TextFragment{std::string(5000, 'x'), Style::Title});
    frags.push_back(TextFragment{"endobj\nendobj %%EOF xref trailer", Style::Body});
    frags.push_back(TextFragment{"\xFF\xFE broken utf8 \xC3", Style::Bullet});
    frags.push_back(TextFragment{"))))((((\\\\", Style::Body});

    const InspectReport r = inspect(serialize(frags, default_page_profile()));
    for (const auto& p : r.problems) ADD_FAILURE() << p;
    EXPECT_TRUE(r.ok());
}

// --- object writer ---

TEST(DocumentWriter, ObjectsMustBeWrittenInOrder) {
    ObjectWriter w;
    w.begin_object(1);
    w.write("<< >>");
    w.end_object();
    EXPECT_THROW(w.begin_object(3), std::logic_error);
    EXPECT_EQ(w.object_count(), 1u);
    EXPECT_EQ(w.offset_of(1), 15u);
}
