//
// Created by gregorian-rayne on 10/18/26.
//

#include <gtest/gtest.h>
#include "rcp/metadata/metadata_extractor.hpp"

using namespace rcp;
using namespace rcp::metadata;

namespace {

    const std::string kValidDocument =
        "---\n"
        "title: EV Charging Market Analysis\n"
        "date: 2025-03-14\n"
        "id: MR-20250314-101500\n"
        "---\n"
        "# EV Charging Market Analysis\n\nBody text.\n";

}  // namespace

TEST(MetadataExtractorTest, ExtractsValidBlock) {
    const auto doc = extract_frontmatter(kValidDocument);

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    const auto& metadata = doc.value().metadata;
    EXPECT_EQ(metadata.size(), 3u);
    EXPECT_EQ(metadata.at("title"), "EV Charging Market Analysis");
    EXPECT_EQ(metadata.at("date"), "2025-03-14");
    EXPECT_EQ(metadata.at("id"), "MR-20250314-101500");
    EXPECT_EQ(doc.value().body, "# EV Charging Market Analysis\n\nBody text.\n");
}

TEST(MetadataExtractorTest, LeadingWhitespaceAndTrailingBlanksTolerated) {
    const auto doc = extract_frontmatter("\n\n---  \ntitle: T\ndate: D\n--- \t\nbody");

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_EQ(doc.value().metadata.at("title"), "T");
    EXPECT_EQ(doc.value().body, "body");
}

TEST(MetadataExtractorTest, ClosingDelimiterAtEndOfDocument) {
    const auto doc = extract_frontmatter("---\ntitle: T\ndate: D\n---");

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_TRUE(doc.value().body.empty());
}

TEST(MetadataExtractorTest, ExtraKeysPassThrough) {
    const auto doc = extract_frontmatter(
        "---\ntitle: T\ndate: D\nauthor: Research Desk\ntags: [ev, energy]\nreviewer:\n---\nbody");

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    const auto& metadata = doc.value().metadata;
    EXPECT_EQ(metadata.at("author"), "Research Desk");
    EXPECT_EQ(metadata.at("tags"), "[ev, energy]");
    EXPECT_EQ(metadata.at("reviewer"), "");
}

TEST(MetadataExtractorTest, MissingOpeningDelimiter) {
    const auto doc = extract_frontmatter("# Just a heading\n\n---\n");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::MissingFrontmatter);
}

TEST(MetadataExtractorTest, EmptyDocumentHasNoFrontmatter) {
    const auto doc = extract_frontmatter("");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::MissingFrontmatter);
}

TEST(MetadataExtractorTest, UnterminatedBlock) {
    const auto doc = extract_frontmatter("---\ntitle: T\ndate: D\n# Body without closing\n");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::UnterminatedFrontmatter);
}

TEST(MetadataExtractorTest, OpeningDelimiterOnly) {
    const auto doc = extract_frontmatter("---");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::UnterminatedFrontmatter);
}

TEST(MetadataExtractorTest, MalformedYaml) {
    const auto doc = extract_frontmatter("---\ntitle: [unclosed\ndate: D\n---\nbody");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::MetadataParseError);
    EXPECT_TRUE(doc.error().has_context());
}

TEST(MetadataExtractorTest, NonMappingBlock) {
    const auto doc = extract_frontmatter("---\n- title\n- date\n---\nbody");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::MetadataParseError);
}

TEST(MetadataExtractorTest, MissingRequiredFieldsListed) {
    const auto no_date = extract_frontmatter("---\ntitle: T\n---\nbody");
    ASSERT_TRUE(no_date.is_err());
    EXPECT_EQ(no_date.error().code(), ErrorCode::MissingRequiredField);
    EXPECT_EQ(no_date.error().context().value(), "date");

    const auto neither = extract_frontmatter("---\nid: X\n---\nbody");
    ASSERT_TRUE(neither.is_err());
    EXPECT_EQ(neither.error().context().value(), "title, date");
}

TEST(MetadataExtractorTest, EmptyBlockMissesBothFields) {
    const auto doc = extract_frontmatter("---\n---\nbody");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::MissingRequiredField);
}

TEST(MetadataExtractorTest, TooLarge) {
    const auto doc = extract_frontmatter(kValidDocument, kValidDocument.size() - 1);

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::TooLarge);
}

TEST(MetadataExtractorTest, PermissiveWithoutBlockReturnsDocumentUnchanged) {
    const std::string documents[] = {
        "# Plain report\n\nNo metadata here.\n",
        "",
        "   \n",
        "---\ntitle: T\nnever closed\n",
        "Intro\n---\ntitle: T\ndate: D\n---\n",
    };

    for (const auto& document : documents) {
        const auto doc = extract_permissive(document);
        ASSERT_TRUE(doc.is_ok()) << document;
        EXPECT_TRUE(doc.value().metadata.empty());
        EXPECT_EQ(doc.value().body, document);
    }
}

TEST(MetadataExtractorTest, PermissiveWithBlockValidates) {
    const auto ok = extract_permissive(kValidDocument);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().metadata.at("title"), "EV Charging Market Analysis");

    const auto missing = extract_permissive("---\ntitle: T\n---\nbody");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::MissingRequiredField);
}

TEST(MetadataExtractorTest, SerializedBlockExtractsBack) {
    const ReportMetadata metadata = {
        {"title", "Grid Storage: 2025 Outlook"},
        {"date", "2025-03-14 10:15:00"},
        {"id", "MR-20250314-101500"},
    };
    const std::string body = "\n# Grid Storage\n\nText with --- inside.\n";

    const auto doc = extract_frontmatter(serialize_frontmatter(metadata, body));

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_EQ(doc.value().metadata, metadata);
    EXPECT_EQ(doc.value().body, body);
}

TEST(MetadataExtractorTest, MissingRequiredFieldsHelper) {
    EXPECT_TRUE(missing_required_fields({{"title", "T"}, {"date", "D"}}).empty());
    EXPECT_EQ(missing_required_fields({{"date", "D"}}), std::vector<std::string>{"title"});
}
