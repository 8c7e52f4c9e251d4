//
// Created by gregorian-rayne on 10/18/26.
//

#include <gtest/gtest.h>
#include "rcp/rcp.hpp"

#include <filesystem>
#include <unistd.h>

using namespace rcp;
namespace fs = std::filesystem;

namespace {

    const std::string kReport =
        "---\n"
        "title: \x1B[1mHeat Pumps Market Analysis\x1B[0m\n"
        "date: 2025-03-14 10:15:07\n"
        "---\n"
        "# Heat Pumps\n\nInstallations grew x^2^ ESC[32mfaster ESC[0m.\n";

}  // namespace

TEST(PipelineTest, ProcessDocumentFrontmatter) {
    pipeline::ProcessOptions options;
    options.policy = pipeline::MetadataPolicy::Frontmatter;

    const auto doc = pipeline::process_document(kReport, options);

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_EQ(doc.value().metadata.at("title"), "Heat Pumps Market Analysis");
    EXPECT_EQ(doc.value().body, "# Heat Pumps\n\nInstallations grew x^2^ faster .\n");
    EXPECT_NE(doc.value().html.find("<h1>Heat Pumps</h1>"), std::string::npos);
    EXPECT_NE(doc.value().html.find("<sup>2</sup>"), std::string::npos);
}

TEST(PipelineTest, ProcessDocumentPermissiveWithoutBlock) {
    const auto doc = pipeline::process_document("# Plain\n\nNo metadata.\n");

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_TRUE(doc.value().metadata.empty());
    EXPECT_EQ(doc.value().body, "# Plain\n\nNo metadata.\n");
    EXPECT_NE(doc.value().html.find("<h1>Plain</h1>"), std::string::npos);
}

TEST(PipelineTest, ProcessDocumentStrictRequiresBlock) {
    pipeline::ProcessOptions options;
    options.policy = pipeline::MetadataPolicy::Frontmatter;

    const auto doc = pipeline::process_document("# Plain\n", options);

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::MissingFrontmatter);
}

TEST(PipelineTest, ProcessDocumentEmptyBody) {
    const auto doc = pipeline::process_document("---\ntitle: T\ndate: D\n---\n   \n");

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::EmptyInput);
}

TEST(PipelineTest, ProcessDocumentTooLarge) {
    pipeline::ProcessOptions options;
    options.render.max_bytes = 8;

    const auto doc = pipeline::process_document("# A much longer document", options);

    ASSERT_TRUE(doc.is_err());
    EXPECT_EQ(doc.error().code(), ErrorCode::TooLarge);
}

TEST(PipelineTest, ProcessDocumentInProcessIsolation) {
    pipeline::ProcessOptions options;
    options.render.isolation = IsolationMode::Process;

    const auto doc = pipeline::process_document(kReport, options);

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_NE(doc.value().html.find("<h1>Heat Pumps</h1>"), std::string::npos);
}

TEST(PipelineTest, StatelessWrappers) {
    EXPECT_EQ(pipeline::sanitize("\x1B[1mx\x1B[0m"), "x");
    EXPECT_TRUE(pipeline::extract_frontmatter("# no block").is_err());
    EXPECT_TRUE(pipeline::extract_permissive("# no block").is_ok());
    EXPECT_EQ(pipeline::render("").error().code(), ErrorCode::EmptyInput);
    EXPECT_NE(pipeline::render("*em*").value().find("<em>em</em>"), std::string::npos);
}

TEST(PipelineTest, ExportPdfWithMissingConverter) {
    Config config;
    config.export_.converter = "rcp-definitely-not-installed-converter";
    config.export_.temp_html = fs::temp_directory_path() /
                               ("rcp_pipeline_export_" + std::to_string(::getpid()) + ".html");

    const auto result = pipeline::export_pdf("# Title", fs::temp_directory_path() / "rcp_pipeline.pdf", config);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ToolNotFound);
    EXPECT_FALSE(fs::exists(config.export_.temp_html));
}

TEST(PipelineTest, ApplyConfigSetsLogLevel) {
    Config config;
    config.log_level = "error";

    ASSERT_TRUE(pipeline::apply_config(config).is_ok());
    EXPECT_EQ(logging::logger()->level(), spdlog::level::err);

    config.log_level = "chatty";
    const auto bad = pipeline::apply_config(config);
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code(), ErrorCode::ConfigError);

    config.log_level = "info";
    ASSERT_TRUE(pipeline::apply_config(config).is_ok());
}

TEST(PipelineTest, FormattedReportSurvivesStoreAndExtraction) {
    const auto root = fs::temp_directory_path() / ("rcp_pipeline_store_" + std::to_string(::getpid()));
    const ReportStore store(root);
    const auto name = format::report_file_name("Heat Pumps");
    const auto report = format::format_report_frontmatter("## Outlook\n\nStrong.\n", "Heat Pumps");

    ASSERT_TRUE(store.save(name, report).is_ok());
    const auto read = store.read(name);
    ASSERT_TRUE(read.is_ok());

    pipeline::ProcessOptions options;
    options.policy = pipeline::MetadataPolicy::Frontmatter;
    const auto doc = pipeline::process_document(read.value(), options);

    ASSERT_TRUE(doc.is_ok()) << doc.error();
    EXPECT_EQ(doc.value().metadata.at("title"), "Heat Pumps Market Analysis");
    EXPECT_NE(doc.value().html.find("<h2>Outlook</h2>"), std::string::npos);

    std::error_code ec;
    fs::remove_all(root, ec);
}
