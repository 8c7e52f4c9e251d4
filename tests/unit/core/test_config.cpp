//
// Created by gregorian-rayne on 10/18/26.
//

#include <gtest/gtest.h>
#include "rcp/config.hpp"

#include <fstream>
#include <filesystem>
#include <unistd.h>

using namespace rcp;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / ("rcp_config_test_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    fs::path create_test_file(const std::string& filename, const std::string& content) const {
        const fs::path file_path = temp_dir / filename;
        std::ofstream file(file_path);
        file << content;
        file.close();
        return file_path;
    }

    fs::path temp_dir;
};

TEST_F(ConfigTest, DefaultConfig) {
    const Config config;

    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.limits.max_process_bytes, 10u * 1024u * 1024u);
    EXPECT_EQ(config.limits.max_read_bytes, 50u * 1024u * 1024u);
    EXPECT_EQ(config.storage.reports_dir, fs::path("reports"));
    EXPECT_EQ(config.storage.extension, ".md");
    EXPECT_EQ(config.render.isolation, IsolationMode::Thread);
    EXPECT_TRUE(config.render.superscript);
    EXPECT_EQ(config.export_.converter, "wkhtmltopdf");
    EXPECT_EQ(config.export_.page_size, "A4");
    EXPECT_EQ(config.export_.margin, "20mm");
    EXPECT_EQ(config.export_.encoding, "UTF-8");
}

TEST_F(ConfigTest, EmptyStringKeepsDefaults) {
    const auto config = Config::load_from_string("");

    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().storage.extension, ".md");
    EXPECT_EQ(config.value().render.isolation, IsolationMode::Thread);
}

TEST_F(ConfigTest, LoadsAllSections) {
    const auto config = Config::load_from_string(R"(
[general]
log_level = "debug"

[limits]
max_process_bytes = 2048
max_read_bytes = 4096

[storage]
reports_dir = "/var/lib/reports"
extension = ".markdown"

[render]
isolation = "process"
superscript = false

[export]
converter = "/opt/bin/wkhtmltopdf"
temp_html = "/var/tmp/out.html"
page_size = "Letter"
margin = "15mm"
encoding = "ISO-8859-1"
)");

    ASSERT_TRUE(config.is_ok()) << config.error();
    const auto& c = config.value();
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.limits.max_process_bytes, 2048u);
    EXPECT_EQ(c.limits.max_read_bytes, 4096u);
    EXPECT_EQ(c.storage.reports_dir, fs::path("/var/lib/reports"));
    EXPECT_EQ(c.storage.extension, ".markdown");
    EXPECT_EQ(c.render.isolation, IsolationMode::Process);
    EXPECT_FALSE(c.render.superscript);
    EXPECT_EQ(c.export_.converter, "/opt/bin/wkhtmltopdf");
    EXPECT_EQ(c.export_.temp_html, fs::path("/var/tmp/out.html"));
    EXPECT_EQ(c.export_.page_size, "Letter");
    EXPECT_EQ(c.export_.margin, "15mm");
    EXPECT_EQ(c.export_.encoding, "ISO-8859-1");
}

TEST_F(ConfigTest, InvalidTomlIsConfigError) {
    const auto config = Config::load_from_string("[storage\nreports_dir = ");

    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    EXPECT_TRUE(config.error().has_context());
}

TEST_F(ConfigTest, WrongTypeIsConfigError) {
    const auto config = Config::load_from_string("[render]\nsuperscript = \"yes\"\n");

    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error().code(), ErrorCode::ConfigError);
    EXPECT_EQ(config.error().context().value(), "render.superscript");
}

TEST_F(ConfigTest, UnknownIsolationModeRejected) {
    const auto config = Config::load_from_string("[render]\nisolation = \"sandbox\"\n");

    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error().context().value(), "render.isolation");
}

TEST_F(ConfigTest, NonPositiveLimitRejected) {
    const auto config = Config::load_from_string("[limits]\nmax_read_bytes = 0\n");

    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error().context().value(), "limits.max_read_bytes");
}

TEST_F(ConfigTest, ExtensionMustStartWithDot) {
    const auto config = Config::load_from_string("[storage]\nextension = \"md\"\n");

    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error().context().value(), "storage.extension");
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = create_test_file("rcp.toml", "[storage]\nreports_dir = \"out\"\n");

    const auto config = Config::load_from_file(path);

    ASSERT_TRUE(config.is_ok()) << config.error();
    EXPECT_EQ(config.value().storage.reports_dir, fs::path("out"));
}

TEST_F(ConfigTest, LoadFromMissingFile) {
    const auto config = Config::load_from_file(temp_dir / "absent.toml");

    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.error().code(), ErrorCode::NotFound);
}

TEST_F(ConfigTest, ToJsonReflectsValues) {
    Config config;
    config.render.isolation = IsolationMode::Process;
    config.storage.reports_dir = "archive";

    const auto json = config.to_json();

    EXPECT_EQ(json["render"]["isolation"], "process");
    EXPECT_EQ(json["storage"]["reports_dir"], "archive");
    EXPECT_EQ(json["export"]["converter"], "wkhtmltopdf");
    EXPECT_EQ(json["limits"]["max_process_bytes"], 10u * 1024u * 1024u);
}

TEST(IsolationModeTest, StringRoundTrip) {
    EXPECT_STREQ(isolation_mode_to_string(IsolationMode::Thread), "thread");
    EXPECT_STREQ(isolation_mode_to_string(IsolationMode::Process), "process");
    EXPECT_EQ(isolation_mode_from_string("process").value(), IsolationMode::Process);
    EXPECT_TRUE(isolation_mode_from_string("Thread").is_err());
}
