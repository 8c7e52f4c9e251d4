//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace rcp
{
    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::EmptyInput, "nothing to render");

        EXPECT_EQ(error.code(), ErrorCode::EmptyInput);
        EXPECT_EQ(error.message(), "nothing to render");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "Report not found", "q3-outlook.md");

        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "q3-outlook.md");
    }

    TEST(ErrorTest, Factories) {
        EXPECT_EQ(Error::invalid_argument("bad", "name").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::empty_input("blank").code(), ErrorCode::EmptyInput);
        EXPECT_EQ(Error::too_large("big", "render").code(), ErrorCode::TooLarge);
        EXPECT_EQ(Error::not_found("gone", "x.md").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::io_error("disk").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("bad toml", "line 1").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::internal_error("oops").code(), ErrorCode::InternalError);
    }

    TEST(ErrorTest, ToStringWithoutContext) {
        const Error error(ErrorCode::EmptyOutput, "Conversion produced no output");
        EXPECT_EQ(error.to_string(), "[EmptyOutput] Conversion produced no output");
    }

    TEST(ErrorTest, ToStringWithContext) {
        const Error error(ErrorCode::MissingRequiredField, "Metadata is missing required field(s)", "title, date");
        EXPECT_EQ(error.to_string(),
                  "[MissingRequiredField] Metadata is missing required field(s) (context: title, date)");
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto base = Error::io_error("Failed to rename");
        const auto once = base.with_context("weekly.md");
        const auto twice = once.with_context("reports");

        EXPECT_EQ(once.context().value(), "weekly.md");
        EXPECT_EQ(twice.context().value(), "weekly.md; reports");
        EXPECT_FALSE(base.has_context());
    }

    TEST(ErrorTest, Equality) {
        const Error a(ErrorCode::ToolFailed, "exit 1", "stderr");
        const Error b(ErrorCode::ToolFailed, "exit 1", "stderr");
        const Error c(ErrorCode::ToolFailed, "exit 1");

        EXPECT_EQ(a, b);
        EXPECT_NE(a, c);
    }

    TEST(ErrorTest, StreamOperators) {
        std::ostringstream oss;
        oss << Error(ErrorCode::RenderPanic, "engine crashed") << " " << ErrorCode::ToolNotFound;
        EXPECT_EQ(oss.str(), "[RenderPanic] engine crashed ToolNotFound");
    }

    TEST(ErrorTest, Categories) {
        EXPECT_EQ(error_category(ErrorCode::InvalidArgument), ErrorCategory::Validation);
        EXPECT_EQ(error_category(ErrorCode::TooLarge), ErrorCategory::Validation);
        EXPECT_EQ(error_category(ErrorCode::MissingRequiredField), ErrorCategory::Validation);
        EXPECT_EQ(error_category(ErrorCode::MissingFrontmatter), ErrorCategory::Parse);
        EXPECT_EQ(error_category(ErrorCode::UnterminatedFrontmatter), ErrorCategory::Parse);
        EXPECT_EQ(error_category(ErrorCode::MetadataParseError), ErrorCategory::Parse);
        EXPECT_EQ(error_category(ErrorCode::NotAFile), ErrorCategory::Io);
        EXPECT_EQ(error_category(ErrorCode::IoError), ErrorCategory::Io);
        EXPECT_EQ(error_category(ErrorCode::RenderPanic), ErrorCategory::Isolation);
        EXPECT_EQ(error_category(ErrorCode::EmptyOutput), ErrorCategory::Isolation);
        EXPECT_EQ(error_category(ErrorCode::ToolNotFound), ErrorCategory::ExternalTool);
        EXPECT_EQ(error_category(ErrorCode::OutputMissing), ErrorCategory::ExternalTool);
        EXPECT_EQ(error_category(ErrorCode::ConfigError), ErrorCategory::Internal);
        EXPECT_EQ(Error::not_found("x", "y").category(), ErrorCategory::Io);
    }
}
