//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_ERROR_HPP
#define REPORTCONTENTPIPELINE_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types for the report pipeline.
 *
 * Every fallible pipeline operation returns Result<T, Error>. An Error
 * carries a specific code, a human-readable message, and optional context
 * (a file name, the list of missing fields, the converter's stderr, ...).
 *
 * Codes are grouped into categories so that callers can decide how to
 * surface a failure without switching over every code:
 * - Validation: InvalidArgument, EmptyInput, TooLarge, MissingRequiredField
 * - Parse: MissingFrontmatter, UnterminatedFrontmatter, MetadataParseError
 * - Io: NotFound, NotAFile, IoError
 * - Isolation: RenderPanic, EmptyOutput
 * - ExternalTool: ToolNotFound, ToolFailed, OutputMissing
 * - Internal: ConfigError, InternalError
 *
 * Usage:
 * @code
 *     auto result = store.read("q3-outlook.md");
 *     if (result.is_err()) {
 *         std::cerr << result.error() << std::endl;
 *         // Output: [NotFound] Report not found (context: q3-outlook.md)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace rcp {

    /**
     * Error code enumeration.
     */
    enum class ErrorCode {
        None,                     ///< No error
        InvalidArgument,          ///< Invalid argument (bad report name, bad option)
        EmptyInput,               ///< Input blank or whitespace-only
        TooLarge,                 ///< Input or file exceeds its size ceiling
        MissingFrontmatter,       ///< Document does not open with a delimiter line
        UnterminatedFrontmatter,  ///< Opening delimiter without a closing one
        MetadataParseError,       ///< Metadata block is not a valid key-value document
        MissingRequiredField,     ///< title and/or date absent from metadata
        NotFound,                 ///< File or directory does not exist
        NotAFile,                 ///< Path exists but is not a regular file
        IoError,                  ///< Read, write or rename failed
        RenderPanic,              ///< Conversion engine terminated abnormally
        EmptyOutput,              ///< Conversion finished but produced nothing
        ToolNotFound,             ///< External converter is not available
        ToolFailed,               ///< External converter exited with an error
        OutputMissing,            ///< Converter reported success but no file exists
        ConfigError,              ///< Configuration could not be loaded
        InternalError             ///< Unexpected internal error
    };

    /**
     * Broad classes of errors. See the file comment for the mapping.
     */
    enum class ErrorCategory {
        None,
        Validation,
        Parse,
        Io,
        Isolation,
        ExternalTool,
        Internal
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:                    return "None";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::EmptyInput:              return "EmptyInput";
            case ErrorCode::TooLarge:                return "TooLarge";
            case ErrorCode::MissingFrontmatter:      return "MissingFrontmatter";
            case ErrorCode::UnterminatedFrontmatter: return "UnterminatedFrontmatter";
            case ErrorCode::MetadataParseError:      return "MetadataParseError";
            case ErrorCode::MissingRequiredField:    return "MissingRequiredField";
            case ErrorCode::NotFound:                return "NotFound";
            case ErrorCode::NotAFile:                return "NotAFile";
            case ErrorCode::IoError:                 return "IoError";
            case ErrorCode::RenderPanic:             return "RenderPanic";
            case ErrorCode::EmptyOutput:             return "EmptyOutput";
            case ErrorCode::ToolNotFound:            return "ToolNotFound";
            case ErrorCode::ToolFailed:              return "ToolFailed";
            case ErrorCode::OutputMissing:           return "OutputMissing";
            case ErrorCode::ConfigError:             return "ConfigError";
            case ErrorCode::InternalError:           return "InternalError";
        }
        return "Unknown";
    }

    inline ErrorCategory error_category(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:
                return ErrorCategory::None;
            case ErrorCode::InvalidArgument:
            case ErrorCode::EmptyInput:
            case ErrorCode::TooLarge:
            case ErrorCode::MissingRequiredField:
                return ErrorCategory::Validation;
            case ErrorCode::MissingFrontmatter:
            case ErrorCode::UnterminatedFrontmatter:
            case ErrorCode::MetadataParseError:
                return ErrorCategory::Parse;
            case ErrorCode::NotFound:
            case ErrorCode::NotAFile:
            case ErrorCode::IoError:
                return ErrorCategory::Io;
            case ErrorCode::RenderPanic:
            case ErrorCode::EmptyOutput:
                return ErrorCategory::Isolation;
            case ErrorCode::ToolNotFound:
            case ErrorCode::ToolFailed:
            case ErrorCode::OutputMissing:
                return ErrorCategory::ExternalTool;
            case ErrorCode::ConfigError:
            case ErrorCode::InternalError:
                return ErrorCategory::Internal;
        }
        return ErrorCategory::Internal;
    }

    /**
     * Structured error with code, message, and optional context.
     *
     * Immutable after construction.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        // Factory methods for the codes used across several modules

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error empty_input(std::string message) {
            return {ErrorCode::EmptyInput, std::move(message)};
        }

        static Error too_large(std::string message, std::string context) {
            return {ErrorCode::TooLarge, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] ErrorCategory category() const noexcept {
            return error_category(code_);
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Creates a new error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_ERROR_HPP
