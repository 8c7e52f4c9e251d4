//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_RESULT_HPP
#define REPORTCONTENTPIPELINE_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result type used by every fallible pipeline operation.
 *
 * Result<T, E> holds either a value of type T or an error of type E (Error by
 * default). Pipeline stages never throw across their public boundary; a stage
 * that fails returns the failure and the caller decides how to surface it.
 *
 * Usage:
 * @code
 *     auto html = renderer.render(body);
 *     if (html.is_err()) {
 *         return Result<fs::path>::failure(html.error());
 *     }
 *     auto saved = store.save("weekly.html", html.value());
 * @endcode
 *
 * Chaining:
 * @code
 *     auto title = metadata::extract_frontmatter(text)
 *         .map([](const ExtractedDocument& doc) { return doc.metadata.at("title"); });
 * @endcode
 */

#include "rcp/error.hpp"

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace rcp {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Either a success value or an error. Never empty.
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        /**
         * Returns the success value.
         * @throws std::logic_error if the Result holds an error.
         */
        T& value() & {
            ensure_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            ensure_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            ensure_ok();
            return std::get<0>(std::move(data_));
        }

        /**
         * Returns the error.
         * @throws std::logic_error if the Result holds a value.
         */
        E& error() & {
            ensure_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            ensure_err();
            return std::get<1>(data_);
        }

        T value_or(T default_value) const& {
            if (is_ok()) {
                return std::get<0>(data_);
            }
            return default_value;
        }

        T value_or(T default_value) && {
            if (is_ok()) {
                return std::get<0>(std::move(data_));
            }
            return default_value;
        }

        /**
         * Transforms the success value, passing errors through unchanged.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E> {
            using U = std::invoke_result_t<F, T&&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(std::move(data_))));
            }
            return Result<U, E>::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Chains a fallible step. f must return a Result with the same error type.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using ResultType = std::invoke_result_t<F, const T&>;
            return ResultType::failure(std::get<1>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using ResultType = std::invoke_result_t<F, T&&>;
            return ResultType::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Rewrites the error (e.g. to attach context), keeping success values.
         */
        template<typename F>
        Result map_error(F&& f) && {
            if (is_err()) {
                return Result::failure(std::forward<F>(f)(std::get<1>(std::move(data_))));
            }
            return std::move(*this);
        }

    private:
        void ensure_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void ensure_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Specialization for operations with no success payload.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() {
            return Result(success_tag);
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        explicit Result(SuccessTag) : error_(std::nullopt) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        explicit operator bool() const noexcept {
            return is_ok();
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F> {
            if (is_ok()) {
                return std::forward<F>(f)();
            }
            using ResultType = std::invoke_result_t<F>;
            return ResultType::failure(*error_);
        }

    private:
        std::optional<E> error_;
    };

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_RESULT_HPP
