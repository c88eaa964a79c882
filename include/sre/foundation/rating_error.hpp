#pragma once

/// @file rating_error.hpp
/// @brief Engine error type used with Result<T, RatingError>.

#include <string>
#include <string_view>
#include <utility>

#include "sre/foundation/error_code.hpp"

namespace sre::foundation {

/// Error carrying a categorized code, a human-readable message and,
/// for persistence failures, the offending file path.
class RatingError {
public:
    RatingError() = default;

    explicit RatingError(ErrorCode code)
        : code_(code) {}

    RatingError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RatingError(ErrorCode code, std::string message, std::string path)
        : code_(code), message_(std::move(message)), path_(std::move(path)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// File the error refers to, empty when not file related.
    [[nodiscard]] std::string_view path() const noexcept { return path_; }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string path_;
};

} // namespace sre::foundation
