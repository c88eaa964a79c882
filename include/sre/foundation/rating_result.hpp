#pragma once

/// @file rating_result.hpp
/// @brief RatingResult<T> type alias for engine error handling.

#include "sre/core/result.hpp"
#include "sre/foundation/rating_error.hpp"

namespace sre::foundation {

/// Result type specialized with RatingError.
///
/// Example:
/// @code
///   RatingResult<double> parseRating(std::string_view text) {
///       double value = 0.0;
///       auto [ptr, ec] = std::from_chars(text.begin(), text.end(), value);
///       if (ec != std::errc{}) {
///           return RatingResult<double>::err(
///               RatingError(ErrorCode::HistoryCorrupted, "bad rating"));
///       }
///       return RatingResult<double>::ok(value);
///   }
/// @endcode
template <typename T>
using RatingResult = sre::Result<T, RatingError>;

}  // namespace sre::foundation
