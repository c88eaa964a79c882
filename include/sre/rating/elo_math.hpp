#pragma once

/// @file elo_math.hpp
/// @brief Elo expectation, margin-of-victory scaling and mean reversion.
///
/// Pure functions shared by the team and player stores. None of them can
/// fail for finite inputs: the logistic form has no singularities and the
/// margin multiplier takes the log of a value >= 1.

#include <cstdint>

namespace sre::rating {

/// Static utility class for Elo rating arithmetic.
///
/// Uses the standard logistic Elo expectation:
///   E(A) = 1 / (1 + 10^((R_B - R_A) / 400))
///
/// so that expectedScore(a, b) + expectedScore(b, a) == 1.
class EloMath {
public:
    EloMath() = delete;

    /// Rating gap that corresponds to a tenfold change in odds.
    static constexpr double kLogisticScale = 400.0;

    /// Expected score of A against B, in (0, 1).
    [[nodiscard]] static double expectedScore(double ratingA, double ratingB);

    /// Actual score of the first side: 1 for a win, 0 for a loss, 0.5 for a tie.
    [[nodiscard]] static double actualScore(int32_t pointsFor, int32_t pointsAgainst);

    /// Margin-of-victory multiplier ln(|margin| + 1).
    ///
    /// Monotonically increasing and sub-linear in the margin; exactly 0 for
    /// a tie, which zeroes the whole update regardless of K.
    [[nodiscard]] static double movMultiplier(int32_t pointsFor, int32_t pointsAgainst);

    /// Rating change K * (actual - expected).
    [[nodiscard]] static double ratingDelta(double kFactor, double actual, double expected);

    /// Pull @p rating toward @p mean by @p factor:
    ///   rating * (1 - factor) + mean * factor
    [[nodiscard]] static double revertToward(double rating, double mean, double factor);
};

} // namespace sre::rating
