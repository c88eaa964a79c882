/// @file elo_math.cpp
/// @brief EloMath implementation.

#include "sre/rating/elo_math.hpp"

#include <cmath>
#include <cstdlib>

namespace sre::rating {

double EloMath::expectedScore(double ratingA, double ratingB) {
    double exponent = (ratingB - ratingA) / kLogisticScale;
    return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double EloMath::actualScore(int32_t pointsFor, int32_t pointsAgainst) {
    if (pointsFor > pointsAgainst) {
        return 1.0;
    }
    if (pointsFor < pointsAgainst) {
        return 0.0;
    }
    return 0.5;
}

double EloMath::movMultiplier(int32_t pointsFor, int32_t pointsAgainst) {
    auto margin = std::abs(static_cast<int64_t>(pointsFor) - pointsAgainst);
    return std::log(static_cast<double>(margin) + 1.0);
}

double EloMath::ratingDelta(double kFactor, double actual, double expected) {
    return kFactor * (actual - expected);
}

double EloMath::revertToward(double rating, double mean, double factor) {
    return rating * (1.0 - factor) + mean * factor;
}

} // namespace sre::rating
