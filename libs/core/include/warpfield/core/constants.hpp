/**
 * @file constants.hpp
 * @brief Shared angular and time constants.
 * @author Watosn
 */
#pragma once

#include <numbers>

namespace warpfield::core::constants {

inline constexpr double kPi = std::numbers::pi;
inline constexpr double kDegToRad = std::numbers::pi / 180.0;
inline constexpr double kRadToDeg = 180.0 / std::numbers::pi;
inline constexpr double kArcsecToRad = kDegToRad / 3600.0;
inline constexpr double kMasToRad = kArcsecToRad / 1000.0;
inline constexpr double kJ2000JulianYear = 2000.0;

// Tangent-plane projection is rejected when cos(separation) <= this value.
inline constexpr double kHemisphereEpsilon = 1e-8;

}  // namespace warpfield::core::constants
