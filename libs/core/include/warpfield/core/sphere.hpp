/**
 * @file sphere.hpp
 * @brief Unit-sphere conversions shared by the frame and attitude code.
 * @author Watosn
 */
#pragma once

#include <cmath>

#include <Eigen/Dense>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/types.hpp"

namespace warpfield::core {

inline Eigen::Vector3d unit_vector(double lon_rad, double lat_rad) {
  return Eigen::Vector3d(std::cos(lat_rad) * std::cos(lon_rad), std::cos(lat_rad) * std::sin(lon_rad), std::sin(lat_rad));
}

inline Eigen::Vector3d unit_vector(const SkyCoord& c) {
  return unit_vector(c.lon_deg * constants::kDegToRad, c.lat_deg * constants::kDegToRad);
}

/**
 * @brief Longitude/latitude of a direction; the vector need not be normalized.
 * Longitude is wrapped to [0, 360).
 */
inline SkyCoord from_unit_vector(const Eigen::Vector3d& v) {
  const double lon = std::atan2(v.y(), v.x()) * constants::kRadToDeg;
  const double lat = std::atan2(v.z(), std::hypot(v.x(), v.y())) * constants::kRadToDeg;
  return SkyCoord{.lon_deg = wrap_deg_360(lon), .lat_deg = lat};
}

}  // namespace warpfield::core
