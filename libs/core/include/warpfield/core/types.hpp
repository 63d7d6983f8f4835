/**
 * @file types.hpp
 * @brief Core domain types for warpfield.
 * @author Watosn
 */
#pragma once

#include <cstdint>

namespace warpfield::core {

/**
 * @brief Per-element status carried by every batch result.
 *
 * `Unassigned` and `OutsideFieldOfView` are expected outcomes, not failures.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  ProjectionSingularity,
  DistortionInversionFailed,
  Unassigned,
  OutsideFieldOfView,
  NumericalError
};

/**
 * @brief Celestial reference frame of a set of sky coordinates.
 */
enum class CelestialFrame : std::uint8_t { Icrs, Galactic };

/**
 * @brief Spherical sky coordinate in degrees.
 */
struct SkyCoord {
  double lon_deg{};
  double lat_deg{};
};

/**
 * @brief Boresight-centered tangent-plane point in radians.
 */
struct TangentPoint {
  double x_rad{};
  double y_rad{};
};

/**
 * @brief Focal-plane point in micrometres.
 */
struct FocalPoint {
  double x_um{};
  double y_um{};
};

/**
 * @brief Detector pixel coordinate.
 */
struct PixelPoint {
  double x{};
  double y{};
};

/**
 * @brief Return a short lowercase name for a status value.
 */
const char* to_string(Status status);

/**
 * @brief True when a status denotes a numerical failure rather than a valid outcome.
 */
inline bool is_failure(Status status) {
  return status == Status::InvalidInput || status == Status::ProjectionSingularity ||
         status == Status::DistortionInversionFailed || status == Status::NumericalError;
}

}  // namespace warpfield::core
