/**
 * @file optics.cpp
 * @brief Optics helpers.
 * @author Watosn
 */

#include "warpfield/focal_plane/optics.hpp"

#include <cmath>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/errors.hpp"

namespace warpfield::focal_plane {

void validate_optics(const Optics& optics) {
  if (!(optics.focal_length_um > 0.0) || !std::isfinite(optics.focal_length_um)) {
    throw warpfield::core::ModelConfigurationError("optics focal length must be positive and finite");
  }
  if (!(optics.aperture_diameter_um >= 0.0) || !std::isfinite(optics.aperture_diameter_um)) {
    throw warpfield::core::ModelConfigurationError("optics aperture diameter must be non-negative and finite");
  }
  if (!(optics.fov_radius_um >= 0.0) || !std::isfinite(optics.fov_radius_um)) {
    throw warpfield::core::ModelConfigurationError("optics field-of-view radius must be non-negative and finite");
  }
}

bool within_field(const Optics& optics, const warpfield::core::FocalPoint& ideal) {
  if (optics.fov_radius_um <= 0.0) {
    return true;
  }
  return std::hypot(ideal.x_um, ideal.y_um) <= optics.fov_radius_um;
}

double plate_scale_um_per_arcsec(const Optics& optics) {
  return optics.focal_length_um * warpfield::core::constants::kArcsecToRad;
}

}  // namespace warpfield::focal_plane
