/**
 * @file optics.hpp
 * @brief Telescope plate scale and field of view.
 * @author Watosn
 */
#pragma once

#include "warpfield/core/types.hpp"

namespace warpfield::focal_plane {

/**
 * @brief First-order optics; lengths in micrometres.
 */
struct Optics {
  double focal_length_um{7.3e6};
  double aperture_diameter_um{4.0e5};
  // Zero disables the field-of-view check.
  double fov_radius_um{0.0};
};

/**
 * @throws warpfield::core::ModelConfigurationError on non-positive focal length,
 * negative aperture or field radius, or non-finite values.
 */
void validate_optics(const Optics& optics);

/**
 * @brief Ideal focal-plane position of a tangent-plane point.
 */
[[nodiscard]] inline warpfield::core::FocalPoint ideal_focal_point(const Optics& optics, const warpfield::core::TangentPoint& p) {
  return warpfield::core::FocalPoint{optics.focal_length_um * p.x_rad, optics.focal_length_um * p.y_rad};
}

/**
 * @brief Tangent-plane point of an ideal focal-plane position.
 */
[[nodiscard]] inline warpfield::core::TangentPoint tangent_point(const Optics& optics, const warpfield::core::FocalPoint& p) {
  return warpfield::core::TangentPoint{p.x_um / optics.focal_length_um, p.y_um / optics.focal_length_um};
}

/**
 * @brief True when the ideal position lies inside the field-of-view circle (edge included).
 */
[[nodiscard]] bool within_field(const Optics& optics, const warpfield::core::FocalPoint& ideal);

/**
 * @brief Plate scale in micrometres per arcsecond.
 */
[[nodiscard]] double plate_scale_um_per_arcsec(const Optics& optics);

}  // namespace warpfield::focal_plane
