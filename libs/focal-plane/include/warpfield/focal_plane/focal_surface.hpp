/**
 * @file focal_surface.hpp
 * @brief Curved and tilted physical focal surface.
 * @author Watosn
 */
#pragma once

#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/types.hpp"

namespace warpfield::focal_plane {

/**
 * @brief Physical focal surface z = curvature/2 (x^2 + y^2) + x tan(tilt_x) + y tan(tilt_y).
 *
 * `z` is measured from the flat reference surface along the optical axis,
 * away from the exit pupil, which sits `pupil_distance_um` in front of the
 * reference surface. A surface with zero curvature and tilt is the reference
 * surface itself.
 */
struct FocalSurface {
  double pupil_distance_um{};
  double curvature_per_um{};
  double tilt_x_rad{};
  double tilt_y_rad{};
};

struct SurfaceSample {
  warpfield::core::FocalPoint point{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

[[nodiscard]] inline bool is_flat(const FocalSurface& s) {
  return s.curvature_per_um == 0.0 && s.tilt_x_rad == 0.0 && s.tilt_y_rad == 0.0;
}

/**
 * @throws warpfield::core::ModelConfigurationError on non-finite values, or a
 * non-flat surface without a positive pupil distance.
 */
void validate_surface(const FocalSurface& surface);

/**
 * @brief Transverse position where the chief ray through `reference` meets the surface.
 *
 * A ray that misses the surface yields `NumericalError`.
 */
[[nodiscard]] SurfaceSample to_surface(const FocalSurface& surface, const warpfield::core::FocalPoint& reference);

/**
 * @brief Reference-surface position of a transverse surface position.
 */
[[nodiscard]] SurfaceSample to_reference(const FocalSurface& surface, const warpfield::core::FocalPoint& on_surface);

/**
 * @brief d(surface)/d(reference) by automatic differentiation of `to_surface`.
 */
[[nodiscard]] warpfield::core::Mat2 surface_jacobian(const FocalSurface& surface, const warpfield::core::FocalPoint& reference);

}  // namespace warpfield::focal_plane
