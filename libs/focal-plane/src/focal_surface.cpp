/**
 * @file focal_surface.cpp
 * @brief Chief-ray intersection with a curved/tilted focal surface.
 * @author Watosn
 */

#include "warpfield/focal_plane/focal_surface.hpp"

#include <array>
#include <cmath>

#include "warpfield/core/autodiff.hpp"
#include "warpfield/core/errors.hpp"

namespace warpfield::focal_plane {
namespace {

using warpfield::core::FocalPoint;
using warpfield::core::Status;

// The ray from the pupil through (x, y) reaches (t x, t y) on the surface, where
// a t^2 + b t + L = 0 with a = curvature r^2 / 2 and b = x tan(tx) + y tan(ty) - L.
// Returns the root near t = 1 in its cancellation-free form; `ok` is false on a miss.
template <typename Scalar>
std::array<Scalar, 2> intersect(const FocalSurface& s, const Scalar& x, const Scalar& y, bool* ok) {
  using std::sqrt;
  const double L = s.pupil_distance_um;
  const Scalar a = 0.5 * s.curvature_per_um * (x * x + y * y);
  const Scalar b = std::tan(s.tilt_x_rad) * x + std::tan(s.tilt_y_rad) * y - L;
  const Scalar disc = b * b - 4.0 * L * a;
  if (!(disc >= 0.0)) {
    *ok = false;
    return {x, y};
  }
  const Scalar denom = sqrt(disc) - b;
  if (!(denom > 0.0)) {
    *ok = false;
    return {x, y};
  }
  const Scalar t = (2.0 * L) / denom;
  *ok = true;
  return {t * x, t * y};
}

}  // namespace

void validate_surface(const FocalSurface& surface) {
  if (!std::isfinite(surface.pupil_distance_um) || !std::isfinite(surface.curvature_per_um) || !std::isfinite(surface.tilt_x_rad) ||
      !std::isfinite(surface.tilt_y_rad)) {
    throw warpfield::core::ModelConfigurationError("focal surface parameters must be finite");
  }
  if (!is_flat(surface) && !(surface.pupil_distance_um > 0.0)) {
    throw warpfield::core::ModelConfigurationError("curved or tilted focal surface needs a positive pupil distance");
  }
  if (std::abs(surface.tilt_x_rad) >= 0.5 * warpfield::core::constants::kPi ||
      std::abs(surface.tilt_y_rad) >= 0.5 * warpfield::core::constants::kPi) {
    throw warpfield::core::ModelConfigurationError("focal surface tilt must be below 90 degrees");
  }
}

SurfaceSample to_surface(const FocalSurface& surface, const FocalPoint& reference) {
  if (!warpfield::core::is_finite(reference)) {
    return SurfaceSample{.point = reference, .status = Status::InvalidInput};
  }
  if (is_flat(surface)) {
    return SurfaceSample{.point = reference, .status = Status::Ok};
  }
  bool ok = false;
  const auto out = intersect(surface, reference.x_um, reference.y_um, &ok);
  if (!ok) {
    return SurfaceSample{.point = reference, .status = Status::NumericalError};
  }
  return SurfaceSample{.point = FocalPoint{out[0], out[1]}, .status = Status::Ok};
}

SurfaceSample to_reference(const FocalSurface& surface, const FocalPoint& on_surface) {
  if (!warpfield::core::is_finite(on_surface)) {
    return SurfaceSample{.point = on_surface, .status = Status::InvalidInput};
  }
  if (is_flat(surface)) {
    return SurfaceSample{.point = on_surface, .status = Status::Ok};
  }
  const double x = on_surface.x_um;
  const double y = on_surface.y_um;
  const double sag = 0.5 * surface.curvature_per_um * (x * x + y * y) + std::tan(surface.tilt_x_rad) * x + std::tan(surface.tilt_y_rad) * y;
  const double depth = surface.pupil_distance_um + sag;
  if (!(depth > 0.0)) {
    return SurfaceSample{.point = on_surface, .status = Status::NumericalError};
  }
  const double k = surface.pupil_distance_um / depth;
  return SurfaceSample{.point = FocalPoint{k * x, k * y}, .status = Status::Ok};
}

warpfield::core::Mat2 surface_jacobian(const FocalSurface& surface, const FocalPoint& reference) {
  if (is_flat(surface)) {
    return warpfield::core::mat2_identity();
  }
  bool ok = false;
  const auto j = warpfield::core::autodiff_jacobian(
      [&surface, &ok](const warpfield::core::AdScalar& x, const warpfield::core::AdScalar& y) {
        const auto r = intersect(surface, x, y, &ok);
        return std::array<warpfield::core::AdScalar, 2>{r[0], r[1]};
      },
      reference.x_um, reference.y_um);
  return ok ? j : warpfield::core::Mat2{};
}

}  // namespace warpfield::focal_plane
