/**
 * @file projection_engine.cpp
 * @brief Projection pipeline implementation.
 * @author Watosn
 */

#include "warpfield/engine/projection_engine.hpp"

#include "warpfield/core/errors.hpp"

namespace warpfield::engine {

using warpfield::core::Mat2;
using warpfield::core::SkyCoord;
using warpfield::core::Status;

void ProjectionSummary::add(Status status) {
  switch (status) {
    case Status::Ok:
      ++assigned;
      break;
    case Status::Unassigned:
      ++unassigned;
      break;
    case Status::OutsideFieldOfView:
      ++outside_fov;
      break;
    case Status::ProjectionSingularity:
      ++singular;
      break;
    case Status::DistortionInversionFailed:
      ++inversion_failed;
      break;
    case Status::InvalidInput:
      ++invalid;
      break;
    case Status::NumericalError:
      ++numerical_error;
      break;
  }
}

std::unique_ptr<ProjectionEngine> ProjectionEngine::Create(const Config& config) {
  const warpfield::attitude::AttitudeModel attitude(config.pointing);
  warpfield::focal_plane::validate_optics(config.optics);
  if (!config.geometry) {
    throw warpfield::core::ModelConfigurationError("projection engine needs a focal plane geometry");
  }
  Config resolved = config;
  if (!resolved.distortion) {
    resolved.distortion = std::make_shared<const warpfield::distortion::IdentityDistortion>();
  }
  return std::unique_ptr<ProjectionEngine>(new ProjectionEngine(std::move(resolved), attitude));
}

ProjectionResult ProjectionEngine::project(const SkyCoord& coord, bool with_jacobian) const {
  ProjectionResult out{};
  const auto tangent = attitude_.to_tangent_plane(coord);
  if (tangent.status != Status::Ok) {
    out.status = tangent.status;
    return out;
  }

  const auto ideal = warpfield::focal_plane::ideal_focal_point(config_.optics, tangent.point);
  if (!warpfield::focal_plane::within_field(config_.optics, ideal)) {
    out.status = Status::OutsideFieldOfView;
    return out;
  }

  const auto distorted = config_.distortion->apply(ideal);
  if (!warpfield::core::is_finite(distorted)) {
    out.status = Status::NumericalError;
    return out;
  }
  out.focal_um = distorted;

  const auto assignment = config_.geometry->assign(distorted);
  out.status = assignment.status;
  if (assignment.status != Status::Ok) {
    return out;
  }
  out.detector_id = assignment.detector_id;
  out.pixel = assignment.pixel;

  if (with_jacobian) {
    // pixel <- surface/detector <- distortion <- plate scale <- gnomonic
    const Mat2 geom = config_.geometry->pixel_jacobian(*assignment.detector_id, distorted);
    const Mat2 dist = config_.distortion->jacobian(ideal);
    const Mat2 scale = warpfield::core::mat2_scale(config_.optics.focal_length_um, warpfield::core::mat2_identity());
    const Mat2 att = attitude_.jacobian(coord);
    out.jacobian = warpfield::core::mat2_mul(geom, warpfield::core::mat2_mul(dist, warpfield::core::mat2_mul(scale, att)));
  }
  return out;
}

ProjectionBatch ProjectionEngine::sky_to_pixel(const std::vector<SkyCoord>& coords, const ProjectionOptions& options) const {
  ProjectionBatch out{};
  out.results.reserve(coords.size());
  for (const auto& c : coords) {
    auto r = project(c, options.with_jacobian);
    out.summary.add(r.status);
    out.results.push_back(std::move(r));
  }
  return out;
}

ProjectionBatch ProjectionEngine::sky_to_pixel(const warpfield::source::SourceCatalog& catalog, const ProjectionOptions& options) const {
  return sky_to_pixel(catalog.icrs_at_epoch(config_.pointing.epoch_jyear), options);
}

DeprojectionBatch ProjectionEngine::pixel_to_sky(int detector_id, const std::vector<warpfield::core::PixelPoint>& pixels) const {
  DeprojectionBatch out{};
  out.results.reserve(pixels.size());
  for (const auto& px : pixels) {
    DeprojectionResult r{};
    const auto focal = config_.geometry->to_focal_plane(detector_id, px);
    if (focal.status != Status::Ok) {
      r.status = focal.status;
    } else {
      const auto ideal = config_.distortion->invert(focal.point);
      if (ideal.status != Status::Ok) {
        r.status = ideal.status;
      } else {
        const auto sky = attitude_.to_sky(warpfield::focal_plane::tangent_point(config_.optics, ideal.point));
        r.coord = sky.coord;
        r.status = sky.status;
      }
    }
    out.summary.add(r.status);
    out.results.push_back(r);
  }
  return out;
}

JacobianBatch ProjectionEngine::local_jacobian(const std::vector<SkyCoord>& coords) const {
  JacobianBatch out{};
  out.results.reserve(coords.size());
  for (const auto& c : coords) {
    const auto r = project(c, true);
    out.summary.add(r.status);
    out.results.push_back(JacobianResult{
        .detector_id = r.detector_id,
        .jacobian = r.jacobian.value_or(Mat2{}),
        .status = r.status,
    });
  }
  return out;
}

}  // namespace warpfield::engine
