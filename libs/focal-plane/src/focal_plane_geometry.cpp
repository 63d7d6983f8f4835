/**
 * @file focal_plane_geometry.cpp
 * @brief Detector assignment and pixel mapping implementation.
 * @author Watosn
 */

#include "warpfield/focal_plane/focal_plane_geometry.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/errors.hpp"

namespace warpfield::focal_plane {
namespace {

using warpfield::core::FocalPoint;
using warpfield::core::PixelPoint;
using warpfield::core::Status;

void validate_detector(const Detector& d) {
  if (!warpfield::core::is_finite(d.center_um) || !std::isfinite(d.rotation_deg)) {
    throw warpfield::core::ModelConfigurationError(fmt::format("detector {}: placement must be finite", d.id));
  }
  if (!(d.pixel_scale_um > 0.0) || !std::isfinite(d.pixel_scale_um)) {
    throw warpfield::core::ModelConfigurationError(fmt::format("detector {}: pixel scale must be positive and finite", d.id));
  }
  if (d.pixel_width <= 0 || d.pixel_height <= 0) {
    throw warpfield::core::ModelConfigurationError(fmt::format("detector {}: pixel width and height must be positive", d.id));
  }
}

bool inside(const Detector& d, const PixelPoint& px) {
  return px.x >= 0.0 && px.x <= static_cast<double>(d.pixel_width) && px.y >= 0.0 && px.y <= static_cast<double>(d.pixel_height);
}

}  // namespace

std::unique_ptr<FocalPlaneGeometry> FocalPlaneGeometry::Create(const Config& config) {
  if (config.detectors.empty()) {
    throw warpfield::core::ModelConfigurationError("focal plane geometry needs at least one detector");
  }
  validate_surface(config.surface);

  std::vector<Placement> placements;
  placements.reserve(config.detectors.size());
  for (const auto& d : config.detectors) {
    validate_detector(d);
    const double rot = d.rotation_deg * warpfield::core::constants::kDegToRad;
    placements.push_back(Placement{
        .detector = d,
        .to_local = warpfield::core::rotation2(-rot),
        .to_focal = warpfield::core::rotation2(rot),
    });
  }
  std::sort(placements.begin(), placements.end(),
            [](const Placement& a, const Placement& b) { return a.detector.id < b.detector.id; });
  for (std::size_t i = 1; i < placements.size(); ++i) {
    if (placements[i].detector.id == placements[i - 1].detector.id) {
      throw warpfield::core::ModelConfigurationError(fmt::format("duplicate detector id {}", placements[i].detector.id));
    }
  }
  return std::unique_ptr<FocalPlaneGeometry>(new FocalPlaneGeometry(std::move(placements), config.surface));
}

PixelPoint FocalPlaneGeometry::local_pixel(const Placement& p, const FocalPoint& on_surface) {
  const double dx = on_surface.x_um - p.detector.center_um.x_um;
  const double dy = on_surface.y_um - p.detector.center_um.y_um;
  const double u = p.to_local(0, 0) * dx + p.to_local(0, 1) * dy;
  const double v = p.to_local(1, 0) * dx + p.to_local(1, 1) * dy;
  return PixelPoint{
      .x = u / p.detector.pixel_scale_um + 0.5 * static_cast<double>(p.detector.pixel_width),
      .y = v / p.detector.pixel_scale_um + 0.5 * static_cast<double>(p.detector.pixel_height),
  };
}

const FocalPlaneGeometry::Placement* FocalPlaneGeometry::placement(int detector_id) const {
  const auto it = std::lower_bound(placements_.begin(), placements_.end(), detector_id,
                                   [](const Placement& p, int id) { return p.detector.id < id; });
  if (it == placements_.end() || it->detector.id != detector_id) {
    return nullptr;
  }
  return &(*it);
}

const Detector* FocalPlaneGeometry::find(int detector_id) const {
  const auto* p = placement(detector_id);
  return p ? &p->detector : nullptr;
}

std::vector<Detector> FocalPlaneGeometry::detectors() const {
  std::vector<Detector> out;
  out.reserve(placements_.size());
  for (const auto& p : placements_) {
    out.push_back(p.detector);
  }
  return out;
}

Assignment FocalPlaneGeometry::assign(const FocalPoint& focal) const {
  const auto on_surface = to_surface(surface_, focal);
  if (on_surface.status != Status::Ok) {
    return Assignment{.status = on_surface.status};
  }
  for (const auto& p : placements_) {
    const auto px = local_pixel(p, on_surface.point);
    if (inside(p.detector, px)) {
      return Assignment{.detector_id = p.detector.id, .pixel = px, .status = Status::Ok};
    }
  }
  return Assignment{.status = Status::Unassigned};
}

AssignmentBatch FocalPlaneGeometry::assign(const std::vector<FocalPoint>& focal) const {
  AssignmentBatch out{};
  out.assignments.reserve(focal.size());
  for (const auto& f : focal) {
    const auto a = assign(f);
    if (a.status == Status::Ok) {
      ++out.assigned_count;
    } else if (a.status == Status::Unassigned) {
      ++out.unassigned_count;
    } else {
      ++out.failed_count;
    }
    out.assignments.push_back(a);
  }
  return out;
}

std::optional<PixelPoint> FocalPlaneGeometry::to_pixel(int detector_id, const FocalPoint& focal) const {
  const auto* p = placement(detector_id);
  if (p == nullptr) {
    return std::nullopt;
  }
  const auto on_surface = to_surface(surface_, focal);
  if (on_surface.status != Status::Ok) {
    return std::nullopt;
  }
  return local_pixel(*p, on_surface.point);
}

FocalPlaneSample FocalPlaneGeometry::to_focal_plane(int detector_id, const PixelPoint& pixel) const {
  const auto* p = placement(detector_id);
  if (p == nullptr || !std::isfinite(pixel.x) || !std::isfinite(pixel.y)) {
    return FocalPlaneSample{.status = Status::InvalidInput};
  }
  const double u = (pixel.x - 0.5 * static_cast<double>(p->detector.pixel_width)) * p->detector.pixel_scale_um;
  const double v = (pixel.y - 0.5 * static_cast<double>(p->detector.pixel_height)) * p->detector.pixel_scale_um;
  const FocalPoint on_surface{
      p->detector.center_um.x_um + p->to_focal(0, 0) * u + p->to_focal(0, 1) * v,
      p->detector.center_um.y_um + p->to_focal(1, 0) * u + p->to_focal(1, 1) * v,
  };
  const auto reference = to_reference(surface_, on_surface);
  return FocalPlaneSample{.point = reference.point, .status = reference.status};
}

std::vector<FocalPlaneSample> FocalPlaneGeometry::to_focal_plane(int detector_id, const std::vector<PixelPoint>& pixels) const {
  std::vector<FocalPlaneSample> out;
  out.reserve(pixels.size());
  for (const auto& px : pixels) {
    out.push_back(to_focal_plane(detector_id, px));
  }
  return out;
}

warpfield::core::Mat2 FocalPlaneGeometry::pixel_jacobian(int detector_id, const FocalPoint& focal) const {
  const auto* p = placement(detector_id);
  if (p == nullptr) {
    return warpfield::core::Mat2{};
  }
  const auto local = warpfield::core::mat2_scale(1.0 / p->detector.pixel_scale_um, p->to_local);
  return warpfield::core::mat2_mul(local, surface_jacobian(surface_, focal));
}

}  // namespace warpfield::focal_plane
