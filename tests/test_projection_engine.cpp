/**
 * @file test_projection_engine.cpp
 * @brief End-to-end sky <-> pixel pipeline checks.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "warpfield/attitude/attitude_model.hpp"
#include "warpfield/core/constants.hpp"
#include "warpfield/core/errors.hpp"
#include "warpfield/distortion/polynomial_distortion.hpp"
#include "warpfield/engine/projection_engine.hpp"
#include "warpfield/focal_plane/presets.hpp"
#include "warpfield/source/source_catalog.hpp"

namespace {

using warpfield::core::SkyCoord;
using warpfield::core::Status;
using warpfield::engine::ProjectionEngine;
namespace constants = warpfield::core::constants;

std::shared_ptr<const warpfield::focal_plane::FocalPlaneGeometry> curved_jasmine() {
  auto config = warpfield::focal_plane::jasmine_geometry_config();
  config.surface = {.pupil_distance_um = 7.3e6, .curvature_per_um = 2.0e-7, .tilt_x_rad = 2.0e-4, .tilt_y_rad = 0.0};
  return warpfield::focal_plane::FocalPlaneGeometry::Create(config);
}

std::shared_ptr<const warpfield::distortion::DistortionModel> cubic() {
  return warpfield::distortion::PolynomialDistortion::Create({
      .order = 3,
      .center_um = {},
      .a = {1.0e-4, 2.0e-5, 3.0e-9, -1.0e-9, 2.0e-9, 1.0e-13, -2.0e-13, 5.0e-14, 1.0e-13},
      .b = {-3.0e-5, 1.5e-4, -2.0e-9, 4.0e-9, 1.0e-9, 3.0e-14, 1.0e-13, -1.0e-13, 2.0e-13},
  });
}

std::vector<SkyCoord> near_boresight(const warpfield::attitude::Pointing& p, double step_deg) {
  std::vector<SkyCoord> out;
  for (int i = -1; i <= 1; ++i) {
    for (int j = -1; j <= 1; ++j) {
      out.push_back(SkyCoord{.lon_deg = p.ra_deg + step_deg * i, .lat_deg = p.dec_deg + step_deg * j});
    }
  }
  return out;
}

}  // namespace

int main() {
  const warpfield::attitude::Pointing pointing{.ra_deg = 40.0, .dec_deg = -30.0, .position_angle_deg = 20.0, .epoch_jyear = 2010.0};
  const auto engine = ProjectionEngine::Create({
      .pointing = pointing,
      .optics = warpfield::focal_plane::jasmine_optics(),
      .distortion = cubic(),
      .geometry = curved_jasmine(),
  });

  // Round trip through every stage.
  const auto sources = near_boresight(pointing, 0.03);
  const auto forward = engine->sky_to_pixel(sources);
  if (forward.results.size() != sources.size() || forward.summary.assigned != sources.size()) {
    spdlog::error("all near-boresight sources should be assigned, got {}", forward.summary.assigned);
    return 1;
  }
  for (std::size_t i = 0; i < sources.size(); ++i) {
    const auto& r = forward.results[i];
    if (r.status != Status::Ok || !r.detector_id || r.jacobian.has_value()) {
      spdlog::error("unexpected projection result at {}", i);
      return 2;
    }
    const auto back = engine->pixel_to_sky(*r.detector_id, {r.pixel});
    if (back.results.size() != 1U || back.results[0].status != Status::Ok) {
      spdlog::error("pixel_to_sky failed at {}", i);
      return 3;
    }
    const double err_rad = warpfield::attitude::separation_deg(sources[i], back.results[0].coord) * constants::kDegToRad;
    if (!(err_rad < 1e-9)) {
      spdlog::error("round trip error {} rad at {}", err_rad, i);
      return 4;
    }
  }

  // Repeated calls give identical answers.
  const auto again = engine->sky_to_pixel(sources);
  for (std::size_t i = 0; i < sources.size(); ++i) {
    if (again.results[i].pixel.x != forward.results[i].pixel.x || again.results[i].pixel.y != forward.results[i].pixel.y ||
        again.results[i].detector_id != forward.results[i].detector_id) {
      spdlog::error("projection is not repeatable at {}", i);
      return 5;
    }
  }

  // One antipodal source among nine valid ones.
  auto mixed = near_boresight(pointing, 0.02);
  mixed.insert(mixed.begin() + 4, SkyCoord{.lon_deg = pointing.ra_deg + 180.0, .lat_deg = -pointing.dec_deg});
  const auto partial = engine->sky_to_pixel(mixed);
  if (partial.results.size() != 10U || partial.summary.assigned != 9U || partial.summary.singular != 1U ||
      partial.summary.failed() != 1U || partial.results[4].status != Status::ProjectionSingularity ||
      partial.results[4].detector_id.has_value()) {
    spdlog::error("partial failure isolation mismatch: assigned={} singular={}", partial.summary.assigned, partial.summary.singular);
    return 6;
  }

  // Local Jacobian against central differences in radians.
  const SkyCoord probe{.lon_deg = pointing.ra_deg + 0.021, .lat_deg = pointing.dec_deg - 0.017};
  const auto jac = engine->local_jacobian({probe});
  const auto with_j = engine->sky_to_pixel(std::vector<SkyCoord>{probe}, {.with_jacobian = true});
  if (jac.results.size() != 1U || jac.results[0].status != Status::Ok || !with_j.results[0].jacobian.has_value()) {
    spdlog::error("jacobian request failed");
    return 7;
  }
  const auto j = jac.results[0].jacobian;
  const double h_deg = 1e-7 * constants::kRadToDeg;
  const auto px = [&](double dlon, double dlat) {
    return engine->sky_to_pixel(std::vector<SkyCoord>{{.lon_deg = probe.lon_deg + dlon, .lat_deg = probe.lat_deg + dlat}}).results[0].pixel;
  };
  const auto lp = px(h_deg, 0.0);
  const auto lm = px(-h_deg, 0.0);
  const auto bp = px(0.0, h_deg);
  const auto bm = px(0.0, -h_deg);
  const double fd[4] = {(lp.x - lm.x) / 2e-7, (bp.x - bm.x) / 2e-7, (lp.y - lm.y) / 2e-7, (bp.y - bm.y) / 2e-7};
  double scale = 0.0;
  for (const double v : fd) {
    scale = std::max(scale, std::abs(v));
  }
  for (std::size_t k = 0; k < 4U; ++k) {
    if (std::abs(j.v[k] - fd[k]) > 1e-5 * scale || j.v[k] != with_j.results[0].jacobian->v[k]) {
      spdlog::error("local jacobian element {} mismatch: {} vs {}", k, j.v[k], fd[k]);
      return 8;
    }
  }

  // Expected non-assignments are not failures.
  const auto far = engine->sky_to_pixel(std::vector<SkyCoord>{{.lon_deg = pointing.ra_deg, .lat_deg = pointing.dec_deg + 0.3}});
  if (far.results[0].status != Status::OutsideFieldOfView || far.summary.outside_fov != 1U || far.summary.failed() != 0U) {
    spdlog::error("source beyond the field radius should be outside_fov");
    return 9;
  }
  const auto plain = ProjectionEngine::Create({
      .pointing = {.ra_deg = 10.0, .dec_deg = 5.0, .position_angle_deg = 0.0},
      .optics = warpfield::focal_plane::jasmine_optics(),
      .geometry = warpfield::focal_plane::FocalPlaneGeometry::Create(warpfield::focal_plane::jasmine_geometry_config()),
  });
  const auto gap_sky = plain->attitude().to_sky(warpfield::core::TangentPoint{.x_rad = 9800.0 / 7.3e6, .y_rad = 0.0});
  const auto gap = plain->sky_to_pixel(std::vector<SkyCoord>{gap_sky.coord});
  if (gap.results[0].status != Status::Unassigned || gap.summary.unassigned != 1U || gap.summary.failed() != 0U) {
    spdlog::error("source in an inter-chip gap should be unassigned");
    return 10;
  }
  const auto id_check = plain->distortion().apply({.x_um = 123.0, .y_um = -45.0});
  if (id_check.x_um != 123.0 || id_check.y_um != -45.0) {
    spdlog::error("missing distortion should default to identity");
    return 11;
  }

  // Catalog overload propagates proper motion to the pointing epoch.
  const SkyCoord moving{.lon_deg = pointing.ra_deg + 0.01, .lat_deg = pointing.dec_deg};
  const warpfield::source::ProperMotion pm{.pm_lon_cosdec_mas_yr = 5000.0, .pm_lat_mas_yr = -2000.0};
  std::vector<warpfield::source::SourcePosition> moving_sources{{.coord = moving, .epoch_jyear = 2000.0, .proper_motion = pm}};
  const warpfield::source::SourceCatalog catalog(std::move(moving_sources));
  const auto from_catalog = engine->sky_to_pixel(catalog);
  const auto expected =
      engine->sky_to_pixel(std::vector<SkyCoord>{warpfield::source::apply_proper_motion(moving, pm, pointing.epoch_jyear - 2000.0)});
  const auto unmoved = engine->sky_to_pixel(std::vector<SkyCoord>{moving});
  if (from_catalog.results[0].status != Status::Ok || from_catalog.results[0].pixel.x != expected.results[0].pixel.x ||
      from_catalog.results[0].pixel.y != expected.results[0].pixel.y ||
      std::abs(from_catalog.results[0].pixel.x - unmoved.results[0].pixel.x) < 1.0) {
    spdlog::error("catalog proper motion was not applied");
    return 12;
  }

  // Inverse-path failures stay per element.
  const auto capped = ProjectionEngine::Create({
      .pointing = pointing,
      .optics = warpfield::focal_plane::jasmine_optics(),
      .distortion = warpfield::distortion::PolynomialDistortion::Create({
          .order = 2,
          .center_um = {},
          .a = {0.0, 0.0, 1.0e-5, 0.0, 0.0},
          .b = {0.0, 0.0, 0.0, 0.0, 1.0e-5},
          .inversion = {.max_iterations = 1, .tolerance_um = 1e-9},
      }),
      .geometry = curved_jasmine(),
  });
  const auto inv = capped->pixel_to_sky(8, {{.x = 640.0, .y = 640.0}, {.x = 100.0, .y = 1200.0}});
  const auto unknown = capped->pixel_to_sky(42, {{.x = 640.0, .y = 640.0}});
  if (inv.results.size() != 2U || inv.results[0].status != Status::DistortionInversionFailed ||
      inv.summary.inversion_failed != 2U || unknown.results[0].status != Status::InvalidInput || unknown.summary.invalid != 1U) {
    spdlog::error("inverse failure reporting mismatch");
    return 13;
  }

  bool threw = false;
  try {
    (void)ProjectionEngine::Create({.pointing = pointing, .optics = warpfield::focal_plane::jasmine_optics()});
  } catch (const warpfield::core::ModelConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    spdlog::error("missing geometry should be rejected");
    return 14;
  }
  threw = false;
  try {
    (void)ProjectionEngine::Create({.pointing = pointing, .optics = {.focal_length_um = -1.0}, .geometry = curved_jasmine()});
  } catch (const warpfield::core::ModelConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    spdlog::error("invalid optics should be rejected");
    return 15;
  }

  return 0;
}
