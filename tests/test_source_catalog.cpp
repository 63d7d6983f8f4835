/**
 * @file test_source_catalog.cpp
 * @brief Galactic frame conversion and proper-motion propagation checks.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "warpfield/attitude/attitude_model.hpp"
#include "warpfield/core/sphere.hpp"
#include "warpfield/source/source_catalog.hpp"

namespace {

using warpfield::core::SkyCoord;

double angle_diff_deg(double a, double b) {
  double d = std::fmod(std::abs(a - b), 360.0);
  return d > 180.0 ? 360.0 - d : d;
}

}  // namespace

int main() {
  // Galactic center and north pole in ICRS (J2000).
  const auto gc = warpfield::source::icrs_to_galactic(SkyCoord{.lon_deg = 266.40499, .lat_deg = -28.93617});
  if (angle_diff_deg(gc.lon_deg, 0.0) > 1e-3 || std::abs(gc.lat_deg) > 1e-3) {
    spdlog::error("galactic center mismatch: l={} b={}", gc.lon_deg, gc.lat_deg);
    return 1;
  }
  const auto ngp = warpfield::source::icrs_to_galactic(SkyCoord{.lon_deg = 192.85948, .lat_deg = 27.12825});
  if (std::abs(ngp.lat_deg - 90.0) > 1e-3) {
    spdlog::error("galactic pole mismatch: b={}", ngp.lat_deg);
    return 2;
  }

  for (const auto& c : {SkyCoord{.lon_deg = 0.0, .lat_deg = 0.0}, SkyCoord{.lon_deg = 83.6, .lat_deg = 22.0},
                        SkyCoord{.lon_deg = 350.0, .lat_deg = -75.0}}) {
    const auto back = warpfield::source::galactic_to_icrs(warpfield::source::icrs_to_galactic(c));
    if (warpfield::attitude::separation_deg(c, back) > 1e-9) {
      spdlog::error("icrs/galactic round trip failed at ({}, {})", c.lon_deg, c.lat_deg);
      return 3;
    }
  }

  const SkyCoord start{.lon_deg = 10.0, .lat_deg = 20.0};
  const auto north = warpfield::source::apply_proper_motion(start, {.pm_lon_cosdec_mas_yr = 0.0, .pm_lat_mas_yr = 1000.0}, 10.0);
  if (std::abs(north.lon_deg - 10.0) > 1e-12 || std::abs(north.lat_deg - (20.0 + 10.0 / 3600.0)) > 1e-9) {
    spdlog::error("northward proper motion mismatch: ({}, {})", north.lon_deg, north.lat_deg);
    return 4;
  }

  const warpfield::source::ProperMotion east_pm{.pm_lon_cosdec_mas_yr = 1000.0, .pm_lat_mas_yr = 0.0};
  const auto east = warpfield::source::apply_proper_motion(start, east_pm, 10.0);
  if (std::abs(warpfield::attitude::separation_deg(start, east) - 10.0 / 3600.0) > 1e-9 ||
      angle_diff_deg(warpfield::attitude::position_angle_deg(start, east), 90.0) > 1e-6) {
    spdlog::error("eastward proper motion mismatch");
    return 5;
  }
  const auto west = warpfield::source::apply_proper_motion(start, east_pm, -10.0);
  if (angle_diff_deg(warpfield::attitude::position_angle_deg(start, west), 270.0) > 1e-6) {
    spdlog::error("negative interval should move against the motion");
    return 6;
  }
  const auto still = warpfield::source::apply_proper_motion(start, {}, 25.0);
  if (still.lon_deg != start.lon_deg || still.lat_deg != start.lat_deg) {
    spdlog::error("zero proper motion should not move the source");
    return 7;
  }

  std::vector<warpfield::source::SourcePosition> sources{
      {.coord = start, .catalog_id = 1, .epoch_jyear = 2000.0, .proper_motion = warpfield::source::ProperMotion{0.0, 1000.0}},
      {.coord = start, .catalog_id = 2},
  };
  const warpfield::source::SourceCatalog catalog(sources);
  const auto at_2010 = catalog.icrs_at_epoch(2010.0);
  if (at_2010.size() != 2U || std::abs(at_2010[0].lat_deg - north.lat_deg) > 1e-12 || at_2010[1].lat_deg != start.lat_deg) {
    spdlog::error("catalog epoch propagation mismatch");
    return 8;
  }
  if (catalog.size() != 2U || catalog.empty() || catalog[0].coord.lat_deg != start.lat_deg ||
      catalog.coordinates()[0].lat_deg != start.lat_deg || catalog.sources()[1].catalog_id != 2 ||
      catalog.frame() != warpfield::core::CelestialFrame::Icrs) {
    spdlog::error("catalog must not be mutated by propagation");
    return 9;
  }

  const auto gal_catalog =
      warpfield::source::SourceCatalog::FromCoordinates({gc}, warpfield::core::CelestialFrame::Galactic);
  const auto gal_icrs = gal_catalog.icrs_at_epoch(2000.0);
  if (warpfield::attitude::separation_deg(gal_icrs[0], SkyCoord{.lon_deg = 266.40499, .lat_deg = -28.93617}) > 1e-9) {
    spdlog::error("galactic catalog conversion mismatch");
    return 10;
  }

  const SkyCoord west_coord{.lon_deg = -30.0, .lat_deg = 45.0};
  const SkyCoord back = warpfield::core::from_unit_vector(3.0 * warpfield::core::unit_vector(west_coord));
  if (std::abs(back.lon_deg - 330.0) > 1e-12 || std::abs(back.lat_deg - 45.0) > 1e-12) {
    spdlog::error("unit vector conversion mismatch: {} {}", back.lon_deg, back.lat_deg);
    return 11;
  }

  return 0;
}
