/**
 * @file source_catalog.cpp
 * @brief Source batch, frame conversion and proper-motion propagation.
 * @author Watosn
 */

#include "warpfield/source/source_catalog.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/sphere.hpp"

namespace warpfield::source {
namespace {

using warpfield::core::from_unit_vector;
using warpfield::core::SkyCoord;
using warpfield::core::unit_vector;
namespace constants = warpfield::core::constants;

// ICRS -> Galactic rotation (Hipparcos, ESA SP-1200 Vol. 1 Sec. 1.5.3).
const Eigen::Matrix3d& galactic_from_icrs() {
  static const Eigen::Matrix3d m = (Eigen::Matrix3d() << -0.0548755604162154, -0.8734370902348850, -0.4838350155487132,
                                    0.4941094278755837, -0.4448296299600112, 0.7469822444972189,
                                    -0.8676661490190047, -0.1980763734312015, 0.4559837761750669)
                                       .finished();
  return m;
}

}  // namespace

SkyCoord icrs_to_galactic(const SkyCoord& icrs) {
  return from_unit_vector(galactic_from_icrs() * unit_vector(icrs));
}

SkyCoord galactic_to_icrs(const SkyCoord& galactic) {
  return from_unit_vector(galactic_from_icrs().transpose() * unit_vector(galactic));
}

SkyCoord apply_proper_motion(const SkyCoord& coord, const ProperMotion& pm, double dt_years) {
  double amount = std::hypot(pm.pm_lon_cosdec_mas_yr * dt_years, pm.pm_lat_mas_yr * dt_years) * constants::kMasToRad;
  if (!(amount > 0.0)) {
    return coord;
  }
  amount = dt_years < 0.0 ? -amount : amount;
  const double bearing = std::atan2(pm.pm_lon_cosdec_mas_yr, pm.pm_lat_mas_yr);

  const double lat1 = coord.lat_deg * constants::kDegToRad;
  const double lon1 = coord.lon_deg * constants::kDegToRad;
  const double sin_lat2 = std::sin(lat1) * std::cos(amount) + std::cos(lat1) * std::sin(amount) * std::cos(bearing);
  const double lat2 = std::asin(std::clamp(sin_lat2, -1.0, 1.0));
  const double lon2 = lon1 + std::atan2(std::sin(bearing) * std::sin(amount) * std::cos(lat1),
                                        std::cos(amount) - std::sin(lat1) * sin_lat2);
  return SkyCoord{.lon_deg = warpfield::core::wrap_deg_360(lon2 * constants::kRadToDeg),
                  .lat_deg = lat2 * constants::kRadToDeg};
}

SourceCatalog SourceCatalog::FromCoordinates(const std::vector<SkyCoord>& coords, warpfield::core::CelestialFrame frame) {
  std::vector<SourcePosition> sources;
  sources.reserve(coords.size());
  for (const auto& c : coords) {
    sources.push_back(SourcePosition{.coord = c});
  }
  return SourceCatalog(std::move(sources), frame);
}

std::vector<SkyCoord> SourceCatalog::coordinates() const {
  std::vector<SkyCoord> out;
  out.reserve(sources_.size());
  for (const auto& s : sources_) {
    out.push_back(s.coord);
  }
  return out;
}

std::vector<SkyCoord> SourceCatalog::icrs_at_epoch(double epoch_jyear) const {
  std::vector<SkyCoord> out;
  out.reserve(sources_.size());
  for (const auto& s : sources_) {
    SkyCoord c = s.coord;
    if (s.epoch_jyear.has_value() && s.proper_motion.has_value()) {
      c = apply_proper_motion(c, *s.proper_motion, epoch_jyear - *s.epoch_jyear);
    }
    if (frame_ == warpfield::core::CelestialFrame::Galactic) {
      c = galactic_to_icrs(c);
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace warpfield::source
