/**
 * @file attitude_model.hpp
 * @brief Boresight pointing and gnomonic tangent-plane projection.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/types.hpp"

namespace warpfield::attitude {

/**
 * @brief ICRS boresight direction, roll and observation epoch.
 */
struct Pointing {
  double ra_deg{};
  double dec_deg{};
  double position_angle_deg{};
  double epoch_jyear{warpfield::core::constants::kJ2000JulianYear};
};

struct TangentSample {
  warpfield::core::TangentPoint point{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

struct TangentBatch {
  std::vector<TangentSample> samples{};
  std::size_t singular_count{};
  std::size_t invalid_count{};
};

struct SkySample {
  warpfield::core::SkyCoord coord{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

struct SkyBatch {
  std::vector<SkySample> samples{};
  std::size_t invalid_count{};
};

/**
 * @brief Gnomonic projection about a fixed pointing.
 *
 * Before the roll, the tangent-plane x axis points toward decreasing right
 * ascension and y toward north; `(x, y)` is then rotated counter-clockwise by
 * the position angle. Points with cos(separation) <= kHemisphereEpsilon are
 * reported as `ProjectionSingularity`.
 */
class AttitudeModel final {
 public:
  /**
   * @brief Validate the pointing and precompute the local frame.
   * @throws warpfield::core::ModelConfigurationError on non-finite values or |dec| > 90.
   */
  explicit AttitudeModel(const Pointing& pointing);

  [[nodiscard]] const Pointing& pointing() const { return pointing_; }

  [[nodiscard]] TangentSample to_tangent_plane(const warpfield::core::SkyCoord& coord) const;
  [[nodiscard]] TangentBatch to_tangent_plane(const std::vector<warpfield::core::SkyCoord>& coords) const;

  [[nodiscard]] SkySample to_sky(const warpfield::core::TangentPoint& point) const;
  [[nodiscard]] SkyBatch to_sky(const std::vector<warpfield::core::TangentPoint>& points) const;

  /**
   * @brief d(x, y)/d(lon, lat) with all angles in radians.
   *
   * Returns a zero matrix outside the valid hemisphere.
   */
  [[nodiscard]] warpfield::core::Mat2 jacobian(const warpfield::core::SkyCoord& coord) const;

 private:
  Pointing pointing_{};
  // Rows: east, north and boresight unit vectors in ICRS.
  Eigen::Matrix3d local_from_icrs_{Eigen::Matrix3d::Identity()};
  warpfield::core::Mat2 roll_{};
  warpfield::core::Mat2 unroll_{};
};

/**
 * @brief Functional forms of the projection for one-off use.
 */
[[nodiscard]] TangentBatch to_tangent_plane(const std::vector<warpfield::core::SkyCoord>& coords, const Pointing& pointing);
[[nodiscard]] SkyBatch to_sky(const std::vector<warpfield::core::TangentPoint>& points, const Pointing& pointing);

/**
 * @brief Great-circle separation in degrees.
 */
[[nodiscard]] double separation_deg(const warpfield::core::SkyCoord& a, const warpfield::core::SkyCoord& b);

/**
 * @brief Position angle of `to` seen from `from`, north through east, degrees in [0, 360).
 */
[[nodiscard]] double position_angle_deg(const warpfield::core::SkyCoord& from, const warpfield::core::SkyCoord& to);

/**
 * @brief Build an ICRS pointing from a Galactic boresight.
 *
 * `position_angle_deg` is the roll in the Galactic tangent frame. The returned
 * pointing projects sources exactly as that Galactic-frame pointing would, so
 * its roll is reduced by the position angle of the Galactic pole at the boresight.
 */
[[nodiscard]] Pointing pointing_from_galactic(const warpfield::core::SkyCoord& galactic_center,
                                              double position_angle_deg,
                                              double epoch_jyear = warpfield::core::constants::kJ2000JulianYear);

}  // namespace warpfield::attitude
