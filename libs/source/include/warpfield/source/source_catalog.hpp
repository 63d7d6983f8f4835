/**
 * @file source_catalog.hpp
 * @brief Immutable sky-source batch with optional proper motion.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "warpfield/core/types.hpp"

namespace warpfield::source {

/**
 * @brief Proper motion in mas/yr; the longitude rate already includes cos(lat).
 */
struct ProperMotion {
  double pm_lon_cosdec_mas_yr{};
  double pm_lat_mas_yr{};
};

/**
 * @brief One catalog source.
 */
struct SourcePosition {
  warpfield::core::SkyCoord coord{};
  std::optional<std::int64_t> catalog_id{};
  std::optional<double> epoch_jyear{};
  std::optional<ProperMotion> proper_motion{};
};

/**
 * @brief Convert an ICRS coordinate into Galactic (l, b).
 */
[[nodiscard]] warpfield::core::SkyCoord icrs_to_galactic(const warpfield::core::SkyCoord& icrs);

/**
 * @brief Convert a Galactic (l, b) coordinate into ICRS.
 */
[[nodiscard]] warpfield::core::SkyCoord galactic_to_icrs(const warpfield::core::SkyCoord& galactic);

/**
 * @brief Move a position along its proper-motion great circle by `dt_years`.
 *
 * Negative `dt_years` moves the source backwards along the same circle.
 */
[[nodiscard]] warpfield::core::SkyCoord apply_proper_motion(const warpfield::core::SkyCoord& coord,
                                                            const ProperMotion& pm,
                                                            double dt_years);

/**
 * @brief Ordered, read-only batch of sources in one celestial frame.
 */
class SourceCatalog final {
 public:
  SourceCatalog() = default;
  explicit SourceCatalog(std::vector<SourcePosition> sources,
                         warpfield::core::CelestialFrame frame = warpfield::core::CelestialFrame::Icrs)
      : sources_(std::move(sources)), frame_(frame) {}

  /**
   * @brief Build a catalog of plain positions without epoch or motion.
   */
  static SourceCatalog FromCoordinates(const std::vector<warpfield::core::SkyCoord>& coords,
                                       warpfield::core::CelestialFrame frame = warpfield::core::CelestialFrame::Icrs);

  [[nodiscard]] std::size_t size() const { return sources_.size(); }
  [[nodiscard]] bool empty() const { return sources_.empty(); }
  [[nodiscard]] const SourcePosition& operator[](std::size_t i) const { return sources_[i]; }
  [[nodiscard]] const std::vector<SourcePosition>& sources() const { return sources_; }
  [[nodiscard]] warpfield::core::CelestialFrame frame() const { return frame_; }

  /**
   * @brief Catalog positions as stored.
   */
  [[nodiscard]] std::vector<warpfield::core::SkyCoord> coordinates() const;

  /**
   * @brief ICRS positions propagated to `epoch_jyear`.
   *
   * Sources without a reference epoch or proper motion are not moved. Proper
   * motion is applied in the catalog frame, then Galactic positions are
   * converted to ICRS.
   */
  [[nodiscard]] std::vector<warpfield::core::SkyCoord> icrs_at_epoch(double epoch_jyear) const;

 private:
  std::vector<SourcePosition> sources_{};
  warpfield::core::CelestialFrame frame_{warpfield::core::CelestialFrame::Icrs};
};

}  // namespace warpfield::source
