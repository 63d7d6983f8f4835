/**
 * @file projection_engine.hpp
 * @brief Sky <-> detector pixel pipeline: attitude, optics, distortion, geometry.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "warpfield/attitude/attitude_model.hpp"
#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/types.hpp"
#include "warpfield/distortion/distortion_model.hpp"
#include "warpfield/focal_plane/focal_plane_geometry.hpp"
#include "warpfield/focal_plane/optics.hpp"
#include "warpfield/source/source_catalog.hpp"

namespace warpfield::engine {

struct ProjectionOptions {
  bool with_jacobian{false};
};

/**
 * @brief Per-source outcome of `sky_to_pixel`.
 *
 * `focal_um` is the distorted reference-surface position whenever the source
 * reached the focal plane. `jacobian` is d(pixel)/d(lon, lat) in pixels per
 * radian, present only for assigned sources when requested.
 */
struct ProjectionResult {
  std::optional<int> detector_id{};
  warpfield::core::PixelPoint pixel{};
  warpfield::core::FocalPoint focal_um{};
  std::optional<warpfield::core::Mat2> jacobian{};
  warpfield::core::Status status{warpfield::core::Status::Unassigned};
};

/**
 * @brief Aggregate outcome counters of one batch call.
 */
struct ProjectionSummary {
  std::size_t assigned{};
  std::size_t unassigned{};
  std::size_t outside_fov{};
  std::size_t singular{};
  std::size_t inversion_failed{};
  std::size_t invalid{};
  std::size_t numerical_error{};

  [[nodiscard]] std::size_t failed() const { return singular + inversion_failed + invalid + numerical_error; }
  void add(warpfield::core::Status status);
};

struct ProjectionBatch {
  std::vector<ProjectionResult> results{};
  ProjectionSummary summary{};
};

struct DeprojectionResult {
  warpfield::core::SkyCoord coord{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

struct DeprojectionBatch {
  std::vector<DeprojectionResult> results{};
  ProjectionSummary summary{};
};

struct JacobianResult {
  std::optional<int> detector_id{};
  warpfield::core::Mat2 jacobian{};
  warpfield::core::Status status{warpfield::core::Status::Unassigned};
};

struct JacobianBatch {
  std::vector<JacobianResult> results{};
  ProjectionSummary summary{};
};

/**
 * @brief Immutable forward/inverse projection pipeline.
 *
 * Every batch call returns exactly one result per input, in input order.
 * Numerical failures are reported per element; nothing here throws after
 * construction, so one engine may be shared read-only across threads.
 */
class ProjectionEngine final {
 public:
  struct Config {
    warpfield::attitude::Pointing pointing{};
    warpfield::focal_plane::Optics optics{};
    // Null selects IdentityDistortion.
    std::shared_ptr<const warpfield::distortion::DistortionModel> distortion{};
    std::shared_ptr<const warpfield::focal_plane::FocalPlaneGeometry> geometry{};
  };

  /**
   * @throws warpfield::core::ModelConfigurationError on an invalid pointing or
   * optics, or a missing geometry.
   */
  static std::unique_ptr<ProjectionEngine> Create(const Config& config);

  /**
   * @brief ICRS sky positions -> detector pixels.
   */
  [[nodiscard]] ProjectionBatch sky_to_pixel(const std::vector<warpfield::core::SkyCoord>& coords,
                                             const ProjectionOptions& options = {}) const;

  /**
   * @brief Catalog sources propagated to the pointing epoch, then projected.
   */
  [[nodiscard]] ProjectionBatch sky_to_pixel(const warpfield::source::SourceCatalog& catalog,
                                             const ProjectionOptions& options = {}) const;

  /**
   * @brief Pixels of one detector -> ICRS sky positions.
   */
  [[nodiscard]] DeprojectionBatch pixel_to_sky(int detector_id, const std::vector<warpfield::core::PixelPoint>& pixels) const;

  /**
   * @brief d(pixel)/d(lon, lat) per source, chained through all stages.
   */
  [[nodiscard]] JacobianBatch local_jacobian(const std::vector<warpfield::core::SkyCoord>& coords) const;

  [[nodiscard]] const warpfield::attitude::AttitudeModel& attitude() const { return attitude_; }
  [[nodiscard]] const warpfield::focal_plane::Optics& optics() const { return config_.optics; }
  [[nodiscard]] const warpfield::distortion::DistortionModel& distortion() const { return *config_.distortion; }
  [[nodiscard]] const warpfield::focal_plane::FocalPlaneGeometry& geometry() const { return *config_.geometry; }

 private:
  ProjectionEngine(Config config, const warpfield::attitude::AttitudeModel& attitude)
      : config_(std::move(config)), attitude_(attitude) {}

  [[nodiscard]] ProjectionResult project(const warpfield::core::SkyCoord& coord, bool with_jacobian) const;

  Config config_{};
  warpfield::attitude::AttitudeModel attitude_;
};

}  // namespace warpfield::engine
