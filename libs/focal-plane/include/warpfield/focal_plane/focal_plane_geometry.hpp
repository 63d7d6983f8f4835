/**
 * @file focal_plane_geometry.hpp
 * @brief Detector mosaic placement and pixel mapping.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/types.hpp"
#include "warpfield/focal_plane/focal_surface.hpp"

namespace warpfield::focal_plane {

/**
 * @brief One detector placed on the focal surface.
 *
 * Pixel coordinates run from 0 at one corner of the active area to
 * `pixel_width` / `pixel_height` at the opposite corner; the detector center
 * sits at (pixel_width / 2, pixel_height / 2) and the pixel axes are the
 * focal-plane axes rotated counter-clockwise by `rotation_deg`.
 */
struct Detector {
  int id{};
  warpfield::core::FocalPoint center_um{};
  double rotation_deg{};
  double pixel_scale_um{15.0};
  int pixel_width{1280};
  int pixel_height{1280};
};

/**
 * @brief Result of detector assignment for one focal-plane point.
 *
 * `detector_id` is empty when the point lies on no detector (`Unassigned`) or
 * could not be carried onto the focal surface.
 */
struct Assignment {
  std::optional<int> detector_id{};
  warpfield::core::PixelPoint pixel{};
  warpfield::core::Status status{warpfield::core::Status::Unassigned};
};

struct AssignmentBatch {
  std::vector<Assignment> assignments{};
  std::size_t assigned_count{};
  std::size_t unassigned_count{};
  std::size_t failed_count{};
};

struct FocalPlaneSample {
  warpfield::core::FocalPoint point{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

/**
 * @brief Read-only detector layout sharing one focal-plane coordinate system.
 *
 * Active areas are closed rectangles, so a point exactly on an edge belongs
 * to the detector. When areas overlap the lowest detector id wins.
 */
class FocalPlaneGeometry final {
 public:
  struct Config {
    std::vector<Detector> detectors{};
    FocalSurface surface{};
  };

  /**
   * @throws warpfield::core::ModelConfigurationError on an empty detector list,
   * duplicate ids, non-positive pixel scale or size, or non-finite placement.
   */
  static std::unique_ptr<FocalPlaneGeometry> Create(const Config& config);

  /**
   * @brief Assign a (distorted) reference-surface point to a detector.
   */
  [[nodiscard]] Assignment assign(const warpfield::core::FocalPoint& focal) const;
  [[nodiscard]] AssignmentBatch assign(const std::vector<warpfield::core::FocalPoint>& focal) const;

  /**
   * @brief Pixel position of a reference-surface point in one detector's frame, bounds not checked.
   */
  [[nodiscard]] std::optional<warpfield::core::PixelPoint> to_pixel(int detector_id, const warpfield::core::FocalPoint& focal) const;

  /**
   * @brief Reference-surface point of a pixel position; unknown ids give `InvalidInput`.
   */
  [[nodiscard]] FocalPlaneSample to_focal_plane(int detector_id, const warpfield::core::PixelPoint& pixel) const;
  [[nodiscard]] std::vector<FocalPlaneSample> to_focal_plane(int detector_id,
                                                             const std::vector<warpfield::core::PixelPoint>& pixels) const;

  /**
   * @brief d(pixel)/d(reference-surface position) for one detector; zero for unknown ids.
   */
  [[nodiscard]] warpfield::core::Mat2 pixel_jacobian(int detector_id, const warpfield::core::FocalPoint& focal) const;

  [[nodiscard]] const Detector* find(int detector_id) const;
  [[nodiscard]] std::vector<Detector> detectors() const;
  [[nodiscard]] const FocalSurface& surface() const { return surface_; }

 private:
  struct Placement {
    Detector detector{};
    warpfield::core::Mat2 to_local{};
    warpfield::core::Mat2 to_focal{};
  };

  FocalPlaneGeometry(std::vector<Placement> placements, const FocalSurface& surface)
      : placements_(std::move(placements)), surface_(surface) {}

  [[nodiscard]] const Placement* placement(int detector_id) const;
  [[nodiscard]] static warpfield::core::PixelPoint local_pixel(const Placement& p, const warpfield::core::FocalPoint& on_surface);

  // Sorted by detector id.
  std::vector<Placement> placements_{};
  FocalSurface surface_{};
};

}  // namespace warpfield::focal_plane
