/**
 * @file distortion_model.hpp
 * @brief Optical distortion interface with bounded Newton inversion.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include "warpfield/core/math_utils.hpp"
#include "warpfield/core/types.hpp"

namespace warpfield::distortion {

/**
 * @brief Iteration budget for inverting a distortion map.
 */
struct InversionConfig {
  int max_iterations{50};
  double tolerance_um{1e-9};
};

/**
 * @brief Tagged outcome of one inversion.
 */
struct InversionResult {
  warpfield::core::FocalPoint point{};
  int iterations{};
  double residual_um{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

struct FocalSample {
  warpfield::core::FocalPoint point{};
  warpfield::core::Status status{warpfield::core::Status::Ok};
};

struct FocalBatch {
  std::vector<FocalSample> samples{};
  std::size_t failed_count{};
};

/**
 * @brief Map from ideal (undistorted) to distorted focal-plane positions.
 *
 * Subclasses provide the closed-form forward map together with an analytic
 * and an automatically differentiated Jacobian. `invert` defaults to a Newton
 * solve seeded at the input point.
 */
class DistortionModel {
 public:
  virtual ~DistortionModel() = default;

  /**
   * @brief Ideal -> distorted position.
   */
  [[nodiscard]] virtual warpfield::core::FocalPoint apply(const warpfield::core::FocalPoint& ideal) const = 0;

  /**
   * @brief Analytic d(distorted)/d(ideal).
   */
  [[nodiscard]] virtual warpfield::core::Mat2 jacobian(const warpfield::core::FocalPoint& ideal) const = 0;

  /**
   * @brief d(distorted)/d(ideal) obtained by differentiating `apply` with AutoDiffScalar.
   */
  [[nodiscard]] virtual warpfield::core::Mat2 jacobian_autodiff(const warpfield::core::FocalPoint& ideal) const = 0;

  /**
   * @brief Distorted -> ideal position.
   *
   * Stops when the forward residual drops below `tolerance_um` or after
   * `max_iterations` Newton steps; the latter yields `DistortionInversionFailed`.
   */
  [[nodiscard]] virtual InversionResult invert(const warpfield::core::FocalPoint& distorted) const;

  [[nodiscard]] FocalBatch apply_batch(const std::vector<warpfield::core::FocalPoint>& ideal) const;
  [[nodiscard]] FocalBatch invert_batch(const std::vector<warpfield::core::FocalPoint>& distorted) const;
  [[nodiscard]] std::vector<warpfield::core::Mat2> jacobian_batch(const std::vector<warpfield::core::FocalPoint>& ideal) const;

  [[nodiscard]] const InversionConfig& inversion_config() const { return inversion_; }

 protected:
  /**
   * @throws warpfield::core::ModelConfigurationError on a non-positive budget.
   */
  explicit DistortionModel(const InversionConfig& inversion);

 private:
  InversionConfig inversion_{};
};

/**
 * @brief No-op distortion.
 */
class IdentityDistortion final : public DistortionModel {
 public:
  IdentityDistortion() : DistortionModel(InversionConfig{}) {}

  [[nodiscard]] warpfield::core::FocalPoint apply(const warpfield::core::FocalPoint& ideal) const override { return ideal; }
  [[nodiscard]] warpfield::core::Mat2 jacobian(const warpfield::core::FocalPoint& /*ideal*/) const override {
    return warpfield::core::mat2_identity();
  }
  [[nodiscard]] warpfield::core::Mat2 jacobian_autodiff(const warpfield::core::FocalPoint& /*ideal*/) const override {
    return warpfield::core::mat2_identity();
  }
  [[nodiscard]] InversionResult invert(const warpfield::core::FocalPoint& distorted) const override;
};

}  // namespace warpfield::distortion
