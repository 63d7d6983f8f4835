/**
 * @file radial_distortion.hpp
 * @brief Rational radial distortion about an optical center.
 * @author Watosn
 */
#pragma once

#include <array>
#include <memory>
#include <utility>
#include <vector>

#include "warpfield/distortion/distortion_model.hpp"

namespace warpfield::distortion {

/**
 * @brief out = c + d * (1 + sum_i num_i s^i) / (1 + sum_j den_j s^j), d = p - c, s = |d|^2.
 *
 * `numerator[i]` multiplies s^(i+1); likewise for `denominator`.
 */
class RadialDistortion final : public DistortionModel {
 public:
  struct Config {
    warpfield::core::FocalPoint center_um{};
    int numerator_order{0};
    int denominator_order{0};
    std::vector<double> numerator{};
    std::vector<double> denominator{};
    InversionConfig inversion{};
  };

  /**
   * @throws warpfield::core::ModelConfigurationError when a coefficient list
   * does not match its declared order or holds non-finite values.
   */
  static std::unique_ptr<RadialDistortion> Create(const Config& config);

  [[nodiscard]] warpfield::core::FocalPoint apply(const warpfield::core::FocalPoint& ideal) const override;
  [[nodiscard]] warpfield::core::Mat2 jacobian(const warpfield::core::FocalPoint& ideal) const override;
  [[nodiscard]] warpfield::core::Mat2 jacobian_autodiff(const warpfield::core::FocalPoint& ideal) const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit RadialDistortion(Config config) : DistortionModel(config.inversion), config_(std::move(config)) {}

  template <typename Scalar>
  std::array<Scalar, 2> evaluate(const Scalar& x, const Scalar& y) const;

  Config config_{};
};

}  // namespace warpfield::distortion
