/**
 * @file polynomial_distortion.hpp
 * @brief SIP-style offset polynomial distortion about a center.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "warpfield/distortion/distortion_model.hpp"

namespace warpfield::distortion {

/**
 * @brief out = p + sum_{1 <= m+n <= order} (A_mn, B_mn) dx^m dy^n, d = p - center.
 *
 * Coefficients are stored in graded order: degree 1 first, and inside one
 * degree k the terms run x^k, x^(k-1) y, ..., y^k.
 */
class PolynomialDistortion final : public DistortionModel {
 public:
  struct Config {
    int order{0};
    warpfield::core::FocalPoint center_um{};
    std::vector<double> a{};
    std::vector<double> b{};
    InversionConfig inversion{};
  };

  /**
   * @brief Number of coefficients per axis for `order`.
   */
  static std::size_t term_count(int order);

  /**
   * @brief (m, n) exponents in storage order.
   */
  static std::vector<std::pair<int, int>> exponents(int order);

  /**
   * @throws warpfield::core::ModelConfigurationError on negative order, a
   * coefficient count that does not match the order, or non-finite values.
   */
  static std::unique_ptr<PolynomialDistortion> Create(const Config& config);

  [[nodiscard]] warpfield::core::FocalPoint apply(const warpfield::core::FocalPoint& ideal) const override;
  [[nodiscard]] warpfield::core::Mat2 jacobian(const warpfield::core::FocalPoint& ideal) const override;
  [[nodiscard]] warpfield::core::Mat2 jacobian_autodiff(const warpfield::core::FocalPoint& ideal) const override;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  explicit PolynomialDistortion(Config config);

  template <typename Scalar>
  std::array<Scalar, 2> evaluate(const Scalar& x, const Scalar& y) const;

  Config config_{};
  std::vector<std::pair<int, int>> exponents_{};
};

}  // namespace warpfield::distortion
