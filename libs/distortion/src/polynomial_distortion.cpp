/**
 * @file polynomial_distortion.cpp
 * @brief Polynomial distortion implementation.
 * @author Watosn
 */

#include "warpfield/distortion/polynomial_distortion.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "warpfield/core/autodiff.hpp"
#include "warpfield/core/errors.hpp"

namespace warpfield::distortion {

std::size_t PolynomialDistortion::term_count(int order) {
  if (order < 1) {
    return 0U;
  }
  const auto n = static_cast<std::size_t>(order);
  return (n + 1U) * (n + 2U) / 2U - 1U;
}

std::vector<std::pair<int, int>> PolynomialDistortion::exponents(int order) {
  std::vector<std::pair<int, int>> out;
  out.reserve(term_count(order));
  for (int k = 1; k <= order; ++k) {
    for (int m = k; m >= 0; --m) {
      out.emplace_back(m, k - m);
    }
  }
  return out;
}

std::unique_ptr<PolynomialDistortion> PolynomialDistortion::Create(const Config& config) {
  if (config.order < 0) {
    throw warpfield::core::ModelConfigurationError(
        fmt::format("polynomial distortion order must be >= 0, got {}", config.order));
  }
  const std::size_t expected = term_count(config.order);
  if (config.a.size() != expected || config.b.size() != expected) {
    throw warpfield::core::ModelConfigurationError(
        fmt::format("polynomial distortion of order {} needs {} coefficients per axis, got {}/{}", config.order, expected,
                    config.a.size(), config.b.size()));
  }
  if (!warpfield::core::is_finite(config.center_um)) {
    throw warpfield::core::ModelConfigurationError("polynomial distortion center is not finite");
  }
  for (std::size_t i = 0; i < expected; ++i) {
    if (!std::isfinite(config.a[i]) || !std::isfinite(config.b[i])) {
      throw warpfield::core::ModelConfigurationError(fmt::format("polynomial distortion coefficient {} is not finite", i));
    }
  }
  return std::unique_ptr<PolynomialDistortion>(new PolynomialDistortion(config));
}

PolynomialDistortion::PolynomialDistortion(Config config)
    : DistortionModel(config.inversion), config_(std::move(config)), exponents_(exponents(config_.order)) {}

template <typename Scalar>
std::array<Scalar, 2> PolynomialDistortion::evaluate(const Scalar& x, const Scalar& y) const {
  const auto n = static_cast<std::size_t>(std::max(config_.order, 0));
  const Scalar dx = x - config_.center_um.x_um;
  const Scalar dy = y - config_.center_um.y_um;
  std::vector<Scalar> px(n + 1U);
  std::vector<Scalar> py(n + 1U);
  px[0] = Scalar(1.0);
  py[0] = Scalar(1.0);
  for (std::size_t i = 1; i <= n; ++i) {
    px[i] = px[i - 1] * dx;
    py[i] = py[i - 1] * dy;
  }

  Scalar ox = x;
  Scalar oy = y;
  for (std::size_t k = 0; k < exponents_.size(); ++k) {
    const Scalar term = px[static_cast<std::size_t>(exponents_[k].first)] * py[static_cast<std::size_t>(exponents_[k].second)];
    ox += config_.a[k] * term;
    oy += config_.b[k] * term;
  }
  return {ox, oy};
}

warpfield::core::FocalPoint PolynomialDistortion::apply(const warpfield::core::FocalPoint& ideal) const {
  const auto out = evaluate(ideal.x_um, ideal.y_um);
  return warpfield::core::FocalPoint{out[0], out[1]};
}

warpfield::core::Mat2 PolynomialDistortion::jacobian(const warpfield::core::FocalPoint& ideal) const {
  const double dx = ideal.x_um - config_.center_um.x_um;
  const double dy = ideal.y_um - config_.center_um.y_um;
  auto j = warpfield::core::mat2_identity();
  for (std::size_t k = 0; k < exponents_.size(); ++k) {
    const int m = exponents_[k].first;
    const int n = exponents_[k].second;
    const double d_dx = (m > 0) ? m * std::pow(dx, m - 1) * std::pow(dy, n) : 0.0;
    const double d_dy = (n > 0) ? n * std::pow(dx, m) * std::pow(dy, n - 1) : 0.0;
    j(0, 0) += config_.a[k] * d_dx;
    j(0, 1) += config_.a[k] * d_dy;
    j(1, 0) += config_.b[k] * d_dx;
    j(1, 1) += config_.b[k] * d_dy;
  }
  return j;
}

warpfield::core::Mat2 PolynomialDistortion::jacobian_autodiff(const warpfield::core::FocalPoint& ideal) const {
  return warpfield::core::autodiff_jacobian(
      [this](const warpfield::core::AdScalar& x, const warpfield::core::AdScalar& y) { return evaluate(x, y); }, ideal.x_um,
      ideal.y_um);
}

}  // namespace warpfield::distortion
