/**
 * @file radial_distortion.cpp
 * @brief Rational radial distortion implementation.
 * @author Watosn
 */

#include "warpfield/distortion/radial_distortion.hpp"

#include <cmath>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "warpfield/core/autodiff.hpp"
#include "warpfield/core/errors.hpp"

namespace warpfield::distortion {
namespace {

void validate_series(const std::vector<double>& coeffs, int order, const char* name) {
  if (order < 0 || coeffs.size() != static_cast<std::size_t>(order)) {
    throw warpfield::core::ModelConfigurationError(
        fmt::format("radial distortion {} of order {} has {} coefficients", name, order, coeffs.size()));
  }
  for (const double c : coeffs) {
    if (!std::isfinite(c)) {
      throw warpfield::core::ModelConfigurationError(fmt::format("radial distortion {} coefficient is not finite", name));
    }
  }
}

// Returns 1 + sum_i c_i s^(i+1) and its derivative with respect to s.
std::pair<double, double> series_with_derivative(const std::vector<double>& coeffs, double s) {
  double value = 1.0;
  double deriv = 0.0;
  double s_pow = 1.0;
  for (std::size_t i = 0; i < coeffs.size(); ++i) {
    deriv += static_cast<double>(i + 1U) * coeffs[i] * s_pow;
    s_pow *= s;
    value += coeffs[i] * s_pow;
  }
  return {value, deriv};
}

}  // namespace

std::unique_ptr<RadialDistortion> RadialDistortion::Create(const Config& config) {
  validate_series(config.numerator, config.numerator_order, "numerator");
  validate_series(config.denominator, config.denominator_order, "denominator");
  if (!warpfield::core::is_finite(config.center_um)) {
    throw warpfield::core::ModelConfigurationError("radial distortion center is not finite");
  }
  return std::unique_ptr<RadialDistortion>(new RadialDistortion(config));
}

template <typename Scalar>
std::array<Scalar, 2> RadialDistortion::evaluate(const Scalar& x, const Scalar& y) const {
  const Scalar dx = x - config_.center_um.x_um;
  const Scalar dy = y - config_.center_um.y_um;
  const Scalar s = dx * dx + dy * dy;

  Scalar num = Scalar(1.0);
  Scalar den = Scalar(1.0);
  Scalar s_pow = Scalar(1.0);
  for (const double c : config_.numerator) {
    s_pow = s_pow * s;
    num += c * s_pow;
  }
  s_pow = Scalar(1.0);
  for (const double c : config_.denominator) {
    s_pow = s_pow * s;
    den += c * s_pow;
  }
  const Scalar f = num / den;
  return {config_.center_um.x_um + dx * f, config_.center_um.y_um + dy * f};
}

warpfield::core::FocalPoint RadialDistortion::apply(const warpfield::core::FocalPoint& ideal) const {
  const auto out = evaluate(ideal.x_um, ideal.y_um);
  return warpfield::core::FocalPoint{out[0], out[1]};
}

warpfield::core::Mat2 RadialDistortion::jacobian(const warpfield::core::FocalPoint& ideal) const {
  const double dx = ideal.x_um - config_.center_um.x_um;
  const double dy = ideal.y_um - config_.center_um.y_um;
  const double s = dx * dx + dy * dy;
  const auto [num, dnum] = series_with_derivative(config_.numerator, s);
  const auto [den, dden] = series_with_derivative(config_.denominator, s);
  const double f = num / den;
  const double df = (dnum * den - num * dden) / (den * den);

  // J = f I + 2 f'(s) d d^T
  warpfield::core::Mat2 j{};
  j(0, 0) = f + 2.0 * df * dx * dx;
  j(0, 1) = 2.0 * df * dx * dy;
  j(1, 0) = 2.0 * df * dy * dx;
  j(1, 1) = f + 2.0 * df * dy * dy;
  return j;
}

warpfield::core::Mat2 RadialDistortion::jacobian_autodiff(const warpfield::core::FocalPoint& ideal) const {
  return warpfield::core::autodiff_jacobian(
      [this](const warpfield::core::AdScalar& x, const warpfield::core::AdScalar& y) { return evaluate(x, y); }, ideal.x_um,
      ideal.y_um);
}

}  // namespace warpfield::distortion
