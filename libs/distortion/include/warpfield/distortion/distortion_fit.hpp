/**
 * @file distortion_fit.hpp
 * @brief Least-squares recovery of polynomial distortion coefficients.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include "warpfield/distortion/polynomial_distortion.hpp"

namespace warpfield::distortion {

struct PolynomialFitResult {
  PolynomialDistortion::Config config{};
  double rms_residual_um{};
  std::size_t pair_count{};
};

/**
 * @brief Fit A/B coefficients of a polynomial distortion to matched pairs.
 *
 * `ideal[i]` is the undistorted position and `observed[i]` the measured
 * distorted position of the same source.
 * @throws warpfield::core::ModelConfigurationError on mismatched sizes, fewer
 * pairs than coefficients, or non-finite input.
 */
PolynomialFitResult fit_polynomial_distortion(int order,
                                              const warpfield::core::FocalPoint& center_um,
                                              const std::vector<warpfield::core::FocalPoint>& ideal,
                                              const std::vector<warpfield::core::FocalPoint>& observed,
                                              const InversionConfig& inversion = InversionConfig{});

}  // namespace warpfield::distortion
