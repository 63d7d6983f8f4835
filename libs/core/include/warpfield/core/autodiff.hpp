/**
 * @file autodiff.hpp
 * @brief Forward-mode automatic differentiation of planar maps.
 * @author Watosn
 */
#pragma once

#include <array>

#include <Eigen/Dense>
#include <unsupported/Eigen/AutoDiff>

#include "warpfield/core/math_utils.hpp"

namespace warpfield::core {

/**
 * @brief Scalar carrying value and gradient w.r.t. two inputs.
 */
using AdScalar = Eigen::AutoDiffScalar<Eigen::Vector2d>;

/**
 * @brief Jacobian of a 2D -> 2D map evaluated with AdScalar inputs.
 *
 * `f` must be callable as `std::array<AdScalar, 2> f(const AdScalar& x, const AdScalar& y)`.
 */
template <typename F>
Mat2 autodiff_jacobian(const F& f, double x, double y) {
  const AdScalar ax(x, 2, 0);
  const AdScalar ay(y, 2, 1);
  const std::array<AdScalar, 2> out = f(ax, ay);
  Mat2 j{};
  for (int r = 0; r < 2; ++r) {
    const auto& der = out[static_cast<std::size_t>(r)].derivatives();
    j(r, 0) = der.size() > 0 ? der(0) : 0.0;
    j(r, 1) = der.size() > 1 ? der(1) : 0.0;
  }
  return j;
}

}  // namespace warpfield::core
