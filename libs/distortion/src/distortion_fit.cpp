/**
 * @file distortion_fit.cpp
 * @brief Polynomial distortion fit implementation.
 * @author Watosn
 */

#include "warpfield/distortion/distortion_fit.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "warpfield/core/errors.hpp"

namespace warpfield::distortion {

PolynomialFitResult fit_polynomial_distortion(int order,
                                              const warpfield::core::FocalPoint& center_um,
                                              const std::vector<warpfield::core::FocalPoint>& ideal,
                                              const std::vector<warpfield::core::FocalPoint>& observed,
                                              const InversionConfig& inversion) {
  if (order < 1) {
    throw warpfield::core::ModelConfigurationError("distortion fit order must be >= 1");
  }
  if (ideal.size() != observed.size()) {
    throw warpfield::core::ModelConfigurationError(
        fmt::format("distortion fit needs matched pairs: {} vs {}", ideal.size(), observed.size()));
  }
  const auto terms = PolynomialDistortion::exponents(order);
  if (ideal.size() < terms.size()) {
    throw warpfield::core::ModelConfigurationError(
        fmt::format("distortion fit of order {} needs at least {} pairs", order, terms.size()));
  }

  // Columns are scaled by the largest offset so high orders stay conditioned.
  double scale = 0.0;
  for (std::size_t i = 0; i < ideal.size(); ++i) {
    if (!warpfield::core::is_finite(ideal[i]) || !warpfield::core::is_finite(observed[i])) {
      throw warpfield::core::ModelConfigurationError(fmt::format("distortion fit pair {} is not finite", i));
    }
    scale = std::max({scale, std::abs(ideal[i].x_um - center_um.x_um), std::abs(ideal[i].y_um - center_um.y_um)});
  }
  if (!(scale > 0.0)) {
    scale = 1.0;
  }

  const auto rows = static_cast<Eigen::Index>(ideal.size());
  const auto cols = static_cast<Eigen::Index>(terms.size());
  Eigen::MatrixXd design(rows, cols);
  Eigen::MatrixXd rhs(rows, 2);
  for (Eigen::Index r = 0; r < rows; ++r) {
    const auto& p = ideal[static_cast<std::size_t>(r)];
    const auto& q = observed[static_cast<std::size_t>(r)];
    const double u = (p.x_um - center_um.x_um) / scale;
    const double v = (p.y_um - center_um.y_um) / scale;
    for (Eigen::Index c = 0; c < cols; ++c) {
      const auto& mn = terms[static_cast<std::size_t>(c)];
      design(r, c) = std::pow(u, mn.first) * std::pow(v, mn.second);
    }
    rhs(r, 0) = q.x_um - p.x_um;
    rhs(r, 1) = q.y_um - p.y_um;
  }

  const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
  if (qr.rank() < cols) {
    throw warpfield::core::ModelConfigurationError(
        fmt::format("distortion fit design matrix is rank deficient ({} of {} terms); pairs do not span the field",
                    qr.rank(), cols));
  }
  const Eigen::MatrixXd solution = qr.solve(rhs);
  const Eigen::MatrixXd residual = design * solution - rhs;

  PolynomialFitResult out{};
  out.pair_count = ideal.size();
  out.rms_residual_um = std::sqrt(residual.squaredNorm() / static_cast<double>(ideal.size()));
  out.config.order = order;
  out.config.center_um = center_um;
  out.config.inversion = inversion;
  out.config.a.resize(terms.size());
  out.config.b.resize(terms.size());
  for (std::size_t c = 0; c < terms.size(); ++c) {
    const double unscale = std::pow(scale, -(terms[c].first + terms[c].second));
    out.config.a[c] = solution(static_cast<Eigen::Index>(c), 0) * unscale;
    out.config.b[c] = solution(static_cast<Eigen::Index>(c), 1) * unscale;
  }
  return out;
}

}  // namespace warpfield::distortion
