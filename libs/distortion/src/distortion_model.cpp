/**
 * @file distortion_model.cpp
 * @brief Batch evaluation and Newton inversion shared by distortion models.
 * @author Watosn
 */

#include "warpfield/distortion/distortion_model.hpp"

#include <cmath>

#include <Eigen/Dense>

#include "warpfield/core/errors.hpp"

namespace warpfield::distortion {
namespace {

using warpfield::core::FocalPoint;
using warpfield::core::Status;

double residual_norm(const FocalPoint& a, const FocalPoint& b) { return std::hypot(a.x_um - b.x_um, a.y_um - b.y_um); }

}  // namespace

DistortionModel::DistortionModel(const InversionConfig& inversion) : inversion_(inversion) {
  if (inversion.max_iterations < 1) {
    throw warpfield::core::ModelConfigurationError("distortion inversion needs at least one iteration");
  }
  if (!(inversion.tolerance_um > 0.0) || !std::isfinite(inversion.tolerance_um)) {
    throw warpfield::core::ModelConfigurationError("distortion inversion tolerance must be positive and finite");
  }
}

InversionResult DistortionModel::invert(const FocalPoint& distorted) const {
  if (!warpfield::core::is_finite(distorted)) {
    return InversionResult{.point = distorted, .status = Status::InvalidInput};
  }

  FocalPoint guess = distorted;
  double residual = 0.0;
  for (int iter = 0;; ++iter) {
    const FocalPoint forward = apply(guess);
    if (!warpfield::core::is_finite(forward)) {
      return InversionResult{.point = guess, .iterations = iter, .residual_um = residual, .status = Status::DistortionInversionFailed};
    }
    residual = residual_norm(forward, distorted);
    if (residual < inversion_.tolerance_um) {
      return InversionResult{.point = guess, .iterations = iter, .residual_um = residual, .status = Status::Ok};
    }
    if (iter >= inversion_.max_iterations) {
      break;
    }

    const auto j = jacobian(guess);
    const Eigen::Map<const Eigen::Matrix<double, 2, 2, Eigen::RowMajor>> jm(j.v.data());
    const Eigen::FullPivLU<Eigen::Matrix2d> lu(jm);
    if (!lu.isInvertible()) {
      return InversionResult{.point = guess, .iterations = iter, .residual_um = residual, .status = Status::DistortionInversionFailed};
    }
    const Eigen::Vector2d step = lu.solve(Eigen::Vector2d(distorted.x_um - forward.x_um, distorted.y_um - forward.y_um));
    guess.x_um += step.x();
    guess.y_um += step.y();
  }
  return InversionResult{
      .point = guess, .iterations = inversion_.max_iterations, .residual_um = residual, .status = Status::DistortionInversionFailed};
}

FocalBatch DistortionModel::apply_batch(const std::vector<FocalPoint>& ideal) const {
  FocalBatch out{};
  out.samples.reserve(ideal.size());
  for (const auto& p : ideal) {
    FocalSample s{};
    if (!warpfield::core::is_finite(p)) {
      s.status = Status::InvalidInput;
    } else {
      s.point = apply(p);
      s.status = warpfield::core::is_finite(s.point) ? Status::Ok : Status::NumericalError;
    }
    if (s.status != Status::Ok) {
      ++out.failed_count;
    }
    out.samples.push_back(s);
  }
  return out;
}

FocalBatch DistortionModel::invert_batch(const std::vector<FocalPoint>& distorted) const {
  FocalBatch out{};
  out.samples.reserve(distorted.size());
  for (const auto& p : distorted) {
    const auto r = invert(p);
    if (r.status != Status::Ok) {
      ++out.failed_count;
    }
    out.samples.push_back(FocalSample{.point = r.point, .status = r.status});
  }
  return out;
}

std::vector<warpfield::core::Mat2> DistortionModel::jacobian_batch(const std::vector<FocalPoint>& ideal) const {
  std::vector<warpfield::core::Mat2> out;
  out.reserve(ideal.size());
  for (const auto& p : ideal) {
    out.push_back(jacobian(p));
  }
  return out;
}

InversionResult IdentityDistortion::invert(const FocalPoint& distorted) const {
  if (!warpfield::core::is_finite(distorted)) {
    return InversionResult{.point = distorted, .status = Status::InvalidInput};
  }
  return InversionResult{.point = distorted, .status = Status::Ok};
}

}  // namespace warpfield::distortion
