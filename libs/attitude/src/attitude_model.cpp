/**
 * @file attitude_model.cpp
 * @brief Gnomonic tangent-plane projection implementation.
 * @author Watosn
 */

#include "warpfield/attitude/attitude_model.hpp"

#include <cmath>

#include <fmt/format.h>

#include "warpfield/core/errors.hpp"
#include "warpfield/core/sphere.hpp"
#include "warpfield/source/source_catalog.hpp"

namespace warpfield::attitude {
namespace {

using warpfield::core::Mat2;
using warpfield::core::SkyCoord;
using warpfield::core::Status;
using warpfield::core::TangentPoint;
using warpfield::core::unit_vector;
namespace constants = warpfield::core::constants;

bool finite_coord(const SkyCoord& c) { return std::isfinite(c.lon_deg) && std::isfinite(c.lat_deg); }

Eigen::Vector2d mat_vec(const Mat2& m, double x, double y) {
  return Eigen::Vector2d(m(0, 0) * x + m(0, 1) * y, m(1, 0) * x + m(1, 1) * y);
}

}  // namespace

AttitudeModel::AttitudeModel(const Pointing& pointing) : pointing_(pointing) {
  if (!std::isfinite(pointing.ra_deg) || !std::isfinite(pointing.dec_deg) || !std::isfinite(pointing.position_angle_deg) ||
      !std::isfinite(pointing.epoch_jyear)) {
    throw warpfield::core::ModelConfigurationError("pointing has non-finite ra/dec/position angle/epoch");
  }
  if (std::abs(pointing.dec_deg) > 90.0) {
    throw warpfield::core::ModelConfigurationError(fmt::format("pointing declination out of range: {}", pointing.dec_deg));
  }

  const double a0 = pointing.ra_deg * constants::kDegToRad;
  const double d0 = pointing.dec_deg * constants::kDegToRad;
  const Eigen::Vector3d east(-std::sin(a0), std::cos(a0), 0.0);
  const Eigen::Vector3d north(-std::sin(d0) * std::cos(a0), -std::sin(d0) * std::sin(a0), std::cos(d0));
  const Eigen::Vector3d bore = unit_vector(a0, d0);
  local_from_icrs_.row(0) = east.transpose();
  local_from_icrs_.row(1) = north.transpose();
  local_from_icrs_.row(2) = bore.transpose();

  const double pa = pointing.position_angle_deg * constants::kDegToRad;
  roll_ = warpfield::core::rotation2(pa);
  unroll_ = warpfield::core::rotation2(-pa);
}

TangentSample AttitudeModel::to_tangent_plane(const SkyCoord& coord) const {
  if (!finite_coord(coord)) {
    return TangentSample{.status = Status::InvalidInput};
  }
  const Eigen::Vector3d local = local_from_icrs_ * unit_vector(coord);
  if (!(local.z() > constants::kHemisphereEpsilon)) {
    return TangentSample{.status = Status::ProjectionSingularity};
  }
  const double xi = local.x() / local.z();
  const double eta = local.y() / local.z();
  const Eigen::Vector2d xy = mat_vec(roll_, -xi, eta);
  return TangentSample{.point = TangentPoint{.x_rad = xy.x(), .y_rad = xy.y()}, .status = Status::Ok};
}

TangentBatch AttitudeModel::to_tangent_plane(const std::vector<SkyCoord>& coords) const {
  TangentBatch out{};
  out.samples.reserve(coords.size());
  for (const auto& c : coords) {
    const auto s = to_tangent_plane(c);
    if (s.status == Status::ProjectionSingularity) {
      ++out.singular_count;
    } else if (s.status != Status::Ok) {
      ++out.invalid_count;
    }
    out.samples.push_back(s);
  }
  return out;
}

SkySample AttitudeModel::to_sky(const TangentPoint& point) const {
  if (!std::isfinite(point.x_rad) || !std::isfinite(point.y_rad)) {
    return SkySample{.status = Status::InvalidInput};
  }
  const Eigen::Vector2d unrolled = mat_vec(unroll_, point.x_rad, point.y_rad);
  const Eigen::Vector3d local(-unrolled.x(), unrolled.y(), 1.0);
  const Eigen::Vector3d s = (local_from_icrs_.transpose() * local).normalized();
  return SkySample{.coord = warpfield::core::from_unit_vector(s), .status = Status::Ok};
}

SkyBatch AttitudeModel::to_sky(const std::vector<TangentPoint>& points) const {
  SkyBatch out{};
  out.samples.reserve(points.size());
  for (const auto& p : points) {
    const auto s = to_sky(p);
    if (s.status != Status::Ok) {
      ++out.invalid_count;
    }
    out.samples.push_back(s);
  }
  return out;
}

Mat2 AttitudeModel::jacobian(const SkyCoord& coord) const {
  const double a = coord.lon_deg * constants::kDegToRad;
  const double d = coord.lat_deg * constants::kDegToRad;
  const Eigen::Vector3d l = local_from_icrs_ * unit_vector(a, d);
  if (!(l.z() > constants::kHemisphereEpsilon)) {
    return Mat2{};
  }
  const Eigen::Vector3d ds_da(-std::cos(d) * std::sin(a), std::cos(d) * std::cos(a), 0.0);
  const Eigen::Vector3d ds_dd(-std::sin(d) * std::cos(a), -std::sin(d) * std::sin(a), std::cos(d));
  const Eigen::Vector3d dl_da = local_from_icrs_ * ds_da;
  const Eigen::Vector3d dl_dd = local_from_icrs_ * ds_dd;

  const double z2 = l.z() * l.z();
  Mat2 unrolled{};
  // Columns: d/dlon, d/dlat. Rows: -xi, eta.
  unrolled(0, 0) = -(dl_da.x() * l.z() - l.x() * dl_da.z()) / z2;
  unrolled(0, 1) = -(dl_dd.x() * l.z() - l.x() * dl_dd.z()) / z2;
  unrolled(1, 0) = (dl_da.y() * l.z() - l.y() * dl_da.z()) / z2;
  unrolled(1, 1) = (dl_dd.y() * l.z() - l.y() * dl_dd.z()) / z2;
  return warpfield::core::mat2_mul(roll_, unrolled);
}

TangentBatch to_tangent_plane(const std::vector<SkyCoord>& coords, const Pointing& pointing) {
  return AttitudeModel(pointing).to_tangent_plane(coords);
}

SkyBatch to_sky(const std::vector<TangentPoint>& points, const Pointing& pointing) {
  return AttitudeModel(pointing).to_sky(points);
}

double separation_deg(const SkyCoord& a, const SkyCoord& b) {
  const Eigen::Vector3d va = unit_vector(a);
  const Eigen::Vector3d vb = unit_vector(b);
  return std::atan2(va.cross(vb).norm(), va.dot(vb)) * constants::kRadToDeg;
}

double position_angle_deg(const SkyCoord& from, const SkyCoord& to) {
  const double d1 = from.lat_deg * constants::kDegToRad;
  const double d2 = to.lat_deg * constants::kDegToRad;
  const double da = (to.lon_deg - from.lon_deg) * constants::kDegToRad;
  const double pa = std::atan2(std::sin(da) * std::cos(d2), std::cos(d1) * std::sin(d2) - std::sin(d1) * std::cos(d2) * std::cos(da));
  return warpfield::core::wrap_deg_360(pa * constants::kRadToDeg);
}

Pointing pointing_from_galactic(const SkyCoord& galactic_center, double position_angle_deg_gal, double epoch_jyear) {
  const SkyCoord center = warpfield::source::galactic_to_icrs(galactic_center);
  const SkyCoord galactic_pole = warpfield::source::galactic_to_icrs(SkyCoord{.lon_deg = 0.0, .lat_deg = 90.0});
  const double dpa = position_angle_deg(center, galactic_pole);
  return Pointing{
      .ra_deg = center.lon_deg,
      .dec_deg = center.lat_deg,
      .position_angle_deg = warpfield::core::wrap_deg_360(position_angle_deg_gal - dpa),
      .epoch_jyear = epoch_jyear,
  };
}

}  // namespace warpfield::attitude
