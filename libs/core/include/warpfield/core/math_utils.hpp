/**
 * @file math_utils.hpp
 * @brief Small 2x2 matrix and angle helpers.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cmath>
#include <cstddef>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/types.hpp"

namespace warpfield::core {

/**
 * @brief Dense 2x2 matrix in row-major storage.
 */
struct Mat2 {
  std::array<double, 4> v{};
  [[nodiscard]] double& operator()(const int r, const int c) { return v[static_cast<std::size_t>(r * 2 + c)]; }
  [[nodiscard]] double operator()(const int r, const int c) const { return v[static_cast<std::size_t>(r * 2 + c)]; }
};

inline Mat2 mat2_identity() {
  Mat2 m{};
  m(0, 0) = 1.0;
  m(1, 1) = 1.0;
  return m;
}

inline Mat2 mat2_mul(const Mat2& a, const Mat2& b) {
  Mat2 c{};
  for (int r = 0; r < 2; ++r) {
    for (int col = 0; col < 2; ++col) {
      c(r, col) = a(r, 0) * b(0, col) + a(r, 1) * b(1, col);
    }
  }
  return c;
}

inline Mat2 mat2_scale(double s, const Mat2& a) {
  Mat2 c{};
  for (std::size_t i = 0; i < 4; ++i) {
    c.v[i] = s * a.v[i];
  }
  return c;
}

/**
 * @brief Counter-clockwise rotation by `angle_rad`.
 */
inline Mat2 rotation2(double angle_rad) {
  const double c = std::cos(angle_rad);
  const double s = std::sin(angle_rad);
  Mat2 m{};
  m(0, 0) = c;
  m(0, 1) = -s;
  m(1, 0) = s;
  m(1, 1) = c;
  return m;
}

inline bool is_finite(const Mat2& m) {
  return std::isfinite(m.v[0]) && std::isfinite(m.v[1]) && std::isfinite(m.v[2]) && std::isfinite(m.v[3]);
}

inline bool is_finite(const FocalPoint& p) { return std::isfinite(p.x_um) && std::isfinite(p.y_um); }

/**
 * @brief Wrap an angle in degrees into [0, 360).
 */
inline double wrap_deg_360(double deg) {
  double out = std::fmod(deg, 360.0);
  if (out < 0.0) {
    out += 360.0;
  }
  if (out >= 360.0) {
    out -= 360.0;
  }
  return out;
}

}  // namespace warpfield::core
