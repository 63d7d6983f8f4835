/**
 * @file instrument_file.cpp
 * @brief Instrument description parser.
 * @author Watosn
 */

#include "warpfield/instrument/instrument_file.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "warpfield/core/constants.hpp"
#include "warpfield/core/errors.hpp"
#include "warpfield/core/types.hpp"
#include "warpfield/distortion/polynomial_distortion.hpp"
#include "warpfield/distortion/radial_distortion.hpp"
#include "warpfield/focal_plane/presets.hpp"

namespace warpfield::instrument {
namespace {

using warpfield::core::ModelConfigurationError;

enum class DistortionKind { Identity, Polynomial, Radial };

struct PendingDistortion {
  DistortionKind kind{DistortionKind::Identity};
  warpfield::distortion::PolynomialDistortion::Config polynomial{};
  warpfield::distortion::RadialDistortion::Config radial{};
  warpfield::distortion::InversionConfig inversion{};
  std::size_t declared_on{};
  // First line of an a/b and of a numerator/denominator record; 0 when absent.
  std::size_t polynomial_coeffs_on{};
  std::size_t radial_coeffs_on{};
};

const char* kind_name(DistortionKind kind) {
  switch (kind) {
    case DistortionKind::Polynomial:
      return "polynomial";
    case DistortionKind::Radial:
      return "radial";
    case DistortionKind::Identity:
      break;
  }
  return "identity";
}

std::vector<std::string> split_tokens(const std::string& line) {
  std::string body = line;
  const auto hash = body.find('#');
  if (hash != std::string::npos) {
    body.erase(hash);
  }
  std::stringstream ss(body);
  std::vector<std::string> tokens;
  std::string tok;
  while (ss >> tok) {
    tokens.push_back(tok);
  }
  return tokens;
}

double parse_double(const std::string& tok, std::size_t line_no) {
  char* end = nullptr;
  const double v = std::strtod(tok.c_str(), &end);
  if (end == tok.c_str() || *end != '\0' || !std::isfinite(v)) {
    throw ModelConfigurationError(fmt::format("line {}: '{}' is not a finite number", line_no, tok));
  }
  return v;
}

int parse_int(const std::string& tok, std::size_t line_no) {
  char* end = nullptr;
  errno = 0;
  const long v = std::strtol(tok.c_str(), &end, 10);
  if (end == tok.c_str() || *end != '\0') {
    throw ModelConfigurationError(fmt::format("line {}: '{}' is not an integer", line_no, tok));
  }
  if (errno == ERANGE || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    throw ModelConfigurationError(fmt::format("line {}: integer '{}' is out of range", line_no, tok));
  }
  return static_cast<int>(v);
}

void expect_arity(const std::vector<std::string>& tokens, std::size_t min_args, std::size_t max_args, std::size_t line_no) {
  const std::size_t args = tokens.size() - 1U;
  if (args < min_args || args > max_args) {
    throw ModelConfigurationError(
        fmt::format("line {}: '{}' takes {} to {} values, got {}", line_no, tokens[0], min_args, max_args, args));
  }
}

void append_coefficients(const std::vector<std::string>& tokens, std::vector<double>& out, std::size_t line_no) {
  if (tokens.size() < 2U) {
    throw ModelConfigurationError(fmt::format("line {}: '{}' record has no coefficients", line_no, tokens[0]));
  }
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    out.push_back(parse_double(tokens[i], line_no));
  }
}

void parse_pointing(const std::vector<std::string>& tokens, std::size_t line_no, warpfield::attitude::Pointing& out) {
  expect_arity(tokens, 4U, 5U, line_no);
  const double lon = parse_double(tokens[2], line_no);
  const double lat = parse_double(tokens[3], line_no);
  const double pa = parse_double(tokens[4], line_no);
  const double epoch = (tokens.size() == 6U) ? parse_double(tokens[5], line_no) : warpfield::core::constants::kJ2000JulianYear;
  if (tokens[1] == "icrs") {
    out = warpfield::attitude::Pointing{.ra_deg = lon, .dec_deg = lat, .position_angle_deg = pa, .epoch_jyear = epoch};
  } else if (tokens[1] == "galactic") {
    out = warpfield::attitude::pointing_from_galactic(warpfield::core::SkyCoord{.lon_deg = lon, .lat_deg = lat}, pa, epoch);
  } else {
    throw ModelConfigurationError(fmt::format("line {}: unknown pointing frame '{}'", line_no, tokens[1]));
  }
}

void parse_distortion(const std::vector<std::string>& tokens, std::size_t line_no, PendingDistortion& out) {
  if (tokens.size() < 2U) {
    throw ModelConfigurationError(fmt::format("line {}: distortion record needs a kind", line_no));
  }
  out.declared_on = line_no;
  const std::string& kind = tokens[1];
  if (kind == "identity") {
    expect_arity(tokens, 1U, 1U, line_no);
    out.kind = DistortionKind::Identity;
  } else if (kind == "polynomial") {
    expect_arity(tokens, 4U, 4U, line_no);
    out.kind = DistortionKind::Polynomial;
    out.polynomial.order = parse_int(tokens[2], line_no);
    out.polynomial.center_um = {parse_double(tokens[3], line_no), parse_double(tokens[4], line_no)};
  } else if (kind == "radial") {
    expect_arity(tokens, 5U, 5U, line_no);
    out.kind = DistortionKind::Radial;
    out.radial.center_um = {parse_double(tokens[2], line_no), parse_double(tokens[3], line_no)};
    out.radial.numerator_order = parse_int(tokens[4], line_no);
    out.radial.denominator_order = parse_int(tokens[5], line_no);
  } else {
    throw ModelConfigurationError(fmt::format("line {}: unknown distortion kind '{}'", line_no, kind));
  }
}

warpfield::focal_plane::Detector parse_detector(const std::vector<std::string>& tokens, std::size_t line_no) {
  if (tokens.size() != 5U && tokens.size() != 8U) {
    throw ModelConfigurationError(
        fmt::format("line {}: detector takes 4 or 7 values, got {}", line_no, tokens.size() - 1U));
  }
  warpfield::focal_plane::Detector d{};
  d.id = parse_int(tokens[1], line_no);
  d.center_um = {parse_double(tokens[2], line_no), parse_double(tokens[3], line_no)};
  d.rotation_deg = parse_double(tokens[4], line_no);
  if (tokens.size() == 8U) {
    d.pixel_scale_um = parse_double(tokens[5], line_no);
    d.pixel_width = parse_int(tokens[6], line_no);
    d.pixel_height = parse_int(tokens[7], line_no);
  }
  return d;
}

std::shared_ptr<const warpfield::distortion::DistortionModel> build_distortion(PendingDistortion pending) {
  if (pending.polynomial_coeffs_on != 0U && pending.kind != DistortionKind::Polynomial) {
    throw ModelConfigurationError(fmt::format("line {}: a/b coefficients given for a {} distortion",
                                              pending.polynomial_coeffs_on, kind_name(pending.kind)));
  }
  if (pending.radial_coeffs_on != 0U && pending.kind != DistortionKind::Radial) {
    throw ModelConfigurationError(fmt::format("line {}: numerator/denominator coefficients given for a {} distortion",
                                              pending.radial_coeffs_on, kind_name(pending.kind)));
  }
  try {
    switch (pending.kind) {
      case DistortionKind::Polynomial:
        pending.polynomial.inversion = pending.inversion;
        return warpfield::distortion::PolynomialDistortion::Create(pending.polynomial);
      case DistortionKind::Radial:
        pending.radial.inversion = pending.inversion;
        return warpfield::distortion::RadialDistortion::Create(pending.radial);
      case DistortionKind::Identity:
        break;
    }
  } catch (const ModelConfigurationError& e) {
    throw ModelConfigurationError(fmt::format("line {}: {}", pending.declared_on, e.what()));
  }
  return std::make_shared<const warpfield::distortion::IdentityDistortion>();
}

}  // namespace

InstrumentDescription parse_instrument(std::istream& in) {
  InstrumentDescription desc{};
  PendingDistortion pending{};
  bool have_pointing = false;
  bool have_optics = false;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto tokens = split_tokens(line);
    if (tokens.empty()) {
      continue;
    }
    const std::string& key = tokens[0];
    if (key == "pointing") {
      parse_pointing(tokens, line_no, desc.pointing);
      have_pointing = true;
    } else if (key == "optics") {
      expect_arity(tokens, 3U, 3U, line_no);
      desc.optics = warpfield::focal_plane::Optics{
          .focal_length_um = parse_double(tokens[1], line_no),
          .aperture_diameter_um = parse_double(tokens[2], line_no),
          .fov_radius_um = parse_double(tokens[3], line_no),
      };
      have_optics = true;
    } else if (key == "surface") {
      expect_arity(tokens, 4U, 4U, line_no);
      desc.geometry.surface = warpfield::focal_plane::FocalSurface{
          .pupil_distance_um = parse_double(tokens[1], line_no),
          .curvature_per_um = parse_double(tokens[2], line_no),
          .tilt_x_rad = parse_double(tokens[3], line_no),
          .tilt_y_rad = parse_double(tokens[4], line_no),
      };
    } else if (key == "distortion") {
      parse_distortion(tokens, line_no, pending);
    } else if (key == "inversion") {
      expect_arity(tokens, 2U, 2U, line_no);
      pending.inversion.max_iterations = parse_int(tokens[1], line_no);
      pending.inversion.tolerance_um = parse_double(tokens[2], line_no);
    } else if (key == "a" || key == "b") {
      append_coefficients(tokens, key == "a" ? pending.polynomial.a : pending.polynomial.b, line_no);
      if (pending.polynomial_coeffs_on == 0U) {
        pending.polynomial_coeffs_on = line_no;
      }
    } else if (key == "numerator" || key == "denominator") {
      append_coefficients(tokens, key == "numerator" ? pending.radial.numerator : pending.radial.denominator, line_no);
      if (pending.radial_coeffs_on == 0U) {
        pending.radial_coeffs_on = line_no;
      }
    } else if (key == "detector") {
      desc.geometry.detectors.push_back(parse_detector(tokens, line_no));
    } else if (key == "preset") {
      expect_arity(tokens, 1U, 1U, line_no);
      if (tokens[1] != "jasmine") {
        throw ModelConfigurationError(fmt::format("line {}: unknown preset '{}'", line_no, tokens[1]));
      }
      if (have_optics || !desc.geometry.detectors.empty()) {
        throw ModelConfigurationError(fmt::format("line {}: preset must precede optics and detector records", line_no));
      }
      // Keeps any surface record; later optics/detector records refine the preset.
      desc.optics = warpfield::focal_plane::jasmine_optics();
      desc.geometry.detectors = warpfield::focal_plane::jasmine_geometry_config().detectors;
    } else {
      throw ModelConfigurationError(fmt::format("line {}: unknown record '{}'", line_no, key));
    }
  }

  if (!have_pointing) {
    throw ModelConfigurationError("instrument description has no pointing record");
  }
  if (desc.geometry.detectors.empty()) {
    throw ModelConfigurationError("instrument description has no detector records");
  }
  desc.distortion = build_distortion(std::move(pending));
  return desc;
}

InstrumentDescription load_instrument_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw ModelConfigurationError(fmt::format("failed to open instrument file: {}", path.string()));
  }
  try {
    return parse_instrument(in);
  } catch (const ModelConfigurationError& e) {
    throw ModelConfigurationError(fmt::format("{}: {}", path.string(), e.what()));
  }
}

std::unique_ptr<warpfield::engine::ProjectionEngine> make_engine(const InstrumentDescription& desc) {
  return warpfield::engine::ProjectionEngine::Create({
      .pointing = desc.pointing,
      .optics = desc.optics,
      .distortion = desc.distortion,
      .geometry = warpfield::focal_plane::FocalPlaneGeometry::Create(desc.geometry),
  });
}

}  // namespace warpfield::instrument
