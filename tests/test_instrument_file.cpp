/**
 * @file test_instrument_file.cpp
 * @brief Instrument description parsing and configuration error checks.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "warpfield/core/errors.hpp"
#include "warpfield/distortion/polynomial_distortion.hpp"
#include "warpfield/distortion/radial_distortion.hpp"
#include "warpfield/instrument/instrument_file.hpp"

namespace {

constexpr const char* kPolynomialInstrument = R"(# test bench
pointing icrs 40.0 -30.0 20.0 2010.5
optics 7.3e6 4.0e5 3.0e4   # jasmine-like
surface 7.3e6 2.0e-7 2.0e-4 0.0

distortion polynomial 2 10.0 -5.0
inversion 30 1e-8
a 1.0e-4 2.0e-5
a 3.0e-9 -1.0e-9 2.0e-9
b -3.0e-5 1.5e-4 -2.0e-9 4.0e-9 1.0e-9
detector 0 -20000 0 0.0
detector 1 0 0 0.0 15.0 1280 1280
detector 2 20000 0 90.0 10.0 2048 1024
)";

// Returns the error message, or an empty string when parsing succeeded.
std::string parse_error(const std::string& text) {
  std::istringstream in(text);
  try {
    (void)warpfield::instrument::parse_instrument(in);
  } catch (const warpfield::core::ModelConfigurationError& e) {
    return e.what();
  }
  return {};
}

bool contains(const std::string& s, const std::string& needle) { return s.find(needle) != std::string::npos; }

}  // namespace

int main() {
  std::istringstream in(kPolynomialInstrument);
  const auto desc = warpfield::instrument::parse_instrument(in);
  if (desc.pointing.ra_deg != 40.0 || desc.pointing.dec_deg != -30.0 || desc.pointing.position_angle_deg != 20.0 ||
      desc.pointing.epoch_jyear != 2010.5) {
    spdlog::error("pointing record mismatch");
    return 1;
  }
  if (desc.optics.focal_length_um != 7.3e6 || desc.optics.fov_radius_um != 3.0e4 || desc.geometry.surface.curvature_per_um != 2.0e-7) {
    spdlog::error("optics/surface record mismatch");
    return 2;
  }
  if (desc.geometry.detectors.size() != 3U || desc.geometry.detectors[0].pixel_scale_um != 15.0 ||
      desc.geometry.detectors[2].pixel_width != 2048 || desc.geometry.detectors[2].rotation_deg != 90.0) {
    spdlog::error("detector records mismatch");
    return 3;
  }
  const auto* poly = dynamic_cast<const warpfield::distortion::PolynomialDistortion*>(desc.distortion.get());
  if (poly == nullptr || poly->config().order != 2 || poly->config().a.size() != 5U || poly->config().a[2] != 3.0e-9 ||
      poly->config().center_um.x_um != 10.0 || poly->inversion_config().max_iterations != 30 ||
      poly->inversion_config().tolerance_um != 1e-8) {
    spdlog::error("polynomial distortion records mismatch");
    return 4;
  }

  const auto engine = warpfield::instrument::make_engine(desc);
  const auto hit = engine->sky_to_pixel(std::vector<warpfield::core::SkyCoord>{{.lon_deg = 40.0, .lat_deg = -30.0}});
  if (hit.results[0].status != warpfield::core::Status::Ok || hit.results[0].detector_id != 1) {
    spdlog::error("engine from instrument should put the boresight on detector 1");
    return 5;
  }

  std::istringstream radial_in(R"(
pointing galactic 30.0 5.0 0.0
preset jasmine
distortion radial 0 0 1 1
numerator 1e-10
denominator 2e-11
)");
  const auto radial_desc = warpfield::instrument::parse_instrument(radial_in);
  const auto gal = warpfield::attitude::pointing_from_galactic({.lon_deg = 30.0, .lat_deg = 5.0}, 0.0);
  if (radial_desc.pointing.ra_deg != gal.ra_deg || radial_desc.pointing.position_angle_deg != gal.position_angle_deg ||
      radial_desc.geometry.detectors.size() != 9U || radial_desc.optics.fov_radius_um != 3.0e4 ||
      dynamic_cast<const warpfield::distortion::RadialDistortion*>(radial_desc.distortion.get()) == nullptr) {
    spdlog::error("galactic/preset/radial records mismatch");
    return 6;
  }

  std::istringstream bare_in("pointing icrs 0 0 0\ndetector 0 0 0 0\n");
  const auto bare = warpfield::instrument::parse_instrument(bare_in);
  if (dynamic_cast<const warpfield::distortion::IdentityDistortion*>(bare.distortion.get()) == nullptr) {
    spdlog::error("missing distortion record should give identity");
    return 7;
  }

  const std::string unknown = parse_error("pointing icrs 0 0 0\nwobble 1 2\n");
  if (!contains(unknown, "line 2") || !contains(unknown, "wobble")) {
    spdlog::error("unknown record error should name line 2: '{}'", unknown);
    return 8;
  }
  const std::string bad_number = parse_error("pointing icrs 0 abc 0\n");
  if (!contains(bad_number, "line 1") || !contains(bad_number, "abc")) {
    spdlog::error("bad number error should name line 1: '{}'", bad_number);
    return 9;
  }
  const std::string count = parse_error("pointing icrs 0 0 0\n\ndistortion polynomial 2 0 0\na 1 2 3\nb 1 2 3 4 5\ndetector 0 0 0 0\n");
  if (!contains(count, "line 3") || !contains(count, "coefficients")) {
    spdlog::error("coefficient mismatch should point at the distortion record: '{}'", count);
    return 10;
  }
  if (parse_error("detector 0 0 0 0\n").empty() || parse_error("pointing icrs 0 0 0\n").empty() ||
      parse_error("pointing icrs 0 0 0\npreset hubble\n").empty() || parse_error("pointing fk4 0 0 0\n").empty() ||
      parse_error("pointing icrs 0 0 0\ndetector 0 0 0\n").empty() || parse_error("pointing icrs 0 0 0\noptics 1 2\n").empty()) {
    spdlog::error("incomplete or malformed instruments should be rejected");
    return 11;
  }

  bool threw = false;
  try {
    (void)warpfield::instrument::load_instrument_file("/nonexistent/warpfield/instrument.txt");
  } catch (const warpfield::core::ModelConfigurationError&) {
    threw = true;
  }
  if (!threw) {
    spdlog::error("missing instrument file should be rejected");
    return 12;
  }

  const auto path = std::filesystem::temp_directory_path() / "warpfield_test_instrument.txt";
  {
    std::ofstream out(path);
    out << kPolynomialInstrument;
  }
  const auto loaded = warpfield::instrument::load_instrument_file(path);
  std::filesystem::remove(path);
  if (loaded.geometry.detectors.size() != 3U || loaded.pointing.epoch_jyear != 2010.5) {
    spdlog::error("file loader mismatch");
    return 13;
  }

  std::istringstream preset_in("pointing icrs 0 0 0\nsurface 7.3e6 2e-7 0 0\npreset jasmine\ndetector 99 0 0 0\n");
  const auto preset = warpfield::instrument::parse_instrument(preset_in);
  if (preset.geometry.surface.curvature_per_um != 2e-7 || preset.geometry.detectors.size() != 10U ||
      preset.geometry.detectors.back().id != 99) {
    spdlog::error("preset should keep the surface record and accept later detectors");
    return 14;
  }
  const std::string late_preset = parse_error("pointing icrs 0 0 0\ndetector 99 0 0 0\npreset jasmine\n");
  const std::string preset_after_optics = parse_error("pointing icrs 0 0 0\noptics 7e6 1e5 0\npreset jasmine\n");
  if (!contains(late_preset, "line 3") || !contains(late_preset, "preset") || preset_after_optics.empty()) {
    spdlog::error("preset after optics or detector records should be rejected: '{}'", late_preset);
    return 15;
  }

  const std::string stray_ab = parse_error("pointing icrs 0 0 0\ndistortion identity\na 1e-4 2e-5\ndetector 0 0 0 0\n");
  const std::string stray_radial =
      parse_error("pointing icrs 0 0 0\ndistortion polynomial 1 0 0\nnumerator 1 0\ndetector 0 0 0 0\n");
  const std::string undeclared = parse_error("pointing icrs 0 0 0\nb 1 2 3\ndetector 0 0 0 0\n");
  const std::string stray_poly = parse_error(
      "pointing icrs 0 0 0\ndistortion radial 0 0 1 0\nnumerator 1 0\ndenominator 1\na 1\ndetector 0 0 0 0\n");
  if (!contains(stray_ab, "line 3") || !contains(stray_ab, "identity") || !contains(stray_radial, "polynomial") ||
      undeclared.empty() || !contains(stray_poly, "line 5")) {
    spdlog::error("coefficients not matching the distortion kind should be rejected");
    return 16;
  }

  const std::string wide_id = parse_error("pointing icrs 0 0 0\ndetector 4294967296 0 0 0\n");
  if (!contains(wide_id, "out of range") || parse_error("pointing icrs 0 0 0\ndetector -2147483648 0 0 0\n") != "") {
    spdlog::error("detector ids outside int range should be rejected: '{}'", wide_id);
    return 17;
  }

  return 0;
}
