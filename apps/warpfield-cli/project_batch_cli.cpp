/**
 * @file project_batch_cli.cpp
 * @brief Batch sky -> detector pixel CLI.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "warpfield/core/errors.hpp"
#include "warpfield/instrument/instrument_file.hpp"

namespace {

bool parse_sky_row(const std::string& line, warpfield::core::SkyCoord& out) {
  std::stringstream ss(line);
  std::string tok;
  std::vector<double> values;
  while (std::getline(ss, tok, ',')) {
    if (tok.empty()) {
      return false;
    }
    char* end = nullptr;
    const double v = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str() || *end != '\0') {
      return false;
    }
    values.push_back(v);
  }
  if (values.size() != 2U) {
    return false;
  }
  out = warpfield::core::SkyCoord{.lon_deg = values[0], .lat_deg = values[1]};
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4 || argc > 5) {
    spdlog::error("usage: warpfield_project_cli <instrument_file> <input_csv> <output_csv> [with_jacobian:0|1]");
    spdlog::error("input row: lon_deg,lat_deg");
    return 1;
  }

  const std::filesystem::path instrument_file = argv[1];
  const std::filesystem::path input_csv = argv[2];
  const std::filesystem::path output_csv = argv[3];
  const bool with_jacobian = (argc >= 5) ? (std::atoi(argv[4]) != 0) : false;

  std::unique_ptr<warpfield::engine::ProjectionEngine> engine;
  try {
    engine = warpfield::instrument::make_engine(warpfield::instrument::load_instrument_file(instrument_file));
  } catch (const warpfield::core::ModelConfigurationError& e) {
    spdlog::error("invalid instrument: {}", e.what());
    return 2;
  }

  std::ifstream in(input_csv);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_csv.string());
    return 3;
  }

  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 4;
  }

  std::vector<warpfield::core::SkyCoord> coords;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    warpfield::core::SkyCoord row{};
    if (!parse_sky_row(line, row)) {
      if (line_no == 1 && line.find("lon_deg") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }
    coords.push_back(row);
  }

  const auto batch = engine->sky_to_pixel(coords, {.with_jacobian = with_jacobian});

  out << "lon_deg,lat_deg,detector_id,px,py,focal_x_um,focal_y_um";
  if (with_jacobian) {
    out << ",dpx_dlon,dpx_dlat,dpy_dlon,dpy_dlat";
  }
  out << ",status\n";

  for (std::size_t i = 0; i < coords.size(); ++i) {
    const auto& r = batch.results[i];
    const int id = r.detector_id.value_or(-1);
    out << fmt::format("{:.12f},{:.12f},{},{:.6f},{:.6f},{:.6f},{:.6f}", coords[i].lon_deg, coords[i].lat_deg, id,
                       r.pixel.x, r.pixel.y, r.focal_um.x_um, r.focal_um.y_um);
    if (with_jacobian) {
      const auto j = r.jacobian.value_or(warpfield::core::Mat2{});
      out << fmt::format(",{:.12e},{:.12e},{:.12e},{:.12e}", j(0, 0), j(0, 1), j(1, 0), j(1, 1));
    }
    out << fmt::format(",{}\n", warpfield::core::to_string(r.status));
  }

  const auto& s = batch.summary;
  spdlog::info("projected {} sources: assigned={} unassigned={} outside_fov={} failed={}", coords.size(), s.assigned,
               s.unassigned, s.outside_fov, s.failed());
  spdlog::info("wrote projection output: {}", output_csv.string());
  return 0;
}
