/**
 * @file deproject_batch_cli.cpp
 * @brief Batch detector pixel -> sky CLI.
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

struct PixelRow {
  int detector_id{};
  warpfield::core::PixelPoint pixel{};
};

bool parse_pixel_row(const std::string& line, PixelRow& out) {
  std::stringstream ss(line);
  std::string tok;
  std::vector<std::string> tokens;
  while (std::getline(ss, tok, ',')) {
    if (tok.empty()) {
      return false;
    }
    tokens.push_back(tok);
  }
  if (tokens.size() != 3U) {
    return false;
  }
  char* end = nullptr;
  const long id = std::strtol(tokens[0].c_str(), &end, 10);
  if (end == tokens[0].c_str() || *end != '\0') {
    return false;
  }
  double px[2]{};
  for (std::size_t i = 0; i < 2U; ++i) {
    const char* s = tokens[i + 1U].c_str();
    px[i] = std::strtod(s, &end);
    if (end == s || *end != '\0') {
      return false;
    }
  }
  out.detector_id = static_cast<int>(id);
  out.pixel = warpfield::core::PixelPoint{.x = px[0], .y = px[1]};
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 4) {
    spdlog::error("usage: warpfield_deproject_cli <instrument_file> <input_csv> <output_csv>");
    spdlog::error("input row: detector_id,px,py");
    return 1;
  }

  const std::filesystem::path instrument_file = argv[1];
  const std::filesystem::path input_csv = argv[2];
  const std::filesystem::path output_csv = argv[3];

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

  out << "detector_id,px,py,lon_deg,lat_deg,status\n";

  std::string line;
  std::size_t line_no = 0;
  std::size_t rows = 0;
  std::size_t failed = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    PixelRow row{};
    if (!parse_pixel_row(line, row)) {
      if (line_no == 1 && line.find("detector_id") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }

    const auto batch = engine->pixel_to_sky(row.detector_id, {row.pixel});
    const auto& r = batch.results.front();
    ++rows;
    if (warpfield::core::is_failure(r.status)) {
      ++failed;
    }
    out << fmt::format("{},{:.6f},{:.6f},{:.12f},{:.12f},{}\n", row.detector_id, row.pixel.x, row.pixel.y, r.coord.lon_deg,
                       r.coord.lat_deg, warpfield::core::to_string(r.status));
  }

  spdlog::info("deprojected {} pixels, {} failed", rows, failed);
  spdlog::info("wrote deprojection output: {}", output_csv.string());
  return 0;
}
