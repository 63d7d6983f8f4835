/**
 * @file instrument_file.hpp
 * @brief Plain-text instrument description loader.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <istream>
#include <memory>

#include "warpfield/attitude/attitude_model.hpp"
#include "warpfield/distortion/distortion_model.hpp"
#include "warpfield/engine/projection_engine.hpp"
#include "warpfield/focal_plane/focal_plane_geometry.hpp"
#include "warpfield/focal_plane/optics.hpp"

namespace warpfield::instrument {

/**
 * @brief Everything needed to build a ProjectionEngine.
 */
struct InstrumentDescription {
  warpfield::attitude::Pointing pointing{};
  warpfield::focal_plane::Optics optics{};
  warpfield::focal_plane::FocalPlaneGeometry::Config geometry{};
  std::shared_ptr<const warpfield::distortion::DistortionModel> distortion{};
};

/**
 * @brief Parse an instrument description.
 *
 * One whitespace-separated record per line; `#` starts a comment.
 *
 *   pointing icrs|galactic <lon_deg> <lat_deg> <pa_deg> [epoch_jyear]
 *   optics <focal_length_um> <aperture_um> <fov_radius_um>
 *   surface <pupil_distance_um> <curvature_per_um> <tilt_x_rad> <tilt_y_rad>
 *   distortion identity
 *   distortion polynomial <order> <center_x_um> <center_y_um>
 *   distortion radial <center_x_um> <center_y_um> <numerator_order> <denominator_order>
 *   inversion <max_iterations> <tolerance_um>
 *   a|b|numerator|denominator <c0> <c1> ...
 *   detector <id> <center_x_um> <center_y_um> <rotation_deg> [pixel_scale_um width height]
 *   preset jasmine
 *
 * Coefficient records append, so long series may span several lines.
 *
 * @throws warpfield::core::ModelConfigurationError naming the offending line,
 * or when the assembled distortion model is inconsistent.
 */
[[nodiscard]] InstrumentDescription parse_instrument(std::istream& in);

/**
 * @throws warpfield::core::ModelConfigurationError when the file cannot be
 * opened or does not parse.
 */
[[nodiscard]] InstrumentDescription load_instrument_file(const std::filesystem::path& path);

/**
 * @brief Build the engine described by `desc`.
 */
[[nodiscard]] std::unique_ptr<warpfield::engine::ProjectionEngine> make_engine(const InstrumentDescription& desc);

}  // namespace warpfield::instrument
