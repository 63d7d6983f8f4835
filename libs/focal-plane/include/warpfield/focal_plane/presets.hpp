/**
 * @file presets.hpp
 * @brief Reference instrument layouts.
 * @author Watosn
 */
#pragma once

#include "warpfield/focal_plane/focal_plane_geometry.hpp"
#include "warpfield/focal_plane/optics.hpp"

namespace warpfield::focal_plane {

/**
 * @brief JASMINE-like optics: 7.3 m focal length, 0.4 m aperture, 30 mm field radius.
 */
[[nodiscard]] Optics jasmine_optics();

/**
 * @brief 3x3 mosaic of 1280x1280, 15 um pixel detectors on a 20 mm stride.
 *
 * Ids 0..8 run along +x first, starting from the (-20 mm, -20 mm) corner.
 */
[[nodiscard]] FocalPlaneGeometry::Config jasmine_geometry_config();

}  // namespace warpfield::focal_plane
