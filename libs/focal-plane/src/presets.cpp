/**
 * @file presets.cpp
 * @brief Reference instrument layouts.
 * @author Watosn
 */

#include "warpfield/focal_plane/presets.hpp"

namespace warpfield::focal_plane {

Optics jasmine_optics() {
  return Optics{.focal_length_um = 7.3e6, .aperture_diameter_um = 4.0e5, .fov_radius_um = 3.0e4};
}

FocalPlaneGeometry::Config jasmine_geometry_config() {
  constexpr double kStrideUm = 20000.0;
  FocalPlaneGeometry::Config config{};
  int id = 0;
  for (int iy = -1; iy <= 1; ++iy) {
    for (int ix = -1; ix <= 1; ++ix) {
      config.detectors.push_back(Detector{
          .id = id++,
          .center_um = warpfield::core::FocalPoint{ix * kStrideUm, iy * kStrideUm},
          .rotation_deg = 0.0,
          .pixel_scale_um = 15.0,
          .pixel_width = 1280,
          .pixel_height = 1280,
      });
    }
  }
  return config;
}

}  // namespace warpfield::focal_plane
