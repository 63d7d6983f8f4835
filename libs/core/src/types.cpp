/**
 * @file types.cpp
 * @brief Core type helpers.
 * @author Watosn
 */

#include "warpfield/core/types.hpp"

namespace warpfield::core {

const char* to_string(Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::ProjectionSingularity:
      return "projection_singularity";
    case Status::DistortionInversionFailed:
      return "distortion_inversion_failed";
    case Status::Unassigned:
      return "unassigned";
    case Status::OutsideFieldOfView:
      return "outside_fov";
    case Status::NumericalError:
      return "numerical_error";
  }
  return "unknown";
}

}  // namespace warpfield::core
