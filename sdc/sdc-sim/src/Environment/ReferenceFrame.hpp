#ifndef SDC_SIM_REFERENCE_FRAME_HPP
#define SDC_SIM_REFERENCE_FRAME_HPP

#include <array>
#include <cstddef>
#include <string_view>

namespace sdc_sim
{

/// Reference frames known to the library
enum class FrameId
{
  ECI,
  ECEF,
  LVLH,
  Body
};

/**
 * @brief Descriptive metadata of a reference frame
 *
 * Frames carry no state beyond this; the geometry between two frames is a
 * FrameTransform.
 */
struct FrameInfo
{
  std::string_view name;
  std::string_view description;
  std::string_view axes;
  bool inertial;
};

namespace detail
{

inline constexpr std::array<FrameInfo, 4> kFrameTable{{
  {"ECI",
   "Earth-Centered Inertial",
   "X: vernal equinox, Z: Earth rotation axis, Y: completes the "
   "right-handed set in the equatorial plane",
   true},
  {"ECEF",
   "Earth-Centered Earth-Fixed",
   "X: prime meridian, Z: Earth rotation axis, Y: 90 deg east in the "
   "equatorial plane",
   false},
  {"LVLH",
   "Local-Vertical Local-Horizontal",
   "X: radial (r/|r|), Y: transverse (h x r), Z: orbit normal (h/|h|)",
   false},
  {"Body",
   "Spacecraft body-fixed",
   "Principal axes of the spacecraft (roll, pitch, yaw)",
   false},
}};

}  // namespace detail

/// Metadata of a frame
constexpr const FrameInfo& frameInfo(FrameId id)
{
  return detail::kFrameTable[static_cast<std::size_t>(id)];
}

/// Short frame name ("ECI", "ECEF", "LVLH", "Body")
constexpr std::string_view toString(FrameId id)
{
  return frameInfo(id).name;
}

}  // namespace sdc_sim

#endif  // SDC_SIM_REFERENCE_FRAME_HPP
