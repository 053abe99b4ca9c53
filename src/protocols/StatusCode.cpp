/* @file StatusCode.cpp
 * @brief text form of the actuator status taxonomy
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <utility>

// Elero headers
#include "protocols/StatusCode.hpp"

namespace elero {
  namespace protocols {

    namespace {
      constexpr std::array<std::pair<StatusCode, const char*>, 17> kStatusNames{ {
          { StatusCode::NoInformation, "no information" },
          { StatusCode::TopPositionStop, "top position stop" },
          { StatusCode::BottomPositionStop, "bottom position stop" },
          { StatusCode::IntermediatePositionStop, "intermediate position stop" },
          { StatusCode::TiltVentilationPosStop, "tilt ventilation position stop" },
          { StatusCode::Blocking, "blocking" },
          { StatusCode::Overheated, "overheated" },
          { StatusCode::Timeout, "timeout" },
          { StatusCode::StartToMoveUp, "start to move up" },
          { StatusCode::StartToMoveDown, "start to move down" },
          { StatusCode::MovingUp, "moving up" },
          { StatusCode::MovingDown, "moving down" },
          { StatusCode::StoppedInUndefinedPosition, "stopped in undefined position" },
          { StatusCode::TopPosStopWithTiltPos, "top position stop wich is tilt position" },
          { StatusCode::BottomPosStopWithIntPos,
            "bottom position stop wich is intermediate position" },
          { StatusCode::SwitchingDeviceOff, "switching device switched off" },
          { StatusCode::SwitchingDeviceOn, "switching device switched on" },
      } };
    } // namespace

    const char* toString(StatusCode code) {
      for (const auto& [value, name] : kStatusNames) {
        if (value == code)
          return name;
      }
      return "unknown response";
    }

    std::optional<StatusCode> statusFromString(std::string_view text) {
      for (const auto& [value, name] : kStatusNames) {
        if (text == name)
          return value;
      }
      return std::nullopt;
    }

    bool isDeviceFault(StatusCode code) {
      return code == StatusCode::Blocking || code == StatusCode::Overheated ||
             code == StatusCode::Timeout;
    }

  } // namespace protocols
} // namespace elero
