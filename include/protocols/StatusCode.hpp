#pragma once
/** @file  StatusCode.hpp
 *  @brief Closed set of conditions an Elero actuator reports back over the radio.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string_view>

namespace elero {
  namespace protocols {

    /**
 * @enum StatusCode
 * @brief Actuator status as decoded by the Transmitter.
 *
 *  * Underlying values match the status byte of the stick protocol (0x0c is unused).
 *  * No numeric position is ever carried; see StatusReconciler for the mapping.
 */
    enum class StatusCode : std::uint8_t {
      NoInformation = 0x00,
      TopPositionStop = 0x01,
      BottomPositionStop = 0x02,
      IntermediatePositionStop = 0x03,
      TiltVentilationPosStop = 0x04,
      Blocking = 0x05,
      Overheated = 0x06,
      Timeout = 0x07,
      StartToMoveUp = 0x08,
      StartToMoveDown = 0x09,
      MovingUp = 0x0a,
      MovingDown = 0x0b,
      StoppedInUndefinedPosition = 0x0d,
      TopPosStopWithTiltPos = 0x0e,
      BottomPosStopWithIntPos = 0x0f,
      SwitchingDeviceOff = 0x10,
      SwitchingDeviceOn = 0x11,
    };

    /// Wire text the Transmitter hands over for \p code.
    const char* toString(StatusCode code);

    /// Reverse of toString(); std::nullopt for anything outside the taxonomy.
    std::optional<StatusCode> statusFromString(std::string_view text);

    /// True for Blocking, Overheated and Timeout.
    bool isDeviceFault(StatusCode code);

  } // namespace protocols
} // namespace elero
