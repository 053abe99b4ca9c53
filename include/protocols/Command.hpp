#pragma once
/** @file  Command.hpp
 *  @brief Radio commands a cover channel can ask its Transmitter to send.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>

namespace elero {
  namespace protocols {
    enum class Command : std::uint8_t { Up, Down, Stop, VentilationTilting, Intermediate, Info };

    inline const char* toString(Command c) {
      switch (c) {
      case Command::Up:
        return "up";
      case Command::Down:
        return "down";
      case Command::Stop:
        return "stop";
      case Command::VentilationTilting:
        return "ventilation_tilting";
      case Command::Intermediate:
        return "intermediate";
      case Command::Info:
        return "info";
      default:
        return "unknown";
      }
    }

  } // namespace protocols
} // namespace elero
