#pragma once
/** @file  TransmitterRegistry.hpp
 *  @brief Serial number → Transmitter lookup owned by the composition root.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

//Elero headers
#include "core/ErrorMonitor.hpp" // TransmitterRegistry reports duplicates to the error monitor
#include "io/Transmitter.hpp"

namespace elero {
  namespace core {

    class TransmitterRegistry {
    public:
      explicit TransmitterRegistry(std::shared_ptr<ErrorMonitor> errMonitor);
      ~TransmitterRegistry() = default;
      //---public APIs------------------------------------------------------
      /// Register under its serial number; false (and reported) on null or duplicate.
      bool add(std::shared_ptr<io::Transmitter> transmitter);

      /// nullptr when no transmitter carries \p serial.
      std::shared_ptr<io::Transmitter> find(const std::string& serial) const;

      std::size_t size() const { return transmitters_.size(); }

    private:
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unordered_map<std::string, std::shared_ptr<io::Transmitter>> transmitters_;
    };

  } // namespace core
} // namespace elero
