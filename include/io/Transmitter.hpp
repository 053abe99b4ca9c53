#pragma once
/** @file  Transmitter.hpp
 *  @brief Interface of the radio stick that multiplexes up to 15 cover channels.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <string>

// Elero headers
#include "protocols/Response.hpp"

namespace elero {
  namespace io {

    /**
 * @class Transmitter
 * @brief One physical transmitter; owns discovery, the serial link and the wire codec.
 *
 *  * Radio commands are fire-and-forget.
 *  * Status arrives later through the callback registered with setChannel(), possibly
 *    from the transmitter's own reader thread.
 */
    class Transmitter {
    public:
      using StatusCallback = std::function<void(const protocols::Response&)>;

      virtual ~Transmitter() = default;

      //---public API-------------------------------------------
      /// Register \p cb for \p channel; returns whether the channel is reachable.
      virtual bool setChannel(int channel, StatusCallback cb) = 0;
      virtual std::string getSerialNumber() const = 0;

      virtual void up(int channel) = 0;
      virtual void down(int channel) = 0;
      virtual void stop(int channel) = 0;
      virtual void ventilationTilting(int channel) = 0;
      virtual void intermediate(int channel) = 0;

      /// Ask for a status refresh; the answer comes back through the callback.
      virtual void info(int channel) = 0;
    };

  } // namespace io
} // namespace elero
