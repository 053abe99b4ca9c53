#pragma once
/** @file  Response.hpp
 *  @brief Status payload pushed by a Transmitter for one channel.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// Elero headers
#include "protocols/StatusCode.hpp"

namespace elero {
  namespace protocols {
    struct Response {
      std::string status; ///< raw status text, kept verbatim for diagnostics

      /// Decoded status, or std::nullopt when the text is outside the taxonomy.
      std::optional<StatusCode> code() const { return statusFromString(status); }

      static Response fromCode(StatusCode code) { return Response{ toString(code) }; }
    };
  } // namespace protocols
} // namespace elero
