#pragma once
/** @file  Response.hpp
 *  @brief Validated reply payload of one command/response cycle.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// spectackler headers
#include "protocols/Frame.hpp"

namespace spectackler {
  namespace protocols {

    /**
     * Framing, checksum and terminators are already stripped. Single-frame protocols
     * fill exactly one block; the handshake protocol may deliver several (ETB-chained).
     */
    struct Response {
      std::vector<Bytes> blocks;

      const Bytes& payload() const { return blocks.front(); }
      std::string text() const { return blocks.empty() ? std::string{} : toString(blocks.front()); }
    };

  } // namespace protocols
} // namespace spectackler
