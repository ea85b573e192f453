/* @file Frame.cpp
 * @brief byte/string conversions and hex formatting for diagnostics
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "protocols/Frame.hpp"

#include <cstdio>

namespace spectackler {
  namespace protocols {

    Bytes toBytes(std::string_view text) { return Bytes(text.begin(), text.end()); }

    std::string toString(const Bytes& bytes) { return std::string(bytes.begin(), bytes.end()); }

    std::string hexByte(std::uint8_t byte) {
      char buf[5];
      std::snprintf(buf, sizeof(buf), "0x%02X", byte);
      return buf;
    }

    std::string hexDump(const Bytes& bytes) {
      std::string out;
      out.reserve(bytes.size() * 3);
      char buf[4];
      for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(buf, sizeof(buf), i ? " %02X" : "%02X", bytes[i]);
        out += buf;
      }
      return out;
    }

  } // namespace protocols
} // namespace spectackler
