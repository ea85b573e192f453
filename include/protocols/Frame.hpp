#pragma once
/** @file  Frame.hpp
 *  @brief Byte helpers and validation errors shared by every wire codec.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// spectackler headers
#include "io/SerialChannel.hpp" // io::Bytes

namespace spectackler {
  namespace protocols {

    using io::Bytes;

    /// A reply arrived but failed validation (checksum, length, echoed leader, handshake signal).
    class ProtocolError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Message the codec has no framing for; retrying cannot help.
    class UnsupportedCommand : public ProtocolError {
    public:
      using ProtocolError::ProtocolError;
    };

    Bytes toBytes(std::string_view text);
    std::string toString(const Bytes& bytes);

    /// "0x3F"
    std::string hexByte(std::uint8_t byte);

    /// "CA 00 01 20" - for diagnostics only.
    std::string hexDump(const Bytes& bytes);

  } // namespace protocols
} // namespace spectackler
