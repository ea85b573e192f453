#pragma once
/** @file  NeslabCodec.hpp
 *  @brief NESLAB RTE binary framing: lead byte, address, command, length, data, inverted-sum checksum.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "protocols/WireProtocol.hpp"

namespace spectackler {
  namespace protocols {
    namespace neslab {

      constexpr std::uint8_t kLeadRs232 = 0xCA;
      constexpr std::uint8_t kLeadRs485 = 0xCC;
      constexpr std::size_t kLeaderLen = 4; ///< lead + 2 address + 1 command byte

      struct Addressing {
        bool multidrop{ false };   ///< RS-485/422 bus instead of point-to-point RS-232
        std::uint8_t address{ 1 }; ///< 1..63, multidrop only
      };

      /// (sum(bytes) XOR 0xFF) & 0xFF
      std::uint8_t checksum(const Bytes& bytes);

      /// Checksum covers address..data (the lead byte is excluded).
      Bytes encode(const Bytes& command, const Bytes& data, const Addressing& addressing = {});

      /**
       * Validates \p reply against the \p request it answers: echoed leader, length byte,
       * checksum. Returns the data bytes. Throws ProtocolError.
       */
      Bytes decode(const Bytes& reply, const Bytes& request);

      /// Qualifier byte + big-endian int16; qualifier 0x10/0x11 → 0.1 resolution, else 0.01.
      double decodeValue(const Bytes& threeBytes);

      /// Big-endian two's complement.
      Bytes encodeInt16(std::int16_t value);

      /// 5-byte status array, MSB first, named per the RTE manual's bit table.
      std::vector<std::pair<std::string, bool>> decodeStatus(const Bytes& fiveBytes);

    } // namespace neslab

    class NeslabProtocol : public WireProtocol {
    public:
      std::string name() const override { return "NESLAB"; }
      Response exchange(io::SerialChannel& channel, const Bytes& frame,
                        std::stop_token stop) override;
    };

  } // namespace protocols
} // namespace spectackler
