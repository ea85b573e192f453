/* @file NeslabCodec.cpp
 * @brief NESLAB RTE binary encode/decode + single-attempt exchange
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "protocols/NeslabCodec.hpp"

#include <array>
#include <numeric>
#include <stdexcept>

namespace spectackler {
  namespace protocols {
    namespace neslab {

      namespace {
        // bit names, MSB of byte 0 first; trailing bits of byte 4 are unassigned
        constexpr std::array<const char*, 37> kStatusBits{
          "rtd1_open_fault", "rtd1_short_fault",  "rtd1_open",          "rtd1_short",
          "rtd3_open_fault", "rtd3_short_fault",  "rtd3_open",          "rtd3_short",
          "rtd2_open_fault", "rtd2_short_fault",  "rtd2_open_warn",     "rtd2_short_warn",
          "rtd2_open",       "rtd2_short",        "refrig_hi_temp",     "htc_fault",
          "hi_fixed_temp_fault", "lo_fixed_temp_fault", "hi_temp_fault", "lo_temp_fault",
          "lo_level_fault",  "hi_temp_warn",      "lo_temp_warn",       "lo_level_warn",
          "buzzer_on",       "alarm_muted",       "unit_faulted",       "unit_stopping",
          "unit_on",         "pump_on",           "comp_on",            "heat_on",
          "rtd2_controlling", "heat_led_flashing", "heat_led_on",       "cool_led_flashing",
          "cool_led_on"
        };
      } // namespace

      std::uint8_t checksum(const Bytes& bytes) {
        const unsigned sum = std::accumulate(bytes.begin(), bytes.end(), 0u);
        return static_cast<std::uint8_t>((sum ^ 0xFFu) & 0xFFu);
      }

      Bytes encode(const Bytes& command, const Bytes& data, const Addressing& addressing) {
        if (command.empty())
          throw std::invalid_argument("[NESLAB] empty command");
        if (data.size() > 0xFF)
          throw std::invalid_argument("[NESLAB] data exceeds 255 bytes");

        Bytes frame;
        if (!addressing.multidrop) {
          frame = { kLeadRs232, 0x00, 0x01 };
        } else {
          if (addressing.address < 1 || addressing.address > 63)
            throw std::invalid_argument("[NESLAB] multidrop address must be in range [1,63]");
          frame = { kLeadRs485, 0x00, addressing.address };
        }
        frame.insert(frame.end(), command.begin(), command.end());
        frame.push_back(static_cast<std::uint8_t>(data.size()));
        frame.insert(frame.end(), data.begin(), data.end());

        frame.push_back(checksum(Bytes(frame.begin() + 1, frame.end())));
        return frame;
      }

      Bytes decode(const Bytes& reply, const Bytes& request) {
        if (reply.size() < kLeaderLen + 2)
          throw ProtocolError("[NESLAB] reply too short: " + hexDump(reply));
        if (request.size() < kLeaderLen)
          throw std::invalid_argument("[NESLAB] request shorter than a leader");

        const Bytes leader(reply.begin(), reply.begin() + kLeaderLen);
        const Bytes sentLeader(request.begin(), request.begin() + kLeaderLen);
        if (leader != sentLeader)
          throw ProtocolError("[NESLAB] command mismatch: should be " + hexDump(sentLeader) +
                              "; read " + hexDump(leader));

        const std::size_t declared = reply[kLeaderLen];
        if (reply.size() != kLeaderLen + 1 + declared + 1)
          throw ProtocolError("[NESLAB] length mismatch: declared " + std::to_string(declared) +
                              " data byte(s), frame is " + std::to_string(reply.size()) +
                              " bytes");

        const std::uint8_t expected = checksum(Bytes(reply.begin() + 1, reply.end() - 1));
        if (reply.back() != expected)
          throw ProtocolError("[NESLAB] checksum mismatch: should be " + hexByte(expected) +
                              "; read " + hexByte(reply.back()));

        return Bytes(reply.begin() + kLeaderLen + 1, reply.end() - 1);
      }

      double decodeValue(const Bytes& threeBytes) {
        if (threeBytes.size() != 3)
          throw ProtocolError("[NESLAB] expected 3 value bytes, got " +
                              std::to_string(threeBytes.size()));
        const auto raw = static_cast<std::int16_t>((threeBytes[1] << 8) | threeBytes[2]);
        const bool tenths = threeBytes[0] == 0x10 || threeBytes[0] == 0x11;
        return static_cast<double>(raw) / (tenths ? 10.0 : 100.0);
      }

      Bytes encodeInt16(std::int16_t value) {
        const auto u = static_cast<std::uint16_t>(value);
        return { static_cast<std::uint8_t>(u >> 8), static_cast<std::uint8_t>(u & 0xFF) };
      }

      std::vector<std::pair<std::string, bool>> decodeStatus(const Bytes& fiveBytes) {
        if (fiveBytes.size() != 5)
          throw ProtocolError("[NESLAB] expected 5 status bytes, got " +
                              std::to_string(fiveBytes.size()));
        std::vector<std::pair<std::string, bool>> out;
        out.reserve(kStatusBits.size());
        for (std::size_t bit = 0; bit < kStatusBits.size(); ++bit) {
          const std::uint8_t byte = fiveBytes[bit / 8];
          out.emplace_back(kStatusBits[bit], (byte >> (7 - bit % 8)) & 0x01);
        }
        return out;
      }

    } // namespace neslab

    Response NeslabProtocol::exchange(io::SerialChannel& channel, const Bytes& frame,
                                      std::stop_token stop) {
      send(channel, frame);

      // leader (4) + data count, then the data bytes and the check byte
      Bytes reply = receive(channel, neslab::kLeaderLen + 1, stop);
      const Bytes rest = receive(channel, static_cast<std::size_t>(reply.back()) + 1, stop);
      reply.insert(reply.end(), rest.begin(), rest.end());

      return Response{ { neslab::decode(reply, frame) } };
    }

  } // namespace protocols
} // namespace spectackler
