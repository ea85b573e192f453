/* @file DasnetCodec.cpp
 * @brief DASNET encode/decode + single-attempt exchange
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "protocols/DasnetCodec.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace spectackler {
  namespace protocols {
    namespace dasnet {

      namespace {
        constexpr std::uint8_t kTerminator = '\r';
        constexpr std::size_t kHeaderLen = 5; // dest, ack, source, 2 length digits
        constexpr std::size_t kChecksumLen = 2;

        std::string hex2(unsigned value) {
          char buf[3];
          std::snprintf(buf, sizeof(buf), "%02X", value & 0xFFu);
          return buf;
        }

        int hexDigit(char c) {
          if (c >= '0' && c <= '9')
            return c - '0';
          c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
          if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
          return -1;
        }

        int parseHex2(std::string_view two) {
          const int hi = hexDigit(two[0]);
          const int lo = hexDigit(two[1]);
          if (hi < 0 || lo < 0)
            return -1;
          return hi * 16 + lo;
        }
      } // namespace

      std::uint8_t checksum(std::string_view text) {
        unsigned total = 0;
        for (unsigned char c : text)
          total += c;
        return static_cast<std::uint8_t>((256 - total % 256) % 256);
      }

      Bytes encode(const Message& msg) {
        if (msg.body.size() > 0xFF)
          throw std::invalid_argument("[DASNET] message exceeds 255 characters");

        std::string cmd;
        cmd += msg.dest;
        cmd += msg.ack;
        cmd += msg.source;
        cmd += hex2(static_cast<unsigned>(msg.body.size()));
        cmd += msg.body;
        for (auto& c : cmd)
          c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        std::string frame = cmd + hex2(checksum(cmd));
        frame += static_cast<char>(kTerminator);
        return toBytes(frame);
      }

      Message decode(const Bytes& frame) {
        if (frame.empty() || frame.back() != kTerminator)
          throw ProtocolError("[DASNET] frame not terminated by CR: " + hexDump(frame));

        const std::string text(frame.begin(), frame.end() - 1);
        if (text.size() < kHeaderLen + kChecksumLen)
          throw ProtocolError("[DASNET] frame too short: '" + text + "'");

        const std::string_view body(text.data(), text.size() - kChecksumLen);
        const int declaredSum = parseHex2(std::string_view(text).substr(body.size()));
        const std::uint8_t expectedSum = checksum(body);
        if (declaredSum != expectedSum)
          throw ProtocolError("[DASNET] checksum mismatch: should be " + hex2(expectedSum) +
                              "; read " + text.substr(body.size()));

        const int declaredLen = parseHex2(body.substr(3, 2));
        const std::size_t actualLen = body.size() - kHeaderLen;
        if (declaredLen < 0 || static_cast<std::size_t>(declaredLen) != actualLen)
          throw ProtocolError("[DASNET] length mismatch: declared " +
                              std::string(body.substr(3, 2)) + ", carried " +
                              std::to_string(actualLen));

        Message msg;
        msg.dest = body[0];
        msg.ack = body[1];
        msg.source = body[2];
        msg.body = std::string(body.substr(kHeaderLen));
        return msg;
      }

    } // namespace dasnet

    Response DasnetProtocol::exchange(io::SerialChannel& channel, const Bytes& frame,
                                      std::stop_token stop) {
      send(channel, frame);
      const auto reply = dasnet::decode(receiveUntil(channel, '\r', stop));
      return Response{ { toBytes(reply.body) } };
    }

  } // namespace protocols
} // namespace spectackler
