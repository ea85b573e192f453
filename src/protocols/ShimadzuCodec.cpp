/* @file ShimadzuCodec.cpp
 * @brief RF-5301 framing, closed checksum table and handshake state machine
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "protocols/ShimadzuCodec.hpp"

#include <array>
#include <bit>
#include <cctype>
#include <utility>

#include "io/SerialChannel.hpp"

namespace spectackler {
  namespace protocols {
    namespace shimadzu {

      namespace {
        constexpr std::size_t kMaxBlockLen = 256;

        /*
         * No general algorithm is known for the check byte. These are the exact
         * STX+message+ETX sequences captured from the vendor software, keyed here by
         * their 7-bit ASCII message text.
         */
        constexpr std::array<std::pair<std::string_view, std::uint8_t>, 15> kChecksums{ {
            { "#", 0x20 },          // POST state
            { "V", 0xD5 },          // serial number
            { "CR", 0x92 },         // ROM version
            { "C", 0x40 },          // memory check
            { "I", 0x4A },          // optics check
            { "E", 0x46 },          // xenon lamp hours
            { "N1", 0x7C },         // shutter open
            { "N2", 0x7F },         // shutter close
            { "R", 0x51 },          // fluorescence reading
            { "WX", 0x8C },         // excitation wavelength
            { "WM", 0x19 },         // emission wavelength
            { "WA0D481162", 0xE9 }, // ex/em 340/445
            { "WA0DAC1068", 0xEC }, // ex/em 350/420
            { "WA0D481130", 0x6E }, // ex/em 340/440
            { "WA0D481324", 0xE9 }, // ex/em 340/490
        } };

        std::uint8_t withOddParity(char c) {
          const auto b = static_cast<std::uint8_t>(c & 0x7F);
          return (std::popcount(b) % 2 == 0) ? static_cast<std::uint8_t>(b | 0x80) : b;
        }

        std::string trim(const std::string& s) {
          std::size_t b = 0;
          std::size_t e = s.size();
          while (b < e && (std::isspace(static_cast<unsigned char>(s[b])) || s[b] == '\0'))
            ++b;
          while (e > b && (std::isspace(static_cast<unsigned char>(s[e - 1])) || s[e - 1] == '\0'))
            --e;
          return s.substr(b, e - b);
        }
      } // namespace

      Bytes toWire(std::string_view ascii) {
        Bytes out;
        out.reserve(ascii.size());
        for (char c : ascii)
          out.push_back(withOddParity(c));
        return out;
      }

      std::string fromWire(const Bytes& bytes) {
        std::string out;
        out.reserve(bytes.size());
        for (auto b : bytes)
          out.push_back(static_cast<char>(b & 0x7F));
        return out;
      }

      std::optional<std::uint8_t> knownChecksum(const Bytes& stxMessageEtx) {
        for (const auto& [message, sum] : kChecksums) {
          Bytes framed{ kStx };
          const Bytes body = toWire(message);
          framed.insert(framed.end(), body.begin(), body.end());
          framed.push_back(kEtx);
          if (framed == stxMessageEtx)
            return sum;
        }
        return std::nullopt;
      }

      Bytes encode(std::string_view message) {
        Bytes frame{ kStx };
        const Bytes body = toWire(message);
        frame.insert(frame.end(), body.begin(), body.end());
        frame.push_back(kEtx);

        const auto sum = knownChecksum(frame);
        if (!sum)
          throw UnsupportedCommand("[RF5301] no known check byte for message '" +
                                   std::string(message) + "'");
        frame.push_back(*sum);
        return frame;
      }

      std::string decodeBlock(const Bytes& block) {
        if (block.size() < 3)
          throw ProtocolError("[RF5301] block too short: " + hexDump(block));
        if (block.front() != kStx)
          throw ProtocolError("[RF5301] block does not start with STX: " + hexDump(block));
        const std::uint8_t terminator = block[block.size() - 2];
        if (terminator != kEtx && terminator != kEtb)
          throw ProtocolError("[RF5301] block not terminated by ETX/ETB: " + hexDump(block));

        const Bytes framed(block.begin(), block.end() - 1);
        if (const auto sum = knownChecksum(framed); sum && *sum != block.back())
          throw ProtocolError("[RF5301] checksum mismatch: should be " + hexByte(*sum) +
                              "; read " + hexByte(block.back()));

        return trim(fromWire(Bytes(block.begin() + 1, block.end() - 2)));
      }

      std::int32_t hex24(std::string_view hex) {
        if (hex.empty() || hex.size() > 6)
          throw ProtocolError("[RF5301] bad 24-bit hex field '" + std::string(hex) + "'");
        std::int32_t value = 0;
        for (char c : hex) {
          int digit;
          if (c >= '0' && c <= '9')
            digit = c - '0';
          else if (c >= 'A' && c <= 'F')
            digit = c - 'A' + 10;
          else if (c >= 'a' && c <= 'f')
            digit = c - 'a' + 10;
          else
            throw ProtocolError("[RF5301] bad 24-bit hex field '" + std::string(hex) + "'");
          value = value * 16 + digit;
        }
        return -(value & 0x800000) | (value & 0x7FFFFF);
      }

      std::string stripEcho(const std::string& reply, std::string_view command) {
        const std::string prefix = "0" + std::string(command);
        if (reply.compare(0, prefix.size(), prefix) == 0)
          return reply.substr(prefix.size());
        return reply;
      }

    } // namespace shimadzu

    using namespace shimadzu;

    const char* toString(ShimadzuProtocol::State s) {
      switch (s) {
      case ShimadzuProtocol::State::Idle:
        return "IDLE";
      case ShimadzuProtocol::State::SentEnq:
        return "SENT_ENQ";
      case ShimadzuProtocol::State::GotAck:
        return "GOT_ACK";
      case ShimadzuProtocol::State::SentFrame:
        return "SENT_FRAME";
      case ShimadzuProtocol::State::FrameAcked:
        return "FRAME_ACKED";
      case ShimadzuProtocol::State::SentEot:
        return "SENT_EOT";
      case ShimadzuProtocol::State::ReadingBlocks:
        return "READING_BLOCKS";
      case ShimadzuProtocol::State::EotSeen:
        return "EOT_SEEN";
      default:
        return "Unknown";
      }
    }

    void ShimadzuProtocol::expectSignal(io::SerialChannel& channel, std::uint8_t signal,
                                        const char* label, const std::stop_token& stop) {
      const std::uint8_t got = receive(channel, 1, stop).front();
      if (got != signal)
        throw ProtocolError(std::string("[RF5301] in ") + protocols::toString(state_) +
                            ": expected " + label + " (" + hexByte(signal) + "), read " +
                            hexByte(got));
    }

    Bytes ShimadzuProtocol::readBlock(io::SerialChannel& channel, const std::stop_token& stop) {
      Bytes block;
      for (;;) {
        block.push_back(receive(channel, 1, stop).front());
        const std::uint8_t last = block.back();
        if (block.size() > 1 && (last == kEtx || last == kEtb)) {
          block.push_back(receive(channel, 1, stop).front()); // check byte
          return block;
        }
        if (block.size() > kMaxBlockLen)
          throw ProtocolError("[RF5301] block exceeds " + std::to_string(kMaxBlockLen) +
                              " bytes without ETX/ETB");
      }
    }

    Response ShimadzuProtocol::exchange(io::SerialChannel& channel, const Bytes& frame,
                                        std::stop_token stop) {
      Response response;
      state_ = State::Idle;

      for (;;) {
        switch (state_) {
        case State::Idle:
          send(channel, { kEnq });
          state_ = State::SentEnq;
          break;
        case State::SentEnq:
          expectSignal(channel, kAck, "ACK", stop);
          state_ = State::GotAck;
          break;
        case State::GotAck:
          send(channel, frame);
          state_ = State::SentFrame;
          break;
        case State::SentFrame:
          expectSignal(channel, kAck, "ACK", stop);
          state_ = State::FrameAcked;
          break;
        case State::FrameAcked:
          send(channel, { kEot });
          state_ = State::SentEot;
          break;
        case State::SentEot:
          // instrument bids for the line before answering
          expectSignal(channel, kEnq, "ENQ", stop);
          send(channel, { kAck });
          state_ = State::ReadingBlocks;
          break;
        case State::ReadingBlocks: {
          const Bytes block = readBlock(channel, stop);
          response.blocks.push_back(toBytes(decodeBlock(block)));
          send(channel, { kAck });
          if (block[block.size() - 2] == kEtx) {
            expectSignal(channel, kEot, "EOT", stop);
            state_ = State::EotSeen;
          }
          break;
        }
        case State::EotSeen:
          state_ = State::Idle;
          return response;
        }
      }
    }

    std::size_t ShimadzuProtocol::clearLine(io::SerialChannel& channel, std::stop_token stop) {
      std::size_t acked = 0;
      for (;;) {
        const auto byte = channel.read(1, stop);
        if (!byte || byte->front() != kEnq)
          return acked;
        send(channel, { kAck });
        ++acked;
      }
    }

  } // namespace protocols
} // namespace spectackler
