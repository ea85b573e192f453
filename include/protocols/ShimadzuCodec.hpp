#pragma once
/** @file  ShimadzuCodec.hpp
 *  @brief RF-5301 handshake protocol: odd-parity ASCII messages, STX/ETX framing,
 *         ENQ/ACK/EOT/ETB signalling around every exchange.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "protocols/WireProtocol.hpp"

namespace spectackler {
  namespace protocols {
    namespace shimadzu {

      // signal bytes as they appear on the wire (parity bit included)
      constexpr std::uint8_t kStx = 0x02;
      constexpr std::uint8_t kEot = 0x04;
      constexpr std::uint8_t kEtx = 0x83;
      constexpr std::uint8_t kEnq = 0x85;
      constexpr std::uint8_t kAck = 0x86;
      constexpr std::uint8_t kEtb = 0x97;

      /// 7-bit ASCII with bit 7 set so that every byte carries an odd number of ones.
      Bytes toWire(std::string_view ascii);

      /// Masks the parity bit off every byte.
      std::string fromWire(const Bytes& bytes);

      /**
       * Check byte for STX + message + ETX, looked up in the closed table of commands
       * the instrument is known to accept. nullopt for anything else.
       */
      std::optional<std::uint8_t> knownChecksum(const Bytes& stxMessageEtx);

      /// STX + message + ETX + check byte. Throws UnsupportedCommand outside the closed set.
      Bytes encode(std::string_view message);

      /**
       * Validates one reply block (STX .. ETB|ETX, check byte) and returns its ASCII
       * payload without STX/ETX/ETB, whitespace-trimmed. Throws ProtocolError.
       */
      std::string decodeBlock(const Bytes& block);

      /// Shimadzu's 24-bit two's complement hex ("FFFFFF" → -1). Throws ProtocolError.
      std::int32_t hex24(std::string_view hex);

      /// Removes "0" + \p command echoed in front of a successful reply, when present.
      std::string stripEcho(const std::string& reply, std::string_view command);

    } // namespace shimadzu

    /**
 * @class ShimadzuProtocol
 * @brief Drives the signal exchange of one query as an explicit state machine:
 *
 *   Idle → SentEnq → GotAck → SentFrame → FrameAcked → SentEot
 *        → ReadingBlocks (each block ACKed) → EotSeen → Idle
 *
 *  A wrong signal byte raises ProtocolError; a silent line raises io::TransportError.
 */
    class ShimadzuProtocol : public WireProtocol {
    public:
      enum class State {
        Idle,
        SentEnq,
        GotAck,
        SentFrame,
        FrameAcked,
        SentEot,
        ReadingBlocks,
        EotSeen
      };

      std::string name() const override { return "RF5301"; }
      Response exchange(io::SerialChannel& channel, const Bytes& frame,
                        std::stop_token stop) override;

      /// Last state reached; Idle after every completed exchange.
      State state() const { return state_; }

      /// Answers any ENQ the instrument left pending so the line is quiet. Returns bytes ACKed.
      std::size_t clearLine(io::SerialChannel& channel, std::stop_token stop);

    private:
      void expectSignal(io::SerialChannel& channel, std::uint8_t signal, const char* label,
                        const std::stop_token& stop);
      Bytes readBlock(io::SerialChannel& channel, const std::stop_token& stop);

      State state_{ State::Idle };
    };

    const char* toString(ShimadzuProtocol::State s);

  } // namespace protocols
} // namespace spectackler
