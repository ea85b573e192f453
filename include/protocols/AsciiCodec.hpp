#pragma once
/** @file  AsciiCodec.hpp
 *  @brief Terminated ASCII command/response (Isotemp bath, auxiliary MCU).
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
    namespace ascii {

      /// Success sentinel of set commands.
      constexpr std::string_view kOk = "OK";

      Bytes encode(std::string_view command, std::string_view terminator = "\r");

      /// Strips terminators and surrounding whitespace; rejects non-ASCII noise (ProtocolError).
      std::string decode(const Bytes& line);

      bool isOk(std::string_view reply);

      /// First word of a reply that starts with a number, units dropped ("T1 21.35C" → 21.35).
      std::optional<double> parseNumber(std::string_view reply);

    } // namespace ascii

    class AsciiProtocol : public WireProtocol {
    public:
      explicit AsciiProtocol(std::uint8_t replyTerminator = '\r')
          : replyTerminator_{ replyTerminator } {}

      std::string name() const override { return "ASCII"; }
      Response exchange(io::SerialChannel& channel, const Bytes& frame,
                        std::stop_token stop) override;

    private:
      std::uint8_t replyTerminator_;
    };

  } // namespace protocols
} // namespace spectackler
