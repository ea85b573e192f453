#pragma once
/** @file  DasnetCodec.hpp
 *  @brief DASNET framing for the ISCO syringe pump: address-routed ASCII with hex checksum.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "protocols/WireProtocol.hpp"

namespace spectackler {
  namespace protocols {
    namespace dasnet {

      /// Frame: <dest><ack><source><len:2 hex><message><checksum:2 hex>\r
      struct Message {
        char dest{ '1' };
        char ack{ 'R' };
        char source{ '0' };
        std::string body;
      };

      /// (256 - (sum of character codes mod 256)) mod 256
      std::uint8_t checksum(std::string_view text);

      /// Upper-cases \p msg; throws std::invalid_argument if longer than 255 characters.
      Bytes encode(const Message& msg);

      /// Verifies terminator, declared length and checksum. Throws ProtocolError.
      Message decode(const Bytes& frame);

    } // namespace dasnet

    class DasnetProtocol : public WireProtocol {
    public:
      std::string name() const override { return "DASNET"; }
      Response exchange(io::SerialChannel& channel, const Bytes& frame,
                        std::stop_token stop) override;
    };

  } // namespace protocols
} // namespace spectackler
