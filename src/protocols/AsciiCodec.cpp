/* @file AsciiCodec.cpp
 * @brief line-oriented ASCII encode/decode + single-attempt exchange
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "protocols/AsciiCodec.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>

namespace spectackler {
  namespace protocols {
    namespace ascii {

      Bytes encode(std::string_view command, std::string_view terminator) {
        Bytes out = toBytes(command);
        out.insert(out.end(), terminator.begin(), terminator.end());
        return out;
      }

      std::string decode(const Bytes& line) {
        std::string text;
        text.reserve(line.size());
        for (auto b : line) {
          if (b == 0 || b >= 0x80)
            throw ProtocolError("[ASCII] non-ASCII byte in reply: " + hexDump(line));
          text.push_back(static_cast<char>(b));
        }
        std::size_t b = 0;
        std::size_t e = text.size();
        while (b < e && std::isspace(static_cast<unsigned char>(text[b])))
          ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1])))
          --e;
        return text.substr(b, e - b);
      }

      bool isOk(std::string_view reply) { return reply == kOk; }

      std::optional<double> parseNumber(std::string_view reply) {
        std::istringstream words{ std::string(reply) };
        std::string word;
        while (words >> word) {
          std::size_t digit = 0;
          if (word[digit] == '-' || word[digit] == '+')
            ++digit;
          if (digit < word.size() && word[digit] == '.')
            ++digit;
          if (digit >= word.size() || !std::isdigit(static_cast<unsigned char>(word[digit])))
            continue; // label, not a number

          // trailing units stay behind strtod's end pointer
          char* end = nullptr;
          const double value = std::strtod(word.c_str(), &end);
          if (end != word.c_str())
            return value;
        }
        return std::nullopt;
      }

    } // namespace ascii

    Response AsciiProtocol::exchange(io::SerialChannel& channel, const Bytes& frame,
                                     std::stop_token stop) {
      send(channel, frame);
      return Response{ { toBytes(ascii::decode(receiveUntil(channel, replyTerminator_, stop))) } };
    }

  } // namespace protocols
} // namespace spectackler
