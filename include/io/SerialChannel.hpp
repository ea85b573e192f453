#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART byte I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// Linux header
#include <termios.h> // for speed_t types e.g., B9600

namespace spectackler {
  namespace io {

    using Bytes = std::vector<std::uint8_t>;

    enum class Parity { None, Even, Odd };

    /// Everything needed to open one point-to-point link. No hot-reconfiguration.
    struct SerialConfig {
      std::string port;
      speed_t baud{ B9600 };
      Parity parity{ Parity::None };
      std::chrono::milliseconds readTimeout{ 1000 };
    };

    /// Maps a numeric baud rate ("9600") to its termios constant; nullopt if unsupported.
    std::optional<speed_t> baudFromInt(long baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Raw byte I/O; framing belongs to the protocol layer.
 *  * Every blocking read is bounded by the configured read timeout and
 *    returns early (nullopt) once the passed stop_token is triggered.
 *  * *Non-copyable*, but move-constructible.
 */
    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const SerialConfig& config);
      virtual bool write(const Bytes& data); // returns false on EIO

      /// Reads exactly \p count bytes; nullopt on timeout, disconnect or stop.
      virtual std::optional<Bytes> read(std::size_t count, std::stop_token stop = {});

      /// Reads up to and including \p terminator; nullopt on timeout, disconnect or stop.
      virtual std::optional<Bytes> readUntil(std::uint8_t terminator, std::stop_token stop = {});

      /// Discards stale input (kernel queue and internal buffer).
      virtual void flushInput();

      /// Discards pending input and output; used before release on disconnect.
      virtual void drain();

      virtual bool isOpen() const { return fd_ >= 0; }
      std::chrono::milliseconds readTimeout() const { return timeout_; }
      virtual void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      /// Pulls whatever arrives within the deadline into rx_buffer_; false on timeout/error/stop.
      bool fill(std::chrono::steady_clock::time_point deadline, const std::stop_token& stop);

      int fd_{ -1 };                              ///< POSIX fd (-1==closed)
      Bytes rx_buffer_{};                         ///< bytes read but not yet consumed
      std::chrono::milliseconds timeout_{ 1000 }; ///< per-read bound
    };
  } // namespace io
} // namespace spectackler
