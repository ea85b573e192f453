#pragma once
/** @file  FileLogger.hpp
 *  @brief Flush-per-line TSV writer for the run log.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>

namespace spectackler {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file exclusively, writes lines and flushes on demand.
 *
 *  * `open()` refuses to clobber an existing file (fopen mode "wx").
 *  * Every `write()` is handed to stdio immediately; `flush()` pushes it to the OS.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path exists or cannot be opened writable. */
      bool open(const std::string& path);

      /** Writes one line (caller includes trailing '\n'); false on short write. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      bool isOpen() const { return fp_ != nullptr; }

      void close();

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      std::FILE* fp_{ nullptr };
    };

  } // namespace io
} // namespace spectackler
