#pragma once
/** @file  DataLogger.hpp
 *  @brief Change-triggered, append-only tab-separated run log.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/Sample.hpp"
#include "io/FileLogger.hpp"

namespace spectackler::core {

  /**
 * @class DataLogger
 * @brief Header once (columns of the first row, sorted), then one row per
 *        record() whose headline value differs from the last written row.
 *
 *  * Every row is flushed before record() returns.
 *  * Columns are fixed by the first row; later absent cells are written "NA",
 *    later extra fields are dropped.
 */
  class DataLogger {
  public:
    explicit DataLogger(std::string headline) : headline_{ std::move(headline) } {}

    /// Creates \p path exclusively. False if it exists or is not writable.
    bool open(const std::string& path) { return file_.open(path); }
    bool isOpen() const { return file_.isOpen(); }
    void close() { file_.close(); }

    /**
     * @returns true if a row was written.
     * @throws std::runtime_error if the file refuses the write.
     */
    bool record(const Fields& row);

    const std::vector<std::string>& columns() const { return columns_; }
    std::size_t rowsWritten() const { return rows_; }
    const std::string& headline() const { return headline_; }

  private:
    void writeLine(const std::string& line);

    std::string headline_;
    io::FileLogger file_;
    std::vector<std::string> columns_;
    std::optional<std::string> lastHeadline_{};
    std::size_t rows_{ 0 };
  };

} // namespace spectackler::core
