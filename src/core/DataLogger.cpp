/* @file DataLogger.cpp
 * @brief headline-change row filter over FileLogger
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/DataLogger.hpp"

#include <stdexcept>

using namespace spectackler::core;

void DataLogger::writeLine(const std::string& line) {
  if (!file_.write(line) || !file_.flush())
    throw std::runtime_error("[DataLogger] write to log file failed");
}

bool DataLogger::record(const Fields& row) {
  auto head = row.find(headline_);
  if (head == row.end())
    return false;

  const std::string value = formatValue(head->second);
  if (lastHeadline_ && *lastHeadline_ == value)
    return false;

  if (columns_.empty()) {
    std::string header;
    for (const auto& [name, _] : row) { // std::map: already sorted
      columns_.push_back(name);
      header += (header.empty() ? "" : "\t") + name;
    }
    writeLine(header + "\n");
  }

  std::string line;
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (i)
      line += '\t';
    auto it = row.find(columns_[i]);
    line += (it == row.end()) ? std::string("NA") : formatValue(it->second);
  }
  writeLine(line + "\n");

  lastHeadline_ = value;
  ++rows_;
  return true;
}
