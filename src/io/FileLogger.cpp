/* @file FileLogger.cpp
 * @brief stdio-backed append-only line writer
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

using namespace spectackler::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept : fp_(std::exchange(other.fp_, nullptr)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  // "x" → fail if the file already exists, never overwrite a previous run
  fp_ = std::fopen(path.c_str(), "wx");
  if (fp_ == nullptr) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return false;
  return std::fwrite(line.data(), 1, line.size(), fp_) == line.size();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ != nullptr) {
    std::fflush(fp_);
    std::fclose(fp_);
  }
  fp_ = nullptr;
}
