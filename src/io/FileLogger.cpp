/* @file FileLogger.cpp
 * @brief chunked stdio writer behind the session journal
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

// Wayfinder headers
#include "io/FileLogger.hpp"

using namespace wayfinder::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path, bool append) {
  close();
  fp_ = std::fopen(path.c_str(), append ? "a" : "w");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << std::strerror(errno)
              << "\n";
    return false;
  }
  buffer_.reserve(kChunkBytes * 2);
  return true;
}

bool FileLogger::write(const std::string& csv) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkBytes)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    const std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << std::strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "[FileLogger] data lost on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
  buffer_.clear();
}
