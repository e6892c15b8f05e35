/* @file FileLogger.cpp
 * @brief chunked fwrite wrapper used by the run logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

// rfsweep headers
#include "io/FileLogger.hpp"

using namespace rfsweep::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "w");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen: " << strerror(errno) << "\n";
    return false;
  }
  path_ = path;
  pending_.reserve(kChunkSize);
  return true;
}

void FileLogger::write(const std::string& text) {
  if (!fp_)
    return;
  pending_.insert(pending_.end(), text.begin(), text.end());
  if (pending_.size() >= kChunkSize)
    (void)flush(); // failure already on cerr; the remainder is retried on the next flush
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < pending_.size()) {
    std::size_t chunk = std::min(kChunkSize, pending_.size() - total);
    std::size_t written = std::fwrite(pending_.data() + total, 1, chunk, fp_);
    if (written != chunk) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      pending_.erase(pending_.begin(), pending_.begin() + static_cast<long>(total + written));
      return false;
    }
    total += written;
  }
  pending_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "Warning: run log closed with unflushed data\n";
  std::fclose(fp_);
  fp_ = nullptr;
  path_.clear();
}
