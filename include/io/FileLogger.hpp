#pragma once
/** @file  FileLogger.hpp
 *  @brief Chunked writer behind the CSV run log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace rfsweep {
  namespace io {

    /**
 * @class FileLogger
 * @brief Owns one `FILE*` opened for truncating writes.
 *
 *  * Lines accumulate in memory and go out through `std::fwrite` once
 *    `kChunkSize` bytes are pending, on `flush()` and on `close()`.
 *  * Only the Logger worker thread touches an instance; nothing here locks.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< close()

      /// Truncates \p path. @returns false (and reports errno on cerr) if it cannot be opened.
      bool open(const std::string& path);

      /// Append raw text; the caller supplies the trailing '\n'. No-op when closed.
      void write(const std::string& text);

      /// @returns false if fwrite or fflush failed; unwritten bytes stay pending.
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; }

      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      FILE* fp_{ nullptr };
      std::string path_;
      std::vector<char> pending_;
    };

  } // namespace io
} // namespace rfsweep
