#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace wayfinder {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for session journals (10 kB – 1 MB).
 *  * Uses `std::fwrite` once the buffer passes 4 kB.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkBytes = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. Appends when \p append. */
      bool open(const std::string& path, bool append = false);

      /** Queues one CSV line (caller includes trailing '\n'). Returns false if closed / EIO. */
      bool write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace wayfinder
