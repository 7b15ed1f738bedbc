#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace trialflow {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for run logs (10 kB – 1 MB).
 *  * Uses `std::fwrite` in 4 kB chunks.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable (file is truncated). */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const noexcept { return fp_ != nullptr; }

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
} // namespace trialflow
