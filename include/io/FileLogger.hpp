#pragma once
/** @file  FileLogger.hpp
 *  @brief Append-only text sink behind the cover transition log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace elero {
  namespace io {

    /**
 * @class FileLogger
 * @brief Owns one `FILE*`; rows collect in memory and reach the disk per chunk.
 *
 *  * A write with no open file is dropped silently.
 *  * The destructor flushes whatever is still buffered.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096; ///< buffered bytes that force a flush

      FileLogger() = default;
      ~FileLogger();

      /// Truncates \p path; false (errno logged) when it cannot be created.
      bool open(const std::string& path);

      /// Appends one row; the caller supplies the trailing '\n'.
      void write(const std::string& row);

      /// Drains the buffer and fflush()es; false when nothing is open or a write failed.
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace elero
