#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // speed_t, B115200 ...

namespace wayfinder {
  namespace io {

    /// Numeric baud → termios constant; none if unsupported.
    std::optional<speed_t> toSpeed(unsigned int baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames input on '\n'; a trailing '\r' is stripped. Output lines end in "\r\n".
 *  * A line longer than `kMaxLineBytes` is discarded up to its terminator.
 *  * *Non-copyable*, but move-constructible.
 */
    class SerialChannel {

    public:
      static constexpr std::size_t kMaxLineBytes = 16384;

      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, unsigned int baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      std::optional<std::string> takeLine();

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string rx_buffer_{}; ///< bytes received but not yet framed
      bool discarding_{ false }; ///< skipping an oversized line
    };
  } // namespace io
} // namespace wayfinder
