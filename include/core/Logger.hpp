#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV session journal (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace wayfinder {
  namespace core {

    enum class LogCategory { Transition, Reroute, Deviation, Tag, Fault, Reader };

    const char* toString(LogCategory category);

    struct LogEvent {
      std::chrono::system_clock::time_point time{ std::chrono::system_clock::now() };
      LogCategory category{ LogCategory::Transition };
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      static constexpr std::size_t kQueueDepth = 1024;

      Logger();
      virtual ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      virtual void log(const LogEvent& event);     ///< enqueue event (non-blocking)
      void log(LogCategory category, std::string message);
      void finishRun(); ///< flush + join worker thread

      bool running() const { return running_.load(); }
      std::uint64_t dropped() const { return dropped_.load(); }

      /// One CSV row: epoch-ms,category,"message" (quotes doubled).
      static std::string formatRow(const LogEvent& event);

    private:
      void drain();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::uint64_t> dropped_{ 0 };
      std::mutex lifecycleMtx_;
    };

  } // namespace core
} // namespace wayfinder
