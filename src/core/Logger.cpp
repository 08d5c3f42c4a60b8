/* @file Logger.cpp
 * @brief journal worker: RingBuffer<LogEvent> → FileLogger CSV rows
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>

// Wayfinder headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace wayfinder {
  namespace core {

    const char* toString(LogCategory category) {
      switch (category) {
      case LogCategory::Transition:
        return "transition";
      case LogCategory::Reroute:
        return "reroute";
      case LogCategory::Deviation:
        return "deviation";
      case LogCategory::Tag:
        return "tag";
      case LogCategory::Fault:
        return "fault";
      case LogCategory::Reader:
        return "reader";
      default:
        return "unknown";
      }
    }

    Logger::Logger() = default;

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& csvPath) {
      std::lock_guard<std::mutex> lock(lifecycleMtx_);
      if (running_)
        return false;

      if (!csvFile_.open(csvPath))
        return false;
      csvFile_.write("time_ms,category,message\n");

      buffer_ = std::make_unique<RingBuffer<LogEvent>>(kQueueDepth);
      running_ = true;
      worker_ = std::thread(&Logger::drain, this);
      return true;
    }

    void Logger::log(const LogEvent& event) {
      if (!running_)
        return;
      if (!buffer_->tryPush(event))
        ++dropped_;
    }

    void Logger::log(LogCategory category, std::string message) {
      log(LogEvent{ std::chrono::system_clock::now(), category, std::move(message) });
    }

    void Logger::finishRun() {
      std::lock_guard<std::mutex> lock(lifecycleMtx_);
      if (!running_.exchange(false))
        return;

      buffer_->close();
      if (worker_.joinable())
        worker_.join();
      csvFile_.close();

      if (dropped_ != 0)
        std::cerr << "[Logger] " << dropped_ << " journal events dropped (queue full)\n";
    }

    std::string Logger::formatRow(const LogEvent& event) {
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          event.time.time_since_epoch())
                          .count();
      std::string row = std::to_string(ms) + "," + toString(event.category) + ",\"";
      for (char c : event.message) {
        if (c == '"')
          row += "\"\"";
        else if (c == '\n' || c == '\r')
          row += ' ';
        else
          row += c;
      }
      row += "\"\n";
      return row;
    }

    void Logger::drain() {
      while (auto event = buffer_->waitPop()) {
        if (!csvFile_.write(formatRow(*event)))
          std::cerr << "[Logger] journal write failed\n";
      }
    }

  } // namespace core
} // namespace wayfinder
