#pragma once
/** @file  TagEventPump.hpp
 *  @brief Bounded hand-off from reader callbacks to the navigation controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

// Wayfinder headers
#include "core/ErrorMonitor.hpp"
#include "core/NavigationController.hpp"
#include "core/RingBuffer.hpp"
#include "io/TagReader.hpp"
#include "model/TagPayload.hpp"

namespace wayfinder {
  namespace core {

    /**
 * @class TagEventPump
 * @brief Single consumer thread; producers never block.
 *
 *  * Events are processed strictly in arrival order.
 *  * A full queue drops the new event and reports to the ErrorMonitor.
 *  * Each accepted payload is stamped via `noteIncomingEvent()` so stale reroutes lose.
 */
    class TagEventPump {
    public:
      TagEventPump(NavigationController& controller, std::shared_ptr<io::TagReader> reader,
                   std::size_t capacity, std::shared_ptr<ErrorMonitor> errorMonitor = nullptr);
      ~TagEventPump(); ///< stop()

      TagEventPump(const TagEventPump&) = delete;
      TagEventPump& operator=(const TagEventPump&) = delete;

      /// Attach to the reader (if any) and launch the worker.
      void start();
      /// Detach, drain what is queued, join.
      void stop();

      bool post(const model::TagPayload& payload); ///< false when dropped
      bool postError(const std::string& message);

      /// Blocks until every accepted event has been handled; false on timeout.
      bool waitIdle(std::chrono::milliseconds timeout);

      std::uint64_t dropped() const { return dropped_.load(); }
      bool running() const { return running_.load(); }

    private:
      struct PayloadEvent {
        model::TagPayload payload;
        std::uint64_t seq{ 0 };
      };
      struct ErrorEvent {
        std::string message;
      };
      using Event = std::variant<PayloadEvent, ErrorEvent>;

      bool enqueue(Event event);
      void drain();

      NavigationController& controller_;
      std::shared_ptr<io::TagReader> reader_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      RingBuffer<Event> queue_;

      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::uint64_t> dropped_{ 0 };

      std::mutex idleMtx_;
      std::condition_variable idleCv_;
      std::size_t pending_{ 0 }; ///< accepted but not yet handled
    };

  } // namespace core
} // namespace wayfinder
