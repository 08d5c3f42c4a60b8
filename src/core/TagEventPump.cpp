/* @file TagEventPump.cpp
 * @brief reader thread → RingBuffer → controller worker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>

// Wayfinder headers
#include "core/TagEventPump.hpp"

namespace wayfinder {
  namespace core {

    TagEventPump::TagEventPump(NavigationController& controller,
                               std::shared_ptr<io::TagReader> reader, std::size_t capacity,
                               std::shared_ptr<ErrorMonitor> errorMonitor)
        : controller_(controller), reader_(std::move(reader)),
          errorMonitor_(std::move(errorMonitor)), queue_(capacity) {}

    TagEventPump::~TagEventPump() { stop(); }

    void TagEventPump::start() {
      if (running_.exchange(true))
        return;

      worker_ = std::thread(&TagEventPump::drain, this);
      if (reader_) {
        reader_->setListener([this](const model::TagPayload& payload) { post(payload); },
                             [this](const std::string& message) { postError(message); });
      }
    }

    void TagEventPump::stop() {
      if (!running_.exchange(false))
        return;

      if (reader_)
        reader_->setListener(nullptr, nullptr);
      queue_.close();
      if (worker_.joinable())
        worker_.join();
    }

    bool TagEventPump::post(const model::TagPayload& payload) {
      return enqueue(PayloadEvent{ payload, controller_.noteIncomingEvent() });
    }

    bool TagEventPump::postError(const std::string& message) {
      return enqueue(ErrorEvent{ message });
    }

    bool TagEventPump::enqueue(Event event) {
      {
        std::lock_guard<std::mutex> lock(idleMtx_);
        ++pending_;
      }
      if (queue_.tryPush(std::move(event)))
        return true;

      {
        std::lock_guard<std::mutex> lock(idleMtx_);
        --pending_;
      }
      idleCv_.notify_all();
      ++dropped_;
      if (errorMonitor_)
        errorMonitor_->notifyFailure("[TagEventPump] event queue full, tag event dropped");
      return false;
    }

    bool TagEventPump::waitIdle(std::chrono::milliseconds timeout) {
      std::unique_lock<std::mutex> lock(idleMtx_);
      return idleCv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
    }

    void TagEventPump::drain() {
      while (auto event = queue_.waitPop()) {
        try {
          if (const auto* tag = std::get_if<PayloadEvent>(&*event))
            controller_.handleTagPayload(tag->payload, tag->seq);
          else if (const auto* err = std::get_if<ErrorEvent>(&*event))
            controller_.handleReaderError(err->message);
        } catch (const std::exception& e) {
          std::cerr << "[TagEventPump] event handling failed: " << e.what() << "\n";
          if (errorMonitor_)
            errorMonitor_->notifyFailure(std::string("[TagEventPump] ") + e.what());
        }

        {
          std::lock_guard<std::mutex> lock(idleMtx_);
          --pending_;
        }
        idleCv_.notify_all();
      }
    }

  } // namespace core
} // namespace wayfinder
