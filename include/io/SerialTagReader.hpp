#pragma once
/** @file  SerialTagReader.hpp
 *  @brief TagReader over a UART-attached proximity reader (one tag per line).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

// Wayfinder headers
#include "core/LocationGraph.hpp"
#include "io/SerialChannel.hpp"
#include "io/TagReader.hpp"
#include "model/TagPayload.hpp"

namespace wayfinder {
  namespace io {

    /**
 * @class SerialTagReader
 * @brief Worker thread turns serial lines into payloads.
 *
 *  * A line starting with '{' is an encoded TagPayload (decoded + checksum-verified).
 *  * Anything else is a tag UID, resolved through the catalog and sealed into a payload.
 *  * Malformed or unverifiable lines are dropped at this boundary (`rejected()` counts them).
 *  * Channel loss is reported through the error callback; nothing is thrown across the thread.
 */
    class SerialTagReader : public TagReader {
    public:
      SerialTagReader(std::string device, unsigned int baud,
                      std::shared_ptr<const core::LocationGraph> graph,
                      std::unique_ptr<SerialChannel> channel = std::make_unique<SerialChannel>());
      ~SerialTagReader() override;

      /// Opens the channel on first use; throws `std::runtime_error` if it cannot.
      void startScanning() override;
      void stopScanning() override;
      bool isScanning() const override { return scanning_.load(); }
      ReaderAvailability availability() const override;
      void setListener(PayloadCallback onPayload, ErrorCallback onError) override;

      /// Payload for one received line, or the reason it was rejected.
      std::variant<model::TagPayload, std::string> interpretLine(const std::string& line) const;

      std::uint64_t rejected() const { return rejected_.load(); }

    private:
      void readLoop();
      void emitPayload(const model::TagPayload& payload);
      void emitError(const std::string& message);

      std::string device_;
      unsigned int baud_;
      std::shared_ptr<const core::LocationGraph> graph_;
      std::unique_ptr<SerialChannel> channel_;

      std::mutex lifecycleMtx_;
      std::thread worker_;
      std::atomic<bool> scanning_{ false };
      std::atomic<std::uint64_t> rejected_{ 0 };

      std::mutex listenerMtx_; ///< held while a callback runs
      PayloadCallback onPayload_;
      ErrorCallback onError_;
    };

  } // namespace io
} // namespace wayfinder
