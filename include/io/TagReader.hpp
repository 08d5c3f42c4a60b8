#pragma once
/** @file  TagReader.hpp
 *  @brief Proximity-tag reader boundary + scoped scan subscription.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <string>

// Wayfinder headers
#include "model/TagPayload.hpp"

namespace wayfinder {
  namespace io {

    enum class ReaderAvailability { Available, Disabled, Unsupported, Unknown };

    const char* toString(ReaderAvailability availability);

    /**
 * @class TagReader
 * @brief Push-based event source: payloads or error strings, from any thread.
 *
 *  * `startScanning()` throws `std::runtime_error` when the hardware cannot start.
 *  * `stopScanning()` is idempotent.
 *  * Listeners must not block; the engine queues and returns.
 */
    class TagReader {
    public:
      using PayloadCallback = std::function<void(const model::TagPayload&)>;
      using ErrorCallback = std::function<void(const std::string&)>;

      virtual ~TagReader() = default;

      virtual void startScanning() = 0;
      virtual void stopScanning() = 0;
      virtual bool isScanning() const = 0;
      virtual ReaderAvailability availability() const = 0;

      virtual void setListener(PayloadCallback onPayload, ErrorCallback onError) = 0;
    };

    /**
 * @class ScanLease
 * @brief RAII: scanning runs while a lease is alive.
 *
 *  * Ctor calls `startScanning()` (and propagates its exception).
 *  * `release()` stops explicitly and may throw; the destructor never does.
 *  * *Non-copyable*, but move-constructible.
 */
    class ScanLease {
    public:
      explicit ScanLease(TagReader& reader);
      ~ScanLease();

      void release();
      bool active() const { return reader_ != nullptr; }

      ScanLease(const ScanLease&) = delete;
      ScanLease& operator=(const ScanLease&) = delete;
      ScanLease(ScanLease&& other) noexcept;
      ScanLease& operator=(ScanLease&& other) noexcept;

    private:
      TagReader* reader_{ nullptr }; ///< nullptr once released
    };

  } // namespace io
} // namespace wayfinder
