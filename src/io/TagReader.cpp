/* @file TagReader.cpp
 * @brief ScanLease acquire/release discipline
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <utility>

// Wayfinder headers
#include "io/TagReader.hpp"

namespace wayfinder {
  namespace io {

    const char* toString(ReaderAvailability availability) {
      switch (availability) {
      case ReaderAvailability::Available:
        return "available";
      case ReaderAvailability::Disabled:
        return "disabled";
      case ReaderAvailability::Unsupported:
        return "unsupported";
      default:
        return "unknown";
      }
    }

    ScanLease::ScanLease(TagReader& reader) : reader_(&reader) { reader.startScanning(); }

    ScanLease::~ScanLease() {
      try {
        release();
      } catch (const std::exception& e) {
        std::cerr << "[ScanLease] stopScanning failed: " << e.what() << "\n";
      }
    }

    void ScanLease::release() {
      if (TagReader* reader = std::exchange(reader_, nullptr))
        reader->stopScanning();
    }

    ScanLease::ScanLease(ScanLease&& other) noexcept
        : reader_(std::exchange(other.reader_, nullptr)) {}

    ScanLease& ScanLease::operator=(ScanLease&& other) noexcept {
      if (this != &other) {
        try {
          release();
        } catch (const std::exception& e) {
          std::cerr << "[ScanLease] stopScanning failed: " << e.what() << "\n";
        }
        reader_ = std::exchange(other.reader_, nullptr);
      }
      return *this;
    }

  } // namespace io
} // namespace wayfinder
