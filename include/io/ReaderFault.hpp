#pragma once
/** @file  ReaderFault.hpp
 *  @brief Classification of tag-reader failures + the recovery path offered to the user.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// Wayfinder headers
#include "io/TagReader.hpp"

namespace wayfinder {
  namespace io {

    enum class ReaderFaultKind {
      HardwareUnavailable,
      PermissionDenied,
      ReaderDisabled,
      ScanTimeout,
      TagReadError,
      Unknown
    };

    const char* toString(ReaderFaultKind kind);

    /**
 * @struct ReaderFault
 * @brief What went wrong with the reader and what the user can do about it.
 *
 *  * Hardware / permission / disabled faults → switch to manual check-in.
 *  * Read errors and timeouts → scanning again is worth a try.
 */
    struct ReaderFault {
      ReaderFaultKind kind{ ReaderFaultKind::Unknown };
      std::string message;     ///< technical detail (journal)
      std::string userMessage; ///< one line for the console
      std::vector<std::string> recoverySuggestions;

      bool operator==(const ReaderFault&) const = default;
    };

    /// Maps a reader error string (listener error or startScanning() exception text).
    ReaderFault classifyReaderError(const std::string& message);

    /// Fault describing a reader that is not `Available`.
    ReaderFault faultFor(ReaderAvailability availability);

    bool shouldOfferRetry(const ReaderFault& fault);
    bool shouldOfferManualSelection(const ReaderFault& fault);

    /// userMessage followed by a numbered "What you can try:" list.
    std::string formatGuidance(const ReaderFault& fault);

  } // namespace io
} // namespace wayfinder
