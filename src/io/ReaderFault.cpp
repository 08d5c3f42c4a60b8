/* @file ReaderFault.cpp
 * @brief reader error classification and recovery guidance
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

// Wayfinder headers
#include "io/ReaderFault.hpp"

namespace wayfinder {
  namespace io {

    namespace {
      constexpr const char* kManual = "Use manual check-in instead";

      bool mentions(const std::string& lowered, const char* needle) {
        return lowered.find(needle) != std::string::npos;
      }

      ReaderFault make(ReaderFaultKind kind, std::string message, std::string userMessage,
                       std::vector<std::string> suggestions) {
        return ReaderFault{ kind, std::move(message), std::move(userMessage),
                            std::move(suggestions) };
      }
    } // namespace

    const char* toString(ReaderFaultKind kind) {
      switch (kind) {
      case ReaderFaultKind::HardwareUnavailable:
        return "hardwareUnavailable";
      case ReaderFaultKind::PermissionDenied:
        return "permissionDenied";
      case ReaderFaultKind::ReaderDisabled:
        return "readerDisabled";
      case ReaderFaultKind::ScanTimeout:
        return "scanTimeout";
      case ReaderFaultKind::TagReadError:
        return "tagReadError";
      default:
        return "unknown";
      }
    }

    ReaderFault classifyReaderError(const std::string& message) {
      std::string lowered = message;
      std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

      if (mentions(lowered, "permission"))
        return make(ReaderFaultKind::PermissionDenied, message,
                    "Permission to use the tag reader was denied",
                    { "Grant access to the reader device", kManual });
      if (mentions(lowered, "disabled"))
        return make(ReaderFaultKind::ReaderDisabled, message, "The tag reader is turned off",
                    { "Enable the reader and reconnect it", kManual });
      if (mentions(lowered, "disconnected") || mentions(lowered, "cannot open") ||
          mentions(lowered, "unsupported") || mentions(lowered, "not supported"))
        return make(ReaderFaultKind::HardwareUnavailable, message, "The tag reader is not available",
                    { "Check that the reader is plugged in", kManual });
      if (mentions(lowered, "timeout") || mentions(lowered, "timed out"))
        return make(ReaderFaultKind::ScanTimeout, message, "No tag was detected in time",
                    { "Hold the tag closer to the reader", "Try scanning again" });
      if (mentions(lowered, "checksum") || mentions(lowered, "malformed") ||
          mentions(lowered, "tag"))
        return make(ReaderFaultKind::TagReadError, message, "Failed to read the tag",
                    { "Try scanning the tag again", "Make sure it is a checkpoint tag", kManual });
      return make(ReaderFaultKind::Unknown, message,
                  "An unexpected error occurred while using the tag reader",
                  { "Try again in a moment", kManual });
    }

    ReaderFault faultFor(ReaderAvailability availability) {
      switch (availability) {
      case ReaderAvailability::Available:
        return make(ReaderFaultKind::Unknown, "reader available", "The tag reader is available", {});
      case ReaderAvailability::Disabled:
        return classifyReaderError("reader disabled");
      case ReaderAvailability::Unsupported:
        return classifyReaderError("reader not supported");
      default:
        return classifyReaderError("reader status unknown");
      }
    }

    bool shouldOfferRetry(const ReaderFault& fault) {
      return fault.kind == ReaderFaultKind::TagReadError || fault.kind == ReaderFaultKind::ScanTimeout;
    }

    bool shouldOfferManualSelection(const ReaderFault& fault) {
      return fault.kind == ReaderFaultKind::HardwareUnavailable ||
             fault.kind == ReaderFaultKind::PermissionDenied ||
             fault.kind == ReaderFaultKind::ReaderDisabled;
    }

    std::string formatGuidance(const ReaderFault& fault) {
      std::ostringstream os;
      os << fault.userMessage;
      if (!fault.recoverySuggestions.empty()) {
        os << "\nWhat you can try:";
        for (std::size_t i = 0; i < fault.recoverySuggestions.size(); ++i)
          os << "\n" << (i + 1) << ". " << fault.recoverySuggestions[i];
      }
      return os.str();
    }

  } // namespace io
} // namespace wayfinder
