#pragma once
/** @file  TagPayload.hpp
 *  @brief Checksummed checkpoint record carried by a proximity tag + its wire codec.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace wayfinder {
  namespace model {

    /** Thrown when tag bytes are not a well-formed payload record. */
    class DecodeError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class TagPayload
 * @brief Location id + millisecond timestamp + auxiliary bag, sealed by a checksum.
 *
 *  * checksum = first 16 hex chars of SHA-256(locationId + timestampMs + canonical(aux)).
 *  * `create()` derives the checksum; the `with*()` copies do not, so a hand-edited
 *    record reports `isValid() == false` until `refreshChecksum()`.
 *  * Auxiliary data keeps insertion order (needed to trim the oldest entries).
 *  * Wire form is compact UTF-8 JSON: locationId, checksum, timestamp, additionalData.
 */
    class TagPayload {
    public:
      using AuxData = nlohmann::ordered_json;

      TagPayload(std::string locationId, std::string checksum, std::chrono::milliseconds timestamp,
                 AuxData additionalData = AuxData::object());

      /// Build a payload with a derived checksum; timestamp truncated to whole ms.
      /// Throws `std::invalid_argument` unless \p additionalData is a flat map of primitives.
      static TagPayload create(std::string locationId,
                               std::chrono::system_clock::time_point timestamp =
                                   std::chrono::system_clock::now(),
                               AuxData additionalData = AuxData::object());
      static TagPayload create(std::string locationId, std::chrono::milliseconds timestamp,
                               AuxData additionalData = AuxData::object());

      const std::string& locationId() const { return locationId_; }
      const std::string& checksum() const { return checksum_; }
      std::chrono::milliseconds timestamp() const { return timestamp_; }
      const AuxData& additionalData() const { return additionalData_; }

      /// Recomputes the checksum and compares it with the stored one.
      bool isValid() const;

      /// Copy with a re-derived checksum; every other field unchanged.
      TagPayload refreshChecksum() const;

      TagPayload withLocationId(std::string locationId) const;
      TagPayload withChecksum(std::string checksum) const;
      TagPayload withTimestamp(std::chrono::milliseconds timestamp) const;
      TagPayload withAdditionalData(AuxData additionalData) const;

      bool isExpired(std::chrono::milliseconds maxAge,
                     std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

      //---wire codec---------------------------------------------------------
      std::string toWire() const;
      std::vector<std::uint8_t> encode() const;

      /// Parse a payload or throw `DecodeError`.
      static TagPayload fromWire(std::string_view text);
      static TagPayload decode(std::span<const std::uint8_t> bytes);

      /// Checksum over the given fields (hex prefix).
      static std::string computeChecksum(const std::string& locationId,
                                         std::chrono::milliseconds timestamp, const AuxData& data);

      bool operator==(const TagPayload& other) const;

    private:
      std::string locationId_;
      std::string checksum_;
      std::chrono::milliseconds timestamp_{ 0 };
      AuxData additionalData_ = AuxData::object();
    };

    namespace tag {
      /// Typical NDEF budget for one tag.
      inline constexpr std::size_t kMaxTagBytes = 8192;
      inline constexpr std::size_t kChecksumLength = 16;

      bool fitsInTag(std::span<const std::uint8_t> encoded, std::size_t budget = kMaxTagBytes);
      std::size_t estimateSize(const TagPayload& payload);
      bool isValidFormat(std::span<const std::uint8_t> bytes);

      /// Drops the least recently added auxiliary entries until the encoding fits.
      TagPayload createWithinBudget(std::string locationId, TagPayload::AuxData additionalData,
                                    std::chrono::milliseconds timestamp,
                                    std::size_t budget = kMaxTagBytes);
    } // namespace tag

  } // namespace model
} // namespace wayfinder
