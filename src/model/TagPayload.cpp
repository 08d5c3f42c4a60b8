/* @file TagPayload.cpp
 * @brief tag payload checksum (SHA-256 via mbedTLS) and JSON wire codec
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

// 3rd-party headers
#include <mbedtls/sha256.h>

// Wayfinder headers
#include "model/TagPayload.hpp"

namespace wayfinder {
  namespace model {

    namespace {

      std::string sha256Hex(const std::string& input) {
        std::array<unsigned char, 32> digest{};

        mbedtls_sha256_context ctx;
        mbedtls_sha256_init(&ctx);
        int rc = mbedtls_sha256_starts(&ctx, 0);
        if (rc == 0)
          rc = mbedtls_sha256_update(&ctx, reinterpret_cast<const unsigned char*>(input.data()),
                                     input.size());
        if (rc == 0)
          rc = mbedtls_sha256_finish(&ctx, digest.data());
        mbedtls_sha256_free(&ctx);

        if (rc != 0)
          throw std::runtime_error("[TagPayload] sha256 failed, mbedtls rc=" + std::to_string(rc));

        static constexpr char kHex[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(digest.size() * 2);
        for (unsigned char b : digest) {
          hex.push_back(kHex[b >> 4]);
          hex.push_back(kHex[b & 0x0F]);
        }
        return hex;
      }

      // Key-sorted compact JSON so entry order does not change the checksum.
      std::string canonical(const TagPayload::AuxData& data) {
        return nlohmann::json::parse(data.dump()).dump();
      }

      // string-keyed map of primitives, null treated as empty
      TagPayload::AuxData primitiveBag(TagPayload::AuxData data) {
        if (data.is_null())
          return TagPayload::AuxData::object();
        if (!data.is_object())
          throw std::invalid_argument("[TagPayload] additionalData must be an object");
        for (const auto& [key, value] : data.items()) {
          if (!value.is_primitive() || value.is_binary())
            throw std::invalid_argument("[TagPayload] additionalData['" + key +
                                        "'] is not a primitive");
        }
        return data;
      }

      void requireField(const nlohmann::ordered_json& j, const char* key) {
        if (!j.contains(key))
          throw DecodeError(std::string("Failed to decode tag payload: missing field '") + key + "'");
      }

    } // namespace

    TagPayload::TagPayload(std::string locationId, std::string checksum,
                           std::chrono::milliseconds timestamp, AuxData additionalData)
        : locationId_(std::move(locationId)), checksum_(std::move(checksum)), timestamp_(timestamp),
          additionalData_(primitiveBag(std::move(additionalData))) {}

    TagPayload TagPayload::create(std::string locationId,
                                  std::chrono::system_clock::time_point timestamp,
                                  AuxData additionalData) {
      return create(std::move(locationId),
                    std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()),
                    std::move(additionalData));
    }

    TagPayload TagPayload::create(std::string locationId, std::chrono::milliseconds timestamp,
                                  AuxData additionalData) {
      additionalData = primitiveBag(std::move(additionalData));
      auto sum = computeChecksum(locationId, timestamp, additionalData);
      return TagPayload(std::move(locationId), std::move(sum), timestamp, std::move(additionalData));
    }

    std::string TagPayload::computeChecksum(const std::string& locationId,
                                            std::chrono::milliseconds timestamp,
                                            const AuxData& data) {
      const std::string material = locationId + std::to_string(timestamp.count()) + canonical(data);
      return sha256Hex(material).substr(0, tag::kChecksumLength);
    }

    bool TagPayload::isValid() const {
      return checksum_ == computeChecksum(locationId_, timestamp_, additionalData_);
    }

    TagPayload TagPayload::refreshChecksum() const {
      return withChecksum(computeChecksum(locationId_, timestamp_, additionalData_));
    }

    TagPayload TagPayload::withLocationId(std::string locationId) const {
      TagPayload copy = *this;
      copy.locationId_ = std::move(locationId);
      return copy;
    }

    TagPayload TagPayload::withChecksum(std::string checksum) const {
      TagPayload copy = *this;
      copy.checksum_ = std::move(checksum);
      return copy;
    }

    TagPayload TagPayload::withTimestamp(std::chrono::milliseconds timestamp) const {
      TagPayload copy = *this;
      copy.timestamp_ = timestamp;
      return copy;
    }

    TagPayload TagPayload::withAdditionalData(AuxData additionalData) const {
      TagPayload copy = *this;
      copy.additionalData_ = primitiveBag(std::move(additionalData));
      return copy;
    }

    bool TagPayload::isExpired(std::chrono::milliseconds maxAge,
                               std::chrono::system_clock::time_point now) const {
      const auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
      return nowMs - timestamp_ > maxAge;
    }

    std::string TagPayload::toWire() const {
      AuxData j = AuxData::object();
      j["locationId"] = locationId_;
      j["checksum"] = checksum_;
      j["timestamp"] = timestamp_.count();
      j["additionalData"] = additionalData_;
      return j.dump();
    }

    std::vector<std::uint8_t> TagPayload::encode() const {
      const std::string text = toWire();
      return { text.begin(), text.end() };
    }

    TagPayload TagPayload::fromWire(std::string_view text) {
      AuxData j;
      try {
        j = AuxData::parse(text.begin(), text.end());
      } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("Failed to decode tag payload: ") + e.what());
      }

      if (!j.is_object())
        throw DecodeError("Failed to decode tag payload: record is not an object");

      requireField(j, "locationId");
      requireField(j, "checksum");
      requireField(j, "timestamp");

      const auto& id = j["locationId"];
      const auto& sum = j["checksum"];
      const auto& ts = j["timestamp"];
      if (!id.is_string())
        throw DecodeError("Failed to decode tag payload: 'locationId' is not a string");
      if (!sum.is_string())
        throw DecodeError("Failed to decode tag payload: 'checksum' is not a string");
      if (!ts.is_number_integer())
        throw DecodeError("Failed to decode tag payload: 'timestamp' is not an integer");
      if (ts.is_number_unsigned()
              ? ts.get<std::uint64_t>() >
                    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
              : ts.get<std::int64_t>() < 0)
        throw DecodeError("Failed to decode tag payload: 'timestamp' is out of range");

      AuxData extra = AuxData::object();
      if (auto it = j.find("additionalData"); it != j.end() && !it->is_null()) {
        if (!it->is_object())
          throw DecodeError("Failed to decode tag payload: 'additionalData' is not an object");
        for (const auto& [key, value] : it->items()) {
          if (!value.is_primitive() || value.is_binary())
            throw DecodeError("Failed to decode tag payload: additionalData['" + key +
                              "'] is not a primitive");
        }
        extra = *it;
      }

      return TagPayload(id.get<std::string>(), sum.get<std::string>(),
                        std::chrono::milliseconds{ ts.get<std::int64_t>() }, std::move(extra));
    }

    TagPayload TagPayload::decode(std::span<const std::uint8_t> bytes) {
      return fromWire(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }

    bool TagPayload::operator==(const TagPayload& other) const {
      return locationId_ == other.locationId_ && checksum_ == other.checksum_ &&
             timestamp_ == other.timestamp_ && additionalData_ == other.additionalData_;
    }

    namespace tag {

      bool fitsInTag(std::span<const std::uint8_t> encoded, std::size_t budget) {
        return encoded.size() <= budget;
      }

      std::size_t estimateSize(const TagPayload& payload) { return payload.toWire().size(); }

      bool isValidFormat(std::span<const std::uint8_t> bytes) {
        try {
          (void)TagPayload::decode(bytes);
          return true;
        } catch (const DecodeError&) {
          return false;
        }
      }

      TagPayload createWithinBudget(std::string locationId, TagPayload::AuxData additionalData,
                                    std::chrono::milliseconds timestamp, std::size_t budget) {
        if (additionalData.is_null())
          additionalData = TagPayload::AuxData::object();

        auto payload = TagPayload::create(locationId, timestamp, additionalData);
        while (!fitsInTag(payload.encode(), budget) && !additionalData.empty()) {
          additionalData.erase(additionalData.begin());
          payload = TagPayload::create(locationId, timestamp, additionalData);
        }
        return payload;
      }

    } // namespace tag

  } // namespace model
} // namespace wayfinder
