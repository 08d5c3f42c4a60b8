#include "model/Location.hpp"
#include "model/Route.hpp"
#include "model/TagPayload.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using namespace wayfinder::model;
using namespace std::chrono_literals;

namespace {
  const std::chrono::milliseconds kStamp{ 1'700'000'000'000 };

  TagPayload::AuxData aux(std::initializer_list<std::pair<const char*, TagPayload::AuxData>> kv) {
    TagPayload::AuxData j = TagPayload::AuxData::object();
    for (const auto& [k, v] : kv)
      j[k] = v;
    return j;
  }
} // namespace

//---Location------------------------------------------------------------------

TEST(location, json_keeps_every_field) {
  Location loc("CP5", "Checkpoint 5", "Main entrance area checkpoint", Coordinates{ 968, 1115 },
               { "CP6", "Main Office" }, LocationType::Hallway, { { "floor", 1 } },
               "04:A1:36:01:B4:44:03");

  nlohmann::json j = loc;
  EXPECT_EQ(j["connectedLocationIds"].size(), 2u);
  EXPECT_EQ(j["type"], "hallway");
  EXPECT_EQ(j["nfcTagSerial"], "04:A1:36:01:B4:44:03");
  EXPECT_EQ(j.get<Location>(), loc);
}

TEST(location, unknown_type_name_reads_as_room) {
  EXPECT_EQ(locationTypeFromString("ballroom"), LocationType::Room);
  EXPECT_EQ(locationTypeFromString("stairs"), LocationType::Stairs);
}

TEST(location, adjacency_is_declared_per_node) {
  Location a("A", "A", "", { 0, 0 }, { "B" }, LocationType::Room);
  Location b("B", "B", "", { 3, 4 }, {}, LocationType::Room);
  EXPECT_TRUE(a.isAdjacentTo("B"));
  EXPECT_FALSE(b.isAdjacentTo("A"));
  EXPECT_DOUBLE_EQ(distanceBetween(a.coordinates(), b.coordinates()), 5.0);
}

//---Route---------------------------------------------------------------------

TEST(route, lookups_follow_the_path) {
  Route r;
  r.id = "r1";
  r.startLocationId = "A";
  r.endLocationId = "C";
  r.path = { "A", "B", "C" };
  r.estimatedDistance = 100.0;
  r.estimatedTime = 60s;
  r.instructions = {
    { "instruction_0", InstructionType::Start, "Start at A towards B", "A", "B", Direction::Forward, 40.0 },
    { "instruction_1", InstructionType::Destination, "Arrive at C", "B", "C", Direction::Left, 60.0 },
  };

  EXPECT_TRUE(r.isValid());
  EXPECT_EQ(r.indexOf("B"), 1u);
  EXPECT_FALSE(r.indexOf("Z").has_value());
  ASSERT_TRUE(r.nextInstruction("B"));
  EXPECT_EQ(r.nextInstruction("B")->toLocationId, "C");
  EXPECT_FALSE(r.nextInstruction("C").has_value());
  EXPECT_DOUBLE_EQ(r.totalInstructionDistance(), 100.0);

  nlohmann::json j = r;
  EXPECT_EQ(j["estimatedTimeMs"], 60000);
  EXPECT_EQ(j["instructions"][1]["direction"], "left");
}

TEST(route, mismatched_endpoints_are_invalid) {
  Route r;
  r.startLocationId = "A";
  r.endLocationId = "B";
  r.path = { "A", "C" };
  EXPECT_FALSE(r.isValid());

  r.path.clear();
  EXPECT_FALSE(r.isValid());
}

//---TagPayload----------------------------------------------------------------

TEST(tag_payload, created_payload_is_valid_and_survives_the_wire) {
  auto p = TagPayload::create("CP3", kStamp, aux({ { "floor", 2 }, { "wing", "east" } }));
  EXPECT_TRUE(p.isValid());
  EXPECT_EQ(p.checksum().size(), tag::kChecksumLength);

  const auto bytes = p.encode();
  const auto back = TagPayload::decode(bytes);
  EXPECT_EQ(back, p);
  EXPECT_TRUE(back.isValid());
}

TEST(tag_payload, creation_truncates_to_whole_milliseconds) {
  const auto tp = std::chrono::system_clock::time_point{ kStamp + 750us };
  auto p = TagPayload::create("CP3", tp);
  EXPECT_EQ(p.timestamp(), kStamp);
  EXPECT_TRUE(p.isValid());
}

TEST(tag_payload, any_edit_breaks_the_checksum) {
  auto p = TagPayload::create("CP3", kStamp, aux({ { "floor", 2 } }));

  EXPECT_FALSE(p.withLocationId("CP4").isValid());
  EXPECT_FALSE(p.withTimestamp(kStamp + 1ms).isValid());
  EXPECT_FALSE(p.withAdditionalData(aux({ { "floor", 3 } })).isValid());
  EXPECT_FALSE(p.withChecksum("0000000000000000").isValid());
}

TEST(tag_payload, refresh_restores_validity_without_touching_fields) {
  auto edited = TagPayload::create("CP3", kStamp).withLocationId("CP4");
  auto fixed = edited.refreshChecksum();

  EXPECT_TRUE(fixed.isValid());
  EXPECT_EQ(fixed.locationId(), "CP4");
  EXPECT_EQ(fixed.timestamp(), kStamp);
  EXPECT_EQ(fixed.additionalData(), edited.additionalData());
}

TEST(tag_payload, checksum_ignores_auxiliary_key_order) {
  auto a = TagPayload::create("CP1", kStamp, aux({ { "b", 1 }, { "a", "x" } }));
  auto b = TagPayload::create("CP1", kStamp, aux({ { "a", "x" }, { "b", 1 } }));
  EXPECT_EQ(a.checksum(), b.checksum());
}

TEST(tag_payload, malformed_bytes_throw_decode_error) {
  EXPECT_THROW(TagPayload::fromWire("not json"), DecodeError);
  EXPECT_THROW(TagPayload::fromWire("[1,2,3]"), DecodeError);
  EXPECT_THROW(TagPayload::fromWire(R"({"checksum":"x","timestamp":1})"), DecodeError);
  EXPECT_THROW(TagPayload::fromWire(R"({"locationId":"A","checksum":"x","timestamp":"1"})"),
               DecodeError);
  EXPECT_THROW(TagPayload::fromWire(
                   R"({"locationId":"A","checksum":"x","timestamp":1,"additionalData":{"n":{"deep":1}}})"),
               DecodeError);

  const std::string junk = "{\"locationId\":";
  const std::vector<std::uint8_t> bytes(junk.begin(), junk.end());
  EXPECT_FALSE(tag::isValidFormat(bytes));
}

TEST(tag_payload, timestamp_outside_signed_millis_is_rejected) {
  EXPECT_THROW(TagPayload::fromWire(
                   R"({"locationId":"A","checksum":"x","timestamp":18446744073709551615})"),
               DecodeError);
  EXPECT_THROW(TagPayload::fromWire(R"({"locationId":"A","checksum":"x","timestamp":-5})"),
               DecodeError);
  const auto latest = TagPayload::fromWire(
      R"({"locationId":"A","checksum":"x","timestamp":9223372036854775807})");
  EXPECT_EQ(latest.timestamp().count(), std::numeric_limits<std::int64_t>::max());
}

TEST(tag_payload, auxiliary_values_must_be_flat_primitives) {
  const auto nested = TagPayload::AuxData::object({ { "wing", "B" } });
  EXPECT_THROW(TagPayload::create("CP1", kStamp, aux({ { "floorPlan", nested } })),
               std::invalid_argument);
  EXPECT_THROW(TagPayload::create("CP1", kStamp, TagPayload::AuxData::array({ 1, 2 })),
               std::invalid_argument);

  auto p = TagPayload::create("CP1", kStamp, TagPayload::AuxData());
  EXPECT_TRUE(p.additionalData().is_object());
  EXPECT_TRUE(p.isValid());
  EXPECT_THROW(p.withAdditionalData(aux({ { "rooms", TagPayload::AuxData::array({ 1 }) } })),
               std::invalid_argument);
}

TEST(tag_payload, missing_additional_data_decodes_as_empty) {
  auto p = TagPayload::fromWire(R"({"locationId":"A","checksum":"abc","timestamp":5})");
  EXPECT_TRUE(p.additionalData().is_object());
  EXPECT_TRUE(p.additionalData().empty());
}

TEST(tag_payload, expiry_is_measured_from_the_stamp) {
  auto p = TagPayload::create("CP1", kStamp);
  const auto now = std::chrono::system_clock::time_point{ kStamp + 10min };
  EXPECT_TRUE(p.isExpired(5min, now));
  EXPECT_FALSE(p.isExpired(15min, now));
}

TEST(tag_budget, oldest_auxiliary_entries_go_first) {
  auto data = aux({ { "history", std::string(300, 'h') }, { "note", "keep" } });

  auto p = tag::createWithinBudget("CP1", data, kStamp, 200);
  EXPECT_TRUE(p.isValid());
  EXPECT_LE(p.encode().size(), 200u);
  EXPECT_FALSE(p.additionalData().contains("history"));
  EXPECT_EQ(p.additionalData()["note"], "keep");
}

TEST(tag_budget, payload_that_fits_is_untouched) {
  auto data = aux({ { "a", 1 }, { "b", 2 } });
  auto p = tag::createWithinBudget("CP1", data, kStamp);
  EXPECT_EQ(p.additionalData(), data);
  EXPECT_TRUE(tag::fitsInTag(p.encode()));
  EXPECT_EQ(tag::estimateSize(p), p.encode().size());
}
