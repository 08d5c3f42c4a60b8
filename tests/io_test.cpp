#include "core/LocationGraph.hpp"
#include "io/FileLogger.hpp"
#include "io/ReaderFault.hpp"
#include "io/SerialChannel.hpp"
#include "io/SerialTagReader.hpp"
#include "io/TagReader.hpp"
#include "model/TagPayload.hpp"

#include "FakeSerialChannel.hpp"
#include "FakeTagReader.hpp"

#include <gtest/gtest.h>
#include <pty.h> // openpty
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

using namespace wayfinder;
using namespace std::chrono_literals;

//---SerialChannel-------------------------------------------------------------

TEST(serial_channel, opens_writes_closes) {
  // create a false ttyUSB0 "device"
  int masterFd, slaveFd;
  char slaveName[64];
  ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

  io::SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, 115200));
  EXPECT_TRUE(chan.isOpen());

  // Writer on master side
  const char* msg = "04:A1:36:01:B4:44:03\r\n";
  ASSERT_EQ(static_cast<ssize_t>(strlen(msg)), write(masterFd, msg, strlen(msg)));

  auto line = chan.readLine(std::chrono::milliseconds{ 200 });
  ASSERT_TRUE(line);
  EXPECT_EQ(*line, "04:A1:36:01:B4:44:03");

  chan.writeLine("ACK");
  char buf[16] = { 0 };
  ASSERT_GT(read(masterFd, buf, sizeof(buf) - 1), 0);
  EXPECT_STREQ(buf, "ACK\r\n");

  chan.close();
  EXPECT_FALSE(chan.isOpen());
  ::close(slaveFd);
  ::close(masterFd);
}

TEST(serial_channel, frames_on_bare_newline) {
  int masterFd, slaveFd;
  char slaveName[64];
  ASSERT_EQ(0, openpty(&masterFd, &slaveFd, slaveName, nullptr, nullptr));

  io::SerialChannel chan;
  ASSERT_TRUE(chan.open(slaveName, 115200));

  const char* msg = "first\nsecond\n";
  ASSERT_EQ(static_cast<ssize_t>(strlen(msg)), write(masterFd, msg, strlen(msg)));

  EXPECT_EQ(chan.readLine(200ms), "first");
  EXPECT_EQ(chan.readLine(200ms), "second");
  EXPECT_FALSE(chan.readLine(20ms).has_value());

  io::SerialChannel moved(std::move(chan));
  EXPECT_TRUE(moved.isOpen());
  EXPECT_FALSE(chan.isOpen());
  ::close(slaveFd);
  ::close(masterFd);
}

TEST(serial_channel, rejects_unknown_baud_and_missing_device) {
  io::SerialChannel chan;
  EXPECT_FALSE(io::toSpeed(12345).has_value());
  EXPECT_FALSE(chan.open("/dev/null", 12345));
  EXPECT_FALSE(chan.open("/dev/does-not-exist", 115200));
  EXPECT_FALSE(chan.isOpen());
  EXPECT_FALSE(chan.readLine(1ms).has_value());
}

//---FileLogger----------------------------------------------------------------

TEST(file_logger, buffers_until_flush) {
  const auto path = (std::filesystem::temp_directory_path() / "wayfinder_file_logger.csv").string();
  io::FileLogger log;
  ASSERT_TRUE(log.open(path));
  EXPECT_TRUE(log.write("a,b\n"));
  EXPECT_EQ(std::filesystem::file_size(path), 0u);
  EXPECT_TRUE(log.flush());
  EXPECT_EQ(std::filesystem::file_size(path), 4u);

  io::FileLogger other(std::move(log));
  EXPECT_FALSE(log.isOpen());
  EXPECT_FALSE(log.write("lost\n"));
  other.close();
  std::remove(path.c_str());
}

//---ScanLease-----------------------------------------------------------------

TEST(scan_lease, scanning_follows_lease_lifetime) {
  test::FakeTagReader reader;
  {
    io::ScanLease lease(reader);
    EXPECT_TRUE(reader.isScanning());

    io::ScanLease moved(std::move(lease));
    EXPECT_FALSE(lease.active());
    EXPECT_TRUE(moved.active());
  }
  EXPECT_FALSE(reader.isScanning());
  EXPECT_EQ(reader.start_calls, 1);
  EXPECT_EQ(reader.stop_calls, 1);
}

TEST(scan_lease, failed_start_leaves_no_lease) {
  test::FakeTagReader reader;
  reader.fail_start = true;
  EXPECT_THROW(io::ScanLease lease(reader), std::runtime_error);
  EXPECT_EQ(reader.stop_calls, 0);
}

TEST(scan_lease, explicit_release_reports_and_destructor_does_not) {
  test::FakeTagReader reader;
  reader.fail_stop = true;
  {
    io::ScanLease lease(reader);
    EXPECT_THROW(lease.release(), std::runtime_error);
    EXPECT_FALSE(lease.active());
  }
  {
    io::ScanLease lease(reader);
    // destructor swallows the failure
  }
  EXPECT_EQ(reader.stop_calls, 2);
}

//---SerialTagReader-----------------------------------------------------------

class SerialTagReaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    graph = std::make_shared<const core::InMemoryLocationGraph>(
        core::InMemoryLocationGraph::demoFacility());
    auto fake = std::make_unique<test::FakeSerialChannel>();
    channel = fake.get();
    reader = std::make_unique<io::SerialTagReader>("/dev/fake-reader", 115200, graph,
                                                   std::move(fake));
    reader->setListener(
        [this](const model::TagPayload& p) {
          std::lock_guard<std::mutex> lock(mtx);
          payloads.push_back(p);
          cv.notify_all();
        },
        [this](const std::string& e) {
          std::lock_guard<std::mutex> lock(mtx);
          errors.push_back(e);
          cv.notify_all();
        });
  }

  void TearDown() override { reader.reset(); }

  template <typename Pred> bool waitFor(Pred pred) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, 2s, pred);
  }

  std::shared_ptr<const core::LocationGraph> graph;
  test::FakeSerialChannel* channel{ nullptr };
  std::unique_ptr<io::SerialTagReader> reader;

  std::mutex mtx;
  std::condition_variable cv;
  std::vector<model::TagPayload> payloads;
  std::vector<std::string> errors;
};

TEST_F(SerialTagReaderTest, bare_serial_resolves_through_catalog) {
  const auto result = reader->interpretLine("  04:a1:3b:01:2c:44:03 \r");
  ASSERT_TRUE(std::holds_alternative<model::TagPayload>(result));
  const auto& p = std::get<model::TagPayload>(result);
  EXPECT_EQ(p.locationId(), "Main Office");
  EXPECT_TRUE(p.isValid());
  EXPECT_EQ(p.additionalData()["tagSerial"], "04:A1:3B:01:2C:44:03");
}

TEST_F(SerialTagReaderTest, encoded_payload_is_verified) {
  const auto good = model::TagPayload::create("CP5");
  auto result = reader->interpretLine(good.toWire());
  ASSERT_TRUE(std::holds_alternative<model::TagPayload>(result));
  EXPECT_EQ(std::get<model::TagPayload>(result), good);

  result = reader->interpretLine(good.withLocationId("CP6").toWire());
  ASSERT_TRUE(std::holds_alternative<std::string>(result));
  EXPECT_NE(std::get<std::string>(result).find("checksum mismatch"), std::string::npos);

  result = reader->interpretLine("{\"locationId\": ");
  ASSERT_TRUE(std::holds_alternative<std::string>(result));
  EXPECT_NE(std::get<std::string>(result).find("malformed"), std::string::npos);

  result = reader->interpretLine("FF:FF:FF");
  ASSERT_TRUE(std::holds_alternative<std::string>(result));
  EXPECT_NE(std::get<std::string>(result).find("unknown tag serial"), std::string::npos);
}

TEST_F(SerialTagReaderTest, scanning_delivers_good_lines_only) {
  channel->push("04:A1:7E:01:E6:44:03");
  channel->push("garbage");
  channel->push("");
  channel->push(model::TagPayload::create("CP5").toWire());

  reader->startScanning();
  EXPECT_TRUE(reader->isScanning());
  ASSERT_TRUE(waitFor([this] { return payloads.size() == 2; }));
  reader->stopScanning();
  EXPECT_FALSE(reader->isScanning());

  EXPECT_EQ(payloads[0].locationId(), "Main Entrance");
  EXPECT_EQ(payloads[1].locationId(), "CP5");
  EXPECT_EQ(reader->rejected(), 1u);
  EXPECT_TRUE(errors.empty());
  EXPECT_EQ(channel->open_calls, 1);
}

TEST_F(SerialTagReaderTest, lost_channel_is_reported) {
  reader->startScanning();
  channel->disconnect();
  ASSERT_TRUE(waitFor([this] { return !errors.empty(); }));
  EXPECT_NE(errors.front().find("reader disconnected"), std::string::npos);
  reader->stopScanning();
}

TEST_F(SerialTagReaderTest, unopenable_device_throws_on_start) {
  channel->open_result = false;
  try {
    reader->startScanning();
    FAIL() << "startScanning should throw";
  } catch (const std::runtime_error& e) {
    EXPECT_EQ(io::classifyReaderError(e.what()).kind, io::ReaderFaultKind::HardwareUnavailable);
  }
  EXPECT_FALSE(reader->isScanning());
}

TEST(serial_tag_reader, availability_reflects_the_device_node) {
  auto graph = std::make_shared<const core::InMemoryLocationGraph>();
  EXPECT_EQ(io::SerialTagReader("", 115200, graph).availability(),
            io::ReaderAvailability::Unsupported);
  EXPECT_EQ(io::SerialTagReader("/dev/does-not-exist", 115200, graph).availability(),
            io::ReaderAvailability::Unsupported);
}

TEST(reader_fault, classifies_by_message) {
  using io::ReaderFaultKind;
  EXPECT_EQ(io::classifyReaderError("Permission denied: /dev/ttyUSB0").kind,
            ReaderFaultKind::PermissionDenied);
  EXPECT_EQ(io::classifyReaderError("reader disabled").kind, ReaderFaultKind::ReaderDisabled);
  EXPECT_EQ(io::classifyReaderError("reader disconnected: /dev/ttyUSB0").kind,
            ReaderFaultKind::HardwareUnavailable);
  EXPECT_EQ(io::classifyReaderError("scan TIMED OUT").kind, ReaderFaultKind::ScanTimeout);
  EXPECT_EQ(io::classifyReaderError("malformed payload").kind, ReaderFaultKind::TagReadError);
  EXPECT_EQ(io::classifyReaderError("reader busy").kind, ReaderFaultKind::Unknown);
}

TEST(reader_fault, recovery_paths_split_retry_from_manual) {
  const auto lost = io::classifyReaderError("reader disconnected");
  EXPECT_TRUE(io::shouldOfferManualSelection(lost));
  EXPECT_FALSE(io::shouldOfferRetry(lost));

  const auto unreadable = io::classifyReaderError("checksum mismatch");
  EXPECT_TRUE(io::shouldOfferRetry(unreadable));
  EXPECT_FALSE(io::shouldOfferManualSelection(unreadable));

  const auto odd = io::classifyReaderError("reader busy");
  EXPECT_FALSE(io::shouldOfferRetry(odd));
  EXPECT_FALSE(io::shouldOfferManualSelection(odd));
}

TEST(reader_fault, availability_maps_to_a_fault) {
  EXPECT_EQ(io::faultFor(io::ReaderAvailability::Disabled).kind,
            io::ReaderFaultKind::ReaderDisabled);
  EXPECT_EQ(io::faultFor(io::ReaderAvailability::Unsupported).kind,
            io::ReaderFaultKind::HardwareUnavailable);
  EXPECT_EQ(io::faultFor(io::ReaderAvailability::Unknown).kind, io::ReaderFaultKind::Unknown);
}

TEST(reader_fault, guidance_lists_numbered_suggestions) {
  const auto guidance = io::formatGuidance(io::classifyReaderError("reader disconnected"));
  EXPECT_EQ(guidance, "The tag reader is not available\n"
                      "What you can try:\n"
                      "1. Check that the reader is plugged in\n"
                      "2. Use manual check-in instead");
}
