/* @file SerialTagReader.cpp
 * @brief line-framed tag reader: UID lookup or encoded payload, on its own thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>

// Linux headers
#include <errno.h>
#include <unistd.h> // access()

// Wayfinder headers
#include "io/SerialTagReader.hpp"

using namespace wayfinder::io;
using wayfinder::model::DecodeError;
using wayfinder::model::TagPayload;

namespace {
  constexpr auto kPollInterval = std::chrono::milliseconds(100);

  std::string trim(const std::string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                       [](unsigned char c) { return std::isspace(c); })
                          .base();
    return first < last ? std::string(first, last) : std::string{};
  }
} // namespace

SerialTagReader::SerialTagReader(std::string device, unsigned int baud,
                                 std::shared_ptr<const core::LocationGraph> graph,
                                 std::unique_ptr<SerialChannel> channel)
    : device_(std::move(device)), baud_(baud), graph_(std::move(graph)),
      channel_(std::move(channel)) {
  if (!graph_ || !channel_)
    throw std::invalid_argument("[SerialTagReader] graph and channel are required");
}

SerialTagReader::~SerialTagReader() {
  stopScanning();
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (worker_.joinable())
    worker_.join();
}

void SerialTagReader::startScanning() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (scanning_)
    return;
  if (worker_.joinable())
    worker_.join(); // previous loop ended on its own

  if (!channel_->isOpen() && !channel_->open(device_, baud_))
    throw std::runtime_error("[SerialTagReader] cannot open " + device_ + " (" +
                             toString(availability()) + ")");

  scanning_ = true;
  worker_ = std::thread(&SerialTagReader::readLoop, this);
}

void SerialTagReader::stopScanning() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  scanning_ = false;
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

ReaderAvailability SerialTagReader::availability() const {
  if (device_.empty())
    return ReaderAvailability::Unsupported;
  if (::access(device_.c_str(), R_OK | W_OK) == 0)
    return ReaderAvailability::Available;
  switch (errno) {
  case ENOENT:
    return ReaderAvailability::Unsupported;
  case EACCES:
  case EPERM:
    return ReaderAvailability::Disabled;
  default:
    return ReaderAvailability::Unknown;
  }
}

void SerialTagReader::setListener(PayloadCallback onPayload, ErrorCallback onError) {
  std::lock_guard<std::mutex> lock(listenerMtx_);
  onPayload_ = std::move(onPayload);
  onError_ = std::move(onError);
}

std::variant<TagPayload, std::string> SerialTagReader::interpretLine(
    const std::string& line) const {
  const std::string text = trim(line);
  if (text.empty())
    return std::string("empty line");

  if (text.front() == '{') {
    try {
      TagPayload payload = TagPayload::fromWire(text);
      if (!payload.isValid())
        return "checksum mismatch for " + payload.locationId();
      return payload;
    } catch (const DecodeError& e) {
      return std::string("malformed tag payload: ") + e.what();
    }
  }

  std::string serial = text;
  std::transform(serial.begin(), serial.end(), serial.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  const auto location = graph_->findByTagSerial(serial);
  if (!location)
    return "unknown tag serial " + serial;

  TagPayload::AuxData aux = TagPayload::AuxData::object();
  aux["tagSerial"] = serial;
  return TagPayload::create(location->id(), std::chrono::system_clock::now(), std::move(aux));
}

void SerialTagReader::readLoop() {
  while (scanning_) {
    const auto line = channel_->readLine(kPollInterval);
    if (!line) {
      if (!channel_->isOpen()) {
        scanning_ = false;
        emitError("reader disconnected: " + device_);
      }
      continue;
    }
    if (trim(*line).empty())
      continue; // keep-alive

    auto result = interpretLine(*line);
    if (const auto* payload = std::get_if<TagPayload>(&result)) {
      emitPayload(*payload);
    } else {
      ++rejected_;
      std::cerr << "[SerialTagReader] " << std::get<std::string>(result) << "\n";
    }
  }
}

void SerialTagReader::emitPayload(const TagPayload& payload) {
  std::lock_guard<std::mutex> lock(listenerMtx_);
  if (onPayload_)
    onPayload_(payload);
}

void SerialTagReader::emitError(const std::string& message) {
  std::lock_guard<std::mutex> lock(listenerMtx_);
  if (onError_)
    onError_(message);
}
