#include "services/publish/sample_publisher.h"

#include <utility>
#include <vector>

namespace concmon {

namespace {

const char* TAG = "PUBLISHER";

}  // namespace

nlohmann::json createEnvelopeJson(const FanoutMessage& message) {
  nlohmann::json value;
  if (const double* d = std::get_if<double>(&message.value)) {
    value = *d;
  } else if (const bool* b = std::get_if<bool>(&message.value)) {
    value = *b;
  } else {
    value = std::get<std::string>(message.value);
  }

  nlohmann::json j;
  j["timestamp"] = toEpochMillis(message.timestamp);
  j["device_id"] = message.source;
  j["status"] = "OK";
  j["data"][message.key] = value;
  return j;
}

std::string envelopeTopic(const FanoutMessage& message) {
  return message.source + "/" + message.key;
}

SamplePublisher::SamplePublisher(transport::Transport& transport,
                                 FanoutChannel::Subscription subscription,
                                 TimeSource& time, Logger& logger)
    : transport_(transport),
      subscription_(std::move(subscription)),
      time_(time),
      log_(logger) {}

void SamplePublisher::run(const std::atomic<bool>& running) {
  log_.info(TAG, "Sample publisher started");
  while (running) {
    flush();
    if (!time_.sleepFor(FLUSH_INTERVAL)) break;
  }
  flush();
  log_.info(TAG, "Sample publisher stopped, " + std::to_string(sent_) +
                     " messages sent, " + std::to_string(failed_) + " failed");
}

std::size_t SamplePublisher::flush() {
  std::vector<FanoutMessage> messages;
  subscription_->drain(messages);

  std::size_t n = 0;
  for (const auto& m : messages) {
    std::string body = createEnvelopeJson(m).dump();
    transport::Transport::Payload payload(body.begin(), body.end());
    if (transport_.send(envelopeTopic(m), payload)) {
      ++sent_;
      ++n;
      if (failing_) {
        log_.info(TAG, "Publishing resumed");
        failing_ = false;
      }
    } else {
      ++failed_;
      if (!failing_) {
        log_.warn(TAG, "Publish failed for " + envelopeTopic(m) +
                           ", dropping messages until the bus recovers");
        failing_ = true;
      }
    }
  }
  return n;
}

}  // namespace concmon
