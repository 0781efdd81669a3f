#pragma once

#include <memory>
#include <string>

#include "services/transport/transport.h"

namespace concmon {
namespace transport {

/**
 * @brief PUB side of a ZeroMQ topic bus.
 *
 * open() binds the endpoint (e.g. "tcp://*:5555"); each send() is one
 * two-frame message: the channel as topic, then the payload. Subscribers
 * filter on the topic prefix.
 */
class ZmqTransport : public Transport {
 public:
  explicit ZmqTransport(const std::string& endpoint);
  ~ZmqTransport() override;

  bool open() override;
  void close() override;
  bool isOpen() const override;

  bool send(const std::string& topic, const Payload& data) override;

  // Last ZeroMQ error text, empty when none.
  std::string lastError() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transport
}  // namespace concmon
