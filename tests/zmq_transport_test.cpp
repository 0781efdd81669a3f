#include <gtest/gtest.h>

#include <string>

#include "services/transport/zmq/zmq_transport.h"

using concmon::transport::Transport;
using concmon::transport::ZmqTransport;

namespace {

Transport::Payload bytes(const std::string& text) {
  return Transport::Payload(text.begin(), text.end());
}

}  // namespace

TEST(ZmqTransportTest, SendBeforeOpenFails) {
  ZmqTransport bus("tcp://127.0.0.1:15555");
  EXPECT_FALSE(bus.isOpen());
  EXPECT_FALSE(bus.send("rs485/conductivity", bytes("{}")));
  EXPECT_EQ(bus.lastError(), "socket not open");
}

TEST(ZmqTransportTest, OpenBindsAndSendsWithoutSubscribers) {
  ZmqTransport bus("tcp://127.0.0.1:15556");
  ASSERT_TRUE(bus.open()) << bus.lastError();
  EXPECT_TRUE(bus.isOpen());
  EXPECT_TRUE(bus.open());

  // PUB drops messages nobody subscribed to; the send itself succeeds
  EXPECT_TRUE(bus.send("rs485/conductivity", bytes("{\"data\":{}}")));

  bus.close();
  EXPECT_FALSE(bus.isOpen());
  bus.close();
}

TEST(ZmqTransportTest, BadEndpointIsReported) {
  ZmqTransport bus("nonsense://endpoint");
  EXPECT_FALSE(bus.open());
  EXPECT_FALSE(bus.isOpen());
  EXPECT_FALSE(bus.lastError().empty());
}
