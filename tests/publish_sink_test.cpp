#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "services/publish/publish_sink.h"
#include "test_support.h"

using namespace concmon;
using testing_support::LogCapture;

namespace {

Sample conductivitySample() {
  Sample s;
  s.source = "rs485";
  s.timestamp = TimePoint(std::chrono::seconds(1000));
  s.measurements = {{"conductivity", 12500.0}, {"concentration", 1.023885}};
  s.raw_registers = {0x4643, 0x5000};
  return s;
}

}  // namespace

class PublishSinkTest : public ::testing::Test {
 protected:
  PublishSinkTest()
      : store_(1, TableSizes()),
        sub_(channel_.subscribe("test", 64)),
        sink_(store_, channel_, logs_.logger) {}

  LogCapture logs_;
  SlaveDataStore store_;
  FanoutChannel channel_;
  FanoutChannel::Subscription sub_;
  DataStorePublishSink sink_;
};

TEST(ConcentrationRegisterTest, ScalesTruncatesAndClamps) {
  EXPECT_EQ(concentrationRegister(1.023885, 100.0), 102);
  EXPECT_EQ(concentrationRegister(0.0, 100.0), 0);
  EXPECT_EQ(concentrationRegister(-3.0, 100.0), 0);
  EXPECT_EQ(concentrationRegister(1000.0, 100.0), 65535);
  EXPECT_EQ(concentrationRegister(1.023885, 1000.0), 1023);
}

TEST_F(PublishSinkTest, MirrorsRawWordsAndConcentration) {
  PublishTarget target;
  target.write_address = 0;
  target.write_address_concentration = 2;

  sink_.publishSample(conductivitySample(), target);

  std::vector<uint16_t> regs;
  ASSERT_TRUE(store_.readHoldingRegisters(0, 3, regs).ok());
  EXPECT_EQ(regs, (std::vector<uint16_t>{0x4643, 0x5000, 102}));
}

TEST_F(PublishSinkTest, DisabledTargetsWriteNothing) {
  sink_.publishSample(conductivitySample(), PublishTarget());

  std::vector<uint16_t> regs;
  ASSERT_TRUE(store_.readHoldingRegisters(0, 100, regs).ok());
  for (uint16_t r : regs) EXPECT_EQ(r, 0);
  // Fan-out still happens
  EXPECT_EQ(sub_->size(), 2u);
}

TEST_F(PublishSinkTest, FansOutMeasurementsThenDiscretesInOrder) {
  Sample s = conductivitySample();
  s.discretes = {{"red", true}, {"green", false}};
  PublishTarget target;
  target.discrete_write_address = 5;

  sink_.publishSample(s, target);

  std::vector<FanoutMessage> out;
  sub_->drain(out);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(out[0].key, "conductivity");
  EXPECT_EQ(out[1].key, "concentration");
  EXPECT_EQ(out[2].key, "red");
  EXPECT_TRUE(std::get<bool>(out[2].value));
  EXPECT_EQ(out[3].key, "green");
  for (const auto& m : out) {
    EXPECT_EQ(m.source, "rs485");
    EXPECT_EQ(m.timestamp, s.timestamp);
  }

  std::vector<bool> bits;
  ASSERT_TRUE(store_.readDiscreteInputs(5, 2, bits).ok());
  EXPECT_EQ(bits, (std::vector<bool>{true, false}));
}

TEST_F(PublishSinkTest, StoreErrorIsLoggedAndDoesNotStopFanOut) {
  PublishTarget target;
  target.write_address = 99;  // two words do not fit in a 100-register table

  sink_.publishSample(conductivitySample(), target);

  EXPECT_EQ(logs_.count(LogLevel::WARN, "Store write"), 1u);
  EXPECT_EQ(sub_->size(), 2u);
}

TEST_F(PublishSinkTest, StatusIsAStringMessage) {
  TimePoint t(std::chrono::seconds(5));
  sink_.publishStatus("rs485", "rs485 OK | 10:00:00", t);

  FanoutMessage m;
  ASSERT_TRUE(sub_->tryPop(m));
  EXPECT_EQ(m.key, "status");
  EXPECT_EQ(std::get<std::string>(m.value), "rs485 OK | 10:00:00");
  EXPECT_EQ(m.timestamp, t);
}
