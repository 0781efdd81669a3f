#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "services/acquisition/acquisition_loop.h"
#include "services/codec/register_codec.h"
#include "services/publish/publish_sink.h"
#include "test_support.h"

using namespace concmon;
using testing_support::FakeSession;
using testing_support::FakeTimeSource;
using testing_support::LogCapture;
using testing_support::drainKey;

namespace {

std::vector<uint16_t> frameFor(float value) {
  auto words = encodeFloat32(value, WordOrder::BIG);
  return {words[0], words[1]};
}

}  // namespace

class AcquisitionLoopTest : public ::testing::Test {
 protected:
  AcquisitionLoopTest()
      : store_(1, TableSizes()),
        sub_(channel_.subscribe("test", 1024)),
        sink_(store_, channel_, logs_.logger) {}

  // RS485 conductivity sensor as deployed: one float32 at 0, big word order
  static InstrumentConfig serialConfig() {
    InstrumentConfig c;
    c.name = "rs485";
    c.transport = TransportKind::SERIAL;
    c.unit_id = 1;
    c.read_address = 0;
    c.read_count = 2;
    c.word_order = WordOrder::BIG;
    c.channels = {ChannelConfig{"conductivity", 0, ValueType::FLOAT32, 1.0}};
    c.derive_concentration = true;
    c.poll_interval = std::chrono::milliseconds(1000);
    c.reconnect_delay = std::chrono::milliseconds(5000);
    c.setup.enabled = false;
    c.target.write_address = 0;
    c.target.write_address_concentration = 2;
    return c;
  }

  void makeLoop(const InstrumentConfig& config) {
    auto session = std::make_unique<FakeSession>();
    session_ = session.get();
    configure(*session_);
    loop_ = std::make_unique<AcquisitionLoop>(config, std::move(session),
                                              model_, sink_, time_,
                                              logs_.logger);
  }

  // Hook for tests that script the session before the loop owns it.
  std::function<void(FakeSession&)> configure = [](FakeSession&) {};

  LogCapture logs_;
  FakeTimeSource time_;
  CalibrationModel model_;
  SlaveDataStore store_;
  FanoutChannel channel_;
  FanoutChannel::Subscription sub_;
  DataStorePublishSink sink_;

  FakeSession* session_ = nullptr;
  std::unique_ptr<AcquisitionLoop> loop_;
};

TEST_F(AcquisitionLoopTest, ReachesPollingAfterNFailedConnects) {
  const int N = 3;
  configure = [](FakeSession& s) { s.connect_failures = 3; };
  makeLoop(serialConfig());

  for (int i = 0; i < N; ++i) {
    EXPECT_TRUE(loop_->step());
    EXPECT_EQ(loop_->state(), LoopState::FAULTED);
  }
  ASSERT_EQ(time_.sleeps.size(), static_cast<std::size_t>(N));
  for (const auto& d : time_.sleeps) {
    EXPECT_EQ(d, std::chrono::milliseconds(5000));
  }
  EXPECT_EQ(logs_.count(LogLevel::ERROR, "Connection failed"),
            static_cast<std::size_t>(N));
  EXPECT_EQ(session_->data_reads, 0);

  EXPECT_TRUE(loop_->step());
  EXPECT_EQ(loop_->state(), LoopState::POLLING);
  EXPECT_EQ(time_.sleeps.back(), std::chrono::milliseconds(1000));

  LoopCounters c = loop_->counters();
  EXPECT_EQ(c.connect_attempts, 4u);
  EXPECT_EQ(c.connect_failures, 3u);
  EXPECT_EQ(c.samples, 1u);
  EXPECT_EQ(c.faults, 0u);
}

TEST_F(AcquisitionLoopTest, ReadErrorClosesSessionAndReconnectsNextStep) {
  configure = [](FakeSession& s) {
    s.frames.push_back({Status(), frameFor(12500.0f)});
    s.frames.push_back({Status(ErrorCode::READ_ERROR, "CRC error"), {}});
    s.frames.push_back({Status(), frameFor(12600.0f)});
  };
  makeLoop(serialConfig());

  loop_->step();
  EXPECT_EQ(session_->connect_calls, 1);
  EXPECT_EQ(loop_->counters().samples, 1u);

  loop_->step();
  EXPECT_EQ(loop_->state(), LoopState::FAULTED);
  EXPECT_FALSE(session_->isOpen());
  EXPECT_EQ(session_->state(), ConnectionState::DISCONNECTED);
  EXPECT_EQ(loop_->counters().faults, 1u);
  EXPECT_EQ(logs_.count(LogLevel::ERROR, "CRC error"), 1u);

  loop_->step();
  EXPECT_EQ(session_->connect_calls, 2);
  EXPECT_EQ(session_->io_while_closed, 0);
  EXPECT_EQ(session_->data_reads, 3);
  EXPECT_EQ(loop_->counters().samples, 2u);
}

TEST_F(AcquisitionLoopTest, TimeoutThenThreePollsPublishThreeOrderedSamples) {
  configure = [](FakeSession& s) {
    s.frames.push_back(
        {Status(ErrorCode::READ_ERROR, "Connection timed out"), {}});
    for (int i = 0; i < 3; ++i) {
      s.frames.push_back({Status(), frameFor(12500.0f + i)});
    }
  };
  makeLoop(serialConfig());
  // Frozen clock: consecutive samples would otherwise share a timestamp
  time_.advance_on_sleep = false;

  for (int i = 0; i < 4; ++i) loop_->step();

  auto samples = drainKey(*sub_, "conductivity");
  ASSERT_EQ(samples.size(), 3u);
  for (std::size_t i = 1; i < samples.size(); ++i) {
    EXPECT_LT(samples[i - 1].timestamp, samples[i].timestamp);
  }
  EXPECT_DOUBLE_EQ(std::get<double>(samples[0].value), 12500.0);
  EXPECT_DOUBLE_EQ(std::get<double>(samples[2].value), 12502.0);
}

TEST_F(AcquisitionLoopTest, EndToEndConductivityToConcentrationRegister) {
  configure = [](FakeSession& s) { s.default_frame = {0x4643, 0x5000}; };
  makeLoop(serialConfig());

  loop_->step();

  std::vector<FanoutMessage> out;
  sub_->drain(out);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].key, "conductivity");
  EXPECT_DOUBLE_EQ(std::get<double>(out[0].value), 12500.0);
  EXPECT_EQ(out[1].key, "concentration");
  EXPECT_NEAR(std::get<double>(out[1].value), 1.023885, 1e-9);
  EXPECT_EQ(out[2].key, "status");
  EXPECT_NE(std::get<std::string>(out[2].value).find("rs485 OK | "),
            std::string::npos);

  std::vector<uint16_t> regs;
  ASSERT_TRUE(store_.readHoldingRegisters(0, 3, regs).ok());
  EXPECT_EQ(regs, (std::vector<uint16_t>{0x4643, 0x5000, 102}));
}

TEST_F(AcquisitionLoopTest, SetupWritesModeRegisterOnce) {
  configure = [](FakeSession& s) { s.mode_register = 0; };
  InstrumentConfig config = serialConfig();
  config.setup.enabled = true;
  makeLoop(config);

  loop_->step();
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::APPLIED);
  ASSERT_EQ(session_->writes.size(), 1u);
  EXPECT_EQ(session_->writes[0], (std::pair<uint16_t, uint16_t>(32, 1)));

  loop_->step();
  loop_->step();
  EXPECT_EQ(session_->mode_reads, 1);
  EXPECT_EQ(session_->writes.size(), 1u);
}

TEST_F(AcquisitionLoopTest, SetupAlreadySetDoesNotWrite) {
  configure = [](FakeSession& s) { s.mode_register = 1; };
  InstrumentConfig config = serialConfig();
  config.setup.enabled = true;
  makeLoop(config);

  loop_->step();
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::ALREADY_SET);
  EXPECT_TRUE(session_->writes.empty());
  EXPECT_EQ(loop_->counters().samples, 1u);
}

TEST_F(AcquisitionLoopTest, FailedSetupLatchesAndIsNeverRetried) {
  configure = [](FakeSession& s) {
    s.mode_read_status = Status(ErrorCode::READ_ERROR, "Illegal data address");
  };
  InstrumentConfig config = serialConfig();
  config.setup.enabled = true;
  makeLoop(config);

  loop_->step();
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::FAILED);
  // The failed read faulted the link
  EXPECT_EQ(loop_->state(), LoopState::FAULTED);
  EXPECT_FALSE(session_->isOpen());

  loop_->step();
  loop_->step();
  EXPECT_EQ(session_->mode_reads, 1);
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::FAILED);
  EXPECT_EQ(loop_->counters().samples, 2u);
}

TEST_F(AcquisitionLoopTest, FailedSetupWriteLatchesAsFailed) {
  configure = [](FakeSession& s) {
    s.mode_register = 0;
    s.mode_write_status = Status(ErrorCode::WRITE_ERROR, "Illegal function");
  };
  InstrumentConfig config = serialConfig();
  config.setup.enabled = true;
  makeLoop(config);

  loop_->step();
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::FAILED);
}

TEST_F(AcquisitionLoopTest, DisabledSetupIsSkipped) {
  makeLoop(serialConfig());
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::NOT_ATTEMPTED);
  loop_->step();
  EXPECT_EQ(loop_->configOutcome(), ConfigOutcome::SKIPPED);
  EXPECT_EQ(session_->mode_reads, 0);
}

TEST_F(AcquisitionLoopTest, NegativeConductivityPublishesZeroConcentration) {
  configure = [](FakeSession& s) { s.default_frame = frameFor(-25.0f); };
  makeLoop(serialConfig());

  loop_->step();

  auto conc = drainKey(*sub_, "concentration");
  ASSERT_EQ(conc.size(), 1u);
  EXPECT_EQ(std::get<double>(conc[0].value), 0.0);
  EXPECT_EQ(logs_.count(LogLevel::WARN, "Negative conductivity"), 1u);
}

TEST_F(AcquisitionLoopTest, NonNumericConductivityDoesNotStopThePipeline) {
  configure = [](FakeSession& s) {
    s.default_frame = frameFor(std::numeric_limits<float>::quiet_NaN());
  };
  makeLoop(serialConfig());

  loop_->step();
  loop_->step();

  auto conc = drainKey(*sub_, "concentration");
  ASSERT_EQ(conc.size(), 2u);
  EXPECT_EQ(std::get<double>(conc[0].value), 0.0);
  EXPECT_EQ(logs_.count(LogLevel::ERROR, "not computable"), 2u);
  EXPECT_EQ(logs_.count(LogLevel::ERROR, "INVALID_INPUT: conductivity"), 2u);
  EXPECT_EQ(loop_->state(), LoopState::POLLING);
  EXPECT_EQ(loop_->counters().faults, 0u);
}

TEST_F(AcquisitionLoopTest, ShortFrameIsADecodeFault) {
  configure = [](FakeSession& s) {
    s.frames.push_back({Status(), std::vector<uint16_t>{0x4643}});
  };
  makeLoop(serialConfig());

  loop_->step();
  EXPECT_EQ(loop_->state(), LoopState::FAULTED);
  EXPECT_FALSE(session_->isOpen());
  EXPECT_EQ(logs_.count(LogLevel::ERROR, "DECODE_ERROR"), 1u);

  auto status = drainKey(*sub_, "status");
  ASSERT_EQ(status.size(), 1u);
  EXPECT_NE(std::get<std::string>(status[0].value).find("rs485 FAULT | "),
            std::string::npos);
}

TEST_F(AcquisitionLoopTest, DiscreteBlockIsReadBeforeHoldingRegisters) {
  configure = [](FakeSession& s) {
    s.discrete_bits = {true, false, true};
    s.default_frame = {0x3F8C, 0xCCCD, 0x4205, 0x47AE, 0x420C, 0x0000};
  };
  InstrumentConfig config = serialConfig();
  config.name = "etch";
  config.transport = TransportKind::TCP;
  config.read_address = 20;
  config.read_count = 6;
  config.channels = {ChannelConfig{"sg", 0, ValueType::FLOAT32, 1.0},
                     ChannelConfig{"hcl", 2, ValueType::FLOAT32, 1.0},
                     ChannelConfig{"h2o2", 4, ValueType::FLOAT32, 1.0}};
  config.derive_concentration = false;
  config.discrete.address = 0;
  config.discrete.names = {"red", "yellow", "green"};
  config.target = PublishTarget();
  config.target.write_address = 30;
  config.target.discrete_write_address = 0;
  makeLoop(config);

  loop_->step();
  EXPECT_EQ(session_->discrete_reads, 1);

  std::vector<FanoutMessage> out;
  sub_->drain(out);
  ASSERT_EQ(out.size(), 7u);  // 3 channels, 3 lights, status
  EXPECT_EQ(out[0].key, "sg");
  EXPECT_NEAR(std::get<double>(out[0].value), 1.1, 1e-6);
  EXPECT_EQ(out[3].key, "red");
  EXPECT_TRUE(std::get<bool>(out[3].value));
  EXPECT_FALSE(std::get<bool>(out[4].value));

  std::vector<bool> lights;
  ASSERT_TRUE(store_.readDiscreteInputs(0, 3, lights).ok());
  EXPECT_EQ(lights, (std::vector<bool>{true, false, true}));
  std::vector<uint16_t> mirrored;
  ASSERT_TRUE(store_.readHoldingRegisters(30, 6, mirrored).ok());
  EXPECT_EQ(mirrored[0], 0x3F8C);
}

TEST_F(AcquisitionLoopTest, DiscreteReadFailureProducesNoSample) {
  configure = [](FakeSession& s) {
    s.discrete_bits = {true};
    s.discrete_status = Status(ErrorCode::READ_ERROR, "Broken pipe");
  };
  InstrumentConfig config = serialConfig();
  config.discrete.names = {"red"};
  makeLoop(config);

  loop_->step();
  EXPECT_EQ(session_->data_reads, 0);
  EXPECT_EQ(loop_->counters().samples, 0u);
  EXPECT_EQ(loop_->state(), LoopState::FAULTED);
}

TEST_F(AcquisitionLoopTest, RunStopsWhenSleepIsInterrupted) {
  makeLoop(serialConfig());
  time_.stop_after_sleeps = 2;
  std::atomic<bool> running{true};

  loop_->run(running);

  EXPECT_EQ(time_.sleeps.size(), 2u);
  EXPECT_EQ(loop_->counters().samples, 2u);
  EXPECT_EQ(loop_->state(), LoopState::IDLE);
  EXPECT_FALSE(session_->isOpen());
}

TEST_F(AcquisitionLoopTest, RunDoesNothingOnceStopped) {
  makeLoop(serialConfig());
  std::atomic<bool> running{false};
  loop_->run(running);
  EXPECT_EQ(session_->connect_calls, 0);
}

TEST(ConfigurationLatchTest, FirstOutcomeWins) {
  ConfigurationLatch latch;
  EXPECT_FALSE(latch.isSet());
  EXPECT_TRUE(latch.set(ConfigOutcome::FAILED));
  EXPECT_FALSE(latch.set(ConfigOutcome::APPLIED));
  EXPECT_EQ(latch.outcome(), ConfigOutcome::FAILED);
  EXPECT_STREQ(configOutcomeName(latch.outcome()), "Failed");
}
