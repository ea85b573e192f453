// spectackler headers
#include "core/AccessGate.hpp"
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Mailbox.hpp"
#include "core/Poller.hpp"
#include "io/TransportError.hpp"
#include "protocols/Frame.hpp"

// spectackler fakes
#include "fakes/FakeInstrument.hpp"
#include "fakes/MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <sstream>
#include <thread>

namespace spectackler::test {

  using namespace std::chrono_literals;
  using spectackler::core::AccessGate;
  using spectackler::core::Logger;
  using spectackler::core::Mailbox;
  using spectackler::core::Poller;
  using spectackler::core::Sample;
  using spectackler::core::SteadyClock;

  namespace {
    /// Spins until \p cond holds or two seconds pass.
    bool eventually(const std::function<bool()>& cond) {
      const auto deadline = std::chrono::steady_clock::now() + 2s;
      while (std::chrono::steady_clock::now() < deadline) {
        if (cond())
          return true;
        std::this_thread::sleep_for(1ms);
      }
      return cond();
    }
  } // namespace

  //------------------------------------------------------------------------------
  // Mailbox
  //------------------------------------------------------------------------------
  TEST(mailbox, empty_until_first_publish) {
    Mailbox box;
    const auto snap = box.latest();
    EXPECT_EQ(snap.sequence, 0u);
    EXPECT_EQ(snap.sample, nullptr);
  }

  TEST(mailbox, reader_never_observes_an_older_sample) {
    Mailbox box;
    std::atomic<bool> done{ false };
    std::thread writer([&] {
      for (int i = 1; i <= 2000; ++i)
        box.publish(Sample({}, { { "n", static_cast<double>(i) } }));
      done = true;
    });

    std::uint64_t lastSeq = 0;
    double lastValue = 0.0;
    while (!done.load()) {
      const auto snap = box.latest();
      if (!snap.sample)
        continue;
      ASSERT_GE(snap.sequence, lastSeq);
      const double v = *snap.sample->number("n");
      ASSERT_GE(v, lastValue);
      EXPECT_DOUBLE_EQ(v, static_cast<double>(snap.sequence));
      lastSeq = snap.sequence;
      lastValue = v;
    }
    writer.join();
    EXPECT_EQ(box.sequence(), 2000u);
  }

  TEST(mailbox, held_snapshot_survives_later_publish) {
    Mailbox box;
    box.publish(Sample({}, { { "T_act", 20.0 } }));
    const auto held = box.latest();
    box.publish(Sample({}, { { "T_act", 25.0 } }));
    EXPECT_DOUBLE_EQ(*held.sample->number("T_act"), 20.0);
    EXPECT_DOUBLE_EQ(*box.latest().sample->number("T_act"), 25.0);
  }

  //------------------------------------------------------------------------------
  // AccessGate
  //------------------------------------------------------------------------------
  TEST(access_gate, hold_blocks_sampling_and_nests) {
    AccessGate gate;
    EXPECT_TRUE(gate.isFree());
    {
      AccessGate::Hold outer(gate);
      AccessGate::Hold inner(gate);
      EXPECT_FALSE(gate.isFree());
    }
    EXPECT_TRUE(gate.isFree());
  }

  TEST(access_gate, acquire_waits_for_sampling_cycle_to_finish) {
    AccessGate gate;
    ASSERT_TRUE(gate.enterSampling({}));
    std::atomic<bool> acquired{ false };
    std::thread commander([&] {
      gate.acquire();
      acquired = true;
      gate.release();
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(acquired.load());
    gate.leaveSampling();
    commander.join();
    EXPECT_TRUE(acquired.load());
  }

  TEST(access_gate, enter_sampling_gives_up_on_stop) {
    AccessGate gate;
    gate.acquire();
    std::stop_source source;
    std::thread stopper([&] {
      std::this_thread::sleep_for(10ms);
      source.request_stop();
    });
    EXPECT_FALSE(gate.enterSampling(source.get_token()));
    stopper.join();
    gate.release();
  }

  //------------------------------------------------------------------------------
  // Poller
  //------------------------------------------------------------------------------
  class PollerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      logger = std::make_shared<Logger>(logText);
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
    }

    std::unique_ptr<Poller> makePoller(FakeInstrument& inst) {
      return std::make_unique<Poller>(inst, clock, logger, errorMonitor,
                                       Poller::Options{ 1ms, 5ms });
    }

    std::ostringstream logText;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    SteadyClock clock;
  };

  TEST_F(PollerTest, publishes_fresh_samples_until_stopped) {
    FakeInstrument inst("aux", { { "T_amb", 22.0 } });
    auto poller = makePoller(inst);
    poller->start();
    ASSERT_TRUE(eventually([&] { return inst.mailbox().sequence() >= 3; }));

    inst.set("T_amb", 23.0);
    const auto seen = inst.mailbox().sequence();
    ASSERT_TRUE(eventually([&] { return inst.mailbox().sequence() > seen + 1; }));
    EXPECT_DOUBLE_EQ(*inst.mailbox().latest().sample->number("T_amb"), 23.0);

    poller->stop();
    EXPECT_FALSE(poller->running());
    const auto final = inst.mailbox().sequence();
    std::this_thread::sleep_for(10ms);
    EXPECT_EQ(inst.mailbox().sequence(), final);
    EXPECT_EQ(poller->published(), final);
  }

  TEST_F(PollerTest, survives_transport_errors_and_reports_them) {
    std::atomic<int> calls{ 0 };
    FakeInstrument inst("pump");
    inst.sampler = [&]() -> Fields {
      if (++calls <= 3)
        throw spectackler::io::TransportError("[DeviceLink] pump: read timeout");
      return { { "vol", 50.0 } };
    };
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("[Poller] pump: ")))
        .Times(3);

    auto poller = makePoller(inst);
    poller->start();
    ASSERT_TRUE(eventually([&] { return inst.mailbox().sequence() >= 1; }));
    poller->stop();

    EXPECT_EQ(poller->failures(), 3u);
    EXPECT_DOUBLE_EQ(*inst.mailbox().latest().sample->number("vol"), 50.0);
    EXPECT_NE(logText.str().find("WARN [Poller] pump: [DeviceLink] pump: read timeout"),
              std::string::npos);
  }

  TEST_F(PollerTest, protocol_error_skips_update_without_escalation) {
    std::atomic<int> calls{ 0 };
    FakeInstrument inst("bath");
    inst.sampler = [&]() -> Fields {
      if (++calls == 1)
        throw spectackler::protocols::ProtocolError("[NESLAB] checksum mismatch");
      return { { "T_act", 20.0 } };
    };
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::_)).Times(0);

    auto poller = makePoller(inst);
    poller->start();
    ASSERT_TRUE(eventually([&] { return inst.mailbox().sequence() >= 1; }));
    poller->stop();
    EXPECT_GE(poller->failures(), 1u);
  }

  TEST_F(PollerTest, pauses_while_gate_is_held) {
    FakeInstrument inst("spec", { { "intensity", 1.0 } });
    auto poller = makePoller(inst);
    poller->start();
    ASSERT_TRUE(eventually([&] { return inst.mailbox().sequence() >= 1; }));

    {
      AccessGate::Hold hold(inst.gate());
      const auto frozen = inst.samples.load();
      std::this_thread::sleep_for(30ms);
      EXPECT_EQ(inst.samples.load(), frozen);
    }
    const auto resumed = inst.samples.load();
    EXPECT_TRUE(eventually([&] { return inst.samples.load() > resumed; }));
    poller->stop();
  }

  TEST_F(PollerTest, stop_returns_while_gate_is_held) {
    FakeInstrument inst("aux");
    auto poller = makePoller(inst);
    inst.gate().acquire();
    poller->start();
    poller->stop();
    EXPECT_FALSE(poller->running());
    inst.gate().release();
  }

} // namespace spectackler::test
