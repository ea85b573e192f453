// spectackler headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExperimentConfig.hpp"
#include "core/InstrumentFactory.hpp"
#include "core/Logger.hpp"
#include "core/Quantity.hpp"
#include "core/Retry.hpp"
#include "core/Sample.hpp"
#include "core/ShutdownSequence.hpp"

#include "fakes/FakeInstrument.hpp"
#include "fakes/MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace spectackler::core;
using namespace spectackler::test;
using ::testing::HasSubstr;
using ::testing::NiceMock;

//---ErrorMonitor------------------------------------------------------------

TEST(error_monitor, escalates_each_unique_failure_once) {
  ErrorMonitor monitor;
  std::vector<std::string> escalated;
  monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

  monitor.notifyFailure("[Poller] pump: timeout");
  monitor.notifyFailure("[Poller] pump: timeout");
  monitor.notifyFailure("[Poller] bath: timeout");

  EXPECT_EQ(escalated, (std::vector<std::string>{ "[Poller] pump: timeout", "[Poller] bath: timeout" }));
  EXPECT_EQ(monitor.uniqueFailures(), 2u);
}

TEST(error_monitor, works_without_escalation) {
  ErrorMonitor monitor;
  monitor.notifyFailure("x");
  EXPECT_EQ(monitor.uniqueFailures(), 1u);
}

//---ShutdownSequence--------------------------------------------------------

TEST(shutdown_sequence, attempts_every_step_after_a_failure) {
  std::ostringstream sink;
  auto logger = std::make_shared<Logger>(sink);
  auto monitor = std::make_shared<NiceMock<MockErrorMonitor>>();
  EXPECT_CALL(*monitor, notifyFailure(HasSubstr("[Shutdown] pump safe state failed: stuck")))
      .Times(1);

  std::vector<std::string> ran;
  ShutdownSequence seq(logger, monitor);
  seq.add("pump safe state", [&] {
    ran.push_back("pump");
    throw std::runtime_error("stuck");
  });
  seq.add("bath safe state", [&] { ran.push_back("bath"); });

  EXPECT_FALSE(seq.run());
  EXPECT_EQ(ran, (std::vector<std::string>{ "pump", "bath" }));
  EXPECT_THAT(sink.str(), HasSubstr("ERROR [Shutdown] pump safe state failed: stuck"));
}

TEST(shutdown_sequence, clean_run_reports_true) {
  auto logger = std::make_shared<Logger>(std::cerr, Logger::Level::Error);
  ShutdownSequence seq(logger, nullptr);
  int n = 0;
  seq.add("a", [&] { ++n; });
  seq.add("b", [&] { ++n; });
  EXPECT_TRUE(seq.run());
  EXPECT_EQ(n, 2);
  EXPECT_EQ(seq.size(), 2u);
}

//---Logger------------------------------------------------------------------

TEST(logger, formats_level_and_tag) {
  std::ostringstream sink;
  Logger logger(sink);
  logger.warn("bath", "attempt 1/5: timeout");
  const std::string line = sink.str();
  // HH:MM:SS prefix
  ASSERT_GE(line.size(), 9u);
  EXPECT_EQ(line[2], ':');
  EXPECT_EQ(line[5], ':');
  EXPECT_EQ(line.substr(8), " WARN [bath] attempt 1/5: timeout\n");
}

TEST(logger, drops_levels_below_minimum) {
  std::ostringstream sink;
  Logger logger(sink, Logger::Level::Warn);
  logger.info("x", "hidden");
  logger.error("x", "shown");
  EXPECT_THAT(sink.str(), ::testing::Not(HasSubstr("hidden")));
  EXPECT_THAT(sink.str(), HasSubstr("ERROR [x] shown"));
}

//---Sample values-----------------------------------------------------------

TEST(sample, formats_and_converts_values) {
  EXPECT_EQ(formatValue(FieldValue{ 25.0 }), "25");
  EXPECT_EQ(formatValue(FieldValue{ 0.125 }), "0.125");
  EXPECT_EQ(formatValue(FieldValue{ true }), "True");
  EXPECT_EQ(formatValue(FieldValue{ std::string("V") }), "V");

  EXPECT_EQ(numericValue(FieldValue{ false }), 0.0);
  EXPECT_EQ(numericValue(FieldValue{ 3.5 }), 3.5);
  EXPECT_FALSE(numericValue(FieldValue{ std::string("V") }).has_value());

  Sample s({}, { { "T_act", 21.5 }, { "pol_ex", std::string("H") } });
  EXPECT_EQ(s.number("T_act"), 21.5);
  EXPECT_FALSE(s.number("pol_ex").has_value());
  EXPECT_FALSE(s.get("missing").has_value());
}

//---Quantity----------------------------------------------------------------

TEST(quantity, decimal_rounds_to_counts) {
  EXPECT_EQ(Decimal<2>::fromValue(21.004).counts(), 2100);
  EXPECT_EQ(Decimal<1>::fromValue(445.0).counts(), 4450);
  EXPECT_DOUBLE_EQ(Decimal<2>::resolution(), 0.01);
  EXPECT_DOUBLE_EQ(Decimal<1>::fromCounts(-15).value(), -1.5);
  EXPECT_THROW(Decimal<2>::fromValue(400.0).toInt16(), std::out_of_range);
}

TEST(quantity, linear_calibration_round_trips) {
  LinearCalibration cal{ 1.02, -0.3 };
  EXPECT_DOUBLE_EQ(cal.ref2act(20.0), 20.1);
  EXPECT_NEAR(cal.act2ref(cal.ref2act(37.0)), 37.0, 1e-12);
}

//---ConfigLoader------------------------------------------------------------

class ConfigLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    path = std::filesystem::temp_directory_path() /
           ("spectackler_config_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".json");
  }
  void TearDown() override { std::filesystem::remove(path); }
  void write(const std::string& text) { std::ofstream(path) << text; }

  std::filesystem::path path;
};

TEST_F(ConfigLoaderTest, parses_json_file) {
  write(R"({"poll_ms": 50})");
  EXPECT_EQ(ConfigLoader(path.string()).load()["poll_ms"], 50);
}

TEST_F(ConfigLoaderTest, missing_file_throws) {
  EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);
}

TEST_F(ConfigLoaderTest, malformed_json_throws) {
  write("{ not json");
  try {
    ConfigLoader(path.string()).load();
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("[ConfigLoader]"));
  }
}

//---ExperimentConfig--------------------------------------------------------

TEST(experiment_config, reads_full_document) {
  const auto doc = nlohmann::json::parse(R"({
    "instruments": {
      "pump": { "driver": "isco260d", "port": "/dev/ttyUSB0", "baud": 9600 },
      "bath": { "driver": "neslab_rte", "port": "/dev/ttyUSB1", "baud": 19200,
                "parity": "even", "timeout_ms": 500 },
      "aux":  { "driver": "auxmcu", "port": "/dev/ttyACM0" }
    },
    "scheduler": {
      "cycle_ms": 200, "n_read": 3, "headline": "intensity",
      "equilibration": [ { "setpoint": "T_set", "measured": "T_act",
                           "min_s": 30, "max_s": 300, "tolerance": 0.2 } ]
    },
    "safety": { "vol_diff": 15, "dew_tol": 3 },
    "plan": {
      "ranges": [ { "field": "T_set", "from": 20, "to": 30, "step": 5 },
                  { "field": "pol_em", "values": ["V", "H"] } ],
      "sort": [ { "field": "T_set", "ascending": false } ]
    },
    "retry": { "attempts": 3, "setpoint_attempts": 4 },
    "poll_ms": 10
  })");

  const auto cfg = ExperimentConfig::fromJson(doc);
  ASSERT_EQ(cfg.instruments.size(), 3u);
  // connection order, not document order
  EXPECT_EQ(cfg.instruments[0].role, "aux");
  EXPECT_EQ(cfg.instruments[1].role, "bath");
  EXPECT_EQ(cfg.instruments[2].role, "pump");

  const auto* bath = cfg.instrument("bath");
  ASSERT_NE(bath, nullptr);
  EXPECT_EQ(bath->driver, "neslab_rte");
  EXPECT_EQ(bath->serial.baud, static_cast<speed_t>(B19200));
  EXPECT_EQ(bath->serial.parity, spectackler::io::Parity::Even);
  EXPECT_EQ(bath->serial.readTimeout, std::chrono::milliseconds(500));
  EXPECT_EQ(cfg.instrument("spec"), nullptr);

  EXPECT_EQ(cfg.scheduler.cycle, std::chrono::milliseconds(200));
  EXPECT_EQ(cfg.scheduler.readsPerState, 3u);
  ASSERT_EQ(cfg.scheduler.rules.size(), 1u);
  EXPECT_DOUBLE_EQ(cfg.scheduler.rules[0].tolerance, 0.2);
  EXPECT_DOUBLE_EQ(cfg.safety.volDiff, 15.0);
  EXPECT_DOUBLE_EQ(cfg.safety.dewTol, 3.0);

  ASSERT_EQ(cfg.ranges.size(), 2u);
  EXPECT_EQ(cfg.ranges[0].values.size(), 2u); // 20, 25
  EXPECT_EQ(cfg.ranges[1].values.size(), 2u);
  ASSERT_EQ(cfg.sort.size(), 1u);
  EXPECT_FALSE(cfg.sort[0].ascending);

  EXPECT_EQ(cfg.retryAttempts, 3u);
  EXPECT_EQ(cfg.scheduler.setpointAttempts, 4u);
  EXPECT_EQ(cfg.poll, std::chrono::milliseconds(10));
}

TEST(experiment_config, empty_document_uses_defaults) {
  const auto cfg = ExperimentConfig::fromJson(nlohmann::json::object());
  EXPECT_TRUE(cfg.instruments.empty());
  EXPECT_EQ(cfg.retryAttempts, 5u);
  EXPECT_EQ(cfg.scheduler.setpointAttempts, 5u);
  EXPECT_EQ(cfg.scheduler.readsPerState, 15u);
  EXPECT_EQ(cfg.scheduler.rules.size(), 2u);
  EXPECT_DOUBLE_EQ(cfg.safety.volDiff, 20.0);
  EXPECT_EQ(cfg.scheduler.mode, AdvanceMode::Equilibrium);
}

TEST(experiment_config, rejects_bad_documents) {
  const char* bad[] = {
    R"([])",
    R"({"instruments": {"laser": {"driver": "x", "port": "/dev/null"}}})",
    R"({"instruments": {"bath": {"port": "/dev/null"}}})",
    R"({"instruments": {"bath": {"driver": "neslab_rte"}}})",
    R"({"instruments": {"bath": {"driver": "neslab_rte", "port": "/dev/null", "baud": 12345}}})",
    R"({"instruments": {"bath": {"driver": "neslab_rte", "port": "/dev/null", "parity": "mark"}}})",
    R"({"scheduler": {"mode": "random"}})",
    R"({"scheduler": {"n_read": -1}})",
    R"({"scheduler": {"equilibration": [ {"setpoint": "T_set", "measured": "T_act"} ]}})",
    R"({"safety": {"vol_diff": "lots"}})",
    R"({"plan": {"ranges": [ {"field": "T_set", "from": 0, "to": 1, "step": 0} ]}})",
    R"({"retry": {"attempts": 0}})",
  };
  for (const char* text : bad) {
    SCOPED_TRACE(text);
    EXPECT_THROW(ExperimentConfig::fromJson(nlohmann::json::parse(text)), SetupError);
  }
}

//---InstrumentFactory-------------------------------------------------------

TEST(instrument_factory, creates_registered_driver) {
  InstrumentFactory factory;
  EXPECT_TRUE(factory.registerDriver("fake", [](const DriverContext& ctx) {
    return std::make_unique<FakeInstrument>(ctx.config.role);
  }));
  EXPECT_FALSE(factory.registerDriver("fake", [](const DriverContext&) { return nullptr; }));
  EXPECT_TRUE(factory.registerDriver("another", [](const DriverContext&) { return nullptr; }));
  EXPECT_EQ(factory.names(), (std::vector<std::string>{ "another", "fake" }));

  InstrumentConfig ic;
  ic.role = "bath";
  ic.driver = "fake";
  auto logger = std::make_shared<Logger>();
  auto inst = factory.create(DriverContext{ ic, logger });
  ASSERT_NE(inst, nullptr);
  EXPECT_EQ(inst->name(), "bath");

  ic.driver = "another";
  EXPECT_THROW(factory.create(DriverContext{ ic, logger }), SetupError);
  ic.driver = "missing";
  EXPECT_THROW(factory.create(DriverContext{ ic, logger }), SetupError);
}

//---Retry-------------------------------------------------------------------

TEST(retry, stops_at_first_success) {
  int calls = 0;
  const auto r = retryBounded(5, [&](std::size_t) { return ++calls == 3; });
  EXPECT_TRUE(r);
  EXPECT_EQ(r.attempts, 3u);
}

TEST(retry, gives_up_after_bound) {
  int calls = 0;
  const auto r = retryBounded(4, [&](std::size_t) {
    ++calls;
    return false;
  });
  EXPECT_FALSE(r);
  EXPECT_EQ(calls, 4);
}
