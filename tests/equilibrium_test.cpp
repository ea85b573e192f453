// spectackler headers
#include "core/OscillationCounter.hpp"
#include "core/TrailingWindow.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <vector>

using namespace spectackler::core;
using std::chrono::microseconds;
using std::chrono::milliseconds;

namespace {
  Clock::time_point ms(long n) { return Clock::time_point{} + milliseconds(n); }

  /// Observes \p value every 100 ms from t=0; returns the first instant ready() holds.
  std::optional<long> firstReady(EquilibriumTracker& tracker, const std::string& field,
                                 const std::function<double(long)>& value, long untilMs) {
    for (long t = 0; t <= untilMs; t += 100) {
      tracker.observe(ms(t), { { field, value(t) } });
      if (tracker.ready(ms(t)))
        return t;
    }
    return std::nullopt;
  }

  /// Observes \p value at each of \p times; returns the first instant ready() holds.
  std::optional<Clock::time_point> firstReadyAt(EquilibriumTracker& tracker, double value,
                                                const std::vector<Clock::time_point>& times) {
    for (const auto t : times) {
      tracker.observe(t, { { "T_act", value } });
      if (tracker.ready(t))
        return t;
    }
    return std::nullopt;
  }

  EquilibrationRule temperatureRule(double hold, double timeout, double tol) {
    return { "T_set", "T_act", Seconds(hold), Seconds(timeout), tol };
  }
} // namespace

TEST(trailing_window, prunes_to_horizon_and_spans_inclusively) {
  TrailingWindow window(std::chrono::seconds(3));
  window.add(ms(0), 1.0);
  window.add(ms(1000), 1.0);
  EXPECT_FALSE(window.spans(ms(2999)));
  EXPECT_TRUE(window.spans(ms(3000)));

  // 0 ms is the newest sample at or before 500 ms, so it still anchors the hold
  window.prune(ms(3500));
  EXPECT_EQ(window.size(), 2u);
  EXPECT_TRUE(window.spans(ms(3500)));

  window.prune(ms(4500));
  EXPECT_EQ(window.size(), 1u);
  EXPECT_TRUE(window.spans(ms(4500)));
  EXPECT_TRUE(window.allWithin(1.5, 0.5));
  EXPECT_FALSE(window.allWithin(1.6, 0.5));
}

TEST(equilibrium_tracker, instant_step_is_in_range_at_exactly_hold_time) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 600.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  const auto t = firstReady(tracker, "T_act", [](long) { return 25.0; }, 10000);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, 3000);
  EXPECT_FALSE(tracker.forced());
}

TEST(equilibrium_tracker, cycle_not_dividing_hold_is_ready_on_first_cycle_past_hold) {
  EquilibriumTracker tracker({ temperatureRule(1.0, 600.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  std::vector<Clock::time_point> times;
  for (long t = 0; t <= 20000; t += 300)
    times.push_back(ms(t));
  const auto t = firstReadyAt(tracker, 25.0, times);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, ms(1200));
  EXPECT_FALSE(tracker.forced());
}

TEST(equilibrium_tracker, drifting_cycle_is_ready_on_first_cycle_past_hold) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 600.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  std::vector<Clock::time_point> times;
  for (long k = 0; k < 2000; ++k)
    times.push_back(Clock::time_point{} + microseconds(100001 * k));
  const auto t = firstReadyAt(tracker, 25.0, times);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, Clock::time_point{} + microseconds(100001 * 30));
}

TEST(equilibrium_tracker, jittered_cycle_is_ready_on_first_cycle_past_hold) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 600.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  // 100 ms cycle running 0..7 ms late
  std::vector<Clock::time_point> times;
  for (long k = 0; k < 200; ++k)
    times.push_back(ms(100 * k + (k * 37) % 8));
  const auto t = firstReadyAt(tracker, 25.0, times);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, ms(3006)); // cycle 30; cycle 29 lands at 2901 ms
}

TEST(equilibrium_tracker, unsettled_value_is_forced_at_exactly_timeout) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 10.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  const auto t = firstReady(tracker, "T_act", [](long t) { return (t / 100) % 2 ? 24.0 : 26.0; },
                            20000);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, 10000);
  EXPECT_TRUE(tracker.forced());
}

TEST(equilibrium_tracker, ramp_reaching_band_at_5s_with_3s_hold_is_ready_at_8s) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 600.0, 0.5) });
  tracker.begin(ms(0), { { "T_set", 30.0 } }, { "T_set" });
  // 20 °C → 29.5 °C linearly over 5 s, then 30.0
  const auto t = firstReady(
      tracker, "T_act", [](long t) { return t < 5000 ? 20.0 + 9.5 * t / 5000.0 : 30.0; }, 20000);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, 8000);
}

TEST(equilibrium_tracker, excursion_restarts_hold) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 600.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  const auto t = firstReady(tracker, "T_act", [](long t) { return t == 2000 ? 25.5 : 25.0; }, 10000);
  ASSERT_TRUE(t);
  EXPECT_EQ(*t, 5100);
}

TEST(equilibrium_tracker, unchanged_or_absent_setpoints_are_waived) {
  EquilibriumTracker tracker({ temperatureRule(3.0, 600.0, 0.1),
                               { "P_set", "P_act", Seconds(5.0), Seconds(60.0), 1.0 } });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, {});
  EXPECT_TRUE(tracker.ready(ms(0)));
  EXPECT_TRUE(tracker.pending(ms(0)).empty());
}

TEST(equilibrium_tracker, verdict_latches_until_next_state) {
  EquilibriumTracker tracker({ temperatureRule(1.0, 600.0, 0.1) });
  tracker.begin(ms(0), { { "T_set", 25.0 } }, { "T_set" });
  ASSERT_TRUE(firstReady(tracker, "T_act", [](long) { return 25.0; }, 2000));
  tracker.observe(ms(2100), { { "T_act", 40.0 } });
  EXPECT_TRUE(tracker.ready(ms(2100)));

  tracker.begin(ms(3000), { { "T_set", 30.0 } }, { "T_set" });
  EXPECT_FALSE(tracker.ready(ms(3000)));
  EXPECT_EQ(tracker.pending(ms(3000)), (std::vector<std::string>{ "T_act" }));
}

TEST(oscillation_counter, counts_complete_swings) {
  OscillationCounter counter(0.1);
  for (double v : { 20.0, 21.0, 22.0, 21.0, 20.0, 21.0, 22.0, 21.0, 20.0, 21.0 })
    counter.observe(v);
  EXPECT_EQ(counter.peaks().size(), 2u);
  EXPECT_EQ(counter.valleys().size(), 2u);
  EXPECT_EQ(counter.oscillations(), 2u);
  EXPECT_DOUBLE_EQ(counter.peaks().front(), 22.0);
  EXPECT_DOUBLE_EQ(counter.valleys().front(), 20.0);
}

TEST(oscillation_counter, ignores_noise_below_threshold) {
  OscillationCounter counter(0.1);
  for (double v : { 20.0, 20.05, 19.97, 20.08, 20.02, 19.95 })
    counter.observe(v);
  EXPECT_TRUE(counter.seeded());
  EXPECT_EQ(counter.oscillations(), 0u);
  EXPECT_TRUE(counter.peaks().empty());
}

TEST(oscillation_counter, reset_forgets_turns) {
  OscillationCounter counter;
  for (double v : { 1.0, 2.0, 1.0, 0.0, 1.0 })
    counter.observe(v);
  EXPECT_EQ(counter.oscillations(), 1u);
  counter.reset(5.0);
  EXPECT_EQ(counter.oscillations(), 0u);
}
