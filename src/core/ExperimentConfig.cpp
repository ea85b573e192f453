/* @file ExperimentConfig.cpp
 * @brief JSON schema validation for the run configuration
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/ExperimentConfig.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "core/Instrument.hpp" // SetupError

namespace spectackler {
  namespace core {

    using nlohmann::json;

    namespace {
      const json& section(const json& doc, const char* key) {
        static const json empty = json::object();
        auto it = doc.find(key);
        if (it == doc.end())
          return empty;
        if (!it->is_object())
          throw SetupError(std::string("[Config] '") + key + "' must be an object");
        return *it;
      }

      double number(const json& obj, const std::string& where, const char* key, double fallback) {
        auto it = obj.find(key);
        if (it == obj.end())
          return fallback;
        if (!it->is_number())
          throw SetupError("[Config] " + where + "." + key + " must be a number");
        return it->get<double>();
      }

      double requiredNumber(const json& obj, const std::string& where, const char* key) {
        if (!obj.contains(key))
          throw SetupError("[Config] " + where + "." + key + " is required");
        return number(obj, where, key, 0.0);
      }

      std::string text(const json& obj, const std::string& where, const char* key,
                       const std::string& fallback) {
        auto it = obj.find(key);
        if (it == obj.end())
          return fallback;
        if (!it->is_string())
          throw SetupError("[Config] " + where + "." + key + " must be a string");
        return it->get<std::string>();
      }

      bool flag(const json& obj, const std::string& where, const char* key, bool fallback) {
        auto it = obj.find(key);
        if (it == obj.end())
          return fallback;
        if (!it->is_boolean())
          throw SetupError("[Config] " + where + "." + key + " must be true or false");
        return it->get<bool>();
      }

      std::size_t count(const json& obj, const std::string& where, const char* key,
                        std::size_t fallback) {
        const double v = number(obj, where, key, static_cast<double>(fallback));
        if (v < 0 || v != static_cast<double>(static_cast<std::size_t>(v)))
          throw SetupError("[Config] " + where + "." + key + " must be a non-negative integer");
        return static_cast<std::size_t>(v);
      }

      io::Parity parity(const std::string& where, const std::string& name) {
        std::string p;
        std::transform(name.begin(), name.end(), std::back_inserter(p),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (p == "none" || p == "n")
          return io::Parity::None;
        if (p == "even" || p == "e")
          return io::Parity::Even;
        if (p == "odd" || p == "o")
          return io::Parity::Odd;
        throw SetupError("[Config] " + where + ".parity '" + name + "' is not none/even/odd");
      }

      InstrumentConfig parseInstrument(const std::string& role, const json& obj) {
        const std::string where = "instruments." + role;
        if (!obj.is_object())
          throw SetupError("[Config] " + where + " must be an object");

        InstrumentConfig ic;
        ic.role = role;
        ic.driver = text(obj, where, "driver", "");
        if (ic.driver.empty())
          throw SetupError("[Config] " + where + ".driver is required");
        ic.serial.port = text(obj, where, "port", "");
        if (ic.serial.port.empty())
          throw SetupError("[Config] " + where + ".port is required");

        const auto baud = static_cast<long>(number(obj, where, "baud", 9600));
        const auto speed = io::baudFromInt(baud);
        if (!speed)
          throw SetupError("[Config] " + where + ".baud " + std::to_string(baud) +
                           " is not supported");
        ic.serial.baud = *speed;
        ic.serial.parity = parity(where, text(obj, where, "parity", "none"));
        ic.serial.readTimeout = std::chrono::milliseconds(count(obj, where, "timeout_ms", 1000));
        ic.options = obj;
        return ic;
      }

      EquilibrationRule rule(const json& obj, std::size_t i) {
        const std::string where = "scheduler.equilibration[" + std::to_string(i) + "]";
        if (!obj.is_object())
          throw SetupError("[Config] " + where + " must be an object");
        EquilibrationRule r;
        r.setpoint = text(obj, where, "setpoint", "");
        r.measured = text(obj, where, "measured", "");
        if (r.setpoint.empty() || r.measured.empty())
          throw SetupError("[Config] " + where + " needs setpoint and measured");
        r.minHold = Seconds(requiredNumber(obj, where, "min_s"));
        r.maxTimeout = Seconds(requiredNumber(obj, where, "max_s"));
        r.tolerance = requiredNumber(obj, where, "tolerance");
        if (r.minHold.count() < 0 || r.maxTimeout.count() < 0 || r.tolerance < 0)
          throw SetupError("[Config] " + where + ": negative time or tolerance");
        return r;
      }

      SchedulerConfig parseScheduler(const json& obj) {
        const std::string where = "scheduler";
        SchedulerConfig s;
        s.cycle = std::chrono::milliseconds(count(obj, where, "cycle_ms", 100));
        s.readsPerState = static_cast<unsigned>(count(obj, where, "n_read", 15));
        s.headline = text(obj, where, "headline", s.headline);
        s.autoShutter = flag(obj, where, "auto_shutter", true);
        s.shutterSettle = Seconds(number(obj, where, "shutter_settle_s", 0.0));

        const std::string mode = text(obj, where, "mode", "equilibrium");
        if (mode == "equilibrium")
          s.mode = AdvanceMode::Equilibrium;
        else if (mode == "oscillation")
          s.mode = AdvanceMode::Oscillation;
        else
          throw SetupError("[Config] scheduler.mode '" + mode + "' is not equilibrium/oscillation");

        if (auto it = obj.find("equilibration"); it != obj.end()) {
          if (!it->is_array())
            throw SetupError("[Config] scheduler.equilibration must be an array");
          for (std::size_t i = 0; i < it->size(); ++i)
            s.rules.push_back(rule((*it)[i], i));
        } else {
          // apparatus defaults: bath and pump must settle
          s.rules.push_back({ "T_set", "T_act", Seconds(60.0), Seconds(600.0), 0.1 });
          s.rules.push_back({ "P_set", "P_act", Seconds(5.0), Seconds(60.0), 1.0 });
        }

        const json& osc = section(obj, "oscillation");
        s.oscillation.field = text(osc, "scheduler.oscillation", "field", s.oscillation.field);
        s.oscillation.count = count(osc, "scheduler.oscillation", "count", s.oscillation.count);
        s.oscillation.timeout =
            Seconds(number(osc, "scheduler.oscillation", "timeout_s", s.oscillation.timeout.count()));
        s.oscillation.threshold =
            number(osc, "scheduler.oscillation", "threshold", s.oscillation.threshold);
        return s;
      }

      FieldRange range(const json& obj, std::size_t i) {
        const std::string where = "plan.ranges[" + std::to_string(i) + "]";
        if (!obj.is_object())
          throw SetupError("[Config] " + where + " must be an object");
        const std::string field = text(obj, where, "field", "");
        if (field.empty())
          throw SetupError("[Config] " + where + ".field is required");

        if (auto it = obj.find("values"); it != obj.end()) {
          if (!it->is_array())
            throw SetupError("[Config] " + where + ".values must be an array");
          FieldRange r{ field, {} };
          for (const auto& v : *it) {
            if (v.is_number())
              r.values.emplace_back(v.get<double>());
            else if (v.is_boolean())
              r.values.emplace_back(v.get<bool>());
            else if (v.is_string())
              r.values.emplace_back(v.get<std::string>());
            else
              throw SetupError("[Config] " + where + ".values holds a non-scalar");
          }
          return r;
        }
        return FieldRange::arange(field, requiredNumber(obj, where, "from"),
                                  requiredNumber(obj, where, "to"),
                                  requiredNumber(obj, where, "step"));
      }
    } // namespace

    ExperimentConfig ExperimentConfig::fromJson(const json& doc) {
      if (!doc.is_object())
        throw SetupError("[Config] document must be a JSON object");

      ExperimentConfig cfg;

      const json& instruments = section(doc, "instruments");
      for (const auto& [role, _] : instruments.items()) {
        if (std::find(std::begin(kRoles), std::end(kRoles), role) == std::end(kRoles))
          throw SetupError("[Config] unknown instrument role '" + role + "'");
      }
      for (const char* role : kRoles) {
        if (auto it = instruments.find(role); it != instruments.end())
          cfg.instruments.push_back(parseInstrument(role, *it));
      }

      cfg.scheduler = parseScheduler(section(doc, "scheduler"));

      const json& safety = section(doc, "safety");
      cfg.safety.volDiff = number(safety, "safety", "vol_diff", cfg.safety.volDiff);
      cfg.safety.volumeField = text(safety, "safety", "volume_field", cfg.safety.volumeField);
      cfg.safety.dewTol = number(safety, "safety", "dew_tol", cfg.safety.dewTol);
      cfg.safety.dewHysteresis = number(safety, "safety", "dew_hysteresis", 0.0);
      if (cfg.safety.dewHysteresis < 0)
        throw SetupError("[Config] safety.dew_hysteresis must not be negative");

      const json& plan = section(doc, "plan");
      if (auto it = plan.find("ranges"); it != plan.end()) {
        if (!it->is_array())
          throw SetupError("[Config] plan.ranges must be an array");
        for (std::size_t i = 0; i < it->size(); ++i)
          cfg.ranges.push_back(range((*it)[i], i));
      }
      if (auto it = plan.find("sort"); it != plan.end()) {
        if (!it->is_array())
          throw SetupError("[Config] plan.sort must be an array");
        for (std::size_t i = 0; i < it->size(); ++i) {
          const std::string where = "plan.sort[" + std::to_string(i) + "]";
          const json& key = (*it)[i];
          if (!key.is_object())
            throw SetupError("[Config] " + where + " must be an object");
          cfg.sort.push_back({ text(key, where, "field", ""), flag(key, where, "ascending", true) });
        }
      }

      const json& retry = section(doc, "retry");
      cfg.retryAttempts = count(retry, "retry", "attempts", 5);
      cfg.scheduler.setpointAttempts = count(retry, "retry", "setpoint_attempts", 5);
      if (cfg.retryAttempts == 0 || cfg.scheduler.setpointAttempts == 0)
        throw SetupError("[Config] retry bounds must be at least 1");

      cfg.poll = std::chrono::milliseconds(count(doc, "config", "poll_ms", 0));
      return cfg;
    }

    const InstrumentConfig* ExperimentConfig::instrument(const std::string& role) const {
      for (const auto& ic : instruments)
        if (ic.role == role)
          return &ic;
      return nullptr;
    }

  } // namespace core
} // namespace spectackler
