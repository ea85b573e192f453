/* @file StatePlan.cpp
 * @brief state-table parsing and range-product generation
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/StatePlan.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <sstream>

#include "core/Instrument.hpp" // SetupError

namespace spectackler {
  namespace core {

    namespace {
      std::vector<std::string> splitTabs(const std::string& line) {
        std::vector<std::string> cells;
        std::string cell;
        std::istringstream ss(line);
        while (std::getline(ss, cell, '\t'))
          cells.push_back(cell);
        if (!line.empty() && line.back() == '\t')
          cells.emplace_back();
        return cells;
      }

      std::string chomp(std::string line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
          line.pop_back();
        return line;
      }

      int rank(const FieldValue& v) { return std::holds_alternative<std::string>(v) ? 1 : 0; }

      void applyReserved(ExperimentState& state, const std::string& column,
                         const FieldValue& value) {
        const auto n = numericValue(value);
        if (!n || *n < 0)
          throw SetupError("[StatePlan] column '" + column + "' needs a non-negative number, got '" +
                           formatValue(value) + "'");
        if (column == StatePlan::kReadsColumn)
          state.reads = static_cast<unsigned>(std::lround(*n));
        else
          state.holdSeconds = *n;
      }

      bool isReserved(const std::string& column) {
        return column == StatePlan::kReadsColumn || column == StatePlan::kHoldColumn;
      }
    } // namespace

    std::optional<FieldValue> ExperimentState::get(const std::string& field) const {
      for (const auto& [name, value] : setpoints)
        if (name == field)
          return value;
      return std::nullopt;
    }

    std::optional<double> ExperimentState::number(const std::string& field) const {
      const auto v = get(field);
      if (!v)
        return std::nullopt;
      return numericValue(*v);
    }

    FieldRange FieldRange::arange(std::string field, double from, double to, double step) {
      if (step == 0.0 || !std::isfinite(step))
        throw SetupError("[StatePlan] range for '" + field + "' has a zero step");
      FieldRange range{ std::move(field), {} };
      const double span = (to - from) / step;
      if (span <= 0)
        return range;
      const auto count = static_cast<std::size_t>(std::ceil(span));
      for (std::size_t i = 0; i < count; ++i)
        range.values.emplace_back(from + static_cast<double>(i) * step);
      return range;
    }

    bool lessThan(const FieldValue& a, const FieldValue& b) {
      if (rank(a) != rank(b))
        return rank(a) < rank(b);
      if (rank(a) == 1)
        return std::get<std::string>(a) < std::get<std::string>(b);
      return *numericValue(a) < *numericValue(b);
    }

    FieldValue parseCell(const std::string& cell) {
      if (cell == "True" || cell == "true")
        return true;
      if (cell == "False" || cell == "false")
        return false;
      if (!cell.empty()) {
        char* end = nullptr;
        const double v = std::strtod(cell.c_str(), &end);
        if (end != cell.c_str() && *end == '\0')
          return v;
      }
      return cell;
    }

    StatePlan StatePlan::fromTable(std::istream& in) {
      StatePlan plan;
      std::string line;

      while (std::getline(in, line)) {
        line = chomp(line);
        if (!line.empty())
          break;
      }
      if (line.empty())
        throw SetupError("[StatePlan] state table is empty");

      auto header = splitTabs(line);
      const bool indexed = !header.empty() && header.front().empty();
      if (indexed)
        header.erase(header.begin());
      if (header.empty())
        throw SetupError("[StatePlan] state table has no columns");
      for (const auto& h : header) {
        if (h.empty())
          throw SetupError("[StatePlan] state table has an unnamed column");
        if (std::count(header.begin(), header.end(), h) > 1)
          throw SetupError("[StatePlan] duplicate column '" + h + "'");
      }
      for (const auto& h : header)
        if (!isReserved(h))
          plan.columns_.push_back(h);

      std::size_t lineNo = 1;
      while (std::getline(in, line)) {
        ++lineNo;
        line = chomp(line);
        if (line.empty())
          continue;
        auto cells = splitTabs(line);
        if (indexed && !cells.empty())
          cells.erase(cells.begin());
        if (cells.size() != header.size())
          throw SetupError("[StatePlan] line " + std::to_string(lineNo) + ": expected " +
                           std::to_string(header.size()) + " cells, found " +
                           std::to_string(cells.size()));

        ExperimentState state;
        for (std::size_t i = 0; i < header.size(); ++i) {
          if (cells[i].empty())
            throw SetupError("[StatePlan] line " + std::to_string(lineNo) + ": empty cell for '" +
                             header[i] + "'");
          FieldValue value = parseCell(cells[i]);
          if (isReserved(header[i]))
            applyReserved(state, header[i], value);
          else
            state.setpoints.emplace_back(header[i], std::move(value));
        }
        plan.states_.push_back(std::move(state));
      }

      if (plan.states_.empty())
        throw SetupError("[StatePlan] state table has a header but no states");
      return plan;
    }

    StatePlan StatePlan::fromRanges(const std::vector<FieldRange>& ranges,
                                    const std::vector<SortKey>& sortKeys) {
      StatePlan plan;
      if (ranges.empty())
        throw SetupError("[StatePlan] no ranges declared");
      for (const auto& r : ranges) {
        if (r.values.empty())
          throw SetupError("[StatePlan] range for '" + r.field + "' is empty");
        if (std::count_if(ranges.begin(), ranges.end(),
                          [&](const FieldRange& o) { return o.field == r.field; }) > 1)
          throw SetupError("[StatePlan] duplicate range '" + r.field + "'");
        plan.columns_.push_back(r.field);
      }
      for (const auto& key : sortKeys) {
        if (std::find(plan.columns_.begin(), plan.columns_.end(), key.field) == plan.columns_.end())
          throw SetupError("[StatePlan] sort key '" + key.field + "' is not a declared range");
      }

      // odometer: last index rolls fastest
      std::vector<std::size_t> idx(ranges.size(), 0);
      for (;;) {
        ExperimentState state;
        for (std::size_t f = 0; f < ranges.size(); ++f)
          state.setpoints.emplace_back(ranges[f].field, ranges[f].values[idx[f]]);
        plan.states_.push_back(std::move(state));

        std::size_t f = ranges.size();
        while (f > 0) {
          --f;
          if (++idx[f] < ranges[f].values.size())
            break;
          idx[f] = 0;
          if (f == 0) {
            f = ranges.size(); // sentinel: every digit rolled over
            break;
          }
        }
        if (f == ranges.size())
          break;
      }

      if (!sortKeys.empty()) {
        std::stable_sort(plan.states_.begin(), plan.states_.end(),
                         [&](const ExperimentState& a, const ExperimentState& b) {
                           for (const auto& key : sortKeys) {
                             const auto va = *a.get(key.field);
                             const auto vb = *b.get(key.field);
                             if (lessThan(va, vb))
                               return key.ascending;
                             if (lessThan(vb, va))
                               return !key.ascending;
                           }
                           return false;
                         });
      }
      return plan;
    }

    void StatePlan::writeTable(std::ostream& out) const {
      const bool anyReads = std::any_of(states_.begin(), states_.end(),
                                        [](const ExperimentState& s) { return s.reads.has_value(); });
      const bool anyHold = std::any_of(states_.begin(), states_.end(), [](const ExperimentState& s) {
        return s.holdSeconds.has_value();
      });

      for (std::size_t i = 0; i < columns_.size(); ++i)
        out << (i ? "\t" : "") << columns_[i];
      if (anyReads)
        out << '\t' << kReadsColumn;
      if (anyHold)
        out << '\t' << kHoldColumn;
      out << '\n';

      for (const auto& s : states_) {
        for (std::size_t i = 0; i < s.setpoints.size(); ++i)
          out << (i ? "\t" : "") << formatValue(s.setpoints[i].second);
        if (anyReads)
          out << '\t' << s.reads.value_or(0u);
        if (anyHold)
          out << '\t' << formatValue(s.holdSeconds.value_or(0.0));
        out << '\n';
      }
    }

  } // namespace core
} // namespace spectackler
