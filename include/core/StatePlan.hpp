#pragma once
/** @file  StatePlan.hpp
 *  @brief Ordered, immutable sequence of experiment states (table or range product).
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Sample.hpp"

namespace spectackler {
  namespace core {

    /**
 * One row of the plan: setpoint fields in column order, plus optional
 * per-state scheduling overrides read from the reserved columns
 * `n_read` and `hold_s`.
 */
    struct ExperimentState {
      std::vector<std::pair<std::string, FieldValue>> setpoints;
      std::optional<unsigned> reads{};
      std::optional<double> holdSeconds{};

      std::optional<FieldValue> get(const std::string& field) const;
      std::optional<double> number(const std::string& field) const;
    };

    /// Values one setpoint field sweeps through, in declaration order.
    struct FieldRange {
      std::string field;
      std::vector<FieldValue> values;

      /// Half-open [from, to) in steps of \p step, like numpy.arange. Throws SetupError.
      static FieldRange arange(std::string field, double from, double to, double step);
    };

    struct SortKey {
      std::string field;
      bool ascending{ true };
    };

    class StatePlan {
    public:
      static constexpr const char* kReadsColumn = "n_read";
      static constexpr const char* kHoldColumn = "hold_s";

      StatePlan() = default;

      /**
       * Tab-separated table, header row = field names. A leading column with an
       * empty header (a row index) is ignored. Throws SetupError on ragged rows,
       * empty headers or an empty table.
       */
      static StatePlan fromTable(std::istream& in);

      /**
       * Cartesian product with the last-declared field varying fastest, then a
       * stable sort by \p sortKeys (first key most significant).
       */
      static StatePlan fromRanges(const std::vector<FieldRange>& ranges,
                                  const std::vector<SortKey>& sortKeys = {});

      /// Header + one row per state, tab-separated; readable by fromTable().
      void writeTable(std::ostream& out) const;

      const std::vector<std::string>& columns() const { return columns_; }
      const std::vector<ExperimentState>& states() const { return states_; }
      std::size_t size() const { return states_.size(); }
      bool empty() const { return states_.empty(); }
      const ExperimentState& operator[](std::size_t i) const { return states_[i]; }

    private:
      std::vector<std::string> columns_;
      std::vector<ExperimentState> states_;
    };

    /// Numbers order before labels; numbers numerically, labels lexicographically.
    bool lessThan(const FieldValue& a, const FieldValue& b);

    /// Parses a cell: number if the whole cell is numeric, True/False as bool, else label.
    FieldValue parseCell(const std::string& cell);

  } // namespace core
} // namespace spectackler
