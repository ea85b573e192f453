#pragma once
/** @file  ShutdownSequence.hpp
 *  @brief Fixed, ordered list of safe-state steps run on every exit path.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"

namespace spectackler::core {

  /**
 * @class ShutdownSequence
 * @brief Every step is attempted even if an earlier one throws; failures are
 *        logged and handed to the ErrorMonitor.
 */
  class ShutdownSequence {
  public:
    using Step = std::function<void()>;

    ShutdownSequence(std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errorMonitor)
        : logger_{ std::move(logger) }, errorMonitor_{ std::move(errorMonitor) } {}

    void add(std::string name, Step step) { steps_.push_back({ std::move(name), std::move(step) }); }

    /// @returns true if every step completed.
    bool run();

    std::size_t size() const { return steps_.size(); }

  private:
    struct Named {
      std::string name;
      Step step;
    };

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::vector<Named> steps_;
  };

} // namespace spectackler::core
