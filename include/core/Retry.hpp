#pragma once
/** @file  Retry.hpp
 *  @brief Bounded retry helper replacing open-ended `while (!f())` loops.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstddef>

namespace spectackler::core {

  struct RetryResult {
    bool succeeded{ false };
    std::size_t attempts{ 0 }; ///< attempts actually made

    explicit operator bool() const { return succeeded; }
  };

  /**
   * Calls `attempt(n)` for n = 1..maxAttempts until it returns true.
   * Exceptions thrown by \p attempt propagate unchanged.
   */
  template <typename Attempt>
  RetryResult retryBounded(std::size_t maxAttempts, Attempt&& attempt) {
    for (std::size_t n = 1; n <= maxAttempts; ++n) {
      if (attempt(n))
        return RetryResult{ true, n };
    }
    return RetryResult{ false, maxAttempts };
  }

} // namespace spectackler::core
