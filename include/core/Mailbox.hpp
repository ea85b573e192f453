#pragma once
/** @file  Mailbox.hpp
 *  @brief Single-slot, overwrite-on-write register holding an instrument's latest Sample.
 *
 *  © 2025 Spectackler contributors — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <mutex>

#include "core/Sample.hpp"

namespace spectackler::core {

  /**
 * @class Mailbox
 * @brief Freshness, not history: readers may miss intermediate Samples.
 *
 *  * `publish()` replaces the slot; it never waits for readers.
 *  * `latest()` returns whatever is in the slot right now (possibly nothing).
 *  * Sequence numbers grow with every publish, so a read after publish #N
 *    always reports N or later.
 */
  class Mailbox {
  public:
    struct Snapshot {
      std::uint64_t sequence{ 0 };           ///< 0 = never published
      std::shared_ptr<const Sample> sample{}; ///< nullptr until the first publish
    };

    void publish(Sample sample);
    Snapshot latest() const;
    std::uint64_t sequence() const;

  private:
    mutable std::mutex mtx_; // held only to swap a pointer
    Snapshot slot_{};
  };

} // namespace spectackler::core
