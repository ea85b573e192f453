/* @file Mailbox.cpp
 * @brief pointer-swap single-slot register
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/Mailbox.hpp"

using namespace spectackler::core;

void Mailbox::publish(Sample sample) {
  auto next = std::make_shared<const Sample>(std::move(sample));
  std::lock_guard<std::mutex> lock(mtx_);
  slot_.sample = std::move(next);
  ++slot_.sequence;
}

Mailbox::Snapshot Mailbox::latest() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return slot_;
}

std::uint64_t Mailbox::sequence() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return slot_.sequence;
}
