/* @file Poller.cpp
 * @brief per-instrument sampling thread
 *
 * © 2025 Spectackler contributors — MIT-licensed.
 */

#include "core/Poller.hpp"

#include "io/TransportError.hpp"
#include "protocols/Frame.hpp"

using namespace spectackler::core;
using spectackler::io::OperationCancelled;
using spectackler::io::TransportError;
using spectackler::protocols::ProtocolError;

namespace {
  // leaves the sampling section on every exit path
  class SamplingSection {
  public:
    explicit SamplingSection(AccessGate& gate) : gate_{ gate } {}
    ~SamplingSection() { gate_.leaveSampling(); }
    SamplingSection(const SamplingSection&) = delete;
    SamplingSection& operator=(const SamplingSection&) = delete;

  private:
    AccessGate& gate_;
  };
} // namespace

Poller::Poller(Instrument& instrument, Clock& clock, std::shared_ptr<Logger> logger,
               std::shared_ptr<ErrorMonitor> errorMonitor, Options options)
    : instrument_(instrument), clock_(clock), logger_(std::move(logger)),
      errorMonitor_(std::move(errorMonitor)), options_(options) {}

Poller::~Poller() { stop(); }

void Poller::start() {
  if (worker_.joinable())
    return;
  stopSource_ = std::stop_source{};
  worker_ = std::thread([this, token = stopSource_.get_token()] { loop(token); });
  logger_->info("Poller", instrument_.name() + " started");
}

void Poller::stop() {
  if (!worker_.joinable())
    return;
  stopSource_.request_stop();
  worker_.join();
  logger_->info("Poller", instrument_.name() + " stopped after " +
                              std::to_string(published_.load()) + " samples");
}

void Poller::reportFailure(const std::string& what) {
  ++failures_;
  logger_->warn("Poller", instrument_.name() + ": " + what);
  if (errorMonitor_)
    errorMonitor_->notifyFailure("[Poller] " + instrument_.name() + ": " + what);
}

void Poller::loop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    if (!instrument_.gate().enterSampling(stop))
      break;

    bool backOff = false;
    try {
      SamplingSection section(instrument_.gate());
      Fields fields = instrument_.sample(stop);
      instrument_.mailbox().publish(Sample(clock_.now(), std::move(fields)));
      ++published_;
    } catch (const OperationCancelled&) {
      break;
    } catch (const TransportError& e) {
      reportFailure(e.what());
      backOff = true;
    } catch (const ProtocolError& e) {
      // skip this cycle's update only
      ++failures_;
      logger_->warn("Poller", instrument_.name() + ": " + e.what());
    } catch (const std::exception& e) {
      reportFailure(e.what());
      backOff = true;
    }

    const auto pause = backOff ? options_.retryBackoff : options_.period;
    if (pause.count() > 0) {
      if (!clock_.sleepUntil(clock_.now() + pause, stop))
        break;
    } else {
      std::this_thread::yield();
    }
  }
}
