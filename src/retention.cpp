// -----------------------------------------------------------------------------
// retention.cpp - Implementation of the RetentionScheduler
//
// API & guarantees:
//   see include/linkrelay/retention.hpp
// -----------------------------------------------------------------------------
#include "linkrelay/retention.hpp"

#include <algorithm>
#include <string>

#include "linkrelay/log.hpp"

namespace linkrelay {

RetentionScheduler::RetentionScheduler(StateStore& store, const LiveConfig& config)
: store_(store), config_(config) {}

RetentionScheduler::Phase RetentionScheduler::phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_;
}

void RetentionScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
}

int64_t RetentionScheduler::seconds_until_next_run(const TimeOfDay& at, const std::tm& local_now) {
  const int64_t now_s    = local_now.tm_hour * 3600 + local_now.tm_min * 60 + local_now.tm_sec;
  const int64_t target_s = at.hour * 3600 + at.minute * 60;
  int64_t diff = target_s - now_s;
  if (diff <= 0) diff += 24 * 3600;
  return std::max<int64_t>(MIN_WAIT_SECONDS, diff);
}

// -----------------------------------------------------------------------------
// sweep() - Purge processed identities past the window, then the code cache.
// POLICY:
//   - CLEANUP_DAYS <= 0 skips the processed purge.
//   - Codes are cleared every sweep, unless the purge is disabled and
//     CLEANUP_CODES_WHEN_DISABLED is false.
//   - A failure in one table does not stop the other.
// -----------------------------------------------------------------------------
SweepReport RetentionScheduler::sweep(std::chrono::system_clock::time_point now) {
  SweepReport r;
  r.days = config_.retention_days();
  std::string err;

  if (r.days > 0) {
    if (store_.cleanup_processed(r.days, now, r.processed_removed, err)) {
      log::info() << "event=cleanup table=processed removed=" << r.processed_removed
                  << " days=" << r.days;
    } else {
      r.ok = false;
      log::error() << "event=cleanup_failed table=processed reason=" << err;
    }
  } else {
    log::info() << "event=cleanup table=processed skipped=1 days=" << r.days;
  }

  if (r.days > 0 || config_.clear_codes_when_disabled()) {
    if (store_.clear_codes(r.codes_removed, err)) {
      r.codes_cleared = true;
      log::info() << "event=cleanup table=duplicate_codes removed=" << r.codes_removed;
    } else {
      r.ok = false;
      log::error() << "event=cleanup_failed table=duplicate_codes reason=" << err;
    }
  }
  return r;
}

void RetentionScheduler::run() {
  log::info() << "event=scheduler_start";
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      phase_ = Phase::Wait;
    }

    const TimeOfDay at = config_.retention_time();
    const std::time_t t = std::time(nullptr);
    std::tm local{};
    localtime_r(&t, &local);
    const int64_t wait_s = seconds_until_next_run(at, local);
    log::debug() << "event=scheduler_wait seconds=" << wait_s;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(wait_s);
      wake_.wait_until(lock, deadline, [this] { return stop_requested_; });
      if (stop_requested_) break;
      phase_ = Phase::Sweep;
    }

    sweep(std::chrono::system_clock::now());
  }
  log::info() << "event=scheduler_stop";
}

} // namespace linkrelay
