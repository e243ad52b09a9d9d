/**
 * @file retention.hpp
 * @brief RetentionScheduler - daily purge of old processed identities and the code cache.
 *
 * @details
 * Two-phase loop, one cycle per day:
 * ```
 *  Wait  ── sleep until next CLEANUP_TIME (local, min 60 s) ──► Sweep
 *  Sweep ── processed rows older than CLEANUP_DAYS, then codes ──► Wait
 * ```
 * Both knobs are re-read from the LiveConfig at the start of each phase.
 * A failing sweep is logged and the loop carries on. `stop()` wakes the Wait
 * phase at once; a Sweep in progress finishes first.
 */
#ifndef LINKRELAY_RETENTION_HPP
#define LINKRELAY_RETENTION_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <ctime>
#include <mutex>

#include "linkrelay/config.hpp"
#include "linkrelay/state_store.hpp"

namespace linkrelay {

struct SweepReport {
  int     days{0};               ///< window used; <= 0 means the processed sweep was skipped
  int64_t processed_removed{0};
  int64_t codes_removed{0};
  bool    codes_cleared{false};
  bool    ok{true};              ///< false if any store call failed
};

class RetentionScheduler {
public:
  enum class Phase { Wait, Sweep };

  static constexpr int MIN_WAIT_SECONDS = 60;

  RetentionScheduler(StateStore& store, const LiveConfig& config);

  /// Loop until stop(). Intended as a thread body.
  void run();

  /// Ask run() to return; safe from any thread.
  void stop();

  /// One sweep with the current config, as the Sweep phase does it.
  SweepReport sweep(std::chrono::system_clock::time_point now);

  Phase phase() const;

  /// Seconds from `local_now` to the next `at` (tomorrow if already past), at least 60.
  static int64_t seconds_until_next_run(const TimeOfDay& at, const std::tm& local_now);

private:
  StateStore&       store_;
  const LiveConfig& config_;

  mutable std::mutex      mutex_;
  std::condition_variable wake_;
  bool                    stop_requested_{false};
  Phase                   phase_{Phase::Wait};
};

} // namespace linkrelay

#endif // LINKRELAY_RETENTION_HPP
