/**
 * @file relay.hpp
 * @brief Relay - bounded inbox in front of the ForwardingPipeline.
 *
 * @details
 * The Relay is the loop body of the daemon. Transports hand it inbound
 * messages; each `tick()` runs **at most one** of them through the pipeline.
 *
 * ```
 *  [ISource] ── add_message() ──► inbox (bounded, ETL)
 *                                   │
 *                             tick() ──► ForwardingPipeline::process()
 *                                   │
 *                             drain() ── tick() until empty
 * ```
 *
 * @par Failure Model
 * - **Unknown source:** refused; the message never reaches the pipeline.
 * - **Inbox full:** refused; the caller decides whether to drain and retry.
 * - **Pipeline outcome:** counted per kind, for the shutdown summary.
 *
 * Not thread-safe. One thread owns the Relay; the pipeline below it is.
 */
#ifndef LINKRELAY_RELAY_HPP
#define LINKRELAY_RELAY_HPP

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

#include "etl/deque.h"
#include "linkrelay/message.hpp"
#include "linkrelay/pipeline.hpp"

namespace linkrelay {

enum class Admit {
  Queued,
  UnknownSource,
  InboxFull
};

/// Per-outcome counters since the Relay was constructed.
struct RelayCounters {
  uint64_t already_processed{0};
  uint64_t duplicate_code{0};
  uint64_t forwarded{0};
  uint64_t delivery_failed{0};
  uint64_t store_failed{0};
  uint64_t refused{0};
};

class Relay {
public:
  static constexpr size_t INBOX_CAP = 64;   ///< Max inbound messages queued

  Relay(ForwardingPipeline& pipeline, const std::vector<int64_t>& sources);

  /// Enqueue one inbound message if its source is configured and there is room.
  Admit add_message(const InboundMessage& msg);

  /// Process the oldest queued message. Returns false if the inbox was empty.
  bool tick();

  /// Tick until the inbox is empty. Returns how many were processed.
  size_t drain();

  bool accepts(int64_t source_id) const { return sources_.count(source_id) != 0; }
  size_t pending() const { return inbox_.size(); }
  const RelayCounters& counters() const { return counters_; }

private:
  void count(ProcessOutcome o);

  ForwardingPipeline& pipeline_;
  std::set<int64_t>   sources_;
  etl::deque<InboundMessage, INBOX_CAP> inbox_;
  RelayCounters       counters_;
};

} // namespace linkrelay

#endif // LINKRELAY_RELAY_HPP
