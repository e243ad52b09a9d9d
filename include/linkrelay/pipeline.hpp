/**
 * @file pipeline.hpp
 * @brief ForwardingPipeline - the per-message decision path of the relay.
 *
 * @details
 * ## Operational model
 * ```
 *  InboundMessage ──► process()
 *                      │
 *                      ├─ claim identity (in-flight set)     ── busy  ──► AlreadyProcessed
 *                      ├─ store: processed?                  ── yes   ──► AlreadyProcessed
 *                      ├─ LinkFilterChain::apply(text)          (may block on network, no lock held)
 *                      ├─ CodeExtractor::extract(text)
 *                      ├─ DuplicateCache::exists(codes)      ── hit   ──► mark processed, DuplicateCode
 *                      ├─ IDestination::deliver(silent)      ── fail  ──► DeliveryFailed (left unmarked)
 *                      └─ mark processed, record codes, stats++      ──► Forwarded
 * ```
 *
 * ## Guarantees
 * - At most one delivery per identity per process lifetime of the store
 *   row: the processed check, plus an in-flight claim that turns a concurrent
 *   second call for the same identity into a no-op.
 * - A failed delivery is never recorded; a later redelivery of the same
 *   identity by the transport is processed again from the top.
 * - Filter and extractor problems never stop a message; only store and
 *   delivery failures do.
 * - The pipeline keeps no state between calls. Everything durable is in the
 *   StateStore; the counter is in the StatsRecorder.
 */
#ifndef LINKRELAY_PIPELINE_HPP
#define LINKRELAY_PIPELINE_HPP

#include <cstdint>
#include <mutex>
#include <set>
#include <utility>

#include "linkrelay/code_extractor.hpp"
#include "linkrelay/link_filter.hpp"
#include "linkrelay/message.hpp"
#include "linkrelay/state_store.hpp"
#include "linkrelay/stats.hpp"
#include "linkrelay/transport/transport_base.hpp"

namespace linkrelay {

enum class ProcessOutcome {
  AlreadyProcessed,   ///< identity seen before (or being processed right now)
  DuplicateCode,      ///< content duplicate; marked processed, not delivered
  Forwarded,          ///< delivered and recorded
  DeliveryFailed,     ///< destination refused; left unmarked
  StoreFailed         ///< state store unavailable; nothing decided
};

const char* to_string(ProcessOutcome o);

class ForwardingPipeline {
public:
  ForwardingPipeline(StateStore& store,
                     LinkFilterChain& filters,
                     CodeExtractor& extractor,
                     transport::IDestination& destination,
                     StatsRecorder& stats);

  /// Run one message through the full decision path.
  ProcessOutcome process(const InboundMessage& msg);

private:
  using Key = std::pair<int64_t, int64_t>;

  bool claim(const Key& key);
  void release(const Key& key);

  StateStore&              store_;
  LinkFilterChain&         filters_;
  CodeExtractor&           extractor_;
  DuplicateCache           codes_;
  transport::IDestination& destination_;
  StatsRecorder&           stats_;

  std::mutex    in_flight_mutex_;
  std::set<Key> in_flight_;       ///< identities currently inside process()
};

} // namespace linkrelay

#endif // LINKRELAY_PIPELINE_HPP
