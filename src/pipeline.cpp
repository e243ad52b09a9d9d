// -----------------------------------------------------------------------------
// pipeline.cpp - Implementation of the ForwardingPipeline
//
// API & guarantees:
//   see include/linkrelay/pipeline.hpp
//
// NOTE: This file focuses on the order of checks and on what is (and is not)
// written when each step fails.
// -----------------------------------------------------------------------------
#include "linkrelay/pipeline.hpp"

#include <exception>
#include <string>

#include "linkrelay/log.hpp"

namespace linkrelay {

const char* to_string(ProcessOutcome o) {
  switch (o) {
    case ProcessOutcome::AlreadyProcessed: return "already_processed";
    case ProcessOutcome::DuplicateCode:    return "duplicate_code";
    case ProcessOutcome::Forwarded:        return "forwarded";
    case ProcessOutcome::DeliveryFailed:   return "delivery_failed";
    case ProcessOutcome::StoreFailed:      return "store_failed";
  }
  return "unknown";
}

template <typename Range>
static std::string join(const Range& items) {
  std::string s;
  for (const auto& v : items) {
    if (!s.empty()) s += ",";
    s += v;
  }
  return s;
}

ForwardingPipeline::ForwardingPipeline(StateStore& store,
                                       LinkFilterChain& filters,
                                       CodeExtractor& extractor,
                                       transport::IDestination& destination,
                                       StatsRecorder& stats)
: store_(store),
  filters_(filters),
  extractor_(extractor),
  codes_(store),
  destination_(destination),
  stats_(stats) {}

bool ForwardingPipeline::claim(const Key& key) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.insert(key).second;
}

void ForwardingPipeline::release(const Key& key) {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  in_flight_.erase(key);
}

// -----------------------------------------------------------------------------
// process() - identity check → filters → code check → deliver → commit.
// PRE:
//   - Store is open; filters/extractor/destination outlive the pipeline.
// POLICY:
//   - A concurrent call for an identity already in flight returns at once.
//   - Store failure before delivery aborts with nothing written.
//   - Content duplicates are marked processed so they are not re-examined.
//   - Delivery failure, including a destination that throws, writes nothing
//     (message stays eligible).
//   - After a successful delivery every commit step is attempted even if an
//     earlier one fails; the message was sent, so it is reported Forwarded.
// OUT:
//   - Outcome for logging and tests.
// -----------------------------------------------------------------------------
ProcessOutcome ForwardingPipeline::process(const InboundMessage& msg) {
  const Key key{msg.source_id, msg.message_id};
  if (!claim(key)) {
    log::debug() << "event=skip reason=in_flight source=" << msg.source_id << " id=" << msg.message_id;
    return ProcessOutcome::AlreadyProcessed;
  }
  struct Release {
    ForwardingPipeline* self;
    Key key;
    ~Release() { self->release(key); }
  } release_on_exit{this, key};

  std::string err;

  // PRE: identity dedup
  bool seen = false;
  if (!store_.is_processed(msg.source_id, msg.message_id, seen, err)) {
    log::error() << "event=store_error op=is_processed source=" << msg.source_id
                 << " id=" << msg.message_id << " reason=" << err;
    return ProcessOutcome::StoreFailed;
  }
  if (seen) return ProcessOutcome::AlreadyProcessed;

  // REWRITE: filter chain first, so expanded links are visible to the extractor
  const std::string text = filters_.apply(msg.text);
  const std::vector<std::string> codes = extractor_.extract(text);

  // POLICY: content dedup
  if (!codes.empty()) {
    std::set<std::string> existing;
    if (!codes_.exists(codes, existing, err)) {
      log::error() << "event=store_error op=find_codes source=" << msg.source_id
                   << " id=" << msg.message_id << " reason=" << err;
      return ProcessOutcome::StoreFailed;
    }
    if (!existing.empty()) {
      log::info() << "event=skip reason=duplicate_codes codes=" << join(existing)
                  << " source=" << msg.source_id << " id=" << msg.message_id;
      if (!store_.mark_processed(msg.source_id, msg.message_id, err)) {
        log::error() << "event=store_error op=mark_processed source=" << msg.source_id
                     << " id=" << msg.message_id << " reason=" << err;
        return ProcessOutcome::StoreFailed;
      }
      return ProcessOutcome::DuplicateCode;
    }
  }

  // OUT: deliver (always silent; attachment carries text as caption)
  Delivery d;
  d.text       = text;
  d.attachment = msg.attachment;
  d.silent     = true;
  bool delivered = false;
  try {
    delivered = destination_.deliver(d, err);
  } catch (const std::exception& e) {
    err = std::string("exception reason=") + e.what();
  }
  if (!delivered) {
    log::error() << "event=forward_failed source=" << msg.source_id
                 << " id=" << msg.message_id << " dest=" << destination_.name() << " reason=" << err;
    return ProcessOutcome::DeliveryFailed;
  }
  log::info() << "event=forwarded source=" << msg.source_id << " id=" << msg.message_id;

  // COMMIT: processed, codes, counter
  if (!store_.mark_processed(msg.source_id, msg.message_id, err)) {
    log::error() << "event=store_error op=mark_processed source=" << msg.source_id
                 << " id=" << msg.message_id << " reason=" << err;
  }
  if (!codes_.record(codes, err)) {
    log::error() << "event=store_error op=mark_codes codes=" << join(codes) << " reason=" << err;
  }
  if (!stats_.increment(err)) {
    log::error() << "event=stats_write_failed reason=" << err;
  }
  return ProcessOutcome::Forwarded;
}

} // namespace linkrelay
