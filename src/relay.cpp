#include "linkrelay/relay.hpp"

#include "linkrelay/log.hpp"

namespace linkrelay {

Relay::Relay(ForwardingPipeline& pipeline, const std::vector<int64_t>& sources)
: pipeline_(pipeline),
  sources_(sources.begin(), sources.end()) {}

// add_message() - Refuse unknown sources and a full inbox; else enqueue.
Admit Relay::add_message(const InboundMessage& msg) {
  if (!accepts(msg.source_id)) {
    ++counters_.refused;
    log::debug() << "event=refused reason=unknown_source source=" << msg.source_id
                 << " id=" << msg.message_id;
    return Admit::UnknownSource;
  }
  if (inbox_.full()) {
    ++counters_.refused;
    log::warn() << "event=refused reason=inbox_full source=" << msg.source_id
                << " id=" << msg.message_id;
    return Admit::InboxFull;
  }
  inbox_.push_back(msg);
  return Admit::Queued;
}

// tick() - Pop the oldest message and run it through the pipeline.
bool Relay::tick() {
  if (inbox_.empty()) return false;

  InboundMessage msg = inbox_.front();
  inbox_.pop_front();

  const ProcessOutcome o = pipeline_.process(msg);
  count(o);
  log::debug() << "event=processed source=" << msg.source_id << " id=" << msg.message_id
               << " outcome=" << to_string(o);
  return true;
}

size_t Relay::drain() {
  size_t n = 0;
  while (tick()) ++n;
  return n;
}

void Relay::count(ProcessOutcome o) {
  switch (o) {
    case ProcessOutcome::AlreadyProcessed: ++counters_.already_processed; break;
    case ProcessOutcome::DuplicateCode:    ++counters_.duplicate_code;    break;
    case ProcessOutcome::Forwarded:        ++counters_.forwarded;         break;
    case ProcessOutcome::DeliveryFailed:   ++counters_.delivery_failed;   break;
    case ProcessOutcome::StoreFailed:      ++counters_.store_failed;      break;
  }
}

} // namespace linkrelay
