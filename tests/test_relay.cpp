#include <doctest/doctest.h>
#include "linkrelay/relay.hpp"
#include "test_support.hpp"

using namespace linkrelay;
using testing_support::FakeDestination;
using testing_support::FakeResolver;
using testing_support::TempDir;

namespace {

struct RelayHarness {
    TempDir            dir;
    StateStore         store;
    FakeResolver       resolver;
    FakeDestination    dest;
    LinkFilterChain    filters{store, resolver};
    CodeExtractor      extractor{[] { return std::string(DUP_CODE_REGEX_DEFAULT); }};
    StatsRecorder      stats{dir.file("stats.json")};
    ForwardingPipeline pipeline{store, filters, extractor, dest, stats};
    Relay              relay{pipeline, {-1, -2}};

    RelayHarness() {
        std::string err;
        REQUIRE_MESSAGE(store.open(":memory:", err), err);
        stats.load();
    }
};

InboundMessage msg(int64_t src, int64_t id, const std::string& text = "hello") {
    InboundMessage m;
    m.source_id = src;
    m.message_id = id;
    m.text = text;
    return m;
}

} // namespace

TEST_CASE("Unknown sources are refused at the door") {
    RelayHarness h;
    CHECK(h.relay.accepts(-1));
    CHECK_FALSE(h.relay.accepts(-3));
    CHECK(h.relay.add_message(msg(-3, 1)) == Admit::UnknownSource);
    CHECK(h.relay.pending() == 0);
    CHECK(h.relay.counters().refused == 1);
}

TEST_CASE("Tick processes one message at a time, in arrival order") {
    RelayHarness h;
    REQUIRE(h.relay.add_message(msg(-1, 1, "first")) == Admit::Queued);
    REQUIRE(h.relay.add_message(msg(-2, 1, "second")) == Admit::Queued);
    CHECK(h.relay.pending() == 2);

    CHECK(h.relay.tick());
    REQUIRE(h.dest.sent.size() == 1);
    CHECK(h.dest.sent[0].text == "first");
    CHECK(h.relay.pending() == 1);

    CHECK(h.relay.drain() == 1);
    CHECK(h.dest.sent[1].text == "second");
    CHECK_FALSE(h.relay.tick());
    CHECK(h.relay.counters().forwarded == 2);
}

TEST_CASE("Inbox is bounded") {
    RelayHarness h;
    for (size_t i = 0; i < Relay::INBOX_CAP; ++i) {
        REQUIRE(h.relay.add_message(msg(-1, static_cast<int64_t>(i))) == Admit::Queued);
    }
    CHECK(h.relay.add_message(msg(-1, 1000)) == Admit::InboxFull);
    CHECK(h.relay.pending() == Relay::INBOX_CAP);

    CHECK(h.relay.drain() == Relay::INBOX_CAP);
    CHECK(h.relay.add_message(msg(-1, 1000)) == Admit::Queued);
}

TEST_CASE("Outcome counters follow the pipeline") {
    RelayHarness h;
    h.relay.add_message(msg(-1, 1, "deal CODE777777"));
    h.relay.add_message(msg(-1, 1, "deal CODE777777"));
    h.relay.add_message(msg(-2, 5, "other CODE777777"));
    h.relay.drain();

    const RelayCounters& c = h.relay.counters();
    CHECK(c.forwarded == 1);
    CHECK(c.already_processed == 1);
    CHECK(c.duplicate_code == 1);
    CHECK(h.dest.sent.size() == 1);
}
