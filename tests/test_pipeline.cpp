#include <doctest/doctest.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "linkrelay/pipeline.hpp"
#include "linkrelay/transport/line_transport.hpp"
#include "test_support.hpp"

using namespace linkrelay;
using testing_support::FakeDestination;
using testing_support::FakeResolver;
using testing_support::TempDir;

namespace {

// One in-memory relay stack wired like the daemon.
struct Harness {
    TempDir            dir;
    StateStore         store;
    FakeResolver       resolver;
    FakeDestination    dest;
    std::string        code_regex{DUP_CODE_REGEX_DEFAULT};
    LinkFilterChain    filters{store, resolver};
    CodeExtractor      extractor{[this] { return code_regex; }};
    StatsRecorder      stats{dir.file("stats.json")};
    ForwardingPipeline pipeline{store, filters, extractor, dest, stats};

    Harness() {
        std::string err;
        REQUIRE_MESSAGE(store.open(":memory:", err), err);
        stats.load();
    }

    bool processed(int64_t src, int64_t id) {
        bool seen = false;
        std::string err;
        REQUIRE(store.is_processed(src, id, seen, err));
        return seen;
    }
};

InboundMessage msg(int64_t src, int64_t id, const std::string& text) {
    InboundMessage m;
    m.source_id = src;
    m.message_id = id;
    m.text = text;
    return m;
}

} // namespace

TEST_CASE("Same identity twice: one delivery, counter +1") {
    Harness h;
    const auto m = msg(-100, 1, "hello there");

    CHECK(h.pipeline.process(m) == ProcessOutcome::Forwarded);
    CHECK(h.pipeline.process(m) == ProcessOutcome::AlreadyProcessed);

    CHECK(h.dest.sent.size() == 1);
    CHECK(h.stats.snapshot().messages == 1);
    CHECK(read_stats(h.stats.path()).messages == 1);
}

TEST_CASE("Overlapping codes: second message never delivered, both processed") {
    Harness h;
    CHECK(h.pipeline.process(msg(-1, 10, "deal CODE12345 today")) == ProcessOutcome::Forwarded);
    CHECK(h.pipeline.process(msg(-2, 20, "again code12345 here")) == ProcessOutcome::DuplicateCode);

    CHECK(h.dest.sent.size() == 1);
    CHECK(h.processed(-1, 10));
    CHECK(h.processed(-2, 20));
    CHECK(h.stats.snapshot().messages == 1);

    // the suppressed message stays suppressed
    CHECK(h.pipeline.process(msg(-2, 20, "again code12345 here")) == ProcessOutcome::AlreadyProcessed);
}

TEST_CASE("Delivery failure leaves the message eligible") {
    Harness h;
    h.dest.refuse = true;
    const auto m = msg(-100, 7, "ticket ABCDEF1");

    CHECK(h.pipeline.process(m) == ProcessOutcome::DeliveryFailed);
    CHECK_FALSE(h.processed(-100, 7));
    CHECK(h.stats.snapshot().messages == 0);

    std::set<std::string> found;
    std::string err;
    REQUIRE(h.store.find_existing_codes({"ABCDEF1"}, found, err));
    CHECK(found.empty());

    h.dest.refuse = false;
    CHECK(h.pipeline.process(m) == ProcessOutcome::Forwarded);
    CHECK(h.dest.sent.size() == 1);
    CHECK(h.stats.snapshot().messages == 1);
}

TEST_CASE("Attachments are delivered with the filtered text as caption, silently") {
    Harness h;
    std::string err;
    int64_t id = 0;
    REQUIRE(h.store.add_filter("foo", "bar", id, err));

    InboundMessage m = msg(-5, 1, "foo caption");
    m.attachment = "photo:42";
    CHECK(h.pipeline.process(m) == ProcessOutcome::Forwarded);

    REQUIRE(h.dest.sent.size() == 1);
    const Delivery& d = h.dest.sent[0];
    CHECK(d.text == "bar caption");
    REQUIRE(d.attachment.has_value());
    CHECK(*d.attachment == "photo:42");
    CHECK(d.silent);
}

TEST_CASE("Attachment-only message without codes is forwarded") {
    Harness h;
    InboundMessage m = msg(-5, 2, "");
    m.attachment = "doc:1";
    CHECK(h.pipeline.process(m) == ProcessOutcome::Forwarded);
    CHECK(h.dest.sent.size() == 1);
}

TEST_CASE("Broken extractor pattern: messages still forwarded, no code dedup") {
    Harness h;
    h.code_regex = "([oops";
    CHECK(h.pipeline.process(msg(-1, 1, "same CODE12345")) == ProcessOutcome::Forwarded);
    CHECK(h.pipeline.process(msg(-1, 2, "same CODE12345")) == ProcessOutcome::Forwarded);
    CHECK(h.dest.sent.size() == 2);
}

TEST_CASE("Closed store: nothing decided, nothing delivered") {
    Harness h;
    h.store.close();
    CHECK(h.pipeline.process(msg(-1, 1, "text ABCDEF1")) == ProcessOutcome::StoreFailed);
    CHECK(h.dest.sent.empty());
    CHECK(h.stats.snapshot().messages == 0);
}

TEST_CASE("Product link is expanded, stripped, deduplicated across sources") {
    Harness h;
    std::string err;
    int64_t id = 0;
    REQUIRE(h.store.add_filter(R"((https?://\S+))", EXPAND_MARKER, id, err));
    h.resolver.identity = true;

    CHECK(h.pipeline.process(msg(-1001, 1, "Check http://x/dp/ABC1234?ref=1")) == ProcessOutcome::Forwarded);
    REQUIRE(h.dest.sent.size() == 1);
    CHECK(h.dest.sent[0].text == "Check http://x/dp/ABC1234");
    CHECK(h.stats.snapshot().messages == 1);

    std::set<std::string> found;
    REQUIRE(h.store.find_existing_codes({"ABC1234"}, found, err));
    CHECK(found.count("ABC1234") == 1);

    CHECK(h.pipeline.process(msg(-1002, 9, "abc1234")) == ProcessOutcome::DuplicateCode);
    CHECK(h.dest.sent.size() == 1);
    CHECK(h.processed(-1002, 9));
    CHECK(h.stats.snapshot().messages == 1);
}

TEST_CASE("Outcome names") {
    CHECK(std::string(to_string(ProcessOutcome::Forwarded)) == "forwarded");
    CHECK(std::string(to_string(ProcessOutcome::DuplicateCode)) == "duplicate_code");
}

namespace {

// Re-enters the pipeline with the same message while the first delivery is in progress.
struct ReentrantDestination : transport::IDestination {
    ForwardingPipeline* pipeline{nullptr};
    InboundMessage      again;
    ProcessOutcome      inner{ProcessOutcome::Forwarded};
    int                 deliveries{0};

    bool deliver(const Delivery&, std::string&) override {
        ++deliveries;
        if (deliveries == 1 && pipeline) inner = pipeline->process(again);
        return true;
    }
    const char* name() const override { return "reentrant"; }
};

} // namespace

TEST_CASE("A duplicate arriving mid-delivery is not delivered again") {
    TempDir dir;
    StateStore store;
    std::string err;
    REQUIRE(store.open(":memory:", err));
    FakeResolver resolver;
    LinkFilterChain filters(store, resolver);
    CodeExtractor extractor([] { return std::string(DUP_CODE_REGEX_DEFAULT); });
    StatsRecorder stats(dir.file("stats.json"));
    stats.load();
    ReentrantDestination dest;
    ForwardingPipeline pipeline(store, filters, extractor, dest, stats);

    const auto m = msg(-9, 99, "racing message");
    dest.pipeline = &pipeline;
    dest.again = m;

    CHECK(pipeline.process(m) == ProcessOutcome::Forwarded);
    CHECK(dest.inner == ProcessOutcome::AlreadyProcessed);
    CHECK(dest.deliveries == 1);
    CHECK(stats.snapshot().messages == 1);
}

namespace {

struct ThrowingDestination : transport::IDestination {
    bool deliver(const Delivery&, std::string&) override { throw std::runtime_error("encoder exploded"); }
    const char* name() const override { return "throwing"; }
};

// Same wiring as Harness, over a caller-chosen destination.
struct Stack {
    TempDir            dir;
    StateStore         store;
    FakeResolver       resolver;
    LinkFilterChain    filters{store, resolver};
    CodeExtractor      extractor{[] { return std::string(DUP_CODE_REGEX_DEFAULT); }};
    StatsRecorder      stats{dir.file("stats.json")};
    ForwardingPipeline pipeline;

    explicit Stack(transport::IDestination& dest) : pipeline(store, filters, extractor, dest, stats) {
        std::string err;
        REQUIRE_MESSAGE(store.open(":memory:", err), err);
        stats.load();
    }
};

} // namespace

TEST_CASE("A rule that cuts a UTF-8 character still yields one valid output line") {
    std::ostringstream out;
    transport::LineDestination dest(out, "-100");
    Stack s(dest);
    std::string err;
    int64_t id = 0;
    REQUIRE(s.store.add_filter(R"(^([\s\S]{4})[\s\S]*)", "\\1", id, err));

    CHECK(s.pipeline.process(msg(-1, 1, "abcé tail")) == ProcessOutcome::Forwarded);
    CHECK(s.stats.snapshot().messages == 1);

    const nlohmann::json j = nlohmann::json::parse(out.str());
    CHECK(j.at("text") == "abc\xEF\xBF\xBD");
}

TEST_CASE("A destination that throws counts as a failed delivery") {
    ThrowingDestination dest;
    Stack s(dest);

    CHECK(s.pipeline.process(msg(-1, 2, "anything ABCDEF1")) == ProcessOutcome::DeliveryFailed);
    bool seen = true;
    std::string err;
    REQUIRE(s.store.is_processed(-1, 2, seen, err));
    CHECK_FALSE(seen);
    CHECK(s.stats.snapshot().messages == 0);
}

TEST_CASE("Accented words do not make later messages look like duplicates") {
    Harness h;
    CHECK(h.pipeline.process(msg(-1, 1, "Informações do produto")) == ProcessOutcome::Forwarded);
    CHECK(h.pipeline.process(msg(-2, 2, "Mais informações amanhã")) == ProcessOutcome::Forwarded);
    CHECK(h.dest.sent.size() == 2);
}
