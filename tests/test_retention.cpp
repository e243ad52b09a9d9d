#include <doctest/doctest.h>
#include <chrono>
#include <thread>
#include "linkrelay/retention.hpp"
#include "test_support.hpp"

using namespace linkrelay;
using std::chrono::hours;
using testing_support::TempDir;
using testing_support::write_text;

static std::tm at(int h, int m, int s) {
    std::tm t{};
    t.tm_hour = h;
    t.tm_min = m;
    t.tm_sec = s;
    return t;
}

TEST_CASE("Next run is later today, else tomorrow, never under a minute") {
    const TimeOfDay five_past{0, 5};
    CHECK(RetentionScheduler::seconds_until_next_run(five_past, at(0, 0, 0)) == 300);
    CHECK(RetentionScheduler::seconds_until_next_run(five_past, at(0, 5, 0)) == 24 * 3600);
    CHECK(RetentionScheduler::seconds_until_next_run(five_past, at(23, 0, 0)) == 3900);
    CHECK(RetentionScheduler::seconds_until_next_run(five_past, at(0, 4, 30)) == 60);
    CHECK(RetentionScheduler::seconds_until_next_run(TimeOfDay{12, 0}, at(11, 59, 59)) == 60);
}

TEST_CASE("Sweep removes old identities and clears the code cache") {
    TempDir dir;
    StateStore store;
    std::string err;
    REQUIRE(store.open(":memory:", err));
    write_text(dir.file(".env"), "CLEANUP_DAYS=5\n");
    LiveConfig live(dir.file(".env"));
    RetentionScheduler scheduler(store, live);

    const auto now = std::chrono::system_clock::now();
    REQUIRE(store.mark_processed_at(1, 1, now - hours(24) * 6, err));
    REQUIRE(store.mark_processed_at(1, 2, now - hours(24) * 4, err));
    REQUIRE(store.mark_codes({"CODE01", "CODE02"}, err));

    const SweepReport r = scheduler.sweep(now);
    CHECK(r.ok);
    CHECK(r.days == 5);
    CHECK(r.processed_removed == 1);
    CHECK(r.codes_cleared);
    CHECK(r.codes_removed == 2);
}

TEST_CASE("Retention disabled: identities kept, codes per CLEANUP_CODES_WHEN_DISABLED") {
    TempDir dir;
    StateStore store;
    std::string err;
    REQUIRE(store.open(":memory:", err));
    const auto now = std::chrono::system_clock::now();
    REQUIRE(store.mark_processed_at(1, 1, now - hours(24) * 900, err));
    LiveConfig live(dir.file(".env"));
    RetentionScheduler scheduler(store, live);

    write_text(dir.file(".env"), "CLEANUP_DAYS=0\n");
    REQUIRE(store.mark_codes({"CODE01"}, err));
    SweepReport r = scheduler.sweep(now);
    CHECK(r.processed_removed == 0);
    CHECK(r.codes_cleared);
    CHECK(r.codes_removed == 1);

    write_text(dir.file(".env"), "CLEANUP_DAYS=0\nCLEANUP_CODES_WHEN_DISABLED=false\n");
    REQUIRE(store.mark_codes({"CODE02"}, err));
    r = scheduler.sweep(now);
    CHECK_FALSE(r.codes_cleared);
    std::set<std::string> found;
    REQUIRE(store.find_existing_codes({"CODE02"}, found, err));
    CHECK(found.size() == 1);

    bool seen = false;
    REQUIRE(store.is_processed(1, 1, seen, err));
    CHECK(seen);
}

TEST_CASE("Sweep on a closed store reports failure and does not throw") {
    TempDir dir;
    StateStore store;
    LiveConfig live(dir.file(".env"));
    RetentionScheduler scheduler(store, live);
    const SweepReport r = scheduler.sweep(std::chrono::system_clock::now());
    CHECK_FALSE(r.ok);
}

TEST_CASE("stop() wakes the wait phase") {
    TempDir dir;
    StateStore store;
    std::string err;
    REQUIRE(store.open(":memory:", err));
    LiveConfig live(dir.file(".env"));
    RetentionScheduler scheduler(store, live);

    std::thread t([&scheduler] { scheduler.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK(scheduler.phase() == RetentionScheduler::Phase::Wait);
    scheduler.stop();
    t.join();
}
