#include <doctest/doctest.h>
#include "linkrelay/admin.hpp"
#include "test_support.hpp"

using namespace linkrelay;
using testing_support::TempDir;
using testing_support::write_text;

namespace {

struct AdminHarness {
    TempDir      dir;
    StateStore   store;
    LiveConfig   live{dir.file(".env")};
    AdminService admin{store, live, "s3cret", dir.file("stats.json")};

    AdminHarness() {
        write_text(dir.file(".env"), "API_ID=1\nSOURCE_CHATS=-100,-200\n");
        std::string err;
        REQUIRE_MESSAGE(store.open(":memory:", err), err);
    }
};

} // namespace

TEST_CASE("Password check") {
    AdminHarness h;
    CHECK(h.admin.check_password("s3cret"));
    CHECK_FALSE(h.admin.check_password("s3cre"));
    CHECK_FALSE(h.admin.check_password("s3cret!"));
    CHECK_FALSE(h.admin.check_password(""));
}

TEST_CASE("Filters are validated before they are stored") {
    AdminHarness h;
    std::string err;
    int64_t id = 0;

    CHECK_FALSE(h.admin.add_filter("([bad", "x", id, err));
    CHECK(err.rfind("bad_pattern", 0) == 0);
    CHECK_FALSE(h.admin.add_filter("", "x", id, err));

    REQUIRE(h.admin.add_filter("good", "better", id, err));
    CHECK_FALSE(h.admin.update_filter(id, "(", "x", err));
    CHECK_FALSE(h.admin.update_filter(id + 100, "ok", "x", err));
    CHECK(err == "not_found");
    REQUIRE(h.admin.update_filter(id, "good+", "best", err));

    std::vector<FilterRule> rules;
    REQUIRE(h.admin.list_filters(rules, err));
    REQUIRE(rules.size() == 1);
    CHECK(rules[0].pattern == "good+");

    REQUIRE(h.admin.delete_filter(id, err));
    CHECK_FALSE(h.admin.delete_filter(id, err));
    CHECK(err == "not_found");
}

TEST_CASE("Reordering swaps neighbours and stops at the ends") {
    AdminHarness h;
    std::string err;
    int64_t a = 0, b = 0;
    REQUIRE(h.admin.add_filter("A", "B", a, err));
    REQUIRE(h.admin.add_filter("B", "C", b, err));

    bool moved = false;
    REQUIRE(h.admin.move_filter_down(b, moved, err));
    CHECK_FALSE(moved);
    REQUIRE(h.admin.move_filter_down(a, moved, err));
    CHECK(moved);

    std::vector<FilterRule> rules;
    REQUIRE(h.admin.list_filters(rules, err));
    CHECK(rules[0].id == b);
    CHECK(rules[1].id == a);

    REQUIRE(h.admin.move_filter_up(a, moved, err));
    CHECK(moved);
    REQUIRE(h.admin.list_filters(rules, err));
    CHECK(rules[0].id == a);
}

TEST_CASE("set_channel labels a source and appends it to SOURCE_CHATS once") {
    AdminHarness h;
    std::string err;
    REQUIRE(h.admin.set_channel(-300, "  Deals  ", err));
    REQUIRE(h.admin.set_channel(-300, "Deals EU", err));

    std::vector<int64_t> sources;
    REQUIRE(h.admin.configured_sources(sources, err));
    CHECK(sources == std::vector<int64_t>{-100, -200, -300});

    const EnvMap env = h.live.file_values();
    CHECK(env.at("ADMIN_PASSWORD") == "s3cret");
    CHECK(env.at("API_ID") == "1");

    std::map<int64_t, std::string> labels;
    REQUIRE(h.store.channel_labels(labels, err));
    CHECK(labels.at(-300) == "Deals EU");
}

TEST_CASE("channel_stats: configured order first, then extra sources") {
    AdminHarness h;
    std::string err;
    REQUIRE(h.store.mark_processed(-200, 1, err));
    REQUIRE(h.store.mark_processed(-200, 2, err));
    REQUIRE(h.store.mark_processed(-999, 1, err));
    REQUIRE(h.store.upsert_channel(-100, "first", err));

    std::vector<ChannelStat> rows;
    REQUIRE(h.admin.channel_stats(rows, err));
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].source_id == -100);
    CHECK(rows[0].name == "first");
    CHECK(rows[0].messages == 0);
    CHECK(rows[1].source_id == -200);
    CHECK(rows[1].messages == 2);
    CHECK(rows[2].source_id == -999);
    CHECK(rows[2].messages == 1);
}

TEST_CASE("Retention and regex settings are validated and removable") {
    AdminHarness h;
    std::string err;

    REQUIRE(h.admin.set_retention("14", "03:30", err));
    CHECK(h.live.retention_days() == 14);
    CHECK(h.live.retention_time().hour == 3);

    CHECK_FALSE(h.admin.set_retention("fortnight", "", err));
    CHECK(err == "bad_days");
    CHECK_FALSE(h.admin.set_retention("", "25:00", err));
    CHECK(err == "bad_time");
    CHECK(h.live.retention_days() == 14);

    REQUIRE(h.admin.set_retention("", "", err));
    CHECK(h.live.retention_days() == CLEANUP_DAYS_DEFAULT);

    CHECK_FALSE(h.admin.set_dup_code_regex("([A-Z", err));
    CHECK(h.live.dup_code_regex() == DUP_CODE_REGEX_DEFAULT);
    REQUIRE(h.admin.set_dup_code_regex(R"(\b[A-Z]{4}\d{4}\b)", err));
    CHECK(h.live.dup_code_regex() == R"(\b[A-Z]{4}\d{4}\b)");
    REQUIRE(h.admin.set_dup_code_regex("  ", err));
    CHECK(h.live.dup_code_regex() == DUP_CODE_REGEX_DEFAULT);
}

TEST_CASE("Query and reset go through the store gates") {
    AdminHarness h;
    std::string err;
    REQUIRE(h.store.mark_processed(-100, 1, err));

    QueryResult q;
    REQUIRE(h.admin.run_query("SELECT COUNT(*) AS n FROM processed", q, err));
    CHECK(q.rows[0][0].get<int64_t>() == 1);
    CHECK_FALSE(h.admin.run_query("DROP TABLE processed", q, err));

    REQUIRE(h.admin.reset_state(err));
    REQUIRE(h.admin.run_query("SELECT COUNT(*) FROM processed", q, err));
    CHECK(q.rows[0][0].get<int64_t>() == 0);
}

TEST_CASE("service_stats reads the daemon's file") {
    AdminHarness h;
    CHECK(h.admin.service_stats().status == ServiceStatus::Unknown);
    write_text(h.dir.file("stats.json"), R"({"messages":3,"status":"running"})");
    const Stats s = h.admin.service_stats();
    CHECK(s.messages == 3);
    CHECK(s.status == ServiceStatus::Running);
}
