#include <doctest/doctest.h>
#include "linkrelay/config.hpp"
#include "test_support.hpp"

using namespace linkrelay;
using testing_support::TempDir;
using testing_support::write_text;

TEST_CASE("Env text: comments, export prefix, quotes, '#' inside values") {
    EnvMap env;
    parse_env_text(
        "# comment\n"
        "\n"
        "API_ID=12345\n"
        "export API_HASH = abc\n"
        "DEST_CHAT=\"@mirror\"\n"
        "DUP_CODE_REGEX='#([A-Z]{6})'\n"
        "no_equals_line\n", env);

    CHECK(env.at("API_ID") == "12345");
    CHECK(env.at("API_HASH") == "abc");
    CHECK(env.at("DEST_CHAT") == "@mirror");
    CHECK(env.at("DUP_CODE_REGEX") == "#([A-Z]{6})");
    CHECK(env.count("no_equals_line") == 0);
}

TEST_CASE("Source list: blanks ignored, junk rejected") {
    std::vector<int64_t> ids;
    std::string err;
    REQUIRE(parse_source_list(" -1001, 42,,7, ", ids, err));
    CHECK(ids == std::vector<int64_t>{-1001, 42, 7});
    CHECK(format_source_list(ids) == "-1001,42,7");

    CHECK_FALSE(parse_source_list("12,abc", ids, err));
    CHECK(err.find("bad_source_id") != std::string::npos);
}

TEST_CASE("Cleanup knobs fall back to defaults on bad input") {
    TimeOfDay t;
    CHECK(parse_time_of_day("07:30", t));
    CHECK(t.hour == 7);
    CHECK(t.minute == 30);
    CHECK_FALSE(parse_time_of_day("24:00", t));
    CHECK_FALSE(parse_time_of_day("7:3x", t));
    CHECK_FALSE(parse_time_of_day("0730", t));

    const TimeOfDay d = parse_cleanup_time("nonsense");
    CHECK(d.hour == 0);
    CHECK(d.minute == 5);

    CHECK(parse_cleanup_days("14") == 14);
    CHECK(parse_cleanup_days("0") == 0);
    CHECK(parse_cleanup_days("-3") == -3);
    CHECK(parse_cleanup_days("two weeks") == 30);

    CHECK(parse_bool("Yes", false));
    CHECK_FALSE(parse_bool("off", true));
    CHECK(parse_bool("maybe", true));
}

TEST_CASE("Settings: every required key must be present") {
    EnvMap env{{"API_ID", "1"}, {"API_HASH", "h"}, {"DEST_CHAT", "-100"},
               {"SOURCE_CHATS", "-1,-2"}, {"ADMIN_PASSWORD", "pw"}};
    Settings s;
    std::string err;
    REQUIRE(load_settings(env, s, err));
    CHECK(s.source_chats == std::vector<int64_t>{-1, -2});
    CHECK(s.web_port == 8000);
    CHECK(s.session_name == "mirror");

    for (const auto& key : REQUIRED_KEYS) {
        EnvMap missing = env;
        missing.erase(key);
        CHECK_FALSE(load_settings(missing, s, err));
        CHECK(err == "missing_env_var key=" + key);
    }

    EnvMap bad_port = env;
    bad_port["WEB_PORT"] = "http";
    CHECK_FALSE(load_settings(bad_port, s, err));
}

TEST_CASE("LiveConfig re-reads the file on every call") {
    TempDir dir;
    const std::string path = dir.file(".env");
    LiveConfig live(path);

    CHECK(live.retention_days() == CLEANUP_DAYS_DEFAULT);
    CHECK(live.dup_code_regex() == DUP_CODE_REGEX_DEFAULT);
    CHECK(live.clear_codes_when_disabled());

    write_text(path, "CLEANUP_DAYS=7\nCLEANUP_TIME=03:15\nCLEANUP_CODES_WHEN_DISABLED=false\n");
    CHECK(live.retention_days() == 7);
    CHECK(live.retention_time().hour == 3);
    CHECK(live.retention_time().minute == 15);
    CHECK_FALSE(live.clear_codes_when_disabled());

    write_text(path, "CLEANUP_DAYS=oops\nCLEANUP_TIME=99:99\n");
    CHECK(live.retention_days() == 30);
    CHECK(live.retention_time().hour == 0);
    CHECK(live.retention_time().minute == 5);
}

TEST_CASE("LiveConfig update rewrites the whole file and keeps other keys") {
    TempDir dir;
    const std::string path = dir.file("config/.env");
    LiveConfig live(path);
    std::string err;

    REQUIRE(live.update([](EnvMap& env) { env["ADMIN_PASSWORD"] = "pw"; env["CLEANUP_DAYS"] = "9"; }, err));
    REQUIRE(live.update([](EnvMap& env) { env.erase("CLEANUP_DAYS"); }, err));

    const EnvMap values = live.file_values();
    CHECK(values.at("ADMIN_PASSWORD") == "pw");
    CHECK(values.count("CLEANUP_DAYS") == 0);
}

TEST_CASE("Written values read back exactly, quotes and padding included") {
    TempDir dir;
    const std::string path = dir.file(".env");
    const EnvMap written{
        {"DUP_CODE_REGEX", R"re("(\w+)")re"},
        {"SINGLE", "'x'"},
        {"PADDED", " spaced "},
        {"PLAIN", "a#b=c"},
    };
    std::string err;
    REQUIRE(write_env_file(path, written, err));

    EnvMap read;
    REQUIRE(read_env_file(path, read, err));
    CHECK(read == written);
}

TEST_CASE("Data dir: explicit DATA_DIR wins") {
    CHECK(resolve_data_dir(EnvMap{{"DATA_DIR", "/srv/relay"}}) == "/srv/relay");
}
