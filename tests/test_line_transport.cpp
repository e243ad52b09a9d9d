#include <doctest/doctest.h>
#include <sstream>
#include <nlohmann/json.hpp>
#include "linkrelay/transport/line_transport.hpp"

using namespace linkrelay;
using namespace linkrelay::transport;
using json = nlohmann::json;

TEST_CASE("Inbound line: identity required, text and attachment optional") {
    InboundMessage m;
    std::string err;

    REQUIRE(parse_inbound_line(R"({"source_id":-1001,"message_id":42,"text":"hi","attachment":"photo:1"})", m, err));
    CHECK(m.source_id == -1001);
    CHECK(m.message_id == 42);
    CHECK(m.text == "hi");
    REQUIRE(m.attachment.has_value());
    CHECK(*m.attachment == "photo:1");

    REQUIRE(parse_inbound_line(R"({"source_id":1,"message_id":2,"attachment":null,"extra":true})", m, err));
    CHECK(m.text.empty());
    CHECK_FALSE(m.attachment.has_value());
}

TEST_CASE("Inbound line: malformed input is rejected with a reason") {
    InboundMessage m;
    std::string err;
    CHECK_FALSE(parse_inbound_line("{broken", m, err));
    CHECK(err == "bad_json");
    CHECK_FALSE(parse_inbound_line("[1,2]", m, err));
    CHECK(err == "not_object");
    CHECK_FALSE(parse_inbound_line(R"({"source_id":"x","message_id":1})", m, err));
    CHECK(err == "bad_source_id");
    CHECK_FALSE(parse_inbound_line(R"({"source_id":1})", m, err));
    CHECK(err == "bad_message_id");
    CHECK_FALSE(parse_inbound_line(R"({"source_id":1,"message_id":2,"text":5})", m, err));
    CHECK(err == "bad_text");
}

TEST_CASE("LineSource skips blank and bad lines, then reports end of input") {
    std::istringstream in(
        "\n"
        "{\"source_id\":1,\"message_id\":1,\"text\":\"a\"}\r\n"
        "not json\n"
        "   \n"
        "{\"source_id\":1,\"message_id\":2,\"text\":\"b\"}\n");
    LineSource src(in);
    InboundMessage m;
    std::string err;

    REQUIRE(src.receive(m, err) == RxResult::Ok);
    CHECK(m.message_id == 1);
    REQUIRE(src.receive(m, err) == RxResult::Ok);
    CHECK(m.message_id == 2);
    CHECK(src.receive(m, err) == RxResult::None);
    CHECK(src.skipped() == 1);
}

TEST_CASE("LineDestination writes one JSON object per delivery") {
    std::ostringstream out;
    LineDestination dest(out, "-100999");
    Delivery d;
    d.text = "caption";
    d.attachment = "doc:7";
    std::string err;
    REQUIRE(dest.deliver(d, err));

    Delivery plain;
    plain.text = "just text";
    REQUIRE(dest.deliver(plain, err));

    std::istringstream lines(out.str());
    std::string first, second;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));

    const json a = json::parse(first);
    CHECK(a.at("dest") == "-100999");
    CHECK(a.at("text") == "caption");
    CHECK(a.at("attachment") == "doc:7");
    CHECK(a.at("silent") == true);

    const json b = json::parse(second);
    CHECK_FALSE(b.contains("attachment"));
}

TEST_CASE("LineDestination reports a broken stream") {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    LineDestination dest(out, "x");
    std::string err;
    CHECK_FALSE(dest.deliver(Delivery{}, err));
    CHECK(err == "write_failed");
}

TEST_CASE("Inbound line: UTF-8 text passes through unchanged") {
    InboundMessage m;
    std::string err;
    REQUIRE(parse_inbound_line(R"({"source_id":1,"message_id":3,"text":"Promoção imperdível"})", m, err));
    CHECK(m.text == "Promoção imperdível");
}

TEST_CASE("LineDestination replaces a split UTF-8 sequence instead of failing") {
    std::ostringstream out;
    LineDestination dest(out, "x");
    Delivery d;
    d.text = std::string("abc\xC3");     // first byte of 'é' only
    std::string err;
    REQUIRE(dest.deliver(d, err));

    const json j = json::parse(out.str());
    CHECK(j.at("text") == "abc\xEF\xBF\xBD");
}

TEST_CASE("LineSource::ready reports buffered input without blocking") {
    std::istringstream in(
        "{\"source_id\":1,\"message_id\":1}\n"
        "{\"source_id\":1,\"message_id\":2}\n");
    LineSource src(in);
    InboundMessage m;
    std::string err;

    CHECK(src.ready());
    REQUIRE(src.receive(m, err) == RxResult::Ok);
    CHECK(src.ready());
    REQUIRE(src.receive(m, err) == RxResult::Ok);
    CHECK_FALSE(src.ready());
}
