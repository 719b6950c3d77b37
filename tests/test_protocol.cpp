#include <catch2/catch_test_macros.hpp>
#include "protocol.hpp"

using namespace paperscout;
using json = nlohmann::json;

// ── Encoding ─────────────────────────────────────────────────────

TEST_CASE("encode: request carries jsonrpc, id, method, params", "[protocol]") {
    Request req;
    req.id = 7;
    req.method = methods::ToolsCall;
    req.params = {{"name", "bm25_search"}, {"arguments", {{"query", "x"}}}};

    std::string line = encode(req);
    REQUIRE(line.find('\n') == std::string::npos);

    auto j = json::parse(line);
    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["id"] == 7);
    REQUIRE(j["method"] == "tools/call");
    REQUIRE(j["params"]["name"] == "bm25_search");
}

TEST_CASE("encode: notification has no id", "[protocol]") {
    Notification note;
    note.method = methods::Initialized;
    auto j = json::parse(encode(note));
    REQUIRE(j["method"] == "notifications/initialized");
    REQUIRE_FALSE(j.contains("id"));
    REQUIRE_FALSE(j.contains("params"));
}

TEST_CASE("encode: error response nests message", "[protocol]") {
    auto j = json::parse(encode(Response::failure(3, "unknown tool nope")));
    REQUIRE(j["id"] == 3);
    REQUIRE(j["error"]["message"] == "unknown tool nope");
    REQUIRE_FALSE(j.contains("result"));
}

TEST_CASE("encode: invalid UTF-8 in a result does not throw", "[protocol]") {
    std::string bad = "abc\xff\xfe";
    std::string line;
    REQUIRE_NOTHROW(line = encode(Response::success(1, bad)));
    REQUIRE(json::parse(line)["result"].is_string());
}

// ── decode_response ──────────────────────────────────────────────

TEST_CASE("decode_response: success", "[protocol]") {
    auto r = decode_response(R"({"jsonrpc":"2.0","id":4,"result":["a"]})");
    REQUIRE(r.id == 4);
    REQUIRE_FALSE(r.is_error);
    REQUIRE(r.result == json::array({"a"}));
}

TEST_CASE("decode_response: null result is still a result", "[protocol]") {
    auto r = decode_response(R"({"jsonrpc":"2.0","id":2,"result":null})");
    REQUIRE_FALSE(r.is_error);
    REQUIRE(r.result.is_null());
}

TEST_CASE("decode_response: error object and bare error string", "[protocol]") {
    auto r = decode_response(R"({"id":5,"error":{"code":-32000,"message":"boom"}})");
    REQUIRE(r.is_error);
    REQUIRE(r.error_message == "boom");

    auto s = decode_response(R"({"id":6,"error":"flat"})");
    REQUIRE(s.is_error);
    REQUIRE(s.error_message == "flat");
}

TEST_CASE("decode_response: protocol violations throw", "[protocol]") {
    REQUIRE_THROWS_AS(decode_response("not json"), ProtocolError);
    REQUIRE_THROWS_AS(decode_response("[1,2]"), ProtocolError);
    REQUIRE_THROWS_AS(decode_response(R"({"result":1})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_response(R"({"id":"1","result":1})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_response(R"({"id":1})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_response(R"({"id":1,"result":1,"error":{"message":"x"}})"),
                      ProtocolError);
}

// ── decode_incoming ──────────────────────────────────────────────

TEST_CASE("decode_incoming: request and notification", "[protocol]") {
    auto req = decode_incoming(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"a":1}})");
    REQUIRE(req.method == "initialize");
    REQUIRE(req.id.has_value());
    REQUIRE(*req.id == 1);
    REQUIRE(req.params["a"] == 1);

    auto note = decode_incoming(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(note.is_notification());
    REQUIRE(note.params.is_object());
}

TEST_CASE("decode_incoming: missing method throws", "[protocol]") {
    REQUIRE_THROWS_AS(decode_incoming(R"({"id":1})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_incoming(R"({"id":1,"method":3})"), ProtocolError);
    REQUIRE_THROWS_AS(decode_incoming("{"), ProtocolError);
}
