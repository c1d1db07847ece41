#include "snotes/core/clock.h"
#include "snotes/core/errors.h"
#include "snotes/storage/inmemory_paste_storage.h"
#include "snotes/token/token_generator.h"

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "jsonrpc_protocol.h"
#include "method_handlers.h"
#include "server_context.h"
#include "server_loop.h"
#include <chrono>
#include <memory>
#include <sstream>
#include <string>

using namespace snotes;
using namespace snotes::server;
using json = nlohmann::json;
using namespace std::chrono_literals;

// 2026-01-01T00:00:00Z
static const core::Timestamp kStart = core::from_unix_millis(1767225600000);

// Always returns the same token: the second create collides.
class RepeatingTokenGenerator final : public token::ITokenGenerator {
 public:
  token::GeneratedToken next() override {
    return token::GeneratedToken{core::PasteToken{"0000000000a"}, 10};
  }
};

// Fixture: in-memory storage on a manual clock plus the full method registry.
struct ServerFixture {
  core::ManualClock clock{kStart};
  snotes::storage::InMemoryPasteStorage storage{
      std::make_unique<token::SnowflakeTokenGenerator>(4, clock), clock};
  ServerConfig config;
  ServerContext ctx{storage, clock, config};
  MethodRegistry registry = build_method_registry();
  std::ostringstream log;

  json call(const std::string& line) { return json::parse(handle_line(line, registry, ctx, log)); }

  json call(const std::string& method, const json& params, const json& id = 1) {
    json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return call(request.dump());
  }
};

// ── protocol ────────────────────────────────────────────────────────────────

TEST_CASE("parse_request keeps the id type", "[jsonrpc]") {
  auto numeric = parse_request(R"({"jsonrpc":"2.0","id":7,"method":"health"})");
  REQUIRE(numeric.has_value());
  CHECK(numeric.value().id == 7);
  CHECK(numeric.value().method == "health");
  CHECK(numeric.value().params.is_object());

  auto text = parse_request(R"({"jsonrpc":"2.0","id":"abc","method":"health","params":{}})");
  REQUIRE(text.has_value());
  CHECK(text.value().id == "abc");

  auto absent = parse_request(R"({"jsonrpc":"2.0","method":"health"})");
  REQUIRE(absent.has_value());
  CHECK(absent.value().id.is_null());
}

TEST_CASE("parse_request rejects malformed messages", "[jsonrpc]") {
  auto garbage = parse_request("{not json");
  REQUIRE_FALSE(garbage.has_value());
  CHECK(garbage.error().error.code == kParseError);

  auto array = parse_request("[1,2,3]");
  REQUIRE_FALSE(array.has_value());
  CHECK(array.error().error.code == kInvalidRequest);

  auto no_method = parse_request(R"({"jsonrpc":"2.0","id":3})");
  REQUIRE_FALSE(no_method.has_value());
  CHECK(no_method.error().error.code == kInvalidRequest);
  CHECK(no_method.error().id == 3);

  auto bad_params = parse_request(R"({"id":4,"method":"health","params":"x"})");
  REQUIRE_FALSE(bad_params.has_value());
  CHECK(bad_params.error().error.code == kInvalidRequest);
}

TEST_CASE("make_response and make_error_response shapes", "[jsonrpc]") {
  const auto ok = json::parse(make_response(5, json{{"status", "ok"}}));
  CHECK(ok["jsonrpc"] == "2.0");
  CHECK(ok["id"] == 5);
  CHECK(ok["result"]["status"] == "ok");
  CHECK_FALSE(ok.contains("error"));

  const auto err =
      json::parse(make_error_response(nullptr, JsonRpcError{kMethodNotFound, "nope", {}}));
  CHECK(err["id"].is_null());
  CHECK(err["error"]["code"] == kMethodNotFound);
  CHECK(err["error"]["message"] == "nope");
  CHECK_FALSE(err.contains("result"));
}

// ── dispatch ────────────────────────────────────────────────────────────────

TEST_CASE("handle_line answers parse errors and unknown methods", "[jsonrpc][server]") {
  ServerFixture f;

  const auto parse_error = f.call("{oops");
  CHECK(parse_error["error"]["code"] == kParseError);
  CHECK(parse_error["id"].is_null());

  const auto unknown = f.call("pastes.delete", json::object());
  CHECK(unknown["error"]["code"] == kMethodNotFound);
  CHECK(unknown["id"] == 1);
}

TEST_CASE("health reports backend and worker", "[jsonrpc][server]") {
  ServerFixture f;
  f.config.worker_id = 4;

  const auto response = f.call("health", json::object(), "h-1");
  CHECK(response["id"] == "h-1");
  CHECK(response["result"]["status"] == "ok");
  CHECK(response["result"]["storage"] == "memory");
  CHECK(response["result"]["worker_id"] == 4);
  CHECK(response["result"]["time"] == "2026-01-01T00:00:00.000Z");
}

TEST_CASE("pastes.create then pastes.get returns the same paste", "[jsonrpc][server]") {
  ServerFixture f;

  const auto created =
      f.call("pastes.create", {{"content", "Hello, World!"}, {"expires_in_seconds", 3600}});
  REQUIRE(created.contains("result"));
  const auto& meta = created["result"];
  CHECK(meta["size_bytes"] == 13);
  CHECK(meta["content_type"] == "text/plain; charset=utf-8");
  CHECK(meta["expires_at"] == "2026-01-01T01:00:00.000Z");
  CHECK_FALSE(meta.contains("content"));

  const auto token = meta["token"].get<std::string>();
  const auto fetched = f.call("pastes.get", {{"token", token}}, 2);
  REQUIRE(fetched.contains("result"));
  CHECK(fetched["id"] == 2);
  CHECK(fetched["result"]["content"] == "Hello, World!");
  CHECK(fetched["result"]["sha256"] == meta["sha256"]);

  const auto raw = f.call("pastes.get_content", {{"token", token}}, 3);
  REQUIRE(raw.contains("result"));
  CHECK(raw["result"]["content"] == "Hello, World!");
  CHECK(raw["result"]["etag"] == "\"" + meta["sha256"].get<std::string>() + "\"");
  CHECK(raw["result"]["cache_control"] == "no-store");
}

TEST_CASE("pastes.create maps validation failures to invalid params", "[jsonrpc][server]") {
  ServerFixture f;

  const auto missing = f.call("pastes.create", json::object());
  CHECK(missing["error"]["code"] == kInvalidParams);
  CHECK(missing["error"]["data"]["field"] == "content");

  const auto wrong_type = f.call("pastes.create", {{"content", 42}});
  CHECK(wrong_type["error"]["code"] == kInvalidParams);

  const auto short_ttl = f.call("pastes.create", {{"content", "x"}, {"expires_in_seconds", 30}});
  CHECK(short_ttl["error"]["code"] == kInvalidParams);
  CHECK(short_ttl["error"]["data"]["field"] == "expires_in_seconds");

  const auto empty = f.call("pastes.create", {{"content", ""}});
  CHECK(empty["error"]["code"] == kInvalidParams);

  CHECK(f.storage.entry_count() == 0);
}

TEST_CASE("pastes.get answers not found for unknown and expired tokens", "[jsonrpc][server]") {
  ServerFixture f;

  const auto unknown = f.call("pastes.get", {{"token", "00000000000"}});
  CHECK(unknown["error"]["code"] == kPasteNotFound);
  CHECK(unknown["error"]["message"] == "Paste not found or expired");

  const auto malformed = f.call("pastes.get_content", {{"token", "../etc"}});
  CHECK(malformed["error"]["code"] == kPasteNotFound);

  const auto missing = f.call("pastes.get", json::object());
  CHECK(missing["error"]["code"] == kInvalidParams);

  const auto created = f.call("pastes.create", {{"content", "brief"}, {"expires_in_seconds", 60}});
  const auto token = created["result"]["token"].get<std::string>();
  f.clock.advance(60s);

  const auto expired = f.call("pastes.get", {{"token", token}});
  CHECK(expired["error"]["code"] == kPasteNotFound);
}

TEST_CASE("pastes.cleanup_expired reports the removed count", "[jsonrpc][server]") {
  ServerFixture f;

  (void)f.call("pastes.create", {{"content", "a"}, {"expires_in_seconds", 60}});
  (void)f.call("pastes.create", {{"content", "b"}, {"expires_in_seconds", 60}});
  (void)f.call("pastes.create", {{"content", "c"}, {"expires_in_seconds", 600}});
  f.clock.advance(2min);

  const auto swept = f.call("pastes.cleanup_expired", json::object());
  CHECK(swept["result"]["removed"] == 2);
}

TEST_CASE("storage errors become internal errors carrying the kind", "[jsonrpc][server]") {
  core::ManualClock clock(kStart);
  storage::InMemoryPasteStorage storage(std::make_unique<RepeatingTokenGenerator>(), clock);
  ServerConfig config;
  ServerContext ctx{storage, clock, config};
  const auto registry = build_method_registry();
  std::ostringstream log;

  const std::string request = R"({"jsonrpc":"2.0","id":1,"method":"pastes.create",)"
                              R"("params":{"content":"x"}})";
  (void)handle_line(request, registry, ctx, log);
  const auto collided = json::parse(handle_line(request, registry, ctx, log));

  CHECK(collided["error"]["code"] == kInternalError);
  CHECK(collided["error"]["data"]["kind"] == "token_collision");
  CHECK(log.str().find("token_collision") != std::string::npos);
}

TEST_CASE("clock regression surfaces as an internal error", "[jsonrpc][server]") {
  ServerFixture f;

  REQUIRE(f.call("pastes.create", {{"content", "first"}}).contains("result"));
  f.clock.advance(-10ms);

  const auto regressed = f.call("pastes.create", {{"content", "second"}});
  CHECK(regressed["error"]["code"] == kInternalError);
  CHECK(regressed["error"]["data"]["kind"] == "clock_regression");
}

// ── loop ────────────────────────────────────────────────────────────────────

TEST_CASE("run_server_loop writes one response per request line", "[jsonrpc][server]") {
  ServerFixture f;
  std::istringstream in(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"health\"}\n"
      "\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"pastes.cleanup_expired\"}\n");
  std::ostringstream out;

  run_server_loop(f.ctx, in, out, f.log);

  std::istringstream lines(out.str());
  std::string first;
  std::string second;
  std::string extra;
  REQUIRE(std::getline(lines, first));
  REQUIRE(std::getline(lines, second));
  CHECK_FALSE(std::getline(lines, extra));

  CHECK(json::parse(first)["id"] == 1);
  CHECK(json::parse(second)["result"]["removed"] == 0);
  CHECK(f.log.str().find("Received: health") != std::string::npos);
}
