#include <doctest/doctest.h>

#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../helpers.hpp"
#include "sentience/agent.hpp"
#include "sentience/server.hpp"
#include "sentience/tooling.hpp"

namespace json = boost::json;
namespace asio = boost::asio;
namespace rpc = sentience::jsonrpc;

using sentience::test::capture_sink;
using sentience::test::settle;
using sentience::test::spawn;

namespace {

// A host on the other end of a server, speaking through encoded lines.
struct host_fixture {
  explicit host_fixture(
      sentience::agent_options opts = {},
      std::unique_ptr<sentience::responder> resp = nullptr)
      : srv{ctx.get_executor(), sink, std::move(opts), std::move(resp)} {
    done = spawn(ctx, srv.run());
  }
  host_fixture(const host_fixture&) = delete;
  host_fixture(host_fixture&&) = delete;
  host_fixture& operator=(const host_fixture&) = delete;
  host_fixture& operator=(host_fixture&&) = delete;
  ~host_fixture() {
    srv.close();
    settle(ctx);
  }

  void feed(std::string_view line) {
    srv.feed_line(line);
    settle(ctx);
  }

  void send(std::int64_t id, std::string method, json::value params = nullptr) {
    feed(rpc::encode(rpc::request{id, std::move(method), std::move(params)}));
  }

  void notify(std::string method, json::value params = nullptr) {
    feed(rpc::encode(rpc::notification{std::move(method), std::move(params)}));
  }

  // The agent's reply to our request @p id, if written.
  [[nodiscard]] std::optional<json::object> reply(std::int64_t id) const {
    for (const auto& line : sink.lines) {
      auto msg = json::parse(line).as_object();
      if (msg.contains("method")) continue;
      auto* rid = msg.if_contains("id");
      if (rid && rid->is_int64() && rid->get_int64() == id) return msg;
    }
    return std::nullopt;
  }

  json::object call(std::int64_t id, std::string method, json::value params = nullptr) {
    send(id, std::move(method), std::move(params));
    auto res = reply(id);
    REQUIRE(res);
    return *res;
  }

  [[nodiscard]] std::vector<json::object> updates() const {
    std::vector<json::object> out{};
    for (const auto& line : sink.lines) {
      auto msg = json::parse(line).as_object();
      auto* m = msg.if_contains("method");
      if (m && m->as_string() == "session/update")
        out.push_back(msg.at("params").as_object());
    }
    return out;
  }

  void initialize(std::string_view caps = "{}") {
    json::object params{};
    params["protocolVersion"] = 1;
    params["clientCapabilities"] = json::parse(caps);
    params["clientInfo"] = json::parse(R"({"name":"test-host","version":"1"})");
    auto res = call(0, "initialize", params);
    REQUIRE(res.contains("result"));
  }

  std::string new_session(std::int64_t id = 1000) {
    auto res = call(id, "session/new", json::parse(R"({"cwd":"/tmp","mcpServers":[]})"));
    return json::value_to<std::string>(res.at("result").at("sessionId"));
  }

  asio::io_context ctx;
  capture_sink sink{};
  sentience::server srv;
  std::shared_ptr<bool> done{};
};

json::object error_of(const json::object& reply) {
  REQUIRE(reply.contains("error"));
  return reply.at("error").as_object();
}

std::string detail_of(const json::object& reply) {
  return std::string{error_of(reply).at("data").at("detail").as_string()};
}

json::value prompt_params(std::string_view session_id, std::string_view text) {
  json::object block{};
  block["type"] = "text";
  block["text"] = text;
  json::object params{};
  params["sessionId"] = session_id;
  params["prompt"] = json::array{block};
  return params;
}

std::string chunk_text(const json::object& update) {
  return std::string{update.at("update").at("content").at("text").as_string()};
}

struct throwing_responder : sentience::responder {
  asio::awaitable<std::string> respond(sentience::turn_context&) override {
    throw std::runtime_error{"boom"};
    co_return std::string{};
  }
};

// Reads a file through the host before answering.
struct reading_responder : sentience::responder {
  explicit reading_responder(
      std::shared_ptr<std::optional<sentience::call_result>> seen)
      : seen{std::move(seen)} {}

  asio::awaitable<std::string> respond(sentience::turn_context& ctx) override {
    sentience::read_options ro{};
    ro.timeout = ctx.timeout;
    auto r = co_await ctx.host.read_text_file(ctx.sess.id, "/tmp/notes.txt", ro);
    *seen = r;
    co_return sentience::describe(r);
  }

  std::shared_ptr<std::optional<sentience::call_result>> seen;
};

// Runs a model-style tool call through the turn's host and update stream.
struct tool_responder : sentience::responder {
  asio::awaitable<std::string> respond(sentience::turn_context& ctx) override {
    namespace tooling = sentience::tooling;
    tooling::options opts{};
    opts.timeout = ctx.timeout;
    std::vector<tooling::tool_call> calls{
      {"call_1", "read_file", json::parse(R"({"path":"/tmp/notes.txt"})").as_object()}};
    auto results = co_await tooling::execute_tool_calls(
        ctx.host, ctx.sess.id, std::move(calls), ctx.update, std::move(opts));
    if (results.size() != 1 || !results.front().ok) co_return "no notes";
    co_return json::value_to<std::string>(results.front().output.at("content"));
  }
};

}  // namespace

TEST_CASE("agent-initialize-negotiates") {
  host_fixture h{};
  auto res = h.call(
      1, "initialize",
      json::parse(R"({"protocolVersion":1,"clientCapabilities":{"fs":{"readTextFile":true}}})"));

  auto& result = res.at("result").as_object();
  CHECK(result.at("protocolVersion").as_int64() == 1);
  CHECK(result.at("agentInfo").at("name").as_string() == "sentience");
  CHECK(result.at("authMethods").as_array().empty());
  auto& caps = result.at("agentCapabilities").as_object();
  CHECK(caps.at("loadSession").as_bool() == false);
  CHECK(caps.at("promptCapabilities").at("embeddedContext").as_bool());

  const auto& state = h.srv.handler().state();
  REQUIRE(state.protocol_version);
  CHECK(*state.protocol_version == 1);
  CHECK(state.client_caps.fs_read_text_file);
  CHECK_FALSE(state.client_caps.terminal);
}

TEST_CASE("agent-initialize-offers-supported-version") {
  host_fixture h{};
  auto res = h.call(1, "initialize", json::parse(R"({"protocolVersion":7})"));
  CHECK(res.at("result").at("protocolVersion").as_int64() == 1);
}

TEST_CASE("agent-initialize-rejects-bad-params") {
  host_fixture h{};

  auto no_version = h.call(1, "initialize", json::object{});
  CHECK(error_of(no_version).at("code").as_int64() == rpc::invalid_params);
  CHECK(detail_of(no_version) == "protocolVersion must be an integer");

  auto text_version =
      h.call(2, "initialize", json::parse(R"({"protocolVersion":"1"})"));
  CHECK(detail_of(text_version) == "protocolVersion must be an integer");

  auto bad_caps = h.call(
      3, "initialize",
      json::parse(R"({"protocolVersion":1,"clientCapabilities":[]})"));
  CHECK(detail_of(bad_caps) == "clientCapabilities must be an object");

  CHECK_FALSE(h.srv.handler().state().protocol_version);
}

TEST_CASE("agent-session-methods-need-initialize") {
  host_fixture h{};

  auto res = h.call(1, "session/new", json::parse(R"({"cwd":"/tmp"})"));
  CHECK(error_of(res).at("code").as_int64() == rpc::not_initialized);
  CHECK(error_of(res).at("message").as_string() == "Not initialized");
  CHECK(detail_of(res) == "Call initialize before session/new");

  auto prompt = h.call(2, "session/prompt", prompt_params("sess_x", "hi"));
  CHECK(error_of(prompt).at("code").as_int64() == rpc::not_initialized);
  CHECK(h.srv.handler().state().sessions.empty());
}

TEST_CASE("agent-session-new-validates") {
  host_fixture h{};
  h.initialize();

  auto missing = h.call(1, "session/new", json::object{});
  CHECK(detail_of(missing) == "cwd must be a string");

  auto relative = h.call(2, "session/new", json::parse(R"({"cwd":"src"})"));
  CHECK(error_of(relative).at("code").as_int64() == rpc::invalid_params);
  CHECK(detail_of(relative) == "cwd must be an absolute path");

  auto servers = h.call(
      3, "session/new", json::parse(R"({"cwd":"/tmp","mcpServers":"x"})"));
  CHECK(detail_of(servers) == "mcpServers must be a list");

  CHECK(h.srv.handler().state().sessions.empty());
}

TEST_CASE("agent-session-ids-are-unique") {
  host_fixture h{};
  h.initialize();

  auto a = h.new_session(1);
  auto b = h.new_session(2);
  CHECK(a != b);
  for (const auto& id : {a, b}) {
    REQUIRE(id.size() == 29);
    CHECK(id.starts_with("sess_"));
    CHECK(
        id.find_first_not_of("0123456789abcdef", 5) == std::string::npos);
  }

  const auto& sessions = h.srv.handler().state().sessions;
  REQUIRE(sessions.size() == 2);
  CHECK(sessions.at(a).cwd == "/tmp");
  CHECK(sessions.at(a).history.empty());
}

TEST_CASE("agent-prompt-streams-before-responding") {
  host_fixture h{};
  h.initialize();
  auto sid = h.new_session();
  auto before = h.sink.lines.size();

  auto res = h.call(7, "session/prompt", prompt_params(sid, "Refactor the parser"));
  CHECK(res.at("result").at("stopReason").as_string() == "end_turn");

  // Everything written for this turn: updates first, the response last.
  std::vector<json::object> turn{};
  for (auto i = before; i < h.sink.lines.size(); ++i) turn.push_back(h.sink.at(i));
  REQUIRE(turn.size() >= 3);
  CHECK(turn.back().at("id").as_int64() == 7);
  for (std::size_t i = 0; i + 1 < turn.size(); ++i) {
    CHECK(turn[i].at("method").as_string() == "session/update");
    CHECK(turn[i].at("params").at("sessionId").as_string() == sid);
  }

  auto& plan = turn[0].at("params").at("update").as_object();
  CHECK(plan.at("sessionUpdate").as_string() == "plan");
  CHECK(plan.at("entries").as_array().size() == 2);

  std::string reply{};
  for (std::size_t i = 1; i + 1 < turn.size(); ++i) {
    auto& u = turn[i].at("params").as_object();
    CHECK(u.at("update").at("sessionUpdate").as_string() == "agent_message_chunk");
    reply += chunk_text(u);
  }
  CHECK(reply.find("Refactor the parser") != std::string::npos);

  const auto& sess = h.srv.handler().state().sessions.at(sid);
  REQUIRE(sess.history.size() == 2);
  CHECK(sess.history[0].who == sentience::role::user);
  CHECK(sess.history[0].content.at(0).at("text").as_string() == "Refactor the parser");
  CHECK(sess.history[1].who == sentience::role::agent);
  CHECK(sess.history[1].content.at(0).at("text").as_string() == reply);
}

TEST_CASE("agent-prompt-chunk-size") {
  sentience::agent_options opts{};
  opts.chunk_size = 10;
  host_fixture h{opts};
  h.initialize();
  auto sid = h.new_session();

  h.call(1, "session/prompt", prompt_params(sid, "héllo wörld, ünïcode"));

  std::size_t chunks{0};
  for (const auto& u : h.updates()) {
    if (u.at("update").at("sessionUpdate").as_string() != "agent_message_chunk")
      continue;
    ++chunks;
    auto text = chunk_text(u);
    std::size_t points{0};
    for (unsigned char c : text)
      if ((c & 0xC0U) != 0x80U) ++points;
    CHECK(points <= 10);
  }
  CHECK(chunks > 1);
}

TEST_CASE("agent-prompt-validates") {
  host_fixture h{};
  h.initialize();
  auto sid = h.new_session();

  auto unknown = h.call(1, "session/prompt", prompt_params("sess_nope", "x"));
  CHECK(detail_of(unknown) == "Unknown sessionId");
  CHECK(error_of(unknown).at("data").at("sessionId").as_string() == "sess_nope");

  json::object params{};
  params["sessionId"] = sid;
  params["prompt"] = "not a list";
  CHECK(detail_of(h.call(2, "session/prompt", params)) == "prompt must be a list");

  params["prompt"] = json::array{1, 2};
  CHECK(
      detail_of(h.call(3, "session/prompt", params)) ==
      "prompt must be a list of objects");

  params.erase("sessionId");
  CHECK(
      detail_of(h.call(4, "session/prompt", params)) ==
      "sessionId must be a string");

  CHECK(h.srv.handler().state().sessions.at(sid).history.empty());
}

TEST_CASE("agent-set-mode") {
  host_fixture h{};
  h.initialize();
  auto sid = h.new_session();

  json::object params{};
  params["sessionId"] = sid;
  params["mode"] = "architect";
  auto res = h.call(1, "session/set_mode", params);
  CHECK(res.at("result").is_null());
  CHECK(h.srv.handler().state().sessions.at(sid).mode == "architect");

  auto updates = h.updates();
  REQUIRE(updates.size() == 1);
  CHECK(updates[0].at("update").at("sessionUpdate").as_string() == "mode");
  CHECK(updates[0].at("update").at("mode").as_string() == "architect");

  params["mode"] = 3;
  CHECK(detail_of(h.call(2, "session/set_mode", params)) == "mode must be a string");
}

TEST_CASE("agent-cancel-is-a-notification") {
  host_fixture h{};
  h.initialize();
  auto sid = h.new_session();
  auto before = h.sink.lines.size();

  json::object params{};
  params["sessionId"] = sid;
  h.notify("session/cancel", params);

  REQUIRE(h.sink.lines.size() == before + 1);
  auto msg = h.sink.last();
  CHECK_FALSE(msg.contains("id"));
  CHECK(msg.at("params").at("update").at("content").at("text").as_string() ==
        "Cancellation requested.");

  // Unknown sessions and unknown notifications produce nothing.
  h.notify("session/cancel", json::parse(R"({"sessionId":"sess_nope"})"));
  h.notify("$/whatever");
  CHECK(h.sink.lines.size() == before + 1);
}

TEST_CASE("agent-unknown-methods") {
  host_fixture h{};

  auto res = h.call(1, "workspace/frobnicate");
  CHECK(error_of(res).at("code").as_int64() == rpc::method_not_found);
  CHECK(error_of(res).at("data").at("method").as_string() == "workspace/frobnicate");

  auto load = h.call(2, "session/load", json::object{});
  CHECK(error_of(load).at("data").at("method").as_string() == "session/load");

  auto auth = h.call(3, "authenticate", json::object{});
  CHECK(auth.at("result").at("outcome").at("outcome").as_string() == "not_required");
}

TEST_CASE("agent-params-must-be-an-object") {
  host_fixture h{};
  auto res = h.call(1, "initialize", json::array{1});
  CHECK(error_of(res).at("code").as_int64() == rpc::invalid_params);
  CHECK(detail_of(res) == "initialize params must be an object");
}

TEST_CASE("agent-handler-fault-is-contained") {
  host_fixture h{{}, std::make_unique<throwing_responder>()};
  h.initialize();
  auto sid = h.new_session();

  auto res = h.call(1, "session/prompt", prompt_params(sid, "x"));
  CHECK(error_of(res).at("code").as_int64() == rpc::internal_error);
  CHECK(error_of(res).at("message").as_string() == "Internal error");
  CHECK_FALSE(error_of(res).contains("data"));

  // The loop keeps going.
  auto again = h.call(2, "authenticate", json::object{});
  CHECK(again.contains("result"));
}

TEST_CASE("agent-bad-lines-dont-stop-the-loop") {
  host_fixture h{};

  h.feed("this is not json");
  h.feed("[]");
  h.feed(R"({"jsonrpc":"1.0","id":1,"method":"initialize"})");
  h.feed("");
  CHECK(h.sink.lines.empty());

  // A request-shaped object without a method is answered.
  h.feed(R"({"jsonrpc":"2.0","id":9})");
  auto invalid = h.reply(9);
  REQUIRE(invalid);
  CHECK(error_of(*invalid).at("code").as_int64() == rpc::invalid_request);

  // Replies nobody waits for are dropped silently.
  auto lines = h.sink.lines.size();
  h.feed(R"({"jsonrpc":"2.0","id":12345,"result":{}})");
  CHECK(h.sink.lines.size() == lines);

  h.initialize();
}

TEST_CASE("agent-calls-host-while-handling-a-prompt") {
  auto seen = std::make_shared<std::optional<sentience::call_result>>();
  host_fixture h{{}, std::make_unique<reading_responder>(seen)};
  h.initialize(R"({"fs":{"readTextFile":true}})");
  auto sid = h.new_session();

  h.send(5, "session/prompt", prompt_params(sid, "read my notes"));
  CHECK_FALSE(h.reply(5));

  // The agent is now waiting on the host.
  auto outbound = h.sink.last();
  REQUIRE(outbound.at("method").as_string() == "fs/read_text_file");
  CHECK(outbound.at("params").at("path").as_string() == "/tmp/notes.txt");
  CHECK(h.srv.rpc().pending_count() == 1);

  json::object content{};
  content["content"] = "buy milk";
  h.feed(rpc::encode(rpc::response{outbound.at("id").as_int64(), content}));

  auto res = h.reply(5);
  REQUIRE(res);
  CHECK(res->at("result").at("stopReason").as_string() == "end_turn");
  REQUIRE(seen->has_value());
  CHECK(sentience::succeeded(**seen));
  CHECK(h.sink.last().at("id").as_int64() == 5);
}

TEST_CASE("agent-eof-releases-waiting-handlers") {
  auto seen = std::make_shared<std::optional<sentience::call_result>>();
  host_fixture h{{}, std::make_unique<reading_responder>(seen)};
  h.initialize(R"({"fs":{"readTextFile":true}})");
  auto sid = h.new_session();

  h.send(5, "session/prompt", prompt_params(sid, "read my notes"));
  CHECK(h.srv.rpc().pending_count() == 1);

  h.srv.close();
  settle(h.ctx);
  CHECK(h.srv.closed());

  REQUIRE(seen->has_value());
  auto* err = std::get_if<sentience::call_error>(&**seen);
  REQUIRE(err);
  CHECK(err->code == sentience::call_errc::router_stopped);
  CHECK(h.reply(5));
  CHECK(*h.done);
}

TEST_CASE("agent-responder-runs-tool-calls") {
  host_fixture h{{}, std::make_unique<tool_responder>()};
  h.initialize(R"({"fs":{"readTextFile":true}})");
  auto sid = h.new_session();

  h.send(7, "session/prompt", prompt_params(sid, "what are my notes?"));
  CHECK_FALSE(h.reply(7));

  auto outbound = h.sink.last();
  REQUIRE(outbound.at("method").as_string() == "fs/read_text_file");
  CHECK(outbound.at("params").at("sessionId").as_string() == sid);

  json::object content{};
  content["content"] = "buy milk";
  h.feed(rpc::encode(rpc::response{outbound.at("id").as_int64(), content}));

  auto res = h.reply(7);
  REQUIRE(res);
  CHECK(res->at("result").at("stopReason").as_string() == "end_turn");
  CHECK(h.sink.last().at("id").as_int64() == 7);

  // plan, tool_call, in_progress, completed, then the reply chunk
  std::vector<std::string> kinds{};
  for (const auto& u : h.updates()) {
    CHECK(u.at("sessionId").as_string() == sid);
    kinds.push_back(json::value_to<std::string>(u.at("update").at("sessionUpdate")));
  }
  CHECK(kinds == std::vector<std::string>{
    "plan", "tool_call", "tool_call_update", "tool_call_update",
    "agent_message_chunk"});
  CHECK(chunk_text(h.updates().back()) == "buy milk");
}
