// SPDX-License-Identifier: MIT
#include "sentience/tooling.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <random>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace sentience::tooling {

namespace p2 = boost::process::v2;
namespace fs = std::filesystem;

namespace {

/// What a dispatched tool produced, before it is reported.
struct outcome {
  bool ok{};
  json::value output{};
  json::value error{};
  json::value raw{};
  std::string message{};
};

outcome success(json::value output, json::value raw) {
  return {true, std::move(output), nullptr, std::move(raw)};
}

outcome failure(json::value error, json::value raw, std::string message) {
  return {false, nullptr, std::move(error), std::move(raw), std::move(message)};
}

std::int64_t byte_count(std::string_view s) {
  return static_cast<std::int64_t>(s.size());
}

std::string stringify(const json::value& v) {
  if (auto* s = v.if_string()) return std::string{sv(*s)};
  return json::serialize(v);
}

json::value error_value(const call_result& r) {
  if (auto* err = std::get_if<jsonrpc::error_object>(&r)) {
    json::object out{};
    out["code"] = err->code;
    out["message"] = err->message;
    if (err->data) out["data"] = *err->data;
    return out;
  }
  if (auto* err = std::get_if<call_error>(&r)) {
    json::object out{};
    out["reason"] = to_string(err->code);
    out["detail"] = err->detail;
    if (err->id) out["id"] = *err->id;
    return out;
  }
  return nullptr;
}

outcome call_failure(const call_result& r, json::object raw) {
  auto error = error_value(r);
  std::string message{};
  auto* err = std::get_if<call_error>(&r);
  auto* method = string_at(raw, "method");
  if (err && err->code == call_errc::timeout && err->id && method)
    message = fmt::format("Timeout calling {} (id={})", sv(*method), *err->id);
  else
    message = "Error: " + stringify(error);
  return failure(std::move(error), std::move(raw), std::move(message));
}

outcome invalid_argument(std::string_view detail, json::object raw) {
  json::object error{};
  error["reason"] = "invalid_params";
  error["detail"] = detail;
  return failure(std::move(error), std::move(raw), fmt::format("Error: {}", detail));
}

json::object method_raw(std::string_view method) {
  json::object raw{};
  raw["method"] = method;
  return raw;
}

json::object text_content(std::string_view text) {
  json::object inner{};
  inner["type"] = "text";
  inner["text"] = text;
  json::object item{};
  item["type"] = "content";
  item["content"] = std::move(inner);
  return item;
}

std::string random_hex(std::size_t bytes) {
  std::random_device rd{};
  std::uniform_int_distribution<unsigned> byte{0, 255};
  std::string out{};
  for (std::size_t i = 0; i < bytes; ++i) out += fmt::format("{:02x}", byte(rd));
  return out;
}

const json::value* first_of(
    const json::object& args, std::initializer_list<std::string_view> keys) {
  for (auto key : keys)
    if (auto* v = args.if_contains(key); v && !v->is_null()) return v;
  return nullptr;
}

std::optional<std::string> string_arg(
    const json::object& args, std::initializer_list<std::string_view> keys) {
  auto* v = first_of(args, keys);
  if (v && v->is_string()) return std::string{sv(v->get_string())};
  return std::nullopt;
}

std::optional<std::int64_t> int_arg(const json::object& args, std::string_view key) {
  auto* v = args.if_contains(key);
  if (!v) return std::nullopt;
  if (v->is_int64()) return v->get_int64();
  if (v->is_uint64()) return static_cast<std::int64_t>(v->get_uint64());
  return std::nullopt;
}

// Host fs methods take absolute paths, not file URIs.
std::string strip_file_uri(std::string path) {
  constexpr std::string_view scheme{"file://"};
  if (std::string_view{path}.starts_with(scheme)) path.erase(0, scheme.size());
  return path;
}

json::object args_object(const json::value& v) {
  if (auto* obj = v.if_object()) return *obj;
  return {};
}

bool needs_permission(std::string_view name, std::string_view kind) {
  return kind == "edit" || kind == "delete" || kind == "move" ||
         kind == "execute" || name == "write_file" || name == "run_command" ||
         name == "fs/write_text_file" || name == "terminal/create";
}

enum class permission { granted, rejected, cancelled, failed };

std::vector<std::pair<std::string, std::string>> environment_with(
    const env_pairs& extra) {
  std::map<std::string, std::string> vars{};
  for (char** e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    if (eq == std::string_view::npos) continue;
    vars[std::string{entry.substr(0, eq)}] = std::string{entry.substr(eq + 1)};
  }
  for (const auto& [name, value] : extra) vars[name] = value;
  return {vars.begin(), vars.end()};
}

/// Runs the calls of one execute_tool_calls invocation.
class runner {
 public:
  runner(client& host, std::string session_id, update_fn& update, const options& opts)
      : host_{&host},
        session_id_{std::move(session_id)},
        update_{&update},
        opts_{&opts} {}

  asio::awaitable<tool_result> run(tool_call call);

 private:
  void report(
      const std::string& tool_call_id, std::string_view status,
      json::array content = {}, json::value raw = nullptr);

  asio::awaitable<std::pair<permission, std::string>> ask_permission(
      const tool_call& call, const json::object& raw_input);

  asio::awaitable<outcome> dispatch(const tool_call& call);
  asio::awaitable<outcome> read_file(const json::object& args);
  asio::awaitable<outcome> write_file(const json::object& args);
  asio::awaitable<outcome> run_command(const tool_call& call);
  asio::awaitable<outcome> run_locally(local_command cmd);

  client* host_;
  std::string session_id_;
  update_fn* update_;
  const options* opts_;
};

void runner::report(
    const std::string& tool_call_id, std::string_view status,
    json::array content, json::value raw) {
  json::object u{};
  u["sessionUpdate"] = "tool_call_update";
  u["toolCallId"] = tool_call_id;
  if (!status.empty()) u["status"] = status;
  if (!raw.is_null()) u["rawOutput"] = std::move(raw);
  if (!content.empty()) u["content"] = std::move(content);
  (*update_)(std::move(u));
}

asio::awaitable<tool_result> runner::run(tool_call call) {
  auto kind = tool_kind(call.name);

  json::object raw_input{};
  raw_input["name"] = call.name;
  raw_input["arguments"] = call.arguments;

  json::object announce{};
  announce["sessionUpdate"] = "tool_call";
  announce["toolCallId"] = call.id;
  announce["title"] = tool_title(call.name, call.arguments);
  announce["kind"] = kind;
  announce["status"] = "pending";
  announce["rawInput"] = raw_input;
  (*update_)(std::move(announce));

  tool_result result{call.id, call.name};

  if (opts_->request_permission && needs_permission(call.name, kind)) {
    auto [verdict, detail] = co_await ask_permission(call, raw_input);
    if (verdict != permission::granted) {
      std::string text{};
      switch (verdict) {
        case permission::rejected:
          text = "Permission rejected by user.";
          result.error = "permission_rejected";
          break;
        case permission::cancelled:
          text = "Cancelled.";
          result.error = "cancelled";
          break;
        default: {
          text = "Permission request failed: " + detail;
          json::object error{};
          error["permission_request_failed"] = detail;
          result.error = std::move(error);
          break;
        }
      }
      LOG_INFO("tool call {} ({}) not run: {}", call.id, call.name, text);
      report(call.id, "failed", json::array{text_content(text)});
      co_return result;
    }
  }

  report(call.id, "in_progress");

  outcome out{};
  try {
    out = co_await dispatch(call);
  } catch (const std::exception& e) {
    LOG_ERROR("tool {} threw: {}", call.name, e.what());
    out = failure(
        error_to_json(e), method_raw(call.name), fmt::format("Error: {}", e.what()));
  }

  if (!out.ok) {
    LOG_INFO("tool call {} ({}) failed: {}", call.id, call.name, out.message);
    report(call.id, "failed", json::array{text_content(out.message)}, out.raw);
    result.error = std::move(out.error);
    co_return result;
  }

  json::array content{};
  auto* output = out.output.if_object();
  auto* written = output ? string_at(*output, "writtenPath") : nullptr;
  auto* new_text = output ? string_at(*output, "newText") : nullptr;
  if (call.name == "write_file" && written && new_text) {
    json::object diff{};
    diff["type"] = "diff";
    diff["path"] = *written;
    diff["oldText"] = output->at("oldText");
    diff["newText"] = *new_text;
    content.push_back(std::move(diff));
    content.push_back(text_content(fmt::format("Wrote {}.", sv(*written))));
  } else {
    content.push_back(text_content(stringify(out.output)));
  }
  report(call.id, "completed", std::move(content), out.raw);

  result.ok = true;
  result.output = std::move(out.output);
  co_return result;
}

asio::awaitable<std::pair<permission, std::string>> runner::ask_permission(
    const tool_call& call, const json::object& raw_input) {
  json::object tc{};
  tc["toolCallId"] = call.id;
  tc["title"] = tool_title(call.name, call.arguments);
  tc["kind"] = tool_kind(call.name);
  tc["rawInput"] = raw_input;

  auto r = co_await host_->request_permission(
      session_id_, std::move(tc), std::nullopt, opts_->timeout);
  auto* value = std::get_if<json::value>(&r);
  if (!value) co_return std::pair{permission::failed, describe(r)};

  const json::object* chosen = nullptr;
  if (auto* res = value->if_object())
    if (auto* o = res->if_contains("outcome")) chosen = o->if_object();
  auto* kind = chosen ? string_at(*chosen, "outcome") : nullptr;

  if (kind && *kind == "selected") {
    auto* option = string_at(*chosen, "optionId");
    if (option && (*option == "allow-once" || *option == "allow-always"))
      co_return std::pair{permission::granted, std::string{}};
    co_return std::pair{permission::rejected, std::string{}};
  }
  if (kind && *kind == "cancelled")
    co_return std::pair{permission::cancelled, std::string{}};

  co_return std::pair{
    permission::failed,
    fmt::format("unexpected permission response {}", json::serialize(*value))};
}

asio::awaitable<outcome> runner::dispatch(const tool_call& call) {
  if (call.name == "read_file") co_return co_await read_file(call.arguments);
  if (call.name == "write_file") co_return co_await write_file(call.arguments);
  if (call.name == "run_command") co_return co_await run_command(call);

  // Anything else is taken to be a host method name.
  auto r = co_await host_->call(
      session_id_, call.name, call.arguments, opts_->timeout);
  if (!succeeded(r)) co_return call_failure(r, method_raw(call.name));
  co_return success(std::get<json::value>(std::move(r)), method_raw(call.name));
}

asio::awaitable<outcome> runner::read_file(const json::object& args) {
  auto path = strip_file_uri(string_arg(args, {"path", "file", "uri"}).value_or(""));

  read_options ro{};
  ro.line = int_arg(args, "line");
  ro.limit = int_arg(args, "limit");
  ro.timeout = opts_->timeout;

  auto raw = method_raw("fs/read_text_file");
  raw["path"] = path;

  auto r = co_await host_->read_text_file(session_id_, path, ro);
  if (!succeeded(r)) co_return call_failure(r, std::move(raw));

  auto& value = std::get<json::value>(r);
  auto* obj = value.if_object();
  auto* content = obj ? string_at(*obj, "content") : nullptr;
  if (!content) {
    json::object error{};
    error["unexpected_response"] = value;
    co_return failure(
        std::move(error), value, "Error: unexpected fs/read_text_file response");
  }

  json::object output{};
  output["content"] = *content;
  json::object stats{};
  stats["contentBytes"] = byte_count(*content);
  co_return success(std::move(output), std::move(stats));
}

asio::awaitable<outcome> runner::write_file(const json::object& args) {
  auto path = strip_file_uri(string_arg(args, {"path", "file", "uri"}).value_or(""));

  auto raw = method_raw("fs/write_text_file");
  raw["path"] = path;

  auto* content_v = first_of(args, {"content", "text"});
  if (content_v && !content_v->is_string())
    co_return invalid_argument("content must be a string", std::move(raw));
  std::string content{content_v ? sv(content_v->get_string()) : std::string_view{}};

  // The previous text, when it can be had, makes the update a real diff.
  json::value old_text = nullptr;
  const auto& caps = host_->capabilities();
  if (caps.fs_write_text_file && caps.fs_read_text_file &&
      utils::is_absolute_path(path)) {
    read_options ro{};
    ro.timeout = opts_->timeout;
    auto prev = co_await host_->read_text_file(session_id_, path, ro);
    if (auto* v = std::get_if<json::value>(&prev))
      if (auto* obj = v->if_object())
        if (auto* existing = string_at(*obj, "content")) old_text = *existing;
  }

  auto r = co_await host_->write_text_file(
      session_id_, path, content, opts_->timeout);
  if (!succeeded(r)) co_return call_failure(r, std::move(raw));

  json::object output{};
  output["writtenPath"] = path;
  output["contentBytes"] = byte_count(content);
  output["oldText"] = old_text;
  output["newText"] = content;

  json::object stats{};
  stats["path"] = path;
  if (auto* s = old_text.if_string())
    stats["oldTextBytes"] = byte_count(*s);
  else
    stats["oldTextBytes"] = nullptr;
  stats["newTextBytes"] = byte_count(content);
  co_return success(std::move(output), std::move(stats));
}

asio::awaitable<outcome> runner::run_command(const tool_call& call) {
  const auto& args = call.arguments;
  auto command = string_arg(args, {"command", "cmd"});
  if (!command)
    co_return invalid_argument("command must be a string", method_raw("run_command"));

  std::vector<std::string> argv{};
  if (auto* list = first_of(args, {"args"}); list && list->is_array())
    for (const auto& a : list->get_array()) argv.push_back(stringify(a));
  auto cwd = string_arg(args, {"cwd"});

  json::value env_json = nullptr;
  if (auto* e = first_of(args, {"env"})) env_json = *e;
  auto env = normalize_env(env_json);
  if (auto* err = std::get_if<call_error>(&env))
    co_return invalid_argument(err->detail, method_raw("run_command"));
  auto& env_array = std::get<json::array>(env);

  local_command local{*command, argv, cwd};
  for (const auto& entry : env_array)
    local.env.emplace_back(
        sv(entry.at("name").get_string()), sv(entry.at("value").get_string()));
  local.timeout = opts_->timeout;
  local.output_limit = static_cast<std::size_t>(opts_->terminal_output_byte_limit);

  auto mode = opts_->mode;
  if (mode == command_mode::local ||
      (mode == command_mode::automatic && !host_->capabilities().terminal))
    co_return co_await run_locally(std::move(local));

  terminal_options topts{};
  topts.args = argv;
  topts.env = json::value(env_array);
  topts.cwd = cwd;
  topts.output_byte_limit = opts_->terminal_output_byte_limit;
  topts.timeout = opts_->timeout;

  auto created = co_await host_->terminal_create(session_id_, *command, topts);
  if (!succeeded(created)) {
    if (mode == command_mode::automatic) {
      LOG_WARN(
          "terminal/create failed ({}), running {} locally", describe(created),
          *command);
      co_return co_await run_locally(std::move(local));
    }
    co_return call_failure(created, method_raw("terminal/create"));
  }

  auto& created_v = std::get<json::value>(created);
  auto* created_obj = created_v.if_object();
  auto* tid = created_obj ? string_at(*created_obj, "terminalId") : nullptr;
  if (!tid) {
    json::object error{};
    error["unexpected_response"] = created_v;
    co_return failure(
        std::move(error), created_v, "Error: unexpected terminal/create response");
  }
  std::string terminal_id{sv(*tid)};

  // Embed the terminal so the host can show live output.
  json::object embed{};
  embed["type"] = "terminal";
  embed["terminalId"] = terminal_id;
  report(call.id, "", json::array{std::move(embed)});

  auto waited = co_await host_->terminal_wait_for_exit(
      session_id_, terminal_id, opts_->timeout);
  if (!succeeded(waited))
    LOG_WARN("terminal/wait_for_exit {}: {}", terminal_id, describe(waited));

  json::object raw{};
  std::string text{};
  auto out = co_await host_->terminal_output(session_id_, terminal_id, opts_->timeout);
  if (auto* v = std::get_if<json::value>(&out); v && v->is_object()) {
    raw = v->get_object();
    if (auto* s = string_at(raw, "output")) text = std::string{sv(*s)};
  } else {
    raw["error"] = describe(out);
  }

  auto released = co_await host_->terminal_release(
      session_id_, terminal_id, opts_->timeout);
  if (!succeeded(released))
    LOG_DEBUG("terminal/release {}: {}", terminal_id, describe(released));

  raw["terminalId"] = terminal_id;

  json::object summary{};
  summary["terminalId"] = terminal_id;
  summary["output"] = text;
  if (auto* v = std::get_if<json::value>(&waited); v && v->is_object())
    summary["exitStatus"] = *v;
  co_return success(std::move(summary), std::move(raw));
}

asio::awaitable<outcome> runner::run_locally(local_command cmd) {
  std::string command{cmd.command};
  auto res = co_await run_local_command(std::move(cmd));

  json::object raw = method_raw("local/run_command");
  raw["command"] = command;
  raw["outputBytes"] = byte_count(res.output);
  raw["outputTruncated"] = res.truncated;

  if (res.timed_out) {
    raw["partialOutput"] = res.output;
    json::object error{};
    error["reason"] = "timeout";
    error["detail"] = "local/run_command";
    co_return failure(
        std::move(error), std::move(raw),
        fmt::format("Timeout running {} locally", command));
  }

  raw["exitCode"] = res.exit_code;
  json::object output{};
  output["output"] = res.output;
  output["exitCode"] = res.exit_code;
  output["outputTruncated"] = res.truncated;
  co_return success(std::move(output), std::move(raw));
}

}  // namespace

tool_call normalize_tool_call(const json::value& raw) {
  auto* obj = raw.if_object();
  if (!obj) return {"call_" + random_hex(6), "unknown", {}};

  auto* id = string_at(*obj, "id");
  auto* type = string_at(*obj, "type");
  auto* fn = obj->if_contains("function");
  if (id && type && *type == "function" && fn && fn->is_object()) {
    const auto& f = fn->get_object();
    auto name = opt_string_at(f, "name").value_or("unknown");
    json::object args{};
    if (auto* a = f.if_contains("arguments"); a && !a->is_null()) {
      if (a->is_object()) {
        args = a->get_object();
      } else if (a->is_string()) {
        boost::system::error_code ec;
        auto parsed = json::parse(a->get_string(), ec);
        if (ec) {
          args["_arguments_decode_error"] = ec.message();
          args["_raw"] = *a;
        } else if (parsed.is_object()) {
          args = std::move(parsed.get_object());
        } else {
          args["_raw_arguments"] = std::move(parsed);
        }
      } else {
        args["_raw_arguments"] = *a;
      }
    }
    return {std::string{sv(*id)}, std::move(name), std::move(args)};
  }

  if (auto* call_id = string_at(*obj, "toolCallId")) {
    if (auto* name = obj->if_contains("name")) {
      json::value args = nullptr;
      if (auto* a = obj->if_contains("arguments")) args = *a;
      return {std::string{sv(*call_id)}, stringify(*name), args_object(args)};
    }
  }

  std::string call_id{};
  if (auto* v = obj->if_contains("id"); v && !v->is_null())
    call_id = stringify(*v);
  else
    call_id = "call_" + random_hex(6);
  auto name = opt_string_at(*obj, "name").value_or("unknown");
  json::value args = nullptr;
  if (auto* a = obj->if_contains("arguments")) args = *a;
  return {std::move(call_id), std::move(name), args_object(args)};
}

std::string_view tool_kind(std::string_view name) {
  if (name == "read_file" || name == "fs/read_text_file") return "read";
  if (name == "write_file" || name == "fs/write_text_file") return "edit";
  if (name == "run_command" || name == "terminal/create") return "execute";
  return "other";
}

std::string tool_title(std::string_view name, const json::object& args) {
  auto suffix = [&](std::string_view key) -> std::string {
    auto* v = string_at(args, key);
    if (!v || v->empty()) return "";
    return fmt::format(" ({})", sv(*v));
  };
  if (name == "read_file") return "Reading file" + suffix("path");
  if (name == "write_file") return "Writing file" + suffix("path");
  if (name == "run_command")
    return fmt::format(
        "Running {}", string_arg(args, {"command", "cmd"}).value_or("command"));
  if (name.empty()) return "Running tool";
  return fmt::format("Running {}", name);
}

command_mode parse_command_mode(std::string_view text) {
  std::string v{};
  for (char c : text)
    if (!std::isspace(static_cast<unsigned char>(c)))
      v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v == "local" || v == "host" || v == "native") return command_mode::local;
  if (v == "auto") return command_mode::automatic;
  return command_mode::client;
}

command_mode command_mode_from_env() {
  const char* v = std::getenv("SENTIENCE_RUN_COMMAND_MODE");  // NOLINT
  return v ? parse_command_mode(v) : command_mode::client;
}

asio::awaitable<std::vector<tool_result>> execute_tool_calls(
    client& host, std::string session_id, std::vector<tool_call> calls,
    update_fn update, options opts) {
  runner r{host, std::move(session_id), update, opts};
  std::vector<tool_result> results{};
  for (auto& call : calls) {
    if (opts.cancelled && opts.cancelled()) {
      LOG_INFO("turn cancelled, skipping remaining tool calls");
      break;
    }
    results.push_back(co_await r.run(std::move(call)));
  }
  co_return results;
}

json::array to_model_tool_results(const std::vector<tool_result>& results) {
  json::array out{};
  for (const auto& r : results) {
    json::object msg{};
    msg["role"] = "tool";
    msg["tool_call_id"] = r.tool_call_id;
    msg["content"] =
        r.ok ? stringify(r.output) : "Tool call failed: " + stringify(r.error);
    out.push_back(std::move(msg));
  }
  return out;
}

asio::awaitable<local_command_result> run_local_command(local_command cmd) {
  auto executor = co_await asio::this_coro::executor;

  fs::path exe = cmd.command.find('/') != std::string::npos
                     ? fs::path{cmd.command}
                     : fs::path{p2::environment::find_executable(cmd.command)};
  if (exe.empty() || !fs::exists(exe))
    utils::throwf("local command not found: {}", cmd.command);

  auto vars = environment_with(cmd.env);
  std::vector<p2::environment::key_value_pair> env{};
  env.reserve(vars.size());
  for (const auto& [name, value] : vars)
    env.emplace_back(
        p2::environment::key_view{name.c_str()},
        p2::environment::value_view{value.c_str()});

  std::string start_dir = cmd.cwd.value_or(fs::current_path().string());
  LOG_INFO("running {} locally in {}", exe.string(), start_dir);

  auto out = std::make_shared<asio::readable_pipe>(executor);
  auto proc = std::make_shared<p2::process>(
      executor, exe, cmd.args,
      p2::process_stdio{.in = nullptr, .out = *out, .err = *out},
      p2::process_start_dir{start_dir}, p2::process_environment{env});

  // Armed until the exit is collected.  A child may close its output early,
  // or leave it open in a grandchild after being killed, so the deadline
  // closes the pipe as well as terminating the process.
  auto timed_out = std::make_shared<bool>(false);
  asio::steady_timer deadline{executor, cmd.timeout};
  deadline.async_wait([weak = std::weak_ptr<p2::process>{proc}, out,
                       timed_out](boost::system::error_code ec) {
    if (ec) return;
    *timed_out = true;
    boost::system::error_code ignored;
    if (auto p = weak.lock()) p->terminate(ignored);
    out->close(ignored);
  });

  local_command_result result{};
  std::array<char, 4096> buf{};
  for (;;) {
    boost::system::error_code ec;
    std::size_t n = co_await out->async_read_some(
        asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));
    std::string_view chunk{buf.data(), n};
    std::size_t room = cmd.output_limit > result.output.size()
                           ? cmd.output_limit - result.output.size()
                           : 0;
    if (chunk.size() > room) result.truncated = true;
    result.output.append(chunk.substr(0, room));
    if (ec) {
      if (ec != asio::error::eof) LOG_DEBUG("local command pipe: {}", ec.message());
      break;
    }
  }

  boost::system::error_code ec;
  result.exit_code =
      co_await proc->async_wait(asio::redirect_error(asio::use_awaitable, ec));
  deadline.cancel();
  if (ec) LOG_DEBUG("waiting for {}: {}", cmd.command, ec.message());
  result.timed_out = *timed_out;
  LOG_DEBUG(
      "{} exited with {} ({} bytes{})", cmd.command, result.exit_code,
      result.output.size(), result.truncated ? ", truncated" : "");
  co_return result;
}

}  // namespace sentience::tooling
