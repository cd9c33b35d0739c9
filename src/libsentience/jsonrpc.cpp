// SPDX-License-Identifier: MIT
#include "sentience/jsonrpc.hpp"

#include <fmt/format.h>

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace sentience::jsonrpc {

std::string_view trim_line_end(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.remove_suffix(1);
  return line;
}

namespace {

bool is_blank(std::string_view s) {
  return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

json::value params_of(const json::object& obj) {
  if (auto* p = obj.if_contains("params")) return *p;
  return nullptr;
}

decode_error shape_error(std::string detail, const json::object& obj) {
  decode_error err{decode_errc::invalid_shape, std::move(detail)};
  // A broken reply must not be answered, or two peers could ping-pong.
  if (obj.contains("result") || obj.contains("error")) return err;
  if (auto* id = obj.if_contains("id")) err.id = id_from_json(*id);
  return err;
}

decode_result classify(const json::object& obj) {
  if (auto* method = obj.if_contains("method")) {
    if (!method->is_string())
      return shape_error("method must be a string", obj);
    std::string name{method->as_string()};
    if (!obj.contains("id"))
      return message{notification{std::move(name), params_of(obj)}};
    auto id = id_from_json(obj.at("id"));
    if (!id) return shape_error("request id must be an integer or string", obj);
    return message{request{std::move(*id), std::move(name), params_of(obj)}};
  }

  if (auto* result = obj.if_contains("result")) {
    auto* raw_id = obj.if_contains("id");
    auto id = raw_id ? id_from_json(*raw_id) : std::nullopt;
    if (!id) return shape_error("response id must be an integer or string", obj);
    return message{response{std::move(*id), *result}};
  }

  if (auto* error = obj.if_contains("error")) {
    auto* eobj = error->if_object();
    if (!eobj) return shape_error("error must be an object", obj);
    auto* code = eobj->if_contains("code");
    auto* text = eobj->if_contains("message");
    if (!code || !code->is_int64() || !text || !text->is_string())
      return shape_error("error needs an integer code and a string message", obj);
    error_response res{};
    if (auto* raw_id = obj.if_contains("id")) res.id = id_from_json(*raw_id);
    res.error.code = static_cast<int>(code->as_int64());
    res.error.message = std::string{text->as_string()};
    if (auto* data = eobj->if_contains("data")) res.error.data = *data;
    return message{std::move(res)};
  }

  return shape_error("missing method, result or error", obj);
}

}  // namespace

std::string_view to_string(decode_errc errc) {
  // clang-format off
  switch (errc) {
  case decode_errc::empty:           return "empty";
  case decode_errc::invalid_json:    return "invalid_json";
  case decode_errc::not_an_object:   return "not_an_object";
  case decode_errc::invalid_version: return "invalid_version";
  case decode_errc::invalid_shape:   return "invalid_shape";
  }
  // clang-format on
  return "unknown";
}

decode_result decode(std::string_view line) {
  line = trim_line_end(line);
  if (is_blank(line)) return decode_error{decode_errc::empty};

  std::error_code ec{};
  json::value parsed = json::parse(line, ec);
  if (ec) return decode_error{decode_errc::invalid_json, ec.message()};

  auto* obj = parsed.if_object();
  if (!obj)
    return decode_error{decode_errc::not_an_object, json::serialize(parsed)};

  auto* version = obj->if_contains("jsonrpc");
  if (!version)
    return decode_error{decode_errc::invalid_version, "missing \"jsonrpc\""};
  if (!version->is_string() || version->as_string() != "2.0")
    return decode_error{
      decode_errc::invalid_version,
      fmt::format("unsupported jsonrpc {}", json::serialize(*version))};

  return classify(*obj);
}

json::value id_to_json(const id_t& id) {
  if (auto* s = std::get_if<std::string>(&id)) return json::string_view{*s};
  return std::get<std::int64_t>(id);
}

std::optional<id_t> id_from_json(const json::value& v) {
  if (auto* i = v.if_int64()) return id_t{*i};
  if (auto* s = v.if_string()) return id_t{std::string{s->data(), s->size()}};
  return std::nullopt;
}

std::string id_to_string(const id_t& id) {
  return std::visit(
      [](const auto& v) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(v)>, std::string>)
          return fmt::format("\"{}\"", v);
        else
          return fmt::format("{}", v);
      },
      id);
}

json::object to_json(const message& msg) {
  json::object out{};
  out["jsonrpc"] = "2.0";
  std::visit(
      [&](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, request>) {
          out["id"] = id_to_json(m.id);
          out["method"] = m.method;
          if (!m.params.is_null()) out["params"] = m.params;
        } else if constexpr (std::is_same_v<T, notification>) {
          out["method"] = m.method;
          if (!m.params.is_null()) out["params"] = m.params;
        } else if constexpr (std::is_same_v<T, response>) {
          out["id"] = id_to_json(m.id);
          // Always present, even when null: a response without "result"
          // is a different (invalid) shape.
          out["result"] = m.result;
        } else {
          out["id"] = m.id ? id_to_json(*m.id) : json::value{nullptr};
          json::object err{};
          err["code"] = m.error.code;
          err["message"] = m.error.message;
          if (m.error.data) err["data"] = *m.error.data;
          out["error"] = std::move(err);
        }
      },
      msg);
  return out;
}

std::string encode(const message& msg) {
  std::string text{json::serialize(to_json(msg))};
  if (text.find_first_of("\r\n") != std::string::npos)
    throw encode_error{"encoded JSONRPC message contains a raw newline"};
  return text;
}

std::optional<send_failure> send(line_sink& sink, const message& msg) {
  std::string line{};
  try {
    line = encode(msg);
  } catch (const std::exception& e) {
    return send_failure{fmt::format("encode failed: {}", e.what())};
  }
  return sink.write_line(line);
}

message make_result(const id_t& id, json::value result) {
  return response{id, std::move(result)};
}

message make_error(
    std::optional<id_t> id, int code, std::string text,
    std::optional<json::value> data) {
  return error_response{
    std::move(id), error_object{code, std::move(text), std::move(data)}};
}

message make_notification(std::string method, json::value params) {
  return notification{std::move(method), std::move(params)};
}

}  // namespace sentience::jsonrpc
