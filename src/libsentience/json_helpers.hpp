#pragma once

#include <boost/json.hpp>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

#include "utils.hpp"

namespace sentience {

namespace json = boost::json;

inline std::string_view sv(json::string_view s) { return {s.data(), s.size()}; }
inline std::string_view sv(const json::string& s) {
  return {s.data(), s.size()};
}

inline const json::string* string_at(
    const json::object& obj, std::string_view key) {
  auto* v = obj.if_contains(key);
  return v ? v->if_string() : nullptr;
}

inline std::optional<std::string> opt_string_at(
    const json::object& obj, std::string_view key) {
  if (auto* s = string_at(obj, key)) return std::string{sv(*s)};
  return std::nullopt;
}

inline json::object error_to_json(const std::exception& e) {
  json::object res;
  res["name"] = utils::demangle_symbol(typeid(e).name());
  res["details"] = e.what();
  return res;
}

}  // namespace sentience
