// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 messages framed as newline-delimited JSON.
 *
 * Each message occupies exactly one line of UTF-8 JSON text terminated by a
 * single @c '\n'.  The encoded text never contains a raw CR or LF byte;
 * newlines inside string values are escaped by the serializer.
 *
 * This is the only layer that touches raw protocol bytes.  Everything above
 * it deals in the @ref message variant.
 */

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace sentience::jsonrpc {

namespace json = boost::json;

// JSONRPC error codes
inline constexpr int parse_error{-32700};
inline constexpr int invalid_request{-32600};
inline constexpr int method_not_found{-32601};
inline constexpr int invalid_params{-32602};
inline constexpr int internal_error{-32603};
inline constexpr int not_initialized{-32000};

using id_t = std::variant<std::int64_t, std::string>;

struct request {
  id_t id;
  std::string method;
  json::value params{};
  friend bool operator==(const request&, const request&) = default;
};

struct notification {
  std::string method;
  json::value params{};
  friend bool operator==(const notification&, const notification&) = default;
};

struct response {
  id_t id;
  json::value result{};
  friend bool operator==(const response&, const response&) = default;
};

struct error_object {
  int code{};
  std::string message;
  std::optional<json::value> data{};
  friend bool operator==(const error_object&, const error_object&) = default;
};

struct error_response {
  // Absent only when the peer could not determine the request id.
  std::optional<id_t> id;
  error_object error;
  friend bool operator==(const error_response&, const error_response&) =
      default;
};

using message = std::variant<request, notification, response, error_response>;

enum class decode_errc {
  empty,            ///< blank line, not an error worth reporting
  invalid_json,     ///< the line is not JSON at all
  not_an_object,    ///< valid JSON, but not a top-level object
  invalid_version,  ///< "jsonrpc" missing or not exactly "2.0"
  invalid_shape,    ///< neither request, notification nor response
};

std::string_view to_string(decode_errc errc);

struct decode_error {
  decode_errc code;
  std::string detail{};
  // Set when the offending object carried a usable id, so that the peer can
  // be told its request was invalid.
  std::optional<id_t> id{};
};

using decode_result = std::variant<message, decode_error>;

/// @p line without its trailing CR/LF bytes.
std::string_view trim_line_end(std::string_view line);

/** @brief Decode one line of input into a @ref message.
 *
 * Trailing CR/LF bytes are ignored.  Never throws: every failure is reported
 * as a @ref decode_error.
 */
decode_result decode(std::string_view line);

/// Thrown when a message cannot be represented as a single protocol line.
struct encode_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

json::value id_to_json(const id_t& id);
std::optional<id_t> id_from_json(const json::value& v);
std::string id_to_string(const id_t& id);

json::object to_json(const message& msg);

/** @brief Encode @p msg as compact JSON, without the trailing newline.
 *
 * Throws @ref encode_error if the serialized text contains a raw CR or LF.
 */
std::string encode(const message& msg);

/// Failure description returned by the write path.
using send_failure = std::string;

/** @brief Destination for encoded lines.
 *
 * Implementations write @p line followed by a single @c '\n' as one
 * indivisible unit with respect to other writers of the same sink.
 */
class line_sink {
 public:
  line_sink() = default;
  line_sink(const line_sink&) = delete;
  line_sink(line_sink&&) = delete;
  line_sink& operator=(const line_sink&) = delete;
  line_sink& operator=(line_sink&&) = delete;
  virtual ~line_sink() = default;

  virtual std::optional<send_failure> write_line(std::string_view line) = 0;
};

/** @brief Encode @p msg and hand it to @p sink.
 *
 * Encoding and IO failures are returned, never thrown.
 */
std::optional<send_failure> send(line_sink& sink, const message& msg);

/// Convenience builders
message make_result(const id_t& id, json::value result);
message make_error(
    std::optional<id_t> id, int code, std::string text,
    std::optional<json::value> data = std::nullopt);
message make_notification(std::string method, json::value params);

}  // namespace sentience::jsonrpc
