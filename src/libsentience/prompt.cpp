// SPDX-License-Identifier: MIT
#include "sentience/prompt.hpp"

#include <fmt/format.h>

#include <initializer_list>
#include <optional>

#include "json_helpers.hpp"

namespace sentience::prompt {

namespace {

// First string among @p keys.
std::optional<std::string> first_string(
    const json::object& obj, std::initializer_list<std::string_view> keys) {
  for (auto key : keys)
    if (auto s = opt_string_at(obj, key)) return s;
  return std::nullopt;
}

std::optional<std::string> nested_uri(
    const json::object& block, std::string_view kind) {
  if (auto* inner = block.if_contains(kind); inner && inner->is_object())
    return opt_string_at(inner->get_object(), "uri");
  return std::nullopt;
}

std::string render_resource(const json::object& resource) {
  auto text = opt_string_at(resource, "text");
  auto uri = opt_string_at(resource, "uri");
  if (!uri) return text.value_or("");

  auto mime = first_string(resource, {"mimeType", "mime_type"});
  std::string header = mime ? fmt::format("Resource ({}): {}", *mime, *uri)
                            : fmt::format("Resource: {}", *uri);
  if (text && !text->empty()) return fmt::format("{}\n\n{}", header, *text);
  return header;
}

std::string render_resource_link(const json::object& block) {
  auto uri = first_string(block, {"uri", "url"});
  auto name = first_string(block, {"name", "title"});
  if (name && uri) return fmt::format("Resource: {}\n{}", *name, *uri);
  if (uri) return fmt::format("Resource: {}", *uri);
  if (name) return fmt::format("Resource: {}", *name);
  return {};
}

std::string render_media(
    const json::object& block, std::string_view kind, std::string_view label) {
  auto uri = nested_uri(block, kind);
  if (!uri) uri = first_string(block, {"uri", "url"});
  if (uri) return fmt::format("[{}: {}]", label, *uri);
  return fmt::format("[{}]", label);
}

bool is_blank(std::string_view s) {
  return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

std::string_view trim(std::string_view s) {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

}  // namespace

std::string render_block(const json::value& block) {
  auto* obj = block.if_object();
  if (!obj) return {};
  auto type = opt_string_at(*obj, "type");
  if (!type) return {};

  if (*type == "text") return opt_string_at(*obj, "text").value_or("");

  if (*type == "resource") {
    auto* resource = obj->if_contains("resource");
    if (resource && resource->is_object())
      return render_resource(resource->get_object());
  } else if (*type == "resource_link") {
    return render_resource_link(*obj);
  } else if (*type == "image") {
    auto alt = first_string(*obj, {"alt", "title"});
    return render_media(*obj, "image", alt.value_or("image"));
  } else if (*type == "audio") {
    auto label = opt_string_at(*obj, "title");
    return render_media(*obj, "audio", label.value_or("audio"));
  }

  return first_string(*obj, {"text", "content"}).value_or("");
}

std::string render(const json::array& blocks) {
  std::string out{};
  for (const auto& block : blocks) {
    auto text = render_block(block);
    if (is_blank(text)) continue;
    if (!out.empty()) out += "\n\n";
    out += text;
  }
  return std::string{trim(out)};
}

std::vector<std::string> chunk_text(std::string_view text, std::size_t max) {
  std::vector<std::string> chunks{};
  if (text.empty()) return chunks;
  if (max == 0) {
    chunks.emplace_back(text);
    return chunks;
  }

  auto is_continuation = [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
  };

  std::size_t start{0};
  while (start < text.size()) {
    std::size_t end{start};
    for (std::size_t points{0}; points < max && end < text.size(); ++points) {
      ++end;
      while (end < text.size() && is_continuation(text[end])) ++end;
    }
    chunks.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return chunks;
}

}  // namespace sentience::prompt
