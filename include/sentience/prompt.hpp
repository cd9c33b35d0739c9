// SPDX-License-Identifier: MIT
#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sentience::prompt {

namespace json = boost::json;

/** @brief Render a single prompt content block as plain text.
 *
 * Known kinds:
 *  - @c text: the text verbatim
 *  - @c resource: "Resource (mime): uri" followed by embedded text
 *  - @c resource_link: name and/or uri
 *  - @c image, @c audio: a bracketed placeholder with label and uri
 *
 * Any other kind salvages a @c text or @c content string field, else
 * renders empty.
 */
std::string render_block(const json::value& block);

/// Render all blocks, drop blank ones, join with a blank line.
std::string render(const json::array& blocks);

/** @brief Split @p text into chunks of at most @p max code points.
 *
 * Never splits a UTF-8 sequence.  @p max of zero yields the whole text as
 * one chunk.  Empty text yields no chunks.
 */
std::vector<std::string> chunk_text(std::string_view text, std::size_t max);

}  // namespace sentience::prompt
