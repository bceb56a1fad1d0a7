#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace klm::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when the text is a single balanced object, ignoring surrounding whitespace.
[[nodiscard]] bool json_is_object(const std::string &json);

/// Parse a JSON array of strings like ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Parse a flat JSON object into a key→value map (string values only, top-level).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

} // namespace klm::common
