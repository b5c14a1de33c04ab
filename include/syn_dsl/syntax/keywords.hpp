#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace syn_dsl::syntax
{

// Reserved words of the pipeline language. Matching is case-sensitive and
// whole-word: "FROMAGE" is a Word, not FROM followed by "AGE".
inline constexpr std::array<std::string_view, 22> k_keywords = {
  "FROM",     "WITH",        "FIELDS", "USING",    "FILTER",      "MODEL",
  "KEY",      "URL",         "MERGE",  "SAVE",     "GENERATE",    "PROMPT",
  "SYSTEM",   "USER",        "TOKENS", "TEMPERATURE", "PRAGMA",   "AUTOSAVE",
  "CONCURRENCY", "STREAM",   "AS",     "TO",
};

[[nodiscard]] inline bool is_keyword(std::string_view word) noexcept
{
  return std::find(k_keywords.begin(), k_keywords.end(), word) != k_keywords.end();
}

}  // namespace syn_dsl::syntax
