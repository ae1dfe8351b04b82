#ifndef UTILITIES_H
#define UTILITIES_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Utilities
// ============================================================================

using TimePoint = std::chrono::system_clock::time_point;

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s);

// Unicode-aware lowercase folding of UTF-8 text
[[nodiscard]] std::string fold_case(const std::string_view s);

[[nodiscard]] std::vector<std::string> tokenize(const std::string_view text);

// Removes the last UTF-8 code point; returns false if s was empty
bool pop_utf8(std::string& s);

// Terminal columns occupied by UTF-8 text (East Asian wide = 2)
[[nodiscard]] size_t display_width(const std::string_view text);

[[nodiscard]] std::string truncate(const std::string_view text,
                                   const size_t max_columns);

[[nodiscard]] std::string join(const std::vector<std::string>& parts,
                               const std::string_view separator);

[[nodiscard]] std::string format_iso8601(const TimePoint tp);

[[nodiscard]] std::optional<TimePoint> parse_iso8601(const std::string_view text);

[[nodiscard]] std::string format_local(const TimePoint tp);

[[nodiscard]] std::optional<std::filesystem::path> home_directory();

[[nodiscard]] std::optional<std::filesystem::path> config_directory();

// Absolute, normalized form used as library identity; works for paths
// that currently do not exist
[[nodiscard]] std::string canonical_path(const std::filesystem::path& p);

[[nodiscard]] size_t terminal_height();

[[nodiscard]] size_t terminal_width();

void clear_screen();

} // namespace Util

#endif
