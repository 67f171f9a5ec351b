#ifndef DASH_CORE_UTILS_HPP
#define DASH_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace dash {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp in local time with a strftime pattern
std::string format_local_time(int64_t timestamp_ms, const char* pattern);

// Format a duration as "HH:MM", minutes rounded to nearest, hours padded to width 2.
// Negative durations are clamped to zero.
std::string format_duration(int64_t duration_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Left-align `s` in a field of at least `width` characters. Never truncates.
std::string pad_right(const std::string& s, size_t width);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create a directory and all missing parents
bool create_directories(const std::string& dir);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

bool path_exists(const std::string& path);

// $HOME, or "." when unset
std::string home_directory();

} // namespace dash

#endif // DASH_CORE_UTILS_HPP
