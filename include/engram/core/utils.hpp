#ifndef engram_CORE_UTILS_HPP
#define engram_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace engram {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// Round half away from zero to the given number of decimal places
double round_to(double value, int decimals);

// True when d is finite and truncates to a representable int64_t
bool double_fits_int64(double d);

// ============ Time utilities ============

// Milliseconds per day
const int64_t MS_PER_DAY = 86400000LL;

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp (milliseconds) as "YYYY-MM-DD HH:MM:SS" UTC
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Number of UTF-8 code points in s
size_t utf8_length(const std::string& s);

// First max_chars UTF-8 code points of s
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Normalize whitespace: collapse runs of whitespace to single space, trim.
std::string normalize_whitespace(const std::string& s);

// ============ Path utilities ============

// Replace a leading "~/" with $HOME
std::string expand_home(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ Hashing utilities ============

// SHA-256 digest of data as 64 lowercase hex characters
std::string sha256_hex(const std::string& data);

} // namespace engram

#endif // engram_CORE_UTILS_HPP
