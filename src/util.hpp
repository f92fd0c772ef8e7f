#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace bankmatch {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a half-written file.
bool atomic_write_file(const std::string& path, const std::string& content);

// True if s is non-empty and made only of ASCII digits
bool is_digits(const std::string& s);

// ASCII-only lowercase; multi-byte UTF-8 sequences pass through untouched
std::string to_lower_ascii(const std::string& s);

// ── UTF-8 ────────────────────────────────────────────────────────

// Decode UTF-8 into code points. Malformed bytes become U+FFFD.
std::u32string decode_utf8(const std::string& s);

// Append the UTF-8 encoding of cp to out
void append_utf8(std::string& out, char32_t cp);

std::string encode_utf8(const std::u32string& cps);

// Number of code points in a UTF-8 string
size_t utf8_length(const std::string& s);

// 64-bit FNV-1a over raw bytes
uint64_t fnv1a_64(const std::string& data, uint64_t seed = 14695981039346656037ULL);

} // namespace bankmatch
