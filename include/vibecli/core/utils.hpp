#ifndef vibecli_CORE_UTILS_HPP
#define vibecli_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace vibecli {

// ============================================================================
// Time
// ============================================================================

int64_t current_timestamp_ms();

// strftime over local time, e.g. format_local_time(ms, "%Y%m%d-%H%M%S")
std::string format_local_time(int64_t timestamp_ms, const char* fmt);

// ============================================================================
// Strings
// ============================================================================

// Whitespace here is space, tab, CR and LF
std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// "a\nb\n" -> {"a", "b"}; inner empty fields are kept
std::vector<std::string> split(const std::string& s, char delimiter);
std::vector<std::string> split_whitespace(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Cut to at most max_len bytes without splitting a UTF-8 sequence
std::string truncate_safe(const std::string& s, size_t max_len);

// Make model-bound text valid UTF-8: broken sequences become U+FFFD,
// stray control bytes become spaces, CR is dropped
std::string sanitize_utf8(const std::string& s);

// ============================================================================
// Paths (lexical only, nothing is resolved against the filesystem)
// ============================================================================

std::string normalize_path(const std::string& path);
std::string join_path(const std::string& a, const std::string& b);
std::string base_name(const std::string& path);

// mkdir -p on the directory part of filepath
bool create_parent_directory(const std::string& filepath);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

// fnmatch with FNM_PATHNAME: '*' stops at '/'
bool glob_match(const std::string& pattern, const std::string& text);

// ============================================================================
// Files
// ============================================================================

bool read_file(const std::string& path, std::string& content_out);
bool write_file(const std::string& path, const std::string& content);

} // namespace vibecli

#endif // vibecli_CORE_UTILS_HPP
