#include <vibecli/core/utils.hpp>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace vibecli {

namespace {

const char* const kBlank = " \t\n\r";

const char* const kReplacementChar = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the UTF-8 sequence introduced by lead byte c, 0 if c cannot lead one
size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

std::string map_chars(const std::string& s, int (*fn)(int)) {
    std::string out(s);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<char>(fn(static_cast<unsigned char>(out[i])));
    }
    return out;
}

} // namespace

// ============================================================================
// Time
// ============================================================================

int64_t current_timestamp_ms() {
    struct timespec now;
    clock_gettime(CLOCK_REALTIME, &now);
    return static_cast<int64_t>(now.tv_sec) * 1000 + now.tv_nsec / 1000000;
}

std::string format_local_time(int64_t timestamp_ms, const char* fmt) {
    time_t secs = static_cast<time_t>(timestamp_ms / 1000);
    struct tm local;
    localtime_r(&secs, &local);
    char buf[64];
    return std::string(buf, strftime(buf, sizeof(buf), fmt, &local));
}

// ============================================================================
// Strings
// ============================================================================

std::string ltrim(const std::string& s) {
    size_t first = s.find_first_not_of(kBlank);
    return first == std::string::npos ? std::string() : s.substr(first);
}

std::string rtrim(const std::string& s) {
    size_t last = s.find_last_not_of(kBlank);
    return last == std::string::npos ? std::string() : s.substr(0, last + 1);
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(kBlank);
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(kBlank);
    return s.substr(first, last - first + 1);
}

std::string to_lower(const std::string& s) { return map_chars(s, ::tolower); }
std::string to_upper(const std::string& s) { return map_chars(s, ::toupper); }

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return s.compare(s.size() - suffix.size(), std::string::npos, suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    size_t hit;
    while ((hit = s.find(delimiter, start)) != std::string::npos) {
        fields.push_back(s.substr(start, hit - start));
        start = hit + 1;
    }
    // A trailing delimiter does not open an empty last field
    if (start < s.size()) {
        fields.push_back(s.substr(start));
    }
    return fields;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> words;
    size_t pos = s.find_first_not_of(kBlank);
    while (pos != std::string::npos) {
        size_t end = s.find_first_of(kBlank, pos);
        words.push_back(s.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        pos = end == std::string::npos ? end : s.find_first_not_of(kBlank, end);
    }
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += delimiter;
        out += parts[i];
    }
    return out;
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    size_t cut = max_len;
    while (cut > 0 && is_continuation(static_cast<unsigned char>(s[cut]))) {
        --cut;
    }
    return s.substr(0, cut);
}

std::string sanitize_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    
    size_t i = 0;
    while (i < s.size()) {
        unsigned char lead = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(lead);
        
        if (len == 1) {
            if (lead == '\t' || lead == '\n' || lead >= 0x20) {
                out.push_back(static_cast<char>(lead));
            } else if (lead != '\r') {
                out.push_back(' ');
            }
            ++i;
            continue;
        }
        
        bool whole = len != 0 && i + len <= s.size();
        for (size_t k = 1; whole && k < len; ++k) {
            whole = is_continuation(static_cast<unsigned char>(s[i + k]));
        }
        if (whole) {
            out.append(s, i, len);
            i += len;
        } else {
            out += kReplacementChar;
            ++i;
        }
    }
    return out;
}

// ============================================================================
// Paths
// ============================================================================

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;
    bool absolute = path[0] == '/';
    
    std::vector<std::string> kept;
    std::vector<std::string> segments = split(path, '/');
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& seg = segments[i];
        if (seg.empty() || seg == ".") continue;
        if (seg != "..") {
            kept.push_back(seg);
        } else if (!kept.empty() && kept.back() != "..") {
            kept.pop_back();
        } else if (!absolute) {
            kept.push_back(seg);
        }
    }
    
    std::string out = (absolute ? "/" : "") + join(kept, "/");
    return out.empty() ? "." : out;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    bool slash_a = a[a.size() - 1] == '/';
    bool slash_b = b[0] == '/';
    if (slash_a && slash_b) return a + b.substr(1);
    if (slash_a || slash_b) return a + b;
    return a + "/" + b;
}

std::string base_name(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return path.empty() ? path : "/";
    }
    size_t slash = path.rfind('/', end);
    size_t start = slash == std::string::npos ? 0 : slash + 1;
    return path.substr(start, end - start + 1);
}

bool create_parent_directory(const std::string& filepath) {
    size_t last = filepath.rfind('/');
    if (last == std::string::npos || last == 0) return true;
    
    // Walk each prefix ending before a '/', creating what is missing
    size_t pos = 0;
    while (pos != std::string::npos && pos <= last) {
        pos = filepath.find('/', pos + 1);
        size_t cut = (pos == std::string::npos || pos > last) ? last : pos;
        std::string dir = filepath.substr(0, cut);
        
        struct stat st;
        if (stat(dir.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) return false;
        } else if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
        if (cut == last) break;
    }
    return true;
}

bool path_exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool glob_match(const std::string& pattern, const std::string& text) {
    return fnmatch(pattern.c_str(), text.c_str(), FNM_PATHNAME) == 0;
}

// ============================================================================
// Files
// ============================================================================

bool read_file(const std::string& path, std::string& content_out) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    
    std::string data;
    char chunk[8192];
    for (;;) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return false;
        }
        data.append(chunk, static_cast<size_t>(n));
    }
    close(fd);
    content_out.swap(data);
    return true;
}

bool write_file(const std::string& path, const std::string& content) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return false;
    
    size_t done = 0;
    while (done < content.size()) {
        ssize_t n = write(fd, content.data() + done, content.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return close(fd) == 0;
}

} // namespace vibecli
