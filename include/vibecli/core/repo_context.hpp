/*
 * vibecli C++17 - Repository context builder
 *
 * Walks a directory under the project root honoring the IgnorePolicy and
 * renders what the backend sees of the project:
 *
 *   DIRECTORY STRUCTURE:
 *   ├── src
 *   │   └── main.js
 *   └── package.json
 *
 *   FILE CONTENTS:
 *   # Project Content: app
 *   ...
 */
#ifndef vibecli_CORE_REPO_CONTEXT_HPP
#define vibecli_CORE_REPO_CONTEXT_HPP

#include "ignore_policy.hpp"
#include <string>
#include <vector>

namespace vibecli {

struct ContextLimits {
    size_t max_file_size;       // larger files are listed, not inlined
    size_t max_context_chars;   // cap on the FILE CONTENTS section
    
    ContextLimits() : max_file_size(51200), max_context_chars(400000) {}
};

class RepoContextBuilder {
public:
    RepoContextBuilder(const std::string& root, const IgnorePolicy& policy,
                       const ContextLimits& limits = ContextLimits());
    
    // Tree of dir (absolute, inside root) without the dir itself.
    // "(Empty Directory)" when nothing is visible.
    std::string render_tree(const std::string& dir) const;
    
    // One level, directories suffixed with "/". False when dir is unreadable.
    bool list_directory(const std::string& dir, std::vector<std::string>& names) const;
    
    // Markdown dump of every visible file below dir
    std::string scrape_contents(const std::string& dir) const;
    
    // Heavy directories hidden from the scan, relative to root, depth <= 2
    std::vector<std::string> find_skipped_directories(const std::string& dir) const;
    
    // Full context body: structure, contents, skipped directory report
    std::string build(const std::string& dir) const;
    
    const std::string& root() const { return root_; }
    const IgnorePolicy& policy() const { return policy_; }
    const ContextLimits& limits() const { return limits_; }

private:
    std::string root_;
    IgnorePolicy policy_;
    ContextLimits limits_;
    
    // Symbolic links are listed but never followed
    struct Entry {
        std::string name;
        bool is_dir;
        bool is_link;
    };
    
    bool list_visible(const std::string& dir, std::vector<Entry>& out) const;
    std::string relative(const std::string& path) const;
    void render_level(const std::string& dir, const std::string& prefix,
                      std::vector<std::string>& lines) const;
    void collect_files(const std::string& dir, std::vector<std::string>& files) const;
};

// True when the first 8 KiB contain a NUL byte
bool looks_binary(const std::string& content);

} // namespace vibecli

#endif // vibecli_CORE_REPO_CONTEXT_HPP
