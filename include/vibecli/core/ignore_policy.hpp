/*
 * vibecli C++17 - Ignore policy
 *
 * Decides which filesystem entries are visible to context scans:
 *   - exact name denylist (node_modules, .git, lock files, ...)
 *   - file extension denylist (images, fonts, archives, binaries)
 *   - dot-entries are hidden, except .env and .gitignore
 *   - glob patterns, typically from the project's .gitignore
 */
#ifndef vibecli_CORE_IGNORE_POLICY_HPP
#define vibecli_CORE_IGNORE_POLICY_HPP

#include <set>
#include <string>
#include <vector>

namespace vibecli {

struct IgnoreRuleSet {
    std::set<std::string> exact_names;
    std::set<std::string> extensions;       // lowercase, with leading '.'
    std::vector<std::string> glob_patterns; // "name", "dir/", "sub/*.log"
    std::set<std::string> visible_dotfiles;
    
    static IgnoreRuleSet defaults();
    
    // Copy with additional glob patterns appended
    IgnoreRuleSet with_patterns(const std::vector<std::string>& patterns) const;
};

// Parses .gitignore-style text: blank lines, comments and negations
// ("!keep.me") are skipped; leading '/' is stripped.
std::vector<std::string> parse_ignore_patterns(const std::string& text);

// relative_path is relative to the project root, '/'-separated
bool is_ignored(const IgnoreRuleSet& rules, const std::string& relative_path, bool is_dir);

class IgnorePolicy {
public:
    IgnorePolicy();
    explicit IgnorePolicy(const IgnoreRuleSet& rules);
    
    // Default rules extended with <root>/.gitignore when present
    static IgnorePolicy for_root(const std::string& root, bool use_gitignore);
    
    bool ignored(const std::string& relative_path, bool is_dir) const {
        return is_ignored(rules_, relative_path, is_dir);
    }
    
    const IgnoreRuleSet& rules() const { return rules_; }

private:
    IgnoreRuleSet rules_;
};

} // namespace vibecli

#endif // vibecli_CORE_IGNORE_POLICY_HPP
