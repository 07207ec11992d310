#include <vibecli/core/ignore_policy.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>

namespace vibecli {

IgnoreRuleSet IgnoreRuleSet::defaults() {
    IgnoreRuleSet rules;
    
    const char* names[] = {
        "node_modules", ".git", ".vs", ".vscode", ".idea", "__pycache__",
        "dist", "build", "coverage", ".next", ".nuxt", ".output", ".vibe",
        "package-lock.json", "yarn.lock", "pnpm-lock.yaml", "bun.lockb",
        ".DS_Store", "Thumbs.db"
    };
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
        rules.exact_names.insert(names[i]);
    }
    
    const char* exts[] = {
        ".png", ".jpg", ".jpeg", ".gif", ".ico", ".svg", ".webp",
        ".woff", ".woff2", ".ttf", ".eot", ".otf",
        ".exe", ".dll", ".so", ".dylib", ".pyc", ".class", ".jar",
        ".pdf", ".zip", ".tar", ".gz"
    };
    for (size_t i = 0; i < sizeof(exts) / sizeof(exts[0]); ++i) {
        rules.extensions.insert(exts[i]);
    }
    
    rules.visible_dotfiles.insert(".env");
    rules.visible_dotfiles.insert(".gitignore");
    return rules;
}

IgnoreRuleSet IgnoreRuleSet::with_patterns(const std::vector<std::string>& patterns) const {
    IgnoreRuleSet copy = *this;
    copy.glob_patterns.insert(copy.glob_patterns.end(), patterns.begin(), patterns.end());
    return copy;
}

std::vector<std::string> parse_ignore_patterns(const std::string& text) {
    std::vector<std::string> patterns;
    std::vector<std::string> lines = split(text, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#' || line[0] == '!') {
            continue;
        }
        if (line[0] == '/') {
            line = line.substr(1);
        }
        if (line.empty() || line == "/") {
            continue;
        }
        patterns.push_back(line);
    }
    return patterns;
}

static std::string extension_of(const std::string& name) {
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return to_lower(name.substr(dot));
}

bool is_ignored(const IgnoreRuleSet& rules, const std::string& relative_path, bool is_dir) {
    std::string name = base_name(relative_path);
    if (name.empty() || name == "." ) {
        return false;
    }
    
    if (rules.exact_names.count(name)) {
        return true;
    }
    
    if (name[0] == '.' && !rules.visible_dotfiles.count(name)) {
        return true;
    }
    
    if (!is_dir && rules.extensions.count(extension_of(name))) {
        return true;
    }
    
    for (size_t i = 0; i < rules.glob_patterns.size(); ++i) {
        std::string pattern = rules.glob_patterns[i];
        if (ends_with(pattern, "/")) {
            if (!is_dir) continue;
            pattern = pattern.substr(0, pattern.size() - 1);
        }
        if (glob_match(pattern, name) || glob_match(pattern, relative_path)) {
            return true;
        }
    }
    
    return false;
}

IgnorePolicy::IgnorePolicy()
    : rules_(IgnoreRuleSet::defaults())
{}

IgnorePolicy::IgnorePolicy(const IgnoreRuleSet& rules)
    : rules_(rules)
{}

IgnorePolicy IgnorePolicy::for_root(const std::string& root, bool use_gitignore) {
    IgnoreRuleSet rules = IgnoreRuleSet::defaults();
    if (!use_gitignore) {
        return IgnorePolicy(rules);
    }
    
    std::string text;
    if (read_file(join_path(root, ".gitignore"), text)) {
        std::vector<std::string> patterns = parse_ignore_patterns(text);
        LOG_DEBUG("Loaded %zu patterns from .gitignore", patterns.size());
        rules = rules.with_patterns(patterns);
    }
    return IgnorePolicy(rules);
}

} // namespace vibecli
