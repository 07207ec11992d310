#include <vibecli/core/repo_context.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <algorithm>
#include <sstream>
#include <dirent.h>
#include <sys/stat.h>

namespace vibecli {

namespace {

const char* SKIPPED_DIR_NAMES[] = {
    "node_modules", ".git", "__pycache__", ".venv", "venv", "dist",
    "build", ".next", ".nuxt", "target", "vendor", ".vibe"
};

const size_t BINARY_SNIFF_BYTES = 8192;

bool entry_less(const std::string& a_name, bool a_dir,
                const std::string& b_name, bool b_dir) {
    if (a_dir != b_dir) {
        return a_dir;
    }
    std::string la = to_lower(a_name);
    std::string lb = to_lower(b_name);
    if (la != lb) {
        return la < lb;
    }
    return a_name < b_name;
}

} // namespace

bool looks_binary(const std::string& content) {
    size_t n = std::min(content.size(), BINARY_SNIFF_BYTES);
    return content.find('\0') < n;
}

RepoContextBuilder::RepoContextBuilder(const std::string& root, const IgnorePolicy& policy,
                                       const ContextLimits& limits)
    : root_(root)
    , policy_(policy)
    , limits_(limits)
{}

std::string RepoContextBuilder::relative(const std::string& path) const {
    if (path == root_) {
        return "";
    }
    if (starts_with(path, root_ + "/")) {
        return path.substr(root_.size() + 1);
    }
    return path;
}

bool RepoContextBuilder::list_visible(const std::string& dir, std::vector<Entry>& out) const {
    DIR* d = opendir(dir.c_str());
    if (!d) {
        return false;
    }
    
    std::string rel_dir = relative(dir);
    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        
        std::string full = join_path(dir, name);
        struct stat st;
        if (lstat(full.c_str(), &st) != 0) {
            continue;
        }
        bool dir_entry = S_ISDIR(st.st_mode);
        
        std::string rel = rel_dir.empty() ? name : rel_dir + "/" + name;
        if (policy_.ignored(rel, dir_entry)) {
            continue;
        }
        
        Entry e;
        e.name = name;
        e.is_dir = dir_entry;
        e.is_link = S_ISLNK(st.st_mode);
        out.push_back(e);
    }
    closedir(d);
    
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) {
        return entry_less(a.name, a.is_dir, b.name, b.is_dir);
    });
    return true;
}

void RepoContextBuilder::render_level(const std::string& dir, const std::string& prefix,
                                      std::vector<std::string>& lines) const {
    std::vector<Entry> entries;
    if (!list_visible(dir, entries)) {
        lines.push_back(prefix + "[Access Denied]");
        return;
    }
    
    for (size_t i = 0; i < entries.size(); ++i) {
        bool last = (i == entries.size() - 1);
        lines.push_back(prefix + (last ? "└── " : "├── ") + entries[i].name);
        if (entries[i].is_dir) {
            render_level(join_path(dir, entries[i].name),
                         prefix + (last ? "    " : "│   "), lines);
        }
    }
}

std::string RepoContextBuilder::render_tree(const std::string& dir) const {
    std::vector<std::string> lines;
    render_level(dir, "", lines);
    if (lines.empty()) {
        return "(Empty Directory)";
    }
    return join(lines, "\n");
}

bool RepoContextBuilder::list_directory(const std::string& dir, std::vector<std::string>& names) const {
    std::vector<Entry> entries;
    if (!list_visible(dir, entries)) {
        return false;
    }
    for (size_t i = 0; i < entries.size(); ++i) {
        names.push_back(entries[i].is_dir ? entries[i].name + "/" : entries[i].name);
    }
    return true;
}

void RepoContextBuilder::collect_files(const std::string& dir, std::vector<std::string>& files) const {
    std::vector<Entry> entries;
    if (!list_visible(dir, entries)) {
        LOG_DEBUG("Cannot list %s", dir.c_str());
        return;
    }
    for (size_t i = 0; i < entries.size(); ++i) {
        std::string full = join_path(dir, entries[i].name);
        if (entries[i].is_link) {
            LOG_DEBUG("Not following symlink %s", full.c_str());
        } else if (entries[i].is_dir) {
            collect_files(full, files);
        } else {
            files.push_back(full);
        }
    }
}

std::string RepoContextBuilder::scrape_contents(const std::string& dir) const {
    std::string name = base_name(dir);
    
    std::ostringstream out;
    out << "# Project Content: " << name << "\n\n";
    out << "## Folder Structure\n";
    out << "```\n";
    out << name << "/\n";
    std::string tree = render_tree(dir);
    if (tree != "(Empty Directory)") {
        out << tree << "\n";
    }
    out << "```\n\n---\n\n";
    out << "## File Contents\n\n";
    
    std::vector<std::string> files;
    collect_files(dir, files);
    
    size_t budget_used = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        const std::string& path = files[i];
        std::string display = path.substr(dir.size() + (ends_with(dir, "/") ? 0 : 1));
        
        size_t dot = display.rfind('.');
        size_t slash = display.rfind('/');
        std::string ext = "text";
        if (dot != std::string::npos && (slash == std::string::npos || dot > slash + 1)) {
            ext = display.substr(dot + 1);
        }
        
        struct stat st;
        if (lstat(path.c_str(), &st) != 0) {
            continue;
        }
        size_t size = static_cast<size_t>(st.st_size);
        
        std::ostringstream block;
        block << "### File: `" << display << "`\n";
        
        if (size > limits_.max_file_size) {
            block << "[skipped: " << size << " bytes]\n\n";
        } else {
            std::string content;
            if (!read_file(path, content)) {
                block << "[unreadable]\n\n";
            } else if (looks_binary(content)) {
                block << "[skipped: binary file]\n\n";
            } else {
                block << "```" << ext << "\n" << sanitize_utf8(content) << "\n```\n\n";
            }
        }
        
        std::string text = block.str();
        if (budget_used + text.size() > limits_.max_context_chars) {
            out << "[context truncated: " << (files.size() - i) << " more files not shown]\n";
            LOG_WARN("Context limit reached (%zu chars), %zu files omitted",
                     limits_.max_context_chars, files.size() - i);
            break;
        }
        budget_used += text.size();
        out << text;
    }
    
    return out.str();
}

std::vector<std::string> RepoContextBuilder::find_skipped_directories(const std::string& dir) const {
    std::vector<std::string> found;
    
    // (path, depth) breadth-first, depth counted from dir
    std::vector<std::pair<std::string, int> > queue;
    queue.push_back(std::make_pair(dir, 0));
    
    for (size_t qi = 0; qi < queue.size(); ++qi) {
        std::string current = queue[qi].first;
        int depth = queue[qi].second;
        
        DIR* d = opendir(current.c_str());
        if (!d) {
            continue;
        }
        struct dirent* ent;
        while ((ent = readdir(d)) != nullptr) {
            std::string name = ent->d_name;
            if (name == "." || name == "..") {
                continue;
            }
            std::string full = join_path(current, name);
            struct stat st;
            if (lstat(full.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
                continue;
            }
            
            bool heavy = false;
            for (size_t i = 0; i < sizeof(SKIPPED_DIR_NAMES) / sizeof(SKIPPED_DIR_NAMES[0]); ++i) {
                if (name == SKIPPED_DIR_NAMES[i]) {
                    heavy = true;
                    break;
                }
            }
            
            if (heavy) {
                found.push_back(relative(full));
            } else if (depth < 2 && !policy_.ignored(relative(full), true)) {
                queue.push_back(std::make_pair(full, depth + 1));
            }
        }
        closedir(d);
    }
    
    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

std::string RepoContextBuilder::build(const std::string& dir) const {
    std::ostringstream out;
    out << "DIRECTORY STRUCTURE:\n" << render_tree(dir) << "\n\n";
    out << "FILE CONTENTS:\n" << scrape_contents(dir);
    
    std::vector<std::string> skipped = find_skipped_directories(dir);
    if (!skipped.empty()) {
        out << "\nSKIPPED DIRECTORIES (not scanned): " << join(skipped, ", ") << "\n";
    }
    return out.str();
}

} // namespace vibecli
