/*
 * vibecli C++17 - Workspace
 *
 * The project root and path confinement. Every file verb resolves its
 * target through here; anything that canonicalizes outside the root is
 * rejected.
 */
#ifndef vibecli_CORE_WORKSPACE_HPP
#define vibecli_CORE_WORKSPACE_HPP

#include <string>

namespace vibecli {

class Workspace {
public:
    Workspace();
    
    // Canonicalizes root (creating it if missing). False when the root
    // cannot be created or is not a directory.
    bool open(const std::string& root);
    
    const std::string& root() const { return root_; }
    
    // Absolute, canonical form of path as seen from cwd. Backslashes are
    // treated as separators. Symlinks are resolved through the nearest
    // existing ancestor so a non-existent leaf still resolves.
    std::string resolve(const std::string& cwd, const std::string& path) const;
    
    bool contains(const std::string& abs_path) const;
    
    // "src/app.js" for <root>/src/app.js, "." for the root itself
    std::string relative_to_root(const std::string& abs_path) const;
    
    // ============ Filesystem helpers ============
    
    static bool ensure_directory(const std::string& path);
    static bool remove_tree(const std::string& path, std::string& error);
    static size_t count_files(const std::string& path);
    static bool copy_file(const std::string& src, const std::string& dst);
    static bool copy_tree(const std::string& src, const std::string& dst);

private:
    std::string root_;
};

// realpath() of the nearest existing ancestor plus the remaining tail
std::string canonicalize(const std::string& abs_path);

} // namespace vibecli

#endif // vibecli_CORE_WORKSPACE_HPP
