/*
 * vibecli C++17 - Line diff
 *
 * Unified diff between two texts for operator review before a write.
 * Lines are classified as added, removed or context; colored output marks
 * additions green and removals red.
 */
#ifndef vibecli_CORE_DIFF_HPP
#define vibecli_CORE_DIFF_HPP

#include <string>
#include <vector>

namespace vibecli {

enum class DiffKind {
    CONTEXT,
    ADDED,
    REMOVED
};

struct DiffLine {
    DiffKind kind;
    std::string text;
    
    DiffLine(DiffKind k, const std::string& t) : kind(k), text(t) {}
};

// Split keeping empty lines; a trailing newline does not add a line
std::vector<std::string> split_lines(const std::string& text);

// Full line-level edit script (longest common subsequence)
std::vector<DiffLine> diff_lines(const std::vector<std::string>& old_lines,
                                 const std::vector<std::string>& new_lines);

// "--- a/label\n+++ b/label\n@@ ... @@" hunks with `context` lines around
// each change. Empty string when the texts are identical.
std::string unified_diff(const std::string& old_content,
                         const std::string& new_content,
                         const std::string& label,
                         bool color = false,
                         size_t context = 3);

} // namespace vibecli

#endif // vibecli_CORE_DIFF_HPP
