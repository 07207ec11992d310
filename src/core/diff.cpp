#include <vibecli/core/diff.hpp>
#include <algorithm>
#include <sstream>

namespace vibecli {

namespace {

const char* COLOR_GREEN = "\033[32m";
const char* COLOR_RED = "\033[31m";
const char* COLOR_CYAN = "\033[36m";
const char* COLOR_RESET = "\033[0m";

struct Hunk {
    size_t begin;   // index into the edit script
    size_t end;
};

std::string range_spec(size_t start, size_t count) {
    // unified format: line numbers are 1-based, an empty range names the line before it
    std::ostringstream oss;
    if (count == 0) {
        oss << start << ",0";
    } else if (count == 1) {
        oss << start + 1;
    } else {
        oss << start + 1 << "," << count;
    }
    return oss.str();
}

} // namespace

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::vector<DiffLine> diff_lines(const std::vector<std::string>& old_lines,
                                 const std::vector<std::string>& new_lines) {
    // Trim the common prefix and suffix before the quadratic table
    size_t prefix = 0;
    while (prefix < old_lines.size() && prefix < new_lines.size() &&
           old_lines[prefix] == new_lines[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < old_lines.size() - prefix && suffix < new_lines.size() - prefix &&
           old_lines[old_lines.size() - 1 - suffix] == new_lines[new_lines.size() - 1 - suffix]) {
        ++suffix;
    }
    
    size_t n = old_lines.size() - prefix - suffix;
    size_t m = new_lines.size() - prefix - suffix;
    
    // lcs[i][j] = LCS length of old[i..n) and new[j..m) (middle section)
    std::vector<std::vector<size_t> > lcs(n + 1, std::vector<size_t>(m + 1, 0));
    for (size_t i = n; i-- > 0; ) {
        for (size_t j = m; j-- > 0; ) {
            if (old_lines[prefix + i] == new_lines[prefix + j]) {
                lcs[i][j] = lcs[i + 1][j + 1] + 1;
            } else {
                lcs[i][j] = std::max(lcs[i + 1][j], lcs[i][j + 1]);
            }
        }
    }
    
    std::vector<DiffLine> script;
    for (size_t k = 0; k < prefix; ++k) {
        script.push_back(DiffLine(DiffKind::CONTEXT, old_lines[k]));
    }
    
    size_t i = 0, j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && old_lines[prefix + i] == new_lines[prefix + j]) {
            script.push_back(DiffLine(DiffKind::CONTEXT, old_lines[prefix + i]));
            ++i;
            ++j;
        } else if (i < n && (j == m || lcs[i + 1][j] >= lcs[i][j + 1])) {
            script.push_back(DiffLine(DiffKind::REMOVED, old_lines[prefix + i]));
            ++i;
        } else {
            script.push_back(DiffLine(DiffKind::ADDED, new_lines[prefix + j]));
            ++j;
        }
    }
    
    for (size_t k = old_lines.size() - suffix; k < old_lines.size(); ++k) {
        script.push_back(DiffLine(DiffKind::CONTEXT, old_lines[k]));
    }
    return script;
}

std::string unified_diff(const std::string& old_content,
                         const std::string& new_content,
                         const std::string& label,
                         bool color,
                         size_t context) {
    std::vector<DiffLine> script = diff_lines(split_lines(old_content), split_lines(new_content));
    
    // Group changes into hunks, merging those whose context windows touch
    std::vector<Hunk> hunks;
    for (size_t k = 0; k < script.size(); ++k) {
        if (script[k].kind == DiffKind::CONTEXT) {
            continue;
        }
        size_t begin = k > context ? k - context : 0;
        size_t end = std::min(script.size(), k + context + 1);
        if (!hunks.empty() && begin <= hunks.back().end) {
            hunks.back().end = std::max(hunks.back().end, end);
        } else {
            Hunk h;
            h.begin = begin;
            h.end = end;
            hunks.push_back(h);
        }
    }
    
    if (hunks.empty()) {
        return "";
    }
    
    std::ostringstream out;
    out << (color ? COLOR_RED : "") << "--- a/" << label << (color ? COLOR_RESET : "") << "\n";
    out << (color ? COLOR_GREEN : "") << "+++ b/" << label << (color ? COLOR_RESET : "") << "\n";
    
    // Line numbers at the start of each script position
    size_t old_no = 0, new_no = 0, pos = 0;
    for (size_t h = 0; h < hunks.size(); ++h) {
        for (; pos < hunks[h].begin; ++pos) {
            if (script[pos].kind != DiffKind::ADDED) ++old_no;
            if (script[pos].kind != DiffKind::REMOVED) ++new_no;
        }
        
        size_t old_count = 0, new_count = 0;
        for (size_t k = hunks[h].begin; k < hunks[h].end; ++k) {
            if (script[k].kind != DiffKind::ADDED) ++old_count;
            if (script[k].kind != DiffKind::REMOVED) ++new_count;
        }
        
        out << (color ? COLOR_CYAN : "")
            << "@@ -" << range_spec(old_no, old_count) << " +" << range_spec(new_no, new_count) << " @@"
            << (color ? COLOR_RESET : "") << "\n";
        
        for (size_t k = hunks[h].begin; k < hunks[h].end; ++k) {
            const DiffLine& line = script[k];
            switch (line.kind) {
                case DiffKind::ADDED:
                    out << (color ? COLOR_GREEN : "") << "+" << line.text << (color ? COLOR_RESET : "") << "\n";
                    break;
                case DiffKind::REMOVED:
                    out << (color ? COLOR_RED : "") << "-" << line.text << (color ? COLOR_RESET : "") << "\n";
                    break;
                default:
                    out << " " << line.text << "\n";
                    break;
            }
        }
        
        old_no += old_count;
        new_no += new_count;
        pos = hunks[h].end;
    }
    
    return out.str();
}

} // namespace vibecli
