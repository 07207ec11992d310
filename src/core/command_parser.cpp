#include <vibecli/core/command_parser.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <algorithm>
#include <cctype>

namespace vibecli {

namespace {

const char* OPEN_MARKER = ">>>";
const char* CLOSE_MARKER = "<<<";
const size_t MARKER_LEN = 3;

struct VerbEntry {
    const char* name;
    Verb verb;
};

const VerbEntry VERBS[] = {
    {"READ", Verb::READ},
    {"TREE", Verb::TREE},
    {"LISTFILES", Verb::LISTFILES},
    {"WRITE", Verb::WRITE},
    {"CD", Verb::CD},
    {"DELETE", Verb::DELETE},
    {"RUN", Verb::RUN},
    {"INSTALL", Verb::INSTALL},
    {"CREATE", Verb::CREATE},
    {"SHADCN", Verb::SHADCN},
    {"REFRESH", Verb::REFRESH}
};

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

// Reads the verb token after the ">>>" at pos. Sets p past the token.
MatchStatus read_verb(const std::string& text, size_t pos, bool at_end, Verb& verb, size_t& p) {
    p = pos + MARKER_LEN;
    while (p < text.size() && is_blank(text[p])) {
        ++p;
    }
    
    size_t start = p;
    while (p < text.size() && std::isalpha(static_cast<unsigned char>(text[p]))) {
        ++p;
    }
    
    if (p == text.size() && !at_end) {
        return MatchStatus::INCOMPLETE;
    }
    if (p == start) {
        return MatchStatus::NOT_A_BLOCK;
    }
    if (p < text.size()) {
        char next = text[p];
        if (!is_blank(next) && next != '\r' && next != '\n' && next != '<') {
            return MatchStatus::NOT_A_BLOCK;
        }
    }
    if (!parse_verb(text.substr(start, p - start), verb)) {
        return MatchStatus::NOT_A_BLOCK;
    }
    return MatchStatus::MATCHED;
}

// A body line that opens a nested write block (and does not close it itself)
bool opens_nested_write(const std::string& trimmed_line) {
    if (!starts_with(trimmed_line, OPEN_MARKER)) {
        return false;
    }
    std::string rest = ltrim(trimmed_line.substr(MARKER_LEN));
    if (!starts_with(rest, "WRITE")) {
        return false;
    }
    return rest.find(CLOSE_MARKER) == std::string::npos;
}

std::string strip_one_newline(const std::string& s) {
    std::string out = s;
    if (!out.empty() && out[out.size() - 1] == '\n') {
        out.erase(out.size() - 1);
        if (!out.empty() && out[out.size() - 1] == '\r') {
            out.erase(out.size() - 1);
        }
    }
    return out;
}

MatchStatus match_write(const std::string& text, size_t p, bool at_end, CommandBlock& block) {
    size_t line_end = text.find('\n', p);
    size_t first_line_end = line_end == std::string::npos ? text.size() : line_end;
    
    // ">>> WRITE path <<<" on one line: empty file
    size_t inline_close = text.find(CLOSE_MARKER, p);
    if (inline_close != std::string::npos && inline_close < first_line_end) {
        block.argument_line = trim(text.substr(p, inline_close - p));
        block.has_body = true;
        block.body.clear();
        block.end_pos = inline_close + MARKER_LEN;
        return block.argument_line.empty() ? MatchStatus::MALFORMED : MatchStatus::MATCHED;
    }
    
    if (line_end == std::string::npos) {
        return at_end ? MatchStatus::MALFORMED : MatchStatus::INCOMPLETE;
    }
    
    block.argument_line = trim(text.substr(p, line_end - p));
    if (block.argument_line.empty()) {
        return MatchStatus::MALFORMED;
    }
    
    size_t body_start = line_end + 1;
    
    // Own-line closer, tracking nested write blocks
    int depth = 0;
    size_t ls = body_start;
    while (ls <= text.size()) {
        size_t le = text.find('\n', ls);
        bool complete_line = le != std::string::npos;
        if (!complete_line) {
            le = text.size();
        }
        std::string t = trim(text.substr(ls, le - ls));
        
        if (t == CLOSE_MARKER) {
            if (depth == 0) {
                block.has_body = true;
                block.body = strip_one_newline(text.substr(body_start, ls - body_start));
                block.end_pos = text.find(CLOSE_MARKER, ls) + MARKER_LEN;
                return MatchStatus::MATCHED;
            }
            --depth;
        } else if (opens_nested_write(t)) {
            ++depth;
        }
        
        if (!complete_line) {
            break;
        }
        ls = le + 1;
    }
    
    if (!at_end) {
        return MatchStatus::INCOMPLETE;
    }
    
    // Fallback: first line that ends with the closer ("}<<<")
    ls = body_start;
    while (ls < text.size()) {
        size_t le = text.find('\n', ls);
        if (le == std::string::npos) {
            le = text.size();
        }
        std::string line = rtrim(text.substr(ls, le - ls));
        if (ends_with(line, CLOSE_MARKER)) {
            size_t close = ls + line.size() - MARKER_LEN;
            block.has_body = true;
            block.body = strip_one_newline(text.substr(body_start, close - body_start));
            block.end_pos = close + MARKER_LEN;
            return MatchStatus::MATCHED;
        }
        ls = le + 1;
    }
    
    return MatchStatus::MALFORMED;
}

} // namespace

const char* verb_name(Verb verb) {
    for (size_t i = 0; i < sizeof(VERBS) / sizeof(VERBS[0]); ++i) {
        if (VERBS[i].verb == verb) {
            return VERBS[i].name;
        }
    }
    return "UNKNOWN";
}

bool parse_verb(const std::string& token, Verb& verb) {
    for (size_t i = 0; i < sizeof(VERBS) / sizeof(VERBS[0]); ++i) {
        if (token == VERBS[i].name) {
            verb = VERBS[i].verb;
            return true;
        }
    }
    return false;
}

bool verb_takes_body(Verb verb) {
    return verb == Verb::WRITE;
}

bool verb_takes_arguments(Verb verb) {
    return verb != Verb::TREE && verb != Verb::LISTFILES && verb != Verb::REFRESH;
}

MatchStatus match_block(const std::string& text, size_t pos, bool at_end, CommandBlock& block) {
    Verb verb;
    size_t p;
    MatchStatus status = read_verb(text, pos, at_end, verb, p);
    if (status != MatchStatus::MATCHED) {
        return status;
    }
    
    block = CommandBlock();
    block.verb = verb;
    block.start_pos = pos;
    
    if (verb_takes_body(verb)) {
        return match_write(text, p, at_end, block);
    }
    
    size_t close = text.find(CLOSE_MARKER, p);
    if (close == std::string::npos) {
        return at_end ? MatchStatus::MALFORMED : MatchStatus::INCOMPLETE;
    }
    
    // Another block opens before this one closed
    size_t reopen = text.find(OPEN_MARKER, p);
    if (reopen != std::string::npos && reopen < close) {
        return MatchStatus::MALFORMED;
    }
    
    if (verb_takes_arguments(verb)) {
        block.argument_line = trim(text.substr(p, close - p));
        if (block.argument_line.empty()) {
            return MatchStatus::MALFORMED;
        }
    }
    block.end_pos = close + MARKER_LEN;
    return MatchStatus::MATCHED;
}

ParseResult parse_commands(const std::string& text) {
    ParseResult result;
    
    size_t copied = 0;
    size_t pos = text.find(OPEN_MARKER);
    while (pos != std::string::npos) {
        CommandBlock block;
        MatchStatus status = match_block(text, pos, true, block);
        if (status == MatchStatus::MATCHED) {
            result.residual += text.substr(copied, pos - copied);
            copied = block.end_pos;
            result.blocks.push_back(block);
            pos = text.find(OPEN_MARKER, block.end_pos);
        } else {
            if (status == MatchStatus::MALFORMED) {
                LOG_DEBUG("Dropping malformed command block at offset %zu", pos);
            }
            pos = text.find(OPEN_MARKER, pos + MARKER_LEN);
        }
    }
    result.residual += text.substr(copied);
    
    std::stable_sort(result.blocks.begin(), result.blocks.end(),
                     [](const CommandBlock& a, const CommandBlock& b) {
                         return static_cast<int>(a.verb) < static_cast<int>(b.verb);
                     });
    return result;
}

ArgumentSplit split_arguments(const std::string& line, size_t count) {
    ArgumentSplit split;
    size_t p = 0;
    while (split.tokens.size() < count) {
        while (p < line.size() && std::isspace(static_cast<unsigned char>(line[p]))) {
            ++p;
        }
        if (p >= line.size()) {
            break;
        }
        size_t start = p;
        while (p < line.size() && !std::isspace(static_cast<unsigned char>(line[p]))) {
            ++p;
        }
        split.tokens.push_back(line.substr(start, p - start));
    }
    if (p < line.size()) {
        split.rest = trim(line.substr(p));
    }
    return split;
}

// ============================================================================
// StreamScanner
// ============================================================================

StreamScanner::StreamScanner()
    : state_(State::PLAIN)
    , blocks_closed_(0)
{}

std::string StreamScanner::feed(const std::string& fragment) {
    text_ += fragment;
    pending_ += fragment;
    return drain(false);
}

std::string StreamScanner::finish() {
    return drain(true);
}

std::string StreamScanner::drain(bool at_end) {
    std::string out;
    
    while (true) {
        if (state_ == State::IN_BLOCK) {
            CommandBlock block;
            MatchStatus status = match_block(pending_, 0, at_end, block);
            if (status == MatchStatus::INCOMPLETE) {
                return out;
            }
            if (status == MatchStatus::MATCHED) {
                pending_.erase(0, block.end_pos);
                state_ = State::CLOSED;
                ++blocks_closed_;
                continue;
            }
            // Not a block after all: the marker is prose
            out += OPEN_MARKER;
            pending_.erase(0, MARKER_LEN);
            state_ = State::PLAIN;
            continue;
        }
        
        if (pending_.empty()) {
            return out;
        }
        state_ = State::PLAIN;
        
        size_t pos = pending_.find(OPEN_MARKER);
        if (pos != std::string::npos) {
            out += pending_.substr(0, pos);
            pending_.erase(0, pos);
            state_ = State::IN_BLOCK;
            continue;
        }
        
        // Hold back a trailing ">" or ">>" that may start a marker
        size_t keep = 0;
        if (!at_end) {
            if (ends_with(pending_, ">>")) {
                keep = 2;
            } else if (ends_with(pending_, ">")) {
                keep = 1;
            }
        }
        out += pending_.substr(0, pending_.size() - keep);
        pending_.erase(0, pending_.size() - keep);
        return out;
    }
}

} // namespace vibecli
