/*
 * vibecli C++17 - Command protocol parser
 *
 * Extracts action blocks from backend text. Grammar:
 *
 *   >>> VERB argument line <<<
 *
 *   >>> WRITE path/to/file
 *   file body, verbatim
 *   <<<
 *
 * WRITE closes at a line holding only "<<<"; nested ">>> WRITE" lines in
 * the body open a level that their own "<<<" line closes. Every other verb
 * closes at the first "<<<", which may sit on the same line. Unknown verbs,
 * unterminated blocks and blocks missing a required argument are dropped
 * and stay part of the prose.
 */
#ifndef vibecli_CORE_COMMAND_PARSER_HPP
#define vibecli_CORE_COMMAND_PARSER_HPP

#include <string>
#include <vector>

namespace vibecli {

// Declaration order is execution order: context-gathering verbs run
// before the ones that mutate the project.
enum class Verb {
    READ,
    TREE,
    LISTFILES,
    WRITE,
    CD,
    DELETE,
    RUN,
    INSTALL,
    CREATE,
    SHADCN,
    REFRESH
};

const char* verb_name(Verb verb);
bool parse_verb(const std::string& token, Verb& verb);
bool verb_takes_body(Verb verb);
bool verb_takes_arguments(Verb verb);

struct CommandBlock {
    Verb verb;
    std::string argument_line;  // trimmed; empty for TREE/LISTFILES/REFRESH
    bool has_body;
    std::string body;
    size_t start_pos;           // span in the source text
    size_t end_pos;
    
    CommandBlock() : verb(Verb::READ), has_body(false), start_pos(0), end_pos(0) {}
};

struct ParseResult {
    std::vector<CommandBlock> blocks;   // sorted by execution priority
    std::string residual;               // input with matched spans removed
};

ParseResult parse_commands(const std::string& text);

enum class MatchStatus {
    MATCHED,
    NOT_A_BLOCK,    // ">>>" not followed by a known verb
    INCOMPLETE,     // needs more text (streaming only)
    MALFORMED
};

// Tries to read one block starting at the ">>>" at pos. at_end says no
// more text will arrive; INCOMPLETE is only returned when it is false.
MatchStatus match_block(const std::string& text, size_t pos, bool at_end, CommandBlock& block);

// "npm react react-dom" with count 2 -> tokens {"npm", "react"}, rest "react-dom"
struct ArgumentSplit {
    std::vector<std::string> tokens;
    std::string rest;
};

ArgumentSplit split_arguments(const std::string& line, size_t count);

// ============================================================================
// Incremental scanner for streamed responses
// ============================================================================

// Consumes a response fragment by fragment and hands back only the prose,
// holding back anything that may turn out to be a command block.
class StreamScanner {
public:
    enum class State {
        PLAIN,      // emitting prose
        IN_BLOCK,   // saw ">>>", waiting for the block to close
        CLOSED      // a block just closed
    };
    
    StreamScanner();
    
    // Returns prose that can be shown now
    std::string feed(const std::string& fragment);
    
    // End of stream: releases anything held back
    std::string finish();
    
    State state() const { return state_; }
    size_t blocks_closed() const { return blocks_closed_; }
    const std::string& text() const { return text_; }

private:
    State state_;
    std::string text_;      // everything received
    std::string pending_;   // held back: a partial marker or an open block
    size_t blocks_closed_;
    
    std::string drain(bool at_end);
};

} // namespace vibecli

#endif // vibecli_CORE_COMMAND_PARSER_HPP
