/*
 * vibecli C++17 - Session
 *
 * Owns the conversation with the backend and the control loop for one
 * operator instruction:
 *
 *   instruction -> [intent hint] -> completion (streamed) -> parse blocks
 *     -> dispatch in priority order -> results appended as one message
 *     -> bounded follow-up completion
 *
 * History layout: leading system prompt, the repo context entry (found by
 * its marker text), then alternating turns. Pruning drops from the middle.
 */
#ifndef vibecli_CORE_SESSION_HPP
#define vibecli_CORE_SESSION_HPP

#include "backup_store.hpp"
#include "dispatcher.hpp"
#include "platform_translator.hpp"
#include "repo_context.hpp"
#include "session_state.hpp"
#include "workspace.hpp"
#include <vibecli/ai/ai.hpp>
#include <memory>
#include <string>
#include <vector>

namespace vibecli {

struct SessionConfig {
    std::string system_prompt;
    bool load_context;              // scan the project before the first turn
    size_t max_history_turns;       // instruction/response pairs kept
    int max_followup_turns;         // extra completions after action results
    size_t max_result_chars;        // per ACTION_RESULT block
    size_t max_history_chars;       // budget before bulky entries are shortened
    bool stream;
    bool classify_intent;
    std::string intent_model;       // empty = backend default
    bool use_gitignore;
    std::string backup_dir;
    CompletionOptions completion;
    ContextLimits limits;
    DispatcherConfig dispatcher;
    
    SessionConfig()
        : load_context(true)
        , max_history_turns(15)
        , max_followup_turns(1)
        , max_result_chars(60000)
        , max_history_chars(600000)
        , stream(true)
        , classify_intent(false)
        , use_gitignore(true)
        , backup_dir(".vibe/backups")
    {}
};

struct TurnOutcome {
    bool backend_ok;
    bool interrupted;
    int completions;            // backend calls made this turn
    size_t actions;             // ActionResults appended
    std::string error;
    
    TurnOutcome() : backend_ok(true), interrupted(false), completions(0), actions(0) {}
};

class Session : public ContextRefresher {
public:
    static const char* CONTEXT_MARKER;
    static const char* TRUNCATION_MARKER;
    
    Session(const Workspace& workspace,
            AIPlugin& ai,
            Prompter& prompter,
            CommandRunner& runner,
            const SessionConfig& config = SessionConfig());
    
    // Seeds history with the system prompt and, unless disabled, the
    // initial context entry.
    void start();
    
    TurnOutcome run_turn(const std::string& instruction);
    
    // Parses one response and dispatches its blocks. Stops at the first
    // operator interrupt, recording it as a failed result.
    std::vector<ActionReport> execute_response(const std::string& response, bool& interrupted);
    
    std::string refresh_context(SessionState& state) override;
    
    // Empty when the backend answered CHAT or something unrecognised
    std::string classify_intent(const std::string& instruction);
    
    void prune_history();
    bool compact_history();
    
    // Drops the conversation, keeps the system prompt and context entry
    void clear_conversation();
    
    // Index of the context entry, -1 when absent
    int find_context_entry() const;
    
    SessionState& state() { return state_; }
    const SessionState& state() const { return state_; }
    const SessionConfig& config() const { return config_; }
    const RepoContextBuilder& context_builder() const { return context_; }
    const BackupStore& backups() const { return backups_; }

private:
    const Workspace& workspace_;
    AIPlugin& ai_;
    Prompter& prompter_;
    SessionConfig config_;
    SessionState state_;
    RepoContextBuilder context_;
    BackupStore backups_;
    PlatformTranslator translator_;
    std::unique_ptr<Dispatcher> dispatcher_;
    
    CompletionResult request_completion();
    size_t leading_entries() const;
};

} // namespace vibecli

#endif // vibecli_CORE_SESSION_HPP
