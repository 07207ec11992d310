#include <vibecli/core/session.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <cctype>

namespace vibecli {

namespace {

const size_t BULKY_ENTRY_CHARS = 4000;
const size_t COMPACTED_KEEP_CHARS = 2000;

const char* INTENT_PROMPT_HEAD = "ANALYZE THE FOLLOWING REQUEST: '";
const char* INTENT_PROMPT_TAIL =
    "'\n"
    "CLASSIFY IT INTO ONE OF THESE CATEGORIES: "
    "[TREE, LISTFILES, CD, READ, WRITE, CREATE, INSTALL, RUN, SHADCN, DELETE, REFRESH, CHAT]\n"
    "RULES:\n"
    "1. If it requires file system access, return ONLY the category name.\n"
    "2. If it is a general question or conversation, return 'CHAT'.\n"
    "3. DO NOT output any other text.\n"
    "RESPONSE:";

} // namespace

const char* Session::CONTEXT_MARKER = "HERE IS THE CURRENT REPO CONTEXT";
const char* Session::TRUNCATION_MARKER = "[truncated to fit context window]";

Session::Session(const Workspace& workspace,
                 AIPlugin& ai,
                 Prompter& prompter,
                 CommandRunner& runner,
                 const SessionConfig& config)
    : workspace_(workspace)
    , ai_(ai)
    , prompter_(prompter)
    , config_(config)
    , context_(workspace.root(), IgnorePolicy::for_root(workspace.root(), config.use_gitignore), config.limits)
    , backups_(workspace, config.backup_dir)
    , translator_(host_platform())
{
    state_.root_directory = workspace.root();
    state_.current_working_directory = workspace.root();
    state_.package_manager = detect_package_manager(workspace.root());
    dispatcher_.reset(new Dispatcher(workspace_, backups_, prompter_, runner, translator_,
                                     context_, *this, config_.dispatcher));
}

void Session::start() {
    state_.message_history.clear();
    if (!config_.system_prompt.empty()) {
        state_.message_history.push_back(ConversationMessage::system(config_.system_prompt));
    }
    LOG_INFO("Session root %s, package manager %s", state_.root_directory.c_str(),
             package_manager_name(state_.package_manager));
    
    if (config_.load_context) {
        prompter_.say("Scanning project...");
        refresh_context(state_);
    } else {
        LOG_INFO("Initial context scan skipped");
    }
}

// ============================================================================
// Context entry
// ============================================================================

int Session::find_context_entry() const {
    const std::vector<ConversationMessage>& h = state_.message_history;
    for (size_t i = 0; i < h.size(); ++i) {
        if (h[i].role == MessageRole::SYSTEM && starts_with(h[i].content, CONTEXT_MARKER)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string Session::refresh_context(SessionState& state) {
    const std::string& dir = state.current_working_directory;
    std::string content = std::string(CONTEXT_MARKER) + " (Updated " +
                          format_local_time(current_timestamp_ms(), "%H:%M:%S") + "):\n\n" +
                          context_.build(dir);
    
    std::vector<ConversationMessage>& h = state.message_history;
    bool replaced = false;
    for (size_t i = 0; i < h.size(); ++i) {
        if (h[i].role == MessageRole::SYSTEM && starts_with(h[i].content, CONTEXT_MARKER)) {
            h[i].content = content;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        size_t at = (!h.empty() && h[0].role == MessageRole::SYSTEM) ? 1 : 0;
        h.insert(h.begin() + at, ConversationMessage::system(content));
    }
    
    LOG_INFO("Context %s for %s (%zu chars)", replaced ? "refreshed" : "loaded",
             workspace_.relative_to_root(dir).c_str(), content.size());
    return context_.render_tree(dir);
}

// ============================================================================
// History maintenance
// ============================================================================

size_t Session::leading_entries() const {
    const std::vector<ConversationMessage>& h = state_.message_history;
    size_t n = 0;
    while (n < h.size() && h[n].role == MessageRole::SYSTEM) {
        ++n;
    }
    return n;
}

void Session::prune_history() {
    std::vector<ConversationMessage>& h = state_.message_history;
    size_t lead = leading_entries();
    int ctx = find_context_entry();
    size_t keep = (config_.max_history_turns > 0 ? config_.max_history_turns : 1) * 2;
    
    std::vector<ConversationMessage> rest;
    for (size_t i = lead; i < h.size(); ++i) {
        if (static_cast<int>(i) != ctx) {
            rest.push_back(h[i]);
        }
    }
    if (rest.size() <= keep) {
        return;
    }
    
    std::vector<ConversationMessage> pruned(h.begin(), h.begin() + lead);
    if (ctx >= static_cast<int>(lead)) {
        pruned.push_back(h[ctx]);
    }
    pruned.insert(pruned.end(), rest.end() - keep, rest.end());
    
    LOG_DEBUG("Pruned history from %zu to %zu messages", h.size(), pruned.size());
    h.swap(pruned);
}

bool Session::compact_history() {
    std::vector<ConversationMessage>& h = state_.message_history;
    size_t lead = leading_entries();
    int ctx = find_context_entry();
    bool changed = false;
    
    // Oldest first; the newest message is what the backend must answer
    for (size_t i = lead; i + 1 < h.size(); ++i) {
        if (estimate_message_chars(h) <= config_.max_history_chars && changed) {
            break;
        }
        if (static_cast<int>(i) == ctx || h[i].content.size() <= BULKY_ENTRY_CHARS) {
            continue;
        }
        size_t original = h[i].content.size();
        h[i].content = truncate_safe(h[i].content, COMPACTED_KEEP_CHARS) + "\n" +
                       TRUNCATION_MARKER + " (" + std::to_string(original) + " characters)";
        changed = true;
    }
    
    if (changed) {
        LOG_INFO("Compacted history to %zu chars", estimate_message_chars(h));
    }
    return changed;
}

void Session::clear_conversation() {
    std::vector<ConversationMessage>& h = state_.message_history;
    size_t lead = leading_entries();
    int ctx = find_context_entry();
    std::vector<ConversationMessage> kept(h.begin(), h.begin() + lead);
    if (ctx >= static_cast<int>(lead)) {
        kept.push_back(h[ctx]);
    }
    h.swap(kept);
}

// ============================================================================
// Turn
// ============================================================================

std::string Session::classify_intent(const std::string& instruction) {
    CompletionOptions opts;
    opts.model = config_.intent_model;
    opts.max_tokens = 10;
    opts.temperature = 0.1;
    
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::user(INTENT_PROMPT_HEAD + instruction + INTENT_PROMPT_TAIL));
    
    CompletionResult r = ai_.chat(messages, opts);
    if (!r.success) {
        LOG_WARN("Intent classification failed: %s", r.error.c_str());
        return "";
    }
    
    std::string cleaned = r.content;
    for (size_t i = 0; i < cleaned.size(); ++i) {
        if (!isalpha(static_cast<unsigned char>(cleaned[i]))) {
            cleaned[i] = ' ';
        }
    }
    std::vector<std::string> words = split_whitespace(to_upper(cleaned));
    Verb verb;
    if (words.empty() || !parse_verb(words[0], verb)) {
        LOG_DEBUG("Intent: %s", words.empty() ? "(none)" : words[0].c_str());
        return "";
    }
    LOG_DEBUG("Intent: %s", verb_name(verb));
    return verb_name(verb);
}

CompletionResult Session::request_completion() {
    const CompletionOptions& opts = config_.completion;
    
    if (!config_.stream) {
        CompletionResult r = ai_.chat(state_.message_history, opts);
        if (r.success) {
            std::string prose = trim(parse_commands(r.content).residual);
            if (!prose.empty()) {
                prompter_.say(prose);
            }
        }
        return r;
    }
    
    StreamScanner scanner;
    CompletionResult r = ai_.chat_stream(state_.message_history, opts,
        [this, &scanner](const std::string& fragment) {
            std::string visible = scanner.feed(fragment);
            if (!visible.empty()) {
                prompter_.stream(visible);
            }
        });
    std::string tail = scanner.finish();
    if (!tail.empty()) {
        prompter_.stream(tail);
    }
    prompter_.stream("\n");
    return r;
}

std::vector<ActionReport> Session::execute_response(const std::string& response, bool& interrupted) {
    std::vector<ActionReport> reports;
    interrupted = false;
    
    ParseResult parsed = parse_commands(response);
    LOG_DEBUG("Response carries %zu action blocks", parsed.blocks.size());
    
    for (size_t i = 0; i < parsed.blocks.size(); ++i) {
        const CommandBlock& block = parsed.blocks[i];
        try {
            std::vector<ActionReport> r = dispatcher_->dispatch(block, state_);
            reports.insert(reports.end(), r.begin(), r.end());
        } catch (const OperatorInterrupt& e) {
            LOG_INFO("%s interrupted: %s", verb_name(block.verb), e.what());
            reports.push_back(ActionReport(block.verb, block.argument_line,
                                           ActionResult::fail("Interrupted by operator")));
            interrupted = true;
        }
        if (interrupted || interrupt_requested()) {
            interrupted = true;
            if (i + 1 < parsed.blocks.size()) {
                LOG_INFO("Skipping %zu remaining actions", parsed.blocks.size() - i - 1);
            }
            break;
        }
    }
    return reports;
}

TurnOutcome Session::run_turn(const std::string& instruction) {
    TurnOutcome outcome;
    
    try {
        std::string content = instruction;
        if (config_.classify_intent) {
            std::string intent = classify_intent(instruction);
            if (!intent.empty()) {
                content = "ACTION REQUIRED: " + intent + ". User Request: " + instruction;
            }
        }
        state_.message_history.push_back(ConversationMessage::user(content));
        prune_history();
        
        for (int followup = 0; ; ++followup) {
            while (estimate_message_chars(state_.message_history) > config_.max_history_chars &&
                   compact_history()) {
            }
            
            CompletionResult r = request_completion();
            outcome.completions++;
            if (!r.success && is_context_limit_error(r.error) && compact_history()) {
                LOG_WARN("Context window exceeded, retrying with compacted history");
                r = request_completion();
                outcome.completions++;
            }
            
            if (!r.success) {
                outcome.backend_ok = false;
                outcome.error = r.error;
                if (r.error == "interrupted" || interrupt_requested()) {
                    clear_interrupt();
                    outcome.interrupted = true;
                    prompter_.warn("Request cancelled.");
                } else {
                    LOG_ERROR("Backend request failed: %s", r.error.c_str());
                    prompter_.warn("Backend error: " + r.error);
                }
                break;
            }
            
            state_.message_history.push_back(ConversationMessage::assistant(r.content));
            
            bool interrupted = false;
            std::vector<ActionReport> reports = execute_response(r.content, interrupted);
            if (reports.empty()) {
                break;
            }
            
            std::vector<std::string> blocks;
            for (size_t i = 0; i < reports.size(); ++i) {
                blocks.push_back(format_action_result(reports[i], config_.max_result_chars));
            }
            state_.message_history.push_back(ConversationMessage::user(join(blocks, "\n\n")));
            outcome.actions += reports.size();
            
            if (interrupted) {
                clear_interrupt();
                outcome.interrupted = true;
                prompter_.warn("Stopped. Results so far were recorded.");
                break;
            }
            if (followup >= config_.max_followup_turns) {
                LOG_DEBUG("Follow-up budget of %d used", config_.max_followup_turns);
                break;
            }
            prompter_.say("Getting follow-up...");
            prune_history();
        }
    } catch (const OperatorInterrupt& e) {
        // Interrupted at the intent prompt or while streaming
        clear_interrupt();
        outcome.interrupted = true;
        LOG_INFO("Turn interrupted: %s", e.what());
    }
    
    prune_history();
    return outcome;
}

} // namespace vibecli
