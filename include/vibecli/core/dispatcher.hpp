/*
 * vibecli C++17 - Action dispatcher
 *
 * Maps each parsed CommandBlock to its effect. Every handler returns an
 * ActionResult; failures are data, never exceptions. Mutating verbs ask
 * the operator first, take a backup before overwriting or deleting, and
 * RUN goes through translation, danger classification and the server
 * guard before anything is spawned.
 *
 * Result block fed back to the backend:
 *   [ACTION_RESULT verb=WRITE success=true]
 *   File src/app.js written (120 bytes)
 *   [/ACTION_RESULT]
 */
#ifndef vibecli_CORE_DISPATCHER_HPP
#define vibecli_CORE_DISPATCHER_HPP

#include "backup_store.hpp"
#include "command_parser.hpp"
#include "command_runner.hpp"
#include "platform_translator.hpp"
#include "prompter.hpp"
#include "repo_context.hpp"
#include "session_state.hpp"
#include "workspace.hpp"
#include <string>
#include <vector>

namespace vibecli {

struct ActionResult {
    bool success;
    bool denied;            // operator said no; nothing was touched
    std::string message;
    bool has_detail;
    std::string detail;     // file contents, command output, trees
    
    ActionResult() : success(false), denied(false), has_detail(false) {}
    
    static ActionResult ok(const std::string& message) {
        ActionResult r;
        r.success = true;
        r.message = message;
        return r;
    }
    
    static ActionResult ok(const std::string& message, const std::string& detail) {
        ActionResult r = ok(message);
        r.has_detail = true;
        r.detail = detail;
        return r;
    }
    
    static ActionResult fail(const std::string& message) {
        ActionResult r;
        r.message = message;
        return r;
    }
    
    static ActionResult fail(const std::string& message, const std::string& detail) {
        ActionResult r = fail(message);
        r.has_detail = true;
        r.detail = detail;
        return r;
    }
    
    static ActionResult refused(const std::string& message) {
        ActionResult r = fail(message);
        r.denied = true;
        return r;
    }
};

struct ActionReport {
    Verb verb;
    std::string argument;
    ActionResult result;
    
    ActionReport() : verb(Verb::READ) {}
    ActionReport(Verb v, const std::string& a, const ActionResult& r)
        : verb(v), argument(a), result(r) {}
};

// max_chars = 0 disables truncation
std::string format_action_result(const ActionReport& report, size_t max_chars = 0);

struct DispatcherConfig {
    int run_timeout_seconds;
    bool auto_answer;
    bool allow_detached;        // offer background launch for servers
    bool color;
    size_t max_display_output;  // per stream, operator console only
    std::string log_dir;        // relative to root
    
    DispatcherConfig()
        : run_timeout_seconds(300)
        , auto_answer(true)
        , allow_detached(true)
        , color(true)
        , max_display_output(2000)
        , log_dir(".vibe/logs")
    {}
};

class Dispatcher {
public:
    Dispatcher(const Workspace& workspace,
               BackupStore& backups,
               Prompter& prompter,
               CommandRunner& runner,
               const PlatformTranslator& translator,
               const RepoContextBuilder& context,
               ContextRefresher& refresher,
               const DispatcherConfig& config = DispatcherConfig());
    
    // Executes one block. OperatorInterrupt from a prompt propagates;
    // any other exception becomes a failed result.
    std::vector<ActionReport> dispatch(const CommandBlock& block, SessionState& state);
    
    ActionResult handle_read(const std::string& target, SessionState& state);
    ActionResult handle_write(const std::string& target, const std::string& content, SessionState& state);
    ActionResult handle_delete(const std::string& target, SessionState& state);
    ActionResult handle_cd(const std::string& target, SessionState& state);
    ActionResult handle_run(const std::string& command, SessionState& state,
                            std::vector<ActionReport>* chained = nullptr);
    ActionResult handle_install(const std::string& arguments, SessionState& state);
    ActionResult handle_shadcn(const std::string& component, SessionState& state);
    ActionResult handle_tree(SessionState& state);
    ActionResult handle_listfiles(SessionState& state);
    ActionResult handle_refresh(SessionState& state);
    
    // CREATE may chain a CD into the new project
    std::vector<ActionReport> handle_create(const std::string& arguments, SessionState& state);
    
    const DispatcherConfig& config() const { return config_; }

private:
    const Workspace& workspace_;
    BackupStore& backups_;
    Prompter& prompter_;
    CommandRunner& runner_;
    const PlatformTranslator& translator_;
    const RepoContextBuilder& context_;
    ContextRefresher& refresher_;
    DispatcherConfig config_;
    
    ActionResult enter_directory(const std::string& abs_path, const std::string& label, SessionState& state);
    ActionResult execute(const std::string& command, int timeout_seconds, SessionState& state);
    std::string display_path(const std::string& abs_path) const;
};

} // namespace vibecli

#endif // vibecli_CORE_DISPATCHER_HPP
