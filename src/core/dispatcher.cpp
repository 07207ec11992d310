#include <vibecli/core/dispatcher.hpp>
#include <vibecli/core/diff.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/safety_gate.hpp>
#include <vibecli/core/scaffold_templates.hpp>
#include <vibecli/core/utils.hpp>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace vibecli {

namespace {

std::string preview(const std::string& text, size_t max_len) {
    if (max_len == 0 || text.size() <= max_len) {
        return text;
    }
    return truncate_safe(text, max_len) + "\n... (" +
           std::to_string(text.size() - max_len) + " more characters)";
}

std::string backup_note(const Workspace& workspace, const BackupRecord& record) {
    return " (backup: " + workspace.relative_to_root(record.backup_path) + ")";
}

// Is ancestor the same path as, or a parent of, path?
bool is_within(const std::string& path, const std::string& ancestor) {
    if (path == ancestor) return true;
    if (ancestor == "/") return true;
    return starts_with(path, ancestor + "/");
}

} // namespace

// ============================================================================
// Result formatting
// ============================================================================

std::string format_action_result(const ActionReport& report, size_t max_chars) {
    std::string body = report.result.message;
    if (report.result.has_detail) {
        body += "\n" + report.result.detail;
    }
    if (max_chars > 0 && body.size() > max_chars) {
        size_t dropped = body.size() - max_chars;
        body = truncate_safe(body, max_chars) +
               "\n... [result truncated: " + std::to_string(dropped) + " more characters]";
    }
    
    std::ostringstream out;
    out << "[ACTION_RESULT verb=" << verb_name(report.verb)
        << " success=" << (report.result.success ? "true" : "false") << "]\n"
        << body << "\n"
        << "[/ACTION_RESULT]";
    return out.str();
}

// ============================================================================
// Dispatcher
// ============================================================================

Dispatcher::Dispatcher(const Workspace& workspace,
                       BackupStore& backups,
                       Prompter& prompter,
                       CommandRunner& runner,
                       const PlatformTranslator& translator,
                       const RepoContextBuilder& context,
                       ContextRefresher& refresher,
                       const DispatcherConfig& config)
    : workspace_(workspace)
    , backups_(backups)
    , prompter_(prompter)
    , runner_(runner)
    , translator_(translator)
    , context_(context)
    , refresher_(refresher)
    , config_(config)
{}

std::string Dispatcher::display_path(const std::string& abs_path) const {
    return workspace_.relative_to_root(abs_path);
}

std::vector<ActionReport> Dispatcher::dispatch(const CommandBlock& block, SessionState& state) {
    std::vector<ActionReport> reports;
    const std::string& arg = block.argument_line;
    LOG_INFO("Action %s %s", verb_name(block.verb), arg.c_str());
    
    ActionResult result;
    try {
        switch (block.verb) {
            case Verb::READ:      result = handle_read(arg, state); break;
            case Verb::TREE:      result = handle_tree(state); break;
            case Verb::LISTFILES: result = handle_listfiles(state); break;
            case Verb::WRITE:     result = handle_write(arg, block.body, state); break;
            case Verb::CD:        result = handle_cd(arg, state); break;
            case Verb::DELETE:    result = handle_delete(arg, state); break;
            case Verb::RUN:       result = handle_run(arg, state, &reports); break;
            case Verb::INSTALL:   result = handle_install(arg, state); break;
            case Verb::SHADCN:    result = handle_shadcn(arg, state); break;
            case Verb::REFRESH:   result = handle_refresh(state); break;
            case Verb::CREATE:
                return handle_create(arg, state);
        }
    } catch (const OperatorInterrupt&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("%s failed: %s", verb_name(block.verb), e.what());
        result = ActionResult::fail(std::string(verb_name(block.verb)) + " error: " + e.what());
    }
    
    // A RUN that was really a "cd" reports as CD
    if (!reports.empty()) {
        return reports;
    }
    reports.push_back(ActionReport(block.verb, arg, result));
    return reports;
}

// ============================================================================
// READ / TREE / LISTFILES / REFRESH
// ============================================================================

ActionResult Dispatcher::handle_read(const std::string& target, SessionState& state) {
    std::string path = workspace_.resolve(state.current_working_directory, target);
    if (!workspace_.contains(path)) {
        LOG_WARN("READ outside project root refused: %s", target.c_str());
        return ActionResult::fail("Access denied: " + target + " is outside the project root");
    }
    if (!path_exists(path)) {
        return ActionResult::fail("Path " + target + " does not exist");
    }
    
    prompter_.say("[READ] " + display_path(path));
    
    if (is_directory(path)) {
        return ActionResult::ok("Scraped contents of directory " + display_path(path),
                                context_.scrape_contents(path));
    }
    
    std::string content;
    if (!read_file(path, content)) {
        return ActionResult::fail("Cannot read " + target);
    }
    if (looks_binary(content)) {
        return ActionResult::fail(target + " is a binary file (" + std::to_string(content.size()) + " bytes)");
    }
    return ActionResult::ok("Content of " + display_path(path) + ":", content);
}

ActionResult Dispatcher::handle_tree(SessionState& state) {
    std::string tree = context_.render_tree(state.current_working_directory);
    prompter_.say(tree);
    return ActionResult::ok("Directory tree of " + display_path(state.current_working_directory) + ":", tree);
}

ActionResult Dispatcher::handle_listfiles(SessionState& state) {
    std::vector<std::string> names;
    if (!context_.list_directory(state.current_working_directory, names)) {
        return ActionResult::fail("Cannot list " + display_path(state.current_working_directory));
    }
    std::string listing = names.empty() ? "(Empty Directory)" : join(names, "\n");
    prompter_.say(listing);
    return ActionResult::ok("Files in " + display_path(state.current_working_directory) + ":", listing);
}

ActionResult Dispatcher::handle_refresh(SessionState& state) {
    prompter_.say("Refreshing project context...");
    std::string tree = refresher_.refresh_context(state);
    return ActionResult::ok("Context refreshed.", "Current Structure:\n" + tree);
}

// ============================================================================
// WRITE / DELETE
// ============================================================================

ActionResult Dispatcher::handle_write(const std::string& target, const std::string& content,
                                      SessionState& state) {
    std::string path = workspace_.resolve(state.current_working_directory, target);
    if (!workspace_.contains(path)) {
        LOG_WARN("WRITE outside project root refused: %s", target.c_str());
        return ActionResult::fail("Access denied: " + target + " is outside the project root");
    }
    if (is_within(backups_.directory(), path) || is_within(path, backups_.directory())) {
        return ActionResult::fail("Refusing to write into the backup directory: " + target);
    }
    
    bool exists = path_exists(path);
    if (exists && is_directory(path)) {
        return ActionResult::fail(target + " is a directory");
    }
    
    std::string rel = display_path(path);
    if (exists) {
        std::string old_content;
        if (!read_file(path, old_content)) {
            return ActionResult::fail("Cannot read existing file " + target);
        }
        if (old_content == content) {
            return ActionResult::ok("File " + rel + " is already up to date");
        }
        std::string diff = unified_diff(old_content, content, rel, config_.color);
        prompter_.say(diff.empty() ? "[WRITE] " + rel + ": only the trailing newline changes" : diff);
    } else {
        prompter_.say("[WRITE] new file " + rel + " (" + std::to_string(split_lines(content).size()) + " lines)");
    }
    
    if (!SafetyGate::confirm_action(prompter_, "Apply changes to " + rel + "?")) {
        LOG_INFO("WRITE %s declined", rel.c_str());
        return ActionResult::refused("User declined writing " + rel);
    }
    
    std::string note;
    if (exists) {
        BackupRecord record;
        std::string error;
        if (!backups_.backup_file(path, record, error)) {
            LOG_ERROR("Backup of %s failed: %s", rel.c_str(), error.c_str());
            return ActionResult::fail("Backup failed, " + rel + " left untouched: " + error);
        }
        note = backup_note(workspace_, record);
    }
    
    if (!create_parent_directory(path)) {
        return ActionResult::fail("Cannot create parent directory for " + rel);
    }
    if (!write_file(path, content)) {
        return ActionResult::fail("Cannot write " + rel);
    }
    
    LOG_INFO("Wrote %s (%zu bytes)", rel.c_str(), content.size());
    return ActionResult::ok("File " + rel + (exists ? " updated successfully" : " created successfully") + note);
}

ActionResult Dispatcher::handle_delete(const std::string& target, SessionState& state) {
    std::string path = workspace_.resolve(state.current_working_directory, target);
    if (!workspace_.contains(path)) {
        LOG_WARN("DELETE outside project root refused: %s", target.c_str());
        return ActionResult::fail("Access denied: " + target + " is outside the project root");
    }
    if (path == workspace_.root()) {
        return ActionResult::fail("Refusing to delete the project root");
    }
    if (is_within(backups_.directory(), path)) {
        return ActionResult::fail("Refusing to delete " + target + ": it holds the backup directory");
    }
    if (!path_exists(path)) {
        return ActionResult::fail("Path " + target + " does not exist");
    }
    
    std::string rel = display_path(path);
    bool dir = is_directory(path);
    if (dir) {
        prompter_.warn("Directory " + rel + " contains " + std::to_string(Workspace::count_files(path)) + " files");
    }
    if (!SafetyGate::confirm_action(prompter_, std::string("Delete this ") + (dir ? "directory" : "file") + " (" + rel + ")?")) {
        LOG_INFO("DELETE %s declined", rel.c_str());
        return ActionResult::refused("User declined deleting " + rel);
    }
    
    BackupRecord record;
    std::string error;
    bool backed_up = dir ? backups_.backup_directory(path, record, error)
                         : backups_.backup_file(path, record, error);
    if (!backed_up) {
        LOG_ERROR("Backup of %s failed: %s", rel.c_str(), error.c_str());
        return ActionResult::fail("Backup failed, " + rel + " left untouched: " + error);
    }
    
    if (!Workspace::remove_tree(path, error)) {
        return ActionResult::fail("Cannot delete " + rel + ": " + error);
    }
    LOG_INFO("Deleted %s", rel.c_str());
    
    std::string message = "Deleted " + rel + backup_note(workspace_, record);
    if (is_within(state.current_working_directory, path)) {
        state.current_working_directory = workspace_.root();
        message += ". Working directory reset to the project root";
    }
    return ActionResult::ok(message);
}

// ============================================================================
// CD
// ============================================================================

ActionResult Dispatcher::enter_directory(const std::string& abs_path, const std::string& label,
                                         SessionState& state) {
    if (!workspace_.contains(abs_path)) {
        LOG_WARN("CD outside project root refused: %s", label.c_str());
        return ActionResult::fail("Access denied: " + label + " is outside the project root");
    }
    if (!path_exists(abs_path)) {
        return ActionResult::fail("Directory '" + label + "' does not exist.");
    }
    if (!is_directory(abs_path)) {
        return ActionResult::fail("'" + label + "' is not a directory.");
    }
    
    state.current_working_directory = abs_path;
    prompter_.say("Current directory: " + display_path(abs_path));
    std::string tree = refresher_.refresh_context(state);
    return ActionResult::ok("Changed directory to " + display_path(abs_path), "Current Structure:\n" + tree);
}

ActionResult Dispatcher::handle_cd(const std::string& target, SessionState& state) {
    return enter_directory(workspace_.resolve(state.current_working_directory, target), target, state);
}

// ============================================================================
// RUN / INSTALL / SHADCN / CREATE
// ============================================================================

ActionResult Dispatcher::handle_run(const std::string& command, SessionState& state,
                                    std::vector<ActionReport>* chained) {
    std::string cd_target;
    if (parse_directory_change(command, cd_target)) {
        ActionResult r = cd_target.empty()
            ? enter_directory(workspace_.root(), ".", state)
            : handle_cd(cd_target, state);
        if (chained) {
            chained->push_back(ActionReport(Verb::CD, cd_target, r));
        }
        return r;
    }
    
    Translation t = translator_.prepare(command);
    for (size_t i = 0; i < t.warnings.size(); ++i) {
        prompter_.warn(t.warnings[i]);
    }
    const std::string& cmd = t.command;
    if (t.changed(command)) {
        LOG_INFO("Command rewritten: %s -> %s", command.c_str(), cmd.c_str());
    }
    
    if (SafetyGate::is_dangerous(cmd)) {
        if (!SafetyGate::confirm_elevated(prompter_, cmd)) {
            return ActionResult::refused("Blocked dangerous command: " + cmd);
        }
        if (!SafetyGate::confirm_action(prompter_, "Really execute '" + cmd + "'?")) {
            return ActionResult::refused("User denied command execution: " + cmd);
        }
        return execute(cmd, config_.run_timeout_seconds, state);
    }
    
    if (is_server_command(cmd)) {
        prompter_.warn("'" + cmd + "' looks like a long-running server.");
        if (config_.allow_detached) {
            std::string answer = to_lower(trim(prompter_.ask(">> Launch it in the background? (Y/n): ")));
            if (answer.empty() || answer == "y" || answer == "yes") {
                std::string log_path = join_path(join_path(workspace_.root(), config_.log_dir),
                    "server_" + format_local_time(current_timestamp_ms(), "%Y%m%d_%H%M%S") + ".log");
                if (!create_parent_directory(log_path)) {
                    return ActionResult::fail("Cannot create log directory " + config_.log_dir);
                }
                RunOutcome launched = runner_.launch_detached(cmd, state.current_working_directory, log_path);
                if (!launched.started) {
                    return ActionResult::fail("Failed to launch '" + cmd + "': " + launched.error);
                }
                prompter_.say("Started in background (pid " + std::to_string(launched.pid) + "), output in " +
                              display_path(log_path));
                return ActionResult::ok("Launched '" + cmd + "' in the background (pid " +
                                        std::to_string(launched.pid) + "). Output: " + display_path(log_path));
            }
        }
        prompter_.warn("vibecli will wait until the command exits or you press Ctrl+C.");
        std::string answer = to_lower(trim(prompter_.ask(">> Run here anyway? (y/N): ")));
        if (answer != "y" && answer != "yes") {
            return ActionResult::refused("Skipped '" + cmd + "' to avoid blocking. The user will run it manually.");
        }
        return execute(cmd, 0, state);
    }
    
    if (!SafetyGate::confirm_action(prompter_, "Execute '" + cmd + "'?")) {
        return ActionResult::refused("User denied command execution: " + cmd);
    }
    return execute(cmd, config_.run_timeout_seconds, state);
}

ActionResult Dispatcher::execute(const std::string& command, int timeout_seconds, SessionState& state) {
    RunRequest request;
    request.command = command;
    request.cwd = state.current_working_directory;
    request.timeout_seconds = timeout_seconds;
    request.auto_answer = config_.auto_answer;
    
    prompter_.say("Running: " + command);
    RunOutcome outcome = runner_.run(request);
    
    if (!outcome.started) {
        return ActionResult::fail("Failed to start '" + command + "': " + outcome.error);
    }
    
    if (!outcome.stdout_text.empty()) {
        prompter_.say(preview(outcome.stdout_text, config_.max_display_output));
    }
    if (!outcome.stderr_text.empty()) {
        prompter_.warn(preview(outcome.stderr_text, config_.max_display_output));
    }
    
    std::string detail = "Code: " + std::to_string(outcome.exit_code) +
                         "\nOut: " + outcome.stdout_text +
                         "\nErr: " + outcome.stderr_text;
    
    if (outcome.interrupted) {
        return ActionResult::fail("User stopped the command (Ctrl+C): " + command, detail);
    }
    if (outcome.timed_out) {
        return ActionResult::fail("Command timed out after " + std::to_string(timeout_seconds) +
                                  " seconds: " + command, detail);
    }
    if (outcome.exit_code != 0) {
        return ActionResult::fail("Command exited with code " + std::to_string(outcome.exit_code) +
                                  ": " + command, detail);
    }
    return ActionResult::ok("Command succeeded: " + command, detail);
}

ActionResult Dispatcher::handle_install(const std::string& arguments, SessionState& state) {
    std::vector<std::string> words = split_whitespace(arguments);
    PackageManager named;
    if (!words.empty() && parse_package_manager(words[0], named)) {
        if (named != state.package_manager) {
            prompter_.warn(std::string("Project uses ") + package_manager_name(state.package_manager) +
                           ", installing with it instead of " + words[0]);
        }
        words.erase(words.begin());
    }
    if (words.empty()) {
        return ActionResult::fail("INSTALL needs at least one package name");
    }
    return handle_run(install_command(state.package_manager, join(words, " ")), state);
}

ActionResult Dispatcher::handle_shadcn(const std::string& component, SessionState& state) {
    std::string name = trim(component);
    if (name.empty()) {
        return ActionResult::fail("SHADCN needs a component name");
    }
    return handle_run("npx shadcn@latest add " + name + " -y", state);
}

std::vector<ActionReport> Dispatcher::handle_create(const std::string& arguments, SessionState& state) {
    std::vector<ActionReport> reports;
    ArgumentSplit args = split_arguments(arguments, 2);
    if (args.tokens.size() < 2) {
        reports.push_back(ActionReport(Verb::CREATE, arguments,
            ActionResult::fail("CREATE needs a framework and a project name")));
        return reports;
    }
    const std::string& framework = args.tokens[0];
    const std::string& name = args.tokens[1];
    
    std::string project_dir = workspace_.resolve(state.current_working_directory, name);
    if (!workspace_.contains(project_dir)) {
        reports.push_back(ActionReport(Verb::CREATE, arguments,
            ActionResult::fail("Access denied: " + name + " is outside the project root")));
        return reports;
    }
    
    ScaffoldCommand scaffold = scaffold_command(framework, name, args.rest);
    if (scaffold.command.empty()) {
        reports.push_back(ActionReport(Verb::CREATE, arguments,
            ActionResult::fail("Unknown framework '" + framework + "'")));
        return reports;
    }
    if (scaffold.fuzzy) {
        prompter_.warn("Using the '" + scaffold.matched_key + "' template for '" + framework + "'");
    } else if (scaffold.matched_key.empty()) {
        prompter_.warn("No template for '" + framework + "', trying the generic npm create form");
    }
    
    bool existed = is_directory(project_dir);
    ActionResult created;
    try {
        created = handle_run(scaffold.command, state);
    } catch (const OperatorInterrupt&) {
        throw;
    } catch (const std::exception& e) {
        created = ActionResult::fail(std::string("CREATE error: ") + e.what());
    }
    reports.push_back(ActionReport(Verb::CREATE, arguments, created));
    
    if (is_directory(project_dir) && (created.success || !existed)) {
        prompter_.say("Entering new project directory " + display_path(project_dir));
        reports.push_back(ActionReport(Verb::CD, name, enter_directory(project_dir, name, state)));
    }
    return reports;
}

} // namespace vibecli
