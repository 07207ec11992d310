/*
 * vibecli C++17 - Application Implementation
 */
#include <vibecli/core/application.hpp>
#include <vibecli/core/interrupt.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/scaffold_templates.hpp>
#include <vibecli/core/utils.hpp>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <curl/curl.h>

namespace vibecli {

// ============================================================================
// AppInfo Implementation
// ============================================================================

const char* AppInfo::NAME = "vibecli";
const char* AppInfo::VERSION = "0.3.0";

std::string AppInfo::default_system_prompt(Platform platform) {
    std::string p;
    p += "You are VibeCLI, a coding agent running in the user's LOCAL project directory.\n";
    p += "You may create, edit, run and delete files. You act only by emitting command blocks;\n";
    p += "the user approves each one and the results come back to you as ACTION_RESULT blocks.\n\n";
    p += "PLATFORM: ";
    p += platform_name(platform);
    p += "\n\n";
    p += "PROTOCOL (one block per action, exactly as shown):\n\n";
    p += ">>> WRITE path/to/file\n<full file content>\n<<<\n\n";
    p += ">>> READ path/to/file_or_directory <<<   (a directory returns every file in it)\n";
    p += ">>> DELETE path <<<\n";
    p += ">>> CD path <<<\n";
    p += ">>> RUN shell command <<<\n";
    p += ">>> INSTALL manager package [more packages] <<<\n";
    p += ">>> CREATE framework project-name [options] <<<\n";
    p += ">>> SHADCN component <<<\n";
    p += ">>> TREE <<<\n";
    p += ">>> LISTFILES <<<\n";
    p += ">>> REFRESH <<<\n\n";
    p += "CREATE frameworks: " + join(scaffold_template_keys(), ", ") + "\n\n";
    p += "RULES:\n";
    p += "1. WRITE always carries the COMPLETE file, never a fragment or a diff.\n";
    p += "2. Paths are relative to the current directory and must stay inside the project.\n";
    p += "3. Long-running servers (npm run dev, etc.) block the session; suggest them, the user decides.\n";
    p += "4. Commands run non-interactively; pass flags that skip prompts.\n";
    p += "5. Read a file before changing it unless it is already in the context.\n";
    p += "6. Use REFRESH after creating or removing many files.\n";
    return p;
}

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - terminal coding agent\n\n"
              << "Usage: " << prog << " [options] [project_dir]\n\n"
              << "Options:\n"
              << "  --config <file>  Configuration file\n"
              << "  --no-context     Skip the initial project scan\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " " << AppInfo::VERSION << std::endl;
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : root_arg_(".")
    , skip_context_(false)
    , curl_ready_(false)
    , exit_code_(EXIT_OK)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--no-context") == 0) {
            skip_context_ = true;
            continue;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file name" << std::endl;
                exit_code_ = EXIT_FAILURE_GENERIC;
                return false;
            }
            config_file_ = argv[++i];
            continue;
        }
        if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            exit_code_ = EXIT_FAILURE_GENERIC;
            return false;
        }
        root_arg_ = argv[i];
    }
    return true;
}

bool Application::load_config() {
    std::vector<std::string> candidates;
    if (!config_file_.empty()) {
        candidates.push_back(config_file_);
    } else {
        candidates.push_back(join_path(workspace_.root(), ".vibe/config.json"));
        const char* home = getenv("HOME");
        if (home && home[0] != '\0') {
            candidates.push_back(join_path(home, ".vibecli/config.json"));
        }
    }
    
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!path_exists(candidates[i])) {
            continue;
        }
        if (config_.load_file(candidates[i])) {
            LOG_INFO("Loaded config from %s", candidates[i].c_str());
        }
        return true;
    }
    
    if (!config_file_.empty()) {
        LOG_ERROR("Config file %s not found", config_file_.c_str());
        return false;
    }
    LOG_DEBUG("No config file found, using defaults");
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
    if (!config_.get_bool("color", true)) {
        Logger::instance().set_color(false);
    }
    
    std::string log_file = config_.get_string("log_file", "");
    if (!log_file.empty()) {
        if (log_file[0] != '/') {
            log_file = join_path(workspace_.root(), log_file);
        }
        if (!Logger::instance().set_log_file(log_file)) {
            LOG_WARN("Cannot open log file %s", log_file.c_str());
        }
    }
}

bool Application::setup_workspace() {
    if (!workspace_.open(root_arg_)) {
        LOG_ERROR("Project directory %s is not accessible", root_arg_.c_str());
        std::cerr << "Error: cannot open project directory " << root_arg_ << std::endl;
        return false;
    }
    LOG_INFO("Project root: %s", workspace_.root().c_str());
    return true;
}

bool Application::setup_ai() {
    if (!ai_.init(config_)) {
        LOG_ERROR("No OpenRouter API key configured");
        std::cerr << "Error: OPENROUTER_API_KEY is not set (or openrouter.api_key in config.json)"
                  << std::endl;
        return false;
    }
    LOG_INFO("AI provider: %s (%s)", ai_.provider_id().c_str(), ai_.default_model().c_str());
    return true;
}

void Application::setup_session() {
    prompter_.reset(new ConsolePrompter(config_.get_bool("color", true)));
    
    SessionConfig sc;
    sc.system_prompt = AppInfo::default_system_prompt(host_platform());
    std::string extra = config_.get_string("agent.system_prompt", "");
    if (!extra.empty()) {
        sc.system_prompt += "\n" + extra;
    }
    sc.load_context = !skip_context_;
    sc.max_history_turns = static_cast<size_t>(config_.get_int("agent.max_history_turns", 15));
    sc.max_followup_turns = static_cast<int>(config_.get_int("agent.max_followup_turns", 1));
    sc.max_result_chars = static_cast<size_t>(config_.get_int("agent.max_result_chars", 60000));
    sc.classify_intent = config_.get_bool("agent.classify_intent", false);
    sc.intent_model = config_.get_string("agent.intent_model", "");
    sc.stream = ai_.streaming_enabled();
    sc.use_gitignore = config_.get_bool("context.use_gitignore", true);
    sc.limits.max_file_size = static_cast<size_t>(config_.get_int("context.max_file_size", 51200));
    sc.limits.max_context_chars = static_cast<size_t>(config_.get_int("context.max_context_chars", 400000));
    sc.max_history_chars = sc.limits.max_context_chars;
    sc.backup_dir = config_.get_string("backup.dir", ".vibe/backups");
    sc.dispatcher.run_timeout_seconds = static_cast<int>(config_.get_int("run.timeout", 300));
    sc.dispatcher.auto_answer = config_.get_bool("run.auto_answer", true);
    sc.dispatcher.allow_detached = config_.get_bool("run.allow_detached", true);
    sc.dispatcher.log_dir = config_.get_string("run.log_dir", ".vibe/logs");
    sc.dispatcher.color = prompter_->color();
    
    session_.reset(new Session(workspace_, ai_, *prompter_, runner_, sc));
    register_core_commands(commands_);
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }
    
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ready_ = true;
    
    install_interrupt_handler();
    signal(SIGPIPE, SIG_IGN);
    
    if (!setup_workspace()) {
        exit_code_ = EXIT_BAD_ROOT;
        return false;
    }
    if (!load_config()) {
        exit_code_ = EXIT_FAILURE_GENERIC;
        return false;
    }
    setup_logging();
    
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);
    
    if (!setup_ai()) {
        exit_code_ = EXIT_NO_CREDENTIALS;
        return false;
    }
    setup_session();
    return true;
}

std::string Application::prompt_text() const {
    std::string rel = workspace_.relative_to_root(session_->state().current_working_directory);
    return "\n[" + rel + "] You: ";
}

int Application::run() {
    prompter_->say(std::string(AppInfo::NAME) + " " + AppInfo::VERSION + " in " + workspace_.root());
    prompter_->say("Type /help for commands, exit to quit.");
    
    try {
        session_->start();
    } catch (const OperatorInterrupt&) {
        clear_interrupt();
        prompter_->warn("Initial scan interrupted.");
    }
    
    while (true) {
        std::string line;
        try {
            line = trim(prompter_->ask(prompt_text()));
        } catch (const OperatorInterrupt& e) {
            if (e.end_of_input()) {
                break;
            }
            clear_interrupt();
            prompter_->warn("(Type exit to quit)");
            continue;
        }
        if (line.empty()) {
            continue;
        }
        
        CommandReply reply;
        if (commands_.handle(line, *session_, reply)) {
            if (reply.quit) {
                break;
            }
            prompter_->say(reply.text);
            continue;
        }
        
        TurnOutcome outcome = session_->run_turn(line);
        LOG_DEBUG("Turn done: %d completions, %zu actions%s", outcome.completions, outcome.actions,
                  outcome.interrupted ? ", interrupted" : "");
    }
    
    prompter_->say("Bye.");
    return EXIT_OK;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    session_.reset();
    if (curl_ready_) {
        curl_global_cleanup();
        curl_ready_ = false;
    }
}

} // namespace vibecli
