/*
 * vibecli C++17 - Application
 *
 * Process singleton: parses arguments, loads configuration, wires the
 * backend, console, runner and session together, and runs the prompt loop.
 */
#ifndef vibecli_CORE_APPLICATION_HPP
#define vibecli_CORE_APPLICATION_HPP

#include "command_runner.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "platform_translator.hpp"
#include "prompter.hpp"
#include "session.hpp"
#include "workspace.hpp"
#include <vibecli/plugins/openrouter/openrouter.hpp>
#include <memory>
#include <string>

namespace vibecli {

struct AppInfo {
    static const char* NAME;
    static const char* VERSION;
    
    static std::string default_system_prompt(Platform platform);
};

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_GENERIC = 1,
    EXIT_BAD_ROOT = 2,
    EXIT_NO_CREDENTIALS = 3
};

class Application {
public:
    static Application& instance();
    
    // False when the process should exit right away; see exit_code()
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();
    
    int exit_code() const { return exit_code_; }
    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    
    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_workspace();
    bool setup_ai();
    void setup_session();
    std::string prompt_text() const;
    
    std::string root_arg_;
    std::string config_file_;
    bool skip_context_;
    bool curl_ready_;
    int exit_code_;
    
    Config config_;
    Workspace workspace_;
    OpenRouterAI ai_;
    PosixCommandRunner runner_;
    std::unique_ptr<ConsolePrompter> prompter_;
    std::unique_ptr<Session> session_;
    CommandTable commands_;
};

} // namespace vibecli

#endif // vibecli_CORE_APPLICATION_HPP
