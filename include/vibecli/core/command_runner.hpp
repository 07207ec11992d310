/*
 * vibecli C++17 - Command runner
 *
 * Runs shell commands for RUN/INSTALL/CREATE/SHADCN. The interface lets
 * tests substitute a recorder for the real subprocess.
 */
#ifndef vibecli_CORE_COMMAND_RUNNER_HPP
#define vibecli_CORE_COMMAND_RUNNER_HPP

#include <string>

namespace vibecli {

struct RunRequest {
    std::string command;
    std::string cwd;
    int timeout_seconds;    // 0 = wait until the process exits or Ctrl+C
    bool auto_answer;       // feed "y\n" on stdin
    size_t max_output;      // per stream
    
    RunRequest() : timeout_seconds(300), auto_answer(true), max_output(100000) {}
};

struct RunOutcome {
    bool started;
    int exit_code;          // 128 + signal when killed by a signal
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out;
    bool interrupted;
    int pid;
    std::string error;      // why the process could not be started
    
    RunOutcome() : started(false), exit_code(-1), timed_out(false), interrupted(false), pid(0) {}
    
    bool succeeded() const { return started && !timed_out && !interrupted && exit_code == 0; }
    
    static RunOutcome fail(const std::string& err) {
        RunOutcome o;
        o.error = err;
        return o;
    }
};

class CommandRunner {
public:
    virtual ~CommandRunner() {}
    
    virtual RunOutcome run(const RunRequest& request) = 0;
    
    // Starts command in its own session and returns at once. Output is
    // appended to log_path.
    virtual RunOutcome launch_detached(const std::string& command,
                                       const std::string& cwd,
                                       const std::string& log_path) = 0;
};

class PosixCommandRunner : public CommandRunner {
public:
    PosixCommandRunner();
    
    RunOutcome run(const RunRequest& request) override;
    RunOutcome launch_detached(const std::string& command,
                               const std::string& cwd,
                               const std::string& log_path) override;
    
    void set_kill_grace_ms(int ms) { kill_grace_ms_ = ms; }

private:
    int kill_grace_ms_;
    
    void terminate_group(int pid, int& status);
};

} // namespace vibecli

#endif // vibecli_CORE_COMMAND_RUNNER_HPP
