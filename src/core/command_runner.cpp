#include <vibecli/core/command_runner.hpp>
#include <vibecli/core/interrupt.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vibecli {

namespace {

const int POLL_INTERVAL_MS = 100;
const char* TRUNCATED_MARK = "\n[output truncated]";

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Drains whatever is readable; returns false on EOF
bool read_available(int fd, std::string& buffer, size_t max_output, bool& truncated) {
    char chunk[4096];
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        size_t room = buffer.size() < max_output ? max_output - buffer.size() : 0;
        size_t take = std::min(room, static_cast<size_t>(n));
        buffer.append(chunk, take);
        if (take < static_cast<size_t>(n)) {
            truncated = true;
        }
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

PosixCommandRunner::PosixCommandRunner()
    : kill_grace_ms_(2000)
{}

void PosixCommandRunner::terminate_group(int pid, int& status) {
    kill(-pid, SIGTERM);
    
    int64_t give_up = current_timestamp_ms() + kill_grace_ms_;
    while (current_timestamp_ms() < give_up) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            kill(-pid, SIGKILL);    // stragglers in the group
            return;
        }
        usleep(50 * 1000);
    }
    
    kill(-pid, SIGKILL);
    waitpid(pid, &status, 0);
}

RunOutcome PosixCommandRunner::run(const RunRequest& request) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    
    if (pipe(in_pipe) < 0 || pipe(out_pipe) < 0 || pipe(err_pipe) < 0) {
        std::string err = std::string("pipe() failed: ") + strerror(errno);
        close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return RunOutcome::fail(err);
    }
    
    pid_t pid = fork();
    if (pid < 0) {
        std::string err = std::string("fork() failed: ") + strerror(errno);
        close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return RunOutcome::fail(err);
    }
    
    if (pid == 0) {
        // Child: own process group so a timeout can kill the whole tree
        setpgid(0, 0);
        signal(SIGINT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        
        if (!request.cwd.empty() && chdir(request.cwd.c_str()) != 0) {
            fprintf(stderr, "cannot enter %s: %s\n", request.cwd.c_str(), strerror(errno));
            _exit(127);
        }
        execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
        fprintf(stderr, "exec failed: %s\n", strerror(errno));
        _exit(127);
    }
    
    setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    
    LOG_DEBUG("Started pid %d: %s", static_cast<int>(pid), request.command.c_str());
    
    RunOutcome outcome;
    outcome.started = true;
    outcome.pid = static_cast<int>(pid);
    
    if (request.auto_answer) {
        // The child may exit without reading; EPIPE must not kill us
        struct sigaction ignore_pipe, previous;
        memset(&ignore_pipe, 0, sizeof(ignore_pipe));
        ignore_pipe.sa_handler = SIG_IGN;
        sigaction(SIGPIPE, &ignore_pipe, &previous);
        ssize_t written = write(in_pipe[1], "y\n", 2);
        if (written < 0) {
            LOG_DEBUG("stdin write failed: %s", strerror(errno));
        }
        sigaction(SIGPIPE, &previous, nullptr);
    }
    close_fd(in_pipe[1]);
    
    int64_t deadline = request.timeout_seconds > 0
        ? current_timestamp_ms() + static_cast<int64_t>(request.timeout_seconds) * 1000
        : 0;
    
    bool out_truncated = false;
    bool err_truncated = false;
    bool exited = false;
    int status = 0;
    
    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        if (interrupt_requested()) {
            outcome.interrupted = true;
            break;
        }
        if (deadline > 0 && current_timestamp_ms() >= deadline) {
            outcome.timed_out = true;
            break;
        }
        
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int* owners[2];
        if (out_pipe[0] >= 0) {
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            owners[nfds++] = &out_pipe[0];
        }
        if (err_pipe[0] >= 0) {
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            owners[nfds++] = &err_pipe[0];
        }
        
        int ready = poll(fds, nfds, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("poll() failed: %s", strerror(errno));
            break;
        }
        
        if (ready == 0) {
            // Child gone but a background grandchild keeps the pipes open
            if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
                exited = true;
            } else if (exited) {
                break;
            }
            continue;
        }
        
        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            bool is_out = owners[i] == &out_pipe[0];
            bool open = read_available(fds[i].fd,
                                       is_out ? outcome.stdout_text : outcome.stderr_text,
                                       request.max_output,
                                       is_out ? out_truncated : err_truncated);
            if (!open) {
                close_fd(*owners[i]);
            }
        }
    }
    
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    
    if (outcome.interrupted || outcome.timed_out) {
        if (!exited) {
            terminate_group(pid, status);
        } else {
            kill(-pid, SIGKILL);
        }
        LOG_INFO("Command %s: %s", outcome.timed_out ? "timed out" : "interrupted",
                 request.command.c_str());
    } else if (!exited) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            if (interrupt_requested()) {
                outcome.interrupted = true;
                terminate_group(pid, status);
                break;
            }
        }
    }
    
    outcome.exit_code = decode_status(status);
    if (out_truncated) outcome.stdout_text += TRUNCATED_MARK;
    if (err_truncated) outcome.stderr_text += TRUNCATED_MARK;
    
    LOG_DEBUG("pid %d finished with code %d", outcome.pid, outcome.exit_code);
    return outcome;
}

RunOutcome PosixCommandRunner::launch_detached(const std::string& command,
                                               const std::string& cwd,
                                               const std::string& log_path) {
    if (!create_parent_directory(log_path)) {
        return RunOutcome::fail("cannot create log directory for " + log_path);
    }
    
    int pid_pipe[2];
    if (pipe(pid_pipe) < 0) {
        return RunOutcome::fail(std::string("pipe() failed: ") + strerror(errno));
    }
    
    pid_t first = fork();
    if (first < 0) {
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        return RunOutcome::fail(std::string("fork() failed: ") + strerror(errno));
    }
    
    if (first == 0) {
        close(pid_pipe[0]);
        setsid();
        
        pid_t second = fork();
        if (second != 0) {
            // Intermediate child reports the daemon pid and leaves
            int reported = static_cast<int>(second);
            ssize_t n;
            do {
                n = write(pid_pipe[1], &reported, sizeof(reported));
            } while (n < 0 && errno == EINTR);
            if (n != static_cast<ssize_t>(sizeof(reported))) {
                // The parent will report a failed start, so no daemon may survive
                if (second > 0) {
                    kill(second, SIGKILL);
                }
                _exit(2);
            }
            _exit(second < 0 ? 1 : 0);
        }
        
        close(pid_pipe[1]);
        signal(SIGINT, SIG_DFL);
        
        int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        if (log_fd >= 0) {
            dup2(log_fd, STDOUT_FILENO);
            dup2(log_fd, STDERR_FILENO);
            close(log_fd);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    
    close(pid_pipe[1]);
    int daemon_pid = -1;
    ssize_t n;
    do {
        n = read(pid_pipe[0], &daemon_pid, sizeof(daemon_pid));
    } while (n < 0 && errno == EINTR);
    close(pid_pipe[0]);
    
    int status = 0;
    while (waitpid(first, &status, 0) < 0 && errno == EINTR) {}
    
    if (n != static_cast<ssize_t>(sizeof(daemon_pid)) || daemon_pid <= 0) {
        LOG_WARN("Detached launch of '%s' failed (launcher status %d)", command.c_str(),
                 WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return RunOutcome::fail("failed to start detached process");
    }
    
    RunOutcome outcome;
    outcome.started = true;
    outcome.exit_code = 0;
    outcome.pid = daemon_pid;
    LOG_INFO("Launched detached pid %d: %s (log %s)", daemon_pid, command.c_str(), log_path.c_str());
    return outcome;
}

} // namespace vibecli
