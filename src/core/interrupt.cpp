#include <vibecli/core/interrupt.hpp>
#include <atomic>
#include <csignal>
#include <cstring>

namespace vibecli {

namespace {
    std::atomic<bool> g_interrupted(false);
    
    void sigint_handler(int sig) {
        (void)sig;
        g_interrupted.store(true);
    }
}

void install_interrupt_handler() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
}

bool interrupt_requested() {
    return g_interrupted.load();
}

void request_interrupt() {
    g_interrupted.store(true);
}

void clear_interrupt() {
    g_interrupted.store(false);
}

} // namespace vibecli
