#include <vibecli/core/prompter.hpp>
#include <cerrno>
#include <cstdio>
#include <iostream>
#include <unistd.h>

namespace vibecli {

ConsolePrompter::ConsolePrompter(bool color)
    : color_(color && isatty(STDOUT_FILENO))
{}

std::string ConsolePrompter::ask(const std::string& prompt) {
    std::cout << prompt << std::flush;
    
    // Raw read(2) so a SIGINT (installed without SA_RESTART) interrupts it
    std::string line;
    while (true) {
        char c;
        ssize_t n = read(STDIN_FILENO, &c, 1);
        if (n == 1) {
            if (c == '\n') {
                break;
            }
            line += c;
            continue;
        }
        if (n < 0 && errno == EINTR && !interrupt_requested()) {
            continue;
        }
        std::cout << std::endl;
        if (n == 0 && !line.empty()) {
            break;
        }
        if (n == 0) {
            throw OperatorInterrupt("end of input", true);
        }
        throw OperatorInterrupt();
    }
    
    if (!line.empty() && line[line.size() - 1] == '\r') {
        line.erase(line.size() - 1);
    }
    return line;
}

void ConsolePrompter::say(const std::string& text) {
    std::cout << text << std::endl;
}

void ConsolePrompter::stream(const std::string& fragment) {
    std::cout << fragment << std::flush;
}

void ConsolePrompter::warn(const std::string& text) {
    if (color_) {
        std::cout << "\033[33m" << text << "\033[0m" << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

} // namespace vibecli
