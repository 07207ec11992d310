/*
 * vibecli C++17 - Operator interrupt
 *
 * SIGINT sets a process-wide flag instead of terminating. Blocking code
 * (prompts, subprocess waits, HTTP transfers) polls the flag and abandons
 * the current action.
 */
#ifndef vibecli_CORE_INTERRUPT_HPP
#define vibecli_CORE_INTERRUPT_HPP

#include <stdexcept>
#include <string>

namespace vibecli {

// Installs the SIGINT handler without SA_RESTART so blocking reads
// return EINTR.
void install_interrupt_handler();

bool interrupt_requested();
void request_interrupt();
void clear_interrupt();

// Thrown when the operator aborts at a prompt (Ctrl+C or closed stdin).
class OperatorInterrupt : public std::runtime_error {
public:
    explicit OperatorInterrupt(const std::string& what = "interrupted by operator", bool eof = false)
        : std::runtime_error(what), end_of_input_(eof) {}
    
    // stdin was closed rather than Ctrl+C pressed
    bool end_of_input() const { return end_of_input_; }

private:
    bool end_of_input_;
};

} // namespace vibecli

#endif // vibecli_CORE_INTERRUPT_HPP
