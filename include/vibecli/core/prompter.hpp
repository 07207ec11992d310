/*
 * vibecli C++17 - Operator console
 *
 * Everything the operator sees or answers goes through a Prompter:
 * confirmations, diffs, streamed backend prose. Logging stays on the
 * Logger.
 */
#ifndef vibecli_CORE_PROMPTER_HPP
#define vibecli_CORE_PROMPTER_HPP

#include "interrupt.hpp"
#include <string>

namespace vibecli {

class Prompter {
public:
    virtual ~Prompter() {}
    
    // Shows prompt and returns the answer without its line terminator.
    // Throws OperatorInterrupt when the operator aborts.
    virtual std::string ask(const std::string& prompt) = 0;
    
    // Full line(s) of output
    virtual void say(const std::string& text) = 0;
    
    // Partial output, no newline added
    virtual void stream(const std::string& fragment) = 0;
    
    virtual void warn(const std::string& text) = 0;
};

class ConsolePrompter : public Prompter {
public:
    explicit ConsolePrompter(bool color = true);
    
    std::string ask(const std::string& prompt) override;
    void say(const std::string& text) override;
    void stream(const std::string& fragment) override;
    void warn(const std::string& text) override;
    
    bool color() const { return color_; }

private:
    bool color_;
};

} // namespace vibecli

#endif // vibecli_CORE_PROMPTER_HPP
