/*
 * vibecli C++17 - Platform command translator
 *
 * Rewrites shell idioms of the other platform into the host's
 * ("ls -la" -> "dir /a" on Windows, "del" -> "rm" elsewhere), and appends
 * non-interactive flags to scaffolding tools that would otherwise sit
 * waiting on a prompt.
 */
#ifndef vibecli_CORE_PLATFORM_TRANSLATOR_HPP
#define vibecli_CORE_PLATFORM_TRANSLATOR_HPP

#include <string>
#include <vector>

namespace vibecli {

enum class Platform {
    POSIX,
    WINDOWS
};

Platform host_platform();
const char* platform_name(Platform platform);

struct Translation {
    std::string command;
    std::vector<std::string> warnings;
    
    bool changed(const std::string& original) const { return command != original; }
};

struct IdiomRule {
    std::string from;
    std::string to;
};

// True when idiom is a prefix of command followed by whitespace or the end
bool whole_word_prefix(const std::string& command, const std::string& idiom);

// True when the flag appears as its own token ("--yes", "--template=x")
bool has_flag(const std::string& command, const std::string& flag);

class PlatformTranslator {
public:
    explicit PlatformTranslator(Platform platform = host_platform());
    
    // Idiom rewrite, longest matching idiom wins
    Translation translate(const std::string& command) const;
    
    // Scaffolding fix-ups (vite, next, astro, remix, shadcn, *init)
    Translation make_non_interactive(const std::string& command) const;
    
    // translate() then make_non_interactive(), warnings concatenated
    Translation prepare(const std::string& command) const;
    
    Platform platform() const { return platform_; }
    const std::vector<IdiomRule>& rules() const { return rules_; }

private:
    Platform platform_;
    std::vector<IdiomRule> rules_;  // sorted longest "from" first
};

// Development servers and watchers that never exit on their own
bool is_server_command(const std::string& command);

// "cd <dir>" with nothing chained after it. A bare "cd" yields an empty
// target. Compound commands ("cd x && make") return false.
bool parse_directory_change(const std::string& command, std::string& target);

} // namespace vibecli

#endif // vibecli_CORE_PLATFORM_TRANSLATOR_HPP
