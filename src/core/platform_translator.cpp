#include <vibecli/core/platform_translator.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <algorithm>
#include <cctype>

namespace vibecli {

namespace {

struct IdiomEntry {
    const char* from;
    const char* to;
};

// POSIX idioms as run on Windows
const IdiomEntry TO_WINDOWS[] = {
    {"ls", "dir /b"},
    {"ls -l", "dir"},
    {"ls -la", "dir /a"},
    {"ls -R", "tree /f /a"},
    {"pwd", "cd"},
    {"cat", "type"},
    {"cp", "copy"},
    {"mv", "move"},
    {"rm", "del"},
    {"rm -rf", "rmdir /s /q"},
    {"rm -r", "rmdir /s /q"},
    {"mkdir -p", "mkdir"},
    {"touch", "type nul >"},
    {"clear", "cls"},
    {"grep", "findstr"},
    {"which", "where"}
};

// Windows idioms as run on POSIX
const IdiomEntry TO_POSIX[] = {
    {"dir", "ls -la"},
    {"dir /b", "ls -1"},
    {"dir /a", "ls -la"},
    {"tree /f /a", "ls -R"},
    {"type nul >", "touch"},
    {"copy", "cp"},
    {"move", "mv"},
    {"del", "rm"},
    {"del /q", "rm -f"},
    {"del /s /q", "rm -rf"},
    {"rmdir /s /q", "rm -rf"},
    {"rd /s /q", "rm -rf"},
    {"cls", "clear"},
    {"findstr", "grep"},
    {"where", "which"}
};

enum class MatchKind {
    CONTAINS,
    ENDS_WITH
};

struct FlagAction {
    const char* flags[3];   // skip when any of these is present
    const char* append;
    const char* warning;
};

struct NonInteractiveRule {
    const char* name;
    MatchKind kind;
    const char* patterns[4];
    FlagAction actions[2];
    const char* advice;     // warning when nothing can be appended
};

const NonInteractiveRule NON_INTERACTIVE_RULES[] = {
    {"vite", MatchKind::CONTAINS, {"create vite", "create-vite", nullptr, nullptr},
     {{{"--template", nullptr, nullptr}, "--template react-ts",
       "Vite detected without --template. Adding default react-ts."},
      {{nullptr, nullptr, nullptr}, nullptr, nullptr}},
     nullptr},
    {"next", MatchKind::CONTAINS, {"create-next-app", nullptr, nullptr, nullptr},
     {{{"--yes", "-y", nullptr}, "--yes", "Next.js detected. Adding --yes flag."},
      {{nullptr, nullptr, nullptr}, nullptr, nullptr}},
     nullptr},
    {"astro", MatchKind::CONTAINS, {"create astro", "create-astro", nullptr, nullptr},
     {{{"--template", nullptr, nullptr}, "--template minimal", "Astro detected. Adding --template minimal."},
      {{"--yes", "-y", nullptr}, "--yes", nullptr}},
     nullptr},
    {"remix", MatchKind::CONTAINS, {"create-remix", nullptr, nullptr, nullptr},
     {{{"--template", nullptr, nullptr}, "--template remix", "Remix detected. Adding --template remix."},
      {{nullptr, nullptr, nullptr}, nullptr, nullptr}},
     nullptr},
    {"shadcn", MatchKind::CONTAINS, {"shadcn", nullptr, nullptr, nullptr},
     {{{"-y", "--yes", nullptr}, "-y", nullptr},
      {{nullptr, nullptr, nullptr}, nullptr, nullptr}},
     nullptr},
    {"init", MatchKind::ENDS_WITH, {"npm init", "yarn init", "pnpm init", "bun init"},
     {{{"-y", "--yes", nullptr}, "-y", "Package manager init detected. Adding -y flag."},
      {{nullptr, nullptr, nullptr}, nullptr, nullptr}},
     nullptr},
    {"create", MatchKind::CONTAINS, {"npm create", "npx create", "yarn create", "pnpm create"},
     {{{nullptr, nullptr, nullptr}, nullptr, nullptr},
      {{nullptr, nullptr, nullptr}, nullptr, nullptr}},
     "Interactive create command detected. Use --yes, -y or --template flags to avoid prompts."}
};

const char* SERVER_PATTERNS[] = {
    "npm run dev", "npm start", "npm run start", "yarn dev", "yarn start",
    "pnpm dev", "pnpm start", "pnpm run dev", "bun dev", "bun run dev",
    "python manage.py runserver", "flask run", "uvicorn", "nodemon"
};

bool rule_matches(const NonInteractiveRule& rule, const std::string& lower) {
    for (size_t i = 0; i < 4 && rule.patterns[i]; ++i) {
        if (rule.kind == MatchKind::ENDS_WITH) {
            if (ends_with(lower, rule.patterns[i])) return true;
        } else if (lower.find(rule.patterns[i]) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

Platform host_platform() {
#ifdef _WIN32
    return Platform::WINDOWS;
#else
    return Platform::POSIX;
#endif
}

const char* platform_name(Platform platform) {
    return platform == Platform::WINDOWS ? "Windows" : "Unix/Mac";
}

bool whole_word_prefix(const std::string& command, const std::string& idiom) {
    if (idiom.empty() || !starts_with(command, idiom)) {
        return false;
    }
    return command.size() == idiom.size() ||
           std::isspace(static_cast<unsigned char>(command[idiom.size()]));
}

bool has_flag(const std::string& command, const std::string& flag) {
    std::vector<std::string> tokens = split_whitespace(command);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == flag || starts_with(tokens[i], flag + "=")) {
            return true;
        }
    }
    return false;
}

PlatformTranslator::PlatformTranslator(Platform platform)
    : platform_(platform)
{
    const IdiomEntry* table = platform == Platform::WINDOWS ? TO_WINDOWS : TO_POSIX;
    size_t count = platform == Platform::WINDOWS
        ? sizeof(TO_WINDOWS) / sizeof(TO_WINDOWS[0])
        : sizeof(TO_POSIX) / sizeof(TO_POSIX[0]);
    
    for (size_t i = 0; i < count; ++i) {
        IdiomRule rule;
        rule.from = table[i].from;
        rule.to = table[i].to;
        rules_.push_back(rule);
    }
    
    std::stable_sort(rules_.begin(), rules_.end(), [](const IdiomRule& a, const IdiomRule& b) {
        return a.from.size() > b.from.size();
    });
}

Translation PlatformTranslator::translate(const std::string& command) const {
    Translation t;
    t.command = command;
    
    std::string stripped = trim(command);
    for (size_t i = 0; i < rules_.size(); ++i) {
        const IdiomRule& rule = rules_[i];
        if (!whole_word_prefix(stripped, rule.from)) {
            continue;
        }
        std::string rest = trim(stripped.substr(rule.from.size()));
        t.command = rest.empty() ? rule.to : rule.to + " " + rest;
        t.warnings.push_back("Auto-converted: " + stripped + " -> " + t.command);
        LOG_DEBUG("Translated '%s' -> '%s'", stripped.c_str(), t.command.c_str());
        break;
    }
    return t;
}

Translation PlatformTranslator::make_non_interactive(const std::string& command) const {
    Translation t;
    t.command = command;
    std::string lower = to_lower(trim(command));
    
    for (size_t r = 0; r < sizeof(NON_INTERACTIVE_RULES) / sizeof(NON_INTERACTIVE_RULES[0]); ++r) {
        const NonInteractiveRule& rule = NON_INTERACTIVE_RULES[r];
        if (!rule_matches(rule, lower)) {
            continue;
        }
        
        for (size_t a = 0; a < 2; ++a) {
            const FlagAction& action = rule.actions[a];
            if (!action.append) {
                continue;
            }
            bool present = false;
            for (size_t f = 0; f < 3 && action.flags[f]; ++f) {
                if (has_flag(t.command, action.flags[f])) {
                    present = true;
                    break;
                }
            }
            if (present) {
                continue;
            }
            t.command = rtrim(t.command) + " " + action.append;
            if (action.warning) {
                t.warnings.push_back(action.warning);
            }
        }
        
        if (rule.advice && !has_flag(command, "--") && !has_flag(command, "--yes") &&
            !has_flag(command, "-y")) {
            t.warnings.push_back(rule.advice);
        }
        break;
    }
    return t;
}

Translation PlatformTranslator::prepare(const std::string& command) const {
    Translation first = translate(command);
    Translation second = make_non_interactive(first.command);
    first.command = second.command;
    first.warnings.insert(first.warnings.end(), second.warnings.begin(), second.warnings.end());
    return first;
}

bool is_server_command(const std::string& command) {
    std::string lower = to_lower(command);
    for (size_t i = 0; i < sizeof(SERVER_PATTERNS) / sizeof(SERVER_PATTERNS[0]); ++i) {
        if (lower.find(SERVER_PATTERNS[i]) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool parse_directory_change(const std::string& command, std::string& target) {
    std::string stripped = trim(command);
    if (!whole_word_prefix(stripped, "cd")) {
        return false;
    }
    std::string rest = trim(stripped.substr(2));
    if (rest.find("&&") != std::string::npos || rest.find("||") != std::string::npos ||
        rest.find(';') != std::string::npos || rest.find('|') != std::string::npos) {
        return false;
    }
    // "cd /d C:\x" on Windows
    if (starts_with(to_lower(rest), "/d ")) {
        rest = trim(rest.substr(3));
    }
    if (rest.size() >= 2 && (rest[0] == '"' || rest[0] == '\'') && rest[rest.size() - 1] == rest[0]) {
        rest = rest.substr(1, rest.size() - 2);
    }
    target = rest;
    return true;
}

} // namespace vibecli
