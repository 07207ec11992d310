#include <vibecli/core/safety_gate.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace vibecli {

const char* SafetyGate::ELEVATED_PHRASE = "confirm";

namespace {

const char* DENYLIST[] = {
    "format", "mkfs", "fdisk", "sfdisk", "gdisk", "parted", "diskpart",
    "dd", "wipefs", "shutdown", "reboot", "halt", "poweroff"
};

// Split a command line into simple commands on && || ; | & and newlines
std::vector<std::string> split_segments(const std::string& command) {
    std::string normalized;
    normalized.reserve(command.size());
    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (c == ';' || c == '|' || c == '&' || c == '\n') {
            normalized += '\n';
        } else {
            normalized += c;
        }
    }
    
    std::vector<std::string> segments;
    std::vector<std::string> parts = split(normalized, '\n');
    for (size_t i = 0; i < parts.size(); ++i) {
        std::string s = trim(parts[i]);
        if (!s.empty()) {
            segments.push_back(s);
        }
    }
    return segments;
}

// Program name without privilege wrappers or a leading directory
std::vector<std::string> strip_wrappers(const std::vector<std::string>& tokens) {
    size_t i = 0;
    while (i < tokens.size() &&
           (tokens[i] == "sudo" || tokens[i] == "doas" || tokens[i] == "exec" ||
            tokens[i] == "command" || tokens[i] == "nohup" ||
            (tokens[i].find('=') != std::string::npos && tokens[i][0] != '-'))) {
        ++i;
    }
    std::vector<std::string> out(tokens.begin() + i, tokens.end());
    if (!out.empty()) {
        out[0] = base_name(out[0]);
        if (ends_with(out[0], ".exe")) {
            out[0] = out[0].substr(0, out[0].size() - 4);
        }
    }
    return out;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s[0] == '"' || s[0] == '\'') && s[s.size() - 1] == s[0]) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool is_root_level_target(const std::string& raw) {
    std::string t = unquote(raw);
    std::replace(t.begin(), t.end(), '\\', '/');
    
    if (t.find('*') != std::string::npos || t.find('?') != std::string::npos) {
        return true;
    }
    if (t == "." || t == "./" || t == ".." || t == "../" || t == "~" || t == "~/" ||
        t == "$home" || t == "${home}" || t == "$home/" || t == "${home}/") {
        return true;
    }
    // Drive roots: c: c:/ 
    if (t.size() >= 2 && t.size() <= 3 && t[1] == ':' && std::isalpha(static_cast<unsigned char>(t[0])) &&
        (t.size() == 2 || t[2] == '/')) {
        return true;
    }
    if (!t.empty() && t[0] == '/') {
        // "/", "/usr", "/home/" are root-level; "/home/me/tmp" is not
        std::string n = normalize_path(t);
        size_t depth = 0;
        for (size_t i = 1; i < n.size(); ++i) {
            if (n[i] == '/') ++depth;
        }
        return n == "/" || depth == 0;
    }
    return false;
}

bool is_recursive_delete(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        return false;
    }
    const std::string& prog = tokens[0];
    
    if (prog == "rm") {
        for (size_t i = 1; i < tokens.size(); ++i) {
            const std::string& t = tokens[i];
            if (t == "--recursive" || t == "--no-preserve-root") return true;
            if (t.size() > 1 && t[0] == '-' && t[1] != '-' &&
                (t.find('r') != std::string::npos || t.find('R') != std::string::npos)) {
                return true;
            }
        }
        return false;
    }
    
    if (prog == "rmdir" || prog == "rd" || prog == "del" || prog == "erase") {
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (tokens[i] == "/s") return true;
        }
        return false;
    }
    
    if (prog == "remove-item" || prog == "ri") {
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (starts_with(tokens[i], "-r")) return true;
        }
    }
    return false;
}

} // namespace

std::string SafetyGate::danger_reason(const std::string& command) {
    std::string lower = to_lower(command);
    
    std::string compact;
    for (size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] != ' ' && lower[i] != '\t') compact += lower[i];
    }
    if (compact.find(":(){") != std::string::npos) {
        return "fork bomb";
    }
    if (compact.find(">/dev/sd") != std::string::npos ||
        compact.find(">/dev/nvme") != std::string::npos ||
        compact.find(">/dev/hd") != std::string::npos) {
        return "raw write to a block device";
    }
    
    std::vector<std::string> segments = split_segments(lower);
    for (size_t s = 0; s < segments.size(); ++s) {
        std::vector<std::string> tokens = strip_wrappers(split_whitespace(segments[s]));
        if (tokens.empty()) {
            continue;
        }
        
        const std::string& prog = tokens[0];
        for (size_t i = 0; i < sizeof(DENYLIST) / sizeof(DENYLIST[0]); ++i) {
            if (prog == DENYLIST[i] || (starts_with(prog, DENYLIST[i]) && prog[strlen(DENYLIST[i])] == '.')) {
                return "'" + prog + "' is on the denylist";
            }
        }
        
        if (!is_recursive_delete(tokens)) {
            continue;
        }
        for (size_t i = 1; i < tokens.size(); ++i) {
            const std::string& t = tokens[i];
            // Flags ("-rf", "/s", "/q") are not targets; "/" itself is
            bool dos_switch = prog != "rm" && t.size() == 2 && t[0] == '/' &&
                              std::isalpha(static_cast<unsigned char>(t[1]));
            if (t[0] == '-' || dos_switch) {
                if (t == "--no-preserve-root") {
                    return "recursive delete with --no-preserve-root";
                }
                continue;
            }
            if (is_root_level_target(t)) {
                return "recursive delete of root-level or wildcard target '" + t + "'";
            }
        }
    }
    
    return "";
}

bool SafetyGate::confirm_action(Prompter& prompter, const std::string& question) {
    std::string answer = to_lower(trim(prompter.ask(">> " + question + " (y/n): ")));
    return answer == "y" || answer == "yes";
}

bool SafetyGate::confirm_elevated(Prompter& prompter, const std::string& command) {
    prompter.warn("DANGEROUS COMMAND: " + command);
    std::string reason = danger_reason(command);
    if (!reason.empty()) {
        prompter.warn("Reason: " + reason);
    }
    // Exact match, no trimming or case folding
    std::string answer = prompter.ask(std::string(">> Type '") + ELEVATED_PHRASE + "' to proceed: ");
    bool ok = answer == ELEVATED_PHRASE;
    if (!ok) {
        LOG_WARN("Blocked dangerous command: %s", command.c_str());
    }
    return ok;
}

} // namespace vibecli
