/*
 * vibecli C++17 - Safety gate
 *
 * Classifies shell commands and runs the confirmation protocol:
 *   - every mutating action needs a y/n answer ("y" or "yes")
 *   - dangerous commands first need the exact phrase "confirm"
 *
 * Dangerous means a denylisted leading program (format, mkfs, fdisk,
 * parted, diskpart, dd, wipefs, shutdown, reboot, halt, poweroff) or a
 * recursive delete aimed at a root-level or wildcard target.
 */
#ifndef vibecli_CORE_SAFETY_GATE_HPP
#define vibecli_CORE_SAFETY_GATE_HPP

#include "prompter.hpp"
#include <string>

namespace vibecli {

class SafetyGate {
public:
    static const char* ELEVATED_PHRASE;
    
    // Empty when the command is not dangerous
    static std::string danger_reason(const std::string& command);
    
    static bool is_dangerous(const std::string& command) {
        return !danger_reason(command).empty();
    }
    
    // "<question> (y/n): " - true only for y/yes
    static bool confirm_action(Prompter& prompter, const std::string& question);
    
    // True only when the operator types the elevated phrase exactly
    static bool confirm_elevated(Prompter& prompter, const std::string& command);
};

} // namespace vibecli

#endif // vibecli_CORE_SAFETY_GATE_HPP
