/*
 * vibecli C++17 - Scaffold templates
 *
 * Static lookup from a framework keyword to its project generator
 * command. Lookup order: exact key, then substring match either way,
 * then "npm create <framework>@latest <name> -- --yes".
 */
#ifndef vibecli_CORE_SCAFFOLD_TEMPLATES_HPP
#define vibecli_CORE_SCAFFOLD_TEMPLATES_HPP

#include <string>
#include <vector>

namespace vibecli {

struct ScaffoldCommand {
    std::string command;        // empty for an unusable framework keyword
    std::string matched_key;    // empty for the generic fallback
    bool fuzzy;
    
    ScaffoldCommand() : fuzzy(false) {}
};

// command is empty when the keyword cannot name an npm package
ScaffoldCommand scaffold_command(const std::string& framework,
                                 const std::string& project_name,
                                 const std::string& options = "");

std::vector<std::string> scaffold_template_keys();

} // namespace vibecli

#endif // vibecli_CORE_SCAFFOLD_TEMPLATES_HPP
