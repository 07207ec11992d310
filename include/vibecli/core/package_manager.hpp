/*
 * vibecli C++17 - Package manager selection
 *
 * Inferred once from the lock file in the project root:
 * bun.lockb > pnpm-lock.yaml > yarn.lock > npm.
 */
#ifndef vibecli_CORE_PACKAGE_MANAGER_HPP
#define vibecli_CORE_PACKAGE_MANAGER_HPP

#include <string>

namespace vibecli {

enum class PackageManager {
    NPM,
    PNPM,
    YARN,
    BUN
};

PackageManager detect_package_manager(const std::string& root);
const char* package_manager_name(PackageManager pm);
bool parse_package_manager(const std::string& name, PackageManager& pm);

// "npm install x", "pnpm add x", "yarn add x", "bun add x"
std::string install_command(PackageManager pm, const std::string& packages);

} // namespace vibecli

#endif // vibecli_CORE_PACKAGE_MANAGER_HPP
