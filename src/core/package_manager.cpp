#include <vibecli/core/package_manager.hpp>
#include <vibecli/core/utils.hpp>

namespace vibecli {

PackageManager detect_package_manager(const std::string& root) {
    if (path_exists(join_path(root, "bun.lockb"))) return PackageManager::BUN;
    if (path_exists(join_path(root, "pnpm-lock.yaml"))) return PackageManager::PNPM;
    if (path_exists(join_path(root, "yarn.lock"))) return PackageManager::YARN;
    return PackageManager::NPM;
}

const char* package_manager_name(PackageManager pm) {
    switch (pm) {
        case PackageManager::PNPM: return "pnpm";
        case PackageManager::YARN: return "yarn";
        case PackageManager::BUN: return "bun";
        default: return "npm";
    }
}

bool parse_package_manager(const std::string& name, PackageManager& pm) {
    std::string n = to_lower(trim(name));
    if (n == "npm") { pm = PackageManager::NPM; return true; }
    if (n == "pnpm") { pm = PackageManager::PNPM; return true; }
    if (n == "yarn") { pm = PackageManager::YARN; return true; }
    if (n == "bun") { pm = PackageManager::BUN; return true; }
    return false;
}

std::string install_command(PackageManager pm, const std::string& packages) {
    switch (pm) {
        case PackageManager::PNPM: return "pnpm add " + packages;
        case PackageManager::YARN: return "yarn add " + packages;
        case PackageManager::BUN: return "bun add " + packages;
        default: return "npm install " + packages;
    }
}

} // namespace vibecli
