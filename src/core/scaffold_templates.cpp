#include <vibecli/core/scaffold_templates.hpp>
#include <vibecli/core/utils.hpp>

namespace vibecli {

namespace {

struct Template {
    const char* key;
    const char* command;    // {name} is replaced by the project name
};

const Template TEMPLATES[] = {
    {"vite-react", "npm create vite@latest {name} -- --template react"},
    {"vite-react-ts", "npm create vite@latest {name} -- --template react-ts"},
    {"vite-vue", "npm create vite@latest {name} -- --template vue"},
    {"vite-vue-ts", "npm create vite@latest {name} -- --template vue-ts"},
    {"vite-svelte", "npm create vite@latest {name} -- --template svelte"},
    {"vite-svelte-ts", "npm create vite@latest {name} -- --template svelte-ts"},
    {"next", "npx create-next-app@latest {name} --typescript --tailwind --app --yes"},
    {"next-js", "npx create-next-app@latest {name} --javascript --tailwind --app --yes"},
    {"next-pages", "npx create-next-app@latest {name} --typescript --tailwind --src-dir --yes"},
    {"astro", "npm create astro@latest {name} -- --template minimal --yes --install"},
    {"astro-blog", "npm create astro@latest {name} -- --template blog --yes --install"},
    {"remix", "npx create-remix@latest {name} --template remix --yes"},
    {"react", "npm create vite@latest {name} -- --template react-ts"},
    {"vue", "npm create vite@latest {name} -- --template vue-ts"},
    {"svelte", "npm create vite@latest {name} -- --template svelte-ts"},
    {"nuxt", "npx nuxi@latest init {name}"},
    {"expo", "npx create-expo-app@latest {name} --template blank-typescript"},
    {"t3", "npm create t3-app@latest {name} -- --noGit"},
    {"solid", "npx degit solidjs/templates/ts {name}"},
    {"qwik", "npm create qwik@latest {name}"}
};

const size_t TEMPLATE_COUNT = sizeof(TEMPLATES) / sizeof(TEMPLATES[0]);

std::string expand(const char* pattern, const std::string& name) {
    std::string cmd = pattern;
    size_t pos = cmd.find("{name}");
    if (pos != std::string::npos) {
        cmd.replace(pos, 6, name);
    }
    return cmd;
}

// The generic fallback passes the keyword to npm create
bool plausible_package_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.' || c == '@' || c == '/';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace

ScaffoldCommand scaffold_command(const std::string& framework,
                                 const std::string& project_name,
                                 const std::string& options) {
    ScaffoldCommand result;
    std::string fw = to_lower(trim(framework));
    if (fw.empty()) {
        return result;
    }
    
    for (size_t i = 0; i < TEMPLATE_COUNT; ++i) {
        if (fw == TEMPLATES[i].key) {
            result.command = expand(TEMPLATES[i].command, project_name);
            result.matched_key = TEMPLATES[i].key;
            break;
        }
    }
    
    if (result.command.empty()) {
        for (size_t i = 0; i < TEMPLATE_COUNT; ++i) {
            std::string key = TEMPLATES[i].key;
            if (key.find(fw) != std::string::npos || fw.find(key) != std::string::npos) {
                result.command = expand(TEMPLATES[i].command, project_name);
                result.matched_key = key;
                result.fuzzy = true;
                break;
            }
        }
    }
    
    if (result.command.empty()) {
        if (!plausible_package_name(fw)) {
            return result;
        }
        result.command = "npm create " + fw + "@latest " + project_name + " -- --yes";
    }
    
    std::string extra = trim(options);
    if (!extra.empty()) {
        result.command += " " + extra;
    }
    return result;
}

std::vector<std::string> scaffold_template_keys() {
    std::vector<std::string> keys;
    for (size_t i = 0; i < TEMPLATE_COUNT; ++i) {
        keys.push_back(TEMPLATES[i].key);
    }
    return keys;
}

} // namespace vibecli
