#include <vibecli/core/config.hpp>
#include <vibecli/core/logger.hpp>
#include <vibecli/core/utils.hpp>

namespace vibecli {

Config::Config()
    : data_(Json::object())
{}

bool Config::load_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        LOG_DEBUG("Config file not found: %s", path.c_str());
        return false;
    }
    
    if (!load_string(text)) {
        LOG_WARN("Config file %s is not valid JSON, using defaults", path.c_str());
        return false;
    }
    
    source_ = path;
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            LOG_WARN("Config root must be a JSON object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Config parse error: %s", e.what());
        return false;
    }
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (!v || v->is_null()) return def;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number()) return static_cast<int64_t>(v->get<double>());
    if (v->is_string()) {
        try {
            return std::stoll(v->get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_number()) return v->get<double>();
    if (v->is_string()) {
        try {
            return std::stod(v->get<std::string>());
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (!v) return def;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number()) return v->get<double>() != 0.0;
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "yes" || s == "1" || s == "on") return true;
        if (s == "false" || s == "no" || s == "0" || s == "off") return false;
    }
    return def;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

void Config::set_string(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    slot(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    slot(key) = value;
}

} // namespace vibecli
