/*
 * vibecli C++17 - Configuration
 *
 * JSON configuration document with dotted-key lookup.
 *
 *   cfg.get_string("openrouter.model", "openai/gpt-4o")
 *   cfg.get_int("agent.max_history_turns", 15)
 */
#ifndef vibecli_CORE_CONFIG_HPP
#define vibecli_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace vibecli {

class Config {
public:
    Config();
    
    // Load a JSON file. Returns false if the file is missing or unparsable;
    // in both cases the previous document is kept.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);
    
    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;
    bool has(const std::string& key) const;
    
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);
    
    const std::string& source() const { return source_; }
    const Json& data() const { return data_; }

private:
    Json data_;
    std::string source_;
    
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
};

} // namespace vibecli

#endif // vibecli_CORE_CONFIG_HPP
