/*
 * vibecli C++17 - JSON alias
 *
 * nlohmann::json under the short name used across the project.
 */
#ifndef vibecli_CORE_JSON_HPP
#define vibecli_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace vibecli {

typedef nlohmann::json Json;

} // namespace vibecli

#endif // vibecli_CORE_JSON_HPP
