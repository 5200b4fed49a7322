/*
 * engram - JSON type
 *
 * Tool parameters, tool result data, configuration and pattern example
 * lists all use nlohmann::json through this alias.
 */
#ifndef engram_CORE_JSON_HPP
#define engram_CORE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace engram {

typedef nlohmann::json Json;

struct JsonParseResult {
    bool ok;
    Json value;
    std::string error;
    
    JsonParseResult() : ok(false) {}
};

// Parse without throwing; on failure ok=false and error holds the parser message
JsonParseResult try_parse_json(const std::string& text);

} // namespace engram

#endif // engram_CORE_JSON_HPP
