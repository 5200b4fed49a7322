/*
 * engram - Configuration Implementation
 */
#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace engram {

JsonParseResult try_parse_json(const std::string& text) {
    JsonParseResult res;
    try {
        res.value = Json::parse(text);
        res.ok = true;
    } catch (const Json::parse_error& e) {
        res.error = e.what();
    }
    return res;
}

Config::Config() : data_(Json::object()) {}

bool Config::load(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        return false;
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    
    if (!load_string(content.str())) {
        LOG_ERROR("[Config] Failed to parse %s: %s", path.c_str(), last_error_.c_str());
        return false;
    }
    
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    JsonParseResult parsed = try_parse_json(text);
    if (!parsed.ok) {
        last_error_ = parsed.error;
        return false;
    }
    if (!parsed.value.is_object()) {
        last_error_ = "Config root must be a JSON object";
        return false;
    }
    data_ = parsed.value;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    Json::const_iterator literal = data_.find(key);
    if (literal != data_.end()) {
        return &(*literal);
    }
    
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    // A literal dotted key would shadow the nested value
    if (key.find('.') != std::string::npos) {
        data_.erase(key);
    }
    
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) {
            child = Json::object();
        }
        node = &child;
    }
    return (*node)[parts.back()];
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return default_val;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return default_val;
    if (v->is_number_float()) {
        double d = v->get<double>();
        return double_fits_int64(d) ? static_cast<int64_t>(d) : default_val;
    }
    if (v->is_number_unsigned() && v->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
        return default_val;
    }
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return default_val;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "1" || s == "yes") return true;
        if (s == "false" || s == "0" || s == "no") return false;
    }
    return default_val;
}

void Config::set_string(const std::string& key, const std::string& value) {
    if (key.empty()) return;
    slot(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    if (key.empty()) return;
    slot(key) = value;
}

} // namespace engram
