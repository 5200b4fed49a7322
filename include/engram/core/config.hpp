/*
 * engram - Configuration
 *
 * JSON configuration file with dotted-path lookups:
 *
 *   {
 *     "log_level": "info",
 *     "memory": { "db_path": "~/.engram/memory.db", "dedup_window_minutes": 15 }
 *   }
 *
 *   cfg.get_string("memory.db_path", "")
 *
 * A literal key containing dots ("memory.db_path": ...) is honoured too.
 */
#ifndef engram_CORE_CONFIG_HPP
#define engram_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace engram {

class Config {
public:
    Config();
    
    // Load from file. Returns false (and keeps previous values) on I/O or parse error.
    bool load(const std::string& path);
    
    // Load from a JSON document in memory
    bool load_string(const std::string& text);
    
    bool has(const std::string& key) const;
    
    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    
    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    Json data_;
    std::string last_error_;
    
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
};

} // namespace engram

#endif // engram_CORE_CONFIG_HPP
