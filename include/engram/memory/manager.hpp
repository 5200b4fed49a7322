/*
 * engram - Memory Manager
 * 
 * High-level memory operations coordinating the storage backend.
 * Validates requests, composes multi-step operations (corrections,
 * forgetting, pruning) and builds the session digest.
 */
#ifndef engram_MEMORY_MANAGER_HPP
#define engram_MEMORY_MANAGER_HPP

#include "store.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace engram {

// Forward declaration
class Config;

struct ForgetResult {
    bool ok;
    std::string error;
    int count;                  // Rows soft-deleted, summed over selectors
    
    ForgetResult() : ok(false), count(0) {}
};

struct PruneOptions {
    int older_than_days;        // <= 0 = no age threshold
    bool only_failures;
    bool has_min_confidence;
    double min_confidence;
    
    PruneOptions() : older_than_days(0), only_failures(false), has_min_confidence(false), min_confidence(0.0) {}
};

struct PruneResult {
    bool ok;
    std::string error;
    int experiences;
    int preferences;
    
    PruneResult() : ok(false), experiences(0), preferences(0) {}
};

// ============================================================================
// MemoryManager - High-level Memory Operations
// ============================================================================

class MemoryManager {
public:
    static const int DIGEST_PREFERENCES = 30;
    static const int DIGEST_EXPERIENCES = 5;
    static const int DIGEST_PATTERNS = 3;
    static const int DIGEST_CORRECTIONS = 3;
    
    MemoryManager();
    ~MemoryManager();
    
    // Initialize with configuration
    bool init(const MemoryConfig& config);
    bool init(const Config& config);
    
    // Shutdown and release resources
    void shutdown();
    
    bool is_initialized() const { return initialized_; }
    
    // ========================================================================
    // Experiences
    // ========================================================================
    
    bool record_experience(const ExperienceInput& input, RecordResult& out);
    
    // Failed 'correction' experience plus the lesson as a pattern. The
    // experience is kept even if the pattern update fails.
    bool record_correction(const std::string& what_i_did,
                           const std::string& what_user_wanted,
                           const std::string& lesson,
                           const std::string& tags,
                           const std::string& project,
                           RecordResult& out,
                           Pattern& pattern);
    
    bool query(const std::string& query, const std::string& project, int limit, SearchResult& out);
    
    bool get_experience(int64_t id, Experience& out);
    
    std::vector<Experience> timeline(int64_t id);
    
    std::vector<Experience> recent_corrections(int limit);
    
    ForgetResult forget(const ForgetSelector& selector);
    
    // ========================================================================
    // Preferences and patterns
    // ========================================================================
    
    bool learn_preference(const std::string& key, const std::string& value,
                          const std::string& scope, const std::string& source,
                          ResolvedPreference& out);
    
    // Merged view for a project, global-only when project is empty
    std::vector<ResolvedPreference> preferences(const std::string& project = "");
    
    std::vector<Pattern> top_patterns(int limit);
    
    // ========================================================================
    // Maintenance
    // ========================================================================
    
    bool stats(MemoryStats& out);
    
    PruneResult prune(const PruneOptions& options);
    
    bool checkpoint();
    
    // Markdown digest injected at session start
    std::string session_context(const std::string& project);
    
    // ========================================================================
    // Access
    // ========================================================================
    
    MemoryStore& store() { return store_; }
    const MemoryStore& store() const { return store_; }
    const MemoryConfig& config() const { return config_; }
    
    std::string last_error() const { return last_error_; }

private:
    MemoryStore store_;
    MemoryConfig config_;
    bool initialized_;
    std::string last_error_;
    
    bool require_open();
};

// Build a MemoryConfig from the "memory.*" keys
MemoryConfig memory_config_from(const Config& config);

} // namespace engram

#endif // engram_MEMORY_MANAGER_HPP
