/*
 * engram - Memory Types
 *
 * Plain records for the three entities owned by the store (experiences,
 * preferences, patterns) plus the views and results built from them.
 * Timestamps are Unix epoch milliseconds; 0 means "unset".
 */
#ifndef engram_MEMORY_TYPES_HPP
#define engram_MEMORY_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace engram {

// ============================================================================
// Experiences
// ============================================================================

enum class ExperienceType {
    EXPERIENCE,
    CORRECTION,
    INSIGHT,
    AUTO_CAPTURE,
    SESSION_SUMMARY
};

const char* experience_type_to_string(ExperienceType type);

// Returns false for unknown names (out is left untouched)
bool experience_type_from_string(const std::string& name, ExperienceType& out);

// One observed episode
struct Experience {
    int64_t id;
    ExperienceType type;
    std::string context;        // What was happening
    std::string action;         // What was done
    std::string result;         // What happened
    bool success;
    std::string tags;           // Comma-joined labels
    std::string project;        // Empty = global
    int64_t created_at;
    int64_t deleted_at;         // 0 = active
    std::string normalized_hash;
    int duplicate_count;
    int64_t last_seen_at;
    std::string topic_key;      // Empty = no topic
    int revision_count;
    
    Experience()
        : id(0), type(ExperienceType::EXPERIENCE), success(true), created_at(0)
        , deleted_at(0), duplicate_count(1), last_seen_at(0), revision_count(1) {}
    
    bool is_active() const { return deleted_at == 0; }
};

// Caller-supplied content for a new or revised experience
struct ExperienceInput {
    ExperienceType type;
    std::string context;
    std::string action;
    std::string result;
    bool success;
    std::string tags;
    std::string project;
    std::string topic_key;      // Optional
    
    ExperienceInput() : type(ExperienceType::EXPERIENCE), success(true) {}
};

enum class RecordOutcome {
    CREATED,
    DEDUPLICATED,
    UPSERTED
};

const char* record_outcome_to_string(RecordOutcome outcome);

struct RecordResult {
    int64_t id;
    RecordOutcome outcome;
    
    RecordResult() : id(0), outcome(RecordOutcome::CREATED) {}
};

// List/search projection; full detail is a follow-up lookup by id
struct CompactExperience {
    int64_t id;
    ExperienceType type;
    std::string tags;
    int64_t created_at;
    bool success;
    std::string project;
    std::string snippet;        // Leading characters of context
    std::string topic_key;
    int duplicate_count;
    int revision_count;
    
    CompactExperience()
        : id(0), type(ExperienceType::EXPERIENCE), created_at(0), success(true)
        , duplicate_count(1), revision_count(1) {}
};

CompactExperience make_compact(const Experience& e, size_t snippet_length);

struct ScoredExperience {
    Experience entry;
    double relevance;           // Higher = better lexical match
    double score;               // Final ranking score
    
    ScoredExperience() : relevance(0.0), score(0.0) {}
};

struct SearchResult {
    std::vector<ScoredExperience> hits;
    bool fallback;              // Index failed; hits are the most recent experiences
    
    SearchResult() : fallback(false) {}
};

// At least one selector must be set
struct ForgetSelector {
    bool has_id;
    int64_t id;
    std::string tag;
    std::string project;
    bool exact_tag;             // Tag set membership instead of substring match
    
    ForgetSelector() : has_id(false), id(0), exact_tag(false) {}
    
    bool empty() const { return !has_id && tag.empty() && project.empty(); }
};

// ============================================================================
// Preferences
// ============================================================================

struct Preference {
    int64_t id;
    std::string key;
    std::string value;
    double confidence;          // 0.0 - 1.0, never lowered by re-affirmation
    std::string source;
    std::string scope;          // "global" or a project label
    int confirmed_count;
    int64_t last_confirmed_at;  // 0 = unknown (maximally stale)
    int64_t updated_at;
    
    Preference()
        : id(0), confidence(0.0), scope("global"), confirmed_count(1)
        , last_confirmed_at(0), updated_at(0) {}
};

// Preference as seen by a reader: decay applied, origin resolved
struct ResolvedPreference {
    Preference pref;
    std::string origin;         // "global" or "project"
    double decay_factor;
    double effective_confidence;
    
    ResolvedPreference() : decay_factor(1.0), effective_confidence(0.0) {}
};

// ============================================================================
// Patterns
// ============================================================================

struct Pattern {
    int64_t id;
    std::string description;    // Unique
    std::string category;
    int frequency;
    std::vector<std::string> examples;  // Oldest first, bounded
    int64_t last_seen;
    
    Pattern() : id(0), frequency(1), last_seen(0) {}
};

// ============================================================================
// Configuration and statistics
// ============================================================================

struct MemoryConfig {
    std::string db_path;
    int64_t dedup_window_ms;
    int64_t timeline_window_ms;
    int timeline_limit;
    size_t snippet_length;
    size_t pattern_example_limit;
    int checkpoint_every;       // Tool-layer writes between WAL checkpoints
    
    MemoryConfig()
        : db_path("~/.engram/memory.db")
        , dedup_window_ms(15 * 60 * 1000LL)
        , timeline_window_ms(60 * 60 * 1000LL)
        , timeline_limit(20)
        , snippet_length(120)
        , pattern_example_limit(10)
        , checkpoint_every(20) {}
};

struct MemoryStats {
    int experiences;            // Active only
    int corrections;            // Active only
    int soft_deleted;
    int global_prefs;
    int project_prefs;
    int patterns;
    
    MemoryStats()
        : experiences(0), corrections(0), soft_deleted(0)
        , global_prefs(0), project_prefs(0), patterns(0) {}
};

} // namespace engram

#endif // engram_MEMORY_TYPES_HPP
