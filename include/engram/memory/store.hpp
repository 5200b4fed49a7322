/*
 * engram - Memory SQLite Store
 * 
 * SQLite-based storage with clean separation of concerns:
 *   FullTextIndex    - FTS5 projection of active experiences (BM25 relevance)
 *   ExperienceStore  - Experience log: dedup, topic upsert, soft delete, recall
 *   PreferenceStore  - Scoped preferences with confidence and read-time decay
 *   PatternStore     - Recurring observations with bounded examples
 *   MemoryStore      - Owns the sqlite3 handle and lock, composes the above
 *
 * Every public operation takes the store lock; every mutation runs inside
 * a BEGIN IMMEDIATE transaction, so there is a single writer at a time.
 */
#ifndef engram_MEMORY_STORE_HPP
#define engram_MEMORY_STORE_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace engram {

struct IndexMatch {
    int64_t id;
    double relevance;           // -bm25(): higher is better
    double score;               // Full ranking score computed by the index query
    
    IndexMatch() : id(0), relevance(0.0), score(0.0) {}
};

// ============================================================================
// FullTextIndex - 'experiences_fts' (rowid = experience id)
//
// Mirrors context/action/result/tags of active experiences only. Callers
// hold the store lock and an open transaction.
// ============================================================================
class FullTextIndex {
public:
    explicit FullTextIndex(sqlite3*& db);
    
    bool add(const Experience& e);
    bool remove(int64_t id);
    bool replace(const Experience& e);
    
    // Drop everything and re-index all active experiences
    bool rebuild();
    
    // The best `limit` active experiences by the combined ranking score,
    // evaluated over every match. project empty = no filter, otherwise rows
    // of that project plus global rows. Returns false when the query cannot
    // be evaluated (e.g. FTS5 syntax error).
    bool match(const std::string& query, const std::string& project,
               int64_t now_ms, int limit, std::vector<IndexMatch>& out);
    
    int count();
    
    std::string last_error() const;

private:
    sqlite3*& db_;
    std::string last_error_;
};

// ============================================================================
// ExperienceStore - 'experiences' table
//
// Count-returning mutations report -1 on storage error.
// ============================================================================
class ExperienceStore {
public:
    ExperienceStore(sqlite3*& db, std::mutex& mutex, FullTextIndex& index, const MemoryConfig& config);
    
    // Topic upsert, else dedup within the window, else insert
    bool record(const ExperienceInput& input, RecordResult& out);
    
    // Active rows only; false when missing or soft-deleted
    bool get(int64_t id, Experience& out);
    
    // Ranked recall; falls back to recent() if the index cannot answer
    bool search(const std::string& query, const std::string& project,
                int limit, SearchResult& out);
    
    // Active rows within the timeline window around id, oldest first
    std::vector<Experience> timeline(int64_t id);
    
    std::vector<Experience> recent(int limit);
    std::vector<Experience> by_type(ExperienceType type, int limit);
    
    // Newest active rows whose type is not excluded; project empty = all,
    // otherwise that project plus global rows
    std::vector<Experience> recent_excluding(const std::vector<ExperienceType>& excluded,
                                             const std::string& project, int limit);
    
    // Every row, soft-deleted included, by id
    std::vector<Experience> scan_all();
    
    // Soft delete
    int soft_delete_by_id(int64_t id);
    int soft_delete_by_tag(const std::string& tag);         // substring of stored tags
    int soft_delete_by_tag_exact(const std::string& tag);   // exact member of tag set
    int soft_delete_by_project(const std::string& project);
    int prune_older_than(int days, bool only_failures);
    
    int count_active();
    int count_active_by_type(ExperienceType type);
    int count_deleted();
    
    std::string last_error() const;

private:
    sqlite3*& db_;
    std::mutex& mutex_;
    FullTextIndex& index_;
    const MemoryConfig& config_;
    std::string last_error_;
    
    bool find_by_topic(const std::string& topic_key, const std::string& project, Experience& out);
    bool find_duplicate(const std::string& hash, const std::string& project, int64_t since, int64_t& id);
    bool load_active(int64_t id, Experience& out);
    std::vector<Experience> query_list(const std::string& sql, int limit);
    
    // Soft-delete the active rows selected by ids, de-indexing each
    int soft_delete_ids(const std::vector<int64_t>& ids);
    // Collect active ids matching a WHERE fragment with one text parameter
    bool select_ids(const std::string& where, const std::string& param, std::vector<int64_t>& ids);
    
    int count_where(const std::string& where);
    void set_error(const std::string& error);
};

// ============================================================================
// PreferenceStore - 'preferences' table, unique on (key, scope)
// ============================================================================
class PreferenceStore {
public:
    static const double BASE_CONFIDENCE;    // 0.3
    static const double CONFIDENCE_STEP;    // 0.1
    
    PreferenceStore(sqlite3*& db, std::mutex& mutex);
    
    // Create at BASE_CONFIDENCE, or overwrite value/source and raise confidence
    bool affirm(const std::string& key, const std::string& value,
                const std::string& scope, const std::string& source, Preference& out);
    
    bool get(const std::string& key, const std::string& scope, Preference& out);
    
    // Raw confidence desc
    std::vector<Preference> list_global();
    std::vector<Preference> list_scope(const std::string& scope);
    
    // Global preferences with decay applied, effective confidence desc
    std::vector<ResolvedPreference> resolved_global(int64_t now_ms);
    
    // Global + project; the project row wins a shared key outright
    std::vector<ResolvedPreference> merged(const std::string& project, int64_t now_ms);
    
    // Hard delete rows whose raw confidence is below min_confidence; -1 on error
    int prune_below(double min_confidence);
    
    int count_global();
    int count_project();
    
    // 1.0 up to 30 days, 0.9 to 90, 0.7 to 180, then 0.5; unset = 0.5
    static double decay_factor(int64_t last_confirmed_at, int64_t now_ms);
    
    // round(confidence * decay, 2)
    static double effective_confidence(const Preference& pref, int64_t now_ms);
    
    std::string last_error() const;

private:
    sqlite3*& db_;
    std::mutex& mutex_;
    std::string last_error_;
    
    bool load(const std::string& key, const std::string& scope, Preference& out);
    std::vector<Preference> list_where_scope(const std::string& scope);
    int count_where(const std::string& where);
    void set_error(const std::string& error);
};

// ============================================================================
// PatternStore - 'patterns' table, unique on description
// ============================================================================
class PatternStore {
public:
    PatternStore(sqlite3*& db, std::mutex& mutex, const MemoryConfig& config);
    
    // New pattern at frequency 1, or frequency+1 with the example appended
    // (oldest examples evicted beyond the limit)
    bool record(const std::string& description, const std::string& category,
                const std::string& example, Pattern& out);
    
    bool get(const std::string& description, Pattern& out);
    
    // Frequency desc, most recently seen first on ties
    std::vector<Pattern> top(int limit);
    
    int count();
    
    std::string last_error() const;

private:
    sqlite3*& db_;
    std::mutex& mutex_;
    const MemoryConfig& config_;
    std::string last_error_;
    
    bool load(const std::string& description, Pattern& out);
    void set_error(const std::string& error);
};

// ============================================================================
// MemoryStore - Top-level store, owns the sqlite3 handle
// ============================================================================
class MemoryStore {
public:
    MemoryStore();
    ~MemoryStore();
    
    // Open (creating parent directories) and migrate to the latest schema
    bool open(const std::string& db_path, const MemoryConfig& config = MemoryConfig());
    void close();
    bool is_open() const;
    
    // Sub-store access
    FullTextIndex& index() { return index_; }
    ExperienceStore& experiences() { return experiences_; }
    PreferenceStore& preferences() { return preferences_; }
    PatternStore& patterns() { return patterns_; }
    
    const MemoryConfig& config() const { return config_; }
    
    // Fold the WAL back into the main file
    bool checkpoint();
    
    // Meta operations
    bool set_meta(const std::string& key, const std::string& value);
    std::string get_meta(const std::string& key, const std::string& default_val = "");
    int schema_version();
    
    // Raw handle for maintenance tooling; bypasses the store lock
    sqlite3* handle() { return db_; }
    
    std::string last_error() const;

private:
    sqlite3* db_;
    std::mutex mutex_;
    MemoryConfig config_;
    std::string last_error_;
    
    FullTextIndex index_;
    ExperienceStore experiences_;
    PreferenceStore preferences_;
    PatternStore patterns_;
    
    MemoryStore(const MemoryStore&);
    MemoryStore& operator=(const MemoryStore&);
};

} // namespace engram

#endif // engram_MEMORY_STORE_HPP
