/*
 * engram - Memory Store Implementation
 * 
 * Owns the SQLite connection (WAL mode) and brings its schema up to date
 * on open. Entity operations live in the sub-store sources.
 */
#include <engram/memory/store.hpp>
#include <engram/memory/migrations.hpp>
#include <engram/memory/sqlite_util.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

namespace engram {

MemoryStore::MemoryStore()
    : db_(nullptr)
    , index_(db_)
    , experiences_(db_, mutex_, index_, config_)
    , preferences_(db_, mutex_)
    , patterns_(db_, mutex_, config_) {}

MemoryStore::~MemoryStore() {
    close();
}

bool MemoryStore::open(const std::string& db_path, const MemoryConfig& config) {
    if (db_) {
        close();
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    
    std::string path = db_path == ":memory:" ? db_path : expand_home(db_path);
    
    // Ensure parent directory exists
    if (path != ":memory:" && !create_parent_directory(path)) {
        last_error_ = "cannot create parent directory for '" + path + "'";
        LOG_ERROR("[MemoryStore] %s", last_error_.c_str());
        return false;
    }
    
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        LOG_ERROR("[MemoryStore] Failed to open database '%s': %s", path.c_str(), last_error_.c_str());
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }
    
    // WAL: readers never block the single writer
    if (!exec_sql(db_, "PRAGMA journal_mode=WAL", last_error_) ||
        !exec_sql(db_, "PRAGMA synchronous=NORMAL", last_error_) ||
        !exec_sql(db_, "PRAGMA busy_timeout=5000", last_error_)) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    if (!migrate(db_, last_error_)) {
        LOG_ERROR("[MemoryStore] Schema migration failed: %s", last_error_.c_str());
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    LOG_INFO("[MemoryStore] Database opened: %s (schema v%d)", path.c_str(), latest_schema_version());
    return true;
}

void MemoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("[MemoryStore] Database closed");
    }
}

bool MemoryStore::is_open() const {
    return db_ != nullptr;
}

bool MemoryStore::checkpoint() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }
    
    int log_frames = 0;
    int checkpointed = 0;
    int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, &log_frames, &checkpointed);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        LOG_WARN("[MemoryStore] WAL checkpoint failed: %s", last_error_.c_str());
        return false;
    }
    
    LOG_DEBUG("[MemoryStore] WAL checkpoint: %d/%d frames", checkpointed, log_frames);
    return true;
}

// ============================================================================
// Meta Operations
// ============================================================================

bool MemoryStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Statement stmt(db_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    stmt.bind(1, key);
    stmt.bind(2, value);
    if (!stmt.run()) {
        last_error_ = stmt.error();
        LOG_ERROR("[MemoryStore] set_meta '%s' failed: %s", key.c_str(), last_error_.c_str());
        return false;
    }
    return true;
}

std::string MemoryStore::get_meta(const std::string& key, const std::string& default_val) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Statement stmt(db_, "SELECT value FROM meta WHERE key = ?");
    if (!stmt.ok()) return default_val;
    stmt.bind(1, key);
    
    if (stmt.step() != SQLITE_ROW) return default_val;
    return column_string(stmt.get(), 0);
}

int MemoryStore::schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;
    
    int version = read_schema_version(db_, last_error_);
    return version < 0 ? 0 : version;
}

std::string MemoryStore::last_error() const {
    return last_error_;
}

} // namespace engram
