#include <engram/memory/migrations.hpp>
#include <engram/memory/sqlite_util.hpp>
#include <engram/memory/text.hpp>
#include <engram/core/logger.hpp>
#include <cstdlib>
#include <cctype>

namespace engram {

namespace {

bool create_base_tables(sqlite3* db, std::string& error) {
    return exec_sql(db,
        "CREATE TABLE IF NOT EXISTS experiences ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  type TEXT NOT NULL DEFAULT 'experience',"
        "  context TEXT NOT NULL,"
        "  action TEXT NOT NULL,"
        "  result TEXT NOT NULL,"
        "  success INTEGER NOT NULL DEFAULT 1,"
        "  tags TEXT NOT NULL DEFAULT '',"
        "  project TEXT NOT NULL DEFAULT '',"
        "  created_at INTEGER NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_experiences_created ON experiences(created_at);"
        "CREATE INDEX IF NOT EXISTS idx_experiences_project ON experiences(project);"
        "CREATE INDEX IF NOT EXISTS idx_experiences_type ON experiences(type);"
        "CREATE TABLE IF NOT EXISTS patterns ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  description TEXT NOT NULL UNIQUE,"
        "  category TEXT NOT NULL DEFAULT '',"
        "  frequency INTEGER NOT NULL DEFAULT 1,"
        "  examples TEXT NOT NULL DEFAULT '[]',"
        "  last_seen INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS preferences ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  key TEXT NOT NULL,"
        "  value TEXT NOT NULL,"
        "  confidence REAL NOT NULL DEFAULT 0.3,"
        "  source TEXT NOT NULL DEFAULT '',"
        "  scope TEXT NOT NULL DEFAULT 'global',"
        "  updated_at INTEGER NOT NULL,"
        "  UNIQUE(key, scope)"
        ")",
        error);
}

bool add_experience_lifecycle(sqlite3* db, std::string& error) {
    bool ok = exec_sql(db,
        "ALTER TABLE experiences ADD COLUMN deleted_at INTEGER;"
        "ALTER TABLE experiences ADD COLUMN normalized_hash TEXT NOT NULL DEFAULT '';"
        "ALTER TABLE experiences ADD COLUMN duplicate_count INTEGER NOT NULL DEFAULT 1;"
        "ALTER TABLE experiences ADD COLUMN last_seen_at INTEGER NOT NULL DEFAULT 0;"
        "ALTER TABLE experiences ADD COLUMN topic_key TEXT;"
        "ALTER TABLE experiences ADD COLUMN revision_count INTEGER NOT NULL DEFAULT 1;"
        "UPDATE experiences SET last_seen_at = created_at WHERE last_seen_at = 0;"
        "CREATE INDEX IF NOT EXISTS idx_experiences_hash ON experiences(normalized_hash, project);"
        "CREATE INDEX IF NOT EXISTS idx_experiences_deleted ON experiences(deleted_at);"
        "CREATE UNIQUE INDEX IF NOT EXISTS ux_experiences_topic ON experiences(topic_key, project) "
        "  WHERE deleted_at IS NULL AND topic_key IS NOT NULL",
        error);
    if (!ok) return false;
    
    // Fingerprint rows written before hashes existed
    Statement select(db, "SELECT id, context, action, result FROM experiences WHERE normalized_hash = ''");
    Statement update(db, "UPDATE experiences SET normalized_hash = ? WHERE id = ?");
    if (!select.ok() || !update.ok()) {
        error = select.ok() ? update.error() : select.error();
        return false;
    }
    
    int backfilled = 0;
    int rc;
    while ((rc = select.step()) == SQLITE_ROW) {
        int64_t id = sqlite3_column_int64(select.get(), 0);
        std::string hash = fingerprint(column_string(select.get(), 1),
                                       column_string(select.get(), 2),
                                       column_string(select.get(), 3));
        sqlite3_reset(update.get());
        update.bind(1, hash);
        update.bind(2, id);
        if (!update.run()) {
            error = update.error();
            return false;
        }
        ++backfilled;
    }
    if (rc != SQLITE_DONE) {
        error = select.error();
        return false;
    }
    
    if (backfilled > 0) {
        LOG_INFO("[Migrations] Fingerprinted %d existing experiences", backfilled);
    }
    return true;
}

bool add_preference_decay(sqlite3* db, std::string& error) {
    return exec_sql(db,
        "ALTER TABLE preferences ADD COLUMN confirmed_count INTEGER NOT NULL DEFAULT 1;"
        "ALTER TABLE preferences ADD COLUMN last_confirmed_at INTEGER;"
        "UPDATE preferences SET last_confirmed_at = updated_at WHERE last_confirmed_at IS NULL",
        error);
}

bool create_fts_index(sqlite3* db, std::string& error) {
    return exec_sql(db,
        "CREATE VIRTUAL TABLE IF NOT EXISTS experiences_fts USING fts5("
        "  context, action, result, tags,"
        "  tokenize='porter unicode61'"
        ");"
        "INSERT INTO experiences_fts(rowid, context, action, result, tags) "
        "  SELECT id, context, action, result, tags FROM experiences WHERE deleted_at IS NULL",
        error);
}

// Declared type of table.column, "" when the column (or table) is absent
bool declared_type(sqlite3* db, const char* table, const char* column,
                   std::string& type, std::string& error)
{
    Statement stmt(db, "SELECT type FROM pragma_table_info(?) WHERE name = ?");
    if (!stmt.ok()) {
        error = stmt.error();
        return false;
    }
    stmt.bind(1, std::string(table));
    stmt.bind(2, std::string(column));
    
    type.clear();
    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        type = column_string(stmt.get(), 0);
        for (auto& c : type) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return true;
    }
    if (rc != SQLITE_DONE) {
        error = stmt.error();
        return false;
    }
    return true;
}

// An unversioned database is replayed from step 1, which only works for the
// version 1 layout. Anything else (text timestamps, trigger-maintained FTS,
// lifecycle columns already present) is refused instead of half-migrated.
bool check_unversioned_layout(sqlite3* db, std::string& error) {
    static const char* const TIMESTAMPS[][2] = {
        {"experiences", "created_at"},
        {"patterns", "last_seen"},
        {"preferences", "updated_at"},
    };
    for (const auto& col : TIMESTAMPS) {
        std::string type;
        if (!declared_type(db, col[0], col[1], type, error)) return false;
        if (!type.empty() && type != "INTEGER") {
            error = std::string("unrecognized database layout: ") + col[0] + "." + col[1] +
                    " is " + type + ", expected INTEGER epoch milliseconds";
            return false;
        }
    }
    
    std::string type;
    if (!declared_type(db, "experiences", "deleted_at", type, error)) return false;
    if (!type.empty()) {
        error = "unrecognized database layout: experiences.deleted_at exists without a schema version";
        return false;
    }
    
    Statement stmt(db,
        "SELECT name FROM sqlite_master "
        "WHERE name = 'experiences_fts' OR (type = 'trigger' AND tbl_name = 'experiences') LIMIT 1");
    if (!stmt.ok()) {
        error = stmt.error();
        return false;
    }
    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        error = "unrecognized database layout: " + column_string(stmt.get(), 0) +
                " exists without a schema version";
        return false;
    }
    if (rc != SQLITE_DONE) {
        error = stmt.error();
        return false;
    }
    return true;
}

bool write_schema_version(sqlite3* db, int version, std::string& error) {
    Statement stmt(db, "INSERT OR REPLACE INTO meta (key, value) VALUES ('schema_version', ?)");
    if (!stmt.ok()) {
        error = stmt.error();
        return false;
    }
    stmt.bind(1, std::to_string(version));
    if (!stmt.run()) {
        error = stmt.error();
        return false;
    }
    return true;
}

} // anonymous namespace

const std::vector<Migration>& schema_migrations() {
    static const std::vector<Migration> steps = {
        {1, "base tables", &create_base_tables},
        {2, "experience lifecycle columns", &add_experience_lifecycle},
        {3, "preference decay columns", &add_preference_decay},
        {4, "full-text index", &create_fts_index},
    };
    return steps;
}

int latest_schema_version() {
    return schema_migrations().back().version;
}

int read_schema_version(sqlite3* db, std::string& error) {
    if (!exec_sql(db, "CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT NOT NULL)", error)) {
        return -1;
    }
    
    Statement stmt(db, "SELECT value FROM meta WHERE key = 'schema_version'");
    if (!stmt.ok()) {
        error = stmt.error();
        return -1;
    }
    
    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return std::atoi(column_string(stmt.get(), 0).c_str());
    }
    if (rc != SQLITE_DONE) {
        error = stmt.error();
        return -1;
    }
    return 0;
}

bool migrate(sqlite3* db, std::string& error) {
    int current = read_schema_version(db, error);
    if (current < 0) return false;
    
    int latest = latest_schema_version();
    if (current > latest) {
        error = "database schema version " + std::to_string(current) +
                " is newer than supported version " + std::to_string(latest);
        return false;
    }
    if (current == 0 && !check_unversioned_layout(db, error)) {
        LOG_ERROR("[Migrations] Refusing to adopt database: %s", error.c_str());
        return false;
    }
    
    for (const auto& step : schema_migrations()) {
        if (step.version <= current) continue;
        
        Transaction tx(db);
        if (!tx.ok()) {
            error = tx.error();
            return false;
        }
        if (!step.apply(db, error) || !write_schema_version(db, step.version, error)) {
            LOG_ERROR("[Migrations] Step %d (%s) failed: %s", step.version, step.name, error.c_str());
            return false;
        }
        if (!tx.commit()) {
            error = tx.error();
            return false;
        }
        LOG_INFO("[Migrations] Applied schema version %d (%s)", step.version, step.name);
    }
    
    return true;
}

} // namespace engram
