#include <engram/memory/sqlite_util.hpp>
#include <engram/core/logger.hpp>

namespace engram {

bool exec_sql(sqlite3* db, const std::string& sql, std::string& error) {
    if (!db) {
        error = "database not open";
        return false;
    }
    
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);
    
    if (rc != SQLITE_OK) {
        error = err_msg ? err_msg : sqlite3_errstr(rc);
        if (err_msg) sqlite3_free(err_msg);
        LOG_ERROR("[SQLite] SQL error: %s\n  Query: %s", error.c_str(), sql.c_str());
        return false;
    }
    
    return true;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col))) : std::string();
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
    if (!db_) {
        error_ = "database not open";
        return;
    }
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        error_ = sqlite3_errmsg(db_);
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::bind(int idx, const std::string& value) {
    sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int idx, int64_t value) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
}

void Statement::bind(int idx, int value) {
    sqlite3_bind_int(stmt_, idx, value);
}

void Statement::bind(int idx, double value) {
    sqlite3_bind_double(stmt_, idx, value);
}

void Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
}

int Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        error_ = sqlite3_errmsg(db_);
    }
    return rc;
}

bool Statement::run() {
    int rc;
    while ((rc = step()) == SQLITE_ROW) {}
    return rc == SQLITE_DONE;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(sqlite3* db) : db_(db), active_(false) {
    active_ = exec_sql(db_, "BEGIN IMMEDIATE", error_);
}

Transaction::~Transaction() {
    if (active_) rollback();
}

bool Transaction::commit() {
    if (!active_) return false;
    if (!exec_sql(db_, "COMMIT", error_)) {
        rollback();
        return false;
    }
    active_ = false;
    return true;
}

void Transaction::rollback() {
    if (!active_) return;
    std::string ignored;
    if (!exec_sql(db_, "ROLLBACK", ignored)) {
        LOG_WARN("[SQLite] Rollback failed: %s", ignored.c_str());
    }
    active_ = false;
}

} // namespace engram
