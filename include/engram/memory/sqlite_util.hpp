/*
 * engram - SQLite helpers
 *
 * Statement    - prepared statement that finalizes itself
 * Transaction  - BEGIN IMMEDIATE ... COMMIT, rolled back unless committed
 */
#ifndef engram_MEMORY_SQLITE_UTIL_HPP
#define engram_MEMORY_SQLITE_UTIL_HPP

#include <string>
#include <cstdint>
#include <sqlite3.h>

namespace engram {

// Run one or more statements without result rows
bool exec_sql(sqlite3* db, const std::string& sql, std::string& error);

// Text column as std::string ("" for NULL)
std::string column_string(sqlite3_stmt* stmt, int col);

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();
    
    bool ok() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() { return stmt_; }
    const std::string& error() const { return error_; }
    
    void bind(int idx, const std::string& value);
    void bind(int idx, int64_t value);
    void bind(int idx, int value);
    void bind(int idx, double value);
    void bind_null(int idx);
    
    // SQLITE_ROW / SQLITE_DONE / error code; error() is set on failure
    int step();
    
    // Step to completion; false on error
    bool run();

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
    std::string error_;
    
    Statement(const Statement&);
    Statement& operator=(const Statement&);
};

class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();
    
    bool ok() const { return active_; }
    bool commit();
    void rollback();
    const std::string& error() const { return error_; }

private:
    sqlite3* db_;
    bool active_;
    std::string error_;
    
    Transaction(const Transaction&);
    Transaction& operator=(const Transaction&);
};

} // namespace engram

#endif // engram_MEMORY_SQLITE_UTIL_HPP
