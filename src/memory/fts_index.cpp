/*
 * engram - Full-text index over active experiences
 *
 * A plain FTS5 table keyed by rowid = experience id. The experience store
 * adds, replaces and removes entries explicitly inside its own write
 * transactions, so the index only ever holds active rows.
 */
#include <engram/memory/store.hpp>
#include <engram/memory/ranking.hpp>
#include <engram/memory/sqlite_util.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

namespace engram {

FullTextIndex::FullTextIndex(sqlite3*& db) : db_(db) {}

bool FullTextIndex::add(const Experience& e) {
    Statement stmt(db_,
        "INSERT INTO experiences_fts (rowid, context, action, result, tags) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    
    stmt.bind(1, e.id);
    stmt.bind(2, e.context);
    stmt.bind(3, e.action);
    stmt.bind(4, e.result);
    stmt.bind(5, e.tags);
    
    if (!stmt.run()) {
        last_error_ = stmt.error();
        LOG_ERROR("[FullTextIndex] add id=%lld failed: %s", (long long)e.id, last_error_.c_str());
        return false;
    }
    return true;
}

bool FullTextIndex::remove(int64_t id) {
    Statement stmt(db_, "DELETE FROM experiences_fts WHERE rowid = ?");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    
    stmt.bind(1, id);
    if (!stmt.run()) {
        last_error_ = stmt.error();
        LOG_ERROR("[FullTextIndex] remove id=%lld failed: %s", (long long)id, last_error_.c_str());
        return false;
    }
    return true;
}

bool FullTextIndex::replace(const Experience& e) {
    return remove(e.id) && add(e);
}

bool FullTextIndex::rebuild() {
    bool ok = exec_sql(db_,
        "DELETE FROM experiences_fts;"
        "INSERT INTO experiences_fts (rowid, context, action, result, tags) "
        "  SELECT id, context, action, result, tags FROM experiences WHERE deleted_at IS NULL",
        last_error_);
    if (ok) {
        LOG_INFO("[FullTextIndex] Rebuilt index (%d entries)", count());
    }
    return ok;
}

bool FullTextIndex::match(const std::string& query, const std::string& project,
                          int64_t now_ms, int limit, std::vector<IndexMatch>& out)
{
    out.clear();
    if (query.empty() || limit <= 0) return true;
    
    // Same blend as combine_score(), so the LIMIT keeps the true top rows.
    // The table is not aliased: FTS5 auxiliary functions need its real name.
    std::string sql =
        "SELECT id, relevance, "
        "       ? * relevance "
        "     + ? * (1.0 / (1.0 + max(0.0, (? - created_at) / ?))) "
        "     + ? * (CASE WHEN success THEN 1.0 ELSE 0.5 END) "
        "     + (CASE WHEN ? <> '' AND project = ? THEN ? ELSE 0.0 END) AS score "
        "FROM ("
        "  SELECT e.id AS id, e.created_at AS created_at, e.success AS success, "
        "         e.project AS project, -bm25(experiences_fts) AS relevance "
        "  FROM experiences_fts "
        "  JOIN experiences e ON e.id = experiences_fts.rowid "
        "  WHERE experiences_fts MATCH ? AND e.deleted_at IS NULL ";
    if (!project.empty()) {
        sql += "AND (e.project = ? OR e.project = '') ";
    }
    sql += ") ORDER BY score DESC, created_at DESC, id DESC LIMIT ?";
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    
    int idx = 1;
    stmt.bind(idx++, RELEVANCE_WEIGHT);
    stmt.bind(idx++, RECENCY_WEIGHT);
    stmt.bind(idx++, now_ms);
    stmt.bind(idx++, static_cast<double>(MS_PER_DAY));
    stmt.bind(idx++, OUTCOME_WEIGHT);
    stmt.bind(idx++, project);
    stmt.bind(idx++, project);
    stmt.bind(idx++, SCOPE_BONUS);
    stmt.bind(idx++, query);
    if (!project.empty()) {
        stmt.bind(idx++, project);
    }
    stmt.bind(idx++, limit);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        IndexMatch m;
        m.id = sqlite3_column_int64(stmt.get(), 0);
        m.relevance = sqlite3_column_double(stmt.get(), 1);
        m.score = sqlite3_column_double(stmt.get(), 2);
        out.push_back(m);
    }
    
    if (rc != SQLITE_DONE) {
        last_error_ = stmt.error();
        out.clear();
        return false;
    }
    
    LOG_DEBUG("[FullTextIndex] '%s' matched %zu entries", query.c_str(), out.size());
    return true;
}

int FullTextIndex::count() {
    Statement stmt(db_, "SELECT COUNT(*) FROM experiences_fts");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        last_error_ = stmt.error();
        return -1;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

std::string FullTextIndex::last_error() const {
    return last_error_;
}

} // namespace engram
