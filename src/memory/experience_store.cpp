/*
 * engram - Experience Store
 *
 * Append-mostly log of experiences. Rows are never physically removed:
 * recurrences bump duplicate_count, topic upserts rewrite in place and
 * deletion sets deleted_at. Only active rows (deleted_at IS NULL) are
 * visible to reads and mirrored in the full-text index.
 */
#include <engram/memory/store.hpp>
#include <engram/memory/sqlite_util.hpp>
#include <engram/memory/ranking.hpp>
#include <engram/memory/text.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <map>

namespace engram {

namespace {

const char* EXPERIENCE_COLUMNS =
    "id, type, context, action, result, success, tags, project, created_at, "
    "deleted_at, normalized_hash, duplicate_count, last_seen_at, topic_key, revision_count";

// Column order matches EXPERIENCE_COLUMNS
Experience read_experience(sqlite3_stmt* stmt) {
    Experience e;
    e.id = sqlite3_column_int64(stmt, 0);
    
    std::string type = column_string(stmt, 1);
    if (!experience_type_from_string(type, e.type)) {
        LOG_WARN("[ExperienceStore] Unknown type '%s' on id=%lld", type.c_str(), (long long)e.id);
    }
    
    e.context = column_string(stmt, 2);
    e.action = column_string(stmt, 3);
    e.result = column_string(stmt, 4);
    e.success = sqlite3_column_int(stmt, 5) != 0;
    e.tags = column_string(stmt, 6);
    e.project = column_string(stmt, 7);
    e.created_at = sqlite3_column_int64(stmt, 8);
    e.deleted_at = sqlite3_column_type(stmt, 9) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt, 9);
    e.normalized_hash = column_string(stmt, 10);
    e.duplicate_count = sqlite3_column_int(stmt, 11);
    e.last_seen_at = sqlite3_column_int64(stmt, 12);
    e.topic_key = column_string(stmt, 13);
    e.revision_count = sqlite3_column_int(stmt, 14);
    return e;
}

std::string select_prefix() {
    return std::string("SELECT ") + EXPERIENCE_COLUMNS + " FROM experiences ";
}

bool has_exact_tag(const std::string& tags, const std::string& tag) {
    std::string wanted = trim(tag);
    for (const auto& part : split(tags, ',')) {
        if (trim(part) == wanted) return true;
    }
    return false;
}

} // anonymous namespace

ExperienceStore::ExperienceStore(sqlite3*& db, std::mutex& mutex, FullTextIndex& index,
                                 const MemoryConfig& config)
    : db_(db), mutex_(mutex), index_(index), config_(config) {}

void ExperienceStore::set_error(const std::string& error) {
    last_error_ = error;
    LOG_ERROR("[ExperienceStore] %s", error.c_str());
}

std::string ExperienceStore::last_error() const {
    return last_error_;
}

// ============================================================================
// Recording
// ============================================================================

bool ExperienceStore::find_by_topic(const std::string& topic_key, const std::string& project,
                                    Experience& out)
{
    Statement stmt(db_, select_prefix() +
        "WHERE topic_key = ? AND project = ? AND deleted_at IS NULL LIMIT 1");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    stmt.bind(1, topic_key);
    stmt.bind(2, project);
    
    if (stmt.step() != SQLITE_ROW) return false;
    out = read_experience(stmt.get());
    return true;
}

bool ExperienceStore::find_duplicate(const std::string& hash, const std::string& project,
                                     int64_t since, int64_t& id)
{
    Statement stmt(db_,
        "SELECT id FROM experiences "
        "WHERE normalized_hash = ? AND project = ? AND deleted_at IS NULL AND created_at >= ? "
        "ORDER BY created_at DESC LIMIT 1");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    stmt.bind(1, hash);
    stmt.bind(2, project);
    stmt.bind(3, since);
    
    if (stmt.step() != SQLITE_ROW) return false;
    id = sqlite3_column_int64(stmt.get(), 0);
    return true;
}

bool ExperienceStore::record(const ExperienceInput& input, RecordResult& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Transaction tx(db_);
    if (!tx.ok()) {
        set_error("record: " + tx.error());
        return false;
    }
    
    int64_t now = current_timestamp_ms();
    std::string hash = fingerprint(input.context, input.action, input.result);
    
    // Topic upsert takes priority over dedup
    Experience existing;
    if (!input.topic_key.empty() && find_by_topic(input.topic_key, input.project, existing)) {
        Statement stmt(db_,
            "UPDATE experiences SET context = ?, action = ?, result = ?, success = ?, tags = ?, "
            "  normalized_hash = ?, revision_count = revision_count + 1, last_seen_at = ? "
            "WHERE id = ?");
        if (!stmt.ok()) {
            set_error("record: " + stmt.error());
            return false;
        }
        stmt.bind(1, input.context);
        stmt.bind(2, input.action);
        stmt.bind(3, input.result);
        stmt.bind(4, input.success ? 1 : 0);
        stmt.bind(5, input.tags);
        stmt.bind(6, hash);
        stmt.bind(7, now);
        stmt.bind(8, existing.id);
        if (!stmt.run()) {
            set_error("record: topic update failed: " + stmt.error());
            return false;
        }
        
        existing.context = input.context;
        existing.action = input.action;
        existing.result = input.result;
        existing.tags = input.tags;
        if (!index_.replace(existing)) {
            set_error("record: " + index_.last_error());
            return false;
        }
        if (!tx.commit()) {
            set_error("record: " + tx.error());
            return false;
        }
        
        out.id = existing.id;
        out.outcome = RecordOutcome::UPSERTED;
        LOG_DEBUG("[ExperienceStore] Upserted id=%lld topic=%s revision=%d",
                  (long long)existing.id, input.topic_key.c_str(), existing.revision_count + 1);
        return true;
    }
    
    int64_t duplicate_id = 0;
    if (find_duplicate(hash, input.project, now - config_.dedup_window_ms, duplicate_id)) {
        Statement stmt(db_,
            "UPDATE experiences SET duplicate_count = duplicate_count + 1, last_seen_at = ? "
            "WHERE id = ?");
        if (!stmt.ok()) {
            set_error("record: " + stmt.error());
            return false;
        }
        stmt.bind(1, now);
        stmt.bind(2, duplicate_id);
        if (!stmt.run()) {
            set_error("record: duplicate update failed: " + stmt.error());
            return false;
        }
        if (!tx.commit()) {
            set_error("record: " + tx.error());
            return false;
        }
        
        out.id = duplicate_id;
        out.outcome = RecordOutcome::DEDUPLICATED;
        LOG_DEBUG("[ExperienceStore] Duplicate of id=%lld", (long long)duplicate_id);
        return true;
    }
    
    Statement stmt(db_,
        "INSERT INTO experiences (type, context, action, result, success, tags, project, created_at, "
        "  normalized_hash, duplicate_count, last_seen_at, topic_key, revision_count) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 1, ?, ?, 1)");
    if (!stmt.ok()) {
        set_error("record: " + stmt.error());
        return false;
    }
    stmt.bind(1, std::string(experience_type_to_string(input.type)));
    stmt.bind(2, input.context);
    stmt.bind(3, input.action);
    stmt.bind(4, input.result);
    stmt.bind(5, input.success ? 1 : 0);
    stmt.bind(6, input.tags);
    stmt.bind(7, input.project);
    stmt.bind(8, now);
    stmt.bind(9, hash);
    stmt.bind(10, now);
    if (input.topic_key.empty()) {
        stmt.bind_null(11);
    } else {
        stmt.bind(11, input.topic_key);
    }
    if (!stmt.run()) {
        set_error("record: insert failed: " + stmt.error());
        return false;
    }
    
    Experience created;
    created.id = sqlite3_last_insert_rowid(db_);
    created.context = input.context;
    created.action = input.action;
    created.result = input.result;
    created.tags = input.tags;
    if (!index_.add(created)) {
        set_error("record: " + index_.last_error());
        return false;
    }
    if (!tx.commit()) {
        set_error("record: " + tx.error());
        return false;
    }
    
    out.id = created.id;
    out.outcome = RecordOutcome::CREATED;
    LOG_DEBUG("[ExperienceStore] Created id=%lld type=%s project='%s'",
              (long long)created.id, experience_type_to_string(input.type), input.project.c_str());
    return true;
}

// ============================================================================
// Reads
// ============================================================================

bool ExperienceStore::load_active(int64_t id, Experience& out) {
    Statement stmt(db_, select_prefix() + "WHERE id = ? AND deleted_at IS NULL");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    stmt.bind(1, id);
    
    if (stmt.step() != SQLITE_ROW) return false;
    out = read_experience(stmt.get());
    return true;
}

bool ExperienceStore::get(int64_t id, Experience& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_active(id, out);
}

std::vector<Experience> ExperienceStore::query_list(const std::string& sql, int limit) {
    std::vector<Experience> results;
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        set_error("query failed: " + stmt.error());
        return results;
    }
    if (limit >= 0) {
        stmt.bind(sqlite3_bind_parameter_count(stmt.get()), limit);
    }
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.push_back(read_experience(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        set_error("query failed: " + stmt.error());
    }
    return results;
}

std::vector<Experience> ExperienceStore::recent(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_list(select_prefix() +
        "WHERE deleted_at IS NULL ORDER BY created_at DESC, id DESC LIMIT ?", limit);
}

std::vector<Experience> ExperienceStore::by_type(ExperienceType type, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<Experience> results;
    Statement stmt(db_, select_prefix() +
        "WHERE deleted_at IS NULL AND type = ? ORDER BY created_at DESC, id DESC LIMIT ?");
    if (!stmt.ok()) {
        set_error("by_type: " + stmt.error());
        return results;
    }
    stmt.bind(1, std::string(experience_type_to_string(type)));
    stmt.bind(2, limit);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.push_back(read_experience(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        set_error("by_type: " + stmt.error());
    }
    return results;
}

std::vector<Experience> ExperienceStore::recent_excluding(const std::vector<ExperienceType>& excluded,
                                                          const std::string& project, int limit)
{
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string sql = select_prefix() + "WHERE deleted_at IS NULL ";
    if (!excluded.empty()) {
        sql += "AND type NOT IN (";
        for (size_t i = 0; i < excluded.size(); ++i) {
            sql += i ? ", ?" : "?";
        }
        sql += ") ";
    }
    if (!project.empty()) {
        sql += "AND (project = ? OR project = '') ";
    }
    sql += "ORDER BY created_at DESC, id DESC LIMIT ?";
    
    std::vector<Experience> results;
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        set_error("recent_excluding: " + stmt.error());
        return results;
    }
    
    int idx = 1;
    for (ExperienceType type : excluded) {
        stmt.bind(idx++, std::string(experience_type_to_string(type)));
    }
    if (!project.empty()) {
        stmt.bind(idx++, project);
    }
    stmt.bind(idx++, limit);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.push_back(read_experience(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        set_error("recent_excluding: " + stmt.error());
    }
    return results;
}

std::vector<Experience> ExperienceStore::scan_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_list(select_prefix() + "ORDER BY id", -1);
}

std::vector<Experience> ExperienceStore::timeline(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<Experience> results;
    Experience target;
    if (!load_active(id, target)) return results;
    
    Statement stmt(db_, select_prefix() +
        "WHERE deleted_at IS NULL AND created_at BETWEEN ? AND ? "
        "ORDER BY created_at ASC, id ASC LIMIT ?");
    if (!stmt.ok()) {
        set_error("timeline: " + stmt.error());
        return results;
    }
    stmt.bind(1, target.created_at - config_.timeline_window_ms);
    stmt.bind(2, target.created_at + config_.timeline_window_ms);
    stmt.bind(3, config_.timeline_limit);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.push_back(read_experience(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        set_error("timeline: " + stmt.error());
    }
    return results;
}

// ============================================================================
// Search
// ============================================================================

bool ExperienceStore::search(const std::string& query, const std::string& project,
                             int limit, SearchResult& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    
    out.hits.clear();
    out.fallback = false;
    if (limit <= 0) return true;
    
    int64_t now = current_timestamp_ms();
    std::vector<IndexMatch> matches;
    if (!index_.match(query, project, now, limit, matches)) {
        LOG_WARN("[ExperienceStore] Index query '%s' failed (%s), returning recent experiences",
                 query.c_str(), index_.last_error().c_str());
        out.fallback = true;
        for (const auto& e : query_list(select_prefix() +
                 "WHERE deleted_at IS NULL ORDER BY created_at DESC, id DESC LIMIT ?", limit)) {
            ScoredExperience hit;
            hit.entry = e;
            out.hits.push_back(hit);
        }
        return true;
    }
    
    if (matches.empty()) return true;
    
    std::map<int64_t, double> relevance;
    std::string sql = select_prefix() + "WHERE deleted_at IS NULL AND id IN (";
    for (size_t i = 0; i < matches.size(); ++i) {
        relevance[matches[i].id] = matches[i].relevance;
        sql += i ? ", ?" : "?";
    }
    sql += ")";
    
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
        set_error("search: " + stmt.error());
        return false;
    }
    for (size_t i = 0; i < matches.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), matches[i].id);
    }
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ScoredExperience hit;
        hit.entry = read_experience(stmt.get());
        hit.relevance = relevance[hit.entry.id];
        out.hits.push_back(hit);
    }
    if (rc != SQLITE_DONE) {
        set_error("search: " + stmt.error());
        out.hits.clear();
        return false;
    }
    
    // Rows come back unordered from the IN (...) lookup
    rank_hits(out.hits, project, now);
    
    LOG_DEBUG("[ExperienceStore] Search '%s' project='%s' -> %zu hits",
              query.c_str(), project.c_str(), out.hits.size());
    return true;
}

// ============================================================================
// Soft delete
// ============================================================================

int ExperienceStore::soft_delete_ids(const std::vector<int64_t>& ids) {
    if (ids.empty()) return 0;
    
    Transaction tx(db_);
    if (!tx.ok()) {
        set_error("soft delete: " + tx.error());
        return -1;
    }
    
    Statement stmt(db_, "UPDATE experiences SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL");
    if (!stmt.ok()) {
        set_error("soft delete: " + stmt.error());
        return -1;
    }
    
    int64_t now = current_timestamp_ms();
    int count = 0;
    for (int64_t id : ids) {
        sqlite3_reset(stmt.get());
        stmt.bind(1, now);
        stmt.bind(2, id);
        if (!stmt.run()) {
            set_error("soft delete id=" + std::to_string(id) + ": " + stmt.error());
            return -1;
        }
        if (sqlite3_changes(db_) == 0) continue;
        
        if (!index_.remove(id)) {
            set_error("soft delete: " + index_.last_error());
            return -1;
        }
        ++count;
    }
    
    if (!tx.commit()) {
        set_error("soft delete: " + tx.error());
        return -1;
    }
    return count;
}

bool ExperienceStore::select_ids(const std::string& where, const std::string& param,
                                 std::vector<int64_t>& ids)
{
    Statement stmt(db_, "SELECT id FROM experiences WHERE deleted_at IS NULL AND " + where);
    if (!stmt.ok()) {
        set_error("select: " + stmt.error());
        return false;
    }
    stmt.bind(1, param);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        set_error("select: " + stmt.error());
        return false;
    }
    return true;
}

int ExperienceStore::soft_delete_by_id(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = soft_delete_ids(std::vector<int64_t>(1, id));
    if (count >= 0) {
        LOG_INFO("[ExperienceStore] Soft-deleted id=%lld (%d row)", (long long)id, count);
    }
    return count;
}

int ExperienceStore::soft_delete_by_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<int64_t> ids;
    if (!select_ids("tags LIKE '%' || ? || '%'", tag, ids)) return -1;
    
    int count = soft_delete_ids(ids);
    if (count >= 0) {
        LOG_INFO("[ExperienceStore] Soft-deleted %d experiences tagged like '%s'", count, tag.c_str());
    }
    return count;
}

int ExperienceStore::soft_delete_by_tag_exact(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<int64_t> ids;
    Statement stmt(db_,
        "SELECT id, tags FROM experiences WHERE deleted_at IS NULL AND tags LIKE '%' || ? || '%'");
    if (!stmt.ok()) {
        set_error("soft delete by tag: " + stmt.error());
        return -1;
    }
    stmt.bind(1, trim(tag));
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        if (has_exact_tag(column_string(stmt.get(), 1), tag)) {
            ids.push_back(sqlite3_column_int64(stmt.get(), 0));
        }
    }
    if (rc != SQLITE_DONE) {
        set_error("soft delete by tag: " + stmt.error());
        return -1;
    }
    
    int count = soft_delete_ids(ids);
    if (count >= 0) {
        LOG_INFO("[ExperienceStore] Soft-deleted %d experiences tagged '%s'", count, tag.c_str());
    }
    return count;
}

int ExperienceStore::soft_delete_by_project(const std::string& project) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<int64_t> ids;
    if (!select_ids("project = ?", project, ids)) return -1;
    
    int count = soft_delete_ids(ids);
    if (count >= 0) {
        LOG_INFO("[ExperienceStore] Soft-deleted %d experiences of project '%s'", count, project.c_str());
    }
    return count;
}

int ExperienceStore::prune_older_than(int days, bool only_failures) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    int64_t cutoff = current_timestamp_ms() - static_cast<int64_t>(days) * MS_PER_DAY;
    
    std::vector<int64_t> ids;
    Statement stmt(db_,
        "SELECT id FROM experiences "
        "WHERE deleted_at IS NULL AND created_at < ? AND (? = 0 OR success = 0)");
    if (!stmt.ok()) {
        set_error("prune: " + stmt.error());
        return -1;
    }
    stmt.bind(1, cutoff);
    stmt.bind(2, only_failures ? 1 : 0);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        set_error("prune: " + stmt.error());
        return -1;
    }
    
    int count = soft_delete_ids(ids);
    if (count >= 0) {
        LOG_INFO("[ExperienceStore] Pruned %d experiences older than %d days%s",
                 count, days, only_failures ? " (failures only)" : "");
    }
    return count;
}

// ============================================================================
// Counts
// ============================================================================

int ExperienceStore::count_where(const std::string& where) {
    Statement stmt(db_, "SELECT COUNT(*) FROM experiences WHERE " + where);
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        set_error("count: " + stmt.error());
        return -1;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int ExperienceStore::count_active() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_where("deleted_at IS NULL");
}

int ExperienceStore::count_active_by_type(ExperienceType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Statement stmt(db_, "SELECT COUNT(*) FROM experiences WHERE deleted_at IS NULL AND type = ?");
    if (!stmt.ok()) {
        set_error("count: " + stmt.error());
        return -1;
    }
    stmt.bind(1, std::string(experience_type_to_string(type)));
    if (stmt.step() != SQLITE_ROW) {
        set_error("count: " + stmt.error());
        return -1;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int ExperienceStore::count_deleted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_where("deleted_at IS NOT NULL");
}

} // namespace engram
