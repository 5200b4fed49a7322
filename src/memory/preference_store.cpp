/*
 * engram - Preference Store
 *
 * Key/value beliefs scoped "global" or per project. Confidence grows with
 * each affirmation and is discounted at read time by how long ago the
 * preference was last confirmed. The stored value never decays.
 */
#include <engram/memory/store.hpp>
#include <engram/memory/sqlite_util.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <map>

namespace engram {

const double PreferenceStore::BASE_CONFIDENCE = 0.3;
const double PreferenceStore::CONFIDENCE_STEP = 0.1;

namespace {

const char* PREFERENCE_SELECT =
    "SELECT id, key, value, confidence, source, scope, confirmed_count, last_confirmed_at, updated_at "
    "FROM preferences ";

Preference read_preference(sqlite3_stmt* stmt) {
    Preference p;
    p.id = sqlite3_column_int64(stmt, 0);
    p.key = column_string(stmt, 1);
    p.value = column_string(stmt, 2);
    p.confidence = sqlite3_column_double(stmt, 3);
    p.source = column_string(stmt, 4);
    p.scope = column_string(stmt, 5);
    p.confirmed_count = sqlite3_column_int(stmt, 6);
    p.last_confirmed_at = sqlite3_column_type(stmt, 7) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt, 7);
    p.updated_at = sqlite3_column_int64(stmt, 8);
    return p;
}

ResolvedPreference resolve(const Preference& p, const std::string& origin, int64_t now_ms) {
    ResolvedPreference r;
    r.pref = p;
    r.origin = origin;
    r.decay_factor = PreferenceStore::decay_factor(p.last_confirmed_at, now_ms);
    r.effective_confidence = round_to(p.confidence * r.decay_factor, 2);
    return r;
}

void sort_by_effective(std::vector<ResolvedPreference>& prefs) {
    std::stable_sort(prefs.begin(), prefs.end(),
        [](const ResolvedPreference& a, const ResolvedPreference& b) {
            return a.effective_confidence > b.effective_confidence;
        });
}

} // anonymous namespace

PreferenceStore::PreferenceStore(sqlite3*& db, std::mutex& mutex) : db_(db), mutex_(mutex) {}

void PreferenceStore::set_error(const std::string& error) {
    last_error_ = error;
    LOG_ERROR("[PreferenceStore] %s", error.c_str());
}

std::string PreferenceStore::last_error() const {
    return last_error_;
}

double PreferenceStore::decay_factor(int64_t last_confirmed_at, int64_t now_ms) {
    if (last_confirmed_at <= 0) return 0.5;
    
    double days = static_cast<double>(now_ms - last_confirmed_at) / static_cast<double>(MS_PER_DAY);
    if (days <= 30.0) return 1.0;
    if (days <= 90.0) return 0.9;
    if (days <= 180.0) return 0.7;
    return 0.5;
}

double PreferenceStore::effective_confidence(const Preference& pref, int64_t now_ms) {
    return round_to(pref.confidence * decay_factor(pref.last_confirmed_at, now_ms), 2);
}

bool PreferenceStore::load(const std::string& key, const std::string& scope, Preference& out) {
    Statement stmt(db_, std::string(PREFERENCE_SELECT) + "WHERE key = ? AND scope = ?");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    stmt.bind(1, key);
    stmt.bind(2, scope);
    
    if (stmt.step() != SQLITE_ROW) return false;
    out = read_preference(stmt.get());
    return true;
}

bool PreferenceStore::affirm(const std::string& key, const std::string& value,
                             const std::string& scope, const std::string& source, Preference& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    
    Transaction tx(db_);
    if (!tx.ok()) {
        set_error("affirm: " + tx.error());
        return false;
    }
    
    int64_t now = current_timestamp_ms();
    Preference existing;
    
    if (load(key, scope, existing)) {
        // Computed from the count before this confirmation
        double confidence = round_to(std::min(1.0, BASE_CONFIDENCE + existing.confirmed_count * CONFIDENCE_STEP), 2);
        confidence = std::max(confidence, existing.confidence);
        
        Statement stmt(db_,
            "UPDATE preferences SET value = ?, source = ?, confidence = ?, "
            "  confirmed_count = confirmed_count + 1, updated_at = ?, last_confirmed_at = ? "
            "WHERE id = ?");
        if (!stmt.ok()) {
            set_error("affirm: " + stmt.error());
            return false;
        }
        stmt.bind(1, value);
        stmt.bind(2, source);
        stmt.bind(3, confidence);
        stmt.bind(4, now);
        stmt.bind(5, now);
        stmt.bind(6, existing.id);
        if (!stmt.run()) {
            set_error("affirm: update failed: " + stmt.error());
            return false;
        }
    } else {
        Statement stmt(db_,
            "INSERT INTO preferences (key, value, confidence, source, scope, confirmed_count, "
            "  last_confirmed_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, 1, ?, ?)");
        if (!stmt.ok()) {
            set_error("affirm: " + stmt.error());
            return false;
        }
        stmt.bind(1, key);
        stmt.bind(2, value);
        stmt.bind(3, BASE_CONFIDENCE);
        stmt.bind(4, source);
        stmt.bind(5, scope);
        stmt.bind(6, now);
        stmt.bind(7, now);
        if (!stmt.run()) {
            set_error("affirm: insert failed: " + stmt.error());
            return false;
        }
    }
    
    if (!load(key, scope, out)) {
        set_error("affirm: preference vanished after write");
        return false;
    }
    if (!tx.commit()) {
        set_error("affirm: " + tx.error());
        return false;
    }
    
    LOG_DEBUG("[PreferenceStore] %s [%s] = '%s' confidence=%.2f count=%d",
              key.c_str(), scope.c_str(), value.c_str(), out.confidence, out.confirmed_count);
    return true;
}

bool PreferenceStore::get(const std::string& key, const std::string& scope, Preference& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(key, scope, out);
}

std::vector<Preference> PreferenceStore::list_where_scope(const std::string& scope) {
    std::vector<Preference> results;
    
    Statement stmt(db_, std::string(PREFERENCE_SELECT) +
        "WHERE scope = ? ORDER BY confidence DESC, key ASC");
    if (!stmt.ok()) {
        set_error("list: " + stmt.error());
        return results;
    }
    stmt.bind(1, scope);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.push_back(read_preference(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        set_error("list: " + stmt.error());
    }
    return results;
}

std::vector<Preference> PreferenceStore::list_global() {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_where_scope("global");
}

std::vector<Preference> PreferenceStore::list_scope(const std::string& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_where_scope(scope);
}

std::vector<ResolvedPreference> PreferenceStore::resolved_global(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<ResolvedPreference> results;
    for (const auto& p : list_where_scope("global")) {
        results.push_back(resolve(p, "global", now_ms));
    }
    sort_by_effective(results);
    return results;
}

std::vector<ResolvedPreference> PreferenceStore::merged(const std::string& project, int64_t now_ms) {
    if (project.empty() || project == "global") {
        return resolved_global(now_ms);
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::map<std::string, ResolvedPreference> by_key;
    for (const auto& p : list_where_scope("global")) {
        by_key[p.key] = resolve(p, "global", now_ms);
    }
    // Project entries replace global ones wholesale
    for (const auto& p : list_where_scope(project)) {
        by_key[p.key] = resolve(p, "project", now_ms);
    }
    
    std::vector<ResolvedPreference> results;
    results.reserve(by_key.size());
    for (const auto& kv : by_key) {
        results.push_back(kv.second);
    }
    sort_by_effective(results);
    return results;
}

int PreferenceStore::prune_below(double min_confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Transaction tx(db_);
    if (!tx.ok()) {
        set_error("prune: " + tx.error());
        return -1;
    }
    
    Statement stmt(db_, "DELETE FROM preferences WHERE confidence < ?");
    if (!stmt.ok()) {
        set_error("prune: " + stmt.error());
        return -1;
    }
    stmt.bind(1, min_confidence);
    if (!stmt.run()) {
        set_error("prune: " + stmt.error());
        return -1;
    }
    int count = sqlite3_changes(db_);
    
    if (!tx.commit()) {
        set_error("prune: " + tx.error());
        return -1;
    }
    
    LOG_INFO("[PreferenceStore] Pruned %d preferences below confidence %.2f", count, min_confidence);
    return count;
}

int PreferenceStore::count_where(const std::string& where) {
    Statement stmt(db_, "SELECT COUNT(*) FROM preferences WHERE " + where);
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        set_error("count: " + stmt.error());
        return -1;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int PreferenceStore::count_global() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_where("scope = 'global'");
}

int PreferenceStore::count_project() {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_where("scope != 'global'");
}

} // namespace engram
