#include <engram/memory/store.hpp>
#include <engram/memory/sqlite_util.hpp>
#include <engram/core/json.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

namespace engram {

namespace {

const char* PATTERN_SELECT =
    "SELECT id, description, category, frequency, examples, last_seen FROM patterns ";

std::vector<std::string> parse_examples(const std::string& text, int64_t id) {
    std::vector<std::string> examples;
    
    JsonParseResult parsed = try_parse_json(text);
    if (!parsed.ok || !parsed.value.is_array()) {
        LOG_WARN("[PatternStore] Pattern id=%lld has unreadable examples, resetting", (long long)id);
        return examples;
    }
    for (const auto& item : parsed.value) {
        if (item.is_string()) {
            examples.push_back(item.get<std::string>());
        }
    }
    return examples;
}

std::string dump_examples(const std::vector<std::string>& examples) {
    Json arr = Json::array();
    for (const auto& ex : examples) {
        arr.push_back(ex);
    }
    return arr.dump(-1, ' ', false, Json::error_handler_t::replace);
}

Pattern read_pattern(sqlite3_stmt* stmt) {
    Pattern p;
    p.id = sqlite3_column_int64(stmt, 0);
    p.description = column_string(stmt, 1);
    p.category = column_string(stmt, 2);
    p.frequency = sqlite3_column_int(stmt, 3);
    p.examples = parse_examples(column_string(stmt, 4), p.id);
    p.last_seen = sqlite3_column_int64(stmt, 5);
    return p;
}

} // anonymous namespace

PatternStore::PatternStore(sqlite3*& db, std::mutex& mutex, const MemoryConfig& config)
    : db_(db), mutex_(mutex), config_(config) {}

void PatternStore::set_error(const std::string& error) {
    last_error_ = error;
    LOG_ERROR("[PatternStore] %s", error.c_str());
}

std::string PatternStore::last_error() const {
    return last_error_;
}

bool PatternStore::load(const std::string& description, Pattern& out) {
    Statement stmt(db_, std::string(PATTERN_SELECT) + "WHERE description = ?");
    if (!stmt.ok()) {
        last_error_ = stmt.error();
        return false;
    }
    stmt.bind(1, description);
    
    if (stmt.step() != SQLITE_ROW) return false;
    out = read_pattern(stmt.get());
    return true;
}

bool PatternStore::record(const std::string& description, const std::string& category,
                          const std::string& example, Pattern& out)
{
    std::lock_guard<std::mutex> lock(mutex_);
    
    Transaction tx(db_);
    if (!tx.ok()) {
        set_error("record: " + tx.error());
        return false;
    }
    
    int64_t now = current_timestamp_ms();
    Pattern existing;
    
    if (load(description, existing)) {
        existing.examples.push_back(example);
        while (existing.examples.size() > config_.pattern_example_limit) {
            existing.examples.erase(existing.examples.begin());
        }
        
        Statement stmt(db_,
            "UPDATE patterns SET frequency = frequency + 1, last_seen = ?, examples = ? WHERE id = ?");
        if (!stmt.ok()) {
            set_error("record: " + stmt.error());
            return false;
        }
        stmt.bind(1, now);
        stmt.bind(2, dump_examples(existing.examples));
        stmt.bind(3, existing.id);
        if (!stmt.run()) {
            set_error("record: update failed: " + stmt.error());
            return false;
        }
    } else {
        Statement stmt(db_,
            "INSERT INTO patterns (description, category, frequency, examples, last_seen) "
            "VALUES (?, ?, 1, ?, ?)");
        if (!stmt.ok()) {
            set_error("record: " + stmt.error());
            return false;
        }
        stmt.bind(1, description);
        stmt.bind(2, category);
        stmt.bind(3, dump_examples(std::vector<std::string>(1, example)));
        stmt.bind(4, now);
        if (!stmt.run()) {
            set_error("record: insert failed: " + stmt.error());
            return false;
        }
    }
    
    if (!load(description, out)) {
        set_error("record: pattern vanished after write");
        return false;
    }
    if (!tx.commit()) {
        set_error("record: " + tx.error());
        return false;
    }
    
    LOG_DEBUG("[PatternStore] '%s' frequency=%d", description.c_str(), out.frequency);
    return true;
}

bool PatternStore::get(const std::string& description, Pattern& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(description, out);
}

std::vector<Pattern> PatternStore::top(int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<Pattern> results;
    Statement stmt(db_, std::string(PATTERN_SELECT) +
        "ORDER BY frequency DESC, last_seen DESC, id DESC LIMIT ?");
    if (!stmt.ok()) {
        set_error("top: " + stmt.error());
        return results;
    }
    stmt.bind(1, limit);
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        results.push_back(read_pattern(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        set_error("top: " + stmt.error());
    }
    return results;
}

int PatternStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Statement stmt(db_, "SELECT COUNT(*) FROM patterns");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        set_error("count: " + stmt.error());
        return -1;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

} // namespace engram
