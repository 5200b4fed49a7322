#include <gtest/gtest.h>
#include <engram/memory/migrations.hpp>
#include <engram/memory/store.hpp>
#include <engram/memory/text.hpp>
#include "test_support.hpp"

using namespace engram;
using engram::test_support::TempDatabase;
using engram::test_support::exec_raw;
using engram::test_support::query_int;

namespace {

// Raw handle for building databases by hand
class RawDatabase {
public:
    explicit RawDatabase(const std::string& path) : db_(nullptr) {
        sqlite3_open(path.c_str(), &db_);
    }
    ~RawDatabase() { sqlite3_close(db_); }
    sqlite3* get() { return db_; }

private:
    sqlite3* db_;
};

// A version 1 database with one experience and one preference
void build_v1(const std::string& path, bool with_meta) {
    RawDatabase raw(path);
    ASSERT_NE(raw.get(), nullptr);

    std::string error;
    ASSERT_TRUE(schema_migrations()[0].apply(raw.get(), error)) << error;
    ASSERT_TRUE(exec_raw(raw.get(),
        "INSERT INTO experiences (type, context, action, result, success, tags, project, created_at) "
        "VALUES ('experience', 'Flaky Test', 'added a retry', 'green again', 1, 'ci', 'proj', 1700000000000);"
        "INSERT INTO experiences (type, context, action, result, success, tags, project, created_at) "
        "VALUES ('correction', 'used printf', 'switched to logger', 'accepted', 0, '', '', 1700000001000);"
        "INSERT INTO preferences (key, value, confidence, source, scope, updated_at) "
        "VALUES ('indent', '4 spaces', 0.6, 'explicit', 'global', 1700000002000);",
        &error)) << error;

    if (with_meta) {
        ASSERT_TRUE(exec_raw(raw.get(),
            "CREATE TABLE meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
            "INSERT INTO meta (key, value) VALUES ('schema_version', '1');",
            &error)) << error;
    }
}

} // anonymous namespace

TEST(MigrationsTest, StepsAreAscending) {
    const std::vector<Migration>& steps = schema_migrations();
    ASSERT_FALSE(steps.empty());
    for (size_t i = 1; i < steps.size(); ++i) {
        EXPECT_EQ(steps[i].version, steps[i - 1].version + 1);
    }
    EXPECT_EQ(latest_schema_version(), 4);
}

TEST(MigrationsTest, FreshDatabaseReachesLatest) {
    TempDatabase tmp;
    MemoryStore store;
    ASSERT_TRUE(store.open(tmp.path())) << store.last_error();
    EXPECT_EQ(store.schema_version(), latest_schema_version());
    EXPECT_EQ(store.get_meta("schema_version"), "4");
    EXPECT_EQ(query_int(store.handle(),
        "SELECT COUNT(*) FROM sqlite_master WHERE name = 'experiences_fts'"), 1);
}

TEST(MigrationsTest, MigrateIsIdempotent) {
    TempDatabase tmp;
    RawDatabase raw(tmp.path());
    std::string error;
    ASSERT_TRUE(migrate(raw.get(), error)) << error;
    ASSERT_TRUE(migrate(raw.get(), error)) << error;
    EXPECT_EQ(read_schema_version(raw.get(), error), latest_schema_version());
}

TEST(MigrationsTest, UpgradesVersionOneDatabase) {
    TempDatabase tmp;
    ASSERT_NO_FATAL_FAILURE(build_v1(tmp.path(), true));

    MemoryStore store;
    ASSERT_TRUE(store.open(tmp.path())) << store.last_error();
    EXPECT_EQ(store.schema_version(), latest_schema_version());

    std::vector<Experience> all = store.experiences().scan_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].normalized_hash, fingerprint("Flaky Test", "added a retry", "green again"));
    EXPECT_EQ(all[0].last_seen_at, all[0].created_at);
    EXPECT_EQ(all[0].duplicate_count, 1);
    EXPECT_EQ(all[0].revision_count, 1);
    EXPECT_TRUE(all[0].is_active());
    EXPECT_TRUE(all[0].topic_key.empty());
    EXPECT_EQ(all[1].type, ExperienceType::CORRECTION);

    // Existing rows are searchable
    SearchResult res;
    ASSERT_TRUE(store.experiences().search("flaky", "", 5, res));
    ASSERT_EQ(res.hits.size(), 1u);
    EXPECT_EQ(res.hits[0].entry.id, all[0].id);
    EXPECT_EQ(store.index().count(), 2);

    Preference p;
    ASSERT_TRUE(store.preferences().get("indent", "global", p));
    EXPECT_EQ(p.confirmed_count, 1);
    EXPECT_EQ(p.last_confirmed_at, 1700000002000LL);
    EXPECT_DOUBLE_EQ(p.confidence, 0.6);
}

TEST(MigrationsTest, BackfilledHashMatchesNewWrites) {
    TempDatabase tmp;
    ASSERT_NO_FATAL_FAILURE(build_v1(tmp.path(), true));

    MemoryStore store;
    MemoryConfig config;
    config.dedup_window_ms = 0;
    ASSERT_TRUE(store.open(tmp.path(), config));

    // Old rows are outside the window, so this is a new row with the same hash
    RecordResult r;
    ASSERT_TRUE(store.experiences().record([] {
        ExperienceInput in;
        in.context = "flaky test";
        in.action = "added a retry";
        in.result = "green again";
        in.project = "proj";
        return in;
    }(), r));
    EXPECT_EQ(r.outcome, RecordOutcome::CREATED);
    EXPECT_EQ(query_int(store.handle(),
        "SELECT COUNT(DISTINCT normalized_hash) FROM experiences WHERE project = 'proj'"), 1);
}

TEST(MigrationsTest, AdoptsUnversionedDatabase) {
    TempDatabase tmp;
    ASSERT_NO_FATAL_FAILURE(build_v1(tmp.path(), false));

    // Version 0 replays the base tables (no-op) and then adds the columns
    MemoryStore store;
    ASSERT_TRUE(store.open(tmp.path())) << store.last_error();
    EXPECT_EQ(store.schema_version(), latest_schema_version());
    EXPECT_EQ(store.experiences().count_active(), 2);
    EXPECT_EQ(store.index().count(), 2);
}

TEST(MigrationsTest, RefusesNewerSchema) {
    TempDatabase tmp;
    {
        MemoryStore store;
        ASSERT_TRUE(store.open(tmp.path()));
        ASSERT_TRUE(store.set_meta("schema_version", "99"));
    }

    MemoryStore store;
    EXPECT_FALSE(store.open(tmp.path()));
    EXPECT_NE(store.last_error().find("newer"), std::string::npos);
    EXPECT_FALSE(store.is_open());
}

TEST(MigrationsTest, RefusesTextTimestampLayout) {
    TempDatabase tmp;
    {
        RawDatabase raw(tmp.path());
        std::string error;
        ASSERT_TRUE(exec_raw(raw.get(),
            "CREATE TABLE experiences (id INTEGER PRIMARY KEY AUTOINCREMENT, type TEXT NOT NULL,"
            "  context TEXT, action TEXT, result TEXT, success INTEGER DEFAULT 1,"
            "  tags TEXT DEFAULT '', project TEXT DEFAULT '',"
            "  created_at TEXT DEFAULT (datetime('now')));"
            "CREATE VIRTUAL TABLE experiences_fts USING fts5(context, action, result, tags,"
            "  content=experiences, content_rowid=id);"
            "CREATE TRIGGER experiences_ai AFTER INSERT ON experiences BEGIN"
            "  INSERT INTO experiences_fts(rowid, context, action, result, tags)"
            "  VALUES (new.id, new.context, new.action, new.result, new.tags);"
            "END;"
            "INSERT INTO experiences (type, context, action, result) VALUES ('experience', 'a', 'b', 'c');",
            &error)) << error;
    }

    MemoryStore store;
    EXPECT_FALSE(store.open(tmp.path()));
    EXPECT_NE(store.last_error().find("experiences.created_at is TEXT"), std::string::npos)
        << store.last_error();
    EXPECT_FALSE(store.is_open());

    // Left as found
    RawDatabase raw(tmp.path());
    EXPECT_EQ(query_int(raw.get(),
        "SELECT COUNT(*) FROM pragma_table_info('experiences') WHERE name = 'deleted_at'"), 0);
    EXPECT_EQ(query_int(raw.get(), "SELECT COUNT(*) FROM experiences"), 1);
}

TEST(MigrationsTest, RefusesUnversionedDatabaseWithTriggers) {
    TempDatabase tmp;
    {
        RawDatabase raw(tmp.path());
        std::string error;
        ASSERT_TRUE(schema_migrations()[0].apply(raw.get(), error)) << error;
        ASSERT_TRUE(exec_raw(raw.get(),
            "CREATE TABLE audit (id INTEGER);"
            "CREATE TRIGGER experiences_audit AFTER INSERT ON experiences BEGIN"
            "  INSERT INTO audit VALUES (new.id);"
            "END;",
            &error)) << error;
    }

    std::string error;
    RawDatabase raw(tmp.path());
    EXPECT_FALSE(migrate(raw.get(), error));
    EXPECT_NE(error.find("experiences_audit"), std::string::npos) << error;
}

TEST(MigrationsTest, RefusesUnversionedLifecycleColumns) {
    TempDatabase tmp;
    {
        RawDatabase raw(tmp.path());
        std::string error;
        ASSERT_TRUE(schema_migrations()[0].apply(raw.get(), error)) << error;
        ASSERT_TRUE(exec_raw(raw.get(), "ALTER TABLE experiences ADD COLUMN deleted_at INTEGER", &error))
            << error;
    }

    std::string error;
    RawDatabase raw(tmp.path());
    EXPECT_FALSE(migrate(raw.get(), error));
    EXPECT_NE(error.find("deleted_at"), std::string::npos) << error;
}
