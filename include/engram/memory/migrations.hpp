/*
 * engram - Schema migrations
 *
 * The schema version lives in the 'meta' table under "schema_version".
 * Steps are additive and applied in order, each in its own transaction.
 */
#ifndef engram_MEMORY_MIGRATIONS_HPP
#define engram_MEMORY_MIGRATIONS_HPP

#include <string>
#include <vector>
#include <sqlite3.h>

namespace engram {

struct Migration {
    int version;
    const char* name;
    bool (*apply)(sqlite3* db, std::string& error);
};

// All known steps, ascending by version
const std::vector<Migration>& schema_migrations();

int latest_schema_version();

// Stored version, 0 for a fresh database or -1 on error
int read_schema_version(sqlite3* db, std::string& error);

// Bring db up to latest_schema_version(). Refuses databases written by a
// newer schema.
bool migrate(sqlite3* db, std::string& error);

} // namespace engram

#endif // engram_MEMORY_MIGRATIONS_HPP
