#include <gtest/gtest.h>
#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/memory/manager.hpp>

using namespace engram;

// ─── Lookup ────────────────────────────────────────────────────

TEST(ConfigTest, DottedPathReachesNestedValues) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"memory": {"db_path": "/tmp/x.db", "timeline_limit": 7}})"));
    EXPECT_TRUE(cfg.has("memory.db_path"));
    EXPECT_EQ(cfg.get_string("memory.db_path", ""), "/tmp/x.db");
    EXPECT_EQ(cfg.get_int("memory.timeline_limit", 0), 7);
    EXPECT_FALSE(cfg.has("memory.missing"));
    EXPECT_FALSE(cfg.has("memory.db_path.deeper"));
}

TEST(ConfigTest, LiteralDottedKeyTakesPriority) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"memory.db_path": "literal", "memory": {"db_path": "nested"}})"));
    EXPECT_EQ(cfg.get_string("memory.db_path", ""), "literal");
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"name": 3, "count": "many", "ratio": 2})"));
    EXPECT_EQ(cfg.get_string("name", "dflt"), "dflt");
    EXPECT_EQ(cfg.get_int("count", 42), 42);
    EXPECT_DOUBLE_EQ(cfg.get_double("ratio", 0.0), 2.0);
}

TEST(ConfigTest, FloatTruncatesForIntegerLookup) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"n": 9.8})"));
    EXPECT_EQ(cfg.get_int("n", 0), 9);
}

TEST(ConfigTest, OutOfRangeNumberFallsBackToDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"huge": 1e300, "unsigned": 18446744073709551615})"));
    EXPECT_EQ(cfg.get_int("huge", 5), 5);
    EXPECT_EQ(cfg.get_int("unsigned", 6), 6);
}

TEST(ConfigTest, BoolAcceptsStringForms) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"a": true, "b": "yes", "c": "0", "d": "FALSE", "e": "maybe"})"));
    EXPECT_TRUE(cfg.get_bool("a", false));
    EXPECT_TRUE(cfg.get_bool("b", false));
    EXPECT_FALSE(cfg.get_bool("c", true));
    EXPECT_FALSE(cfg.get_bool("d", true));
    EXPECT_TRUE(cfg.get_bool("e", true));
    EXPECT_FALSE(cfg.get_bool("missing", false));
}

// ─── Loading and overrides ─────────────────────────────────────

TEST(ConfigTest, RejectsMalformedAndNonObjectDocuments) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"keep": "me"})"));

    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_FALSE(cfg.load_string("[1, 2, 3]"));
    EXPECT_EQ(cfg.last_error(), "Config root must be a JSON object");

    // Previous values survive a failed load
    EXPECT_EQ(cfg.get_string("keep", ""), "me");
}

TEST(ConfigTest, LoadMissingFileFails) {
    Config cfg;
    EXPECT_FALSE(cfg.load("/nonexistent/engram/config.json"));
    EXPECT_NE(cfg.last_error().find("Cannot open config file"), std::string::npos);
}

TEST(ConfigTest, SetCreatesNestedPathAndReplacesLiteralKey) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"memory.db_path": "old"})"));
    cfg.set_string("memory.db_path", "new");
    cfg.set_int("memory.timeline_limit", 3);

    EXPECT_EQ(cfg.get_string("memory.db_path", ""), "new");
    EXPECT_EQ(cfg.get_int("memory.timeline_limit", 0), 3);
    EXPECT_TRUE(cfg.data()["memory"].is_object());
    EXPECT_EQ(cfg.data().count("memory.db_path"), 0u);
}

// ─── Memory settings ───────────────────────────────────────────

TEST(ConfigTest, MemoryConfigDefaults) {
    Config cfg;
    MemoryConfig mc = memory_config_from(cfg);
    EXPECT_EQ(mc.db_path, "~/.engram/memory.db");
    EXPECT_EQ(mc.dedup_window_ms, 15 * 60 * 1000LL);
    EXPECT_EQ(mc.timeline_window_ms, 60 * 60 * 1000LL);
    EXPECT_EQ(mc.timeline_limit, 20);
    EXPECT_EQ(mc.snippet_length, 120u);
    EXPECT_EQ(mc.pattern_example_limit, 10u);
    EXPECT_EQ(mc.checkpoint_every, 20);
}

TEST(ConfigTest, MemoryConfigClampsOutOfRangeValues) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(R"({"memory": {
        "dedup_window_minutes": -5,
        "timeline_window_minutes": 0,
        "timeline_limit": 100000,
        "snippet_length": 0,
        "pattern_example_limit": 3,
        "checkpoint_every": 0
    }})"));
    MemoryConfig mc = memory_config_from(cfg);
    EXPECT_EQ(mc.dedup_window_ms, 0);
    EXPECT_EQ(mc.timeline_window_ms, 60 * 1000LL);
    EXPECT_EQ(mc.timeline_limit, 500);
    EXPECT_EQ(mc.snippet_length, 1u);
    EXPECT_EQ(mc.pattern_example_limit, 3u);
    EXPECT_EQ(mc.checkpoint_every, 1);
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("whatever"), LogLevel::INFO);
}
