#include <gtest/gtest.h>
#include <engram/core/memory_tool.hpp>
#include <engram/core/dispatcher.hpp>
#include <engram/core/config.hpp>
#include <engram/core/utils.hpp>
#include "test_support.hpp"
#include <stdexcept>
#include <sys/stat.h>

using namespace engram;
using engram::test_support::TempDatabase;
using engram::test_support::age_experience;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Json record_params(const std::string& context, const std::string& project = "") {
    Json p = Json::object();
    p["context"] = context;
    p["action"] = "tried something";
    p["result"] = "it worked";
    p["success"] = true;
    if (!project.empty()) p["project"] = project;
    return p;
}

// Size of the database's write-ahead log, -1 when it does not exist
long long wal_size(const std::string& db_path) {
    struct stat st;
    if (stat((db_path + "-wal").c_str(), &st) != 0) return -1;
    return static_cast<long long>(st.st_size);
}

// Minimal provider relying on the generic per-action tools
class EchoProvider : public ToolProvider {
public:
    const char* name() const override { return "echo"; }
    const char* description() const override { return "Echo parameters back"; }
    const char* version() const override { return "0.1"; }
    bool init(const Config&) override { initialized_ = true; return true; }
    void shutdown() override { initialized_ = false; }
    const char* tool_id() const override { return "echo"; }
    std::vector<std::string> actions() const override {
        return std::vector<std::string>(1, "say");
    }
    ToolResult execute(const std::string& action, const Json& params) override {
        if (action != "say") return ToolResult::fail("Unknown action: " + action);
        if (!params.contains("text")) return ToolResult::fail("Missing required parameter: text");
        Json data = Json::object();
        data["said"] = params["text"];
        return ToolResult::ok(data);
    }
};

} // anonymous namespace

class MemoryToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config cfg;
        cfg.set_string("memory.db_path", tmp.path());
        ASSERT_TRUE(tool.init(cfg));
        dispatcher.register_provider(tool);
    }

    ToolResult run(const std::string& action, const Json& params) {
        return tool.execute(action, params);
    }

    std::string output(const std::string& action, const Json& params) {
        ToolResult r = run(action, params);
        EXPECT_TRUE(r.success) << action << ": " << r.error;
        return r.success ? r.data["output"].get<std::string>() : std::string();
    }

    TempDatabase tmp;
    MemoryTool tool;
    Dispatcher dispatcher;
};

// ─── Provider surface ──────────────────────────────────────────

TEST(MemoryToolInitTest, ExecuteBeforeInitFails) {
    MemoryTool tool;
    ToolResult r = tool.execute("memory_stats", Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Memory tool not initialized");
}

TEST_F(MemoryToolTest, ExposesTwelveActions) {
    EXPECT_EQ(tool.actions().size(), 12u);
    EXPECT_EQ(tool.get_agent_tools().size(), 12u);
    EXPECT_EQ(dispatcher.tools().size(), 12u);
    EXPECT_TRUE(dispatcher.tools().count("query_memory") > 0);

    ToolResult r = run("no_such_action", Json::object());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Unknown action: no_such_action");
}

// ─── Recording ─────────────────────────────────────────────────

TEST_F(MemoryToolTest, RecordExperienceReportsOutcome) {
    ToolResult first = run("record_experience", record_params("Linker error"));
    ASSERT_TRUE(first.success) << first.error;
    EXPECT_EQ(first.data["outcome"], "created");
    EXPECT_TRUE(contains(first.data["output"].get<std::string>(), "Experience saved (id: "));
    EXPECT_TRUE(contains(first.data["output"].get<std::string>(), "Memory: 1 experiences"));

    ToolResult again = run("record_experience", record_params("  linker ERROR "));
    ASSERT_TRUE(again.success);
    EXPECT_EQ(again.data["id"], first.data["id"]);
    EXPECT_TRUE(contains(again.data["output"].get<std::string>(), "deduplicated"));

    Json topic = record_params("Storage design");
    topic["topic_key"] = "arch:storage";
    ASSERT_TRUE(run("record_experience", topic).success);
    topic["context"] = "Storage design, revised";
    ToolResult upsert = run("record_experience", topic);
    ASSERT_TRUE(upsert.success);
    EXPECT_TRUE(contains(upsert.data["output"].get<std::string>(), "upserted (topic updated)"));
}

TEST_F(MemoryToolTest, RecordExperienceValidatesParameters) {
    Json p = record_params("x");
    p.erase("result");
    ToolResult missing = run("record_experience", p);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error, "Missing required parameter: result");

    Json empty = record_params("   ");
    ToolResult blank = run("record_experience", empty);
    EXPECT_FALSE(blank.success);
    EXPECT_EQ(blank.error, "Parameter 'context' must not be empty");

    Json bad = record_params("x");
    bad["success"] = "perhaps";
    ToolResult invalid = run("record_experience", bad);
    EXPECT_FALSE(invalid.success);
    EXPECT_EQ(invalid.error, "Parameter 'success' must be a boolean");

    Json stringly = record_params("y");
    stringly["success"] = "false";
    EXPECT_TRUE(run("record_experience", stringly).success);
}

TEST_F(MemoryToolTest, RecordCorrection) {
    Json p = Json::object();
    p["what_i_did"] = "rewrote the module";
    p["what_user_wanted"] = "a minimal fix";
    p["lesson"] = "Keep diffs small";
    ToolResult r = run("record_correction", p);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_TRUE(contains(r.data["output"].get<std::string>(), "pattern updated (seen 1x)"));
    EXPECT_EQ(r.data["pattern"]["description"], "Keep diffs small");

    p["what_i_did"] = "refactored everything";
    ToolResult again = run("record_correction", p);
    ASSERT_TRUE(again.success);
    EXPECT_TRUE(contains(again.data["output"].get<std::string>(), "seen 2x"));
}

// ─── Recall ────────────────────────────────────────────────────

TEST_F(MemoryToolTest, QueryMemoryFormatsCompactResults) {
    ASSERT_TRUE(run("record_experience", record_params("api returned 500", "proj-a")).success);
    ASSERT_TRUE(run("record_experience", record_params("api returned 500", "proj-b")).success);
    ASSERT_TRUE(run("record_experience", record_params("api returned 500")).success);

    Json q = Json::object();
    q["query"] = "api";
    q["project"] = "proj-a";
    ToolResult r = run("query_memory", q);
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_EQ(r.data["results"].size(), 2u);
    EXPECT_EQ(r.data["results"][0]["project"], "proj-a");
    EXPECT_EQ(r.data["results"][1]["project"], "");
    EXPECT_FALSE(r.data["fallback"].get<bool>());

    std::string out = r.data["output"].get<std::string>();
    EXPECT_TRUE(contains(out, "Found 2 relevant experiences (compact):"));
    EXPECT_TRUE(contains(out, "(proj-a)"));
    EXPECT_FALSE(contains(out, "(proj-b)"));
    EXPECT_TRUE(contains(out, "Use get_experience(id) for full details."));
}

TEST_F(MemoryToolTest, QueryMemoryWithoutMatches) {
    Json q = Json::object();
    q["query"] = "quasar";
    EXPECT_EQ(output("query_memory", q),
              "No relevant experiences found in memory. This is uncharted territory.");
}

TEST_F(MemoryToolTest, QueryMemoryFallsBackOnSyntaxError) {
    ASSERT_TRUE(run("record_experience", record_params("something")).success);

    Json q = Json::object();
    q["query"] = "\"unbalanced";
    ToolResult r = run("query_memory", q);
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(r.data["fallback"].get<bool>());
    EXPECT_TRUE(contains(r.data["output"].get<std::string>(), "Direct search unavailable. Last 1 experiences:"));
}

TEST_F(MemoryToolTest, QueryLimitAcceptsStrings) {
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(run("record_experience", record_params("cache entry " + std::to_string(i))).success);
    }
    Json q = Json::object();
    q["query"] = "cache";
    q["limit"] = "2";
    ToolResult r = run("query_memory", q);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.data["results"].size(), 2u);

    q["limit"] = "lots";
    EXPECT_FALSE(run("query_memory", q).success);
}

TEST_F(MemoryToolTest, QueryMemoryMarksTruncatedSnippets) {
    std::string tail;
    for (int i = 0; i < 125; ++i) tail += "\xC3\xA9";     // 134 code points in total
    std::string long_context = "overflow " + tail;
    std::string exact_context = "boundary " + tail.substr(0, 111 * 2);   // exactly 120
    ASSERT_EQ(utf8_length(exact_context), 120u);
    ASSERT_TRUE(run("record_experience", record_params(long_context)).success);
    ASSERT_TRUE(run("record_experience", record_params(exact_context)).success);

    Json q = Json::object();
    q["query"] = "overflow";
    ToolResult r = run("query_memory", q);
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_EQ(r.data["results"].size(), 1u);
    std::string snippet = r.data["results"][0]["snippet"].get<std::string>();
    EXPECT_EQ(utf8_length(snippet), 120u);
    EXPECT_EQ(snippet, utf8_prefix(long_context, 120));
    EXPECT_TRUE(contains(r.data["output"].get<std::string>(), "| " + snippet + "...\n"));

    q["query"] = "boundary";
    r = run("query_memory", q);
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_EQ(r.data["results"].size(), 1u);
    EXPECT_EQ(r.data["results"][0]["snippet"], exact_context);
    std::string out = r.data["output"].get<std::string>();
    EXPECT_TRUE(contains(out, "| " + exact_context + "\n"));
    EXPECT_FALSE(contains(out, "..."));
}

TEST_F(MemoryToolTest, OutOfRangeIntegersAreRejected) {
    Json get = Json::object();
    get["id"] = 1e300;
    ToolResult r = run("get_experience", get);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Parameter 'id' must be an integer");

    get["id"] = Json::parse("18446744073709551615");
    EXPECT_FALSE(run("get_experience", get).success);

    get["id"] = "99999999999999999999";
    EXPECT_FALSE(run("get_experience", get).success);

    Json prune = Json::object();
    prune["older_than_days"] = 1e30;
    r = run("prune_memory", prune);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Parameter 'older_than_days' must be an integer");

    // In-range floats still truncate
    ToolResult rec = run("record_experience", record_params("float id"));
    ASSERT_TRUE(rec.success);
    get["id"] = static_cast<double>(rec.data["id"].get<int64_t>()) + 0.4;
    EXPECT_TRUE(run("get_experience", get).success);
}

TEST_F(MemoryToolTest, GetExperienceAndTimeline) {
    ToolResult rec = run("record_experience", record_params("Deploy failed"));
    ASSERT_TRUE(rec.success);
    int64_t id = rec.data["id"].get<int64_t>();

    Json p = Json::object();
    p["id"] = id;
    std::string detail = output("get_experience", p);
    EXPECT_TRUE(contains(detail, "=== Experience #" + std::to_string(id) + " ==="));
    EXPECT_TRUE(contains(detail, "Context:    Deploy failed"));
    EXPECT_TRUE(contains(detail, "Project:    (global)"));

    std::string timeline = output("get_timeline", p);
    EXPECT_TRUE(contains(timeline, "Timeline around experience #" + std::to_string(id)));
    EXPECT_TRUE(contains(timeline, " <<<"));

    Json missing = Json::object();
    missing["id"] = 424242;
    ToolResult none = run("get_experience", missing);
    ASSERT_TRUE(none.success);
    EXPECT_FALSE(none.data["found"].get<bool>());
    EXPECT_EQ(none.data["output"], "Experience #424242 not found (may have been deleted).");
}

// ─── Preferences and patterns ──────────────────────────────────

TEST_F(MemoryToolTest, LearnAndListPreferences) {
    Json p = Json::object();
    p["key"] = "indent";
    p["value"] = "4 spaces";
    std::string first = output("learn_preference", p);
    EXPECT_EQ(first, "Preference \"indent\" = \"4 spaces\" saved [GLOBAL] "
                     "(confidence: 0.3, effective: 0.3, confirmed 1x).");

    std::string second = output("learn_preference", p);
    EXPECT_TRUE(contains(second, "confidence: 0.4"));
    EXPECT_TRUE(contains(second, "confirmed 2x"));

    p["value"] = "tabs";
    p["scope"] = "proj";
    EXPECT_TRUE(contains(output("learn_preference", p), "[project: proj]"));

    Json q = Json::object();
    q["project"] = "proj";
    ToolResult listed = run("get_preferences", q);
    ASSERT_TRUE(listed.success);
    ASSERT_EQ(listed.data["results"].size(), 1u);
    EXPECT_EQ(listed.data["results"][0]["value"], "tabs");
    EXPECT_EQ(listed.data["results"][0]["origin"], "project");
    EXPECT_TRUE(contains(listed.data["output"].get<std::string>(), "Preferences for proj (global + project)"));

    ToolResult global = run("get_preferences", Json::object());
    ASSERT_TRUE(global.success);
    EXPECT_EQ(global.data["results"][0]["value"], "4 spaces");
}

TEST_F(MemoryToolTest, EmptyPreferencesAndPatterns) {
    EXPECT_EQ(output("get_preferences", Json::object()),
              "No preferences saved yet. They will be learned with usage.");
    EXPECT_EQ(output("get_patterns", Json::object()),
              "No patterns detected yet. They will form with usage.");
}

TEST_F(MemoryToolTest, GetPatternsListsLatestExample) {
    Json p = Json::object();
    p["what_i_did"] = "used raw new";
    p["what_user_wanted"] = "a unique_ptr";
    p["lesson"] = "Prefer RAII";
    ASSERT_TRUE(run("record_correction", p).success);

    std::string out = output("get_patterns", Json::object());
    EXPECT_TRUE(contains(out, "1 patterns detected:"));
    EXPECT_TRUE(contains(out, "1. [x1] Prefer RAII"));
    EXPECT_TRUE(contains(out, "Latest: Did: used raw new"));
}

// ─── Maintenance ───────────────────────────────────────────────

TEST_F(MemoryToolTest, MemoryStats) {
    ASSERT_TRUE(run("record_experience", record_params("one")).success);
    Json c = Json::object();
    c["what_i_did"] = "a";
    c["what_user_wanted"] = "b";
    c["lesson"] = "Ask first";
    ASSERT_TRUE(run("record_correction", c).success);

    ToolResult r = run("memory_stats", Json::object());
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.data["experiences"], 2);
    EXPECT_EQ(r.data["corrections"], 1);
    EXPECT_EQ(r.data["patterns"], 1);
    std::string out = r.data["output"].get<std::string>();
    EXPECT_TRUE(contains(out, "=== Memory Status ==="));
    EXPECT_TRUE(contains(out, "Latest corrections:\n- Ask first"));
    EXPECT_TRUE(contains(out, "Top patterns:\n- [x1] Ask first"));
}

TEST_F(MemoryToolTest, ForgetMemory) {
    ASSERT_TRUE(run("record_experience", record_params("keep me")).success);
    Json tagged = record_params("drop me");
    tagged["tags"] = "scratch";
    ASSERT_TRUE(run("record_experience", tagged).success);

    ToolResult none = run("forget_memory", Json::object());
    EXPECT_FALSE(none.success);
    EXPECT_EQ(none.error, "you must provide at least one of: id, tag, or project.");

    Json p = Json::object();
    p["tag"] = "scratch";
    std::string out = output("forget_memory", p);
    EXPECT_TRUE(contains(out, "Soft-deleted 1 experience(s)."));
    EXPECT_TRUE(contains(out, "1 soft-deleted"));
}

TEST_F(MemoryToolTest, PruneMemory) {
    ToolResult none = run("prune_memory", Json::object());
    EXPECT_FALSE(none.success);
    EXPECT_EQ(none.error, "you must provide at least older_than_days or min_confidence.");

    ToolResult old = run("record_experience", record_params("ancient history"));
    ASSERT_TRUE(old.success);
    ASSERT_TRUE(age_experience(tool.manager().store().handle(), old.data["id"].get<int64_t>(), 100));

    Json p = Json::object();
    p["older_than_days"] = 90;
    EXPECT_TRUE(contains(output("prune_memory", p), "Pruned 1 experience(s)."));
    EXPECT_TRUE(contains(output("prune_memory", p), "No records matched the criteria."));
}

TEST_F(MemoryToolTest, SessionContext) {
    Json p = Json::object();
    p["project"] = "proj";
    ToolResult r = run("session_context", p);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.data["project"], "proj");
    EXPECT_TRUE(contains(r.data["output"].get<std::string>(), "## Memory Context"));
}

// ─── Dispatcher ────────────────────────────────────────────────

TEST_F(MemoryToolTest, DispatcherHandlesToolCallLine) {
    std::string out = dispatcher.handle(
        "{\"tool\": \"record_experience\", \"arguments\": {\"context\": \"ctx\", \"action\": \"act\", "
        "\"result\": \"res\", \"success\": true}}");
    EXPECT_TRUE(contains(out, "[TOOL_RESULT tool=record_experience success=true]\n"));
    EXPECT_TRUE(contains(out, "Experience saved"));
    EXPECT_TRUE(contains(out, "\n[/TOOL_RESULT]"));
}

TEST_F(MemoryToolTest, DispatcherReportsMissingRequiredParameter) {
    std::string out = dispatcher.handle("{\"tool\": \"query_memory\", \"arguments\": {}}");
    EXPECT_EQ(out, "[TOOL_RESULT tool=query_memory success=false]\n"
                   "Error: Missing required parameter: query\n[/TOOL_RESULT]");
}

TEST_F(MemoryToolTest, DispatcherReportsUnknownTool) {
    std::string out = dispatcher.handle("{\"tool\": \"nope\"}");
    EXPECT_TRUE(contains(out, "success=false"));
    EXPECT_TRUE(contains(out, "Unknown tool: nope"));
    EXPECT_TRUE(contains(out, "Available tools: forget_memory, get_experience"));
}

TEST(DispatcherTest, ParsesCallsEmbeddedInText) {
    Dispatcher d;
    std::vector<ParsedToolCall> calls = d.parse_tool_calls(
        "first {\"tool\": \"a\", \"arguments\": {\"x\": \"}{\"}} then "
        "{\"not\": \"a call\"} and {\"tool\": \"b\", \"arguments\": \"{\\\"y\\\": 1}\"} "
        "and {\"tool\": \"c\", \"arguments\": [1]} {broken");
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].tool_name, "a");
    EXPECT_TRUE(calls[0].valid);
    EXPECT_EQ(calls[0].params["x"], "}{");
    EXPECT_EQ(calls[1].tool_name, "b");
    EXPECT_TRUE(calls[1].valid);
    EXPECT_EQ(calls[1].params["y"], 1);
    EXPECT_EQ(calls[2].tool_name, "c");
    EXPECT_FALSE(calls[2].valid);
    EXPECT_EQ(calls[2].parse_error, "Arguments must be a JSON object");
}

TEST(DispatcherTest, NoCallMeansEmptyOutput) {
    Dispatcher d;
    EXPECT_EQ(d.handle("just some text"), "");
}

TEST(DispatcherTest, ExceptionsBecomeFailures) {
    Dispatcher d;
    d.register_tool("boom", "Throws", [](const Json&) -> AgentToolResult {
        throw std::runtime_error("kaboom");
    });
    std::string out = d.handle("{\"tool\": \"boom\"}");
    EXPECT_TRUE(contains(out, "Error: Tool exception: kaboom"));
}

TEST(DispatcherTest, GenericProviderToolsUseParamsField) {
    EchoProvider echo;
    Dispatcher d;
    d.register_provider(echo);
    ASSERT_EQ(d.tools().count("echo_say"), 1u);

    std::string wrapped = d.handle("{\"tool\": \"echo_say\", \"arguments\": {\"params\": {\"text\": \"hi\"}}}");
    EXPECT_TRUE(contains(wrapped, "success=true"));
    EXPECT_TRUE(contains(wrapped, "{\"said\":\"hi\"}"));

    std::string bare = d.handle("{\"tool\": \"echo_say\", \"arguments\": {\"text\": \"yo\"}}");
    EXPECT_TRUE(contains(bare, "{\"said\":\"yo\"}"));

    std::string failed = d.handle("{\"tool\": \"echo_say\", \"arguments\": {}}");
    EXPECT_TRUE(contains(failed, "Error: Missing required parameter: text"));
}

TEST(DispatcherTest, ToolsPromptListsParameters) {
    TempDatabase tmp;
    Config cfg;
    cfg.set_string("memory.db_path", tmp.path());
    MemoryTool tool;
    ASSERT_TRUE(tool.init(cfg));
    Dispatcher d;
    d.register_provider(tool);

    std::string prompt = d.build_tools_prompt();
    EXPECT_TRUE(contains(prompt, "## Available Tools"));
    EXPECT_TRUE(contains(prompt, "**record_correction**:"));
    EXPECT_TRUE(contains(prompt, "- `lesson` (string, required):"));
    EXPECT_TRUE(contains(prompt, "- `limit` (number):"));
}

// ─── WAL maintenance ───────────────────────────────────────────

TEST(MemoryToolCheckpointTest, CheckpointsAfterBatchOfWrites) {
    TempDatabase tmp;
    Json doc = Json::object();
    doc["memory"]["db_path"] = tmp.path();
    doc["memory"]["checkpoint_every"] = 3;
    Config cfg;
    ASSERT_TRUE(cfg.load_string(doc.dump()));

    MemoryTool tool;
    ASSERT_TRUE(tool.init(cfg));
    ASSERT_EQ(tool.manager().config().checkpoint_every, 3);

    ASSERT_TRUE(tool.execute("record_experience", record_params("first write")).success);
    ASSERT_TRUE(tool.execute("record_experience", record_params("second write")).success);
    EXPECT_EQ(tool.writes_since_checkpoint(), 2);
    EXPECT_GT(wal_size(tmp.path()), 0);

    Json pref = Json::object();
    pref["key"] = "indent";
    pref["value"] = "4 spaces";
    ASSERT_TRUE(tool.execute("learn_preference", pref).success);
    EXPECT_EQ(tool.writes_since_checkpoint(), 0);
    EXPECT_EQ(wal_size(tmp.path()), 0);

    // Reads do not count
    Json q = Json::object();
    q["query"] = "write";
    ASSERT_TRUE(tool.execute("query_memory", q).success);
    EXPECT_EQ(tool.writes_since_checkpoint(), 0);

    ASSERT_TRUE(tool.execute("record_experience", record_params("third write")).success);
    EXPECT_EQ(tool.writes_since_checkpoint(), 1);
    EXPECT_GT(wal_size(tmp.path()), 0);
}

TEST(MemoryToolCheckpointTest, DefaultBatchIsTwenty) {
    TempDatabase tmp;
    Config cfg;
    cfg.set_string("memory.db_path", tmp.path());
    MemoryTool tool;
    ASSERT_TRUE(tool.init(cfg));

    for (int i = 0; i < 19; ++i) {
        ASSERT_TRUE(tool.execute("record_experience",
                                 record_params("write " + std::to_string(i))).success);
    }
    EXPECT_EQ(tool.writes_since_checkpoint(), 19);
    EXPECT_GT(wal_size(tmp.path()), 0);

    ASSERT_TRUE(tool.execute("record_experience", record_params("write 19")).success);
    EXPECT_EQ(tool.writes_since_checkpoint(), 0);
    EXPECT_EQ(wal_size(tmp.path()), 0);
}
