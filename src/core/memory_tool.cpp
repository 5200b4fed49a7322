/*
 * engram - Memory Tool Implementation
 * 
 * ToolProvider exposing the memory manager to the agent. Every action
 * returns a human-readable "output" plus structured fields in its data.
 */
#include <engram/core/memory_tool.hpp>
#include <engram/core/config.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

#include <sstream>
#include <cstdlib>
#include <cerrno>

namespace engram {

namespace {

// Typed access to tool parameters. Absent or null optional parameters leave
// the output untouched; a present parameter of the wrong type is an error.
class ParamReader {
public:
    explicit ParamReader(const Json& params) : params_(params) {}
    
    bool has(const char* key) const {
        return params_.is_object() && params_.contains(key) && !params_[key].is_null();
    }
    
    bool str(const char* key, std::string& out, bool required) {
        if (!has(key)) return missing(key, required);
        const Json& v = params_[key];
        if (v.is_string()) {
            out = v.get<std::string>();
        } else if (v.is_number()) {
            out = v.dump(-1, ' ', false, Json::error_handler_t::replace);
        } else {
            return invalid(key, "a string");
        }
        if (required && trim(out).empty()) {
            error_ = std::string("Parameter '") + key + "' must not be empty";
            return false;
        }
        return true;
    }
    
    bool integer(const char* key, int64_t& out, bool required) {
        if (!has(key)) return missing(key, required);
        const Json& v = params_[key];
        if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
            return invalid(key, "an integer");
        }
        if (v.is_number_integer()) {
            out = v.get<int64_t>();
            return true;
        }
        if (v.is_number_float()) {
            double d = v.get<double>();
            if (!double_fits_int64(d)) return invalid(key, "an integer");
            out = static_cast<int64_t>(d);
            return true;
        }
        if (v.is_string()) {
            std::string s = trim(v.get<std::string>());
            char* end = nullptr;
            errno = 0;
            long long parsed = std::strtoll(s.c_str(), &end, 10);
            if (!s.empty() && end && *end == '\0' && errno != ERANGE) {
                out = parsed;
                return true;
            }
        }
        return invalid(key, "an integer");
    }
    
    bool number(const char* key, double& out, bool required) {
        if (!has(key)) return missing(key, required);
        const Json& v = params_[key];
        if (v.is_number()) {
            out = v.get<double>();
            return true;
        }
        if (v.is_string()) {
            std::string s = trim(v.get<std::string>());
            char* end = nullptr;
            double parsed = std::strtod(s.c_str(), &end);
            if (!s.empty() && end && *end == '\0') {
                out = parsed;
                return true;
            }
        }
        return invalid(key, "a number");
    }
    
    bool boolean(const char* key, bool& out, bool required) {
        if (!has(key)) return missing(key, required);
        const Json& v = params_[key];
        if (v.is_boolean()) {
            out = v.get<bool>();
            return true;
        }
        if (v.is_string()) {
            std::string s = to_lower(trim(v.get<std::string>()));
            if (s == "true" || s == "1" || s == "yes") { out = true; return true; }
            if (s == "false" || s == "0" || s == "no") { out = false; return true; }
        }
        if (v.is_number_integer()) {
            out = v.get<int64_t>() != 0;
            return true;
        }
        return invalid(key, "a boolean");
    }
    
    const std::string& error() const { return error_; }

private:
    const Json& params_;
    std::string error_;
    
    bool missing(const char* key, bool required) {
        if (!required) return true;
        error_ = std::string("Missing required parameter: ") + key;
        return false;
    }
    
    bool invalid(const char* key, const char* expected) {
        error_ = std::string("Parameter '") + key + "' must be " + expected;
        return false;
    }
};

Json experience_to_json(const Experience& e) {
    Json j = Json::object();
    j["id"] = e.id;
    j["type"] = experience_type_to_string(e.type);
    j["context"] = e.context;
    j["action"] = e.action;
    j["result"] = e.result;
    j["success"] = e.success;
    j["tags"] = e.tags;
    j["project"] = e.project;
    j["created_at"] = e.created_at;
    j["duplicate_count"] = e.duplicate_count;
    j["last_seen_at"] = e.last_seen_at;
    j["revision_count"] = e.revision_count;
    if (!e.topic_key.empty()) j["topic_key"] = e.topic_key;
    return j;
}

Json compact_to_json(const CompactExperience& c) {
    Json j = Json::object();
    j["id"] = c.id;
    j["type"] = experience_type_to_string(c.type);
    j["tags"] = c.tags;
    j["created_at"] = c.created_at;
    j["success"] = c.success;
    j["project"] = c.project;
    j["snippet"] = c.snippet;
    j["duplicate_count"] = c.duplicate_count;
    j["revision_count"] = c.revision_count;
    if (!c.topic_key.empty()) j["topic_key"] = c.topic_key;
    return j;
}

Json preference_to_json(const ResolvedPreference& r) {
    Json j = Json::object();
    j["key"] = r.pref.key;
    j["value"] = r.pref.value;
    j["scope"] = r.pref.scope;
    j["source"] = r.pref.source;
    j["confidence"] = r.pref.confidence;
    j["confirmed_count"] = r.pref.confirmed_count;
    j["decay_factor"] = r.decay_factor;
    j["effective_confidence"] = r.effective_confidence;
    j["origin"] = r.origin;
    return j;
}

Json pattern_to_json(const Pattern& p) {
    Json j = Json::object();
    j["id"] = p.id;
    j["description"] = p.description;
    j["category"] = p.category;
    j["frequency"] = p.frequency;
    j["examples"] = p.examples;
    j["last_seen"] = p.last_seen;
    return j;
}

Json stats_to_json(const MemoryStats& s) {
    Json j = Json::object();
    j["experiences"] = s.experiences;
    j["corrections"] = s.corrections;
    j["soft_deleted"] = s.soft_deleted;
    j["global_prefs"] = s.global_prefs;
    j["project_prefs"] = s.project_prefs;
    j["patterns"] = s.patterns;
    return j;
}

// Two decimals, without trailing zeros ("0.3", "0.63", "1")
std::string format_confidence(double value) {
    std::ostringstream oss;
    oss << round_to(value, 2);
    return oss.str();
}

AgentToolResult to_agent_result(const ToolResult& r) {
    if (!r.success) return AgentToolResult::fail(r.error);
    if (r.data.contains("output") && r.data["output"].is_string()) {
        return AgentToolResult::ok(r.data["output"].get<std::string>());
    }
    return AgentToolResult::ok(r.data.dump(-1, ' ', false, Json::error_handler_t::replace));
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

MemoryTool::MemoryTool() : writes_since_checkpoint_(0) {}

MemoryTool::~MemoryTool() {
    shutdown();
}

// ============================================================================
// Plugin Interface
// ============================================================================

bool MemoryTool::init(const Config& cfg) {
    if (!manager_.init(cfg)) {
        LOG_ERROR("[MemoryTool] Failed to initialize memory manager: %s", manager_.last_error().c_str());
        return false;
    }
    
    writes_since_checkpoint_ = 0;
    initialized_ = true;
    LOG_INFO("[MemoryTool] Initialized (db=%s)", manager_.config().db_path.c_str());
    return true;
}

void MemoryTool::shutdown() {
    if (initialized_) {
        // The manager folds the WAL on close
        manager_.shutdown();
        writes_since_checkpoint_ = 0;
        initialized_ = false;
    }
}

// ============================================================================
// ToolProvider Interface
// ============================================================================

std::vector<std::string> MemoryTool::actions() const {
    std::vector<std::string> acts;
    acts.push_back("record_experience");
    acts.push_back("record_correction");
    acts.push_back("learn_preference");
    acts.push_back("query_memory");
    acts.push_back("get_experience");
    acts.push_back("get_timeline");
    acts.push_back("get_patterns");
    acts.push_back("get_preferences");
    acts.push_back("memory_stats");
    acts.push_back("forget_memory");
    acts.push_back("prune_memory");
    acts.push_back("session_context");
    return acts;
}

ToolResult MemoryTool::execute(const std::string& action, const Json& params) {
    if (!initialized_) {
        return ToolResult::fail("Memory tool not initialized");
    }
    
    if (action == "record_experience") return do_record_experience(params);
    if (action == "record_correction") return do_record_correction(params);
    if (action == "learn_preference")  return do_learn_preference(params);
    if (action == "query_memory")      return do_query_memory(params);
    if (action == "get_experience")    return do_get_experience(params);
    if (action == "get_timeline")      return do_get_timeline(params);
    if (action == "get_patterns")      return do_get_patterns(params);
    if (action == "get_preferences")   return do_get_preferences(params);
    if (action == "memory_stats")      return do_memory_stats(params);
    if (action == "forget_memory")     return do_forget_memory(params);
    if (action == "prune_memory")      return do_prune_memory(params);
    if (action == "session_context")   return do_session_context(params);
    
    return ToolResult::fail("Unknown action: " + action);
}

// ============================================================================
// Agent Tool Definitions
// ============================================================================

std::vector<AgentTool> MemoryTool::get_agent_tools() const {
    std::vector<AgentTool> tools;
    MemoryTool* self = const_cast<MemoryTool*>(this);
    
    // record_experience
    {
        AgentTool tool;
        tool.name = "record_experience";
        tool.description =
            "Save an experience to memory: what was happening, what was done and how it went. "
            "Repeats within 15 minutes are merged; a topic_key updates the existing entry in place.";
        tool.params.push_back(ToolParamSchema("context", "string", "What was happening (the problem or situation)", true));
        tool.params.push_back(ToolParamSchema("action", "string", "What was done", true));
        tool.params.push_back(ToolParamSchema("result", "string", "What happened after the action", true));
        tool.params.push_back(ToolParamSchema("success", "boolean", "Did it work?", true));
        tool.params.push_back(ToolParamSchema("tags", "string", "Comma-separated tags (e.g. 'cpp,build,linker')", false));
        tool.params.push_back(ToolParamSchema("project", "string", "Project name. Omit for a global experience", false));
        tool.params.push_back(ToolParamSchema("topic_key", "string",
            "Stable topic id (e.g. 'arch:storage'). Updates the entry with the same topic_key and project", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_record_experience(params));
        };
        tools.push_back(tool);
    }
    
    // record_correction
    {
        AgentTool tool;
        tool.name = "record_correction";
        tool.description =
            "Record that the user corrected or rejected an action, with the lesson to apply next time. "
            "The lesson is tracked as a recurring pattern.";
        tool.params.push_back(ToolParamSchema("what_i_did", "string", "What was done that was rejected", true));
        tool.params.push_back(ToolParamSchema("what_user_wanted", "string", "What the user actually wanted", true));
        tool.params.push_back(ToolParamSchema("lesson", "string", "What to do differently next time", true));
        tool.params.push_back(ToolParamSchema("tags", "string", "Comma-separated tags. Default: 'correction'", false));
        tool.params.push_back(ToolParamSchema("project", "string", "Project where the correction happened", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_record_correction(params));
        };
        tools.push_back(tool);
    }
    
    // learn_preference
    {
        AgentTool tool;
        tool.name = "learn_preference";
        tool.description =
            "Save or re-affirm a user preference. scope='global' applies everywhere; a project name "
            "applies only there and overrides the global value. Each confirmation raises confidence.";
        tool.params.push_back(ToolParamSchema("key", "string", "Preference name (e.g. 'indent', 'language')", true));
        tool.params.push_back(ToolParamSchema("value", "string", "Preference value", true));
        tool.params.push_back(ToolParamSchema("scope", "string", "'global' (default) or a project name", false));
        tool.params.push_back(ToolParamSchema("source", "string", "Where it was learned. Default: 'observed'", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_learn_preference(params));
        };
        tools.push_back(tool);
    }
    
    // query_memory
    {
        AgentTool tool;
        tool.name = "query_memory";
        tool.description =
            "Search memory for relevant experiences before making a decision. Results are compact; "
            "use get_experience for full details.";
        tool.params.push_back(ToolParamSchema("query", "string", "Full-text search terms", true));
        tool.params.push_back(ToolParamSchema("project", "string", "Search this project plus global experiences", false));
        tool.params.push_back(ToolParamSchema("limit", "number", "Maximum results. Default: 5", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_query_memory(params));
        };
        tools.push_back(tool);
    }
    
    // get_experience
    {
        AgentTool tool;
        tool.name = "get_experience";
        tool.description = "Full details of one experience by id.";
        tool.params.push_back(ToolParamSchema("id", "number", "Experience id", true));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_get_experience(params));
        };
        tools.push_back(tool);
    }
    
    // get_timeline
    {
        AgentTool tool;
        tool.name = "get_timeline";
        tool.description = "Experiences recorded within one hour before and after the given one, oldest first.";
        tool.params.push_back(ToolParamSchema("id", "number", "Experience id to center on", true));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_get_timeline(params));
        };
        tools.push_back(tool);
    }
    
    // get_patterns
    {
        AgentTool tool;
        tool.name = "get_patterns";
        tool.description = "Most frequent recurring patterns (repeated lessons, errors, workflows).";
        tool.params.push_back(ToolParamSchema("limit", "number", "Maximum patterns. Default: 10", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_get_patterns(params));
        };
        tools.push_back(tool);
    }
    
    // get_preferences
    {
        AgentTool tool;
        tool.name = "get_preferences";
        tool.description =
            "User preferences with confidence decay applied. With a project, global and project "
            "preferences are merged and the project value wins.";
        tool.params.push_back(ToolParamSchema("project", "string", "Project name. Omit for global preferences only", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_get_preferences(params));
        };
        tools.push_back(tool);
    }
    
    // memory_stats
    {
        AgentTool tool;
        tool.name = "memory_stats";
        tool.description = "Memory counters plus the latest corrections and top patterns.";
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_memory_stats(params));
        };
        tools.push_back(tool);
    }
    
    // forget_memory
    {
        AgentTool tool;
        tool.name = "forget_memory";
        tool.description = "Soft-delete experiences by id, tag or project. At least one is required.";
        tool.params.push_back(ToolParamSchema("id", "number", "Experience id", false));
        tool.params.push_back(ToolParamSchema("tag", "string", "Delete experiences whose tags contain this text", false));
        tool.params.push_back(ToolParamSchema("project", "string", "Delete all experiences of this project", false));
        tool.params.push_back(ToolParamSchema("exact_tag", "boolean",
            "Match the tag as a whole comma-separated entry instead of a substring. Default: false", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_forget_memory(params));
        };
        tools.push_back(tool);
    }
    
    // prune_memory
    {
        AgentTool tool;
        tool.name = "prune_memory";
        tool.description =
            "Clean up memory: soft-delete old experiences and/or drop low-confidence preferences. "
            "At least older_than_days or min_confidence is required.";
        tool.params.push_back(ToolParamSchema("older_than_days", "number", "Soft-delete experiences older than N days", false));
        tool.params.push_back(ToolParamSchema("only_failures", "boolean", "Only failed experiences. Default: false", false));
        tool.params.push_back(ToolParamSchema("min_confidence", "number", "Delete preferences below this confidence", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_prune_memory(params));
        };
        tools.push_back(tool);
    }
    
    // session_context
    {
        AgentTool tool;
        tool.name = "session_context";
        tool.description = "Digest of preferences, recent experiences, patterns and corrections for a new session.";
        tool.params.push_back(ToolParamSchema("project", "string", "Current project name", false));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return to_agent_result(self->do_session_context(params));
        };
        tools.push_back(tool);
    }
    
    return tools;
}

// ============================================================================
// Helpers
// ============================================================================

void MemoryTool::checkpoint_after_write() {
    if (++writes_since_checkpoint_ < manager_.config().checkpoint_every) return;
    
    writes_since_checkpoint_ = 0;
    if (!manager_.checkpoint()) {
        LOG_WARN("[MemoryTool] Checkpoint after write failed: %s", manager_.last_error().c_str());
    }
}

std::string MemoryTool::totals_line(bool with_deleted) {
    MemoryStats stats;
    if (!manager_.stats(stats)) {
        return "Memory totals unavailable.";
    }
    
    std::ostringstream oss;
    oss << "Memory: " << stats.experiences << " experiences, ";
    if (with_deleted) {
        oss << stats.soft_deleted << " soft-deleted, ";
    }
    oss << stats.patterns << " patterns, "
        << stats.global_prefs << " global prefs, "
        << stats.project_prefs << " project prefs.";
    return oss.str();
}

// ============================================================================
// Experience Actions
// ============================================================================

ToolResult MemoryTool::do_record_experience(const Json& params) {
    ParamReader p(params);
    ExperienceInput input;
    
    if (!p.str("context", input.context, true) ||
        !p.str("action", input.action, true) ||
        !p.str("result", input.result, true) ||
        !p.boolean("success", input.success, true) ||
        !p.str("tags", input.tags, false) ||
        !p.str("project", input.project, false) ||
        !p.str("topic_key", input.topic_key, false)) {
        return ToolResult::fail(p.error());
    }
    
    RecordResult rec;
    if (!manager_.record_experience(input, rec)) {
        return ToolResult::fail("Failed to record experience: " + manager_.last_error());
    }
    checkpoint_after_write();
    
    std::string status = "saved";
    if (rec.outcome == RecordOutcome::DEDUPLICATED) status = "deduplicated (existing updated)";
    if (rec.outcome == RecordOutcome::UPSERTED) status = "upserted (topic updated)";
    
    std::ostringstream oss;
    oss << "Experience " << status << " (id: " << rec.id << "). " << totals_line(false);
    
    Json data = Json::object();
    data["output"] = oss.str();
    data["id"] = rec.id;
    data["outcome"] = record_outcome_to_string(rec.outcome);
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_record_correction(const Json& params) {
    ParamReader p(params);
    std::string what_i_did, what_user_wanted, lesson, tags, project;
    
    if (!p.str("what_i_did", what_i_did, true) ||
        !p.str("what_user_wanted", what_user_wanted, true) ||
        !p.str("lesson", lesson, true) ||
        !p.str("tags", tags, false) ||
        !p.str("project", project, false)) {
        return ToolResult::fail(p.error());
    }
    
    RecordResult rec;
    Pattern pattern;
    if (!manager_.record_correction(what_i_did, what_user_wanted, lesson, tags, project, rec, pattern)) {
        return ToolResult::fail("Failed to record correction: " + manager_.last_error());
    }
    checkpoint_after_write();
    
    std::ostringstream oss;
    oss << "Correction recorded"
        << (rec.outcome == RecordOutcome::DEDUPLICATED ? " (deduplicated)" : "")
        << " (id: " << rec.id << ") and pattern updated (seen " << pattern.frequency
        << "x). Lesson: \"" << lesson << "\"";
    
    Json data = Json::object();
    data["output"] = oss.str();
    data["id"] = rec.id;
    data["outcome"] = record_outcome_to_string(rec.outcome);
    data["pattern"] = pattern_to_json(pattern);
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_query_memory(const Json& params) {
    ParamReader p(params);
    std::string query, project;
    int64_t limit = 5;
    
    if (!p.str("query", query, true) ||
        !p.str("project", project, false) ||
        !p.integer("limit", limit, false)) {
        return ToolResult::fail(p.error());
    }
    limit = clamp<int64_t>(limit, 1, 50);
    
    SearchResult found;
    if (!manager_.query(query, project, static_cast<int>(limit), found)) {
        return ToolResult::fail("Search failed: " + manager_.last_error());
    }
    
    const size_t snippet_length = manager_.config().snippet_length;
    Json results = Json::array();
    std::ostringstream oss;
    
    if (found.fallback) {
        oss << "Direct search unavailable. Last " << found.hits.size() << " experiences:\n";
        for (size_t i = 0; i < found.hits.size(); ++i) {
            const Experience& e = found.hits[i].entry;
            oss << "\n" << (i + 1) << ". [id:" << e.id << "] [" << experience_type_to_string(e.type) << "] "
                << utf8_prefix(e.context, snippet_length) << " \xE2\x86\x92 " << utf8_prefix(e.result, snippet_length);
            results.push_back(compact_to_json(make_compact(e, snippet_length)));
        }
    } else if (found.hits.empty()) {
        oss << "No relevant experiences found in memory. This is uncharted territory.";
    } else {
        oss << "Found " << found.hits.size() << " relevant experiences (compact):\n";
        for (size_t i = 0; i < found.hits.size(); ++i) {
            const ScoredExperience& hit = found.hits[i];
            CompactExperience c = make_compact(hit.entry, snippet_length);
            
            oss << "\n" << (i + 1) << ". [id:" << c.id << "] [" << experience_type_to_string(c.type) << "] "
                << (c.success ? "OK" : "FAIL");
            if (!c.project.empty()) oss << " (" << c.project << ")";
            oss << " | " << c.snippet;
            if (utf8_length(hit.entry.context) > snippet_length) oss << "...";
            oss << "\n   Tags: " << (c.tags.empty() ? "(none)" : c.tags)
                << " | " << format_timestamp_ms(c.created_at);
            if (c.duplicate_count > 1) oss << " | x" << c.duplicate_count << " dups";
            if (c.revision_count > 1) oss << " | rev " << c.revision_count;
            oss << "\n";
            
            Json j = compact_to_json(c);
            j["score"] = round_to(hit.score, 4);
            results.push_back(j);
        }
        oss << "\nUse get_experience(id) for full details.";
    }
    
    Json data = Json::object();
    data["output"] = oss.str();
    data["results"] = results;
    data["fallback"] = found.fallback;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_get_experience(const Json& params) {
    ParamReader p(params);
    int64_t id = 0;
    if (!p.integer("id", id, true)) {
        return ToolResult::fail(p.error());
    }
    
    Json data = Json::object();
    Experience e;
    if (!manager_.get_experience(id, e)) {
        data["output"] = "Experience #" + std::to_string(id) + " not found (may have been deleted).";
        data["found"] = false;
        return ToolResult::ok(data);
    }
    
    std::ostringstream oss;
    oss << "=== Experience #" << e.id << " ===\n"
        << "Type:       " << experience_type_to_string(e.type) << "\n"
        << "Success:    " << (e.success ? "Yes" : "No") << "\n"
        << "Project:    " << (e.project.empty() ? "(global)" : e.project) << "\n"
        << "Tags:       " << (e.tags.empty() ? "(none)" : e.tags) << "\n"
        << "Created:    " << format_timestamp_ms(e.created_at) << "\n";
    if (!e.topic_key.empty()) oss << "Topic:      " << e.topic_key << "\n";
    if (e.revision_count > 1) oss << "Revisions:  " << e.revision_count << "\n";
    if (e.duplicate_count > 1) oss << "Duplicates: " << e.duplicate_count << "\n";
    oss << "\n"
        << "Context:    " << e.context << "\n"
        << "Action:     " << e.action << "\n"
        << "Result:     " << e.result;
    
    data["output"] = oss.str();
    data["found"] = true;
    data["experience"] = experience_to_json(e);
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_get_timeline(const Json& params) {
    ParamReader p(params);
    int64_t id = 0;
    if (!p.integer("id", id, true)) {
        return ToolResult::fail(p.error());
    }
    
    std::vector<Experience> entries = manager_.timeline(id);
    
    Json data = Json::object();
    Json results = Json::array();
    
    if (entries.empty()) {
        data["output"] = "No timeline found for experience #" + std::to_string(id) + " (may have been deleted).";
        data["results"] = results;
        return ToolResult::ok(data);
    }
    
    const size_t snippet_length = manager_.config().snippet_length;
    std::ostringstream oss;
    oss << "Timeline around experience #" << id << " (+-"
        << (manager_.config().timeline_window_ms / 60000) << " min):\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        const Experience& e = entries[i];
        CompactExperience c = make_compact(e, snippet_length);
        oss << "\n[" << format_timestamp_ms(e.created_at) << "] #" << e.id
            << " [" << experience_type_to_string(e.type) << "] " << (e.success ? "OK" : "FAIL")
            << " | " << c.snippet;
        if (e.id == id) oss << " <<<";
        results.push_back(compact_to_json(c));
    }
    
    data["output"] = oss.str();
    data["results"] = results;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_forget_memory(const Json& params) {
    ParamReader p(params);
    ForgetSelector selector;
    int64_t id = 0;
    
    if (!p.integer("id", id, false) ||
        !p.str("tag", selector.tag, false) ||
        !p.str("project", selector.project, false) ||
        !p.boolean("exact_tag", selector.exact_tag, false)) {
        return ToolResult::fail(p.error());
    }
    if (p.has("id")) {
        selector.has_id = true;
        selector.id = id;
    }
    
    if (selector.empty()) {
        return ToolResult::fail("you must provide at least one of: id, tag, or project.");
    }
    
    ForgetResult res = manager_.forget(selector);
    if (!res.ok) {
        return ToolResult::fail("Forget failed: " + res.error);
    }
    if (res.count > 0) checkpoint_after_write();
    
    std::ostringstream oss;
    oss << "Soft-deleted " << res.count << " experience(s). " << totals_line(true);
    
    Json data = Json::object();
    data["output"] = oss.str();
    data["count"] = res.count;
    return ToolResult::ok(data);
}

// ============================================================================
// Preference and Pattern Actions
// ============================================================================

ToolResult MemoryTool::do_learn_preference(const Json& params) {
    ParamReader p(params);
    std::string key, value;
    std::string scope = "global";
    std::string source = "observed";
    
    if (!p.str("key", key, true) ||
        !p.str("value", value, true) ||
        !p.str("scope", scope, false) ||
        !p.str("source", source, false)) {
        return ToolResult::fail(p.error());
    }
    if (trim(scope).empty()) scope = "global";
    if (trim(source).empty()) source = "observed";
    
    ResolvedPreference pref;
    if (!manager_.learn_preference(key, value, scope, source, pref)) {
        return ToolResult::fail("Failed to save preference: " + manager_.last_error());
    }
    checkpoint_after_write();
    
    std::string scope_label = scope == "global" ? "GLOBAL" : "project: " + scope;
    std::ostringstream oss;
    oss << "Preference \"" << key << "\" = \"" << value << "\" saved [" << scope_label << "] "
        << "(confidence: " << format_confidence(pref.pref.confidence)
        << ", effective: " << format_confidence(pref.effective_confidence)
        << ", confirmed " << pref.pref.confirmed_count << "x).";
    
    Json data = preference_to_json(pref);
    data["output"] = oss.str();
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_get_preferences(const Json& params) {
    ParamReader p(params);
    std::string project;
    if (!p.str("project", project, false)) {
        return ToolResult::fail(p.error());
    }
    
    std::vector<ResolvedPreference> prefs = manager_.preferences(project);
    
    Json data = Json::object();
    Json results = Json::array();
    
    if (prefs.empty()) {
        data["output"] = "No preferences saved yet. They will be learned with usage.";
        data["results"] = results;
        return ToolResult::ok(data);
    }
    
    std::ostringstream oss;
    oss << (project.empty() ? std::string("Global preferences")
                            : "Preferences for " + project + " (global + project)") << ":\n";
    for (size_t i = 0; i < prefs.size(); ++i) {
        const ResolvedPreference& r = prefs[i];
        oss << "\n- " << r.pref.key << ": \"" << r.pref.value << "\""
            << " (confidence: " << format_confidence(r.pref.confidence)
            << ", effective: " << format_confidence(r.effective_confidence)
            << ", decay: " << format_confidence(r.decay_factor) << ") [" << r.origin << "]";
        results.push_back(preference_to_json(r));
    }
    
    data["output"] = oss.str();
    data["results"] = results;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_get_patterns(const Json& params) {
    ParamReader p(params);
    int64_t limit = 10;
    if (!p.integer("limit", limit, false)) {
        return ToolResult::fail(p.error());
    }
    limit = clamp<int64_t>(limit, 1, 100);
    
    std::vector<Pattern> patterns = manager_.top_patterns(static_cast<int>(limit));
    
    Json data = Json::object();
    Json results = Json::array();
    
    if (patterns.empty()) {
        data["output"] = "No patterns detected yet. They will form with usage.";
        data["results"] = results;
        return ToolResult::ok(data);
    }
    
    std::ostringstream oss;
    oss << patterns.size() << " patterns detected:\n";
    for (size_t i = 0; i < patterns.size(); ++i) {
        const Pattern& pat = patterns[i];
        oss << "\n" << (i + 1) << ". [x" << pat.frequency << "] " << pat.description
            << "\n   Category: " << (pat.category.empty() ? "(none)" : pat.category)
            << " | Last seen: " << format_timestamp_ms(pat.last_seen);
        if (!pat.examples.empty()) {
            oss << "\n   Latest: " << pat.examples.back();
        }
        oss << "\n";
        results.push_back(pattern_to_json(pat));
    }
    
    data["output"] = oss.str();
    data["results"] = results;
    return ToolResult::ok(data);
}

// ============================================================================
// Maintenance Actions
// ============================================================================

ToolResult MemoryTool::do_memory_stats(const Json& params) {
    (void)params;
    
    MemoryStats stats;
    if (!manager_.stats(stats)) {
        return ToolResult::fail("Failed to read statistics: " + manager_.last_error());
    }
    
    std::vector<Experience> corrections = manager_.recent_corrections(3);
    std::vector<Pattern> patterns = manager_.top_patterns(3);
    
    std::ostringstream oss;
    oss << "=== Memory Status ===\n"
        << "Experiences:        " << stats.experiences << "\n"
        << "Corrections:        " << stats.corrections << "\n"
        << "Soft-deleted:       " << stats.soft_deleted << "\n"
        << "Global prefs:       " << stats.global_prefs << "\n"
        << "Project prefs:      " << stats.project_prefs << "\n"
        << "Patterns:           " << stats.patterns;
    
    Json latest = Json::array();
    if (!corrections.empty()) {
        oss << "\n\nLatest corrections:";
        for (size_t i = 0; i < corrections.size(); ++i) {
            oss << "\n- " << corrections[i].result;
            latest.push_back(corrections[i].result);
        }
    }
    
    Json top = Json::array();
    if (!patterns.empty()) {
        oss << "\n\nTop patterns:";
        for (size_t i = 0; i < patterns.size(); ++i) {
            oss << "\n- [x" << patterns[i].frequency << "] " << patterns[i].description;
            top.push_back(pattern_to_json(patterns[i]));
        }
    }
    
    Json data = stats_to_json(stats);
    data["output"] = oss.str();
    data["latest_corrections"] = latest;
    data["top_patterns"] = top;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_prune_memory(const Json& params) {
    ParamReader p(params);
    PruneOptions options;
    int64_t days = 0;
    
    if (!p.integer("older_than_days", days, false) ||
        !p.boolean("only_failures", options.only_failures, false) ||
        !p.number("min_confidence", options.min_confidence, false)) {
        return ToolResult::fail(p.error());
    }
    options.older_than_days = static_cast<int>(clamp<int64_t>(days, 0, 1000000));
    options.has_min_confidence = p.has("min_confidence");
    
    if (options.older_than_days <= 0 && !options.has_min_confidence) {
        return ToolResult::fail("you must provide at least older_than_days or min_confidence.");
    }
    
    PruneResult res = manager_.prune(options);
    if (!res.ok) {
        return ToolResult::fail("Prune failed: " + res.error);
    }
    if (res.experiences > 0 || res.preferences > 0) checkpoint_after_write();
    
    std::ostringstream oss;
    if (res.experiences > 0 && res.preferences > 0) {
        oss << "Pruned " << res.experiences << " experience(s) and " << res.preferences << " preference(s).";
    } else if (res.experiences > 0) {
        oss << "Pruned " << res.experiences << " experience(s).";
    } else if (res.preferences > 0) {
        oss << "Pruned " << res.preferences << " preference(s).";
    } else {
        oss << "No records matched the criteria.";
    }
    oss << " " << totals_line(true);
    
    Json data = Json::object();
    data["output"] = oss.str();
    data["experiences"] = res.experiences;
    data["preferences"] = res.preferences;
    return ToolResult::ok(data);
}

ToolResult MemoryTool::do_session_context(const Json& params) {
    ParamReader p(params);
    std::string project;
    if (!p.str("project", project, false)) {
        return ToolResult::fail(p.error());
    }
    
    Json data = Json::object();
    data["output"] = manager_.session_context(project);
    data["project"] = project;
    return ToolResult::ok(data);
}

} // namespace engram
