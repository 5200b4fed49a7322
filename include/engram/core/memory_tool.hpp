/*
 * engram - Memory Tool
 * 
 * ToolProvider that exposes the experience memory to an agent.
 * 
 * Agent-facing actions:
 *   record_experience  - Save what was tried and how it went
 *   record_correction  - Save a user correction and learn its lesson
 *   learn_preference   - Save or re-affirm a global/project preference
 *   query_memory       - Ranked full-text recall (compact results)
 *   get_experience     - Full record by id
 *   get_timeline       - Experiences within an hour of a given one
 *   get_patterns       - Most frequent recurring patterns
 *   get_preferences    - Preferences with decay applied
 *   memory_stats       - Counters, latest corrections, top patterns
 *   forget_memory      - Soft-delete by id, tag or project
 *   prune_memory       - Age/failure and confidence based cleanup
 *   session_context    - Digest to inject at session start
 */
#ifndef engram_CORE_MEMORY_TOOL_HPP
#define engram_CORE_MEMORY_TOOL_HPP

#include "tool.hpp"
#include "dispatcher.hpp"
#include <engram/memory/manager.hpp>
#include <string>

namespace engram {

class MemoryTool : public ToolProvider {
public:
    MemoryTool();
    virtual ~MemoryTool();
    
    // Plugin interface
    const char* name() const override { return "memory"; }
    const char* description() const override {
        return "Persistent experience, preference and pattern memory";
    }
    const char* version() const override { return "1.0.0"; }
    
    bool init(const Config& cfg) override;
    void shutdown() override;
    
    // ToolProvider interface
    const char* tool_id() const override { return "memory"; }
    std::vector<std::string> actions() const override;
    ToolResult execute(const std::string& action, const Json& params) override;
    
    // Agent tools with detailed descriptions
    std::vector<AgentTool> get_agent_tools() const override;
    
    // Access to the underlying manager
    MemoryManager& manager() { return manager_; }
    const MemoryManager& manager() const { return manager_; }
    
    // Writes not yet followed by a checkpoint
    int writes_since_checkpoint() const { return writes_since_checkpoint_; }

private:
    MemoryManager manager_;
    int writes_since_checkpoint_;
    
    // Tool action implementations
    ToolResult do_record_experience(const Json& params);
    ToolResult do_record_correction(const Json& params);
    ToolResult do_learn_preference(const Json& params);
    ToolResult do_query_memory(const Json& params);
    ToolResult do_get_experience(const Json& params);
    ToolResult do_get_timeline(const Json& params);
    ToolResult do_get_patterns(const Json& params);
    ToolResult do_get_preferences(const Json& params);
    ToolResult do_memory_stats(const Json& params);
    ToolResult do_forget_memory(const Json& params);
    ToolResult do_prune_memory(const Json& params);
    ToolResult do_session_context(const Json& params);
    
    // Count a write and fold the WAL every memory.checkpoint_every writes;
    // failure only warns
    void checkpoint_after_write();
    
    // "Memory: N experiences, ..." summary line
    std::string totals_line(bool with_deleted);
};

} // namespace engram

#endif // engram_CORE_MEMORY_TOOL_HPP
