/*
 * engram - Tool Provider
 *
 * A ToolProvider groups related actions behind one id and exposes them
 * to the dispatcher as AgentTools.
 */
#ifndef engram_CORE_TOOL_HPP
#define engram_CORE_TOOL_HPP

#include "json.hpp"
#include <string>
#include <vector>

namespace engram {

class Config;
struct AgentTool;

// Result of a provider action: structured data on success
struct ToolResult {
    bool success;
    Json data;
    std::string error;
    
    ToolResult() : success(false) {}
    
    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }
    
    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

class ToolProvider {
public:
    ToolProvider() : initialized_(false) {}
    virtual ~ToolProvider() {}
    
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* version() const = 0;
    
    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    
    bool is_initialized() const { return initialized_; }
    
    virtual const char* tool_id() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;
    
    // One generic AgentTool per action ("<tool_id>_<action>") taking the
    // raw parameter object. Override for real parameter schemas.
    virtual std::vector<AgentTool> get_agent_tools() const;

protected:
    bool initialized_;
};

} // namespace engram

#endif // engram_CORE_TOOL_HPP
