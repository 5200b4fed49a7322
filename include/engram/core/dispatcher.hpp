/*
 * engram - Tool Dispatcher
 * 
 * Routes JSON tool calls to registered tools and formats their results.
 * 
 * Tool Call Format:
 *   {"tool": "tool_name", "arguments": {"param1": "value1", "param2": "value2"}}
 * 
 * Tool Result Format:
 *   [TOOL_RESULT tool=tool_name success=true]
 *     ... result content ...
 *   [/TOOL_RESULT]
 */
#ifndef engram_CORE_DISPATCHER_HPP
#define engram_CORE_DISPATCHER_HPP

#include "json.hpp"
#include "logger.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>

namespace engram {

class ToolProvider;

// ============================================================================
// Tool Definition
// ============================================================================

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;
    
    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result
struct AgentToolResult {
    bool success;
    std::string output;     // Text output
    std::string error;      // Error message if failed
    
    AgentToolResult() : success(false) {}
    
    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }
    
    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Tool execution function type
typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

// Tool definition
struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;
    
    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
};

// ============================================================================
// Parsed Tool Call
// ============================================================================

struct ParsedToolCall {
    std::string tool_name;
    Json params;
    std::string raw_content;  // Raw JSON content of the tool call
    size_t start_pos;       // Position in original text
    size_t end_pos;         // End position in original text
    bool valid;
    std::string parse_error;
    
    ParsedToolCall() : start_pos(0), end_pos(0), valid(false) {}
};

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher {
public:
    Dispatcher();
    ~Dispatcher();
    
    // Register a tool
    void register_tool(const AgentTool& tool);
    void register_tool(const std::string& name, const std::string& desc, ToolExecutor executor);
    
    // Register every AgentTool a provider exposes
    void register_provider(const ToolProvider& provider);
    
    // Get registered tools
    const std::map<std::string, AgentTool>& tools() const { return tools_; }
    
    // Human-readable catalogue of registered tools
    std::string build_tools_prompt() const;
    
    // Find every {"tool": ...} object in text
    std::vector<ParsedToolCall> parse_tool_calls(const std::string& text) const;
    
    // Execute a single tool call
    AgentToolResult execute_tool(const ParsedToolCall& call);
    
    // Format tool result as a [TOOL_RESULT] block
    std::string format_tool_result(const std::string& tool_name, const AgentToolResult& result) const;
    
    // Parse, execute and format every call in text. Empty when text holds no call.
    std::string handle(const std::string& text);

private:
    std::map<std::string, AgentTool> tools_;
    
    std::string tool_names() const;
};

} // namespace engram

#endif // engram_CORE_DISPATCHER_HPP
