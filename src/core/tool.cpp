/*
 * engram - Tool Provider Implementation
 */
#include <engram/core/tool.hpp>
#include <engram/core/dispatcher.hpp>

namespace engram {

std::vector<AgentTool> ToolProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    ToolProvider* self = const_cast<ToolProvider*>(this);
    
    const std::vector<std::string> action_list = actions();
    const std::string id = tool_id();
    const std::string desc = description();
    
    for (size_t i = 0; i < action_list.size(); ++i) {
        const std::string action = action_list[i];
        
        AgentTool tool;
        tool.name = id + "_" + action;
        tool.description = desc + " - " + action + " action";
        tool.params.push_back(ToolParamSchema("params", "object", "Action parameters", false));
        tool.execute = [self, action](const Json& params) -> AgentToolResult {
            const Json& args = params.contains("params") ? params["params"] : params;
            ToolResult r = self->execute(action, args);
            if (!r.success) return AgentToolResult::fail(r.error);
            return AgentToolResult::ok(r.data.dump(-1, ' ', false, Json::error_handler_t::replace));
        };
        tools.push_back(tool);
    }
    
    return tools;
}

} // namespace engram
