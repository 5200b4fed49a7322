/*
 * engram - Tool Dispatcher Implementation
 */
#include <engram/core/dispatcher.hpp>
#include <engram/core/tool.hpp>
#include <sstream>

namespace engram {

Dispatcher::Dispatcher() {}

Dispatcher::~Dispatcher() {}

void Dispatcher::register_tool(const AgentTool& tool) {
    LOG_DEBUG("[Dispatcher] Registering tool: %s", tool.name.c_str());
    tools_[tool.name] = tool;
}

void Dispatcher::register_tool(const std::string& name, const std::string& desc, ToolExecutor executor) {
    AgentTool tool(name, desc, executor);
    register_tool(tool);
}

void Dispatcher::register_provider(const ToolProvider& provider) {
    std::vector<AgentTool> provided = provider.get_agent_tools();
    for (size_t i = 0; i < provided.size(); ++i) {
        register_tool(provided[i]);
    }
    LOG_INFO("[Dispatcher] Registered %zu tools from provider '%s'", provided.size(), provider.name());
}

std::string Dispatcher::tool_names() const {
    std::string names;
    for (std::map<std::string, AgentTool>::const_iterator t = tools_.begin(); t != tools_.end(); ++t) {
        if (t != tools_.begin()) names += ", ";
        names += t->first;
    }
    return names;
}

std::string Dispatcher::build_tools_prompt() const {
    if (tools_.empty()) {
        return "";
    }
    
    std::ostringstream oss;
    oss << "## Available Tools\n\n";
    oss << "Send one JSON object per line:\n\n";
    oss << "  {\"tool\": \"TOOLNAME\", \"arguments\": {\"param\": \"value\"}}\n\n";
    oss << "### Tools:\n\n";
    
    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin();
         it != tools_.end(); ++it) {
        const AgentTool& tool = it->second;
        oss << "**" << tool.name << "**: " << tool.description << "\n";
        
        if (!tool.params.empty()) {
            oss << "  Parameters:\n";
            for (size_t i = 0; i < tool.params.size(); ++i) {
                const ToolParamSchema& param = tool.params[i];
                oss << "  - `" << param.name << "` (" << param.type;
                if (param.required) oss << ", required";
                oss << "): " << param.description << "\n";
            }
        }
        oss << "\n";
    }
    
    return oss.str();
}

std::vector<ParsedToolCall> Dispatcher::parse_tool_calls(const std::string& text) const {
    std::vector<ParsedToolCall> calls;
    
    // Scan for '{' and try to parse balanced JSON objects that carry a "tool" key
    size_t pos = 0;
    while (pos < text.size()) {
        size_t brace_start = text.find('{', pos);
        if (brace_start == std::string::npos) break;
        
        // Find the matching closing brace
        int brace_count = 1;
        size_t scan = brace_start + 1;
        bool in_string = false;
        bool escape_next = false;
        while (scan < text.size() && brace_count > 0) {
            char c = text[scan];
            if (escape_next) {
                escape_next = false;
                scan++;
                continue;
            }
            if (c == '\\' && in_string) {
                escape_next = true;
                scan++;
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
            } else if (!in_string) {
                if (c == '{') brace_count++;
                else if (c == '}') brace_count--;
            }
            scan++;
        }
        
        if (brace_count != 0) {
            // Unmatched braces, skip
            pos = brace_start + 1;
            continue;
        }
        
        std::string candidate = text.substr(brace_start, scan - brace_start);
        
        JsonParseResult parsed = try_parse_json(candidate);
        if (!parsed.ok) {
            LOG_DEBUG("[Dispatcher] Candidate JSON parse failed: %s", parsed.error.c_str());
            pos = brace_start + 1;
            continue;
        }
        
        if (!parsed.value.is_object() || !parsed.value.contains("tool") || !parsed.value["tool"].is_string()) {
            pos = scan;
            continue;
        }
        
        std::string tool_name = parsed.value["tool"].get<std::string>();
        if (tool_name.empty()) {
            LOG_DEBUG("[Dispatcher] JSON has 'tool' key but empty value, skipping");
            pos = scan;
            continue;
        }
        
        ParsedToolCall call;
        call.tool_name = tool_name;
        call.start_pos = brace_start;
        call.end_pos = scan;
        call.raw_content = candidate;
        
        if (parsed.value.contains("arguments") && parsed.value["arguments"].is_object()) {
            call.params = parsed.value["arguments"];
            call.valid = true;
        } else if (parsed.value.contains("arguments") && parsed.value["arguments"].is_string()) {
            // Arguments sent as a JSON string
            std::string args_str = parsed.value["arguments"].get<std::string>();
            JsonParseResult args_parsed = try_parse_json(args_str);
            if (args_parsed.ok && args_parsed.value.is_object()) {
                call.params = args_parsed.value;
                call.valid = true;
            } else {
                call.parse_error = "Arguments field is a string but not valid JSON: " + args_str;
                LOG_WARN("[Dispatcher] Failed to parse stringified arguments for '%s'", tool_name.c_str());
            }
        } else if (parsed.value.contains("arguments") && !parsed.value["arguments"].is_null()) {
            call.parse_error = "Arguments must be a JSON object";
        } else {
            // No arguments field - that's OK for tools with no params
            call.params = Json::object();
            call.valid = true;
        }
        
        calls.push_back(call);
        pos = scan;
        
        LOG_DEBUG("[Dispatcher] Parsed tool call: %s (valid=%s)",
                  tool_name.c_str(), call.valid ? "yes" : "no");
    }
    
    return calls;
}

AgentToolResult Dispatcher::execute_tool(const ParsedToolCall& call) {
    std::map<std::string, AgentTool>::iterator it = tools_.find(call.tool_name);
    if (it == tools_.end()) {
        return AgentToolResult::fail("Unknown tool: " + call.tool_name + "\nAvailable tools: " + tool_names());
    }
    
    if (!call.valid) {
        return AgentToolResult::fail("Invalid tool call: " + call.parse_error);
    }
    
    for (size_t i = 0; i < it->second.params.size(); ++i) {
        const ToolParamSchema& param = it->second.params[i];
        if (param.required && (!call.params.contains(param.name) || call.params[param.name].is_null())) {
            return AgentToolResult::fail("Missing required parameter: " + param.name);
        }
    }
    
    LOG_INFO("[Dispatcher] Executing tool: %s", call.tool_name.c_str());
    LOG_DEBUG("[Dispatcher] Tool params: %s", call.params.dump(-1, ' ', false, Json::error_handler_t::replace).c_str());
    
    try {
        AgentToolResult result = it->second.execute(call.params);
        LOG_DEBUG("[Dispatcher] Tool %s result: success=%s, output_len=%zu",
                  call.tool_name.c_str(), result.success ? "yes" : "no",
                  result.output.size());
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("[Dispatcher] Tool %s threw exception: %s", call.tool_name.c_str(), e.what());
        return AgentToolResult::fail(std::string("Tool exception: ") + e.what());
    }
}

std::string Dispatcher::format_tool_result(const std::string& tool_name, const AgentToolResult& result) const {
    std::ostringstream oss;
    oss << "[TOOL_RESULT tool=" << tool_name
        << " success=" << (result.success ? "true" : "false") << "]\n";
    
    if (result.success) {
        oss << result.output;
    } else {
        oss << "Error: " << result.error;
    }
    
    oss << "\n[/TOOL_RESULT]";
    return oss.str();
}

std::string Dispatcher::handle(const std::string& text) {
    std::vector<ParsedToolCall> calls = parse_tool_calls(text);
    
    std::string out;
    for (size_t i = 0; i < calls.size(); ++i) {
        if (!out.empty()) out += "\n";
        out += format_tool_result(calls[i].tool_name, execute_tool(calls[i]));
    }
    return out;
}

} // namespace engram
