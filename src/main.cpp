/*
 * engram - Persistent memory for coding agents
 * 
 * Usage:
 *   ./engram [--config config.json] [--db memory.db] [--list-tools]
 * 
 * Reads one JSON tool call per stdin line and answers each with a
 * [TOOL_RESULT] block on stdout. Logs go to stderr.
 */
#include <engram/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = engram::Application::instance();
    
    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.is_running() ? 1 : 0;
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
