/*
 * engram - Application Implementation
 * 
 * Central application singleton managing the lifecycle of all components.
 */
#include <engram/core/application.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

#include <iostream>
#include <fstream>
#include <csignal>
#include <cstring>
#include <cstdlib>

namespace engram {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Persistent memory for coding agents\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  --config FILE  Load configuration from FILE (default: ~/.engram/config.json)\n"
              << "  --db PATH      Database file (overrides memory.db_path)\n"
              << "  --list-tools   Print the tool catalogue and exit\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Tool calls are read from stdin, one JSON object per line:\n"
              << "  {\"tool\": \"query_memory\", \"arguments\": {\"query\": \"linker error\"}}\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
        LOG_INFO("Received shutdown signal");
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , list_tools_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_ = false;
            return false;
        }
        if (strcmp(argv[i], "--list-tools") == 0) {
            list_tools_ = true;
            continue;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_override_ = std::string(argv[++i]);
            continue;
        }
        
        std::cerr << "Unknown or incomplete option: " << argv[i] << "\n\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

bool Application::load_config() {
    // An explicit --config must load; the default file is optional
    if (!config_file_.empty()) {
        if (!config_.load(config_file_)) {
            LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), config_.last_error().c_str());
            return false;
        }
        LOG_INFO("Loaded config from %s", config_file_.c_str());
        return true;
    }
    
    std::string default_file = expand_home("~/.engram/config.json");
    std::ifstream probe(default_file.c_str());
    if (!probe.good()) {
        LOG_DEBUG("No config at %s, using defaults", default_file.c_str());
        return true;
    }
    probe.close();
    
    if (!config_.load(default_file)) {
        LOG_ERROR("Failed to load config from %s: %s", default_file.c_str(), config_.last_error().c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", default_file.c_str());
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::setup_memory() {
    if (!db_override_.empty()) {
        config_.set_string("memory.db_path", db_override_);
    }
    
    if (!memory_.init(config_)) {
        LOG_ERROR("Failed to initialize memory tool");
        return false;
    }
    
    dispatcher_.register_provider(memory_);
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }
    
    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    
    if (!load_config()) {
        return false;
    }
    setup_logging();
    
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);
    
    return setup_memory();
}

int Application::run() {
    return run(std::cin, std::cout);
}

int Application::run(std::istream& in, std::ostream& out) {
    if (list_tools_) {
        out << dispatcher_.build_tools_prompt();
        out.flush();
        return 0;
    }
    
    LOG_INFO("Serving %zu tools on stdio", dispatcher_.tools().size());
    
    std::string line;
    while (running_.load() && std::getline(in, line)) {
        std::string input = trim(line);
        if (input.empty() || input[0] == '#') continue;
        
        std::string response = dispatcher_.handle(input);
        if (response.empty()) {
            response = dispatcher_.format_tool_result("unknown",
                AgentToolResult::fail("No tool call found. Expected {\"tool\": \"name\", \"arguments\": {...}}"));
        }
        
        out << response << "\n";
        out.flush();
    }
    
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    memory_.shutdown();
    LOG_INFO("Goodbye!");
}

} // namespace engram
