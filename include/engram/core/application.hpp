/*
 * engram - Application
 * 
 * Process lifecycle: command line, configuration, logging, the memory
 * tool and a line-oriented stdio loop feeding the dispatcher.
 */
#ifndef engram_CORE_APPLICATION_HPP
#define engram_CORE_APPLICATION_HPP

#include "config.hpp"
#include "dispatcher.hpp"
#include "memory_tool.hpp"
#include <string>
#include <atomic>
#include <iosfwd>

namespace engram {

struct AppInfo {
    static constexpr const char* NAME = "engram";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();
    
    // false for --help/--version (is_running() == false) or a fatal error
    bool init(int argc, char* argv[]);
    
    // Serve tool calls from in until EOF or stop(); prints the catalogue
    // instead when --list-tools was given
    int run();
    int run(std::istream& in, std::ostream& out);
    
    void shutdown();
    void stop() { running_ = false; }
    bool is_running() const { return running_.load(); }
    
    Config& config() { return config_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    MemoryTool& memory() { return memory_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);
    
    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_memory();
    
    std::atomic<bool> running_;
    bool list_tools_;
    std::string config_file_;
    std::string db_override_;
    
    Config config_;
    MemoryTool memory_;
    Dispatcher dispatcher_;
};

} // namespace engram

#endif // engram_CORE_APPLICATION_HPP
