/*
 * dash - Application
 *
 * Process-level lifecycle: option parsing, configuration, logging, store
 * setup and command dispatch. One instance per process.
 */
#ifndef DASH_CORE_APPLICATION_HPP
#define DASH_CORE_APPLICATION_HPP

#include <dash/core/config.hpp>
#include <dash/tracker/store.hpp>
#include <string>
#include <vector>

namespace dash {

struct AppInfo {
    static constexpr const char* NAME = "dash";
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* DATA_DIR_NAME = ".dash";
    static constexpr const char* DATABASE_FILE = "dash.db";
    static constexpr const char* CONFIG_FILE = "config.json";
    static constexpr const char* HOME_ENV = "DASH_HOME";
};

// Global options come before the command; everything from the first
// non-option argument on is the command line proper.
struct CliOptions {
    bool show_help;
    bool show_version;
    bool verbose;
    std::string config_file;
    std::string data_dir;
    std::vector<std::string> command;

    CliOptions() : show_help(false), show_version(false), verbose(false) {}
};

// Returns false with `error` set on an unknown option or a missing value
bool parse_cli_options(int argc, char* argv[], CliOptions& out, std::string& error);

// Base directory before configuration is read: --data-dir, then
// $DASH_HOME (`env_home`, may be null), then ~/.dash
std::string default_base_dir(const CliOptions& options, const char* env_home);

// Storage directory: --data-dir, then $DASH_HOME, then config "data_dir"
// (a leading "~/" is expanded), then ~/.dash
std::string resolve_data_dir(const CliOptions& options, const char* env_home, const Config& config);

// True when the requested command loads or saves tracker data
bool command_uses_store(const CliOptions& options);

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit without running a
    // command; exit_code() then holds the status (0 for --help/--version).
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool load_config();
    bool setup_logging();
    bool setup_store();

    Config config_;
    TrackerStore store_;
    CliOptions options_;
    std::string program_;
    int exit_code_;
};

} // namespace dash

#endif // DASH_CORE_APPLICATION_HPP
