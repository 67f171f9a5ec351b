/*
 * dash - Application Implementation
 */
#include <dash/core/application.hpp>
#include <dash/core/commands.hpp>
#include <dash/core/logger.hpp>
#include <dash/core/utils.hpp>

#include <iostream>
#include <cstdlib>
#include <cstring>

namespace dash {

// ============================================================================
// Option Parsing
// ============================================================================

namespace {

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// Accept "--name VALUE" and "--name=VALUE"
bool take_value(const char* name, int argc, char* argv[], int& i,
                std::string& value, std::string& error) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) != 0) return false;

    if (argv[i][len] == '=') {
        value = std::string(argv[i] + len + 1);
        if (value.empty()) error = std::string(name) + " requires a value";
        return true;
    }
    if (argv[i][len] != '\0') return false;

    if (i + 1 >= argc) {
        error = std::string(name) + " requires a value";
        return true;
    }
    value = std::string(argv[++i]);
    return true;
}

} // namespace

bool parse_cli_options(int argc, char* argv[], CliOptions& out, std::string& error) {
    out = CliOptions();
    error.clear();

    int i = 1;
    for (; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "--") == 0) {
            ++i;
            break;
        }
        if (arg[0] != '-' || arg[1] == '\0') {
            break;
        }
        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            out.show_help = true;
            continue;
        }
        if (strcmp(arg, "--version") == 0) {
            out.show_version = true;
            continue;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            out.verbose = true;
            continue;
        }
        if (take_value("--config", argc, argv, i, out.config_file, error) ||
            take_value("--data-dir", argc, argv, i, out.data_dir, error)) {
            if (!error.empty()) return false;
            continue;
        }

        error = std::string("unknown option: ") + arg;
        return false;
    }

    for (; i < argc; ++i) {
        out.command.push_back(argv[i]);
    }
    return true;
}

std::string default_base_dir(const CliOptions& options, const char* env_home) {
    if (!options.data_dir.empty()) return options.data_dir;
    if (env_home && env_home[0] != '\0') return std::string(env_home);
    return join_path(home_directory(), AppInfo::DATA_DIR_NAME);
}

std::string resolve_data_dir(const CliOptions& options, const char* env_home, const Config& config) {
    if (!options.data_dir.empty()) return options.data_dir;
    if (env_home && env_home[0] != '\0') return std::string(env_home);

    std::string configured = config.get_string("data_dir", "");
    if (starts_with(configured, "~/")) {
        configured = join_path(home_directory(), configured.substr(2));
    }
    if (!configured.empty()) return configured;

    return join_path(home_directory(), AppInfo::DATA_DIR_NAME);
}

bool command_uses_store(const CliOptions& options) {
    if (options.command.empty()) return false;
    const CommandDef* cmd = find_command(options.command[0]);
    return cmd && cmd->uses_store;
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : program_(AppInfo::NAME)
    , exit_code_(0)
{}

bool Application::load_config() {
    std::string path = options_.config_file;
    if (path.empty()) {
        path = join_path(default_base_dir(options_, getenv(AppInfo::HOME_ENV)), AppInfo::CONFIG_FILE);
    }

    if (!config_.load_file(path)) {
        std::cerr << "Invalid configuration: " << config_.last_error() << "\n";
        return false;
    }
    return true;
}

bool Application::setup_logging() {
    if (options_.verbose) {
        Logger::instance().set_level(LogLevel::DEBUG);
        return true;
    }

    std::string name = config_.get_string("log_level", "warn");
    LogLevel level;
    if (!parse_log_level(name, level)) {
        std::cerr << "Invalid configuration: unknown log_level '" << name << "'\n";
        return false;
    }
    Logger::instance().set_level(level);
    return true;
}

bool Application::setup_store() {
    std::string data_dir = resolve_data_dir(options_, getenv(AppInfo::HOME_ENV), config_);
    std::string db_path = join_path(data_dir, AppInfo::DATABASE_FILE);

    if (!create_directories(data_dir)) {
        LOG_ERROR("Failed to create data directory %s", data_dir.c_str());
        std::cerr << "Cannot create data directory " << data_dir << "\n";
        return false;
    }

    if (!store_.open(db_path) || !store_.ensure_initialized()) {
        std::cerr << "Cannot open data store " << db_path << ": " << store_.last_error() << "\n";
        return false;
    }

    LOG_DEBUG("Using data store %s", db_path.c_str());
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (argc > 0 && argv[0]) {
        program_ = argv[0];
    }

    std::string error;
    if (!parse_cli_options(argc, argv, options_, error)) {
        std::cerr << program_ << ": " << error << "\n";
        print_usage(std::cout, program_);
        exit_code_ = 1;
        return false;
    }

    if (options_.show_help) {
        print_usage(std::cout, program_);
        exit_code_ = 0;
        return false;
    }
    if (options_.show_version) {
        print_version();
        exit_code_ = 0;
        return false;
    }

    // Verbose must be honored before the config file is even read
    if (options_.verbose) {
        Logger::instance().set_level(LogLevel::DEBUG);
    }

    if (!load_config() || !setup_logging()) {
        exit_code_ = 1;
        return false;
    }

    // Usage needs no store; don't create one just to print help
    if (!command_uses_store(options_)) {
        return true;
    }

    if (!setup_store()) {
        exit_code_ = 1;
        return false;
    }
    return true;
}

int Application::run() {
    CommandContext ctx(store_, std::cout, std::cerr, program_, current_timestamp_ms);
    exit_code_ = dispatch_command(ctx, options_.command);
    return exit_code_;
}

void Application::shutdown() {
    store_.close();
    LOG_DEBUG("Exiting with status %d", exit_code_);
}

} // namespace dash
