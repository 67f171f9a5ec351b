#ifndef DASH_CORE_COMMANDS_HPP
#define DASH_CORE_COMMANDS_HPP

#include <dash/tracker/store.hpp>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace dash {

typedef std::function<int64_t()> Clock;

// Everything a command needs for one load-mutate-save cycle
struct CommandContext {
    TrackerStore& store;
    std::ostream& out;
    std::ostream& err;
    std::string program;
    Clock clock;

    CommandContext(TrackerStore& s, std::ostream& o, std::ostream& e,
                   const std::string& prog, const Clock& c)
        : store(s), out(o), err(e), program(prog), clock(c) {}
};

typedef std::vector<std::string> CommandArgs;
typedef std::function<int(CommandContext& ctx, const CommandArgs& args)> CommandHandler;

struct CommandDef {
    std::string name;
    std::string args;           // Argument synopsis for usage text
    std::string description;
    size_t max_args;
    CommandHandler handler;
    bool uses_store;

    CommandDef(const std::string& n, const std::string& a, const std::string& d,
               size_t max, const CommandHandler& h, bool store = true)
        : name(n), args(a), description(d), max_args(max), handler(h), uses_store(store) {}
};

namespace commands {
    int cmd_start(CommandContext& ctx, const CommandArgs& args);
    int cmd_end(CommandContext& ctx, const CommandArgs& args);
    int cmd_project(CommandContext& ctx, const CommandArgs& args);
    int cmd_status(CommandContext& ctx, const CommandArgs& args);
    int cmd_log(CommandContext& ctx, const CommandArgs& args);
    int cmd_remove_last(CommandContext& ctx, const CommandArgs& args);
    int cmd_usage(CommandContext& ctx, const CommandArgs& args);
}

// All commands, in usage order
const std::vector<CommandDef>& command_table();

const CommandDef* find_command(const std::string& name);

void print_usage(std::ostream& out, const std::string& program);

// Run `argv[0]` with the remaining elements as arguments. Unknown or
// missing commands and surplus arguments print usage and return 1.
int dispatch_command(CommandContext& ctx, const std::vector<std::string>& argv);

} // namespace dash

#endif // DASH_CORE_COMMANDS_HPP
