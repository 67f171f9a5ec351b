/*
 * dash - Command Implementations
 *
 * Each command loads a fresh snapshot, computes the new state with the
 * tracker transitions and writes back only the stores it changed.
 */
#include <dash/core/commands.hpp>
#include <dash/core/logger.hpp>
#include <dash/core/utils.hpp>
#include <dash/tracker/query.hpp>
#include <dash/tracker/transitions.hpp>

namespace dash {

namespace {

const char* const TIME_FORMAT = "%Y-%m-%d %H:%M";

const size_t PHASE_WIDTH = 15;
const size_t START_WIDTH = 20;
const size_t END_WIDTH = 20;
const size_t DELTA_WIDTH = 15;

bool load_state(CommandContext& ctx, TrackerState& state) {
    if (!ctx.store.load(state)) {
        ctx.err << "Failed to load data from " << ctx.store.path() << ": "
                << ctx.store.last_error() << "\n";
        return false;
    }
    return true;
}

int report_save_failure(CommandContext& ctx) {
    ctx.err << "Failed to save data to " << ctx.store.path() << ": "
            << ctx.store.last_error() << "\n";
    return 1;
}

int report_no_project(CommandContext& ctx) {
    ctx.err << "Current project not set\n";
    return 1;
}

// Shared tail of start/end/remove-last
int apply_transition(CommandContext& ctx, const TransitionResult& result, const char* what) {
    LOG_DEBUG("%s: %s", what, transition_status_str(result.status));

    switch (result.status) {
        case TransitionStatus::NO_CURRENT_PROJECT:
            return report_no_project(ctx);
        case TransitionStatus::PHASE_REQUIRED:
            ctx.out << "Last record not found - phase required\n";
            return 1;
        case TransitionStatus::UNCHANGED:
            return 0;
        case TransitionStatus::CHANGED:
            break;
    }

    if (!ctx.store.save_records(result.records)) {
        return report_save_failure(ctx);
    }
    return 0;
}

std::string describe_record(const Record& record) {
    std::string text = record.phase + ", started " + format_local_time(record.start, TIME_FORMAT);
    if (record.is_open()) {
        text += ", in progress";
    } else {
        text += ", ended " + format_local_time(record.end, TIME_FORMAT);
    }
    return text;
}

std::string log_row(const std::string& phase, const std::string& start,
                    const std::string& end, const std::string& delta) {
    return pad_right(phase, PHASE_WIDTH) + pad_right(start, START_WIDTH) +
           pad_right(end, END_WIDTH) + pad_right(delta, DELTA_WIDTH);
}

} // namespace

// ============================================================================
// Command Table
// ============================================================================

const std::vector<CommandDef>& command_table() {
    static const std::vector<CommandDef> table = {
        CommandDef("start", "[phase]", "Start work on a phase, or resume the last one", 1, commands::cmd_start),
        CommandDef("end", "", "End the current phase", 0, commands::cmd_end),
        CommandDef("project", "[name]", "Show, create or switch the current project", 1, commands::cmd_project),
        CommandDef("status", "", "Show the current project and last record", 0, commands::cmd_status),
        CommandDef("log", "", "Print the work log of the current project", 0, commands::cmd_log),
        CommandDef("remove-last", "", "Delete the most recent record", 0, commands::cmd_remove_last),
        CommandDef("usage", "", "Show this help", 0, commands::cmd_usage, false),
    };
    return table;
}

const CommandDef* find_command(const std::string& name) {
    const std::vector<CommandDef>& table = command_table();
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].name == name) return &table[i];
    }
    return nullptr;
}

void print_usage(std::ostream& out, const std::string& program) {
    const std::vector<CommandDef>& table = command_table();

    std::vector<std::string> names;
    for (size_t i = 0; i < table.size(); ++i) {
        names.push_back(table[i].name);
    }

    out << "Usage: " << program << " [options] [" << join(names, "|") << "]\n\n"
        << "Commands:\n";
    for (size_t i = 0; i < table.size(); ++i) {
        std::string synopsis = table[i].name;
        if (!table[i].args.empty()) synopsis += " " + table[i].args;
        out << "  " << pad_right(synopsis, 20) << table[i].description << "\n";
    }
    out << "\nOptions:\n"
        << "  -h, --help          Show this help message\n"
        << "  --version           Show version\n"
        << "  -v, --verbose       Debug logging on stderr\n"
        << "  --config FILE       Configuration file (default ~/.dash/config.json)\n"
        << "  --data-dir DIR      Data directory (default $DASH_HOME or ~/.dash)\n";
}

int dispatch_command(CommandContext& ctx, const std::vector<std::string>& argv) {
    if (argv.empty()) {
        print_usage(ctx.out, ctx.program);
        return 1;
    }

    const CommandDef* cmd = find_command(argv[0]);
    if (!cmd) {
        LOG_DEBUG("Unknown command '%s'", argv[0].c_str());
        print_usage(ctx.out, ctx.program);
        return 1;
    }

    CommandArgs args(argv.begin() + 1, argv.end());
    if (args.size() > cmd->max_args) {
        LOG_DEBUG("Too many arguments for '%s': %zu", cmd->name.c_str(), args.size());
        print_usage(ctx.out, ctx.program);
        return 1;
    }

    LOG_DEBUG("Running command '%s' with %zu argument(s)", cmd->name.c_str(), args.size());
    return cmd->handler(ctx, args);
}

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

int cmd_start(CommandContext& ctx, const CommandArgs& args) {
    TrackerState state;
    if (!load_state(ctx, state)) return 1;

    std::string phase = args.empty() ? "" : args[0];
    return apply_transition(ctx, start_phase(state, phase, ctx.clock()), "start");
}

int cmd_end(CommandContext& ctx, const CommandArgs& /*args*/) {
    TrackerState state;
    if (!load_state(ctx, state)) return 1;

    return apply_transition(ctx, end_phase(state, ctx.clock()), "end");
}

int cmd_remove_last(CommandContext& ctx, const CommandArgs& /*args*/) {
    TrackerState state;
    if (!load_state(ctx, state)) return 1;

    return apply_transition(ctx, remove_last_record(state), "remove-last");
}

int cmd_project(CommandContext& ctx, const CommandArgs& args) {
    TrackerState state;
    if (!load_state(ctx, state)) return 1;

    if (args.empty() || args[0].empty()) {
        ctx.out << "Current project: "
                << (state.meta.has_current_project() ? state.meta.current_project : "none") << "\n";
        return 0;
    }

    const std::string& name = args[0];
    ProjectSwitch result = switch_project(state, name, ctx.clock());
    if (result.created) {
        ctx.out << "Creating project " << name << "\n";
    } else {
        ctx.out << "Setting project to " << name << "\n";
    }

    const ProjectSet* projects = result.created ? &result.projects : nullptr;
    if (!ctx.store.save(&result.meta, projects, nullptr)) {
        return report_save_failure(ctx);
    }
    LOG_INFO("Current project is now '%s'", name.c_str());
    return 0;
}

int cmd_status(CommandContext& ctx, const CommandArgs& /*args*/) {
    TrackerState state;
    if (!load_state(ctx, state)) return 1;

    const Project* project = get_current_project(state.meta, state.projects);
    if (!project) {
        ctx.out << "Current project not set\n";
        return 0;
    }

    const Record* last = get_last_record(*project, state.records);
    ctx.out << "Currently working on project " << project->name << "\n"
            << "Last record: " << (last ? describe_record(*last) : "none") << "\n";
    return 0;
}

int cmd_log(CommandContext& ctx, const CommandArgs& /*args*/) {
    TrackerState state;
    if (!load_state(ctx, state)) return 1;

    const Project* project = get_current_project(state.meta, state.projects);
    if (!project) {
        return report_no_project(ctx);
    }

    int64_t now = ctx.clock();
    std::vector<const Record*> records = sorted_project_records(*project, state.records);

    ctx.out << log_row("PHASE", "START", "END", "DELTA") << "\n";
    for (size_t i = 0; i < records.size(); ++i) {
        const Record& record = *records[i];
        std::string start = format_local_time(record.start, TIME_FORMAT);
        std::string end = record.is_open() ? "" : format_local_time(record.end, TIME_FORMAT);
        int64_t until = record.is_open() ? now : record.end;
        ctx.out << log_row(record.phase, start, end, format_duration(until - record.start)) << "\n";
    }
    return 0;
}

int cmd_usage(CommandContext& ctx, const CommandArgs& /*args*/) {
    print_usage(ctx.out, ctx.program);
    return 1;
}

} // namespace commands

} // namespace dash
