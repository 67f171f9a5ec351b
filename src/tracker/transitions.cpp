#include <dash/tracker/transitions.hpp>
#include <dash/tracker/query.hpp>
#include <dash/core/logger.hpp>

namespace dash {

const char* transition_status_str(TransitionStatus status) {
    switch (status) {
        case TransitionStatus::CHANGED: return "changed";
        case TransitionStatus::UNCHANGED: return "unchanged";
        case TransitionStatus::NO_CURRENT_PROJECT: return "no current project";
        case TransitionStatus::PHASE_REQUIRED: return "phase required";
        default: return "unknown";
    }
}

TransitionResult start_phase(const TrackerState& state, const std::string& phase, int64_t now) {
    const Project* project = get_current_project(state.meta, state.projects);
    if (!project) {
        return TransitionResult(TransitionStatus::NO_CURRENT_PROJECT, state.records);
    }

    const Record* last = get_last_record(*project, state.records);
    if (phase.empty() && !last) {
        return TransitionResult(TransitionStatus::PHASE_REQUIRED, state.records);
    }

    // A clock stepping backwards must not reorder records: the new record
    // never starts before the last one started, or before it ended
    int64_t at = now;
    if (last) {
        int64_t floor = last->is_open() ? last->start : last->end;
        if (at < floor) at = floor;
    }

    TransitionResult result(TransitionStatus::CHANGED, state.records);
    std::string new_phase = phase;

    if (last && last->is_open()) {
        if (phase.empty() || phase == last->phase) {
            result.status = TransitionStatus::UNCHANGED;
            return result;
        }
        // Switching phase closes the open record at the switch instant
        result.records[last->id].end = at;
        LOG_DEBUG("Closed record %lld (%s) on phase switch",
                  static_cast<long long>(last->id), last->phase.c_str());
    } else if (phase.empty()) {
        new_phase = last->phase;
    }

    Record record(next_record_id(result.records), project->name, new_phase, at);
    result.records[record.id] = record;
    LOG_DEBUG("Opened record %lld: project=%s phase=%s",
              static_cast<long long>(record.id), record.project.c_str(), record.phase.c_str());
    return result;
}

TransitionResult end_phase(const TrackerState& state, int64_t now) {
    const Project* project = get_current_project(state.meta, state.projects);
    if (!project) {
        return TransitionResult(TransitionStatus::NO_CURRENT_PROJECT, state.records);
    }

    const Record* last = get_last_record(*project, state.records);
    if (!last || !last->is_open()) {
        return TransitionResult(TransitionStatus::UNCHANGED, state.records);
    }

    TransitionResult result(TransitionStatus::CHANGED, state.records);
    // Clock skew must not produce a negative span
    result.records[last->id].end = now < last->start ? last->start : now;
    return result;
}

TransitionResult remove_last_record(const TrackerState& state) {
    const Project* project = get_current_project(state.meta, state.projects);
    if (!project) {
        return TransitionResult(TransitionStatus::NO_CURRENT_PROJECT, state.records);
    }

    const Record* last = get_last_record(*project, state.records);
    if (!last) {
        return TransitionResult(TransitionStatus::UNCHANGED, state.records);
    }

    TransitionResult result(TransitionStatus::CHANGED, state.records);
    result.records.erase(last->id);
    return result;
}

ProjectSwitch switch_project(const TrackerState& state, const std::string& name, int64_t now) {
    ProjectSwitch result;
    result.meta = state.meta;
    result.projects = state.projects;

    if (!find_project(state.projects, name)) {
        result.projects[name] = Project(name, now);
        result.created = true;
    }
    result.meta.current_project = name;
    return result;
}

} // namespace dash
