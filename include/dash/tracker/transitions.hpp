/*
 * dash - Record state transitions
 *
 * Each project is either idle (no open record) or active on exactly one
 * phase. Transitions never touch the snapshot they are given: they return
 * a new record set (or meta/project set) for the caller to persist.
 *
 *   start(phase)   open a record; switching phase closes the open one at
 *                  the same instant; an empty phase resumes the last one
 *   end()          close the open record
 *   remove_last()  delete the most recent record
 */
#ifndef DASH_TRACKER_TRANSITIONS_HPP
#define DASH_TRACKER_TRANSITIONS_HPP

#include <dash/tracker/types.hpp>
#include <string>

namespace dash {

enum class TransitionStatus {
    CHANGED,
    UNCHANGED,
    NO_CURRENT_PROJECT,
    PHASE_REQUIRED
};

const char* transition_status_str(TransitionStatus status);

struct TransitionResult {
    TransitionStatus status;
    RecordSet records;          // Resulting set; equals the input unless CHANGED

    TransitionResult() : status(TransitionStatus::UNCHANGED) {}
    TransitionResult(TransitionStatus s, const RecordSet& r) : status(s), records(r) {}

    bool changed() const { return status == TransitionStatus::CHANGED; }
    bool failed() const {
        return status == TransitionStatus::NO_CURRENT_PROJECT ||
               status == TransitionStatus::PHASE_REQUIRED;
    }
};

// An empty `phase` means "no phase given"
TransitionResult start_phase(const TrackerState& state, const std::string& phase, int64_t now);

// Closing an already closed record is a no-op
TransitionResult end_phase(const TrackerState& state, int64_t now);

TransitionResult remove_last_record(const TrackerState& state);

struct ProjectSwitch {
    Meta meta;
    ProjectSet projects;
    bool created;

    ProjectSwitch() : created(false) {}
};

// Make `name` current, creating the project first if it does not exist
ProjectSwitch switch_project(const TrackerState& state, const std::string& name, int64_t now);

} // namespace dash

#endif // DASH_TRACKER_TRANSITIONS_HPP
