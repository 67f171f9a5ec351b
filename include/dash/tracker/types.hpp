/*
 * dash - Tracker data model
 *
 *   Meta     - which project is current
 *   Project  - a named container for work records
 *   Record   - one contiguous span of work on a phase
 *
 * Projects are keyed by name and records by a synthetic id, so identity
 * never depends on comparing timestamps.
 */
#ifndef DASH_TRACKER_TYPES_HPP
#define DASH_TRACKER_TYPES_HPP

#include <string>
#include <map>
#include <cstdint>

namespace dash {

struct Meta {
    std::string current_project;   // Empty = no current project

    bool has_current_project() const { return !current_project.empty(); }
};

struct Project {
    std::string name;
    int64_t created_at;            // Creation timestamp (unix ms, 0 = unknown)

    Project() : created_at(0) {}
    explicit Project(const std::string& n, int64_t created = 0) : name(n), created_at(created) {}
};

struct Record {
    int64_t id;                    // Stable key, increases with insertion order
    std::string project;           // Owning project name
    std::string phase;             // Category of work
    int64_t start;                 // Start timestamp (unix ms)
    int64_t end;                   // End timestamp (unix ms, 0 = still open)

    Record() : id(0), start(0), end(0) {}
    Record(int64_t i, const std::string& proj, const std::string& ph, int64_t s, int64_t e = 0)
        : id(i), project(proj), phase(ph), start(s), end(e) {}

    bool is_open() const { return end == 0; }
};

typedef std::map<std::string, Project> ProjectSet;
typedef std::map<int64_t, Record> RecordSet;

// Snapshot of everything the store persists
struct TrackerState {
    Meta meta;
    ProjectSet projects;
    RecordSet records;
};

// Next free record id: one past the largest id in use
inline int64_t next_record_id(const RecordSet& records) {
    return records.empty() ? 1 : records.rbegin()->first + 1;
}

} // namespace dash

#endif // DASH_TRACKER_TYPES_HPP
