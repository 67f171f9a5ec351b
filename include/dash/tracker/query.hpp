/*
 * dash - Read-only views over a loaded snapshot
 *
 * Lookups return pointers into the sets they were given (nullptr = none);
 * they stay valid as long as the set is not modified.
 */
#ifndef DASH_TRACKER_QUERY_HPP
#define DASH_TRACKER_QUERY_HPP

#include <dash/tracker/types.hpp>
#include <string>
#include <vector>

namespace dash {

const Project* find_project(const ProjectSet& projects, const std::string& name);

// nullptr when no project is current, or the current name is unknown
const Project* get_current_project(const Meta& meta, const ProjectSet& projects);

// Records belonging to `project`, in id (insertion) order
std::vector<const Record*> filter_project_records(const Project& project, const RecordSet& records);

// Record with the latest start; equal starts resolve to the highest id
const Record* get_last_record(const Project& project, const RecordSet& records);

// Records of `project` ordered by start, then id
std::vector<const Record*> sorted_project_records(const Project& project, const RecordSet& records);

} // namespace dash

#endif // DASH_TRACKER_QUERY_HPP
