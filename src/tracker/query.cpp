#include <dash/tracker/query.hpp>
#include <algorithm>

namespace dash {

namespace {

bool starts_before(const Record* a, const Record* b) {
    if (a->start != b->start) return a->start < b->start;
    return a->id < b->id;
}

} // namespace

const Project* find_project(const ProjectSet& projects, const std::string& name) {
    ProjectSet::const_iterator it = projects.find(name);
    return it != projects.end() ? &it->second : nullptr;
}

const Project* get_current_project(const Meta& meta, const ProjectSet& projects) {
    if (!meta.has_current_project()) return nullptr;
    return find_project(projects, meta.current_project);
}

std::vector<const Record*> filter_project_records(const Project& project, const RecordSet& records) {
    std::vector<const Record*> result;
    for (RecordSet::const_iterator it = records.begin(); it != records.end(); ++it) {
        if (it->second.project == project.name) {
            result.push_back(&it->second);
        }
    }
    return result;
}

const Record* get_last_record(const Project& project, const RecordSet& records) {
    const Record* last = nullptr;
    for (RecordSet::const_iterator it = records.begin(); it != records.end(); ++it) {
        const Record& record = it->second;
        if (record.project != project.name) continue;
        // Ids ascend, so >= lets a later record win a tie
        if (!last || record.start >= last->start) {
            last = &record;
        }
    }
    return last;
}

std::vector<const Record*> sorted_project_records(const Project& project, const RecordSet& records) {
    std::vector<const Record*> result = filter_project_records(project, records);
    std::sort(result.begin(), result.end(), starts_before);
    return result;
}

} // namespace dash
