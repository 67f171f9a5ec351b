/*
 * dash - Tracker SQLite Store
 *
 * One database file holds the three persisted stores:
 *   meta      - key/value rows ("current_project")
 *   projects  - one row per project, keyed by name
 *   records   - one row per work span, keyed by synthetic id
 *
 * Every invocation loads a full snapshot and writes back whole stores;
 * there are no partial row updates.
 */
#ifndef DASH_TRACKER_STORE_HPP
#define DASH_TRACKER_STORE_HPP

#include <dash/tracker/types.hpp>
#include <string>
#include <sqlite3.h>

namespace dash {

class TrackerStore {
public:
    TrackerStore();
    ~TrackerStore();

    // Database lifecycle. open() creates missing parent directories.
    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return path_; }

    // Create the stores if absent. Safe to call on every run.
    bool ensure_initialized();

    // Read all three stores into `out`. Fails on unreadable or corrupt data.
    bool load(TrackerState& out);

    // Replace each non-null store wholesale; null stores are left untouched.
    // All replacements happen in a single transaction.
    bool save(const Meta* meta, const ProjectSet* projects, const RecordSet* records);

    bool save_meta(const Meta& meta) { return save(&meta, nullptr, nullptr); }
    bool save_records(const RecordSet& records) { return save(nullptr, nullptr, &records); }

    std::string last_error() const { return last_error_; }

private:
    TrackerStore(const TrackerStore&);
    TrackerStore& operator=(const TrackerStore&);

    bool read_meta(Meta& out);
    bool read_projects(ProjectSet& out);
    bool read_records(RecordSet& out);

    bool write_meta(const Meta& meta);
    bool write_projects(const ProjectSet& projects);
    bool write_records(const RecordSet& records);

    bool prepare(const char* sql, sqlite3_stmt** stmt);
    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db(const char* context);

    sqlite3* db_;
    std::string path_;
    std::string last_error_;
};

} // namespace dash

#endif // DASH_TRACKER_STORE_HPP
