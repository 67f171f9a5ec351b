/*
 * dash - Tracker Store Implementation
 *
 * SQLite storage backend for meta, projects and records.
 */
#include <dash/tracker/store.hpp>
#include <dash/core/logger.hpp>
#include <dash/core/utils.hpp>
#include <sqlite3.h>

namespace dash {

namespace {
const char* const CURRENT_PROJECT_KEY = "current_project";
}

// ============================================================================
// Lifecycle
// ============================================================================

TrackerStore::TrackerStore() : db_(nullptr) {}

TrackerStore::~TrackerStore() {
    close();
}

bool TrackerStore::open(const std::string& db_path) {
    if (db_) {
        close();
    }
    last_error_.clear();

    if (!create_parent_directory(db_path)) {
        set_error("cannot create directory for " + db_path);
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db("open");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    path_ = db_path;

    if (!exec("PRAGMA busy_timeout=5000")) {
        LOG_WARN("[TrackerStore] Could not set busy timeout: %s", last_error_.c_str());
    }

    LOG_DEBUG("[TrackerStore] Database opened: %s", db_path.c_str());
    return true;
}

void TrackerStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("[TrackerStore] Database closed: %s", path_.c_str());
    }
}

bool TrackerStore::ensure_initialized() {
    if (!db_) {
        set_error("database not open");
        return false;
    }

    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ")"
    );
    if (!ok) return false;

    ok = exec(
        "CREATE TABLE IF NOT EXISTS projects ("
        "  name TEXT PRIMARY KEY,"
        "  created_at INTEGER NOT NULL DEFAULT 0"
        ")"
    );
    if (!ok) return false;

    ok = exec(
        "CREATE TABLE IF NOT EXISTS records ("
        "  id INTEGER PRIMARY KEY,"
        "  project TEXT NOT NULL,"
        "  phase TEXT NOT NULL,"
        "  start_ms INTEGER NOT NULL,"
        "  end_ms INTEGER"
        ")"
    );
    if (!ok) return false;

    ok = exec("CREATE INDEX IF NOT EXISTS idx_records_project ON records(project)");
    if (!ok) return false;

    LOG_DEBUG("[TrackerStore] Stores initialized");
    return true;
}

// ============================================================================
// Load
// ============================================================================

bool TrackerStore::load(TrackerState& out) {
    if (!db_) {
        set_error("database not open");
        return false;
    }

    TrackerState state;
    if (!read_meta(state.meta)) return false;
    if (!read_projects(state.projects)) return false;
    if (!read_records(state.records)) return false;

    LOG_DEBUG("[TrackerStore] Loaded current_project='%s', %zu projects, %zu records",
              state.meta.current_project.c_str(), state.projects.size(), state.records.size());
    out = state;
    return true;
}

bool TrackerStore::read_meta(Meta& out) {
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("SELECT value FROM meta WHERE key = ?", &stmt)) return false;

    sqlite3_bind_text(stmt, 1, CURRENT_PROJECT_KEY, -1, SQLITE_STATIC);

    out = Meta();
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const char* col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        out.current_project = col_text ? col_text : "";
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db("read meta");
        return false;
    }
    return true;
}

bool TrackerStore::read_projects(ProjectSet& out) {
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("SELECT name, created_at FROM projects", &stmt)) return false;

    out.clear();
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Project project;
        const char* col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        project.name = col_text ? col_text : "";
        project.created_at = sqlite3_column_int64(stmt, 1);
        out[project.name] = project;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db("read projects");
        return false;
    }
    return true;
}

bool TrackerStore::read_records(RecordSet& out) {
    sqlite3_stmt* stmt = nullptr;
    if (!prepare("SELECT id, project, phase, start_ms, end_ms FROM records", &stmt)) return false;

    out.clear();
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Record record;
        const char* col_text;

        record.id = sqlite3_column_int64(stmt, 0);

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.project = col_text ? col_text : "";

        col_text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.phase = col_text ? col_text : "";

        record.start = sqlite3_column_int64(stmt, 3);
        record.end = sqlite3_column_type(stmt, 4) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt, 4);

        out[record.id] = record;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db("read records");
        return false;
    }
    return true;
}

// ============================================================================
// Save
// ============================================================================

bool TrackerStore::save(const Meta* meta, const ProjectSet* projects, const RecordSet* records) {
    if (!db_) {
        set_error("database not open");
        return false;
    }
    if (!meta && !projects && !records) {
        return true;
    }

    if (!exec("BEGIN IMMEDIATE")) return false;

    bool ok = (!meta || write_meta(*meta))
           && (!projects || write_projects(*projects))
           && (!records || write_records(*records));

    if (!ok) {
        // Keep the error from the failed write, not from the rollback
        std::string error = last_error_;
        if (!exec("ROLLBACK")) {
            LOG_ERROR("[TrackerStore] Rollback failed: %s", last_error_.c_str());
        }
        last_error_ = error;
        return false;
    }

    if (!exec("COMMIT")) return false;

    LOG_DEBUG("[TrackerStore] Saved%s%s%s",
              meta ? " meta" : "", projects ? " projects" : "", records ? " records" : "");
    return true;
}

bool TrackerStore::write_meta(const Meta& meta) {
    if (!exec("DELETE FROM meta WHERE key = 'current_project'")) return false;
    if (!meta.has_current_project()) return true;

    sqlite3_stmt* stmt = nullptr;
    if (!prepare("INSERT INTO meta (key, value) VALUES (?, ?)", &stmt)) return false;

    sqlite3_bind_text(stmt, 1, CURRENT_PROJECT_KEY, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, meta.current_project.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db("write meta");
        return false;
    }
    return true;
}

bool TrackerStore::write_projects(const ProjectSet& projects) {
    if (!exec("DELETE FROM projects")) return false;

    sqlite3_stmt* stmt = nullptr;
    if (!prepare("INSERT INTO projects (name, created_at) VALUES (?, ?)", &stmt)) return false;

    for (ProjectSet::const_iterator it = projects.begin(); it != projects.end(); ++it) {
        sqlite3_bind_text(stmt, 1, it->second.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, it->second.created_at);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            set_error_from_db("write projects");
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);
    return true;
}

bool TrackerStore::write_records(const RecordSet& records) {
    if (!exec("DELETE FROM records")) return false;

    sqlite3_stmt* stmt = nullptr;
    if (!prepare("INSERT INTO records (id, project, phase, start_ms, end_ms) VALUES (?, ?, ?, ?, ?)", &stmt)) {
        return false;
    }

    for (RecordSet::const_iterator it = records.begin(); it != records.end(); ++it) {
        const Record& record = it->second;
        sqlite3_bind_int64(stmt, 1, record.id);
        sqlite3_bind_text(stmt, 2, record.project.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, record.phase.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, record.start);
        if (record.is_open()) {
            sqlite3_bind_null(stmt, 5);
        } else {
            sqlite3_bind_int64(stmt, 5, record.end);
        }

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            set_error_from_db("write records");
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);
    return true;
}

// ============================================================================
// Helpers
// ============================================================================

bool TrackerStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    int rc = sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db("prepare");
        sqlite3_finalize(*stmt);
        *stmt = nullptr;
        return false;
    }
    return true;
}

bool TrackerStore::exec(const std::string& sql) {
    if (!db_) {
        set_error("database not open");
        return false;
    }

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        set_error(std::string(err_msg ? err_msg : "unknown error") + " (query: " + sql + ")");
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }

    return true;
}

void TrackerStore::set_error(const std::string& error) {
    last_error_ = error;
    LOG_ERROR("[TrackerStore] %s", error.c_str());
}

void TrackerStore::set_error_from_db(const char* context) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    set_error(std::string(context) + " failed: " + message);
}

} // namespace dash
