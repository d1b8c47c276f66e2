#include "detach/registry.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace detach {

namespace {

const char* SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS sessions (
        id TEXT PRIMARY KEY,
        command TEXT NOT NULL,
        origin TEXT,
        working_directory TEXT,
        directory TEXT NOT NULL,
        attachable INTEGER NOT NULL,
        env_mode INTEGER NOT NULL,
        host_name TEXT,
        host_type INTEGER NOT NULL,
        action_attach TEXT,
        action_view TEXT,
        action_run TEXT,
        action_status TEXT,
        action_callback TEXT,
        time_start REAL NOT NULL,
        time_end REAL NOT NULL,
        time_duration REAL NOT NULL,
        status_outcome INTEGER NOT NULL,
        status_code INTEGER NOT NULL,
        size INTEGER NOT NULL,
        state INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS metadata (
        session_id TEXT NOT NULL,
        position INTEGER NOT NULL,
        key TEXT NOT NULL,
        value TEXT,
        PRIMARY KEY (session_id, position),
        FOREIGN KEY (session_id) REFERENCES sessions(id)
    );
)";

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Enum columns outside the known range mark a corrupt row.
template <typename E>
E enumColumn(sqlite3_stmt* stmt, int column, E last) {
    int value = sqlite3_column_int(stmt, column);
    if (value < 0 || value > static_cast<int>(last)) {
        throw std::out_of_range(std::string(sqlite3_column_name(stmt, column)) +
                                " = " + std::to_string(value));
    }
    return static_cast<E>(value);
}

} // namespace

class Registry::Impl {
public:
    Impl(const std::string& path, const std::string& version) :
        dbPath_(path),
        version_(version),
        db_(nullptr) {}

    ~Impl() {
        close();
    }

    bool open() {
        if (db_) return true;

        std::error_code ec;
        fs::create_directories(fs::path(dbPath_).parent_path(), ec);

        if (sqlite3_open(dbPath_.c_str(), &db_) != SQLITE_OK) {
            std::cerr << "Can't open database: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        // Other detach processes write the same file; wait briefly instead of failing.
        sqlite3_busy_timeout(db_, 2000);

        try {
            exec("CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);");

            std::string stored = storedVersion();
            if (stored != version_) {
                if (!stored.empty()) {
                    std::cerr << "Session database version " << stored << " does not match "
                              << version_ << ", starting empty" << std::endl;
                }
                exec("BEGIN IMMEDIATE;"
                     "DROP TABLE IF EXISTS metadata;"
                     "DROP TABLE IF EXISTS sessions;");
                exec(SCHEMA);
                writeVersion();
                exec("COMMIT;");
            } else {
                exec(SCHEMA);
            }

            sessions_ = readSessions();
        } catch (const std::exception& e) {
            std::cerr << "Failed to initialize session database: " << e.what() << std::endl;
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            close();
            return false;
        }
        return true;
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        sessions_.clear();
        dirty_.clear();
    }

    bool isOpen() const {
        return db_ != nullptr;
    }

    void insert(const Session& session) {
        requireOpen();
        if (sessions_.count(session.id)) {
            throw std::runtime_error("Session " + session.id + " already exists");
        }
        sessions_[session.id] = session;
        dirty_.insert(session.id);
        flush();
    }

    void update(const Session& session, bool persist) {
        requireOpen();
        sessions_[session.id] = session;
        dirty_.insert(session.id);
        if (persist) {
            flush();
        }
    }

    void flush() {
        requireOpen();
        if (dirty_.empty()) return;

        exec("BEGIN IMMEDIATE;");
        try {
            for (const auto& id : dirty_) {
                auto it = sessions_.find(id);
                if (it != sessions_.end()) {
                    storeSession(it->second);
                }
            }
            exec("COMMIT;");
        } catch (...) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
        dirty_.clear();
    }

    bool remove(const Session& session) {
        requireOpen();
        auto it = sessions_.find(session.id);
        if (it == sessions_.end()) return false;

        std::string logPath = it->second.logPath();

        exec("BEGIN IMMEDIATE;");
        try {
            deleteRows("DELETE FROM metadata WHERE session_id = ?", session.id);
            deleteRows("DELETE FROM sessions WHERE id = ?", session.id);
            exec("COMMIT;");
        } catch (...) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }

        sessions_.erase(it);
        dirty_.erase(session.id);

        std::error_code ec;
        fs::remove(logPath, ec);
        return true;
    }

    std::optional<Session> get(const std::string& id) const {
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Session> getAll() const {
        std::vector<Session> result;
        result.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            result.push_back(entry.second);
        }
        std::stable_sort(result.begin(), result.end(),
            [](const Session& a, const Session& b) {
                return a.time.start < b.time.start;
            });
        return result;
    }

    // A database that cannot be read right now (locked, I/O error) leaves the
    // current sessions in place.
    void reload() {
        requireOpen();

        std::map<std::string, Session> loaded;
        try {
            if (storedVersion() != version_) {
                std::cerr << "Session database was rewritten by another version, ignoring it" << std::endl;
                sessions_.clear();
                dirty_.clear();
                return;
            }
            loaded = readSessions();
        } catch (const std::exception& e) {
            std::cerr << "Failed to reload session database, keeping " << sessions_.size()
                      << " sessions: " << e.what() << std::endl;
            return;
        }

        sessions_ = std::move(loaded);
        dirty_.clear();
    }

    std::string path() const { return dbPath_; }
    std::string version() const { return version_; }

private:
    void requireOpen() const {
        if (!db_) {
            throw std::runtime_error("Session database is not open");
        }
    }

    void exec(const char* sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string message = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + message);
        }
    }

    std::string storedVersion() const {
        sqlite3_stmt* stmt;
        const char* sql = "SELECT value FROM meta WHERE key = 'version'";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare version statement: ") +
                                     sqlite3_errmsg(db_));
        }

        // No row means a fresh file. Anything but a row or done is an error.
        std::string version;
        int result = sqlite3_step(stmt);
        if (result == SQLITE_ROW) {
            version = columnText(stmt, 0);
        } else if (result != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to read database version: " + message);
        }
        sqlite3_finalize(stmt);
        return version;
    }

    void writeVersion() {
        sqlite3_stmt* stmt;
        const char* sql = "INSERT OR REPLACE INTO meta (key, value) VALUES ('version', ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare version statement");
        }

        bindText(stmt, 1, version_);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to write database version");
        }
        sqlite3_finalize(stmt);
    }

    // Reads every session into a new map. Throws unless both queries run to
    // completion, so a locked database never yields a partial result.
    std::map<std::string, Session> readSessions() const {
        sqlite3_stmt* stmt;
        const char* sql =
            "SELECT id, command, origin, working_directory, directory, attachable, env_mode, "
            "host_name, host_type, action_attach, action_view, action_run, action_status, "
            "action_callback, time_start, time_end, time_duration, status_outcome, status_code, "
            "size, state FROM sessions";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }

        std::map<std::string, Session> sessions;
        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
            Session session;
            session.id = columnText(stmt, 0);
            try {
                session.command = columnText(stmt, 1);
                session.origin = columnText(stmt, 2);
                session.workingDirectory = columnText(stmt, 3);
                session.directory = columnText(stmt, 4);
                session.attachable = sqlite3_column_int(stmt, 5) != 0;
                session.envMode = enumColumn(stmt, 6, EnvMode::TerminalData);
                session.host.name = columnText(stmt, 7);
                session.host.type = enumColumn(stmt, 8, HostType::Remote);
                session.action.attach = columnText(stmt, 9);
                session.action.view = columnText(stmt, 10);
                session.action.run = columnText(stmt, 11);
                session.action.status = columnText(stmt, 12);
                session.action.callback = columnText(stmt, 13);
                session.time.start = sqlite3_column_double(stmt, 14);
                session.time.end = sqlite3_column_double(stmt, 15);
                session.time.duration = sqlite3_column_double(stmt, 16);
                session.status.outcome = enumColumn(stmt, 17, Outcome::Failure);
                session.status.exitCode = sqlite3_column_int(stmt, 18);
                session.size = static_cast<std::uintmax_t>(sqlite3_column_int64(stmt, 19));
                session.state = enumColumn(stmt, 20, State::Inactive);
            } catch (const std::out_of_range& e) {
                std::cerr << "Skipping corrupt session " << session.id << ": " << e.what() << std::endl;
                continue;
            }

            sessions[session.id] = session;
        }
        std::string message = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            throw std::runtime_error("Failed to read sessions: " + message);
        }

        readMetadata(sessions);
        return sessions;
    }

    void readMetadata(std::map<std::string, Session>& sessions) const {
        sqlite3_stmt* stmt;
        const char* sql = "SELECT session_id, key, value FROM metadata ORDER BY session_id, position";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare metadata statement: ") + sqlite3_errmsg(db_));
        }

        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
            auto it = sessions.find(columnText(stmt, 0));
            if (it == sessions.end()) continue;
            it->second.metadata.emplace_back(columnText(stmt, 1), columnText(stmt, 2));
        }
        std::string message = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            throw std::runtime_error("Failed to read session metadata: " + message);
        }
    }

    void storeSession(const Session& session) {
        sqlite3_stmt* stmt;
        const char* sql =
            "INSERT OR REPLACE INTO sessions (id, command, origin, working_directory, directory, "
            "attachable, env_mode, host_name, host_type, action_attach, action_view, action_run, "
            "action_status, action_callback, time_start, time_end, time_duration, status_outcome, "
            "status_code, size, state) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement");
        }

        bindText(stmt, 1, session.id);
        bindText(stmt, 2, session.command);
        bindText(stmt, 3, session.origin);
        bindText(stmt, 4, session.workingDirectory);
        bindText(stmt, 5, session.directory);
        sqlite3_bind_int(stmt, 6, session.attachable ? 1 : 0);
        sqlite3_bind_int(stmt, 7, static_cast<int>(session.envMode));
        bindText(stmt, 8, session.host.name);
        sqlite3_bind_int(stmt, 9, static_cast<int>(session.host.type));
        bindText(stmt, 10, session.action.attach);
        bindText(stmt, 11, session.action.view);
        bindText(stmt, 12, session.action.run);
        bindText(stmt, 13, session.action.status);
        bindText(stmt, 14, session.action.callback);
        sqlite3_bind_double(stmt, 15, session.time.start);
        sqlite3_bind_double(stmt, 16, session.time.end);
        sqlite3_bind_double(stmt, 17, session.time.duration);
        sqlite3_bind_int(stmt, 18, static_cast<int>(session.status.outcome));
        sqlite3_bind_int(stmt, 19, session.status.exitCode);
        sqlite3_bind_int64(stmt, 20, static_cast<sqlite3_int64>(session.size));
        sqlite3_bind_int(stmt, 21, static_cast<int>(session.state));

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to store session " + session.id);
        }
        sqlite3_finalize(stmt);

        deleteRows("DELETE FROM metadata WHERE session_id = ?", session.id);
        storeMetadata(session);
    }

    void storeMetadata(const Session& session) {
        sqlite3_stmt* stmt;
        const char* sql = "INSERT INTO metadata (session_id, position, key, value) VALUES (?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare metadata statement");
        }

        int position = 0;
        for (const auto& entry : session.metadata) {
            sqlite3_reset(stmt);
            bindText(stmt, 1, session.id);
            sqlite3_bind_int(stmt, 2, position++);
            bindText(stmt, 3, entry.first);
            bindText(stmt, 4, entry.second);

            if (sqlite3_step(stmt) != SQLITE_DONE) {
                sqlite3_finalize(stmt);
                throw std::runtime_error("Failed to store metadata for " + session.id);
            }
        }
        sqlite3_finalize(stmt);
    }

    void deleteRows(const char* sql, const std::string& id) {
        sqlite3_stmt* stmt;

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare delete statement");
        }

        bindText(stmt, 1, id);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE) {
            throw std::runtime_error("Failed to delete rows for " + id);
        }
    }

    std::string dbPath_;
    std::string version_;
    sqlite3* db_;
    std::map<std::string, Session> sessions_;
    std::set<std::string> dirty_;
};

Registry::Registry(const std::string& path, const std::string& version) :
    impl_(std::make_unique<Impl>(path, version)) {}
Registry::~Registry() = default;

bool Registry::open() { return impl_->open(); }
void Registry::close() { impl_->close(); }
bool Registry::isOpen() const { return impl_->isOpen(); }
void Registry::insert(const Session& session) { impl_->insert(session); }
void Registry::update(const Session& session, bool persist) {
    impl_->update(session, persist);
}
void Registry::flush() { impl_->flush(); }
bool Registry::remove(const Session& session) {
    return impl_->remove(session);
}
std::optional<Session> Registry::get(const std::string& id) const {
    return impl_->get(id);
}
std::vector<Session> Registry::getAll() const {
    return impl_->getAll();
}
void Registry::reload() { impl_->reload(); }
std::string Registry::path() const { return impl_->path(); }
std::string Registry::version() const { return impl_->version(); }

} // namespace detach
