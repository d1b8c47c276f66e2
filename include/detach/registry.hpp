#pragma once

#include "session.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace detach {

// Durable id -> Session store. The in-memory map is authoritative for
// readers; every persisting call mirrors pending changes to the database file.
class Registry {
public:
    static constexpr const char* VERSION = "0.6.1";

    explicit Registry(const std::string& path, const std::string& version = VERSION);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    bool open();
    void close();
    bool isOpen() const;

    // Throws std::runtime_error when the id is already present.
    void insert(const Session& session);
    void update(const Session& session, bool persist);
    void flush();
    // Also deletes the session log. Returns false for unknown sessions.
    bool remove(const Session& session);

    std::optional<Session> get(const std::string& id) const;
    std::vector<Session> getAll() const;

    // Replaces the in-memory map with the database contents.
    void reload();

    std::string path() const;
    std::string version() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace detach
