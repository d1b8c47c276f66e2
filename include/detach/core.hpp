#pragma once

#include "config.hpp"
#include "engine.hpp"
#include "handlers.hpp"
#include "invocation.hpp"
#include "process.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "watcher.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace detach {

// Owns the registry, the state engine and the directory watches for one
// process. All mutation happens on the thread that calls into Core.
class Core {
public:
    explicit Core(const Config& config);
    ~Core();

    Core(const Core&) = delete;
    Core& operator=(const Core&) = delete;

    bool init();

    // Constructs the session, prepares its directory and log, registers it
    // and watches its directory. Does not start anything.
    Session create(const std::string& command,
                   const std::string& origin = "shell",
                   const std::string& workingDirectory = "");

    // Runs dtach for Create; replaces this process for CreateAndAttach.
    bool launch(Session& session, Mode mode);

    // Sweep, then every session ordered by start time.
    std::vector<Session> list();

    // Exact id or unique prefix. On failure `error` holds a user-facing message.
    std::optional<Session> find(const std::string& idOrPrefix, std::string& error) const;

    bool kill(const std::string& id);
    bool kill(const std::string& id, ProcessTable& table);
    bool remove(const std::string& id);
    // A brand-new session with the same command, origin and working directory.
    // When the session's run handler takes over, `handedOff` is set and
    // nothing is returned.
    std::optional<Session> rerun(const std::string& id, bool* handedOff = nullptr);

    SweepResult sweep();
    void ensureWatched(const std::string& directory);
    void handleEvent(const WatchEvent& event);
    // Waits up to timeoutMs and dispatches what arrived. Returns the number of events.
    size_t processEvents(int timeoutMs);

    void run();
    void shutdown();

    const Config& config() const;
    const std::string& hostname() const;
    Registry& registry();
    Engine& engine();
    Handlers& handlers();
    Watcher& watcher();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace detach
