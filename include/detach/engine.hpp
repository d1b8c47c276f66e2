#pragma once

#include "session.hpp"
#include "registry.hpp"
#include "handlers.hpp"
#include <functional>
#include <string>

namespace detach {

// Lines detach-env appends to a session log.
constexpr const char* SUCCESS_SENTINEL = "Detached session finished";
constexpr const char* FAILURE_SENTINEL = "Detached session exited abnormally with code";

std::string lastLine(const std::string& path);
bool isSentinelLine(const std::string& line);

// Default status policy: the sentinel on the last log line, if any.
Status sentinelStatus(const Session& session);

struct SweepResult {
    int promoted = 0;
    int finished = 0;
    int removed = 0;
    int skipped = 0;
};

// Session state transitions. Every mutation goes through the registry.
class Engine {
public:
    using Notifier = std::function<void(const Session&)>;

    Engine(Registry& registry, const Handlers& handlers, Notifier notifier = {});

    // active (or unknown) -> inactive. With `approximate` the end time is the
    // log's modification time instead of now. Returns false when the session
    // is unknown to the registry or already inactive.
    bool transition(const std::string& id, bool approximate);

    // Reconciles every session with its files. Sessions belonging to another
    // host are skipped while their directory is unreachable.
    SweepResult sweep(const std::string& hostname);

    void setNotifier(Notifier notifier);

private:
    Status statusOf(const Session& session) const;

    Registry& registry_;
    const Handlers& handlers_;
    Notifier notifier_;
};

} // namespace detach
