#pragma once

#include "session.hpp"
#include "config.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace detach {

using StatusHandler = std::function<Status(const Session&)>;
using SessionHandler = std::function<void(const Session&)>;
using Annotator = std::function<std::string(const SessionContext&)>;

// Named handlers a session's Action refers to, plus the metadata annotators.
class Handlers {
public:
    // Registers the built-ins that need nothing beyond the session:
    // status "sentinel" and "compilation", view "cat" and "tail",
    // callback "notify", annotators "git-branch" and "user".
    Handlers();

    void registerStatus(const std::string& name, StatusHandler handler);
    void registerAttach(const std::string& name, SessionHandler handler);
    void registerView(const std::string& name, SessionHandler handler);
    void registerRun(const std::string& name, SessionHandler handler);
    void registerCallback(const std::string& name, SessionHandler handler);
    void registerAnnotator(const std::string& name, Annotator annotator);

    // Empty function when the name is empty or unknown.
    StatusHandler status(const std::string& name) const;
    SessionHandler attach(const std::string& name) const;
    SessionHandler view(const std::string& name) const;
    SessionHandler run(const std::string& name) const;
    SessionHandler callback(const std::string& name) const;

    // Runs the named annotators in order. Unknown names and empty results are skipped.
    Metadata annotate(const std::vector<std::string>& names, const SessionContext& context) const;

private:
    std::map<std::string, StatusHandler> status_;
    std::map<std::string, SessionHandler> attach_;
    std::map<std::string, SessionHandler> view_;
    std::map<std::string, SessionHandler> run_;
    std::map<std::string, SessionHandler> callback_;
    std::vector<std::pair<std::string, Annotator>> annotators_;
};

// Handler names configured for an origin through action.<origin>.<slot>.
Action resolveAction(const std::string& origin, const Config& config);

// Status from the last line of a log that ends in a compilation summary.
Status compilationStatus(const Session& session);

} // namespace detach
