#pragma once

#include "session.hpp"
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace detach {

enum class Mode { Create, CreateAndAttach, Attach };

struct Invocation {
    std::vector<std::string> argv;

    std::string program() const { return argv.empty() ? "" : argv.front(); }
    std::string shellString() const;
};

// dtach flag for a mode. Throws std::logic_error for values outside Mode.
const char* modeFlag(Mode mode);

// Throws std::invalid_argument for anything but create, create-and-attach, attach.
Mode parseMode(const std::string& value);

std::string shellQuote(const std::string& value);

// The command line dtach hands to the shell: the session command grouped,
// optionally wrapped by the env reporter, with output redirected into the log.
std::string wrapCommand(const Session& session, const Config& config);

// Exact multiplexer invocation for a mode. Never downgrades: asking for
// Attach on a session that cannot be attached throws.
Invocation buildInvocation(const Session& session, Mode mode, const Config& config);

// Caller-side attach: real attach when possible, otherwise the view path.
Invocation resolveAttach(const Session& session, const Config& config);

// Follows the log while the session runs, prints it once it has finished.
Invocation viewInvocation(const Session& session, bool follow);

// Last session an invocation was built for on this thread.
std::optional<Session> currentSession();

} // namespace detach
