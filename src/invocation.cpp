#include "detach/invocation.hpp"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace detach {

namespace {

thread_local std::optional<Session> current;

bool isShellSafe(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.' || c == '/' || c == ':' || c == ',' ||
           c == '@' || c == '%' || c == '+' || c == '=';
}

} // namespace

std::string Invocation::shellString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << shellQuote(argv[i]);
    }
    return oss.str();
}

const char* modeFlag(Mode mode) {
    switch (mode) {
        case Mode::Create: return "-n";
        case Mode::CreateAndAttach: return "-c";
        case Mode::Attach: return "-a";
    }
    throw std::logic_error("Invalid session mode: " + std::to_string(static_cast<int>(mode)));
}

Mode parseMode(const std::string& value) {
    if (value == "create") return Mode::Create;
    if (value == "create-and-attach") return Mode::CreateAndAttach;
    if (value == "attach") return Mode::Attach;
    throw std::invalid_argument("Invalid session mode: " + value);
}

std::string shellQuote(const std::string& value) {
    if (value.empty()) return "''";

    bool safe = true;
    for (char c : value) {
        if (!isShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) return value;

    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string wrapCommand(const Session& session, const Config& config) {
    std::string inner;
    if (config.envProgram.empty()) {
        inner = shellQuote(config.shellProgram) + " -c " + shellQuote(session.command);
    } else {
        // The reporter runs the command under the configured shell, not its own default.
        inner = "DETACH_SHELL=" + shellQuote(config.shellProgram) + " " +
                shellQuote(config.envProgram) + " " + toString(session.envMode) + " " +
                shellQuote(session.command);
    }

    std::string redirect = session.attachable
        ? "2>&1 | tee " + shellQuote(session.logPath())
        : "&> " + shellQuote(session.logPath());

    return "{ " + inner + "; } " + redirect;
}

Invocation buildInvocation(const Session& session, Mode mode, const Config& config) {
    const char* flag = modeFlag(mode);

    Invocation invocation;
    if (mode == Mode::Attach) {
        if (!session.attachable) {
            throw std::invalid_argument("Session " + session.shortId() + " is not attachable");
        }
        if (!fs::exists(session.socketPath())) {
            throw std::runtime_error("Session " + session.shortId() + " has no socket to attach to");
        }

        std::vector<std::string> attach = {config.dtachProgram, flag, session.socketPath(), "-r", "none"};
        if (config.showOutputOnAttach) {
            Invocation dtach{attach};
            invocation.argv = {config.shellProgram, "-c",
                               "cat " + shellQuote(session.logPath()) + "; " + dtach.shellString()};
        } else {
            invocation.argv = attach;
        }
    } else {
        invocation.argv = {config.dtachProgram, flag, session.socketPath(),
                           "-z", config.shellProgram, "-c", wrapCommand(session, config)};
    }

    current = session;
    return invocation;
}

Invocation resolveAttach(const Session& session, const Config& config) {
    bool running = session.state != State::Inactive && fs::exists(session.socketPath());
    if (session.attachable && running) {
        return buildInvocation(session, Mode::Attach, config);
    }
    current = session;
    return viewInvocation(session, running);
}

Invocation viewInvocation(const Session& session, bool follow) {
    if (follow) {
        return Invocation{{"tail", "-n", "+1", "-F", session.logPath()}};
    }
    return Invocation{{"cat", session.logPath()}};
}

std::optional<Session> currentSession() {
    return current;
}

} // namespace detach
