#pragma once

#include <string>
#include <ctime>
#include <cstdint>
#include <utility>
#include <vector>

namespace detach {

enum class State { Unknown, Active, Inactive };
enum class Outcome { Unknown, Success, Failure };
enum class EnvMode { PlainText, TerminalData };
enum class HostType { Local, Remote };

struct Host {
    std::string name;
    HostType type = HostType::Local;
};

// Handler names resolved once per origin when the session is created.
// An empty name means the default behavior.
struct Action {
    std::string attach;
    std::string view;
    std::string run;
    std::string status;
    std::string callback;
};

struct Timing {
    double start = 0;
    double end = 0;
    double duration = 0;
};

struct Status {
    Outcome outcome = Outcome::Unknown;
    int exitCode = 0;

    bool operator==(const Status& other) const {
        return outcome == other.outcome && exitCode == other.exitCode;
    }
};

using Metadata = std::vector<std::pair<std::string, std::string>>;

class Session {
public:
    std::string id;
    std::string command;
    std::string origin;
    std::string workingDirectory;
    std::string directory;
    bool attachable = true;
    EnvMode envMode = EnvMode::PlainText;
    Host host;
    Metadata metadata;
    Action action;

    Timing time;
    Status status;
    std::uintmax_t size = 0;
    State state = State::Unknown;

    std::string socketPath() const;
    std::string logPath() const;

    std::string shortId() const {
        return id.substr(0, 8);
    }

    std::string timeString() const {
        std::time_t t = static_cast<std::time_t>(time.start);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
        return buf;
    }

    std::string summary() const {
        return command.substr(0, 50) + (command.length() > 50 ? "..." : "");
    }
};

// Everything a new session captures from its caller besides the command.
struct SessionContext {
    std::string origin = "shell";
    std::string workingDirectory;
    std::string directory;
    Host host;
    Action action;
    Metadata metadata;
    std::vector<std::string> nonAttachablePatterns;
    std::vector<std::string> terminalDataPatterns;
};

std::string makeSessionId(const std::string& command, double timestamp);
double now();

// Builds a registry-ready session with state unknown. Does not touch disk.
Session createSession(const std::string& command, const SessionContext& context);

bool matchesAny(const std::string& command, const std::vector<std::string>& patterns);

const char* toString(State state);
const char* toString(Outcome outcome);
const char* toString(EnvMode mode);
const char* toString(HostType type);

EnvMode envModeFromString(const std::string& value);

} // namespace detach
