#include "detach/session.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace detach {

std::string Session::socketPath() const {
    return (fs::path(directory) / (id + ".socket")).string();
}

std::string Session::logPath() const {
    return (fs::path(directory) / (id + ".log")).string();
}

double now() {
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string makeSessionId(const std::string& command, double timestamp) {
    // Sessions created within the same clock tick still get distinct ids.
    static std::atomic<std::uint64_t> counter{0};

    std::string seed = command;
    seed += '\0';
    seed += std::to_string(timestamp);
    seed += '\0';
    seed += std::to_string(getpid());
    seed += '\0';
    seed += std::to_string(counter++);

    // FNV-1a
    std::uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : seed) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

bool matchesAny(const std::string& command, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.empty()) continue;
        try {
            if (std::regex_search(command, std::regex(pattern))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            std::cerr << "Invalid command pattern '" << pattern << "': " << e.what() << std::endl;
        }
    }
    return false;
}

Session createSession(const std::string& command, const SessionContext& context) {
    Session session;
    session.time.start = now();
    session.id = makeSessionId(command, session.time.start);
    session.command = command;
    session.origin = context.origin;
    session.workingDirectory = context.workingDirectory;
    session.directory = context.directory;
    session.attachable = !matchesAny(command, context.nonAttachablePatterns);
    session.envMode = matchesAny(command, context.terminalDataPatterns)
        ? EnvMode::TerminalData
        : EnvMode::PlainText;
    session.host = context.host;
    session.metadata = context.metadata;
    session.action = context.action;
    return session;
}

const char* toString(State state) {
    switch (state) {
        case State::Unknown: return "unknown";
        case State::Active: return "active";
        case State::Inactive: return "inactive";
    }
    return "unknown";
}

const char* toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Unknown: return "unknown";
        case Outcome::Success: return "success";
        case Outcome::Failure: return "failure";
    }
    return "unknown";
}

const char* toString(EnvMode mode) {
    switch (mode) {
        case EnvMode::PlainText: return "plain-text";
        case EnvMode::TerminalData: return "terminal-data";
    }
    return "plain-text";
}

const char* toString(HostType type) {
    return type == HostType::Remote ? "remote" : "local";
}

EnvMode envModeFromString(const std::string& value) {
    if (value == "plain-text") return EnvMode::PlainText;
    if (value == "terminal-data") return EnvMode::TerminalData;
    throw std::invalid_argument("Unknown environment mode: " + value);
}

} // namespace detach
