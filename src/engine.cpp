#include "detach/engine.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace detach {

namespace {

constexpr std::streamoff TAIL_BYTES = 8192;

bool startsWith(const std::string& line, const char* prefix) {
    return line.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Sentinels are written after the command's own output, which may not end in
// a newline or may leave terminal control bytes before them.
std::string stripLeadingControl(const std::string& line) {
    size_t start = 0;
    while (start < line.size() && (line[start] == '\r' || line[start] == '\n')) ++start;
    return line.substr(start);
}

bool modificationTime(const std::string& path, double& seconds) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    seconds = static_cast<double>(st.st_mtim.tv_sec) + st.st_mtim.tv_nsec / 1e9;
    return true;
}

} // namespace

std::string lastLine(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) return "";

    std::streamoff size = in.tellg();
    if (size <= 0) return "";

    std::streamoff offset = std::max<std::streamoff>(0, size - TAIL_BYTES);
    in.seekg(offset);
    std::string tail(static_cast<size_t>(size - offset), '\0');
    in.read(&tail[0], static_cast<std::streamsize>(tail.size()));
    tail.resize(static_cast<size_t>(in.gcount()));

    size_t end = tail.find_last_not_of("\r\n \t");
    if (end == std::string::npos) return "";
    size_t begin = tail.find_last_of("\r\n", end);
    begin = (begin == std::string::npos) ? 0 : begin + 1;
    return tail.substr(begin, end - begin + 1);
}

bool isSentinelLine(const std::string& line) {
    std::string text = stripLeadingControl(line);
    return startsWith(text, SUCCESS_SENTINEL) || startsWith(text, FAILURE_SENTINEL);
}

Status sentinelStatus(const Session& session) {
    std::string line = stripLeadingControl(lastLine(session.logPath()));

    if (startsWith(line, SUCCESS_SENTINEL)) {
        return {Outcome::Success, 0};
    }
    if (startsWith(line, FAILURE_SENTINEL)) {
        const char* digits = line.c_str() + std::char_traits<char>::length(FAILURE_SENTINEL);
        char* end = nullptr;
        errno = 0;
        long code = std::strtol(digits, &end, 10);
        if (end != digits && errno == 0 && code >= 0 && code <= INT_MAX) {
            return {Outcome::Failure, static_cast<int>(code)};
        }
    }
    return {Outcome::Unknown, 0};
}

Engine::Engine(Registry& registry, const Handlers& handlers, Notifier notifier) :
    registry_(registry),
    handlers_(handlers),
    notifier_(std::move(notifier)) {}

void Engine::setNotifier(Notifier notifier) {
    notifier_ = std::move(notifier);
}

bool Engine::transition(const std::string& id, bool approximate) {
    auto found = registry_.get(id);
    if (!found || found->state == State::Inactive) {
        return false;
    }

    Session session = *found;
    std::string logPath = session.logPath();

    std::error_code ec;
    std::uintmax_t size = fs::file_size(logPath, ec);
    session.size = ec ? 0 : size;

    double end = now();
    if (approximate) {
        double modified;
        if (modificationTime(logPath, modified)) {
            end = modified;
        }
    }
    session.time.end = end;
    session.time.duration = std::max(0.0, end - session.time.start);
    session.status = statusOf(session);
    session.state = State::Inactive;

    registry_.update(session, true);

    if (notifier_) {
        notifier_(session);
    }
    if (auto callback = handlers_.callback(session.action.callback)) {
        try {
            callback(session);
        } catch (const std::exception& e) {
            std::cerr << "Callback for session " << session.shortId() << " failed: " << e.what() << std::endl;
        }
    }
    return true;
}

SweepResult Engine::sweep(const std::string& hostname) {
    SweepResult result;

    for (const auto& session : registry_.getAll()) {
        try {
            std::error_code ec;
            if (session.host.name != hostname && !fs::is_directory(session.directory, ec)) {
                ++result.skipped;
                continue;
            }

            if (!fs::exists(session.logPath(), ec)) {
                registry_.remove(session);
                ++result.removed;
                continue;
            }

            if (session.state == State::Unknown) {
                // Promoted without looking at the socket: the creating process
                // may not have started dtach yet. A later sweep or the socket
                // watch finishes it.
                Session promoted = session;
                promoted.state = State::Active;
                registry_.update(promoted, false);
                ++result.promoted;
            } else if (session.state == State::Active && !fs::exists(session.socketPath(), ec)) {
                if (transition(session.id, true)) {
                    ++result.finished;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Failed to reconcile session " << session.shortId() << ": " << e.what() << std::endl;
        }
    }

    try {
        registry_.flush();
    } catch (const std::exception& e) {
        std::cerr << "Failed to persist sessions: " << e.what() << std::endl;
    }
    return result;
}

Status Engine::statusOf(const Session& session) const {
    if (auto handler = handlers_.status(session.action.status)) {
        try {
            return handler(session);
        } catch (const std::exception& e) {
            std::cerr << "Status handler for session " << session.shortId() << " failed: " << e.what() << std::endl;
        }
    }
    return sentinelStatus(session);
}

} // namespace detach
