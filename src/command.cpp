#include "detach/command.hpp"
#include "detach/labels.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace detach {

namespace {

std::optional<Session> lookup(Core& core, const std::vector<std::string>& args,
                              std::ostream& out) {
    if (args.size() < 2) {
        throw std::runtime_error("Usage: detach " + args[0] + " <session-id>");
    }
    std::string error;
    auto session = core.find(args[1], error);
    if (!session) {
        out << error << std::endl;
    }
    return session;
}

std::string statusString(const Session& session) {
    if (session.state != State::Inactive) return "-";
    std::string status = toString(session.status.outcome);
    if (session.status.outcome == Outcome::Failure) {
        status += " (" + std::to_string(session.status.exitCode) + ")";
    }
    return status;
}

bool socketExists(const Session& session) {
    std::error_code ec;
    return fs::exists(session.socketPath(), ec);
}

} // namespace

int Command::execute(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    if (args.empty()) {
        help(out);
        return 1;
    }

    std::string command = args[0];

    try {
        if (command == "create") {
            return create(core, args, out);
        } else if (command == "list") {
            return list(core, out);
        } else if (command == "attach") {
            return attach(core, args, out);
        } else if (command == "view") {
            return view(core, args, out);
        } else if (command == "tail") {
            return tail(core, args, out);
        } else if (command == "info") {
            return info(core, args, out);
        } else if (command == "kill") {
            return kill(core, args, out);
        } else if (command == "delete") {
            return remove(core, args, out);
        } else if (command == "rerun") {
            return rerun(core, args, out);
        } else if (command == "help") {
            help(out);
        } else {
            out << "Unknown command: " << command << std::endl;
            help(out);
            return 1;
        }
    } catch (const std::exception& e) {
        out << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

int Command::create(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    std::string origin = "shell";
    std::string directory;
    bool attachNow = false;

    size_t i = 1;
    for (; i < args.size(); ++i) {
        if (args[i] == "--attach") {
            attachNow = true;
        } else if (args[i] == "--origin" && i + 1 < args.size()) {
            origin = args[++i];
        } else if (args[i] == "-C" && i + 1 < args.size()) {
            directory = args[++i];
        } else if (args[i] == "--") {
            ++i;
            break;
        } else {
            break;
        }
    }

    std::string text;
    for (; i < args.size(); ++i) {
        if (!text.empty()) text += " ";
        text += args[i];
    }
    if (text.empty()) {
        throw std::runtime_error("Usage: detach create [--attach] [--origin <name>] [-C <dir>] <command>");
    }

    Session session = core.create(text, origin, directory);
    out << session.id << std::endl;
    out.flush();

    if (!core.launch(session, attachNow ? Mode::CreateAndAttach : Mode::Create)) {
        out << "Failed to start session " << session.shortId() << std::endl;
        return 1;
    }
    return 0;
}

int Command::list(Core& core, std::ostream& out) {
    std::vector<Session> sessions = core.list();
    if (sessions.empty()) {
        out << "No sessions" << std::endl;
        return 0;
    }

    std::vector<std::string> commands;
    for (const auto& session : sessions) {
        commands.push_back(session.summary());
    }
    std::vector<std::string> labels = deduplicate(commands);

    for (size_t i = 0; i < sessions.size(); ++i) {
        const Session& s = sessions[i];
        double duration = s.state == State::Inactive ? s.time.duration : now() - s.time.start;
        out << s.shortId() << " | " << s.timeString()
            << " | " << std::left << std::setw(8) << toString(s.state)
            << " | " << std::setw(12) << statusString(s)
            << " | " << std::right << std::setw(9) << formatDuration(duration)
            << " | " << std::setw(6) << (s.state == State::Inactive ? formatSize(s.size) : "-")
            << " | " << labels[i] << std::endl;
    }
    return 0;
}

int Command::attach(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    if (auto handler = core.handlers().attach(session->action.attach)) {
        handler(*session);
        return 0;
    }

    Invocation invocation = resolveAttach(*session, core.config());
    if (!session->attachable) {
        out << "Session " << session->shortId() << " is not attachable, showing its output" << std::endl;
    }
    out.flush();
    execProgram(invocation.argv, session->workingDirectory);
    return 1;
}

int Command::view(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    if (auto handler = core.handlers().view(session->action.view)) {
        handler(*session);
        return 0;
    }

    std::ifstream log(session->logPath());
    if (!log) {
        out << "No output for session " << session->shortId() << std::endl;
        return 1;
    }
    std::string line;
    while (std::getline(log, line)) {
        if (!isSentinelLine(line)) {
            out << line << '\n';
        }
    }
    out.flush();
    return 0;
}

int Command::tail(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    bool running = session->state != State::Inactive && socketExists(*session);
    out.flush();
    execProgram(viewInvocation(*session, running).argv, session->workingDirectory);
    return 1;
}

int Command::info(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    const Session& s = *session;
    out << "Id:          " << s.id << "\n"
        << "Command:     " << s.command << "\n"
        << "Origin:      " << s.origin << "\n"
        << "State:       " << toString(s.state) << "\n"
        << "Status:      " << statusString(s) << "\n"
        << "Started:     " << s.timeString() << "\n"
        << "Duration:    " << (s.state == State::Inactive ? formatDuration(s.time.duration) : "-") << "\n"
        << "Size:        " << (s.state == State::Inactive ? formatSize(s.size) : "-") << "\n"
        << "Attachable:  " << (s.attachable ? "yes" : "no") << "\n"
        << "Environment: " << toString(s.envMode) << "\n"
        << "Host:        " << s.host.name << " (" << toString(s.host.type) << ")\n"
        << "Directory:   " << s.workingDirectory << "\n"
        << "Log:         " << s.logPath() << "\n"
        << "Socket:      " << s.socketPath() << "\n";
    for (const auto& entry : s.metadata) {
        out << "Metadata:    " << entry.first << " = " << entry.second << "\n";
    }
    out.flush();
    return 0;
}

int Command::kill(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    if (!core.kill(session->id)) {
        out << "Could not kill session " << session->shortId() << std::endl;
        return 1;
    }
    out << "Killed session " << session->shortId() << std::endl;
    return 0;
}

int Command::remove(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    if (!core.remove(session->id)) {
        out << "Could not delete session " << session->shortId() << std::endl;
        return 1;
    }
    out << "Deleted session " << session->shortId() << std::endl;
    return 0;
}

int Command::rerun(Core& core, const std::vector<std::string>& args, std::ostream& out) {
    auto session = lookup(core, args, out);
    if (!session) return 1;

    bool handedOff = false;
    auto fresh = core.rerun(session->id, &handedOff);
    if (handedOff) {
        out << "Rerun handed to " << session->action.run << std::endl;
        return 0;
    }
    if (!fresh) {
        out << "Failed to rerun session " << session->shortId() << std::endl;
        return 1;
    }
    out << fresh->id << std::endl;
    return 0;
}

void Command::help(std::ostream& out) {
    out << "detach - run shell commands that outlive their terminal\n";
    out << "Usage: detach <command> [options]\n\n";
    out << "Commands:\n";
    out << "  create [--attach] [--origin <name>] [-C <dir>] <command>\n";
    out << "                     Start a detached session\n";
    out << "  list               List sessions\n";
    out << "  attach <id>        Attach to a running session, or show its output\n";
    out << "  view <id>          Print a session's output\n";
    out << "  tail <id>          Follow a session's output\n";
    out << "  info <id>          Show everything known about a session\n";
    out << "  kill <id>          Kill a running session\n";
    out << "  delete <id>        Delete a finished session and its log\n";
    out << "  rerun <id>         Start the session's command again\n";
    out << "  daemon start|stop|status\n";
    out << "                     Control the background session monitor\n";
    out << "Session ids may be shortened to any unique prefix.\n";
}

std::string Command::formatDuration(double seconds) {
    long total = seconds > 0 ? static_cast<long>(seconds + 0.5) : 0;
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m " << secs << "s";
    } else if (minutes > 0) {
        oss << minutes << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

std::string Command::formatSize(std::uintmax_t bytes) {
    const char* units[] = {"", "K", "M", "G", "T"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024 && unit < 4) {
        size /= 1024;
        ++unit;
    }

    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%ju", bytes);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f%s", size, units[unit]);
    }
    return buf;
}

} // namespace detach
