#include "detach/handlers.hpp"
#include "detach/engine.hpp"
#include "detach/invocation.hpp"
#include "detach/process.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>

namespace detach {

namespace {

template <typename Map>
typename Map::mapped_type lookup(const Map& handlers, const std::string& name) {
    if (name.empty()) return {};
    auto it = handlers.find(name);
    if (it == handlers.end()) {
        std::cerr << "Unknown handler '" << name << "', using the default" << std::endl;
        return {};
    }
    return it->second;
}

void printLog(const Session& session) {
    std::ifstream log(session.logPath());
    if (!log) {
        std::cerr << "No output for session " << session.shortId() << std::endl;
        return;
    }
    std::string line;
    while (std::getline(log, line)) {
        if (!isSentinelLine(line)) {
            std::cout << line << '\n';
        }
    }
    std::cout.flush();
}

void followLog(const Session& session) {
    Invocation tail = viewInvocation(session, true);
    execProgram(tail.argv, session.workingDirectory);
}

void desktopNotify(const Session& session) {
    std::string message = session.summary() + " " + toString(session.status.outcome);
    if (session.status.outcome == Outcome::Failure) {
        message += " (" + std::to_string(session.status.exitCode) + ")";
    }
    if (runProgram({"notify-send", "detach", message}) != 0) {
        std::cerr << "notify-send failed for session " << session.shortId() << std::endl;
    }
}

std::string gitBranch(const SessionContext& context) {
    auto branch = captureOutput({"git", "-C", context.workingDirectory,
                                 "rev-parse", "--abbrev-ref", "HEAD"});
    return branch ? *branch : "";
}

std::string userName(const SessionContext&) {
    const char* user = std::getenv("USER");
    return user ? user : "";
}

} // namespace

Handlers::Handlers() {
    registerStatus("sentinel", sentinelStatus);
    registerStatus("compilation", compilationStatus);
    registerView("cat", printLog);
    registerView("tail", followLog);
    registerCallback("notify", desktopNotify);
    registerAnnotator("git-branch", gitBranch);
    registerAnnotator("user", userName);
}

void Handlers::registerStatus(const std::string& name, StatusHandler handler) {
    status_[name] = std::move(handler);
}

void Handlers::registerAttach(const std::string& name, SessionHandler handler) {
    attach_[name] = std::move(handler);
}

void Handlers::registerView(const std::string& name, SessionHandler handler) {
    view_[name] = std::move(handler);
}

void Handlers::registerRun(const std::string& name, SessionHandler handler) {
    run_[name] = std::move(handler);
}

void Handlers::registerCallback(const std::string& name, SessionHandler handler) {
    callback_[name] = std::move(handler);
}

void Handlers::registerAnnotator(const std::string& name, Annotator annotator) {
    for (auto& entry : annotators_) {
        if (entry.first == name) {
            entry.second = std::move(annotator);
            return;
        }
    }
    annotators_.emplace_back(name, std::move(annotator));
}

StatusHandler Handlers::status(const std::string& name) const { return lookup(status_, name); }
SessionHandler Handlers::attach(const std::string& name) const { return lookup(attach_, name); }
SessionHandler Handlers::view(const std::string& name) const { return lookup(view_, name); }
SessionHandler Handlers::run(const std::string& name) const { return lookup(run_, name); }
SessionHandler Handlers::callback(const std::string& name) const { return lookup(callback_, name); }

Metadata Handlers::annotate(const std::vector<std::string>& names, const SessionContext& context) const {
    Metadata metadata;
    for (const auto& name : names) {
        bool found = false;
        for (const auto& entry : annotators_) {
            if (entry.first != name) continue;
            found = true;
            try {
                std::string value = entry.second(context);
                if (!value.empty()) {
                    metadata.emplace_back(name, value);
                }
            } catch (const std::exception& e) {
                std::cerr << "Annotator " << name << " failed: " << e.what() << std::endl;
            }
            break;
        }
        if (!found) {
            std::cerr << "Unknown metadata annotator '" << name << "'" << std::endl;
        }
    }
    return metadata;
}

Action resolveAction(const std::string& origin, const Config& config) {
    auto slot = [&](const char* name) {
        auto it = config.actions.find(origin + "." + name);
        return it == config.actions.end() ? std::string() : it->second;
    };

    Action action;
    action.attach = slot("attach");
    action.view = slot("view");
    action.run = slot("run");
    action.status = slot("status");
    action.callback = slot("callback");
    return action;
}

Status compilationStatus(const Session& session) {
    static const std::regex finished("^Compilation finished");
    static const std::regex failed("^Compilation exited abnormally with code ([0-9]+)");

    std::string line = lastLine(session.logPath());
    std::smatch match;
    if (std::regex_search(line, finished)) {
        return {Outcome::Success, 0};
    }
    if (std::regex_search(line, match, failed)) {
        return {Outcome::Failure, std::stoi(match[1].str())};
    }
    return sentinelStatus(session);
}

} // namespace detach
