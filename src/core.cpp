#include "detach/core.hpp"
#include <atomic>
#include <chrono>
#include <climits>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <linux/magic.h>
#include <sys/statfs.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace detach {

namespace {

// Not all of these are in <linux/magic.h>.
constexpr long CIFS_MAGIC = 0xFF534D42;
constexpr long SMB2_MAGIC = 0xFE534D42;
constexpr long FUSE_MAGIC = 0x65735546;

// Without a trailing separator, so keys match parent_path() of event paths.
std::string normalize(const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p.string();
}

std::string localHostname() {
    char buf[HOST_NAME_MAX + 1] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        perror("gethostname");
        return "localhost";
    }
    return buf;
}

// Session directories on network filesystems are shared with other hosts.
HostType hostTypeOf(const std::string& directory) {
    struct statfs st;
    if (statfs(directory.c_str(), &st) != 0) {
        return HostType::Local;
    }
    long type = static_cast<long>(st.f_type);
    if (type == NFS_SUPER_MAGIC || type == SMB_SUPER_MAGIC || type == CIFS_MAGIC ||
        type == SMB2_MAGIC || type == FUSE_MAGIC) {
        return HostType::Remote;
    }
    return HostType::Local;
}

bool isLive(const Session& session) {
    return session.state != State::Inactive;
}

void logFinished(const Session& session) {
    std::cerr << "Session " << session.shortId() << " finished: " << session.summary()
              << " [" << toString(session.status.outcome);
    if (session.status.outcome == Outcome::Failure) {
        std::cerr << " " << session.status.exitCode;
    }
    std::cerr << "]" << std::endl;
}

} // namespace

class Core::Impl {
public:
    Impl(const Config& config) :
        config_(config),
        hostname_(localHostname()),
        registry_(config.dbPath()),
        engine_(registry_, handlers_, logFinished),
        running_(false) {}

    bool init(Core& core) {
        if (!registry_.open()) {
            std::cerr << "Failed to open session database " << registry_.path() << std::endl;
            return false;
        }

        handlers_.registerAttach("dtach", [this](const Session& session) {
            execProgram(resolveAttach(session, config_).argv, session.workingDirectory);
        });
        handlers_.registerRun("shell", [&core](const Session& session) {
            Session fresh = core.create(session.command, session.origin, session.workingDirectory);
            core.launch(fresh, Mode::Create);
        });

        if (watcher_.init()) {
            dbDirectory_ = normalize(fs::path(registry_.path()).parent_path().string());
            if (!watcher_.watch(dbDirectory_, WatchChanges)) {
                std::cerr << "Not watching " << dbDirectory_ << ", external changes need a restart" << std::endl;
            }
        } else {
            std::cerr << "Directory watches unavailable, relying on sweeps" << std::endl;
        }

        sweep();
        return true;
    }

    Session create(const std::string& command, const std::string& origin,
                   const std::string& workingDirectory) {
        if (command.empty()) {
            throw std::invalid_argument("Empty command");
        }

        SessionContext context;
        context.origin = origin.empty() ? "shell" : origin;
        context.workingDirectory = workingDirectory.empty()
            ? fs::current_path().string()
            : fs::absolute(workingDirectory).string();
        context.directory = normalize(fs::absolute(config_.sessionDirectory).string());
        context.nonAttachablePatterns = config_.nonAttachableCommands;
        context.terminalDataPatterns = config_.terminalDataCommands;
        context.action = resolveAction(context.origin, config_);

        std::error_code ec;
        fs::create_directories(context.directory, ec);
        if (ec) {
            throw std::runtime_error("Failed to create session directory " + context.directory +
                                     ": " + ec.message());
        }
        context.host = {hostname_, hostTypeOf(context.directory)};
        context.metadata = handlers_.annotate(config_.metadataAnnotators, context);

        Session session = createSession(command, context);
        while (registry_.get(session.id)) {
            session.id = makeSessionId(command, now());
        }

        // The log exists from the start so a sweep never mistakes a session
        // that is still starting for one whose files were purged.
        std::ofstream log(session.logPath(), std::ios::app);
        if (!log) {
            throw std::runtime_error("Failed to create " + session.logPath());
        }
        log.close();

        registry_.insert(session);
        ensureWatched(session.directory);
        return session;
    }

    bool launch(Session& session, Mode mode) {
        if (mode == Mode::Attach) {
            throw std::invalid_argument("Attach does not launch a session");
        }

        Invocation invocation = buildInvocation(session, mode, config_);

        if (mode == Mode::CreateAndAttach) {
            execProgram(invocation.argv, session.workingDirectory);
            std::cerr << "Failed to start " << config_.dtachProgram << std::endl;
            return false;
        }

        int code = runProgram(invocation.argv, session.workingDirectory);
        if (code != 0) {
            std::cerr << "Failed to start session " << session.shortId()
                      << " (" << config_.dtachProgram << " exited with " << code << ")" << std::endl;
            return false;
        }

        if (fs::exists(session.socketPath())) {
            session.state = State::Active;
            registry_.update(session, true);
        }
        return true;
    }

    std::vector<Session> list() {
        sweep();
        return registry_.getAll();
    }

    std::optional<Session> find(const std::string& idOrPrefix, std::string& error) const {
        if (idOrPrefix.empty()) {
            error = "No session id given";
            return std::nullopt;
        }
        if (auto session = registry_.get(idOrPrefix)) {
            return session;
        }

        std::optional<Session> match;
        for (const auto& session : registry_.getAll()) {
            if (session.id.compare(0, idOrPrefix.size(), idOrPrefix) != 0) continue;
            if (match) {
                error = "Session id '" + idOrPrefix + "' is ambiguous";
                return std::nullopt;
            }
            match = session;
        }
        if (!match) {
            error = "No session matches '" + idOrPrefix + "'";
        }
        return match;
    }

    bool kill(const std::string& id, ProcessTable& table) {
        auto session = registry_.get(id);
        if (!session) {
            std::cerr << "No session " << id << std::endl;
            return false;
        }
        if (session->state == State::Inactive) {
            std::cerr << "Session " << session->shortId() << " has already finished" << std::endl;
            return false;
        }

        // The session master was started with -n or -c; -a is an attached client.
        auto pid = table.findByArgument(config_.dtachProgram, session->socketPath(),
                                        {modeFlag(Mode::Create), modeFlag(Mode::CreateAndAttach)});
        if (!pid) {
            std::cerr << "No process found for session " << session->shortId() << std::endl;
            return false;
        }

        // Completion is still reported by the socket disappearing.
        killTree(table, *pid, SIGTERM);
        return true;
    }

    bool remove(const std::string& id) {
        auto session = registry_.get(id);
        if (!session) {
            std::cerr << "No session " << id << std::endl;
            return false;
        }
        if (isLive(*session) && fs::exists(session->socketPath())) {
            std::cerr << "Kill session " << session->shortId() << " before removing it" << std::endl;
            return false;
        }

        registry_.remove(*session);
        maybeUnwatch(session->directory);
        return true;
    }

    std::optional<Session> rerun(Core& core, const std::string& id, bool* handedOff) {
        if (handedOff) *handedOff = false;

        auto session = registry_.get(id);
        if (!session) {
            std::cerr << "No session " << id << std::endl;
            return std::nullopt;
        }

        if (auto handler = handlers_.run(session->action.run)) {
            handler(*session);
            if (handedOff) *handedOff = true;
            return std::nullopt;
        }

        Session fresh = core.create(session->command, session->origin, session->workingDirectory);
        if (!launch(fresh, Mode::Create)) {
            return std::nullopt;
        }
        return fresh;
    }

    SweepResult sweep() {
        SweepResult result = engine_.sweep(hostname_);

        std::set<std::string> live;
        for (const auto& session : registry_.getAll()) {
            if (isLive(session)) {
                live.insert(normalize(session.directory));
            }
        }
        for (const auto& directory : live) {
            ensureWatched(directory);
        }

        std::vector<std::string> stale;
        for (const auto& directory : sessionDirectories_) {
            if (!live.count(directory)) stale.push_back(directory);
        }
        for (const auto& directory : stale) {
            unwatch(directory);
        }
        return result;
    }

    void ensureWatched(const std::string& directory) {
        if (watcher_.fd() < 0) return;

        std::string path = normalize(directory);
        if (sessionDirectories_.count(path)) return;

        if (watcher_.watch(path, WatchDeletes)) {
            sessionDirectories_.insert(path);
        }
    }

    void handleEvent(const WatchEvent& event) {
        if (event.wd < 0) {
            sweep();
            return;
        }

        fs::path path(event.path);
        std::string directory = normalize(path.parent_path().string());

        if (directory == dbDirectory_ && normalize(event.path) == normalize(registry_.path())) {
            if (event.action != WatchAction::Deleted) {
                registry_.reload();
                for (const auto& session : registry_.getAll()) {
                    if (isLive(session)) ensureWatched(session.directory);
                }
            }
            return;
        }

        bool gone = event.action == WatchAction::Deleted || event.action == WatchAction::Renamed;
        if (!gone || path.extension() != ".socket" || !sessionDirectories_.count(directory)) {
            return;
        }

        std::string id = path.stem().string();
        auto session = registry_.get(id);
        if (!session) {
            // Created by another process since the last reload.
            registry_.reload();
            session = registry_.get(id);
        }
        if (session && normalize(session->directory) == directory) {
            engine_.transition(id, false);
        }
        maybeUnwatch(directory);
    }

    size_t processEvents(int timeoutMs) {
        if (!watcher_.wait(timeoutMs)) return 0;

        std::vector<WatchEvent> events = watcher_.readEvents();
        for (const auto& event : events) {
            try {
                handleEvent(event);
            } catch (const std::exception& e) {
                std::cerr << "Failed to handle event for " << event.path << ": " << e.what() << std::endl;
            }
        }
        return events.size();
    }

    void run() {
        running_ = true;
        auto lastSweep = steady_clock::now();

        while (running_) {
            processEvents(1000);

            auto current = steady_clock::now();
            if (config_.sweepInterval > 0 &&
                duration_cast<seconds>(current - lastSweep).count() >= config_.sweepInterval) {
                sweep();
                lastSweep = current;
            }
        }
    }

    void shutdown() {
        running_ = false;
    }

    Config config_;
    std::string hostname_;
    Handlers handlers_;
    Registry registry_;
    Engine engine_;
    Watcher watcher_;

private:
    void maybeUnwatch(const std::string& directory) {
        std::string path = normalize(directory);
        for (const auto& session : registry_.getAll()) {
            if (isLive(session) && normalize(session.directory) == path) return;
        }
        unwatch(path);
    }

    void unwatch(const std::string& path) {
        if (!sessionDirectories_.erase(path)) return;
        // The database directory keeps its own watch.
        if (path != dbDirectory_) {
            watcher_.unwatch(path);
        }
    }

    std::string dbDirectory_;
    std::set<std::string> sessionDirectories_;
    std::atomic<bool> running_;
};

Core::Core(const Config& config) : impl_(std::make_unique<Impl>(config)) {}
Core::~Core() = default;

bool Core::init() { return impl_->init(*this); }

Session Core::create(const std::string& command, const std::string& origin,
                     const std::string& workingDirectory) {
    return impl_->create(command, origin, workingDirectory);
}

bool Core::launch(Session& session, Mode mode) { return impl_->launch(session, mode); }
std::vector<Session> Core::list() { return impl_->list(); }

std::optional<Session> Core::find(const std::string& idOrPrefix, std::string& error) const {
    return impl_->find(idOrPrefix, error);
}

bool Core::kill(const std::string& id) {
    ProcFsTable table;
    return impl_->kill(id, table);
}

bool Core::kill(const std::string& id, ProcessTable& table) { return impl_->kill(id, table); }
bool Core::remove(const std::string& id) { return impl_->remove(id); }
std::optional<Session> Core::rerun(const std::string& id, bool* handedOff) {
    return impl_->rerun(*this, id, handedOff);
}
SweepResult Core::sweep() { return impl_->sweep(); }
void Core::ensureWatched(const std::string& directory) { impl_->ensureWatched(directory); }
void Core::handleEvent(const WatchEvent& event) { impl_->handleEvent(event); }
size_t Core::processEvents(int timeoutMs) { return impl_->processEvents(timeoutMs); }
void Core::run() { impl_->run(); }
void Core::shutdown() { impl_->shutdown(); }

const Config& Core::config() const { return impl_->config_; }
const std::string& Core::hostname() const { return impl_->hostname_; }
Registry& Core::registry() { return impl_->registry_; }
Engine& Core::engine() { return impl_->engine_; }
Handlers& Core::handlers() { return impl_->handlers_; }
Watcher& Core::watcher() { return impl_->watcher_; }

} // namespace detach
