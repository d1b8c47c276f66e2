#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <chrono>
#include <cstdlib>
#include <sqlite3.h>
#include <sys/stat.h>

#include "detach/command.hpp"
#include "detach/config.hpp"
#include "detach/core.hpp"
#include "detach/engine.hpp"
#include "detach/invocation.hpp"
#include "detach/labels.hpp"
#include "detach/process.hpp"
#include "detach/registry.hpp"
#include "detach/session.hpp"

namespace fs = std::filesystem;

namespace {

void assert_true(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

std::string make_temp_dir(const std::string& prefix) {
    const std::string dir = (fs::temp_directory_path() / (prefix + std::to_string(std::rand()))).string();
    fs::create_directories(dir);
    return dir;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

detach::Config test_config(const std::string& root) {
    detach::Config config = detach::Config::defaults();
    config.dbDirectory = root + "/db";
    config.sessionDirectory = root + "/sessions";
    config.envProgram = "";
    config.shellProgram = "bash";
    config.metadataAnnotators.clear();
    config.sweepInterval = 0;
    return config;
}

detach::Session make_session(const std::string& directory, const std::string& command) {
    detach::SessionContext context;
    context.origin = "shell";
    context.workingDirectory = "/home/user/project";
    context.directory = directory;
    context.host = {"testhost", detach::HostType::Local};
    return detach::createSession(command, context);
}

class FakeProcessTable : public detach::ProcessTable {
public:
    std::map<pid_t, std::vector<pid_t>> tree;
    std::set<pid_t> exited;
    std::vector<pid_t> signalled;
    std::optional<pid_t> owner;
    mutable std::vector<std::string> flagsAsked;

    std::vector<pid_t> children(pid_t pid) const override {
        auto it = tree.find(pid);
        return it == tree.end() ? std::vector<pid_t>() : it->second;
    }

    bool signal(pid_t pid, int) override {
        signalled.push_back(pid);
        return !exited.count(pid);
    }

    std::optional<pid_t> findByArgument(const std::string&, const std::string&,
                                        const std::vector<std::string>& flags) const override {
        flagsAsked = flags;
        return owner;
    }
};

void test_session_construction() {
    detach::SessionContext context;
    context.origin = "compile";
    context.workingDirectory = "/work";
    context.directory = "/tmp/detach";
    context.host = {"box", detach::HostType::Local};
    context.metadata = {{"git-branch", "main"}};
    context.nonAttachablePatterns = {"^ls", "^make"};
    context.terminalDataPatterns = {"^htop"};

    double before = detach::now();
    detach::Session plain = detach::createSession("make -k all", context);
    assert_true(!plain.id.empty(), "session id should be set");
    assert_true(plain.state == detach::State::Unknown, "new session should be unknown");
    assert_true(plain.status.outcome == detach::Outcome::Unknown && plain.status.exitCode == 0,
                "new session status should be (unknown, 0)");
    assert_true(plain.size == 0, "new session size should be zero");
    assert_true(plain.time.start >= before, "start time should be now");
    assert_true(!plain.attachable, "deny-listed command should not be attachable");
    assert_true(plain.envMode == detach::EnvMode::PlainText, "make should be plain text");
    assert_true(plain.origin == "compile", "origin should be captured");
    assert_true(plain.metadata.size() == 1 && plain.metadata[0].second == "main", "metadata should be captured");
    assert_true(plain.socketPath() == "/tmp/detach/" + plain.id + ".socket", "socket path");
    assert_true(plain.logPath() == "/tmp/detach/" + plain.id + ".log", "log path");

    detach::Session terminal = detach::createSession("htop", context);
    assert_true(terminal.attachable, "htop is not deny-listed");
    assert_true(terminal.envMode == detach::EnvMode::TerminalData, "htop should be terminal data");
    assert_true(terminal.id != plain.id, "ids should be unique");

    detach::Session again = detach::createSession("make -k all", context);
    assert_true(again.id != plain.id, "same command created twice should get distinct ids");
}

void test_mode_flags() {
    assert_true(std::string(detach::modeFlag(detach::Mode::Create)) == "-n", "create flag");
    assert_true(std::string(detach::modeFlag(detach::Mode::CreateAndAttach)) == "-c", "create-and-attach flag");
    assert_true(std::string(detach::modeFlag(detach::Mode::Attach)) == "-a", "attach flag");
    assert_true(detach::parseMode("create-and-attach") == detach::Mode::CreateAndAttach, "parse mode");

    bool threw = false;
    try {
        detach::parseMode("detach");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert_true(threw, "unknown mode name should throw");

    threw = false;
    try {
        detach::modeFlag(static_cast<detach::Mode>(42));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert_true(threw, "out of range mode should throw");
}

void test_shell_quote() {
    assert_true(detach::shellQuote("plain/path-1.log") == "plain/path-1.log", "safe strings stay bare");
    assert_true(detach::shellQuote("") == "''", "empty string is quoted");
    assert_true(detach::shellQuote("a b") == "'a b'", "spaces are quoted");
    assert_true(detach::shellQuote("it's") == "'it'\\''s'", "single quotes are escaped");
}

void test_create_invocation() {
    const std::string dir = make_temp_dir("detach-invocation-");
    detach::Config config = test_config(dir);

    detach::Session session = make_session(dir, "sleep 1 && echo done");
    detach::Invocation create = detach::buildInvocation(session, detach::Mode::Create, config);

    std::vector<std::string> expected = {
        "dtach", "-n", session.socketPath(), "-z", "bash", "-c",
        "{ bash -c 'sleep 1 && echo done'; } 2>&1 | tee " + session.logPath()};
    assert_true(create.argv == expected, "create invocation should match: " + create.shellString());

    auto current = detach::currentSession();
    assert_true(current && current->id == session.id, "builder should record the current session");

    detach::Invocation both = detach::buildInvocation(session, detach::Mode::CreateAndAttach, config);
    assert_true(both.argv[1] == "-c", "create-and-attach uses -c");

    session.attachable = false;
    detach::Invocation quiet = detach::buildInvocation(session, detach::Mode::Create, config);
    assert_true(quiet.argv.back() == "{ bash -c 'sleep 1 && echo done'; } &> " + session.logPath(),
                "non-attachable sessions redirect straight into the log");

    config.envProgram = "detach-env";
    session.attachable = true;
    detach::Invocation reported = detach::buildInvocation(session, detach::Mode::Create, config);
    assert_true(reported.argv.back() ==
                "{ DETACH_SHELL=bash detach-env plain-text 'sleep 1 && echo done'; } 2>&1 | tee " +
                session.logPath(),
                "env reporter should wrap the command");

    config.shellProgram = "/usr/bin/zsh";
    detach::Invocation zsh = detach::buildInvocation(session, detach::Mode::Create, config);
    assert_true(zsh.argv[4] == "/usr/bin/zsh", "dtach runs the configured shell");
    assert_true(zsh.argv.back().compare(0, 28, "{ DETACH_SHELL=/usr/bin/zsh ") == 0,
                "env reporter is told the configured shell: " + zsh.argv.back());

    fs::remove_all(dir);
}

void test_attach_gate() {
    const std::string dir = make_temp_dir("detach-attach-");
    detach::Config config = test_config(dir);

    detach::Session session = make_session(dir, "tail -f /var/log/syslog");
    session.state = detach::State::Active;
    write_file(session.socketPath(), "");
    write_file(session.logPath(), "line\n");

    detach::Invocation attach = detach::resolveAttach(session, config);
    std::vector<std::string> expected = {"dtach", "-a", session.socketPath(), "-r", "none"};
    assert_true(attach.argv == expected, "attachable session should attach: " + attach.shellString());

    config.showOutputOnAttach = true;
    detach::Invocation shown = detach::resolveAttach(session, config);
    assert_true(shown.argv[0] == "bash" && shown.argv[1] == "-c", "show-output attach runs through the shell");
    assert_true(shown.argv[2].compare(0, 4, "cat ") == 0, "show-output attach dumps the log first");
    config.showOutputOnAttach = false;

    session.attachable = false;
    bool threw = false;
    try {
        detach::buildInvocation(session, detach::Mode::Attach, config);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert_true(threw, "building attach for a non-attachable session should throw");

    detach::Invocation view = detach::resolveAttach(session, config);
    assert_true(view.program() == "tail", "non-attachable running session should be tailed");
    for (const auto& arg : view.argv) {
        assert_true(arg != "-a", "non-attachable session must never get a bare attach");
    }

    session.attachable = true;
    fs::remove(session.socketPath());
    threw = false;
    try {
        detach::buildInvocation(session, detach::Mode::Attach, config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert_true(threw, "attaching without a socket should throw");
    assert_true(detach::resolveAttach(session, config).program() == "cat",
                "finished session should be printed");

    fs::remove_all(dir);
}

void test_registry_round_trip() {
    const std::string dir = make_temp_dir("detach-registry-");
    const std::string path = dir + "/detach.db";

    detach::Session session = make_session(dir, "make test");
    session.metadata = {{"git-branch", "feature/x"}, {"user", "alice"}, {"a", "b"}};
    session.action.status = "compilation";
    session.action.callback = "notify";
    session.envMode = detach::EnvMode::TerminalData;
    session.attachable = false;
    session.host.type = detach::HostType::Remote;

    {
        detach::Registry registry(path);
        assert_true(registry.open(), "registry should open");
        registry.insert(session);

        session.state = detach::State::Inactive;
        session.status = {detach::Outcome::Failure, 2};
        session.size = 12345;
        session.time.end = session.time.start + 7.5;
        session.time.duration = 7.5;
        registry.update(session, false);
        registry.flush();
        registry.close();
    }

    detach::Registry reloaded(path);
    assert_true(reloaded.open(), "registry should reopen");
    auto loaded = reloaded.get(session.id);
    assert_true(loaded.has_value(), "session should survive a reload");
    assert_true(loaded->command == session.command, "command round-trip");
    assert_true(loaded->origin == session.origin, "origin round-trip");
    assert_true(loaded->workingDirectory == session.workingDirectory, "working directory round-trip");
    assert_true(loaded->directory == session.directory, "directory round-trip");
    assert_true(loaded->attachable == session.attachable, "attachable round-trip");
    assert_true(loaded->envMode == session.envMode, "env mode round-trip");
    assert_true(loaded->host.name == session.host.name && loaded->host.type == session.host.type, "host round-trip");
    assert_true(loaded->metadata == session.metadata, "metadata should keep its order");
    assert_true(loaded->action.status == "compilation" && loaded->action.callback == "notify", "action round-trip");
    assert_true(loaded->state == detach::State::Inactive, "state round-trip");
    assert_true(loaded->status == session.status, "status round-trip");
    assert_true(loaded->size == 12345, "size round-trip");
    assert_true(loaded->time.start == session.time.start, "start time round-trip");
    assert_true(loaded->time.duration == 7.5, "duration round-trip");

    bool threw = false;
    try {
        reloaded.insert(session);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert_true(threw, "duplicate ids should be rejected");

    fs::remove_all(dir);
}

void test_registry_version_mismatch() {
    const std::string dir = make_temp_dir("detach-version-");
    const std::string path = dir + "/detach.db";

    {
        detach::Registry current(path, "0.6.1");
        assert_true(current.open(), "current registry should open");
        current.insert(make_session(dir, "echo current"));
    }
    {
        detach::Registry same(path, "0.6.1");
        assert_true(same.open(), "same version should open");
        assert_true(same.getAll().size() == 1, "matching version should load its sessions");
    }
    {
        detach::Registry old(path, "0.0.1");
        assert_true(old.open(), "a mismatched version is not an error");
        assert_true(old.getAll().empty(), "mismatched version should load empty");
    }

    fs::remove_all(dir);
}

void test_registry_remove_deletes_log() {
    const std::string dir = make_temp_dir("detach-remove-");
    detach::Registry registry(dir + "/detach.db");
    assert_true(registry.open(), "registry should open");

    detach::Session session = make_session(dir, "echo bye");
    write_file(session.logPath(), "bye\n");
    registry.insert(session);

    assert_true(registry.remove(session), "known session should be removed");
    assert_true(!fs::exists(session.logPath()), "log should be deleted with the session");
    assert_true(!registry.get(session.id), "removed session should be gone");
    assert_true(!registry.remove(session), "second removal should report false");

    fs::remove_all(dir);
}

void test_last_line_and_sentinels() {
    const std::string dir = make_temp_dir("detach-sentinel-");
    detach::Session session = make_session(dir, "false");

    write_file(session.logPath(), "output\n\nDetached session exited abnormally with code 3\n\n");
    assert_true(detach::lastLine(session.logPath()) == "Detached session exited abnormally with code 3",
                "last line should skip trailing blank lines");
    detach::Status failed = detach::sentinelStatus(session);
    assert_true(failed.outcome == detach::Outcome::Failure && failed.exitCode == 3, "failure sentinel");

    write_file(session.logPath(), "all good\r\nDetached session finished\r\n");
    assert_true(detach::sentinelStatus(session) == detach::Status{detach::Outcome::Success, 0}, "success sentinel");

    write_file(session.logPath(), "no sentinel here\n");
    assert_true(detach::sentinelStatus(session) == detach::Status{}, "no sentinel means unknown");

    write_file(session.logPath(), "");
    assert_true(detach::sentinelStatus(session) == detach::Status{}, "empty log means unknown");

    assert_true(detach::isSentinelLine("Detached session finished"), "success line is a sentinel");
    assert_true(!detach::isSentinelLine("Detached sessions are nice"), "other lines are not");

    write_file(session.logPath(), "gcc ...\nCompilation exited abnormally with code 2 at Mon\n");
    detach::Status compile = detach::compilationStatus(session);
    assert_true(compile.outcome == detach::Outcome::Failure && compile.exitCode == 2, "compilation status");

    fs::remove_all(dir);
}

void test_lifecycle_through_socket_watch() {
    const std::string dir = make_temp_dir("detach-lifecycle-");
    detach::Config config = test_config(dir);

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    int notifications = 0;
    core.engine().setNotifier([&](const detach::Session&) { ++notifications; });

    detach::Session session = core.create("sleep 1 && echo done", "shell", dir);
    assert_true(session.state == detach::State::Unknown, "created session starts unknown");
    assert_true(fs::exists(session.logPath()), "log exists from creation");
    assert_true(core.watcher().isWatched(session.directory), "session directory should be watched");

    detach::Invocation invocation = detach::buildInvocation(session, detach::Mode::Create, core.config());
    assert_true(invocation.argv[1] == "-n", "create invocation");

    // What dtach does: socket appears, output lands in the log.
    write_file(session.socketPath(), "");
    write_file(session.logPath(), "done\n");

    core.sweep();
    assert_true(core.registry().get(session.id)->state == detach::State::Active, "sweep should promote to active");

    fs::remove(session.socketPath());
    for (int i = 0; i < 5 && core.registry().get(session.id)->state != detach::State::Inactive; ++i) {
        core.processEvents(200);
    }

    auto finished = core.registry().get(session.id);
    assert_true(finished->state == detach::State::Inactive, "socket deletion should finish the session");
    assert_true(finished->status == detach::Status{}, "no reporter means unknown status");
    assert_true(finished->size == 5, "size should be the log length");
    assert_true(finished->time.duration >= 0, "duration should not be negative");
    assert_true(finished->time.end >= finished->time.start, "end should follow start");
    assert_true(notifications == 1, "one notification per completion");
    assert_true(!core.watcher().isWatched(session.directory), "idle directory should no longer be watched");

    assert_true(!core.engine().transition(session.id, false), "second transition should be a no-op");
    assert_true(notifications == 1, "no second notification");
    assert_true(core.registry().get(session.id)->time.end == finished->time.end, "inactive session unchanged");

    detach::Registry persisted(config.dbPath());
    assert_true(persisted.open(), "database should be readable by another instance");
    assert_true(persisted.get(session.id)->state == detach::State::Inactive, "completion should be persisted");

    fs::remove_all(dir);
}

void test_sweep_reconciliation() {
    const std::string dir = make_temp_dir("detach-sweep-");
    detach::Config config = test_config(dir);

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    std::vector<std::string> notified;
    core.engine().setNotifier([&](const detach::Session& s) { notified.push_back(s.id); });

    detach::Session failed = core.create("false", "shell", dir);
    detach::Session passed = core.create("true", "shell", dir);
    detach::Session purged = core.create("rm -rf /tmp/x", "shell", dir);
    detach::Session running = core.create("sleep 100", "shell", dir);

    for (auto* s : {&failed, &passed, &purged, &running}) {
        s->state = detach::State::Active;
        core.registry().update(*s, true);
    }

    write_file(failed.logPath(), "oops\nDetached session exited abnormally with code 3\n");
    write_file(passed.logPath(), "ok\nDetached session finished\n");
    fs::remove(purged.logPath());
    write_file(running.socketPath(), "");

    detach::SweepResult result = core.sweep();
    assert_true(result.finished == 2, "two sessions should finish");
    assert_true(result.removed == 1, "purged session should be removed");

    auto f = core.registry().get(failed.id);
    assert_true(f->state == detach::State::Inactive, "failed session inactive");
    assert_true(f->status == detach::Status{detach::Outcome::Failure, 3}, "failure status from sentinel");

    auto p = core.registry().get(passed.id);
    assert_true(p->status == detach::Status{detach::Outcome::Success, 0}, "success status from sentinel");

    assert_true(!core.registry().get(purged.id), "session with missing log should be removed");
    assert_true(core.registry().get(running.id)->state == detach::State::Active, "running session untouched");
    assert_true(notified.size() == 2, "purged sessions are removed without notification");
    for (const auto& id : notified) {
        assert_true(id != purged.id, "purged session must not notify");
    }

    fs::remove_all(dir);
}

void test_status_and_callback_handlers() {
    const std::string dir = make_temp_dir("detach-handlers-");
    detach::Config config = test_config(dir);
    config.actions["ci.status"] = "always-broken";
    config.actions["ci.callback"] = "count";

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    int callbacks = 0;
    core.handlers().registerStatus("always-broken", [](const detach::Session&) {
        return detach::Status{detach::Outcome::Failure, 42};
    });
    core.handlers().registerCallback("count", [&](const detach::Session& s) {
        assert_true(s.state == detach::State::Inactive, "callback sees the finished session");
        ++callbacks;
    });

    detach::Session session = core.create("./run-ci.sh", "ci", dir);
    assert_true(session.action.status == "always-broken", "status handler resolved from origin");
    write_file(session.logPath(), "Detached session finished\n");

    assert_true(core.engine().transition(session.id, true), "transition should run");
    auto finished = core.registry().get(session.id);
    assert_true(finished->status == detach::Status{detach::Outcome::Failure, 42}, "bound status handler wins");
    assert_true(callbacks == 1, "per-session callback fires once");

    struct stat st;
    assert_true(stat(session.logPath().c_str(), &st) == 0, "log should exist");
    double modified = static_cast<double>(st.st_mtim.tv_sec) + st.st_mtim.tv_nsec / 1e9;
    assert_true(finished->time.end == modified, "approximate end time is the log modification time");

    assert_true(!core.engine().transition(session.id, true), "repeat transition is a no-op");
    assert_true(callbacks == 1, "callback does not fire twice");

    fs::remove_all(dir);
}

void test_find_and_remove() {
    const std::string dir = make_temp_dir("detach-find-");
    detach::Config config = test_config(dir);

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    detach::Session session = core.create("sleep 5", "shell", dir);
    std::string error;
    auto found = core.find(session.id.substr(0, 10), error);
    assert_true(found && found->id == session.id, "unique prefix should resolve");

    assert_true(!core.find("zzzz", error), "unknown id should not resolve");
    assert_true(error.find("No session") != std::string::npos, "error should explain the miss");

    std::ostringstream out;
    int code = detach::Command::execute(core, {"info", "zzzz"}, out);
    assert_true(code == 1, "invalid session reference should fail");
    assert_true(out.str().find("No session matches") != std::string::npos, "user-facing message expected");

    session.state = detach::State::Active;
    core.registry().update(session, true);
    write_file(session.socketPath(), "");
    assert_true(!core.remove(session.id), "running session should not be deleted");

    fs::remove(session.socketPath());
    assert_true(core.remove(session.id), "finished session should be deleted");
    assert_true(!core.registry().get(session.id), "deleted session should be gone");

    fs::remove_all(dir);
}

void test_external_registry_change() {
    const std::string dir = make_temp_dir("detach-external-");
    detach::Config config = test_config(dir);

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    fs::create_directories(config.sessionDirectory);
    detach::Session other = make_session(config.sessionDirectory, "make docs");
    write_file(other.logPath(), "");
    {
        detach::Registry writer(config.dbPath());
        assert_true(writer.open(), "second registry should open");
        writer.insert(other);
    }

    for (int i = 0; i < 5 && !core.registry().get(other.id); ++i) {
        core.processEvents(200);
    }
    assert_true(core.registry().get(other.id).has_value(), "external insert should be picked up");

    fs::remove_all(dir);
}

void test_kill_tree_order() {
    FakeProcessTable table;
    table.tree[100] = {101, 102};
    table.tree[101] = {103};
    table.exited = {102};

    int delivered = detach::killTree(table, 100);
    std::vector<pid_t> expected = {103, 101, 102, 100};
    assert_true(table.signalled == expected, "children should be signalled before their parent");
    assert_true(delivered == 3, "exited child should not count as delivered");

    const std::string dir = make_temp_dir("detach-kill-");
    detach::Config config = test_config(dir);
    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    detach::Session session = core.create("sleep 100", "shell", dir);
    FakeProcessTable missing;
    assert_true(!core.kill(session.id, missing), "no owning process means nothing to kill");

    FakeProcessTable owned;
    owned.owner = 200;
    owned.tree[200] = {201, 202};
    owned.exited = {201};
    assert_true(core.kill(session.id, owned), "kill should reach the dtach process");
    std::vector<pid_t> order = {201, 202, 200};
    assert_true(owned.signalled == order, "both children signalled before the parent");
    std::vector<std::string> masterFlags = {"-n", "-c"};
    assert_true(owned.flagsAsked == masterFlags, "only the session master is looked up");

    fs::remove_all(dir);
}

void test_deduplicate_labels() {
    std::vector<std::string> labels = {"ls", "make", "ls", "ls (2)", "ls", "make"};
    std::vector<std::string> result = detach::deduplicate(labels);

    assert_true(result.size() == labels.size(), "one label per session");
    std::set<std::string> unique(result.begin(), result.end());
    assert_true(unique.size() == result.size(), "labels should be distinct");
    assert_true(result[0] == "ls", "first occurrence keeps its label");
    assert_true(result[1] == "make", "first make keeps its label");
    assert_true(result[2] == "ls (1)", "second ls is numbered");
    assert_true(result[3] == "ls (2)", "real label is kept");
    assert_true(result[4] == "ls (3)", "generated label skips a taken one");
    assert_true(result[5] == "make (1)", "second make is numbered");
}

void test_config_parsing() {
    const std::string dir = make_temp_dir("detach-config-");
    const std::string path = dir + "/detach.conf";
    write_file(path,
               "# comment\n"
               "[core]\n"
               "db_directory = /var/lib/detach\n"
               "dtach_program = /usr/local/bin/dtach\n"
               "show_output_on_attach = true\n"
               "non_attachable_commands = ^ls, ^git (status|log)\n"
               "terminal_data_commands = ^htop\n"
               "metadata_annotators =\n"
               "sweep_interval = 15\n"
               "action.compile.status = compilation\n");

    detach::Config config = detach::Config::load(path);
    assert_true(config.dbDirectory == "/var/lib/detach", "db directory");
    assert_true(config.dbPath() == "/var/lib/detach/detach.db", "db path");
    assert_true(config.dtachProgram == "/usr/local/bin/dtach", "dtach program");
    assert_true(config.showOutputOnAttach, "boolean option");
    assert_true(config.nonAttachableCommands.size() == 2, "list option");
    assert_true(config.nonAttachableCommands[1] == "^git (status|log)", "list items are trimmed");
    assert_true(config.metadataAnnotators.empty(), "empty list clears the default");
    assert_true(config.sweepInterval == 15, "integer option");
    assert_true(config.actions["compile.status"] == "compilation", "action option");

    detach::Action action = detach::resolveAction("compile", config);
    assert_true(action.status == "compilation" && action.attach.empty(), "origin action resolution");

    const std::string fresh = dir + "/nested/detach.conf";
    detach::Config created = detach::Config::loadOrCreate(fresh);
    assert_true(fs::exists(fresh), "default config should be written");
    assert_true(created.dtachProgram == "dtach", "default config should load");

    fs::remove_all(dir);
}

void test_format_helpers() {
    assert_true(detach::Command::formatDuration(5) == "5s", "seconds");
    assert_true(detach::Command::formatDuration(125) == "2m 5s", "minutes");
    assert_true(detach::Command::formatDuration(3725) == "1h 2m 5s", "hours");
    assert_true(detach::Command::formatSize(512) == "512", "bytes");
    assert_true(detach::Command::formatSize(2048) == "2.0K", "kilobytes");
}

void test_lifecycle_with_trailing_slash() {
    const std::string dir = make_temp_dir("detach-slash-");
    detach::Config config = test_config(dir);
    config.sessionDirectory = dir + "/sessions/";

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    detach::Session session = core.create("sleep 1 && echo done", "shell", dir);
    assert_true(session.directory.back() != '/', "session directory is stored without a trailing slash");
    assert_true(core.watcher().isWatched(dir + "/sessions"), "session directory should be watched");

    write_file(session.socketPath(), "");
    core.sweep();
    assert_true(core.registry().get(session.id)->state == detach::State::Active, "sweep should promote to active");

    fs::remove(session.socketPath());
    for (int i = 0; i < 5 && core.registry().get(session.id)->state != detach::State::Inactive; ++i) {
        core.processEvents(200);
    }
    assert_true(core.registry().get(session.id)->state == detach::State::Inactive,
                "socket deletion should finish a session configured with a trailing slash");

    fs::remove_all(dir);
}

void test_sweep_edge_cases() {
    const std::string dir = make_temp_dir("detach-edges-");
    detach::Config config = test_config(dir);

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    int notifications = 0;
    core.engine().setNotifier([&](const detach::Session&) { ++notifications; });

    detach::Session starting = core.create("make", "shell", dir);
    assert_true(starting.state == detach::State::Unknown, "new session starts unknown");
    fs::remove(starting.logPath());

    detach::Session remote = make_session(dir + "/unreachable", "make docs");
    remote.host = {"some-other-host.invalid", detach::HostType::Remote};
    core.registry().insert(remote);

    detach::SweepResult result = core.sweep();
    assert_true(!core.registry().get(starting.id), "unknown session without a log should be removed");
    assert_true(result.removed == 1, "only the session without a log is removed");
    assert_true(result.skipped == 1, "unreachable session of another host is skipped");
    assert_true(core.registry().get(remote.id).has_value(), "skipped session stays registered");
    assert_true(notifications == 0, "removal and skipping never notify");

    detach::Session running = core.create("sleep 1", "shell", dir);
    running.state = detach::State::Active;
    core.registry().update(running, true);

    detach::WatchEvent overflow{-1, detach::WatchAction::Other, ""};
    core.handleEvent(overflow);
    assert_true(core.registry().get(running.id)->state == detach::State::Inactive,
                "a queue overflow should trigger a sweep");
    assert_true(notifications == 1, "the sweep finishes the session once");

    fs::remove_all(dir);
}

void test_reload_keeps_sessions_when_locked() {
    const std::string dir = make_temp_dir("detach-locked-");
    const std::string path = dir + "/detach.db";

    detach::Registry registry(path);
    assert_true(registry.open(), "registry should open");
    registry.insert(make_session(dir, "make"));
    registry.insert(make_session(dir, "make test"));

    sqlite3* other = nullptr;
    assert_true(sqlite3_open(path.c_str(), &other) == SQLITE_OK, "second connection should open");
    assert_true(sqlite3_exec(other, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr) == SQLITE_OK,
                "second connection should lock the database");

    registry.reload();
    size_t whileLocked = registry.getAll().size();

    sqlite3_exec(other, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(other);

    assert_true(whileLocked == 2, "a locked database should not empty the registry");
    registry.reload();
    assert_true(registry.getAll().size() == 2, "reload works again once the lock is gone");

    fs::remove_all(dir);
}

void test_corrupt_rows_are_skipped() {
    const std::string dir = make_temp_dir("detach-corrupt-");
    const std::string path = dir + "/detach.db";

    detach::Session good = make_session(dir, "make");
    detach::Session bad = make_session(dir, "make install");
    {
        detach::Registry registry(path);
        assert_true(registry.open(), "registry should open");
        registry.insert(good);
        registry.insert(bad);
    }

    sqlite3* raw = nullptr;
    assert_true(sqlite3_open(path.c_str(), &raw) == SQLITE_OK, "raw connection should open");
    const std::string sql = "UPDATE sessions SET state = 7 WHERE id = '" + bad.id + "';";
    int updated = sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr);
    sqlite3_close(raw);
    assert_true(updated == SQLITE_OK, "row should be corrupted");

    detach::Registry reopened(path);
    assert_true(reopened.open(), "a corrupt row does not prevent opening");
    assert_true(reopened.get(good.id).has_value(), "intact sessions still load");
    assert_true(!reopened.get(bad.id), "a row with an out of range state is skipped");

    fs::remove_all(dir);
}

void test_command_line_matching() {
    const std::string socket = "/tmp/detach/abc.socket";
    const std::vector<std::string> masterFlags = {"-n", "-c"};

    std::vector<std::string> master = {"dtach", "-n", socket, "-z", "bash", "-c", "make"};
    std::vector<std::string> client = {"/usr/bin/dtach", "-a", socket, "-r", "none"};
    std::vector<std::string> both = {"/usr/local/bin/dtach", "-c", socket, "-z", "bash"};

    assert_true(detach::matchesCommandLine(master, "dtach", socket, masterFlags), "master matches");
    assert_true(!detach::matchesCommandLine(client, "dtach", socket, masterFlags), "attach client does not match");
    assert_true(detach::matchesCommandLine(client, "dtach", socket, {}), "no flags accept any position");
    assert_true(detach::matchesCommandLine(both, "/usr/bin/dtach", socket, masterFlags), "program compared by basename");
    assert_true(!detach::matchesCommandLine(master, "tmux", socket, masterFlags), "other programs do not match");
    assert_true(!detach::matchesCommandLine(master, "dtach", "/tmp/other.socket", masterFlags), "other sockets do not match");
}

void test_rerun_handler_lookup() {
    const std::string dir = make_temp_dir("detach-rerun-");
    detach::Config config = test_config(dir);
    config.dtachProgram = dir + "/no-such-dtach";
    config.actions["ci.run"] = "replay";
    config.actions["nightly.run"] = "missing-handler";

    detach::Core core(config);
    assert_true(core.init(), "core should initialize");

    int runs = 0;
    core.handlers().registerRun("replay", [&](const detach::Session&) { ++runs; });

    detach::Session ci = core.create("make check", "ci", dir);
    std::ostringstream out;
    assert_true(detach::Command::execute(core, {"rerun", ci.id}, out) == 0, "handed-off rerun succeeds");
    assert_true(runs == 1, "run handler is called once");
    assert_true(out.str().find("Rerun handed to replay") != std::string::npos, "hand-off is reported");

    detach::Session nightly = core.create("make nightly", "nightly", dir);
    std::ostringstream errors;
    std::streambuf* saved = std::cerr.rdbuf(errors.rdbuf());
    std::ostringstream ignored;
    int code = detach::Command::execute(core, {"rerun", nightly.id}, ignored);
    std::cerr.rdbuf(saved);

    assert_true(code == 1, "rerun without a working dtach fails");
    const std::string log = errors.str();
    const std::string warning = "Unknown handler 'missing-handler'";
    size_t first = log.find(warning);
    assert_true(first != std::string::npos, "unknown handler is reported");
    assert_true(log.find(warning, first + 1) == std::string::npos, "unknown handler is reported once");

    fs::remove_all(dir);
}

}  // namespace

int main() {
    std::srand(static_cast<unsigned>(std::chrono::steady_clock::now().time_since_epoch().count()));
    try {
        test_session_construction();
        test_mode_flags();
        test_shell_quote();
        test_create_invocation();
        test_attach_gate();
        test_registry_round_trip();
        test_registry_version_mismatch();
        test_registry_remove_deletes_log();
        test_last_line_and_sentinels();
        test_lifecycle_through_socket_watch();
        test_sweep_reconciliation();
        test_status_and_callback_handlers();
        test_find_and_remove();
        test_external_registry_change();
        test_kill_tree_order();
        test_deduplicate_labels();
        test_config_parsing();
        test_format_helpers();
        test_lifecycle_with_trailing_slash();
        test_sweep_edge_cases();
        test_reload_keeps_sessions_when_locked();
        test_corrupt_rows_are_skipped();
        test_command_line_matching();
        test_rerun_handler_lookup();
        std::cout << "detach_tests: all tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "detach_tests: failure: " << ex.what() << "\n";
        return 1;
    }
}
