#include "detach/process.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace detach {

namespace {

bool isNumeric(const char* name) {
    if (!*name) return false;
    for (; *name; ++name) {
        if (*name < '0' || *name > '9') return false;
    }
    return true;
}

std::vector<pid_t> listPids() {
    std::vector<pid_t> pids;
    DIR* dir = opendir("/proc");
    if (!dir) return pids;

    while (struct dirent* entry = readdir(dir)) {
        if (isNumeric(entry->d_name)) {
            pids.push_back(static_cast<pid_t>(std::atoi(entry->d_name)));
        }
    }
    closedir(dir);
    return pids;
}

// Parent pid from /proc/<pid>/stat. The command name may contain spaces and
// parentheses, so parsing starts after the last ')'.
pid_t parentOf(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return -1;

    size_t end = line.rfind(')');
    if (end == std::string::npos) return -1;

    std::istringstream rest(line.substr(end + 1));
    char state;
    pid_t ppid = -1;
    rest >> state >> ppid;
    return ppid;
}

std::vector<std::string> readCmdline(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    std::vector<std::string> args;
    std::string arg;
    while (std::getline(in, arg, '\0')) {
        args.push_back(arg);
    }
    return args;
}

std::vector<char*> toArgv(const std::vector<std::string>& argv) {
    std::vector<char*> result;
    for (const auto& arg : argv) {
        result.push_back(const_cast<char*>(arg.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

void enterDirectory(const std::string& workingDirectory) {
    if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) != 0) {
        perror("chdir");
    }
}

} // namespace

std::vector<pid_t> ProcFsTable::children(pid_t pid) const {
    std::vector<pid_t> result;
    bool readable = false;

    std::error_code ec;
    fs::path tasks = "/proc/" + std::to_string(pid) + "/task";
    for (const auto& task : fs::directory_iterator(tasks, ec)) {
        std::ifstream in(task.path() / "children");
        if (!in) continue;
        readable = true;
        pid_t child;
        while (in >> child) {
            result.push_back(child);
        }
    }

    // Kernels without CONFIG_PROC_CHILDREN: scan every parent pid instead.
    if (!readable) {
        for (pid_t candidate : listPids()) {
            if (parentOf(candidate) == pid) {
                result.push_back(candidate);
            }
        }
    }
    return result;
}

bool ProcFsTable::signal(pid_t pid, int sig) {
    if (::kill(pid, sig) == 0) return true;
    if (errno != ESRCH) {
        std::cerr << "Failed to signal " << pid << ": " << std::strerror(errno) << std::endl;
    }
    return false;
}

std::optional<pid_t> ProcFsTable::findByArgument(const std::string& program,
                                                 const std::string& argument,
                                                 const std::vector<std::string>& flags) const {
    for (pid_t pid : listPids()) {
        if (matchesCommandLine(readCmdline(pid), program, argument, flags)) {
            return pid;
        }
    }
    return std::nullopt;
}

bool matchesCommandLine(const std::vector<std::string>& args, const std::string& program,
                        const std::string& argument, const std::vector<std::string>& flags) {
    if (args.empty() || fs::path(args[0]).filename() != fs::path(program).filename()) {
        return false;
    }
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] != argument) continue;
        if (flags.empty()) return true;
        for (const auto& flag : flags) {
            if (args[i - 1] == flag) return true;
        }
    }
    return false;
}

int killTree(ProcessTable& table, pid_t pid, int sig) {
    int delivered = 0;
    for (pid_t child : table.children(pid)) {
        delivered += killTree(table, child, sig);
    }
    if (table.signal(pid, sig)) {
        ++delivered;
    }
    return delivered;
}

int runCommand(const std::vector<std::string>& argv, const std::string& workingDirectory) {
    if (argv.empty()) return 127;

    pid_t pid = fork();
    if (pid < 0) {
        perror("fork");
        return 127;
    }

    if (pid == 0) {
        enterDirectory(workingDirectory);
        std::vector<char*> args = toArgv(argv);
        execvp(args[0], args.data());
        perror(argv[0].c_str());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            perror("waitpid");
            return 127;
        }
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 127;
}

int runProgram(const std::vector<std::string>& argv, const std::string& workingDirectory) {
    int code = runCommand(argv, workingDirectory);
    return (code == 127 || code > 128) ? -1 : code;
}

int execProgram(const std::vector<std::string>& argv, const std::string& workingDirectory) {
    if (argv.empty()) return -1;

    enterDirectory(workingDirectory);
    std::vector<char*> args = toArgv(argv);
    execvp(args[0], args.data());
    perror(argv[0].c_str());
    return -1;
}

std::optional<std::string> captureOutput(const std::vector<std::string>& argv,
                                         const std::string& workingDirectory) {
    if (argv.empty()) return std::nullopt;

    int fds[2];
    if (pipe(fds) < 0) {
        perror("pipe");
        return std::nullopt;
    }

    pid_t pid = fork();
    if (pid < 0) {
        perror("fork");
        close(fds[0]);
        close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) dup2(devnull, STDERR_FILENO);
        enterDirectory(workingDirectory);
        std::vector<char*> args = toArgv(argv);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(fds[1]);
    std::string output;
    char buffer[4096];
    ssize_t len;
    while ((len = read(fds[0], buffer, sizeof(buffer))) != 0) {
        if (len < 0) {
            if (errno == EINTR) continue;
            break;
        }
        output.append(buffer, static_cast<size_t>(len));
    }
    close(fds[0]);

    int status = 0;
    pid_t waited;
    while ((waited = waitpid(pid, &status, 0)) < 0 && errno == EINTR) {}

    if (waited < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }
    return output;
}

} // namespace detach
