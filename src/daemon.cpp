#include "detach/daemon.hpp"
#include "detach/core.hpp"
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>
#include <csignal>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <thread>
#include <chrono>

namespace fs = std::filesystem;

namespace detach {

namespace {

Core* activeCore = nullptr;

void handleSignal(int) {
    if (activeCore) {
        activeCore->shutdown();
    }
}

pid_t readPid(const std::string& path) {
    std::ifstream pidFile(path);
    if (!pidFile) return -1;

    pid_t pid = -1;
    pidFile >> pid;
    return pidFile ? pid : -1;
}

} // namespace

Daemon::Daemon(const Config& config) :
    config_(config),
    pidPath_(config.pidPath()) {}

bool Daemon::start() {
    if (isRunning()) {
        std::cerr << "Daemon is already running" << std::endl;
        return false;
    }

    std::error_code ec;
    fs::create_directories(config_.dbDirectory, ec);
    if (ec) {
        std::cerr << "Failed to create " << config_.dbDirectory << ": " << ec.message() << std::endl;
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        perror("fork");
        return false;
    }

    if (pid > 0) {
        return true;
    }

    umask(022);
    setsid();

    // stdin from /dev/null, diagnostics to the daemon log
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    int logFd = open(config_.daemonLogPath().c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (logFd >= 0) {
        dup2(logFd, STDOUT_FILENO);
        dup2(logFd, STDERR_FILENO);
        close(logFd);
    }

    if (chdir("/")) {
        perror("chdir");
        _exit(EXIT_FAILURE);
    }

    std::ofstream pidFile(pidPath_);
    if (!pidFile) {
        perror("pid file");
        _exit(EXIT_FAILURE);
    }
    pidFile << getpid() << std::endl;
    pidFile.close();

    mainLoop();

    unlink(pidPath_.c_str());
    _exit(EXIT_SUCCESS);
}

bool Daemon::stop() {
    pid_t pid = readPid(pidPath_);
    if (pid <= 0 || kill(pid, 0) != 0) {
        std::cerr << "Daemon is not running" << std::endl;
        return false;
    }

    if (kill(pid, SIGTERM) < 0) {
        perror("kill");
        return false;
    }

    // The loop notices the signal within one select timeout.
    for (int i = 0; i < 30 && isRunning(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return !isRunning();
}

bool Daemon::isRunning() const {
    pid_t pid = readPid(pidPath_);
    if (pid <= 0) return false;

    return kill(pid, 0) == 0;
}

void Daemon::mainLoop() {
    Core core(config_);
    if (!core.init()) {
        std::cerr << "Core initialization failed" << std::endl;
        return;
    }

    activeCore = &core;
    struct sigaction action = {};
    action.sa_handler = handleSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGINT, &action, nullptr);
    signal(SIGHUP, SIG_IGN);

    std::cerr << "detach daemon " << getpid() << " watching " << config_.sessionDirectory << std::endl;
    core.run();
    std::cerr << "detach daemon " << getpid() << " stopped" << std::endl;

    activeCore = nullptr;
}

} // namespace detach
