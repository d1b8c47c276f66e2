#include "detach/engine.hpp"
#include "detach/process.hpp"
#include "detach/session.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Runs a session command and appends the sentinel line detach reads the exit
// status from. Usage: detach-env <plain-text|terminal-data> <command...>
int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: detach-env <plain-text|terminal-data> <command>" << std::endl;
        return 2;
    }

    detach::EnvMode mode;
    try {
        mode = detach::envModeFromString(argv[1]);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    std::string command;
    for (int i = 2; i < argc; ++i) {
        if (!command.empty()) command += " ";
        command += argv[i];
    }

    const char* shell = std::getenv("DETACH_SHELL");
    std::string shellProgram = (shell && *shell) ? shell : "bash";

    std::vector<std::string> program;
    if (mode == detach::EnvMode::TerminalData) {
        // script gives the command a terminal so it keeps colors and progress
        // output. It runs the command with $SHELL.
        if (setenv("SHELL", shellProgram.c_str(), 1) != 0) {
            perror("setenv");
        }
        program = {"script", "--quiet", "--flush", "--return", "--command", command, "/dev/null"};
    } else {
        program = {shellProgram, "-c", command};
    }

    std::cout.flush();
    int code = detach::runCommand(program);

    if (code == 0) {
        std::cout << "\n" << detach::SUCCESS_SENTINEL << std::endl;
    } else {
        std::cout << "\n" << detach::FAILURE_SENTINEL << " " << code << std::endl;
    }
    return code;
}
