#include "detach/command.hpp"
#include "detach/config.hpp"
#include "detach/core.hpp"
#include "detach/daemon.hpp"
#include <vector>
#include <string>
#include <iostream>

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    if (args.empty()) {
        detach::Command::help(std::cout);
        return 1;
    }

    detach::Config config = detach::Config::loadOrCreate(detach::Config::defaultPath());

    // Daemon control never opens the database in this process
    if (args[0] == "daemon") {
        detach::Daemon daemon(config);
        std::string action = args.size() > 1 ? args[1] : "status";

        if (action == "start") {
            if (!daemon.start()) {
                return 1;
            }
            std::cout << "detach daemon started" << std::endl;
            return 0;
        } else if (action == "stop") {
            if (daemon.stop()) {
                std::cout << "detach daemon stopped" << std::endl;
                return 0;
            }
            return 1;
        } else if (action == "status") {
            std::cout << "detach daemon: "
                      << (daemon.isRunning() ? "running" : "stopped")
                      << std::endl;
            return 0;
        }
        std::cerr << "Usage: detach daemon start|stop|status" << std::endl;
        return 1;
    }

    if (args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        detach::Command::help(std::cout);
        return 0;
    }

    detach::Core core(config);
    if (!core.init()) {
        return 1;
    }
    return detach::Command::execute(core, args, std::cout);
}
