#pragma once
#include "config.hpp"
#include <string>

namespace detach {

// Background monitor: watches session directories and records completions
// while no other detach process is running.
class Daemon {
public:
    explicit Daemon(const Config& config);

    bool start();
    bool stop();
    bool isRunning() const;

private:
    void mainLoop();

    Config config_;
    std::string pidPath_;
};

} // namespace detach
