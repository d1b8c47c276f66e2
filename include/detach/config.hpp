#pragma once

#include <map>
#include <string>
#include <vector>

namespace detach {

struct Config {
    std::string dbDirectory;
    std::string sessionDirectory;
    std::string dtachProgram = "dtach";
    std::string shellProgram = "bash";
    std::string envProgram = "detach-env";
    bool showOutputOnAttach = false;
    std::vector<std::string> nonAttachableCommands;
    std::vector<std::string> terminalDataCommands;
    std::vector<std::string> metadataAnnotators;
    int sweepInterval = 60;

    // "<origin>.<slot>" -> handler name, from action.<origin>.<slot> keys.
    std::map<std::string, std::string> actions;

    static Config defaults();
    static Config load(const std::string& path);
    static std::string defaultPath();

    // Writes the default config file unless one exists. Returns the loaded config.
    static Config loadOrCreate(const std::string& path);

    std::string dbPath() const;
    std::string pidPath() const;
    std::string daemonLogPath() const;
};

} // namespace detach
