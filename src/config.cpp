#include "detach/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace detach {

namespace {

constexpr const char* DEFAULT_CONFIG = R"(# detach configuration
[core]
dtach_program = dtach
shell_program = bash
env_program = detach-env
show_output_on_attach = false
sweep_interval = 60

# Comma separated regular expressions matched against the command
non_attachable_commands =
terminal_data_commands =

# Built-in annotators: git-branch, user
metadata_annotators = git-branch

# Per-origin handlers, e.g.
# action.compile.status = compilation
# action.shell.callback = notify
)";

std::string trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c){ return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c){ return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0, end;
    while ((end = value.find(',', start)) != std::string::npos) {
        std::string item = trim(value.substr(start, end - start));
        if (!item.empty()) items.push_back(item);
        start = end + 1;
    }
    std::string item = trim(value.substr(start));
    if (!item.empty()) items.push_back(item);
    return items;
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "yes" || value == "1" || value == "on";
}

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

std::string homeDirectory() {
    return envOr("HOME", fs::temp_directory_path().string());
}

} // namespace

Config Config::defaults() {
    Config config;
    config.dbDirectory = (fs::path(envOr("XDG_DATA_HOME", homeDirectory() + "/.local/share")) / "detach").string();
    config.sessionDirectory = (fs::temp_directory_path() / "detach").string();
    config.metadataAnnotators = {"git-branch"};
    return config;
}

std::string Config::defaultPath() {
    const char* explicitPath = std::getenv("DETACH_CONFIG");
    if (explicitPath && *explicitPath) return explicitPath;
    fs::path base = envOr("XDG_CONFIG_HOME", homeDirectory() + "/.config");
    return (base / "detach" / "detach.conf").string();
}

Config Config::load(const std::string& path) {
    Config config = defaults();

    std::ifstream confFile(path);
    if (!confFile) return config;

    std::string line;
    int lineNumber = 0;
    while (std::getline(confFile, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == '[') continue;

        size_t pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        try {
            if (key == "db_directory") {
                config.dbDirectory = value;
            } else if (key == "session_directory") {
                config.sessionDirectory = value;
            } else if (key == "dtach_program") {
                config.dtachProgram = value;
            } else if (key == "shell_program") {
                config.shellProgram = value;
            } else if (key == "env_program") {
                config.envProgram = value;
            } else if (key == "show_output_on_attach") {
                config.showOutputOnAttach = parseBool(value);
            } else if (key == "non_attachable_commands") {
                config.nonAttachableCommands = splitList(value);
            } else if (key == "terminal_data_commands") {
                config.terminalDataCommands = splitList(value);
            } else if (key == "metadata_annotators") {
                config.metadataAnnotators = splitList(value);
            } else if (key == "sweep_interval") {
                config.sweepInterval = std::stoi(value);
            } else if (key.compare(0, 7, "action.") == 0) {
                config.actions[key.substr(7)] = value;
            } else {
                std::cerr << path << ":" << lineNumber << ": unknown key '" << key << "'" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << path << ":" << lineNumber << ": invalid value for '" << key << "'" << std::endl;
        }
    }

    return config;
}

Config Config::loadOrCreate(const std::string& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
        std::ofstream confFile(path);
        if (confFile) {
            confFile << DEFAULT_CONFIG;
        } else {
            std::cerr << "Failed to write default config to " << path << std::endl;
        }
    }
    return load(path);
}

std::string Config::dbPath() const {
    return (fs::path(dbDirectory) / "detach.db").string();
}

std::string Config::pidPath() const {
    return (fs::path(dbDirectory) / "detach.pid").string();
}

std::string Config::daemonLogPath() const {
    return (fs::path(dbDirectory) / "detach.log").string();
}

} // namespace detach
