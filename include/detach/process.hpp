#pragma once

#include <csignal>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace detach {

// Process introspection and signalling, separated so the kill logic can run
// against a scripted table.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    virtual std::vector<pid_t> children(pid_t pid) const = 0;
    // Returns false when the process no longer exists or cannot be signalled.
    virtual bool signal(pid_t pid, int sig) = 0;
    // First process whose command line satisfies matchesCommandLine.
    virtual std::optional<pid_t> findByArgument(const std::string& program,
                                                const std::string& argument,
                                                const std::vector<std::string>& flags) const = 0;
};

// True when argv[0]'s basename is `program` and `argument` appears right after
// one of `flags`. An empty flag list accepts `argument` anywhere.
bool matchesCommandLine(const std::vector<std::string>& args, const std::string& program,
                        const std::string& argument, const std::vector<std::string>& flags);

// Linux /proc backed table.
class ProcFsTable : public ProcessTable {
public:
    std::vector<pid_t> children(pid_t pid) const override;
    bool signal(pid_t pid, int sig) override;
    std::optional<pid_t> findByArgument(const std::string& program,
                                        const std::string& argument,
                                        const std::vector<std::string>& flags) const override;
};

// Signals every descendant depth first, then `pid` itself. Processes that have
// already exited are skipped silently. Returns the number of signals delivered.
int killTree(ProcessTable& table, pid_t pid, int sig = SIGTERM);

// fork/exec/wait. Returns the status the way a shell reports it: the exit
// code, 128 + signal number, or 127 when the program could not be started.
int runCommand(const std::vector<std::string>& argv, const std::string& workingDirectory = "");

// Like runCommand, but -1 when the program could not run or was killed.
int runProgram(const std::vector<std::string>& argv, const std::string& workingDirectory = "");

// Replaces the current process. Only returns on failure.
int execProgram(const std::vector<std::string>& argv, const std::string& workingDirectory = "");

// Runs a program and returns its stdout with the trailing newline stripped,
// or nothing if it failed.
std::optional<std::string> captureOutput(const std::vector<std::string>& argv,
                                         const std::string& workingDirectory = "");

} // namespace detach
