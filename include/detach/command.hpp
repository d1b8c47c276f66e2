#pragma once
#include "core.hpp"
#include <string>
#include <vector>
#include <iostream>

namespace detach {

class Command {
public:
    static int execute(Core& core, const std::vector<std::string>& args, std::ostream& out);

    static int create(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int list(Core& core, std::ostream& out);
    static int attach(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int view(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int tail(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int info(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int kill(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int remove(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static int rerun(Core& core, const std::vector<std::string>& args, std::ostream& out);
    static void help(std::ostream& out);

    static std::string formatDuration(double seconds);
    static std::string formatSize(std::uintmax_t bytes);
};

} // namespace detach
