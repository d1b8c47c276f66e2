#pragma once

#include <string>
#include <vector>

namespace detach {

// Makes display labels distinct by appending " (n)" to repeated ones. The
// first occurrence keeps its label; later ones are numbered in order.
std::vector<std::string> deduplicate(const std::vector<std::string>& labels);

} // namespace detach
