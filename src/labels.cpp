#include "detach/labels.hpp"
#include <map>
#include <unordered_set>

namespace detach {

std::vector<std::string> deduplicate(const std::vector<std::string>& labels) {
    std::unordered_set<std::string> taken(labels.begin(), labels.end());
    std::unordered_set<std::string> seen;
    std::map<std::string, int> counters;

    std::vector<std::string> result;
    result.reserve(labels.size());

    for (const auto& label : labels) {
        if (seen.insert(label).second) {
            result.push_back(label);
            continue;
        }

        // A generated suffix may itself collide with a real label.
        int& n = counters[label];
        std::string candidate;
        do {
            candidate = label + " (" + std::to_string(++n) + ")";
        } while (taken.count(candidate));

        taken.insert(candidate);
        result.push_back(candidate);
    }
    return result;
}

} // namespace detach
