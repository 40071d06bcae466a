#include "trigger_matcher.h"
#include "utils.h"

namespace vortex_l0 {
namespace trigger_matcher {

int score_lowercase(const std::string& lower_query, const std::vector<std::string>& triggers) {
    int total = 0;
    for (const auto& trigger : triggers) {
        if (trigger.empty()) continue;
        if (lower_query.find(utils::normalize_copy(trigger)) != std::string::npos) {
            total += static_cast<int>(trigger.size());
        }
    }
    return total;
}

int score(const std::string& query, const std::vector<std::string>& triggers) {
    return score_lowercase(utils::normalize_copy(query), triggers);
}

std::optional<int> match_score(const std::string& lower_query, const Plugin& plugin) {
    int raw = score_lowercase(lower_query, plugin.triggers);
    if (raw == 0) {
        return std::nullopt;
    }
    return raw + plugin.priority;
}

} // namespace trigger_matcher
} // namespace vortex_l0
