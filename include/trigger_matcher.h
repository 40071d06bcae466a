#pragma once

#include "plugin.h"
#include <string>
#include <vector>
#include <optional>

namespace vortex_l0 {

/**
 * @brief Scores queries against plugin trigger sets
 *
 * Score is the sum of the lengths of every trigger that occurs anywhere in
 * the lowercased query, so longer and more specific phrases outweigh short
 * generic ones. Matching is raw substring containment: "test" also matches
 * inside "testimony".
 */
namespace trigger_matcher {

/**
 * @brief Raw trigger score of a query
 * @param query Query text (any case)
 * @param triggers Trigger words/phrases (any case)
 * @return Sum of lengths of contained triggers, 0 when none match
 */
int score(const std::string& query, const std::vector<std::string>& triggers);

/**
 * @brief Same as score() but for a query that is already lowercase
 */
int score_lowercase(const std::string& lower_query, const std::vector<std::string>& triggers);

/**
 * @brief Ranking score of a plugin for an already-lowercased query
 * @return Trigger score plus plugin priority, or std::nullopt if no trigger
 *         matched (priority alone never makes a plugin match)
 */
std::optional<int> match_score(const std::string& lower_query, const Plugin& plugin);

} // namespace trigger_matcher

} // namespace vortex_l0
