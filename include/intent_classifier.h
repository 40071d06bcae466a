#pragma once

#include <string>

namespace vortex_l0 {

/**
 * @brief Built-in intents, in the order they are tested
 */
enum class BuiltinIntent {
    Help,
    Code,
    Memory,
    Campaign,
    Content,
    Trend,
    None   ///< No built-in classifier fired; plugins get a chance
};

const char* builtin_intent_name(BuiltinIntent intent);

/**
 * @brief Cheap substring predicates over a lowercased query
 *
 * classify() evaluates them in fixed priority order and returns the first
 * that fires. The order is part of the routing contract: built-in intents
 * always win over registered plugins.
 */
namespace intent_classifier {

bool is_help_request(const std::string& lower_query);
bool is_code_request(const std::string& lower_query);
bool is_memory_request(const std::string& lower_query);
bool is_campaign_request(const std::string& lower_query);
bool is_content_request(const std::string& lower_query);
bool is_trend_request(const std::string& lower_query);

/// First matching built-in intent for a lowercased query.
BuiltinIntent classify(const std::string& lower_query);

} // namespace intent_classifier

} // namespace vortex_l0
