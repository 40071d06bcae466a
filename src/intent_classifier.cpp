#include "intent_classifier.h"
#include "utils.h"

namespace vortex_l0 {

const char* builtin_intent_name(BuiltinIntent intent) {
    switch (intent) {
        case BuiltinIntent::Help:     return "help";
        case BuiltinIntent::Code:     return "code";
        case BuiltinIntent::Memory:   return "memory";
        case BuiltinIntent::Campaign: return "campaign";
        case BuiltinIntent::Content:  return "content";
        case BuiltinIntent::Trend:    return "trend";
        case BuiltinIntent::None:     return "none";
    }
    return "none";
}

namespace intent_classifier {

using utils::contains;
using utils::contains_any;

bool is_help_request(const std::string& q) {
    return utils::starts_with(q, "help") || contains(q, "help ") || contains(q, "how to");
}

bool is_code_request(const std::string& q) {
    return contains_any(q, {"code", "snippet"});
}

bool is_memory_request(const std::string& q) {
    return contains_any(q, {"memory", "notes", "meeting"});
}

bool is_campaign_request(const std::string& q) {
    return contains_any(q, {"campaign", "social media", "viral"});
}

bool is_content_request(const std::string& q) {
    return contains(q, "content") && contains_any(q, {"create", "strategy"});
}

bool is_trend_request(const std::string& q) {
    return contains_any(q, {"trend", "hashtag", "analytics"});
}

BuiltinIntent classify(const std::string& q) {
    if (is_help_request(q)) return BuiltinIntent::Help;
    if (is_code_request(q)) return BuiltinIntent::Code;
    if (is_memory_request(q)) return BuiltinIntent::Memory;
    if (is_campaign_request(q)) return BuiltinIntent::Campaign;
    if (is_content_request(q)) return BuiltinIntent::Content;
    if (is_trend_request(q)) return BuiltinIntent::Trend;
    return BuiltinIntent::None;
}

} // namespace intent_classifier

} // namespace vortex_l0
