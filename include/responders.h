#pragma once

#include "response.h"
#include <string>
#include <vector>

namespace vortex_l0 {

/**
 * @brief Canned, deterministic response generators for the built-in intents
 *
 * None of these touch the network. The snippet and memory lookups run over
 * a small static catalog compiled into the binary.
 */
namespace responders {

struct CodeSnippet {
    std::string id;
    std::string title;
    std::string content;
    std::string language;
    std::vector<std::string> tags;
    std::string last_used;
    std::string project;
};

struct StoredMemory {
    std::string id;
    std::string title;
    std::string content;
    std::string type;
    std::string date;
    std::vector<std::string> tags;
};

const std::vector<CodeSnippet>& snippet_catalog();
const std::vector<StoredMemory>& memory_catalog();

/// Lowercased words longer than two characters, minus common stop words.
std::vector<std::string> extract_keywords(const std::string& description);

Response get_help(const std::string& query);
Response find_code(const std::string& description);
Response search_memories(const std::string& query);
Response orchestrate_campaign(const std::string& request);
Response orchestrate_content(const std::string& request);
Response analyze_trends(const std::string& request);

/// Terminal fallback when neither a built-in intent nor a plugin matched.
Response orchestrate_general(const std::string& request);

} // namespace responders

} // namespace vortex_l0
