#pragma once

#include "plugin.h"
#include "memory_client.h"
#include <string>
#include <vector>
#include <memory>

namespace vortex_l0 {

/// What a query routed to the memory plugin is asking for.
enum class MemoryIntent {
    Search,
    Create,
    List,
    Delete,
    Recall,
    SuggestTags,
    FindRelated,
    DetectDuplicates,
    SuggestNext,
    RecordPattern,
    Unknown
};

const char* memory_intent_name(MemoryIntent intent);

/**
 * @brief Classify a query into a memory intent
 *
 * Ordered checks, first hit wins: intelligence intents (tags, related,
 * duplicates), then behavioral (recall, next step, record), then CRUD
 * (create, search, list, delete). This is not a scored contest.
 */
MemoryIntent detect_memory_intent(const std::string& query);

/**
 * @brief Strip the command verb for create/search/delete queries
 *
 * "remember that X" -> "X", "search X" -> "X", "forget X" -> "X".
 * Other intents, or queries that do not start with the verb, come back
 * unchanged.
 */
std::string extract_memory_content(const std::string& query, MemoryIntent intent);

/// First 36-character [a-f0-9-] run in text (case-insensitive), or "".
std::string find_memory_id(const std::string& text);

/**
 * @brief Memory-as-a-service plugin
 *
 * Routes each query through detect_memory_intent() and makes one call on
 * MemoryClient per branch. Every outcome, including timeouts and server
 * errors, is returned as a Response of type memory (or help for the usage
 * hint); handle() never throws.
 */
class MemoryServicesPlugin {
public:
    explicit MemoryServicesPlugin(std::shared_ptr<MemoryClient> client);

    Response handle(const PluginContext& ctx) const;

    /// Trigger vocabulary registered with the plugin registry.
    static std::vector<std::string> default_triggers();

    /// Registrable descriptor whose handler keeps this instance alive.
    static Plugin make_plugin(std::shared_ptr<MemoryServicesPlugin> self);

private:
    Response dispatch(MemoryIntent intent, const std::string& query, const std::string& content) const;

    Response handle_search(const std::string& content) const;
    Response handle_create(const std::string& content) const;
    Response handle_list() const;
    Response handle_delete(const std::string& content) const;
    Response handle_recall(const std::string& content) const;
    Response handle_suggest_tags(const std::string& content) const;
    Response handle_find_related(const std::string& content) const;
    Response handle_detect_duplicates() const;
    Response handle_suggest_next(const std::string& content) const;
    Response handle_record_pattern(const std::string& content) const;
    Response handle_unknown(const std::string& query) const;

    std::shared_ptr<MemoryClient> client_;
};

/// Convenience: client + plugin in one step, ready for register_plugin().
Plugin make_memory_plugin(std::shared_ptr<MemoryClient> client);

} // namespace vortex_l0
