#include "plugins/memory_plugin.h"
#include "common.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <regex>

using json = nlohmann::json;

namespace vortex_l0 {

namespace {

constexpr size_t TITLE_MAX_CHARS = 50;
constexpr size_t PREVIEW_CHARS = 100;
constexpr size_t RELATED_PREVIEW_CHARS = 80;
constexpr size_t MAX_LISTED = 5;

const json& array_field(const json& obj, const char* key) {
    static const json empty = json::array();
    if (obj.is_object() && obj.contains(key) && obj[key].is_array()) {
        return obj[key];
    }
    return empty;
}

long percent(double fraction) {
    return std::lround(fraction * 100.0);
}

double number_or(const json& obj, const char* key, double fallback) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<double>();
    }
    return fallback;
}

std::string string_or(const json& obj, const char* key, const std::string& fallback = "") {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return fallback;
}

std::vector<MemoryRecord> parse_memories(const json& arr) {
    std::vector<MemoryRecord> out;
    for (const auto& item : arr) {
        out.push_back(MemoryRecord::from_json(item));
    }
    return out;
}

Response memory_response(const std::string& message) {
    return Response::make(message, ResponseType::Memory);
}

Response format_memory_list(const std::vector<MemoryRecord>& memories) {
    if (memories.empty()) {
        Response r = memory_response("No memories found. Your knowledge base is ready to grow!");
        r.related = {"Try: \"remember that...\" to save something"};
        return r;
    }

    std::vector<std::string> lines;
    for (size_t i = 0; i < memories.size() && i < MAX_LISTED; ++i) {
        const auto& m = memories[i];
        lines.push_back(std::to_string(i + 1) + ". **" + m.title + "**\n   "
            + utils::truncate(m.content, PREVIEW_CHARS));
    }

    Response r = memory_response("Found " + std::to_string(memories.size()) + " relevant "
        + (memories.size() == 1 ? "memory" : "memories") + ":");
    r.data = utils::join(lines, "\n\n");
    for (size_t i = 0; i < memories.size() && i < 3; ++i) {
        r.related.push_back(memories[i].title);
    }
    return r;
}

std::string regex_capture(const std::string& text, const std::regex& re, size_t group = 1) {
    std::smatch match;
    if (std::regex_search(text, match, re) && match.size() > group && match[group].matched) {
        return match[group].str();
    }
    return "";
}

} // namespace

const char* memory_intent_name(MemoryIntent intent) {
    switch (intent) {
        case MemoryIntent::Search:           return "search";
        case MemoryIntent::Create:           return "create";
        case MemoryIntent::List:             return "list";
        case MemoryIntent::Delete:           return "delete";
        case MemoryIntent::Recall:           return "recall";
        case MemoryIntent::SuggestTags:      return "suggest_tags";
        case MemoryIntent::FindRelated:      return "find_related";
        case MemoryIntent::DetectDuplicates: return "detect_duplicates";
        case MemoryIntent::SuggestNext:      return "suggest_next";
        case MemoryIntent::RecordPattern:    return "record_pattern";
        case MemoryIntent::Unknown:          return "unknown";
    }
    return "unknown";
}

MemoryIntent detect_memory_intent(const std::string& query) {
    const std::string q = utils::normalize_copy(query);
    using utils::contains_any;

    // Intelligence
    if (contains_any(q, {"suggest tags", "tag this", "what tags", "auto tag"})) {
        return MemoryIntent::SuggestTags;
    }
    if (contains_any(q, {"related", "similar", "like this", "connections"})) {
        return MemoryIntent::FindRelated;
    }
    if (contains_any(q, {"duplicate", "duplicates", "redundant", "cleanup"})) {
        return MemoryIntent::DetectDuplicates;
    }

    // Behavioral
    if (contains_any(q, {"pattern", "workflow", "how did i", "last time"})) {
        return MemoryIntent::Recall;
    }
    if (contains_any(q, {"what next", "next step", "suggest action", "what should i"})) {
        return MemoryIntent::SuggestNext;
    }
    if (contains_any(q, {"record this", "save workflow", "learn this", "that worked"})) {
        return MemoryIntent::RecordPattern;
    }

    // Core CRUD
    if (contains_any(q, {"remember", "save", "store", "note"})) {
        return MemoryIntent::Create;
    }
    if (contains_any(q, {"search", "find", "what do i know", "look for"})) {
        return MemoryIntent::Search;
    }
    if (contains_any(q, {"list", "show", "my memories"})) {
        return MemoryIntent::List;
    }
    if (contains_any(q, {"delete", "remove", "forget"})) {
        return MemoryIntent::Delete;
    }

    return MemoryIntent::Unknown;
}

std::string extract_memory_content(const std::string& query, MemoryIntent intent) {
    static const std::regex create_re(
        R"(^(?:remember|save|store|note)\s+(?:that\s+)?(.+)$)", std::regex::icase);
    static const std::regex search_re(
        R"(^(?:search|find|what do i know about|look for)\s+(.+)$)", std::regex::icase);
    static const std::regex delete_re(
        R"(^(?:delete|remove|forget)\s+(.+)$)", std::regex::icase);

    const std::regex* re = nullptr;
    switch (intent) {
        case MemoryIntent::Create: re = &create_re; break;
        case MemoryIntent::Search: re = &search_re; break;
        case MemoryIntent::Delete: re = &delete_re; break;
        default: return query;
    }

    std::smatch match;
    if (std::regex_match(query, match, *re)) {
        return utils::trim_copy(match[1].str());
    }
    return query;
}

std::string find_memory_id(const std::string& text) {
    static const std::regex id_re(R"([a-f0-9-]{36})", std::regex::icase);
    std::smatch match;
    if (std::regex_search(text, match, id_re)) {
        return match[0].str();
    }
    return "";
}

MemoryServicesPlugin::MemoryServicesPlugin(std::shared_ptr<MemoryClient> client)
    : client_(std::move(client)) {
}

std::vector<std::string> MemoryServicesPlugin::default_triggers() {
    return {
        // Core memory
        "remember", "recall", "find", "search", "what do i know",
        "save", "store", "note", "list", "show", "my memories",
        "delete", "remove", "forget",
        // Intelligence
        "suggest tags", "tag this", "auto tag", "what tags",
        "related", "similar", "like this", "connections",
        "duplicate", "duplicates", "redundant", "cleanup",
        // Behavioral
        "pattern", "workflow", "how did i", "last time",
        "what next", "next step", "suggest action", "what should i",
        "record this", "save workflow", "learn this", "that worked",
    };
}

Plugin MemoryServicesPlugin::make_plugin(std::shared_ptr<MemoryServicesPlugin> self) {
    Plugin plugin;
    plugin.metadata.name = "memory-services";
    plugin.metadata.version = "1.0.0";
    plugin.metadata.description = "LanOnasis Memory-as-a-Service integration - context-aware memory operations";
    plugin.metadata.author = "LanOnasis";
    plugin.metadata.keywords = {"memory", "context", "knowledge", "semantic-search", "lanonasis", "maas"};
    plugin.triggers = default_triggers();
    plugin.priority = MEMORY_PLUGIN_PRIORITY;
    plugin.handler = [self](const PluginContext& ctx) { return self->handle(ctx); };
    return plugin;
}

Plugin make_memory_plugin(std::shared_ptr<MemoryClient> client) {
    return MemoryServicesPlugin::make_plugin(
        std::make_shared<MemoryServicesPlugin>(std::move(client)));
}

Response MemoryServicesPlugin::handle(const PluginContext& ctx) const {
    const MemoryIntent intent = detect_memory_intent(ctx.query);
    const std::string content = extract_memory_content(ctx.query, intent);

    LOG_MEMORY(std::string("Intent: ") + memory_intent_name(intent));

    try {
        return dispatch(intent, ctx.query, content);
    } catch (const std::exception& e) {
        Logger::error("[Memory] Handler error: " + std::string(e.what()));
        Response r = memory_response("Memory service error: " + std::string(e.what()));
        r.related = {"Check connection", "Try again"};
        return r;
    }
}

Response MemoryServicesPlugin::dispatch(MemoryIntent intent, const std::string& query,
                                        const std::string& content) const {
    switch (intent) {
        case MemoryIntent::Search:           return handle_search(content);
        case MemoryIntent::Create:           return handle_create(content);
        case MemoryIntent::List:             return handle_list();
        case MemoryIntent::Delete:           return handle_delete(content);
        case MemoryIntent::Recall:           return handle_recall(content);
        case MemoryIntent::SuggestTags:      return handle_suggest_tags(content);
        case MemoryIntent::FindRelated:      return handle_find_related(content);
        case MemoryIntent::DetectDuplicates: return handle_detect_duplicates();
        case MemoryIntent::SuggestNext:      return handle_suggest_next(content);
        case MemoryIntent::RecordPattern:    return handle_record_pattern(content);
        case MemoryIntent::Unknown:          break;
    }
    return handle_unknown(query);
}

Response MemoryServicesPlugin::handle_search(const std::string& content) const {
    auto result = client_->search(content);
    if (result.is_error()) {
        Response r = memory_response("Search failed: " + result.error().message);
        r.related = {"Check your connection", "Try again"};
        return r;
    }
    return format_memory_list(parse_memories(array_field(result.value(), "results")));
}

Response MemoryServicesPlugin::handle_create(const std::string& content) const {
    if (content.size() < 3) {
        return memory_response("What would you like me to remember? Tell me more!");
    }

    const std::string title = utils::truncate(content, TITLE_MAX_CHARS);
    auto result = client_->create(title, content);
    if (result.is_error()) {
        return memory_response("Could not save: " + result.error().message);
    }

    const json& body = result.value();
    Response r = memory_response("Saved! \"" + title + "\"");
    r.data = {
        {"id", body.is_object() && body.contains("id") ? body["id"] : json(nullptr)},
        {"title", title},
    };
    r.related = {"Search your memories", "List recent"};
    return r;
}

Response MemoryServicesPlugin::handle_list() const {
    auto result = client_->list(DEFAULT_LIST_LIMIT);
    if (result.is_error()) {
        return memory_response("Could not list memories: " + result.error().message);
    }
    return format_memory_list(parse_memories(array_field(result.value(), "data")));
}

Response MemoryServicesPlugin::handle_delete(const std::string& content) const {
    const std::string id = find_memory_id(content);
    if (id.empty()) {
        Response r = memory_response("To delete, I need the memory ID. Try \"list\" first to see IDs.");
        r.related = {"list memories", "show my memories"};
        return r;
    }

    auto result = client_->remove(id);
    if (result.is_error()) {
        return memory_response("Could not delete: " + result.error().message);
    }
    return memory_response("Deleted memory " + id.substr(0, 8) + "...");
}

Response MemoryServicesPlugin::handle_recall(const std::string& content) const {
    auto result = client_->recall_behavior(content);
    if (result.is_error()) {
        Logger::warn("[Memory] Recall failed: " + result.error().message);
    }
    const json& patterns = result.is_ok() ? array_field(result.value(), "patterns") : array_field(json(), "");
    if (patterns.empty()) {
        return memory_response("No matching patterns found. Keep using the system to build your workflow memory!");
    }

    std::vector<std::string> lines;
    for (size_t i = 0; i < patterns.size(); ++i) {
        const auto& p = patterns[i];
        lines.push_back(std::to_string(i + 1) + ". " + string_or(p, "trigger")
            + " (" + std::to_string(percent(number_or(p, "confidence", 0.0))) + "% match)");
    }

    Response r = memory_response("Found relevant workflow patterns:\n" + utils::join(lines, "\n"));
    for (const auto& action : array_field(patterns[0], "actions")) {
        if (action.is_string()) r.workflow.push_back(action.get<std::string>());
    }
    return r;
}

Response MemoryServicesPlugin::handle_suggest_tags(const std::string& content) const {
    const std::string id = find_memory_id(content);
    if (id.empty()) {
        Response r = memory_response("🏷️ To suggest tags, I need a memory ID. Try \"list\" first to see your memories.");
        r.related = {"list memories", "show recent"};
        return r;
    }

    auto result = client_->suggest_tags(id);
    if (result.is_error()) {
        Logger::warn("[Memory] Tag suggestion failed: " + result.error().message);
    }
    const json& suggestions = result.is_ok() ? array_field(result.value(), "suggestions") : array_field(json(), "");
    if (suggestions.empty()) {
        return memory_response("Could not generate tag suggestions. The memory may not have enough content.");
    }

    std::vector<std::string> lines;
    for (const auto& s : suggestions) {
        lines.push_back("• " + string_or(s, "tag") + " ("
            + std::to_string(percent(number_or(s, "confidence", 0.0))) + "% confidence)");
    }

    Response r = memory_response("🏷️ Suggested tags for this memory:\n" + utils::join(lines, "\n"));
    r.data = {{"suggestions", suggestions}};
    r.related = {"Apply these tags", "Search by tag"};
    return r;
}

Response MemoryServicesPlugin::handle_find_related(const std::string& content) const {
    const std::string id = find_memory_id(content);
    if (id.empty()) {
        // No id: fall back to a content search
        auto search = client_->search(content, RELATED_LIMIT);
        if (search.is_ok()) {
            auto memories = parse_memories(array_field(search.value(), "results"));
            if (!memories.empty()) {
                return format_memory_list(memories);
            }
        }
        return memory_response("🔗 To find related memories, describe what you're looking for or provide a memory ID.");
    }

    auto result = client_->find_related(id, RELATED_LIMIT);
    if (result.is_error()) {
        Logger::warn("[Memory] Find related failed: " + result.error().message);
    }
    const json& related = result.is_ok() ? array_field(result.value(), "related") : array_field(json(), "");
    if (related.empty()) {
        return memory_response("No related memories found. Your knowledge graph will grow as you add more!");
    }

    std::vector<std::string> lines;
    std::vector<std::string> titles;
    for (size_t i = 0; i < related.size(); ++i) {
        const auto memory = MemoryRecord::from_json(related[i].value("memory", json::object()));
        lines.push_back(std::to_string(i + 1) + ". **" + memory.title + "** ("
            + std::to_string(percent(number_or(related[i], "similarity", 0.0))) + "% similar)\n   "
            + utils::utf8_prefix(memory.content, RELATED_PREVIEW_CHARS) + "...");
        titles.push_back(memory.title);
    }

    Response r = memory_response("🔗 Found " + std::to_string(related.size()) + " related memories:\n\n"
        + utils::join(lines, "\n\n"));
    for (size_t i = 0; i < titles.size() && i < 3; ++i) {
        r.related.push_back(titles[i]);
    }
    return r;
}

Response MemoryServicesPlugin::handle_detect_duplicates() const {
    auto result = client_->detect_duplicates(client_->config().duplicate_threshold);
    if (result.is_error()) {
        return memory_response("Could not scan for duplicates: " + result.error().message);
    }

    const json& duplicates = array_field(result.value(), "duplicates");
    if (duplicates.empty()) {
        Response r = memory_response("✨ No duplicates found! Your memory collection is clean.");
        r.related = {"List memories", "Search for something"};
        return r;
    }

    std::vector<std::string> lines;
    for (size_t i = 0; i < duplicates.size(); ++i) {
        const auto& d = duplicates[i];
        const auto first = MemoryRecord::from_json(d.value("memory1", json::object()));
        const auto second = MemoryRecord::from_json(d.value("memory2", json::object()));
        lines.push_back(std::to_string(i + 1) + ". \"" + first.title + "\" ↔ \"" + second.title + "\" ("
            + std::to_string(percent(number_or(d, "similarity", 0.0))) + "% similar)");
    }

    Response r = memory_response("🔍 Found " + std::to_string(duplicates.size()) + " potential duplicates:\n\n"
        + utils::join(lines, "\n") + "\n\n💡 Say \"delete [id]\" to remove unwanted copies.");
    r.data = {{"duplicates", duplicates}};
    return r;
}

Response MemoryServicesPlugin::handle_suggest_next(const std::string& content) const {
    static const std::regex task_re(R"((?:for|on|with)\s+(.+?)(?:\?|$))", std::regex::icase);
    std::string task = regex_capture(content, task_re);
    if (task.empty()) {
        task = content;
    }

    auto result = client_->suggest_next_action(task);
    if (result.is_error()) {
        Logger::warn("[Memory] Next-action suggestion failed: " + result.error().message);
    }
    const json& suggestions = result.is_ok() ? array_field(result.value(), "suggestions") : array_field(json(), "");
    if (suggestions.empty()) {
        return memory_response("🤔 I don't have enough context yet to suggest next steps. "
                               "Keep working and I'll learn your patterns!");
    }

    std::vector<std::string> steps;
    for (const auto& s : suggestions) {
        steps.push_back(s.is_string() ? s.get<std::string>() : s.dump());
    }
    std::vector<std::string> lines;
    for (size_t i = 0; i < steps.size(); ++i) {
        lines.push_back(std::to_string(i + 1) + ". " + steps[i]);
    }

    Response r = memory_response("💡 Based on your patterns, here's what to do next:\n\n" + utils::join(lines, "\n"));
    r.workflow = steps;
    r.related = {"Show my patterns", "Record this workflow"};
    return r;
}

Response MemoryServicesPlugin::handle_record_pattern(const std::string& content) const {
    static const std::regex actions_re(R"((?:steps?|actions?|workflow):\s*(.+))", std::regex::icase);
    static const std::regex trigger_re(R"((?:for|when|trigger):\s*(.+?)(?:steps|actions|$))", std::regex::icase);

    std::smatch actions_match;
    std::smatch trigger_match;
    const bool has_actions = std::regex_search(content, actions_match, actions_re);
    const bool has_trigger = std::regex_search(content, trigger_match, trigger_re);

    if (!has_actions && !has_trigger) {
        return memory_response(
            "📝 To record a workflow pattern, tell me:\n"
            "• What triggered it: \"for: [task description]\"\n"
            "• What steps worked: \"steps: [action1, action2, ...]\"\n\n"
            "Example: \"record this for: debugging auth, steps: check logs, verify tokens, test endpoint\"");
    }

    std::string trigger = has_trigger ? utils::trim_copy(trigger_match[1].str()) : "";
    if (trigger.empty()) {
        trigger = utils::utf8_prefix(content, TITLE_MAX_CHARS);
    }

    std::vector<std::string> actions;
    if (has_actions) {
        std::string list = actions_match[1].str();
        std::replace(list.begin(), list.end(), ';', ',');
        for (const auto& part : utils::split(list, ',')) {
            std::string action = utils::trim_copy(part);
            if (!action.empty()) actions.push_back(action);
        }
    }
    if (actions.empty()) {
        actions.push_back(content);
    }

    RecordPatternInput input;
    input.trigger = trigger;
    input.actions = actions;
    input.outcome = "success";
    input.confidence = RECORD_PATTERN_CONFIDENCE;

    auto result = client_->record_pattern(input);
    if (result.is_error()) {
        return memory_response("Could not record pattern: " + result.error().message);
    }

    const json& body = result.value();
    Response r = memory_response("✅ Workflow pattern recorded!\n\n📌 Trigger: \"" + trigger + "\"\n📋 Steps: "
        + utils::join(actions, " → ") + "\n\nI'll suggest this pattern when you work on similar tasks.");
    r.data = {{"pattern_id", body.is_object() && body.contains("pattern_id") ? body["pattern_id"] : json(nullptr)}};
    r.related = {"Show my patterns", "What's my workflow for..."};
    return r;
}

Response MemoryServicesPlugin::handle_unknown(const std::string& query) const {
    auto result = client_->search(query, 3);
    if (result.is_ok()) {
        auto memories = parse_memories(array_field(result.value(), "results"));
        if (!memories.empty()) {
            return format_memory_list(memories);
        }
    }
    return Response::make(
        "I can help you with your memories! Try:\n"
        "• \"remember that...\" to save\n"
        "• \"search for...\" to find\n"
        "• \"show my memories\" to list",
        ResponseType::Help);
}

} // namespace vortex_l0
