#include "memory_client.h"
#include "logger.h"
#include "common.h"
#include "utils.h"
#include <filesystem>

using json = nlohmann::json;

namespace vortex_l0 {

MemoryRecord MemoryRecord::from_json(const json& j) {
    MemoryRecord m;
    if (!j.is_object()) {
        return m;
    }
    if (j.contains("id")) {
        m.id = j["id"].is_string() ? j["id"].get<std::string>() : j["id"].dump();
    }
    m.title = j.value("title", "");
    m.content = j.value("content", "");
    m.memory_type = j.value("memory_type", "");
    m.created_at = j.value("created_at", "");
    if (j.contains("similarity") && j["similarity"].is_number()) {
        m.similarity = j["similarity"].get<double>();
    }
    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& tag : j["tags"]) {
            if (tag.is_string()) m.tags.push_back(tag.get<std::string>());
        }
    }
    return m;
}

MemoryClient::MemoryClient(const MemoryServiceConfig& config, std::shared_ptr<HttpTransport> transport)
    : config_(config), transport_(std::move(transport)) {
}

json MemoryClient::user_id_json() const {
    if (config_.user_id.empty()) return nullptr;
    return config_.user_id;
}

MemoryClient::ApiResult MemoryClient::call(const std::string& method, const std::string& endpoint,
                                           const json& body) {
    return call(method, endpoint, body, CancellationToken::with_timeout(config_.timeout_ms));
}

MemoryClient::ApiResult MemoryClient::call(const std::string& method, const std::string& endpoint,
                                           const json& body, const CancellationToken& token) {
    if (!transport_) {
        return make_error(ErrorType::InvalidArgument, "No HTTP transport configured");
    }

    HttpRequest request;
    request.method = method;
    request.url = config_.api_url + endpoint;
    request.headers.emplace_back("Content-Type", "application/json");
    if (!config_.auth_token.empty()) {
        request.headers.emplace_back("Authorization", "Bearer " + config_.auth_token);
    }
    if (!body.is_null()) {
        request.body = body.dump();
    }

    auto start = std::chrono::steady_clock::now();
    auto result = transport_->send(request, token);

    if (result.is_error()) {
        const auto& err = result.error();
        Logger::warn("[Memory] " + method + " " + endpoint + " failed after "
            + std::to_string(ms_since(start)) + "ms: " + err.message);
        return err;
    }

    const HttpResponse& response = result.value();
    if (!response.ok()) {
        std::string text = response.body.empty()
            ? "HTTP " + std::to_string(response.status)
            : response.body;
        Logger::warn("[Memory] " + method + " " + endpoint + " returned HTTP "
            + std::to_string(response.status));
        return make_http_error(response.status, text);
    }

    LOG_MEMORY(method + " " + endpoint + " -> " + std::to_string(response.status)
        + " in " + std::to_string(ms_since(start)) + "ms");

    if (utils::is_empty_or_whitespace(response.body)) {
        return json::object();
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        return make_parse_error("Invalid JSON from memory service: " + std::string(e.what()));
    }
}

MemoryClient::ApiResult MemoryClient::search(const std::string& query, int limit) {
    json body;
    body["query"] = query;
    body["limit"] = limit > 0 ? limit : config_.search_limit;
    body["threshold"] = config_.search_threshold;
    return call("POST", "/api/v1/memory/search", body);
}

MemoryClient::ApiResult MemoryClient::create(const std::string& title, const std::string& content,
                                             const std::string& memory_type,
                                             const std::vector<std::string>& tags) {
    json body;
    body["title"] = title;
    body["content"] = content;
    body["memory_type"] = memory_type;
    body["tags"] = tags;
    return call("POST", "/api/v1/memory", body);
}

MemoryClient::ApiResult MemoryClient::list(int limit) {
    return call("GET", "/api/v1/memory?limit=" + std::to_string(limit));
}

MemoryClient::ApiResult MemoryClient::get(const std::string& id) {
    return call("GET", "/api/v1/memory/" + utils::url_encode(id));
}

MemoryClient::ApiResult MemoryClient::remove(const std::string& id) {
    return call("DELETE", "/api/v1/memory/" + utils::url_encode(id));
}

MemoryClient::ApiResult MemoryClient::suggest_tags(const std::string& memory_id) {
    json body;
    body["memory_id"] = memory_id;
    body["user_id"] = user_id_json();
    return call("POST", "/api/v1/intelligence/suggest-tags", body);
}

MemoryClient::ApiResult MemoryClient::find_related(const std::string& memory_id, int limit) {
    json body;
    body["memory_id"] = memory_id;
    body["user_id"] = user_id_json();
    body["limit"] = limit;
    return call("POST", "/api/v1/intelligence/find-related", body);
}

MemoryClient::ApiResult MemoryClient::detect_duplicates(double threshold) {
    json body;
    body["user_id"] = user_id_json();
    body["similarity_threshold"] = threshold > 0.0 ? threshold : config_.duplicate_threshold;
    body["max_pairs"] = DUPLICATE_MAX_PAIRS;
    return call("POST", "/api/v1/intelligence/detect-duplicates", body);
}

MemoryClient::ApiResult MemoryClient::recall_behavior(const std::string& current_task,
                                                      const std::string& current_directory) {
    json body;
    body["user_id"] = user_id_json();
    body["context"]["current_task"] = current_task;
    body["context"]["current_directory"] = current_directory.empty() ? json(nullptr) : json(current_directory);
    body["limit"] = RECALL_LIMIT;
    return call("POST", "/api/v1/behavior/recall", body);
}

MemoryClient::ApiResult MemoryClient::suggest_next_action(const std::string& task_description,
                                                          const std::vector<std::string>& completed_steps) {
    json body;
    body["user_id"] = user_id_json();
    body["current_state"]["task_description"] = task_description;
    body["current_state"]["completed_steps"] = completed_steps;
    return call("POST", "/api/v1/behavior/suggest", body);
}

MemoryClient::ApiResult MemoryClient::record_pattern(const RecordPatternInput& input) {
    json context = input.context;
    if (context.is_null()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        context = json::object();
        context["directory"] = ec ? std::string("/") : cwd.string();
    }

    const std::string timestamp = to_iso8601(std::chrono::system_clock::now());
    json actions = json::array();
    for (const auto& action : input.actions) {
        actions.push_back({
            {"tool", action},
            {"parameters", json::object()},
            {"outcome", input.outcome},
            {"timestamp", timestamp},
        });
    }

    json body;
    body["user_id"] = user_id_json();
    body["trigger"] = input.trigger;
    body["context"] = context;
    body["actions"] = actions;
    body["final_outcome"] = input.outcome;
    body["confidence"] = input.confidence > 0.0 ? input.confidence : RECORD_PATTERN_CONFIDENCE;
    return call("POST", "/api/v1/behavior/record", body);
}

} // namespace vortex_l0
