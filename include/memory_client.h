#pragma once

#include "config.h"
#include "errors.h"
#include "http_client.h"
#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

namespace vortex_l0 {

/// A memory entry as returned by the service.
struct MemoryRecord {
    std::string id;
    std::string title;
    std::string content;
    std::string memory_type;
    std::vector<std::string> tags;
    double similarity = 0.0;   ///< Only set by search/related endpoints
    std::string created_at;

    static MemoryRecord from_json(const nlohmann::json& j);
};

/// Input for MemoryClient::record_pattern().
struct RecordPatternInput {
    std::string trigger;
    std::vector<std::string> actions;
    std::string outcome = "success";   ///< "success" | "partial" | "failed"
    double confidence = 0.8;
    nlohmann::json context;            ///< null = {directory: <cwd>}
};

/**
 * @brief REST client for the memory service
 *
 * Every call is bounded by config.timeout_ms through a CancellationToken
 * and returns the decoded JSON body or an Error. Non-2xx statuses become
 * HttpError with the response body attached. Nothing here throws for
 * transport or server failures, and nothing retries.
 */
class MemoryClient {
public:
    using ApiResult = Result<nlohmann::json>;

    MemoryClient(const MemoryServiceConfig& config, std::shared_ptr<HttpTransport> transport);

    // Non-copyable
    MemoryClient(const MemoryClient&) = delete;
    MemoryClient& operator=(const MemoryClient&) = delete;

    // Core CRUD
    ApiResult search(const std::string& query, int limit = 0);
    ApiResult create(const std::string& title, const std::string& content,
                     const std::string& memory_type = "context",
                     const std::vector<std::string>& tags = {});
    ApiResult list(int limit = 10);
    ApiResult get(const std::string& id);
    ApiResult remove(const std::string& id);

    // Intelligence
    ApiResult suggest_tags(const std::string& memory_id);
    ApiResult find_related(const std::string& memory_id, int limit = 5);
    ApiResult detect_duplicates(double threshold = 0.0);

    // Behavior
    ApiResult recall_behavior(const std::string& current_task,
                              const std::string& current_directory = "");
    ApiResult suggest_next_action(const std::string& task_description,
                                  const std::vector<std::string>& completed_steps = {});
    ApiResult record_pattern(const RecordPatternInput& input);

    const MemoryServiceConfig& config() const { return config_; }

    /**
     * @brief Perform one call against the service
     * @param method HTTP method
     * @param endpoint Path appended to config.api_url (e.g. "/api/v1/memory")
     * @param body JSON body, null for none
     * @param token Cancellation for this call (the caller owns the deadline)
     */
    ApiResult call(const std::string& method, const std::string& endpoint,
                   const nlohmann::json& body, const CancellationToken& token);

private:
    ApiResult call(const std::string& method, const std::string& endpoint,
                   const nlohmann::json& body = nullptr);

    nlohmann::json user_id_json() const;

    MemoryServiceConfig config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace vortex_l0
