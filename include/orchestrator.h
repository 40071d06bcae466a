#pragma once

#include "plugin_registry.h"
#include "response.h"
#include <string>
#include <memory>
#include <future>
#include <nlohmann/json.hpp>

namespace vortex_l0 {

/**
 * @brief Routes a free-text query to a built-in generator, a plugin, or the
 * generic fallback
 *
 * Built-in intents are tested first in a fixed order and always win over
 * plugins. When none fires, the registry's best match handles the query.
 * With no match either, the generic orchestration template answers.
 *
 * query() never throws. The registry must outlive the orchestrator, and both
 * must outlive any future returned by query_async().
 */
class Orchestrator {
public:
    explicit Orchestrator(PluginRegistry& registry);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Route one query
     * @param query Free-text request
     * @param options Forwarded to the plugin handler, if one is chosen
     */
    Response query(const std::string& query, const nlohmann::json& options = nullptr) const;

    /// query() on its own thread. Independent queries may run concurrently.
    std::future<Response> query_async(const std::string& query,
                                      const nlohmann::json& options = nullptr) const;

    // Direct access to the canned generators
    Response get_help(const std::string& query) const;
    Response find_code(const std::string& description) const;
    Response search_memories(const std::string& query) const;
    Response orchestrate_campaign(const std::string& request) const;
    Response orchestrate_content(const std::string& request) const;
    Response analyze_trends(const std::string& request) const;
    Response orchestrate_general(const std::string& request) const;

    PluginRegistry& plugin_registry() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace vortex_l0
