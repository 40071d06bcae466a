#pragma once

#include "common.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vortex_l0 {

struct LoggingConfig {
    std::string level = "info";   ///< "debug" | "info" | "warn" | "error"
    std::string file;             ///< Append log lines here too (empty = console only)
};

/// Remote memory service used by the memory-services plugin.
struct MemoryServiceConfig {
    std::string api_url = DEFAULT_MEMORY_API_URL;
    std::string auth_token;       ///< Sent as "Authorization: Bearer <token>" when set
    std::string user_id;
    int timeout_ms = DEFAULT_MEMORY_TIMEOUT_MS;          ///< Whole-request budget per call
    int connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    int search_limit = DEFAULT_SEARCH_LIMIT;
    double search_threshold = DEFAULT_SEARCH_THRESHOLD;
    double duplicate_threshold = DEFAULT_DUPLICATE_THRESHOLD;
};

/// Which plugins the default registry starts with.
struct PluginsConfig {
    bool include_builtins = true;           ///< dev-tools, analytics, collaboration
    bool include_memory_services = false;   ///< Needs a reachable memory service
    std::vector<std::string> disabled;      ///< Registered but disabled at startup
};

struct Config {
    LoggingConfig logging;
    MemoryServiceConfig memory_service;
    PluginsConfig plugins;

    /**
     * @brief Load from a JSON file, then apply environment overrides.
     * A missing or unparsable file logs a warning and yields defaults.
     */
    static Config load_from_file(const std::string& path);

    /// Defaults plus environment overrides.
    static Config from_environment();

    /**
     * @brief Apply LANONASIS_API_URL, LANONASIS_API_KEY, LANONASIS_USER_ID
     * and L0_LOG_LEVEL when set.
     */
    void apply_environment();

    /// Merge a parsed JSON document; keys not present keep their values.
    void apply_json(const nlohmann::json& j);

    /// Same shape apply_json() reads. The auth token is written as "***" if redact_secrets.
    nlohmann::json to_json(bool redact_secrets = false) const;

    void save_to_file(const std::string& path) const;
};

} // namespace vortex_l0
