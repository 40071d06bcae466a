#pragma once

#include "plugin.h"
#include "response.h"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>

namespace vortex_l0 {

/**
 * @brief Owns registered plugins and dispatches queries to the best match
 *
 * Plugins are kept in registration order. Matching scores every enabled
 * plugin with trigger_matcher and stable-sorts by descending score, so
 * ties resolve to the earlier registration and repeated calls on an
 * unchanged registry return the same order.
 *
 * All members are safe to call from several threads. Handlers run outside
 * the internal lock.
 */
class PluginRegistry {
public:
    PluginRegistry() = default;

    // Non-copyable
    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /**
     * @brief Register a plugin
     * @param plugin Plugin to register
     * @return true if registered; false if validation failed or the name is
     *         already taken (the existing registration is kept as-is)
     */
    bool register_plugin(Plugin plugin);

    /**
     * @brief Remove a plugin by name
     * @return true if a plugin was removed
     */
    bool unregister_plugin(const std::string& name);

    /**
     * @brief Enable or disable a plugin without unregistering it
     * @return true if the plugin exists
     */
    bool set_enabled(const std::string& name, bool enabled);

    /**
     * @brief Enabled plugins whose triggers occur in the query, best first
     */
    std::vector<std::shared_ptr<const Plugin>> find_matching(const std::string& query) const;

    /**
     * @brief Run the handler of the best matching plugin
     * @param query User query
     * @param options Opaque options forwarded to the handler
     * @return Handler's response, or std::nullopt when nothing matched
     */
    std::optional<Response> execute(const std::string& query,
                                    const nlohmann::json& options = nullptr) const;

    /// Metadata of enabled plugins, in registration order.
    std::vector<PluginMetadata> list() const;

    /// Every plugin, enabled or not, with its registration state.
    std::vector<PluginInfo> list_detailed() const;

    size_t count() const;
    size_t enabled_count() const;
    bool has(const std::string& name) const;

    /**
     * @brief Get a plugin by name (disabled plugins included)
     * @return The plugin, or nullptr if not registered
     */
    std::shared_ptr<const Plugin> get(const std::string& name) const;

    /**
     * @brief Whether a registered plugin is enabled
     * @return std::nullopt when the plugin is not registered
     */
    std::optional<bool> is_enabled(const std::string& name) const;

    /// Registration state as a pretty-printed JSON array (handlers omitted).
    std::string to_json() const;

private:
    static bool validate(const Plugin& plugin);

    std::vector<PluginRegistration>::iterator find_locked(const std::string& name);
    std::vector<PluginRegistration>::const_iterator find_locked(const std::string& name) const;

    mutable std::mutex mutex_;
    std::vector<PluginRegistration> registrations_;
};

} // namespace vortex_l0
