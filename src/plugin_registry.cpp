#include "plugin_registry.h"
#include "trigger_matcher.h"
#include "common.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

using json = nlohmann::json;

namespace vortex_l0 {

bool PluginRegistry::validate(const Plugin& plugin) {
    const auto& meta = plugin.metadata;
    if (meta.name.empty() || meta.version.empty() || meta.description.empty()) {
        Logger::error("Plugin validation failed: metadata must include name, version, and description");
        return false;
    }

    if (plugin.triggers.empty()) {
        Logger::error("Plugin validation failed for '" + meta.name + "': triggers must be a non-empty list");
        return false;
    }

    if (!plugin.handler) {
        Logger::error("Plugin validation failed for '" + meta.name + "': handler must be callable");
        return false;
    }

    return true;
}

std::vector<PluginRegistration>::iterator PluginRegistry::find_locked(const std::string& name) {
    return std::find_if(registrations_.begin(), registrations_.end(),
        [&name](const PluginRegistration& r) { return r.plugin->metadata.name == name; });
}

std::vector<PluginRegistration>::const_iterator PluginRegistry::find_locked(const std::string& name) const {
    return std::find_if(registrations_.begin(), registrations_.end(),
        [&name](const PluginRegistration& r) { return r.plugin->metadata.name == name; });
}

bool PluginRegistry::register_plugin(Plugin plugin) {
    if (!validate(plugin)) {
        return false;
    }

    const std::string name = plugin.metadata.name;

    std::lock_guard<std::mutex> lock(mutex_);
    if (find_locked(name) != registrations_.end()) {
        Logger::warn("Plugin '" + name + "' is already registered. Unregister it first to replace it.");
        return false;
    }

    PluginRegistration registration;
    registration.plugin = std::make_shared<const Plugin>(std::move(plugin));
    registration.enabled = true;
    registration.registered_at = std::chrono::system_clock::now();
    registrations_.push_back(std::move(registration));

    LOG_REGISTRY("Registered plugin: " + name);
    return true;
}

bool PluginRegistry::unregister_plugin(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(name);
    if (it == registrations_.end()) {
        return false;
    }
    registrations_.erase(it);
    LOG_REGISTRY("Unregistered plugin: " + name);
    return true;
}

bool PluginRegistry::set_enabled(const std::string& name, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(name);
    if (it == registrations_.end()) {
        return false;
    }
    it->enabled = enabled;
    LOG_REGISTRY("Plugin '" + name + "' " + (enabled ? "enabled" : "disabled"));
    return true;
}

std::vector<std::shared_ptr<const Plugin>> PluginRegistry::find_matching(const std::string& query) const {
    const std::string lower_query = utils::normalize_copy(query);

    struct Scored {
        std::shared_ptr<const Plugin> plugin;
        int score;
    };
    std::vector<Scored> matches;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& registration : registrations_) {
            if (!registration.enabled) continue;

            auto score = trigger_matcher::match_score(lower_query, *registration.plugin);
            if (score) {
                matches.push_back({registration.plugin, *score});
            }
        }
    }

    // Stable: equal scores keep registration order
    std::stable_sort(matches.begin(), matches.end(),
        [](const Scored& a, const Scored& b) { return a.score > b.score; });

    std::vector<std::shared_ptr<const Plugin>> result;
    result.reserve(matches.size());
    for (auto& m : matches) {
        result.push_back(std::move(m.plugin));
    }
    return result;
}

std::optional<Response> PluginRegistry::execute(const std::string& query, const json& options) const {
    auto matches = find_matching(query);
    if (matches.empty()) {
        return std::nullopt;
    }

    const auto& best = matches.front();
    LOG_ROUTER("Dispatching to plugin '" + best->metadata.name + "' ("
        + std::to_string(matches.size()) + " candidate(s))");

    PluginContext context;
    context.query = query;
    context.options = options;

    try {
        return best->handler(context);
    } catch (const std::exception& e) {
        Logger::error("Plugin '" + best->metadata.name + "' failed: " + e.what());
        Response failure;
        failure.message = "Plugin \"" + best->metadata.name + "\" failed: " + e.what();
        failure.type = ResponseType::Orchestration;
        failure.related = {"Try rephrasing the request", "Check plugin configuration"};
        return failure;
    }
}

std::vector<PluginMetadata> PluginRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PluginMetadata> result;
    for (const auto& registration : registrations_) {
        if (registration.enabled) {
            result.push_back(registration.plugin->metadata);
        }
    }
    return result;
}

std::vector<PluginInfo> PluginRegistry::list_detailed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PluginInfo> result;
    result.reserve(registrations_.size());
    for (const auto& registration : registrations_) {
        PluginInfo info;
        info.metadata = registration.plugin->metadata;
        info.triggers = registration.plugin->triggers;
        info.priority = registration.plugin->priority;
        info.enabled = registration.enabled;
        info.registered_at = registration.registered_at;
        result.push_back(std::move(info));
    }
    return result;
}

size_t PluginRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

size_t PluginRegistry::enabled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(registrations_.begin(), registrations_.end(),
        [](const PluginRegistration& r) { return r.enabled; }));
}

bool PluginRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(name) != registrations_.end();
}

std::shared_ptr<const Plugin> PluginRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(name);
    if (it != registrations_.end()) {
        return it->plugin;
    }
    return nullptr;
}

std::optional<bool> PluginRegistry::is_enabled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(name);
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->enabled;
}

std::string PluginRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json entries = json::array();

    for (const auto& registration : registrations_) {
        const auto& meta = registration.plugin->metadata;

        json metadata;
        metadata["name"] = meta.name;
        metadata["version"] = meta.version;
        metadata["description"] = meta.description;
        if (!meta.author.empty()) metadata["author"] = meta.author;
        if (!meta.keywords.empty()) metadata["keywords"] = meta.keywords;

        json entry;
        entry["name"] = meta.name;
        entry["metadata"] = metadata;
        entry["triggers"] = registration.plugin->triggers;
        entry["enabled"] = registration.enabled;
        entry["registeredAt"] = to_iso8601(registration.registered_at);
        entries.push_back(entry);
    }

    return entries.dump(2);
}

} // namespace vortex_l0
