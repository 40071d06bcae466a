#pragma once

#include "response.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace vortex_l0 {

/// Identity and documentation of a plugin.
struct PluginMetadata {
    std::string name;         ///< Unique key in the registry (e.g. "dev-tools")
    std::string version;
    std::string description;
    std::string author;       ///< Optional
    std::vector<std::string> keywords;  ///< Optional
};

/// What a handler gets to see: the raw query and the caller's options bag.
struct PluginContext {
    std::string query;
    nlohmann::json options;   ///< Opaque; null when the caller passed none
};

/// Handlers are pure functions of their context. They may block on I/O.
using PluginHandler = std::function<Response(const PluginContext&)>;

/// A registrable plugin. Immutable once handed to the registry.
struct Plugin {
    PluginMetadata metadata;
    std::vector<std::string> triggers;  ///< Lowercase words/phrases
    int priority = 0;                   ///< Added to the match score
    PluginHandler handler;
};

/// Registry-owned wrapper around a plugin.
struct PluginRegistration {
    std::shared_ptr<const Plugin> plugin;
    bool enabled = true;
    std::chrono::system_clock::time_point registered_at;
};

/// Introspection row returned by PluginRegistry::list_detailed().
struct PluginInfo {
    PluginMetadata metadata;
    std::vector<std::string> triggers;
    int priority = 0;
    bool enabled = false;
    std::chrono::system_clock::time_point registered_at;
};

} // namespace vortex_l0
