#pragma once

#include "plugin.h"
#include "plugin_registry.h"
#include "config.h"
#include "http_client.h"
#include <memory>
#include <string>
#include <vector>

namespace vortex_l0 {

/// Development workflows: debugging, testing, deployment.
Plugin make_dev_tools_plugin();

/// Reporting and KPI workflows.
Plugin make_analytics_plugin();

/// Team rituals: standups, retrospectives, general coordination.
Plugin make_collaboration_plugin();

/// What create_plugin_registry() installs.
struct RegistryOptions {
    bool include_builtins = true;
    bool include_memory_services = false;
    std::vector<std::string> disabled;   ///< Registered, then switched off
    MemoryServiceConfig memory_service;

    /// Transport for the memory plugin; a CurlHttpTransport is created when null.
    std::shared_ptr<HttpTransport> transport;

    static RegistryOptions from_config(const Config& config);
};

/**
 * @brief Build a registry with the standard plugin set
 *
 * Registration order is dev-tools, analytics, collaboration, then
 * memory-services, so equal scores resolve in that order.
 */
std::unique_ptr<PluginRegistry> create_plugin_registry(const RegistryOptions& options = RegistryOptions());

} // namespace vortex_l0
