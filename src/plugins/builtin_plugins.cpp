#include "plugins/builtin_plugins.h"
#include "plugins/memory_plugin.h"
#include "memory_client.h"
#include "logger.h"
#include "utils.h"

using json = nlohmann::json;

namespace vortex_l0 {

namespace {

Response workflow_response(const std::string& message,
                           std::vector<std::string> workflow,
                           std::vector<std::string> agents) {
    Response r = Response::make(message, ResponseType::Orchestration);
    r.workflow = std::move(workflow);
    r.agents = std::move(agents);
    return r;
}

Response dev_tools_handler(const PluginContext& ctx) {
    const std::string q = utils::normalize_copy(ctx.query);

    if (utils::contains(q, "debug")) {
        Response r = workflow_response("🔧 Development Debugging Workflow",
            {
                "📋 Reproduce the issue with minimal test case",
                "🔍 Analyze stack traces and error logs",
                "🎯 Identify root cause vs symptoms",
                "🛠️  Implement targeted fix",
                "✅ Verify fix with regression tests",
            },
            {
                "Debug Agent: Analyzing error patterns and stack traces",
                "Test Agent: Creating reproduction cases",
                "Code Agent: Implementing fixes",
            });
        r.data = {
            {"recommendedTools", {"console.log", "debugger", "breakpoints", "profiler"}},
            {"bestPractices", {"Isolate the problem", "Check recent changes", "Review dependencies"}},
        };
        return r;
    }

    if (utils::contains(q, "test")) {
        return workflow_response("🧪 Testing Strategy Workflow",
            {
                "📊 Analyze code coverage gaps",
                "🎯 Identify critical paths for testing",
                "✍️  Write unit tests for core logic",
                "🔗 Add integration tests for workflows",
                "🚀 Set up CI/CD test automation",
            },
            {
                "Test Agent: Generating test cases",
                "Coverage Agent: Analyzing test coverage",
                "CI Agent: Configuring automated testing",
            });
    }

    if (utils::contains_any(q, {"deploy", "ci", "cd"})) {
        return workflow_response("🚀 Deployment Pipeline Workflow",
            {
                "📋 Review deployment checklist",
                "🧪 Run pre-deployment tests",
                "🔒 Security scan and vulnerability check",
                "📦 Build and package artifacts",
                "🚀 Deploy to target environment",
                "✅ Post-deployment verification",
            },
            {
                "Build Agent: Compiling and packaging",
                "Security Agent: Running vulnerability scans",
                "Deploy Agent: Orchestrating deployment",
                "Monitor Agent: Verifying health checks",
            });
    }

    return workflow_response("🛠️  Development Workflow Orchestration",
        {
            "🔍 Analyze development request",
            "📋 Create task breakdown",
            "⚡ Execute development tasks",
            "✅ Validate and test changes",
        },
        {"Dev Agent: Coordinating development tasks"});
}

Response analytics_handler(const PluginContext& ctx) {
    const std::string q = utils::normalize_copy(ctx.query);

    if (utils::contains_any(q, {"kpi", "metrics"})) {
        Response r = workflow_response("📊 KPI & Metrics Analysis Workflow",
            {
                "📈 Define key performance indicators",
                "📊 Collect data from relevant sources",
                "🧮 Calculate metrics and benchmarks",
                "📉 Identify trends and anomalies",
                "📝 Generate actionable insights",
            },
            {
                "Data Agent: Aggregating metrics data",
                "Analysis Agent: Processing and calculating KPIs",
                "Insights Agent: Generating recommendations",
            });
        r.data = {
            {"sampleKPIs", {"Conversion Rate", "Engagement Rate", "Customer Acquisition Cost", "Lifetime Value"}},
            {"reportTypes", {"Daily", "Weekly", "Monthly", "Quarterly"}},
        };
        return r;
    }

    return workflow_response("📈 Analytics & Reporting Workflow",
        {
            "🔍 Define report objectives and scope",
            "📊 Gather and validate data sources",
            "📈 Analyze trends and patterns",
            "📝 Create visualizations and summaries",
            "🎯 Derive actionable recommendations",
        },
        {
            "Data Agent: Collecting and cleaning data",
            "Analytics Agent: Running statistical analysis",
            "Report Agent: Creating visualizations and reports",
        });
}

Response collaboration_handler(const PluginContext& ctx) {
    const std::string q = utils::normalize_copy(ctx.query);

    if (utils::contains_any(q, {"standup", "daily"})) {
        Response r = workflow_response("🤝 Daily Standup Facilitation",
            {
                "📋 Gather team availability and blockers",
                "✅ Review yesterday's completed tasks",
                "🎯 Outline today's priorities",
                "🚧 Identify and escalate blockers",
                "📝 Document action items",
            },
            {
                "Coordination Agent: Facilitating standup flow",
                "Tracking Agent: Recording updates and blockers",
            });
        r.data = {
            {"format", "15-minute timeboxed meeting"},
            {"structure", {"What did you accomplish?", "What will you work on?", "Any blockers?"}},
        };
        return r;
    }

    if (utils::contains(q, "retro")) {
        return workflow_response("🔄 Sprint Retrospective Workflow",
            {
                "✅ What went well this sprint?",
                "❌ What didn't go well?",
                "💡 What can we improve?",
                "🎯 Define action items",
                "📝 Document and track improvements",
            },
            {
                "Facilitation Agent: Guiding retrospective discussion",
                "Analysis Agent: Identifying patterns and themes",
                "Action Agent: Creating improvement tasks",
            });
    }

    return workflow_response("🤝 Team Collaboration Workflow",
        {
            "📋 Define collaboration objectives",
            "👥 Coordinate team members",
            "📝 Document decisions and action items",
            "✅ Follow up on commitments",
        },
        {"Collaboration Agent: Coordinating team activities"});
}

} // namespace

Plugin make_dev_tools_plugin() {
    Plugin plugin;
    plugin.metadata = {"dev-tools", "1.0.0", "Development workflow orchestration tools", "VortexAI",
                       {"development", "debugging", "testing", "ci/cd"}};
    plugin.triggers = {"debug", "test", "deploy", "ci", "cd", "build", "lint", "refactor"};
    plugin.priority = 10;
    plugin.handler = dev_tools_handler;
    return plugin;
}

Plugin make_analytics_plugin() {
    Plugin plugin;
    plugin.metadata = {"analytics", "1.0.0", "Data analytics and reporting workflows", "VortexAI",
                       {"analytics", "data", "reports", "metrics", "kpi"}};
    plugin.triggers = {"report", "analytics", "metrics", "kpi", "dashboard", "insights", "performance report"};
    plugin.priority = 10;
    plugin.handler = analytics_handler;
    return plugin;
}

Plugin make_collaboration_plugin() {
    Plugin plugin;
    plugin.metadata = {"collaboration", "1.0.0", "Team collaboration and coordination workflows", "VortexAI",
                       {"team", "collaboration", "meeting", "standup", "review"}};
    plugin.triggers = {"meeting", "standup", "review", "sprint", "retrospective", "planning", "team", "collaborate"};
    plugin.priority = 5;
    plugin.handler = collaboration_handler;
    return plugin;
}

RegistryOptions RegistryOptions::from_config(const Config& config) {
    RegistryOptions options;
    options.include_builtins = config.plugins.include_builtins;
    options.include_memory_services = config.plugins.include_memory_services;
    options.disabled = config.plugins.disabled;
    options.memory_service = config.memory_service;
    return options;
}

std::unique_ptr<PluginRegistry> create_plugin_registry(const RegistryOptions& options) {
    auto registry = std::make_unique<PluginRegistry>();

    if (options.include_builtins) {
        registry->register_plugin(make_dev_tools_plugin());
        registry->register_plugin(make_analytics_plugin());
        registry->register_plugin(make_collaboration_plugin());
    }

    if (options.include_memory_services) {
        std::shared_ptr<HttpTransport> transport = options.transport;
        if (!transport) {
            transport = std::make_shared<CurlHttpTransport>(options.memory_service.connect_timeout_ms);
        }
        auto client = std::make_shared<MemoryClient>(options.memory_service, transport);
        registry->register_plugin(make_memory_plugin(client));
        LOG_MEMORY("Memory service at " + options.memory_service.api_url
            + (options.memory_service.auth_token.empty() ? " (no auth token)" : ""));
    }

    for (const auto& name : options.disabled) {
        if (!registry->set_enabled(name, false)) {
            Logger::warn("Cannot disable unknown plugin: " + name);
        }
    }

    LOG_REGISTRY(std::to_string(registry->enabled_count()) + " of "
        + std::to_string(registry->count()) + " plugins enabled");
    return registry;
}

} // namespace vortex_l0
