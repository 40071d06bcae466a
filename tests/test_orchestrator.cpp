/**
 * Orchestrator routing tests.
 * Asserts:
 * - Built-in classifiers fire in fixed order and win over plugins.
 * - Unclassified queries go to the best plugin, then to the general template.
 * - A throwing plugin never escapes query().
 *
 * Run from build dir: ./test_orchestrator
 */

#include "orchestrator.h"
#include "intent_classifier.h"
#include "responders.h"
#include "plugins/builtin_plugins.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vortex_l0;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- classifier order ---
    using intent_classifier::classify;
    ASSERT(classify("help") == BuiltinIntent::Help);
    ASSERT(classify("how to write code") == BuiltinIntent::Help);      // help before code
    ASSERT(classify("show me a code snippet") == BuiltinIntent::Code);
    ASSERT(classify("meeting notes from monday") == BuiltinIntent::Memory);
    ASSERT(classify("plan a viral launch") == BuiltinIntent::Campaign);
    ASSERT(classify("create a content plan") == BuiltinIntent::Content);
    ASSERT(classify("content calendar") == BuiltinIntent::None);       // needs create/strategy too
    ASSERT(classify("hashtag ideas") == BuiltinIntent::Trend);
    ASSERT(classify("deploy to production") == BuiltinIntent::None);
    ASSERT(classify("helpful") == BuiltinIntent::Help);                // prefix check

    // --- built-ins win over plugins ---
    {
        PluginRegistry registry;
        Plugin greedy;
        greedy.metadata = {"greedy", "1.0.0", "Matches everything it can", "", {}};
        greedy.triggers = {"help", "code", "deploy"};
        greedy.priority = 1000;
        greedy.handler = [](const PluginContext&) {
            return Response::make("greedy", ResponseType::Context);
        };
        ASSERT(registry.register_plugin(greedy));

        Orchestrator orchestrator(registry);
        Response help = orchestrator.query("help me deploy");
        ASSERT(help.type == ResponseType::Help);
        ASSERT(help.message != "greedy");

        Response code = orchestrator.query("find code for the floating card");
        ASSERT(code.type == ResponseType::Snippet);

        Response plugin = orchestrator.query("deploy now");
        ASSERT(plugin.message == "greedy");
    }

    // --- canned generators ---
    {
        PluginRegistry registry;
        Orchestrator orchestrator(registry);

        Response topic = orchestrator.query("help with oauth");
        ASSERT(topic.type == ResponseType::Help);
        ASSERT(starts_with(topic.message, "OAuth Implementation"));
        ASSERT(topic.related.size() == 5);

        Response snippet = orchestrator.find_code("floating card");
        ASSERT(snippet.type == ResponseType::Snippet);
        ASSERT(snippet.code.has_value());
        ASSERT(snippet.clipboard == std::optional<bool>(true));
        ASSERT(snippet.dashboard_url == std::optional<std::string>("/memories/floating-card-1"));

        Response missing = orchestrator.find_code("nonexistent widget");
        ASSERT(missing.type == ResponseType::Snippet);
        ASSERT(!missing.code.has_value());
        ASSERT(starts_with(missing.message, "No code snippets found"));

        Response campaign = orchestrator.query("viral campaign for the launch");
        ASSERT(campaign.type == ResponseType::Campaign);
        ASSERT(campaign.message == "🎯 Orchestrating Viral Campaign Strategy");

        Response trends = orchestrator.analyze_trends("hashtags");
        ASSERT(trends.type == ResponseType::Orchestration);
        ASSERT(!trends.workflow.empty());
    }

    // --- plugin dispatch and general fallback ---
    {
        auto registry = create_plugin_registry();
        Orchestrator orchestrator(*registry);
        ASSERT(&orchestrator.plugin_registry() == registry.get());

        Response debug = orchestrator.query("debug the login crash");
        ASSERT(debug.message == "🔧 Development Debugging Workflow");
        ASSERT(debug.agents.size() == 3);

        Response retro = orchestrator.query("run our sprint retrospective");
        ASSERT(retro.message == "🔄 Sprint Retrospective Workflow");

        Response general = orchestrator.query("organize my week");
        ASSERT(general.type == ResponseType::Orchestration);
        ASSERT(general.message == "🧠 L0 analyzing: \"organize my week\"");
    }

    // --- a throwing plugin is contained ---
    {
        PluginRegistry registry;
        Plugin broken;
        broken.metadata = {"broken", "1.0.0", "Always throws", "", {}};
        broken.triggers = {"explode"};
        broken.handler = [](const PluginContext&) -> Response {
            throw std::runtime_error("disk on fire");
        };
        registry.register_plugin(broken);

        Orchestrator orchestrator(registry);
        Response r = orchestrator.query("explode please");
        ASSERT(r.type == ResponseType::Orchestration);
        ASSERT(r.message.find("disk on fire") != std::string::npos);
    }

    // --- concurrent queries ---
    {
        auto registry = create_plugin_registry();
        Orchestrator orchestrator(*registry);
        std::vector<std::future<Response>> futures;
        for (int i = 0; i < 8; ++i) {
            futures.push_back(orchestrator.query_async(i % 2 ? "deploy build" : "kpi dashboard"));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            Response r = futures[i].get();
            ASSERT(r.message == (i % 2 ? "🚀 Deployment Pipeline Workflow" : "📊 KPI & Metrics Analysis Workflow"));
        }
    }

    // --- memory search keywords ---
    {
        Response one = responders::search_memories("oauth");
        ASSERT(one.message == "Found 1 relevant memories:");
        ASSERT(one.related == std::vector<std::string>{"OAuth Integration Best Practices"});

        // A doubled space yields an empty keyword, which matches the whole catalog
        Response all = responders::search_memories("oauth  zzz");
        ASSERT(all.message == "Found 3 relevant memories:");
        ASSERT(all.related.size() == 3);

        Response none = responders::search_memories("zzz");
        ASSERT(none.message.find("No memories found") == 0);
    }

    // --- memory previews keep UTF-8 intact ---
    {
        std::string text = std::string(49, 'a') + "\xC3\xA9 tail";
        ASSERT(utils::utf8_prefix(text, 50) == std::string(49, 'a'));
        ASSERT(utils::utf8_prefix(text, 51) == std::string(49, 'a') + "\xC3\xA9");
        ASSERT(utils::truncate(text, 50) == std::string(49, 'a') + "...");
        ASSERT(utils::truncate("short", 50) == "short");
        ASSERT(utils::utf8_boundary("\xE2\x82\xAC", 2) == 0);

        bool dumped = true;
        try {
            nlohmann::json j = {{"preview", utils::truncate(text, 50)}};
            (void)j.dump();
        } catch (const nlohmann::json::exception&) {
            dumped = false;
        }
        ASSERT(dumped);
    }

    // --- presentation boundary ---
    {
        Response r = responders::orchestrate_general("x");
        auto j = r.to_json();
        ASSERT(j["type"] == "orchestration");
        ASSERT(!j.contains("code"));
        ASSERT(!j.contains("dashboardUrl"));
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All orchestrator tests passed.\n";
    return 0;
}
