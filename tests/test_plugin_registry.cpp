/**
 * Plugin registry and trigger matcher tests.
 * Asserts:
 * - Registration validates descriptors and refuses duplicate names.
 * - Disabled plugins never match.
 * - Ranking is sum of matched trigger lengths plus priority, ties in registration order.
 * - execute() returns nullopt with no match and turns handler exceptions into a failure response.
 *
 * Run from build dir: ./test_plugin_registry
 */

#include "plugin_registry.h"
#include "trigger_matcher.h"
#include "plugins/builtin_plugins.h"
#include "logger.h"
#include <iostream>
#include <stdexcept>
#include <string>

using namespace vortex_l0;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static Plugin make_plugin(const std::string& name, std::vector<std::string> triggers, int priority = 0) {
    Plugin p;
    p.metadata.name = name;
    p.metadata.version = "1.0.0";
    p.metadata.description = name + " test plugin";
    p.triggers = std::move(triggers);
    p.priority = priority;
    p.handler = [name](const PluginContext& ctx) {
        return Response::make(name + ":" + ctx.query, ResponseType::Orchestration);
    };
    return p;
}

static std::vector<std::string> names(const std::vector<std::shared_ptr<const Plugin>>& plugins) {
    std::vector<std::string> out;
    for (const auto& p : plugins) out.push_back(p->metadata.name);
    return out;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- trigger_matcher ---
    ASSERT(trigger_matcher::score("please run the tests", {"test"}) == 4);
    ASSERT(trigger_matcher::score("TESTIMONY", {"test"}) == 4);   // plain substring, no word boundary
    ASSERT(trigger_matcher::score("deploy and test", {"deploy", "test", "lint"}) == 10);
    ASSERT(trigger_matcher::score("anything", {""}) == 0);
    ASSERT(trigger_matcher::score("nothing here", {"deploy"}) == 0);
    {
        Plugin negative = make_plugin("neg", {"ab"}, -2);
        auto s = trigger_matcher::match_score("ab", negative);
        ASSERT(s.has_value() && *s == 0);   // matched with net zero is still a match
        ASSERT(!trigger_matcher::match_score("zz", negative).has_value());
    }

    // --- register / has / duplicates ---
    {
        PluginRegistry registry;
        ASSERT(registry.count() == 0);
        ASSERT(registry.register_plugin(make_plugin("echo", {"echo"})));
        ASSERT(registry.has("echo"));
        ASSERT(registry.count() == 1);

        auto first = registry.list_detailed().front();
        registry.set_enabled("echo", false);
        ASSERT(!registry.register_plugin(make_plugin("echo", {"other"})));
        auto after = registry.list_detailed().front();
        ASSERT(registry.count() == 1);
        ASSERT(after.enabled == false);
        ASSERT(after.registered_at == first.registered_at);
        ASSERT(after.triggers == std::vector<std::string>{"echo"});
    }

    // --- validation ---
    {
        PluginRegistry registry;
        Plugin no_name = make_plugin("", {"x"});
        Plugin no_version = make_plugin("v", {"x"});
        no_version.metadata.version.clear();
        Plugin no_description = make_plugin("d", {"x"});
        no_description.metadata.description.clear();
        Plugin no_triggers = make_plugin("t", {});
        Plugin no_handler = make_plugin("h", {"x"});
        no_handler.handler = nullptr;

        ASSERT(!registry.register_plugin(no_name));
        ASSERT(!registry.register_plugin(no_version));
        ASSERT(!registry.register_plugin(no_description));
        ASSERT(!registry.register_plugin(no_triggers));
        ASSERT(!registry.register_plugin(no_handler));
        ASSERT(registry.count() == 0);
    }

    // --- unregister ---
    {
        PluginRegistry registry;
        registry.register_plugin(make_plugin("a", {"alpha"}));
        ASSERT(!registry.unregister_plugin("missing"));
        ASSERT(registry.count() == 1);
        ASSERT(registry.unregister_plugin("a"));
        ASSERT(registry.count() == 0);
        ASSERT(!registry.has("a"));
        ASSERT(registry.get("a") == nullptr);
        ASSERT(!registry.is_enabled("a").has_value());
    }

    // --- enable / disable ---
    {
        PluginRegistry registry;
        registry.register_plugin(make_plugin("a", {"alpha"}));
        registry.register_plugin(make_plugin("b", {"alpha"}));
        ASSERT(registry.find_matching("alpha").size() == 2);

        ASSERT(registry.set_enabled("a", false));
        ASSERT(registry.is_enabled("a") == std::optional<bool>(false));
        ASSERT(names(registry.find_matching("alpha")) == std::vector<std::string>{"b"});
        ASSERT(registry.list().size() == 1);
        ASSERT(registry.list_detailed().size() == 2);
        ASSERT(registry.enabled_count() == 1);
        ASSERT(registry.get("a") != nullptr);

        ASSERT(registry.set_enabled("a", true));
        ASSERT(names(registry.find_matching("alpha")) == (std::vector<std::string>{"a", "b"}));
        ASSERT(!registry.set_enabled("missing", true));
    }

    // --- ranking ---
    {
        // high: short trigger, high priority (2 + 10 = 12)
        // low:  long trigger, no priority (len("performance report") = 18)
        PluginRegistry registry;
        registry.register_plugin(make_plugin("high", {"kp"}, 10));
        registry.register_plugin(make_plugin("low", {"performance report"}, 0));

        ASSERT(names(registry.find_matching("kp performance report"))
               == (std::vector<std::string>{"low", "high"}));

        registry.unregister_plugin("high");
        registry.register_plugin(make_plugin("high", {"kp"}, 20));   // 22 > 18
        ASSERT(names(registry.find_matching("kp performance report"))
               == (std::vector<std::string>{"high", "low"}));
    }

    // --- ties keep registration order; results are deterministic ---
    {
        PluginRegistry registry;
        registry.register_plugin(make_plugin("first", {"sync"}));
        registry.register_plugin(make_plugin("second", {"sync"}));
        registry.register_plugin(make_plugin("third", {"sync"}));
        auto once = names(registry.find_matching("sync now"));
        auto twice = names(registry.find_matching("sync now"));
        ASSERT(once == (std::vector<std::string>{"first", "second", "third"}));
        ASSERT(once == twice);
    }

    // --- execute ---
    {
        PluginRegistry registry;
        ASSERT(!registry.execute("anything").has_value());

        Plugin echo;
        echo.metadata = {"echo", "1.0.0", "Echo", "", {}};
        echo.triggers = {"echo"};
        echo.handler = [](const PluginContext& ctx) {
            return Response::make("echoed:" + ctx.query, ResponseType::Orchestration);
        };
        ASSERT(registry.register_plugin(echo));

        auto response = registry.execute("please echo this");
        ASSERT(response.has_value());
        ASSERT(response && response->message == "echoed:please echo this");
        ASSERT(!registry.execute("no match here").has_value());
    }

    // --- options reach the handler ---
    {
        PluginRegistry registry;
        Plugin opt = make_plugin("opt", {"opt"});
        opt.handler = [](const PluginContext& ctx) {
            return Response::make(ctx.options.value("mode", "none"), ResponseType::Context);
        };
        registry.register_plugin(opt);
        auto response = registry.execute("opt in", {{"mode", "verbose"}});
        ASSERT(response && response->message == "verbose");
        ASSERT(response && response->type == ResponseType::Context);
    }

    // --- handler exceptions become a failure response ---
    {
        PluginRegistry registry;
        Plugin broken = make_plugin("broken", {"boom"});
        broken.handler = [](const PluginContext&) -> Response {
            throw std::runtime_error("kaput");
        };
        registry.register_plugin(broken);

        auto response = registry.execute("boom");
        ASSERT(response.has_value());
        ASSERT(response && response->type == ResponseType::Orchestration);
        ASSERT(response && response->message == "Plugin \"broken\" failed: kaput");
        ASSERT(response && !response->related.empty());
    }

    // --- to_json ---
    {
        PluginRegistry registry;
        registry.register_plugin(make_plugin("a", {"alpha"}));
        auto j = nlohmann::json::parse(registry.to_json());
        ASSERT(j.is_array() && j.size() == 1);
        ASSERT(j[0]["name"] == "a");
        ASSERT(j[0]["enabled"] == true);
        ASSERT(j[0].contains("registeredAt"));
        ASSERT(!j[0].contains("handler"));
    }

    // --- standard plugin set ---
    {
        auto registry = create_plugin_registry();
        ASSERT(registry->count() == 3);
        ASSERT(registry->has("dev-tools"));
        ASSERT(registry->has("analytics"));
        ASSERT(registry->has("collaboration"));
        ASSERT(!registry->has("memory-services"));

        auto deploy = registry->execute("deploy to staging");
        ASSERT(deploy && deploy->message == "🚀 Deployment Pipeline Workflow");

        auto standup = registry->execute("run the daily standup");
        ASSERT(standup && standup->message == "🤝 Daily Standup Facilitation");
        ASSERT(standup && standup->has_data());

        auto kpi = registry->execute("kpi report");
        ASSERT(kpi && kpi->message == "📊 KPI & Metrics Analysis Workflow");

        RegistryOptions options;
        options.disabled = {"dev-tools", "unknown-plugin"};
        auto partial = create_plugin_registry(options);
        ASSERT(partial->count() == 3);
        ASSERT(partial->is_enabled("dev-tools") == std::optional<bool>(false));
        ASSERT(!partial->execute("deploy to staging").has_value());

        RegistryOptions none;
        none.include_builtins = false;
        ASSERT(create_plugin_registry(none)->count() == 0);
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All plugin registry tests passed.\n";
    return 0;
}
