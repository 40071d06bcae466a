#include "orchestrator.h"
#include "intent_classifier.h"
#include "responders.h"
#include "logger.h"
#include "utils.h"

using json = nlohmann::json;

namespace vortex_l0 {

class Orchestrator::Impl {
public:
    explicit Impl(PluginRegistry& registry) : registry_(registry) {}

    Response query(const std::string& query, const json& options) const {
        try {
            return dispatch(query, options);
        } catch (const std::exception& e) {
            Logger::error("[Router] Query failed: " + std::string(e.what()));
            Response r = Response::make("L0 could not process the request: " + std::string(e.what()),
                                        ResponseType::Orchestration);
            r.related = {"Try rephrasing the request"};
            return r;
        }
    }

    PluginRegistry& registry() const { return registry_; }

private:
    Response dispatch(const std::string& query, const json& options) const {
        const std::string lower = utils::normalize_copy(query);
        const BuiltinIntent intent = intent_classifier::classify(lower);

        LOG_ROUTER("\"" + utils::truncate(query, 60) + "\" -> " + builtin_intent_name(intent));

        switch (intent) {
            case BuiltinIntent::Help:     return responders::get_help(query);
            case BuiltinIntent::Code:     return responders::find_code(query);
            case BuiltinIntent::Memory:   return responders::search_memories(query);
            case BuiltinIntent::Campaign: return responders::orchestrate_campaign(query);
            case BuiltinIntent::Content:  return responders::orchestrate_content(query);
            case BuiltinIntent::Trend:    return responders::analyze_trends(query);
            case BuiltinIntent::None:     break;
        }

        if (auto response = registry_.execute(query, options)) {
            return std::move(*response);
        }

        LOG_ROUTER("No plugin matched; using general orchestration");
        return responders::orchestrate_general(query);
    }

    PluginRegistry& registry_;
};

Orchestrator::Orchestrator(PluginRegistry& registry)
    : pimpl_(std::make_unique<Impl>(registry)) {}
Orchestrator::~Orchestrator() = default;

Response Orchestrator::query(const std::string& query, const json& options) const {
    return pimpl_->query(query, options);
}

std::future<Response> Orchestrator::query_async(const std::string& query, const json& options) const {
    const Impl* impl = pimpl_.get();
    return std::async(std::launch::async, [impl, query, options]() {
        return impl->query(query, options);
    });
}

Response Orchestrator::get_help(const std::string& query) const {
    return responders::get_help(query);
}

Response Orchestrator::find_code(const std::string& description) const {
    return responders::find_code(description);
}

Response Orchestrator::search_memories(const std::string& query) const {
    return responders::search_memories(query);
}

Response Orchestrator::orchestrate_campaign(const std::string& request) const {
    return responders::orchestrate_campaign(request);
}

Response Orchestrator::orchestrate_content(const std::string& request) const {
    return responders::orchestrate_content(request);
}

Response Orchestrator::analyze_trends(const std::string& request) const {
    return responders::analyze_trends(request);
}

Response Orchestrator::orchestrate_general(const std::string& request) const {
    return responders::orchestrate_general(request);
}

PluginRegistry& Orchestrator::plugin_registry() const {
    return pimpl_->registry();
}

} // namespace vortex_l0
