#include "response.h"

using json = nlohmann::json;

namespace vortex_l0 {

const char* response_type_name(ResponseType type) {
    switch (type) {
        case ResponseType::Snippet:       return "snippet";
        case ResponseType::Memory:        return "memory";
        case ResponseType::Context:       return "context";
        case ResponseType::Help:          return "help";
        case ResponseType::Orchestration: return "orchestration";
        case ResponseType::Campaign:      return "campaign";
    }
    return "orchestration";
}

std::optional<ResponseType> parse_response_type(const std::string& name) {
    if (name == "snippet") return ResponseType::Snippet;
    if (name == "memory") return ResponseType::Memory;
    if (name == "context") return ResponseType::Context;
    if (name == "help") return ResponseType::Help;
    if (name == "orchestration") return ResponseType::Orchestration;
    if (name == "campaign") return ResponseType::Campaign;
    return std::nullopt;
}

json Response::to_json() const {
    json j;
    j["message"] = message;
    j["type"] = response_type_name(type);
    if (code) j["code"] = *code;
    if (has_data()) j["data"] = data;
    if (!related.empty()) j["related"] = related;
    if (clipboard) j["clipboard"] = *clipboard;
    if (dashboard_url) j["dashboardUrl"] = *dashboard_url;
    if (!workflow.empty()) j["workflow"] = workflow;
    if (!agents.empty()) j["agents"] = agents;
    return j;
}

} // namespace vortex_l0
