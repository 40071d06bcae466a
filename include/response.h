#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace vortex_l0 {

/**
 * @brief Category of a response, used by the presentation layer
 */
enum class ResponseType {
    Snippet,
    Memory,
    Context,
    Help,
    Orchestration,
    Campaign
};

const char* response_type_name(ResponseType type);

/// Inverse of response_type_name(). Unknown names yield std::nullopt.
std::optional<ResponseType> parse_response_type(const std::string& name);

/**
 * @brief Uniform output of every classifier and plugin handler
 *
 * A plain value: built once by a generator or handler and returned up the
 * call chain unchanged. `data` is either null (absent), a JSON object, or a
 * JSON string.
 */
struct Response {
    std::string message;
    ResponseType type = ResponseType::Orchestration;
    std::optional<std::string> code;
    nlohmann::json data;                       ///< null when absent
    std::vector<std::string> related;
    std::optional<bool> clipboard;
    std::optional<std::string> dashboard_url;
    std::vector<std::string> workflow;
    std::vector<std::string> agents;

    bool has_data() const { return !data.is_null(); }

    /// Serialize for the presentation boundary. Absent fields are omitted.
    nlohmann::json to_json() const;

    static Response make(const std::string& message, ResponseType type) {
        Response r;
        r.message = message;
        r.type = type;
        return r;
    }
};

} // namespace vortex_l0
