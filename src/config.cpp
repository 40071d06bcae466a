#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace vortex_l0 {

namespace {

void read_string(const json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

void read_int(const json& obj, const char* key, int& out) {
    if (obj.contains(key) && obj[key].is_number_integer()) out = obj[key].get<int>();
}

void read_double(const json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

void read_bool(const json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean()) out = obj[key].get<bool>();
}

bool env_string(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value && *value) {
        out = value;
        return true;
    }
    return false;
}

} // namespace

void Config::apply_json(const json& j) {
    if (!j.is_object()) {
        Logger::warn("Config root is not a JSON object; ignoring");
        return;
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        read_string(l, "level", logging.level);
        read_string(l, "file", logging.file);
    }

    if (j.contains("memory_service") && j["memory_service"].is_object()) {
        const auto& m = j["memory_service"];
        read_string(m, "api_url", memory_service.api_url);
        read_string(m, "auth_token", memory_service.auth_token);
        read_string(m, "user_id", memory_service.user_id);
        read_int(m, "timeout_ms", memory_service.timeout_ms);
        read_int(m, "connect_timeout_ms", memory_service.connect_timeout_ms);
        read_int(m, "search_limit", memory_service.search_limit);
        read_double(m, "search_threshold", memory_service.search_threshold);
        read_double(m, "duplicate_threshold", memory_service.duplicate_threshold);
    }

    if (j.contains("plugins") && j["plugins"].is_object()) {
        const auto& p = j["plugins"];
        read_bool(p, "include_builtins", plugins.include_builtins);
        read_bool(p, "include_memory_services", plugins.include_memory_services);
        if (p.contains("disabled") && p["disabled"].is_array()) {
            plugins.disabled.clear();
            for (const auto& name : p["disabled"]) {
                if (name.is_string()) plugins.disabled.push_back(name.get<std::string>());
            }
        }
    }

    if (memory_service.timeout_ms <= 0) {
        Logger::warn("memory_service.timeout_ms must be positive; using default");
        memory_service.timeout_ms = DEFAULT_MEMORY_TIMEOUT_MS;
    }
    // Strip trailing slashes so endpoint paths can be appended directly
    while (!memory_service.api_url.empty() && memory_service.api_url.back() == '/') {
        memory_service.api_url.pop_back();
    }
}

void Config::apply_environment() {
    env_string("LANONASIS_API_URL", memory_service.api_url);
    env_string("LANONASIS_API_KEY", memory_service.auth_token);
    env_string("LANONASIS_USER_ID", memory_service.user_id);
    env_string("L0_LOG_LEVEL", logging.level);

    while (!memory_service.api_url.empty() && memory_service.api_url.back() == '/') {
        memory_service.api_url.pop_back();
    }
}

Config Config::from_environment() {
    Config cfg;
    cfg.apply_environment();
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        cfg.apply_environment();
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        cfg.apply_environment();
        return cfg;
    }

    cfg.apply_json(j);
    cfg.apply_environment();
    return cfg;
}

json Config::to_json(bool redact_secrets) const {
    json j;
    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    auto& m = j["memory_service"];
    m["api_url"] = memory_service.api_url;
    if (redact_secrets && !memory_service.auth_token.empty()) {
        m["auth_token"] = "***";
    } else {
        m["auth_token"] = memory_service.auth_token;
    }
    m["user_id"] = memory_service.user_id;
    m["timeout_ms"] = memory_service.timeout_ms;
    m["connect_timeout_ms"] = memory_service.connect_timeout_ms;
    m["search_limit"] = memory_service.search_limit;
    m["search_threshold"] = memory_service.search_threshold;
    m["duplicate_threshold"] = memory_service.duplicate_threshold;

    j["plugins"]["include_builtins"] = plugins.include_builtins;
    j["plugins"]["include_memory_services"] = plugins.include_memory_services;
    j["plugins"]["disabled"] = plugins.disabled;
    return j;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << to_json().dump(2) << "\n";
}

} // namespace vortex_l0
