/**
 * Config loading tests.
 * Asserts:
 * - Defaults when the file is missing or unparsable.
 * - JSON values override defaults; environment overrides both.
 * - Secrets are redacted on request; save/load round-trips the rest.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include "plugins/builtin_plugins.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace vortex_l0;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::string write_temp(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

static void clear_env() {
    unsetenv("LANONASIS_API_URL");
    unsetenv("LANONASIS_API_KEY");
    unsetenv("LANONASIS_USER_ID");
    unsetenv("L0_LOG_LEVEL");
}

int main() {
    Logger::initialize(LogLevel::ERROR);
    clear_env();

    // --- log levels ---
    ASSERT(parse_log_level("debug") == LogLevel::DEBUG);
    ASSERT(parse_log_level("WARN") == LogLevel::WARN);
    ASSERT(parse_log_level("error") == LogLevel::ERROR);
    ASSERT(parse_log_level("chatty") == LogLevel::INFO);

    // --- missing file ---
    {
        Config cfg = Config::load_from_file("/nonexistent/vortex_l0/config.json");
        ASSERT(cfg.logging.level == "info");
        ASSERT(cfg.memory_service.api_url == "https://api.lanonasis.com");
        ASSERT(cfg.memory_service.timeout_ms == 30000);
        ASSERT(cfg.plugins.include_builtins);
        ASSERT(!cfg.plugins.include_memory_services);
    }

    // --- unparsable file ---
    {
        std::string path = write_temp("vortex_l0_bad.json", "{ not json");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.memory_service.search_limit == 5);
        std::filesystem::remove(path);
    }

    // --- values from file ---
    {
        std::string path = write_temp("vortex_l0_good.json", R"({
            "logging": {"level": "debug"},
            "memory_service": {
                "api_url": "https://memory.example.com/",
                "user_id": "u-1",
                "timeout_ms": 2500,
                "search_threshold": 0.5,
                "search_limit": "ten"
            },
            "plugins": {"include_memory_services": true, "disabled": ["analytics"]}
        })");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.logging.level == "debug");
        ASSERT(cfg.memory_service.api_url == "https://memory.example.com");   // trailing slash stripped
        ASSERT(cfg.memory_service.user_id == "u-1");
        ASSERT(cfg.memory_service.timeout_ms == 2500);
        ASSERT(cfg.memory_service.search_threshold == 0.5);
        ASSERT(cfg.memory_service.search_limit == 5);                         // wrong type ignored
        ASSERT(cfg.plugins.include_memory_services);
        ASSERT(cfg.plugins.disabled == std::vector<std::string>{"analytics"});

        RegistryOptions options = RegistryOptions::from_config(cfg);
        ASSERT(options.include_memory_services);
        ASSERT(options.memory_service.timeout_ms == 2500);
        ASSERT(options.disabled == std::vector<std::string>{"analytics"});
        std::filesystem::remove(path);
    }

    // --- non-positive timeout falls back to the default ---
    {
        Config cfg;
        cfg.apply_json(nlohmann::json::parse(R"({"memory_service": {"timeout_ms": 0}})"));
        ASSERT(cfg.memory_service.timeout_ms == 30000);
    }

    // --- environment overrides the file ---
    {
        std::string path = write_temp("vortex_l0_env.json",
            R"({"memory_service": {"api_url": "https://from-file.example", "auth_token": "file-token"}})");
        setenv("LANONASIS_API_URL", "https://from-env.example/", 1);
        setenv("LANONASIS_API_KEY", "env-token", 1);
        setenv("L0_LOG_LEVEL", "warn", 1);

        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.memory_service.api_url == "https://from-env.example");
        ASSERT(cfg.memory_service.auth_token == "env-token");
        ASSERT(cfg.logging.level == "warn");

        Config env_only = Config::from_environment();
        ASSERT(env_only.memory_service.auth_token == "env-token");

        clear_env();
        std::filesystem::remove(path);
    }

    // --- serialization ---
    {
        Config cfg;
        cfg.memory_service.auth_token = "super-secret";
        cfg.memory_service.user_id = "u-9";
        cfg.plugins.disabled = {"collaboration"};

        auto redacted = cfg.to_json(true);
        ASSERT(redacted["memory_service"]["auth_token"] == "***");
        ASSERT(cfg.to_json()["memory_service"]["auth_token"] == "super-secret");

        std::string path = (std::filesystem::temp_directory_path() / "vortex_l0_saved.json").string();
        cfg.save_to_file(path);
        Config loaded = Config::load_from_file(path);
        ASSERT(loaded.memory_service.auth_token == "super-secret");
        ASSERT(loaded.memory_service.user_id == "u-9");
        ASSERT(loaded.plugins.disabled == std::vector<std::string>{"collaboration"});
        std::filesystem::remove(path);
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
