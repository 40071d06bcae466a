#include "config.h"
#include "logger.h"
#include "orchestrator.h"
#include "plugins/builtin_plugins.h"
#include "utils.h"
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace vortex_l0 {

namespace {

struct CliOptions {
    std::string config_path;
    bool json_output = false;
    bool list_plugins = false;
    bool print_config = false;
    bool help = false;
    std::vector<std::string> words;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--config <file>] [--json] [--list-plugins] [--print-config] <query...>\n"
              << "\n"
              << "  --config <file>   JSON config (default: config/config.json next to the binary)\n"
              << "  --json            Print the response as JSON\n"
              << "  --list-plugins    Print registered plugins and exit\n"
              << "  --print-config    Print the effective config (secrets redacted) and exit\n";
}

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file argument" << std::endl;
                return false;
            }
            opts.config_path = argv[++i];
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--list-plugins") {
            opts.list_plugins = true;
        } else if (arg == "--print-config") {
            opts.print_config = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (utils::starts_with(arg, "--")) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            opts.words.push_back(arg);
        }
    }
    return true;
}

/// config/config.json beside the executable's parent directory, or "" if absent.
std::string default_config_path() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len == -1) {
        return "";
    }
    buf[len] = '\0';
    std::string exe_dir(buf);
    size_t pos = exe_dir.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
    std::ifstream test(candidate);
    return test.good() ? candidate : "";
}

void print_text(const Response& r) {
    std::cout << r.message << "\n";
    if (r.code) {
        std::cout << "\n" << *r.code << "\n";
    }
    if (r.has_data()) {
        std::cout << "\n" << (r.data.is_string() ? r.data.get<std::string>() : r.data.dump(2)) << "\n";
    }
    if (!r.workflow.empty()) {
        std::cout << "\nWorkflow:\n";
        for (size_t i = 0; i < r.workflow.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << r.workflow[i] << "\n";
        }
    }
    if (!r.agents.empty()) {
        std::cout << "\nAgents:\n";
        for (const auto& agent : r.agents) {
            std::cout << "  - " << agent << "\n";
        }
    }
    if (!r.related.empty()) {
        std::cout << "\nRelated: " << utils::join(r.related, " | ") << "\n";
    }
    if (r.dashboard_url) {
        std::cout << "Dashboard: " << *r.dashboard_url << "\n";
    }
    std::cout.flush();
}

void print_plugins(const PluginRegistry& registry) {
    for (const auto& info : registry.list_detailed()) {
        std::cout << (info.enabled ? "[on]  " : "[off] ") << info.metadata.name
                  << " v" << info.metadata.version
                  << " (priority " << info.priority << ") - " << info.metadata.description << "\n"
                  << "      triggers: " << utils::join(info.triggers, ", ") << "\n";
    }
    std::cout.flush();
}

int run(const CliOptions& opts, const Config& config) {
    auto registry = create_plugin_registry(RegistryOptions::from_config(config));

    if (opts.list_plugins) {
        if (opts.json_output) {
            std::cout << registry->to_json() << std::endl;
        } else {
            print_plugins(*registry);
        }
        return 0;
    }

    const std::string query = utils::trim_copy(utils::join(opts.words, " "));
    if (query.empty()) {
        print_usage("vortex_l0");
        return 2;
    }

    Orchestrator orchestrator(*registry);
    Response response = orchestrator.query(query);

    if (opts.json_output) {
        std::cout << response.to_json().dump(2) << std::endl;
    } else {
        print_text(response);
    }

    return 0;
}

} // namespace

} // namespace vortex_l0

int main(int argc, char* argv[]) {
    using namespace vortex_l0;

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    std::string config_path = opts.config_path.empty() ? default_config_path() : opts.config_path;
    Config config = config_path.empty() ? Config::from_environment() : Config::load_from_file(config_path);

    LogLevel level = parse_log_level(config.logging.level);
    // Keep stdout parseable in JSON mode
    if (opts.json_output && level < LogLevel::WARN) {
        level = LogLevel::WARN;
    }
    Logger::initialize(level, config.logging.file);

    if (opts.print_config) {
        std::cout << config.to_json(true).dump(2) << std::endl;
        Logger::shutdown();
        return 0;
    }

    int status = 1;
    try {
        status = run(opts, config);
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
    }

    Logger::shutdown();
    return status;
}
