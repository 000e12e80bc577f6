/**
 * asdf-config
 *
 * Prints the resolved asdf paths, rc file settings and hook commands.
 */
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "config/config.hpp"
#include "core/logger.hpp"

using json = nlohmann::json;
using namespace asdf;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_STATUS = 1;
constexpr int EXIT_USAGE = 2;

struct Options {
    bool verbose = false;
    bool as_json = false;
    bool help = false;
    std::string file;
    std::string command;
    std::vector<std::string> args;
};

void print_usage(std::ostream& out) {
    out << "Usage: asdf-config [options] <command> [args]\n"
        << "\n"
        << "Options:\n"
        << "  -v, --verbose         Log debug output to stderr\n"
        << "  -j, --json            Print JSON instead of key = value text\n"
        << "  -f, --file P          Read settings from P (settings command only)\n"
        << "  -h, --help            Show this help\n"
        << "\n"
        << "Commands:\n"
        << "  paths                 Show home, data directory and rc file paths\n"
        << "  settings              Show all settings from the rc file (or --file P)\n"
        << "  get <setting>         Show a single setting\n"
        << "  hook <name>           Show the command for a hook\n";
}

bool parse_args(int argc, char** argv, Options& opts) {
    static const struct option longopts[] = {{"verbose", no_argument, nullptr, 'v'},
                                             {"json", no_argument, nullptr, 'j'},
                                             {"file", required_argument, nullptr, 'f'},
                                             {"help", no_argument, nullptr, 'h'},
                                             {nullptr, 0, nullptr, 0}};

    int c;
    while ((c = getopt_long(argc, argv, "vjf:h", longopts, nullptr)) != -1) {
        switch (c) {
        case 'v':
            opts.verbose = true;
            break;
        case 'j':
            opts.as_json = true;
            break;
        case 'f':
            opts.file = optarg;
            break;
        case 'h':
            opts.help = true;
            break;
        default:
            return false;
        }
    }

    if (optind < argc) {
        opts.command = argv[optind++];
    }
    for (; optind < argc; ++optind) {
        opts.args.push_back(argv[optind]);
    }
    return opts.help || !opts.command.empty();
}

void print_object(const json& j, bool as_json) {
    if (as_json) {
        std::cout << j.dump(2) << "\n";
        return;
    }
    for (auto& [key, value] : j.items()) {
        if (value.is_string()) {
            std::cout << key << " = " << value.get<std::string>() << "\n";
        } else {
            std::cout << key << " = " << value.dump() << "\n";
        }
    }
}

int cmd_paths(const config::Config& cfg, const Options& opts) {
    print_object(cfg.to_json(), opts.as_json);
    return EXIT_OK;
}

int cmd_settings(const config::Config& cfg, const Options& opts) {
    if (!opts.args.empty()) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    const std::string path = opts.file.empty() ? cfg.config_file : opts.file;

    auto result = config::load_settings(path, cfg.environment());
    if (!result.success && result.kind != config::ErrorKind::FILE_NOT_FOUND) {
        spdlog::error("{}", result.error);
        return EXIT_FAILURE_STATUS;
    }
    if (!result.success) {
        spdlog::info("No settings file at {}, showing defaults", path);
    }

    json j = result.settings.to_json();
    if (opts.as_json) {
        std::cout << j.dump(2) << "\n";
        return EXIT_OK;
    }

    auto hooks = j["hooks"];
    j.erase("hooks");
    j[std::string("plugin_repository_last_check_duration")] =
        result.settings.plugin_repository_last_check_duration.to_string();
    print_object(j, false);
    for (auto& [name, command] : hooks.items()) {
        std::cout << name << " = " << command.get<std::string>() << "\n";
    }
    return EXIT_OK;
}

int cmd_get(const config::Config& cfg, const Options& opts) {
    if (opts.args.size() != 1) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    const std::string& key = opts.args[0];
    json value;
    bool success = false;
    std::string error;

    auto take = [&](const auto& result, json rendered) {
        success = result.success;
        error = result.error;
        value = std::move(rendered);
    };

    if (key == "legacy_version_file") {
        auto r = cfg.legacy_version_file();
        take(r, r.value);
    } else if (key == "always_keep_download") {
        auto r = cfg.always_keep_download();
        take(r, r.value);
    } else if (key == "disable_plugin_short_name_repository") {
        auto r = cfg.disable_plugin_short_name_repository();
        take(r, r.value);
    } else if (key == "plugin_repository_last_check_duration") {
        auto r = cfg.plugin_repository_last_check_duration();
        take(r, opts.as_json ? json{{"never", r.value.never}, {"every", r.value.every}}
                             : json(r.value.to_string()));
    } else if (key == "concurrency") {
        auto r = cfg.concurrency();
        take(r, r.value);
    } else {
        spdlog::error("Unknown setting '{}'", key);
        return EXIT_USAGE;
    }

    if (!success) {
        spdlog::error("{}", error);
        return EXIT_FAILURE_STATUS;
    }

    if (opts.as_json) {
        std::cout << json{{key, value}}.dump(2) << "\n";
    } else if (value.is_boolean()) {
        std::cout << (value.get<bool>() ? "yes" : "no") << "\n";
    } else if (value.is_string()) {
        std::cout << value.get<std::string>() << "\n";
    } else {
        std::cout << value.dump() << "\n";
    }
    return EXIT_OK;
}

int cmd_hook(const config::Config& cfg, const Options& opts) {
    if (opts.args.size() != 1) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    auto result = cfg.get_hook(opts.args[0]);
    if (!result.success) {
        spdlog::error("{}", result.error);
        return EXIT_FAILURE_STATUS;
    }
    if (result.value.empty()) {
        spdlog::debug("Hook {} is not defined", opts.args[0]);
        return EXIT_FAILURE_STATUS;
    }

    if (opts.as_json) {
        std::cout << json{{"name", opts.args[0]}, {"command", result.value}}.dump(2) << "\n";
    } else {
        std::cout << result.value << "\n";
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char** argv) {
    core::init_logger();

    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    if (opts.help) {
        print_usage(std::cout);
        return EXIT_OK;
    }
    if (!opts.file.empty() && opts.command != "settings") {
        spdlog::error("--file only applies to the settings command");
        return EXIT_USAGE;
    }

    auto env = core::process_environment();
    auto level_name = core::get_env(*env, "ASDF_LOG_LEVEL");
    if (!level_name.empty()) {
        if (auto level = core::parse_log_level(level_name)) {
            core::set_log_level(*level);
        } else {
            spdlog::warn("Unknown ASDF_LOG_LEVEL '{}'", level_name);
        }
    }
    if (opts.verbose) {
        core::set_log_level(spdlog::level::debug);
    }

    auto loaded = config::load_config(env);
    if (!loaded.success) {
        spdlog::error("{} ({})", loaded.error, config::error_kind_to_string(loaded.kind));
        return EXIT_FAILURE_STATUS;
    }

    if (opts.command == "paths")    return cmd_paths(loaded.config, opts);
    if (opts.command == "settings") return cmd_settings(loaded.config, opts);
    if (opts.command == "get")      return cmd_get(loaded.config, opts);
    if (opts.command == "hook")     return cmd_hook(loaded.config, opts);

    spdlog::error("Unknown command '{}'", opts.command);
    print_usage(std::cerr);
    return EXIT_USAGE;
}
