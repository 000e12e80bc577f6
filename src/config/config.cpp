#include "config/config.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace asdf::config {

namespace {
const char* const ENV_DATA_DIR = "ASDF_DATA_DIR";
const char* const ENV_CONFIG_FILE = "ASDF_CONFIG_FILE";
const char* const ENV_TOOL_VERSIONS_FILENAME = "ASDF_DEFAULT_TOOL_VERSIONS_FILENAME";
} // namespace

Config::Config() : Config(core::process_environment()) {}

Config::Config(std::shared_ptr<const core::Environment> env)
    : env_(env ? std::move(env) : core::process_environment()) {}

template <typename T, typename Fn>
ValueResult<T> Config::with_settings(Fn&& select) const {
    ValueResult<T> result;
    auto loaded = load_settings(config_file, *env_);

    // A missing rc file is the same as an empty one at this level.
    if (!loaded.success && loaded.kind != ErrorKind::FILE_NOT_FOUND) {
        spdlog::warn("Failed to read settings: {}", loaded.error);
        result.value = select(loaded.settings);
        result.kind = loaded.kind;
        result.error = loaded.error;
        return result;
    }

    result.success = true;
    result.value = select(loaded.settings);
    return result;
}

ValueResult<bool> Config::legacy_version_file() const {
    return with_settings<bool>([](const Settings& s) { return s.legacy_version_file; });
}

ValueResult<bool> Config::always_keep_download() const {
    return with_settings<bool>([](const Settings& s) { return s.always_keep_download; });
}

ValueResult<DurationOrNever> Config::plugin_repository_last_check_duration() const {
    return with_settings<DurationOrNever>(
        [](const Settings& s) { return s.plugin_repository_last_check_duration; });
}

ValueResult<bool> Config::disable_plugin_short_name_repository() const {
    return with_settings<bool>(
        [](const Settings& s) { return s.disable_plugin_short_name_repository; });
}

ValueResult<std::string> Config::concurrency() const {
    return with_settings<std::string>([](const Settings& s) {
        if (s.concurrency == "auto") {
            return std::to_string(processing_units());
        }
        return s.concurrency;
    });
}

ValueResult<std::string> Config::get_hook(const std::string& name) const {
    return with_settings<std::string>([&name](const Settings& s) {
        auto it = s.hooks.find(name);
        return it != s.hooks.end() ? it->second : std::string();
    });
}

ValueResult<Settings> Config::settings() const {
    return with_settings<Settings>([](const Settings& s) { return s; });
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["home"] = home;
    j["data_dir"] = data_dir;
    j["config_file"] = config_file;
    j["default_tool_versions_filename"] = default_tool_versions_filename;
    return j;
}

ConfigResult load_config(std::shared_ptr<const core::Environment> env,
                         const core::paths::HomeLookup& home_lookup) {
    ConfigResult result;
    result.config = Config(env);
    const core::Environment& vars = result.config.environment();

    auto home = core::paths::home_dir(vars, home_lookup);
    if (!home) {
        result.kind = ErrorKind::HOME_DIRECTORY_UNAVAILABLE;
        result.error = "unable to determine home directory: $HOME is not set and no passwd entry found";
        return result;
    }

    Config& config = result.config;
    config.home = *home;
    const std::filesystem::path home_path(config.home);

    auto data_dir = core::get_env(vars, ENV_DATA_DIR);
    config.data_dir = data_dir.empty()
        ? (home_path / DEFAULT_DATA_DIR_NAME).string()
        : core::paths::expand_tilde(data_dir, config.home);

    config.config_file = core::get_env_or(vars, ENV_CONFIG_FILE,
                                          (home_path / DEFAULT_CONFIG_FILE_NAME).string());

    config.default_tool_versions_filename =
        core::get_env_or(vars, ENV_TOOL_VERSIONS_FILENAME, DEFAULT_TOOL_VERSIONS_FILENAME);

    spdlog::debug("Config resolved (home={}, data_dir={}, config_file={})",
                  config.home, config.data_dir, config.config_file);

    result.success = true;
    return result;
}

} // namespace asdf::config
