/**
 * asdf runtime configuration
 *
 * Resolves the home, data directory and rc file paths once, then reads the
 * rc file afresh on every accessor call so edits and environment changes are
 * always picked up.
 */
#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "config/errors.hpp"
#include "config/settings.hpp"
#include "core/env.hpp"
#include "core/paths.hpp"

namespace asdf::config {

constexpr const char* DEFAULT_DATA_DIR_NAME = ".asdf";
constexpr const char* DEFAULT_CONFIG_FILE_NAME = ".asdfrc";
constexpr const char* DEFAULT_TOOL_VERSIONS_FILENAME = ".tool-versions";

class Config {
public:
    // Empty paths; every accessor returns defaults.
    Config();
    explicit Config(std::shared_ptr<const core::Environment> env);

    std::string home;
    std::string data_dir;
    std::string config_file;
    std::string default_tool_versions_filename = DEFAULT_TOOL_VERSIONS_FILENAME;

    ValueResult<bool> legacy_version_file() const;
    ValueResult<bool> always_keep_download() const;
    ValueResult<DurationOrNever> plugin_repository_last_check_duration() const;
    ValueResult<bool> disable_plugin_short_name_repository() const;

    // Effective concurrency; a file value of "auto" resolves to the CPU count.
    ValueResult<std::string> concurrency() const;

    // Hook command for `name`, empty if not defined.
    ValueResult<std::string> get_hook(const std::string& name) const;

    // Freshly loaded settings; missing rc file yields defaults without error.
    ValueResult<Settings> settings() const;

    const core::Environment& environment() const { return *env_; }

    nlohmann::json to_json() const;

private:
    std::shared_ptr<const core::Environment> env_;

    template <typename T, typename Fn>
    ValueResult<T> with_settings(Fn&& select) const;
};

struct ConfigResult {
    bool success = false;
    Config config;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
};

// Resolve paths from `env` (ASDF_DATA_DIR, ASDF_CONFIG_FILE, ...).
// `home_lookup` is consulted when $HOME is unset or empty.
ConfigResult load_config(std::shared_ptr<const core::Environment> env = core::process_environment(),
                         const core::paths::HomeLookup& home_lookup = core::paths::passwd_home_dir);

} // namespace asdf::config
