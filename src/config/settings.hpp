/**
 * asdf rc file settings
 *
 * Line-oriented `key = value` parser for ~/.asdfrc. Recognised keys map to
 * typed fields; every other key is a hook command.
 */
#pragma once
#include <istream>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "config/errors.hpp"
#include "core/env.hpp"

namespace asdf::config {

constexpr int DEFAULT_PLUGIN_CHECK_MINUTES = 60;

// Either "never" or "every N minutes"
struct DurationOrNever {
    bool never = false;
    int every = DEFAULT_PLUGIN_CHECK_MINUTES;

    bool operator==(const DurationOrNever& other) const {
        return never == other.never && every == other.every;
    }
    bool operator!=(const DurationOrNever& other) const { return !(*this == other); }

    std::string to_string() const;
};

struct Settings {
    bool loaded = false;  // rc file was opened and parsed
    bool legacy_version_file = false;
    bool always_keep_download = false;
    bool disable_plugin_short_name_repository = false;
    std::string concurrency;
    DurationOrNever plugin_repository_last_check_duration;
    std::map<std::string, std::string> hooks;

    nlohmann::json to_json() const;
};

struct SettingsResult {
    bool success = false;
    Settings settings;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
};

// Number of processing units this process may use, at least 1.
unsigned processing_units();

// All fields at their defaults, loaded=false.
Settings default_settings();

/**
 * Parse rc content from an open stream and apply environment overrides.
 * Never fails: malformed lines are skipped, bad values fall back to defaults.
 */
Settings parse_settings(std::istream& in, const core::Environment& env);

/**
 * Load the rc file at `path`.
 * On open failure the result carries defaults (with environment overrides),
 * loaded=false and FILE_NOT_FOUND or FILE_OPEN_ERROR.
 */
SettingsResult load_settings(const std::string& path, const core::Environment& env);

// Apply ASDF_CONCURRENCY on top of parsed/default settings.
void apply_env_overrides(Settings& settings, const core::Environment& env);

} // namespace asdf::config
