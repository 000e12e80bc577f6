#include "config/settings.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sched.h>
#include <thread>

namespace asdf::config {

namespace {

const char* const KEY_LEGACY_VERSION_FILE = "legacy_version_file";
const char* const KEY_ALWAYS_KEEP_DOWNLOAD = "always_keep_download";
const char* const KEY_LAST_CHECK_DURATION = "plugin_repository_last_check_duration";
const char* const KEY_DISABLE_SHORT_NAME_REPO = "disable_plugin_short_name_repository";
const char* const KEY_CONCURRENCY = "concurrency";

const char* const ENV_CONCURRENCY = "ASDF_CONCURRENCY";

const char UTF8_BOM[] = "\xEF\xBB\xBF";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::string();
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool parse_yes(const std::string& value) {
    return value == "yes";
}

DurationOrNever parse_duration(const std::string& value) {
    DurationOrNever duration;
    if (value == "never") {
        duration.never = true;
        duration.every = 0;
        return duration;
    }

    if (!all_digits(value)) {
        return duration;
    }

    int minutes = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), minutes);
    if (ec != std::errc() || ptr != value.data() + value.size() || minutes <= 0) {
        return duration;
    }
    duration.every = minutes;
    return duration;
}

void apply_line(Settings& settings, const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') return;

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) return;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    if (key.empty()) return;

    if (key == KEY_LEGACY_VERSION_FILE) {
        settings.legacy_version_file = parse_yes(value);
    } else if (key == KEY_ALWAYS_KEEP_DOWNLOAD) {
        settings.always_keep_download = parse_yes(value);
    } else if (key == KEY_DISABLE_SHORT_NAME_REPO) {
        settings.disable_plugin_short_name_repository = parse_yes(value);
    } else if (key == KEY_LAST_CHECK_DURATION) {
        settings.plugin_repository_last_check_duration = parse_duration(value);
    } else if (key == KEY_CONCURRENCY) {
        settings.concurrency = value;
    } else {
        settings.hooks[key] = value;
    }
}

} // namespace

std::string DurationOrNever::to_string() const {
    if (never) return "never";
    return std::to_string(every);
}

nlohmann::json Settings::to_json() const {
    nlohmann::json j;
    j["loaded"] = loaded;
    j[KEY_LEGACY_VERSION_FILE] = legacy_version_file;
    j[KEY_ALWAYS_KEEP_DOWNLOAD] = always_keep_download;
    j[KEY_DISABLE_SHORT_NAME_REPO] = disable_plugin_short_name_repository;
    j[KEY_CONCURRENCY] = concurrency;
    j[KEY_LAST_CHECK_DURATION] = {
        {"never", plugin_repository_last_check_duration.never},
        {"every", plugin_repository_last_check_duration.every}
    };
    j["hooks"] = hooks;
    return j;
}

unsigned processing_units() {
    // CPUs this process may run on, not every online CPU.
    cpu_set_t set;
    CPU_ZERO(&set);
    if (sched_getaffinity(0, sizeof(set), &set) == 0) {
        int count = CPU_COUNT(&set);
        if (count > 0) {
            return static_cast<unsigned>(count);
        }
    }

    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

Settings default_settings() {
    Settings settings;
    settings.concurrency = std::to_string(processing_units());
    return settings;
}

void apply_env_overrides(Settings& settings, const core::Environment& env) {
    auto value = core::get_env(env, ENV_CONCURRENCY);
    if (value.empty()) {
        return;
    }

    if (value == "auto") {
        settings.concurrency = std::to_string(processing_units());
    } else if (all_digits(value)) {
        settings.concurrency = value;
    } else {
        spdlog::warn("Ignoring {}={}: expected a non-negative integer or 'auto'", ENV_CONCURRENCY, value);
        return;
    }
    spdlog::debug("{} override: concurrency={}", ENV_CONCURRENCY, settings.concurrency);
}

Settings parse_settings(std::istream& in, const core::Environment& env) {
    Settings settings = default_settings();
    settings.loaded = true;

    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        if (first && line.compare(0, sizeof(UTF8_BOM) - 1, UTF8_BOM) == 0) {
            line.erase(0, sizeof(UTF8_BOM) - 1);
        }
        first = false;
        apply_line(settings, line);
    }

    apply_env_overrides(settings, env);
    return settings;
}

SettingsResult load_settings(const std::string& path, const core::Environment& env) {
    SettingsResult result;

    auto fail = [&](ErrorKind kind, const std::string& message) {
        result.settings = default_settings();
        apply_env_overrides(result.settings, env);
        result.kind = kind;
        result.error = message;
        spdlog::debug("Using default settings: {}", message);
        return result;
    };

    if (path.empty()) {
        return fail(ErrorKind::FILE_NOT_FOUND, "no settings file path given");
    }

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return fail(ErrorKind::FILE_NOT_FOUND, "open " + path + ": no such file or directory");
    }
    if (ec) {
        return fail(ErrorKind::FILE_OPEN_ERROR, "open " + path + ": " + ec.message());
    }
    if (std::filesystem::is_directory(status)) {
        return fail(ErrorKind::FILE_OPEN_ERROR, "open " + path + ": is a directory");
    }

    std::ifstream file(path);
    if (!file) {
        return fail(ErrorKind::FILE_OPEN_ERROR, "open " + path + ": " + std::strerror(errno));
    }

    result.success = true;
    result.settings = parse_settings(file, env);
    spdlog::debug("Loaded settings from {} ({} hooks)", path, result.settings.hooks.size());
    return result;
}

} // namespace asdf::config
