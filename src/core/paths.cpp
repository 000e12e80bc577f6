#include "core/paths.hpp"
#include <pwd.h>
#include <unistd.h>

namespace asdf::core::paths {

std::optional<std::string> passwd_home_dir() {
    struct passwd* pw = getpwuid(getuid());
    if (pw != nullptr && pw->pw_dir != nullptr && pw->pw_dir[0] != '\0') {
        return std::string(pw->pw_dir);
    }
    return std::nullopt;
}

std::optional<std::string> home_dir(const Environment& env, const HomeLookup& fallback) {
    auto home = get_env(env, "HOME");
    if (!home.empty()) {
        return home;
    }
    if (!fallback) {
        return std::nullopt;
    }

    auto looked_up = fallback();
    if (looked_up && looked_up->empty()) {
        return std::nullopt;
    }
    return looked_up;
}

std::string expand_tilde(const std::string& path, const std::string& home) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    return home + path.substr(1);
}

} // namespace asdf::core::paths
