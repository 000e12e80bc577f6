#pragma once
#include <functional>
#include <optional>
#include <string>
#include "core/env.hpp"

namespace asdf::core::paths {

// Looks up the current user's home directory outside the environment.
using HomeLookup = std::function<std::optional<std::string>()>;

// Home directory from the password database entry of the current user.
std::optional<std::string> passwd_home_dir();

// Home directory of the current user: $HOME, else `fallback` (passwd by default).
// nullopt if neither is available.
std::optional<std::string> home_dir(const Environment& env, const HomeLookup& fallback = passwd_home_dir);

// Replace a leading '~' with `home`; the rest of the path is kept as-is.
std::string expand_tilde(const std::string& path, const std::string& home);

} // namespace asdf::core::paths
