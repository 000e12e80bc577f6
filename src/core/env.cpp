#include "core/env.hpp"
#include <cstdlib>

namespace asdf::core {

std::optional<std::string> ProcessEnvironment::lookup(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

MapEnvironment::MapEnvironment(std::unordered_map<std::string, std::string> vars)
    : vars_(std::move(vars)) {}

std::optional<std::string> MapEnvironment::lookup(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MapEnvironment::set(const std::string& name, const std::string& value) {
    vars_[name] = value;
}

void MapEnvironment::unset(const std::string& name) {
    vars_.erase(name);
}

std::shared_ptr<const Environment> process_environment() {
    static const auto env = std::make_shared<const ProcessEnvironment>();
    return env;
}

std::string get_env(const Environment& env, const std::string& key) {
    return env.lookup(key).value_or(std::string());
}

std::string get_env_or(const Environment& env, const std::string& key, const std::string& fallback) {
    auto value = get_env(env, key);
    return value.empty() ? fallback : value;
}

} // namespace asdf::core
