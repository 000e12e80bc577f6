#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace asdf::core {

// Read-only view of environment variables.
class Environment {
public:
    virtual ~Environment() = default;

    // Value of `name`, nullopt if unset.
    virtual std::optional<std::string> lookup(const std::string& name) const = 0;
};

// Backed by the real process environment.
class ProcessEnvironment : public Environment {
public:
    std::optional<std::string> lookup(const std::string& name) const override;
};

// In-memory environment, used to simulate overrides without touching the process.
class MapEnvironment : public Environment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::unordered_map<std::string, std::string> vars);

    std::optional<std::string> lookup(const std::string& name) const override;

    void set(const std::string& name, const std::string& value);
    void unset(const std::string& name);

private:
    std::unordered_map<std::string, std::string> vars_;
};

// Shared handle to the process environment.
std::shared_ptr<const Environment> process_environment();

// Get environment variable, empty string if missing.
std::string get_env(const Environment& env, const std::string& key);

// Get environment variable with default fallback (also used when set but empty).
std::string get_env_or(const Environment& env, const std::string& key, const std::string& fallback);

} // namespace asdf::core
