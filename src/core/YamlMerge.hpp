#pragma once

#include <yaml-cpp/yaml.h>

namespace cctl {

// Overlays a user config onto the built-in defaults. Nested maps merge key
// by key; any other node in the overlay replaces the default outright.
inline YAML::Node mergeYaml(const YAML::Node& defaults, const YAML::Node& user)
{
    const bool userEmpty = !user.IsDefined() || user.IsNull();
    const bool defaultsEmpty = !defaults.IsDefined() || defaults.IsNull();

    if (userEmpty)
        return YAML::Clone(defaults);
    if (defaultsEmpty || !defaults.IsMap() || !user.IsMap())
        return YAML::Clone(user);

    YAML::Node merged = YAML::Clone(defaults);
    for (const auto& entry : user) {
        const std::string key = entry.first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], entry.second)
                                  : YAML::Clone(entry.second);
    }
    return merged;
}

} // namespace cctl
