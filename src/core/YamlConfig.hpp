#pragma once

#include <QString>
#include <yaml-cpp/yaml.h>

namespace cctl {

class YamlConfig {
public:
    YamlConfig();

    /// Merge `filePath` over the defaults. On a parse error the defaults are
    /// kept and false is returned.
    bool load(const QString& filePath);

    /// $XDG_CONFIG_HOME/cast_control/config.yaml
    static QString defaultPath();

    // Discovery (seconds)
    double retryWait() const;
    /// Negative when retrying is disabled.
    double wait() const;

    // Icons
    bool lightIcon() const;

    // Logging
    QString logLevel() const;

    // Playback
    int durationResolution() const;

    // Session
    QString dataDir() const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace cctl
