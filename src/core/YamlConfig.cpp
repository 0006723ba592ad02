#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include "core/Constants.hpp"
#include <QStandardPaths>
#include <boost/log/trivial.hpp>

namespace cctl {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["discovery"]["retry_wait"] = DEFAULT_RETRY_WAIT;
    root_["discovery"]["wait"] = DEFAULT_WAIT;

    root_["icons"]["light"] = false;

    root_["logging"]["level"] = DEFAULT_LOG_LEVEL;

    root_["playback"]["duration_resolution"] = DEFAULT_DURATION_RESOLUTION;

    root_["session"]["data_dir"] = "";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    try {
        const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeYaml(defaults, loaded);

        // mergeYaml keeps defaults for nulls; `wait: ~` means no retrying
        if (loaded.IsMap() && loaded["discovery"].IsMap()
            && loaded["discovery"]["wait"].IsDefined() && loaded["discovery"]["wait"].IsNull())
            root_["discovery"]["wait"] = NO_WAIT;
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Cannot read " << filePath.toStdString()
                                   << ": " << e.what() << ", using defaults";
        return false;
    }
    return true;
}

QString YamlConfig::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        + "/" + APP_NAME + "/config.yaml";
}

// --- Discovery ---

double YamlConfig::retryWait() const
{
    return root_["discovery"]["retry_wait"].as<double>(DEFAULT_RETRY_WAIT);
}

double YamlConfig::wait() const
{
    double v = root_["discovery"]["wait"].as<double>(DEFAULT_WAIT);
    return v < 0 ? NO_WAIT : v;
}

// --- Icons ---

bool YamlConfig::lightIcon() const
{
    return root_["icons"]["light"].as<bool>(false);
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>(DEFAULT_LOG_LEVEL));
}

// --- Playback ---

int YamlConfig::durationResolution() const
{
    return root_["playback"]["duration_resolution"].as<int>(DEFAULT_DURATION_RESOLUTION);
}

// --- Session ---

QString YamlConfig::dataDir() const
{
    QString dir = QString::fromStdString(root_["session"]["data_dir"].as<std::string>(""));
    if (dir.isEmpty())
        dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return dir;
}

} // namespace cctl
