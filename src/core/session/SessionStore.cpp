#include "core/session/SessionStore.hpp"
#include "core/adapter/TrackMetadata.hpp"

#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace cctl {

namespace {

QString fileStem(const QString& identifier)
{
    return dbusSafeName(identifier);
}

std::string optionalString(const YAML::Node& node)
{
    if (!node || node.IsNull())
        return std::string();
    return node.as<std::string>();
}

} // namespace

SessionStore::SessionStore(const QString& dataDir)
    : dataDir_(dataDir)
{
}

QString SessionStore::argsPath(const QString& identifier) const
{
    return dataDir_ + "/" + fileStem(identifier) + "-args.yaml";
}

QString SessionStore::pidPath(const QString& identifier) const
{
    return dataDir_ + "/" + fileStem(identifier) + ".pid";
}

DaemonArgs SessionStore::load(const QString& identifier) const
{
    DaemonArgs args;
    args.valid = false;

    const QString path = argsPath(identifier);
    if (!QFile::exists(path))
        return args;

    try {
        YAML::Node root = YAML::LoadFile(path.toStdString());
        if (!root.IsMap()) {
            BOOST_LOG_TRIVIAL(warning) << "[SessionStore] " << path.toStdString() << " is not a map";
            return args;
        }

        args.name = QString::fromStdString(optionalString(root["name"]));
        args.host = QString::fromStdString(optionalString(root["host"]));
        args.uuid = QString::fromStdString(optionalString(root["uuid"]));

        const YAML::Node wait = root["wait"];
        args.wait = (wait && wait.IsNull()) ? NO_WAIT : wait.as<double>(DEFAULT_WAIT);
        args.retryWait = root["retry_wait"].as<double>(DEFAULT_RETRY_WAIT);
        args.lightIcon = root["light_icon"].as<bool>(false);
        args.logLevel = QString::fromStdString(
            root["log_level"].as<std::string>(DEFAULT_LOG_LEVEL));
        args.valid = true;
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[SessionStore] Cannot read " << path.toStdString()
                                   << ": " << e.what();
        args.valid = false;
    }
    return args;
}

bool SessionStore::save(const DaemonArgs& args) const
{
    if (!QDir().mkpath(dataDir_)) {
        BOOST_LOG_TRIVIAL(error) << "[SessionStore] Cannot create " << dataDir_.toStdString();
        return false;
    }

    YAML::Node root(YAML::NodeType::Map);
    auto putString = [&root](const char* key, const QString& value) {
        if (value.isEmpty())
            root[key] = YAML::Node(YAML::NodeType::Null);
        else
            root[key] = value.toStdString();
    };

    putString("name", args.name);
    putString("host", args.host);
    putString("uuid", args.uuid);
    if (args.wait < 0)
        root["wait"] = YAML::Node(YAML::NodeType::Null);
    else
        root["wait"] = args.wait;
    root["retry_wait"] = args.retryWait;
    root["light_icon"] = args.lightIcon;
    root["log_level"] = args.logLevel.toStdString();

    const QString path = argsPath(args.identifier());
    std::ofstream fout(path.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "[SessionStore] Cannot write " << path.toStdString();
        return false;
    }
    fout << root;
    return true;
}

bool SessionStore::remove(const QString& identifier) const
{
    const QString path = argsPath(identifier);
    if (!QFile::exists(path))
        return true;
    return QFile::remove(path);
}

} // namespace cctl
