#include "core/DesktopEntry.hpp"
#include "core/Constants.hpp"
#include "core/adapter/IconResolver.hpp"

#include <QDir>
#include <QSaveFile>
#include <QStandardPaths>
#include <boost/log/trivial.hpp>

namespace cctl {

namespace DesktopEntry {

QString create(bool lightIcon, const QString& directory, const QString& assetDir)
{
    QString dir = directory;
    if (dir.isEmpty())
        dir = QStandardPaths::writableLocation(QStandardPaths::ApplicationsLocation);

    if (dir.isEmpty() || !QDir().mkpath(dir)) {
        BOOST_LOG_TRIVIAL(warning) << "[DesktopEntry] No writable directory for " << FILE_NAME;
        return QString();
    }

    IconResolver icons(assetDir.isEmpty() ? IconResolver::defaultAssetDir() : assetDir);
    icons.setLightIcon(lightIcon);

    const QString path = dir + "/" + FILE_NAME;
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        BOOST_LOG_TRIVIAL(warning) << "[DesktopEntry] Cannot write " << path.toStdString();
        return QString();
    }

    QByteArray content;
    content += "[Desktop Entry]\n";
    content += "Version=1.0\n";
    content += "Type=Application\n";
    content += "Name=" + QByteArray(DEFAULT_NAME) + "\n";
    content += "Comment=Control casting devices through MPRIS\n";
    content += "Icon=" + icons.iconPath().toUtf8() + "\n";
    content += "Exec=cast-control connect\n";
    content += "Terminal=false\n";
    content += "NoDisplay=true\n";

    file.write(content);
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(warning) << "[DesktopEntry] Cannot write " << path.toStdString();
        return QString();
    }
    return path;
}

} // namespace DesktopEntry

} // namespace cctl
