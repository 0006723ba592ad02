#include "core/adapter/IconResolver.hpp"
#include "core/Constants.hpp"
#include <QFileInfo>
#include <QUrl>

namespace cctl {

IconResolver::IconResolver(const QString& assetDir, DesktopEntryFactory factory)
    : assetDir_(assetDir)
    , factory_(std::move(factory))
{
}

void IconResolver::setLightIcon(bool light)
{
    if (light == lightIcon_)
        return;

    lightIcon_ = light;
    entryCached_ = false;
    entry_.clear();
}

QString IconResolver::artUrl(const QString& thumbnail, const QString& castIcon) const
{
    if (!thumbnail.isEmpty())
        return thumbnail;
    if (!castIcon.isEmpty())
        return castIcon;
    return lightIcon_ ? lightIconUrl() : defaultIconUrl();
}

QString IconResolver::defaultIconUrl() const
{
    return QUrl::fromLocalFile(assetDir_ + "/" + ICON_FILE).toString();
}

QString IconResolver::lightIconUrl() const
{
    return QUrl::fromLocalFile(assetDir_ + "/" + LIGHT_ICON_FILE).toString();
}

QString IconResolver::iconPath() const
{
    return assetDir_ + "/" + (lightIcon_ ? LIGHT_ICON_FILE : ICON_FILE);
}

QString IconResolver::desktopEntry()
{
    if (entryCached_)
        return entry_;

    QString path = factory_ ? factory_(lightIcon_) : QString();
    entry_ = path.isEmpty() ? QString(NO_DESKTOP_FILE) : stripSuffix(path);
    entryCached_ = true;
    return entry_;
}

QString IconResolver::defaultAssetDir()
{
    return QStringLiteral(CASTCTL_ASSETS_DIR);
}

QString IconResolver::stripSuffix(const QString& path)
{
    QFileInfo info(path);
    if (info.suffix().isEmpty())
        return path;
    return path.left(path.size() - info.suffix().size() - 1);
}

} // namespace cctl
