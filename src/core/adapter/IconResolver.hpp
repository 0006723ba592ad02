#pragma once

#include <QString>
#include <functional>

namespace cctl {

class IconResolver {
public:
    /// Writes a desktop entry for the given icon flavour, returns its path or "".
    using DesktopEntryFactory = std::function<QString(bool lightIcon)>;

    explicit IconResolver(const QString& assetDir, DesktopEntryFactory factory = {});

    bool lightIcon() const { return lightIcon_; }
    void setLightIcon(bool light);

    /// First non-empty of thumbnail, cast icon, bundled icon.
    QString artUrl(const QString& thumbnail, const QString& castIcon) const;

    QString defaultIconUrl() const;
    QString lightIconUrl() const;
    QString iconPath() const;

    /// Desktop entry path without suffix, created on first use.
    QString desktopEntry();

    static QString stripSuffix(const QString& path);

    /// Installed icon directory, set at build time.
    static QString defaultAssetDir();

private:
    QString assetDir_;
    DesktopEntryFactory factory_;
    bool lightIcon_ = false;
    bool entryCached_ = false;
    QString entry_;
};

} // namespace cctl
