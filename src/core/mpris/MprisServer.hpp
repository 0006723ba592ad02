#pragma once

#include "core/adapter/TrackMetadata.hpp"
#include "core/mpris/IMprisAdapter.hpp"

#include <QDBusConnection>
#include <QObject>
#include <QVariantMap>

namespace cctl {

/// Publishes one IMprisAdapter as an MPRIS player on the session bus.
class MprisServer : public QObject {
    Q_OBJECT
public:
    static constexpr char OBJECT_PATH[] = "/org/mpris/MediaPlayer2";
    static constexpr char SERVICE_PREFIX[] = "org.mpris.MediaPlayer2.";
    static constexpr char PLAYER_INTERFACE[] = "org.mpris.MediaPlayer2.Player";

    MprisServer(const QString& name, IMprisAdapter* adapter, QObject* parent = nullptr);
    MprisServer(const QString& name, IMprisAdapter* adapter, const QDBusConnection& bus,
                QObject* parent = nullptr);
    ~MprisServer() override;

    QString serviceName() const { return serviceName_; }
    IMprisAdapter* adapter() const { return adapter_; }
    bool isPublished() const { return published_; }

    /// Register the object and claim the service name. False on any D-Bus failure.
    bool publish();
    void unpublish();

    /// Send PropertiesChanged for the Player interface.
    void emitChanges();

    /// org.mpris.MediaPlayer2.cast_control_<safe name>
    static QString serviceNameFor(const QString& name);

    static QVariantMap metadataToVariantMap(const TrackMetadata& metadata);
    static QVariantMap playerProperties(IMprisAdapter* adapter);

private:
    QDBusConnection bus_;
    IMprisAdapter* adapter_;
    QString serviceName_;
    bool published_ = false;
};

} // namespace cctl
