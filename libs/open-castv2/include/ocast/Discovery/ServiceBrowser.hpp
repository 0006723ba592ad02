#pragma once

#include <ocast/Device/CastInfo.hpp>

#include <QObject>
#include <QHash>
#include <QList>
#include <QByteArray>

namespace ocast {

/// Browses _googlecast._tcp through avahi-daemon on the system bus.
class ServiceBrowser : public QObject {
    Q_OBJECT
public:
    explicit ServiceBrowser(QObject* parent = nullptr);
    ~ServiceBrowser() override;

    /// Returns false when avahi cannot be reached; nothing will be found.
    bool start();
    /// Frees the avahi browser and forgets every resolved device.
    void stop();
    bool isBrowsing() const { return browsing_; }

    QList<CastInfo> devices() const { return devices_.values(); }

    /// Build a CastInfo from the id/fn/md TXT entries of a resolved service.
    static CastInfo parseTxt(const QList<QByteArray>& txt);
    static QString normalizeUuid(const QString& id);

    /// Record a resolved service. A new device, or a known one whose
    /// address changed, is announced through deviceFound().
    bool addResolved(const QString& serviceName, const CastInfo& info);
    /// Drop the device published under `serviceName`.
    void removeService(const QString& serviceName);

signals:
    void deviceFound(const ocast::CastInfo& info);

private slots:
    void onItemNew(int interface, int protocol, const QString& name,
                   const QString& type, const QString& domain, uint flags);
    void onItemRemove(int interface, int protocol, const QString& name,
                      const QString& type, const QString& domain, uint flags);

private:
    void resolve(int interface, int protocol, const QString& name,
                 const QString& type, const QString& domain);

    QString browserPath_;
    QHash<QString, CastInfo> devices_;
    QHash<QString, QString> serviceKeys_;
    bool browsing_ = false;
};

} // namespace ocast
