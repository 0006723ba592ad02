#include <ocast/Discovery/ServiceBrowser.hpp>
#include <QDBusArgument>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QDBusObjectPath>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QDebug>

namespace {
const QString kAvahiService = QStringLiteral("org.freedesktop.Avahi");
const QString kServerInterface = QStringLiteral("org.freedesktop.Avahi.Server");
const QString kBrowserInterface = QStringLiteral("org.freedesktop.Avahi.ServiceBrowser");
const QString kCastServiceType = QStringLiteral("_googlecast._tcp");

constexpr int kIfUnspec = -1;
constexpr int kProtoUnspec = -1;
constexpr int kProtoInet = 0;
}

namespace ocast {

ServiceBrowser::ServiceBrowser(QObject* parent)
    : QObject(parent)
{
}

ServiceBrowser::~ServiceBrowser()
{
    stop();
}

bool ServiceBrowser::start()
{
    if (browsing_) return true;

    auto bus = QDBusConnection::systemBus();
    if (!bus.isConnected()) {
        qWarning() << "[ServiceBrowser] Cannot connect to system D-Bus, discovery disabled";
        return false;
    }

    // Subscribe before creating the browser; ItemNew fires right away
    bus.connect(
        kAvahiService,
        QString(),  // any path
        kBrowserInterface,
        QStringLiteral("ItemNew"),
        this,
        SLOT(onItemNew(int,int,QString,QString,QString,uint)));
    bus.connect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("ItemRemove"),
                this, SLOT(onItemRemove(int,int,QString,QString,QString,uint)));

    QDBusMessage msg = QDBusMessage::createMethodCall(
        kAvahiService, QStringLiteral("/"), kServerInterface,
        QStringLiteral("ServiceBrowserNew"));
    msg << kIfUnspec << kProtoUnspec << kCastServiceType << QStringLiteral("local") << 0u;

    QDBusMessage reply = bus.call(msg, QDBus::Block, 2000);
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        qWarning() << "[ServiceBrowser] avahi-daemon unavailable:" << reply.errorMessage();
        bus.disconnect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("ItemNew"),
                       this, SLOT(onItemNew(int,int,QString,QString,QString,uint)));
        bus.disconnect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("ItemRemove"),
                       this, SLOT(onItemRemove(int,int,QString,QString,QString,uint)));
        return false;
    }

    browserPath_ = reply.arguments().at(0).value<QDBusObjectPath>().path();
    browsing_ = true;
    qDebug() << "[ServiceBrowser] browsing" << kCastServiceType << "at" << browserPath_;
    return true;
}

void ServiceBrowser::stop()
{
    // A device that left or moved must be resolved afresh on the next browse
    devices_.clear();
    serviceKeys_.clear();

    if (!browsing_) return;

    auto bus = QDBusConnection::systemBus();
    bus.disconnect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("ItemNew"),
                   this, SLOT(onItemNew(int,int,QString,QString,QString,uint)));
    bus.disconnect(kAvahiService, QString(), kBrowserInterface, QStringLiteral("ItemRemove"),
                   this, SLOT(onItemRemove(int,int,QString,QString,QString,uint)));

    if (!browserPath_.isEmpty()) {
        QDBusMessage free = QDBusMessage::createMethodCall(
            kAvahiService, browserPath_, kBrowserInterface, QStringLiteral("Free"));
        bus.send(free);
    }

    browserPath_.clear();
    browsing_ = false;
}

CastInfo ServiceBrowser::parseTxt(const QList<QByteArray>& txt)
{
    CastInfo info;
    for (const QByteArray& entry : txt) {
        int eq = entry.indexOf('=');
        if (eq <= 0) continue;

        const QByteArray key = entry.left(eq);
        const QString value = QString::fromUtf8(entry.mid(eq + 1));
        if (key == "id") {
            info.uuid = normalizeUuid(value);
        } else if (key == "fn") {
            info.friendlyName = value;
        } else if (key == "md") {
            info.modelName = value;
        }
    }
    return info;
}

QString ServiceBrowser::normalizeUuid(const QString& id)
{
    QString hex = id.toLower();
    hex.remove(QLatin1Char('-'));
    if (hex.size() != 32)
        return id.toLower();

    return hex.left(8) + QLatin1Char('-') + hex.mid(8, 4) + QLatin1Char('-')
         + hex.mid(12, 4) + QLatin1Char('-') + hex.mid(16, 4) + QLatin1Char('-')
         + hex.mid(20);
}

bool ServiceBrowser::addResolved(const QString& serviceName, const CastInfo& info)
{
    const QString key = info.uuid.isEmpty() ? serviceName : info.uuid;
    auto it = devices_.constFind(key);
    const bool moved = it != devices_.constEnd()
        && (it->host != info.host || it->port != info.port);
    if (it != devices_.constEnd() && !moved)
        return false;

    devices_.insert(key, info);
    serviceKeys_.insert(serviceName, key);
    qInfo() << "[ServiceBrowser]" << (moved ? "moved" : "resolved")
            << info.friendlyName << info.host << info.port;
    emit deviceFound(info);
    return true;
}

void ServiceBrowser::removeService(const QString& serviceName)
{
    const QString key = serviceKeys_.take(serviceName);
    if (key.isEmpty()) return;
    qDebug() << "[ServiceBrowser] removed" << serviceName;
    devices_.remove(key);
}

void ServiceBrowser::onItemNew(int interface, int protocol, const QString& name,
                               const QString& type, const QString& domain, uint flags)
{
    Q_UNUSED(flags)
    if (type != kCastServiceType) return;

    qDebug() << "[ServiceBrowser] found" << name << "on interface" << interface;
    resolve(interface, protocol, name, type, domain);
}

void ServiceBrowser::onItemRemove(int interface, int protocol, const QString& name,
                                  const QString& type, const QString& domain, uint flags)
{
    Q_UNUSED(interface)
    Q_UNUSED(protocol)
    Q_UNUSED(domain)
    Q_UNUSED(flags)
    if (type != kCastServiceType) return;
    removeService(name);
}

void ServiceBrowser::resolve(int interface, int protocol, const QString& name,
                             const QString& type, const QString& domain)
{
    QDBusMessage msg = QDBusMessage::createMethodCall(
        kAvahiService, QStringLiteral("/"), kServerInterface,
        QStringLiteral("ResolveService"));
    msg << interface << protocol << name << type << domain << kProtoInet << 0u;

    auto* watcher = new QDBusPendingCallWatcher(
        QDBusConnection::systemBus().asyncCall(msg), this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [this, name](QDBusPendingCallWatcher* call) {
        call->deleteLater();

        QDBusMessage reply = call->reply();
        if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().size() < 10) {
            qDebug() << "[ServiceBrowser] resolve failed for" << name << reply.errorMessage();
            return;
        }

        // (i iface, i proto, s name, s type, s domain, s host, i aproto,
        //  s address, q port, aay txt, u flags)
        const QList<QVariant> args = reply.arguments();
        QList<QByteArray> txt;
        args.at(9).value<QDBusArgument>() >> txt;

        CastInfo info = parseTxt(txt);
        info.host = args.at(7).toString();
        info.port = static_cast<quint16>(args.at(8).toUInt());
        if (info.friendlyName.isEmpty())
            info.friendlyName = name;

        addResolved(name, info);
    });
}

} // namespace ocast
