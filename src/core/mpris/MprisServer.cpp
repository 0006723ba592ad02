#include "core/mpris/MprisServer.hpp"
#include "core/mpris/MprisAdaptors.hpp"
#include "core/Constants.hpp"

#include <QDBusConnectionInterface>
#include <QDBusMessage>
#include <QDBusMetaType>
#include <QDBusObjectPath>
#include <boost/log/trivial.hpp>

namespace cctl {

MprisServer::MprisServer(const QString& name, IMprisAdapter* adapter, QObject* parent)
    : MprisServer(name, adapter, QDBusConnection::sessionBus(), parent)
{
}

MprisServer::MprisServer(const QString& name, IMprisAdapter* adapter, const QDBusConnection& bus,
                         QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , adapter_(adapter)
    , serviceName_(serviceNameFor(name))
{
    qDBusRegisterMetaType<QList<QVariantMap>>();

    new MprisRootAdaptor(adapter_, this);
    new MprisPlayerAdaptor(adapter_, this);
    new MprisTrackListAdaptor(adapter_, this);
}

MprisServer::~MprisServer()
{
    unpublish();
}

bool MprisServer::publish()
{
    if (published_)
        return true;

    if (!bus_.isConnected()) {
        BOOST_LOG_TRIVIAL(warning) << "[Mpris] session bus unavailable: "
                                   << bus_.lastError().message().toStdString();
        return false;
    }

    if (!bus_.registerObject(QString::fromLatin1(OBJECT_PATH), this,
                             QDBusConnection::ExportAdaptors)) {
        BOOST_LOG_TRIVIAL(warning) << "[Mpris] failed to register " << OBJECT_PATH;
        return false;
    }

    if (!bus_.registerService(serviceName_)) {
        BOOST_LOG_TRIVIAL(warning) << "[Mpris] failed to claim " << serviceName_.toStdString()
                                   << ": " << bus_.lastError().message().toStdString();
        bus_.unregisterObject(QString::fromLatin1(OBJECT_PATH));
        return false;
    }

    published_ = true;
    BOOST_LOG_TRIVIAL(info) << "[Mpris] published " << serviceName_.toStdString();
    return true;
}

void MprisServer::unpublish()
{
    if (!published_)
        return;

    bus_.unregisterService(serviceName_);
    bus_.unregisterObject(QString::fromLatin1(OBJECT_PATH));
    published_ = false;
    BOOST_LOG_TRIVIAL(info) << "[Mpris] withdrew " << serviceName_.toStdString();
}

void MprisServer::emitChanges()
{
    if (!published_)
        return;

    QDBusMessage signal = QDBusMessage::createSignal(
        QString::fromLatin1(OBJECT_PATH),
        QStringLiteral("org.freedesktop.DBus.Properties"),
        QStringLiteral("PropertiesChanged"));
    signal << QString::fromLatin1(PLAYER_INTERFACE)
           << playerProperties(adapter_)
           << QStringList();

    if (!bus_.send(signal))
        BOOST_LOG_TRIVIAL(warning) << "[Mpris] PropertiesChanged not sent";
}

QString MprisServer::serviceNameFor(const QString& name)
{
    QString unique = QString::fromLatin1(APP_NAME) + QLatin1Char('_') + dbusSafeName(name);
    return QString::fromLatin1(SERVICE_PREFIX) + unique.left(255 - int(qstrlen(SERVICE_PREFIX)));
}

QVariantMap MprisServer::metadataToVariantMap(const TrackMetadata& metadata)
{
    QVariantMap map;
    QString trackId = metadata.trackId.isEmpty() ? QString::fromLatin1(NO_TRACK) : metadata.trackId;
    map.insert(QStringLiteral("mpris:trackid"), QVariant::fromValue(QDBusObjectPath(trackId)));

    if (metadata.length != NO_DURATION)
        map.insert(QStringLiteral("mpris:length"), QVariant::fromValue(qlonglong(metadata.length)));
    if (!metadata.artUrl.isEmpty())
        map.insert(QStringLiteral("mpris:artUrl"), metadata.artUrl);
    if (!metadata.url.isEmpty())
        map.insert(QStringLiteral("xesam:url"), metadata.url);

    map.insert(QStringLiteral("xesam:title"), metadata.title);
    map.insert(QStringLiteral("xesam:artist"), metadata.artists);
    map.insert(QStringLiteral("xesam:album"), metadata.album);
    map.insert(QStringLiteral("xesam:albumArtist"), metadata.albumArtists);
    map.insert(QStringLiteral("xesam:discNumber"), metadata.discNumber);
    if (metadata.trackNumber != 0)
        map.insert(QStringLiteral("xesam:trackNumber"), metadata.trackNumber);
    map.insert(QStringLiteral("xesam:comment"), metadata.comments);
    return map;
}

QVariantMap MprisServer::playerProperties(IMprisAdapter* adapter)
{
    QVariantMap props;
    props.insert(QStringLiteral("PlaybackStatus"), adapter->playbackStatus());
    props.insert(QStringLiteral("LoopStatus"), adapter->loopStatus());
    props.insert(QStringLiteral("Rate"), adapter->rate());
    props.insert(QStringLiteral("Shuffle"), adapter->shuffle());
    props.insert(QStringLiteral("Metadata"), metadataToVariantMap(adapter->metadata()));
    props.insert(QStringLiteral("Volume"), adapter->volume().toDouble());
    props.insert(QStringLiteral("CanGoNext"), adapter->canGoNext());
    props.insert(QStringLiteral("CanGoPrevious"), adapter->canGoPrevious());
    props.insert(QStringLiteral("CanPlay"), adapter->canPlay());
    props.insert(QStringLiteral("CanPause"), adapter->canPause());
    props.insert(QStringLiteral("CanSeek"), adapter->canSeek());
    props.insert(QStringLiteral("CanControl"), adapter->canControl());
    return props;
}

} // namespace cctl
