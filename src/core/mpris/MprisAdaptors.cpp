#include "core/mpris/MprisAdaptors.hpp"
#include "core/mpris/MprisServer.hpp"

#include <boost/log/trivial.hpp>

namespace cctl {

// --- org.mpris.MediaPlayer2 ---

MprisRootAdaptor::MprisRootAdaptor(IMprisAdapter* adapter, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , adapter_(adapter)
{
}

bool MprisRootAdaptor::canQuit() const { return adapter_->canQuit(); }
QString MprisRootAdaptor::identity() const { return adapter_->name(); }
QString MprisRootAdaptor::desktopEntry() const { return adapter_->desktopEntry(); }
QStringList MprisRootAdaptor::supportedUriSchemes() const { return adapter_->supportedUriSchemes(); }
QStringList MprisRootAdaptor::supportedMimeTypes() const { return adapter_->supportedMimeTypes(); }

void MprisRootAdaptor::Raise()
{
    BOOST_LOG_TRIVIAL(debug) << "[Mpris] Raise ignored, no window";
}

void MprisRootAdaptor::Quit()
{
    adapter_->quit();
}

// --- org.mpris.MediaPlayer2.Player ---

MprisPlayerAdaptor::MprisPlayerAdaptor(IMprisAdapter* adapter, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , adapter_(adapter)
{
}

QString MprisPlayerAdaptor::playbackStatus() const { return adapter_->playbackStatus(); }
QString MprisPlayerAdaptor::loopStatus() const { return adapter_->loopStatus(); }
void MprisPlayerAdaptor::setLoopStatus(const QString& status) { adapter_->setLoopStatus(status); }
double MprisPlayerAdaptor::rate() const { return adapter_->rate(); }
void MprisPlayerAdaptor::setRate(double rate) { adapter_->setRate(rate); }
bool MprisPlayerAdaptor::shuffle() const { return adapter_->shuffle(); }
void MprisPlayerAdaptor::setShuffle(bool shuffle) { adapter_->setShuffle(shuffle); }

QVariantMap MprisPlayerAdaptor::metadata() const
{
    return MprisServer::metadataToVariantMap(adapter_->metadata());
}

double MprisPlayerAdaptor::volume() const
{
    return adapter_->volume().toDouble();
}

void MprisPlayerAdaptor::setVolume(double volume) { adapter_->setVolume(volume); }
qlonglong MprisPlayerAdaptor::position() const { return adapter_->position(); }
double MprisPlayerAdaptor::minimumRate() const { return adapter_->minimumRate(); }
double MprisPlayerAdaptor::maximumRate() const { return adapter_->maximumRate(); }
bool MprisPlayerAdaptor::canGoNext() const { return adapter_->canGoNext(); }
bool MprisPlayerAdaptor::canGoPrevious() const { return adapter_->canGoPrevious(); }
bool MprisPlayerAdaptor::canPlay() const { return adapter_->canPlay(); }
bool MprisPlayerAdaptor::canPause() const { return adapter_->canPause(); }
bool MprisPlayerAdaptor::canSeek() const { return adapter_->canSeek(); }
bool MprisPlayerAdaptor::canControl() const { return adapter_->canControl(); }

void MprisPlayerAdaptor::Next() { adapter_->next(); }
void MprisPlayerAdaptor::Previous() { adapter_->previous(); }
void MprisPlayerAdaptor::Pause() { adapter_->pause(); }
void MprisPlayerAdaptor::Stop() { adapter_->stop(); }
void MprisPlayerAdaptor::Play() { adapter_->play(); }

void MprisPlayerAdaptor::PlayPause()
{
    if (adapter_->playbackStatus() == QLatin1String("Playing"))
        adapter_->pause();
    else
        adapter_->resume();
}

void MprisPlayerAdaptor::Seek(qlonglong offset)
{
    if (!adapter_->canSeek())
        return;

    qlonglong target = adapter_->position() + offset;
    if (target < BEGINNING)
        target = BEGINNING;

    adapter_->seek(target);
    emit Seeked(target);
}

void MprisPlayerAdaptor::SetPosition(const QDBusObjectPath& trackId, qlonglong position)
{
    if (!adapter_->canSeek() || position < BEGINNING)
        return;

    const TrackMetadata current = adapter_->metadata();
    if (trackId.path() != current.trackId) {
        BOOST_LOG_TRIVIAL(debug) << "[Mpris] SetPosition for stale track "
                                 << trackId.path().toStdString();
        return;
    }
    if (current.length != NO_DURATION && position > current.length)
        return;

    adapter_->seek(position);
    emit Seeked(position);
}

void MprisPlayerAdaptor::OpenUri(const QString& uri)
{
    adapter_->openUri(uri);
}

// --- org.mpris.MediaPlayer2.TrackList ---

MprisTrackListAdaptor::MprisTrackListAdaptor(IMprisAdapter* adapter, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , adapter_(adapter)
{
}

QList<QDBusObjectPath> MprisTrackListAdaptor::tracks() const
{
    QList<QDBusObjectPath> paths;
    for (const QString& id : adapter_->tracks())
        paths.append(QDBusObjectPath(id));
    return paths;
}

bool MprisTrackListAdaptor::canEditTracks() const
{
    return adapter_->canEditTracks();
}

QList<QVariantMap> MprisTrackListAdaptor::GetTracksMetadata(const QList<QDBusObjectPath>& trackIds)
{
    QList<QVariantMap> result;
    const TrackMetadata current = adapter_->metadata();
    for (const QDBusObjectPath& id : trackIds) {
        if (id.path() == current.trackId)
            result.append(MprisServer::metadataToVariantMap(current));
    }
    return result;
}

void MprisTrackListAdaptor::AddTrack(const QString& uri, const QDBusObjectPath& afterTrack,
                                     bool setAsCurrent)
{
    adapter_->addTrack(uri, afterTrack.path(), setAsCurrent);
}

void MprisTrackListAdaptor::RemoveTrack(const QDBusObjectPath& trackId)
{
    Q_UNUSED(trackId);
}

void MprisTrackListAdaptor::GoTo(const QDBusObjectPath& trackId)
{
    Q_UNUSED(trackId);
}

} // namespace cctl
