#include "core/adapter/DeviceAdapter.hpp"
#include "core/adapter/ContentIdentifier.hpp"

#include <QMimeDatabase>
#include <boost/log/trivial.hpp>
#include <cmath>

namespace cctl {

DeviceAdapter::DeviceAdapter(ocast::ICastDevice* device, QObject* parent)
    : DeviceAdapter(device, Options(), parent)
{
}

DeviceAdapter::DeviceAdapter(ocast::ICastDevice* device, const Options& options, QObject* parent)
    : QObject(parent)
    , device_(device)
    , duration_(options.durationResolution)
    , icons_(options.assetDir, options.desktopEntryFactory)
{
    device_->setParent(this);
    icons_.setLightIcon(options.lightIcon);

    youTube_ = new ocast::YouTubeController(device_->mediaController(), this);
    device_->registerHandler(youTube_);
}

// --- Device status ---

ocast::CastStatus DeviceAdapter::castStatus() const
{
    return device_->status();
}

ocast::MediaStatus DeviceAdapter::mediaStatus() const
{
    return mediaController()->status();
}

ocast::IMediaController* DeviceAdapter::mediaController() const
{
    return device_->mediaController();
}

Titles DeviceAdapter::titles() const
{
    return aggregateTitles(mediaController()->title(), mediaStatus(), castStatus().displayName);
}

QString DeviceAdapter::url() const
{
    ocast::MediaStatus status = mediaStatus();
    if (!status.isValid())
        return QString();

    const QString& contentId = status.contentId;
    if (!contentId.isEmpty() && !contentId.contains(QLatin1String("http")) && youTube_->isActive())
        return youTubeWatchUrl(contentId);

    return contentId;
}

QString DeviceAdapter::artUrl() const
{
    return icons_.artUrl(mediaController()->thumbnail(), castStatus().iconUrl);
}

qint64 DeviceAdapter::duration()
{
    return duration_.duration(mediaStatus());
}

void DeviceAdapter::setLightIcon(bool light)
{
    icons_.setLightIcon(light);
}

void DeviceAdapter::onNewStatus()
{
    duration_.onNewStatus(mediaStatus());
}

// --- org.mpris.MediaPlayer2 ---

QString DeviceAdapter::name() const
{
    QString deviceName = device_->name();
    return deviceName.isEmpty() ? QString::fromLatin1(DEFAULT_NAME) : deviceName;
}

QString DeviceAdapter::desktopEntry()
{
    return icons_.desktopEntry();
}

void DeviceAdapter::quit()
{
    BOOST_LOG_TRIVIAL(info) << "[Adapter] quitting app on " << name().toStdString();
    device_->quitApp();
}

QStringList DeviceAdapter::supportedUriSchemes() const
{
    return {QStringLiteral("http"), QStringLiteral("https")};
}

QStringList DeviceAdapter::supportedMimeTypes() const
{
    return {QStringLiteral("audio/mpeg"), QStringLiteral("audio/mp4"), QStringLiteral("audio/aac"),
            QStringLiteral("audio/ogg"), QStringLiteral("audio/webm"), QStringLiteral("audio/flac"),
            QStringLiteral("audio/wav"), QStringLiteral("video/mp4"), QStringLiteral("video/webm"),
            QStringLiteral("image/jpeg"), QStringLiteral("image/png"), QStringLiteral("image/gif"),
            QStringLiteral("image/webp")};
}

// --- org.mpris.MediaPlayer2.Player ---

QString DeviceAdapter::playbackStatus() const
{
    if (mediaController()->isPaused())
        return QStringLiteral("Paused");
    if (mediaController()->isPlaying())
        return QStringLiteral("Playing");
    return QStringLiteral("Stopped");
}

QString DeviceAdapter::loopStatus() const
{
    return QStringLiteral("None");
}

void DeviceAdapter::setLoopStatus(const QString& status)
{
    Q_UNUSED(status);
}

double DeviceAdapter::rate() const
{
    ocast::MediaStatus status = mediaStatus();
    if (!status.isValid() || status.playbackRate == 0.0)
        return DEFAULT_RATE;
    return status.playbackRate;
}

void DeviceAdapter::setRate(double rate)
{
    Q_UNUSED(rate);
}

double DeviceAdapter::minimumRate() const
{
    return DEFAULT_RATE;
}

double DeviceAdapter::maximumRate() const
{
    return DEFAULT_RATE;
}

bool DeviceAdapter::shuffle() const
{
    return false;
}

void DeviceAdapter::setShuffle(bool shuffle)
{
    Q_UNUSED(shuffle);
}

TrackMetadata DeviceAdapter::metadata()
{
    const Titles t = titles();
    const ocast::MediaStatus status = mediaStatus();

    TrackMetadata m;
    m.trackId = trackIdFor(t.title);
    m.length = duration();
    m.artUrl = artUrl();
    m.url = url();
    m.title = t.title;
    if (!t.artist.isEmpty())
        m.artists << t.artist;
    m.album = t.album;
    m.albumArtists = m.artists;
    if (status.isValid()) {
        if (status.discNumber > 0)
            m.discNumber = status.discNumber;
        m.trackNumber = status.trackNumber;
    }
    return m;
}

QVariant DeviceAdapter::volume() const
{
    ocast::CastStatus status = castStatus();
    if (!status.isValid())
        return QVariant();
    return status.volumeLevel;
}

void DeviceAdapter::setVolume(double volume)
{
    QVariant current = this->volume();
    if (!current.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[Adapter] volume unknown, ignoring set to " << volume;
        return;
    }

    const double delta = volume - current.toDouble();
    if (delta > 0.0)
        device_->volumeUp(delta);
    else if (delta < 0.0)
        device_->volumeDown(std::abs(delta));
}

bool DeviceAdapter::isMuted() const
{
    ocast::CastStatus status = castStatus();
    return status.isValid() && status.volumeMuted;
}

void DeviceAdapter::setMuted(bool muted)
{
    device_->setVolumeMuted(muted);
}

qint64 DeviceAdapter::position() const
{
    return DurationTracker::position(mediaStatus());
}

bool DeviceAdapter::canGoNext() const
{
    ocast::MediaStatus status = mediaStatus();
    return status.isValid() && status.supportsQueueNext();
}

bool DeviceAdapter::canGoPrevious() const
{
    ocast::MediaStatus status = mediaStatus();
    return status.isValid() && status.supportsQueuePrev();
}

bool DeviceAdapter::canPlay() const
{
    return playbackStatus() != QLatin1String("Playing");
}

bool DeviceAdapter::canPause() const
{
    ocast::MediaStatus status = mediaStatus();
    return status.isValid() && status.supportsPause();
}

bool DeviceAdapter::canSeek() const
{
    ocast::MediaStatus status = mediaStatus();
    return status.isValid() && status.supportsSeek();
}

bool DeviceAdapter::canControl() const
{
    return true;
}

bool DeviceAdapter::canQuit() const
{
    return true;
}

void DeviceAdapter::next()
{
    mediaController()->queueNext();
}

void DeviceAdapter::previous()
{
    mediaController()->queuePrev();
}

void DeviceAdapter::pause()
{
    mediaController()->pause();
}

void DeviceAdapter::stop()
{
    mediaController()->stop();
}

void DeviceAdapter::play()
{
    mediaController()->play();
}

void DeviceAdapter::resume()
{
    play();
}

void DeviceAdapter::seek(qint64 position)
{
    const double seconds = std::round(static_cast<double>(position) / US_IN_SEC);
    mediaController()->seek(seconds);
}

void DeviceAdapter::openUri(const QString& uri)
{
    QString videoId = youTubeVideoId(uri);
    if (!videoId.isEmpty()) {
        playYouTube(videoId);
        return;
    }

    QMimeDatabase mimes;
    QString mimeType = mimes.mimeTypeForFile(uri, QMimeDatabase::MatchExtension).name();
    BOOST_LOG_TRIVIAL(info) << "[Adapter] opening " << uri.toStdString()
                            << " as " << mimeType.toStdString();
    mediaController()->playMedia(uri, mimeType);
}

// --- org.mpris.MediaPlayer2.TrackList ---

void DeviceAdapter::addTrack(const QString& uri, const QString& afterTrack, bool setAsCurrent)
{
    Q_UNUSED(afterTrack);

    QString videoId = youTubeVideoId(uri);
    if (!videoId.isEmpty()) {
        youTube_->addToQueue(videoId);
        if (setAsCurrent)
            playYouTube(videoId);
        return;
    }

    if (setAsCurrent) {
        openUri(uri);
        return;
    }

    QMimeDatabase mimes;
    mediaController()->queueInsert(uri, mimes.mimeTypeForFile(uri, QMimeDatabase::MatchExtension).name());
}

QStringList DeviceAdapter::tracks()
{
    QString trackId = trackIdFor(titles().title);
    if (trackId == QLatin1String(NO_TRACK))
        return {};
    return {trackId};
}

bool DeviceAdapter::canEditTracks() const
{
    return false;
}

// YouTubeController::playVideo launches the app itself when it is not running
void DeviceAdapter::playYouTube(const QString& videoId)
{
    youTube_->playVideo(videoId);
}

} // namespace cctl
