#pragma once

#include "core/adapter/DurationTracker.hpp"
#include "core/adapter/IconResolver.hpp"
#include "core/adapter/Titles.hpp"
#include "core/mpris/IMprisAdapter.hpp"

#include <ocast/Controller/YouTubeController.hpp>
#include <ocast/Device/ICastDevice.hpp>

#include <QObject>

namespace cctl {

/// Presents one cast device as an MPRIS player. Owns the device.
class DeviceAdapter : public QObject, public IMprisAdapter {
    Q_OBJECT
public:
    struct Options {
        bool lightIcon = false;
        int durationResolution = DEFAULT_DURATION_RESOLUTION;
        QString assetDir = IconResolver::defaultAssetDir();
        IconResolver::DesktopEntryFactory desktopEntryFactory;
    };

    explicit DeviceAdapter(ocast::ICastDevice* device, QObject* parent = nullptr);
    DeviceAdapter(ocast::ICastDevice* device, const Options& options, QObject* parent = nullptr);

    ocast::ICastDevice* device() const { return device_; }
    ocast::YouTubeController* youTube() const { return youTube_; }

    // --- Device status ---
    ocast::CastStatus castStatus() const;
    ocast::MediaStatus mediaStatus() const;
    ocast::IMediaController* mediaController() const;

    Titles titles() const;
    QString url() const;
    QString artUrl() const;
    qint64 duration();

    void setLightIcon(bool light);
    IconResolver& icons() { return icons_; }
    DurationTracker& durationTracker() { return duration_; }

    /// Call on every device or media status update.
    void onNewStatus();

    // --- IMprisAdapter ---
    QString name() const override;
    QString desktopEntry() override;
    void quit() override;
    QStringList supportedUriSchemes() const override;
    QStringList supportedMimeTypes() const override;

    QString playbackStatus() const override;
    QString loopStatus() const override;
    void setLoopStatus(const QString& status) override;
    double rate() const override;
    void setRate(double rate) override;
    double minimumRate() const override;
    double maximumRate() const override;
    bool shuffle() const override;
    void setShuffle(bool shuffle) override;
    TrackMetadata metadata() override;

    QVariant volume() const override;
    void setVolume(double volume) override;
    bool isMuted() const override;
    void setMuted(bool muted) override;
    qint64 position() const override;

    bool canGoNext() const override;
    bool canGoPrevious() const override;
    bool canPlay() const override;
    bool canPause() const override;
    bool canSeek() const override;
    bool canControl() const override;
    bool canQuit() const override;

    void next() override;
    void previous() override;
    void pause() override;
    void stop() override;
    void play() override;
    void resume() override;
    void seek(qint64 position) override;
    void openUri(const QString& uri) override;

    void addTrack(const QString& uri, const QString& afterTrack, bool setAsCurrent) override;
    QStringList tracks() override;
    bool canEditTracks() const override;

private:
    void playYouTube(const QString& videoId);

    ocast::ICastDevice* device_;
    ocast::YouTubeController* youTube_;
    DurationTracker duration_;
    IconResolver icons_;
};

} // namespace cctl
