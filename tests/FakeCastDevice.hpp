#pragma once

#include <ocast/Device/ICastDevice.hpp>

#include <QStringList>

namespace cctl {
namespace testing {

/// Media controller that records commands instead of sending them.
class FakeMediaController : public ocast::IMediaController {
public:
    ocast::MediaStatus mediaStatus;
    QStringList commands;

    ocast::MediaStatus status() const override { return mediaStatus; }
    QString title() const override { return mediaStatus.isValid() ? mediaStatus.title : QString(); }
    QString thumbnail() const override { return mediaStatus.thumbnail(); }
    bool isPlaying() const override { return mediaStatus.isValid() && mediaStatus.isPlaying(); }
    bool isPaused() const override { return mediaStatus.isValid() && mediaStatus.isPaused(); }

    void play() override { commands << "play"; }
    void pause() override { commands << "pause"; }
    void stop() override { commands << "stop"; }
    void seek(double seconds) override { commands << QString("seek %1").arg(seconds); }
    void queueNext() override { commands << "next"; }
    void queuePrev() override { commands << "prev"; }
    void playMedia(const QString& url, const QString& contentType) override {
        commands << QString("playMedia %1 %2").arg(url, contentType);
    }
    void queueInsert(const QString& url, const QString& contentType) override {
        commands << QString("queueInsert %1 %2").arg(url, contentType);
    }
};

/// In-memory device: status is set by the test, commands are recorded.
class FakeCastDevice : public ocast::ICastDevice {
    Q_OBJECT
public:
    explicit FakeCastDevice(const QString& name = QString(), QObject* parent = nullptr)
        : ocast::ICastDevice(parent), name_(name) {}

    ocast::CastStatus castStatus;
    FakeMediaController media;
    QStringList commands;
    QList<ocast::BaseController*> handlers;

    QString name() const override { return name_; }
    ocast::CastInfo info() const override {
        ocast::CastInfo info;
        info.friendlyName = name_;
        info.host = "127.0.0.1";
        return info;
    }
    bool isConnected() const override { return true; }
    ocast::CastStatus status() const override { return castStatus; }
    ocast::IMediaController* mediaController() const override {
        return const_cast<FakeMediaController*>(&media);
    }

    void registerHandler(ocast::BaseController* controller) override { handlers << controller; }

    void quitApp() override { commands << "quit"; }
    void volumeUp(double delta) override { commands << QString("up %1").arg(delta); }
    void volumeDown(double delta) override { commands << QString("down %1").arg(delta); }
    void setVolumeMuted(bool muted) override { commands << (muted ? "mute on" : "mute off"); }

    void pushMediaStatus(const ocast::MediaStatus& status) {
        media.mediaStatus = status;
        emit mediaStatusChanged(status);
    }

    void pushCastStatus(const ocast::CastStatus& status) {
        castStatus = status;
        emit statusChanged(status);
    }

private:
    QString name_;
};

} // namespace testing
} // namespace cctl
