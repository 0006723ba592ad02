#pragma once

#include <ocast/Controller/BaseController.hpp>
#include <ocast/Controller/IMediaController.hpp>
#include <ocast/Version.hpp>

namespace ocast {

class MediaController : public BaseController, public IMediaController {
    Q_OBJECT
public:
    explicit MediaController(QObject* parent = nullptr);

    bool receiveMessage(const QJsonObject& message) override;
    void onReceiverStatus(const CastStatus& status) override;

    MediaStatus status() const override { return status_; }
    QString title() const override { return status_.title; }
    QString thumbnail() const override { return status_.thumbnail(); }
    bool isPlaying() const override { return status_.isPlaying(); }
    bool isPaused() const override { return status_.isPaused(); }

    void updateStatus();
    void play() override;
    void pause() override;
    void stop() override;
    void seek(double seconds) override;
    void queueNext() override;
    void queuePrev() override;
    void playMedia(const QString& url, const QString& contentType) override;
    void queueInsert(const QString& url, const QString& contentType) override;

signals:
    void statusChanged(const ocast::MediaStatus& status);

private:
    static QJsonObject mediaInfo(const QString& url, const QString& contentType);
    bool sendSessionCommand(const QString& type, QJsonObject message = QJsonObject());
    void onActiveChanged(bool active);

    MediaStatus status_;
    QJsonObject pendingLoad_;
};

} // namespace ocast
