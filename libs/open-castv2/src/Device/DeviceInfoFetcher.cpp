#include <ocast/Device/DeviceInfoFetcher.hpp>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

namespace ocast {

DeviceInfoFetcher::DeviceInfoFetcher(QObject* parent)
    : QObject(parent)
{
}

void DeviceInfoFetcher::fetch(const QString& host)
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(EUREKA_PORT);
    url.setPath(QStringLiteral("/setup/eureka_info"));

    QNetworkRequest request(url);
    request.setTransferTimeout(TIMEOUT_MS);

    QNetworkReply* reply = network_.get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply, host]() {
        reply->deleteLater();

        CastInfo info;
        info.host = host;
        if (reply->error() != QNetworkReply::NoError) {
            qDebug() << "[DeviceInfo]" << host << "eureka_info failed:" << reply->errorString();
        } else if (!parseEurekaInfo(reply->readAll(), info)) {
            qDebug() << "[DeviceInfo]" << host << "eureka_info unreadable";
        }
        emit finished(info);
    });
}

bool DeviceInfoFetcher::parseEurekaInfo(const QByteArray& body, CastInfo& info)
{
    QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject())
        return false;

    QJsonObject obj = doc.object();
    info.friendlyName = obj.value("name").toString();
    info.uuid = obj.value("ssdp_udn").toString();
    if (info.modelName.isEmpty())
        info.modelName = obj.value("device_info").toObject().value("model_name").toString();
    return !info.friendlyName.isEmpty();
}

} // namespace ocast
