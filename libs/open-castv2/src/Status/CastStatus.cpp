#include <ocast/Status/CastStatus.hpp>
#include <QJsonArray>

namespace ocast {

CastStatus CastStatus::fromJson(const QJsonObject& status)
{
    CastStatus result;
    result.valid = true;

    QJsonObject volume = status.value("volume").toObject();
    result.volumeLevel = volume.value("level").toDouble(0.0);
    result.volumeMuted = volume.value("muted").toBool(false);

    result.isActiveInput = status.value("isActiveInput").toBool(false);
    result.isStandBy = status.value("isStandBy").toBool(false);

    QJsonArray apps = status.value("applications").toArray();
    if (!apps.isEmpty()) {
        QJsonObject app = apps.first().toObject();
        result.appId = app.value("appId").toString();
        result.displayName = app.value("displayName").toString();
        result.iconUrl = app.value("iconUrl").toString();
        result.sessionId = app.value("sessionId").toString();
        result.transportId = app.value("transportId").toString();
        result.statusText = app.value("statusText").toString();
        for (const auto& ns : app.value("namespaces").toArray())
            result.namespaces.append(ns.toObject().value("name").toString());
    }

    return result;
}

} // namespace ocast
