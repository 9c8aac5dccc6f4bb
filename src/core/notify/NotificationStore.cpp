#include "core/notify/NotificationStore.hpp"
#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <algorithm>

namespace lnc {

namespace {

QJsonObject payloadToJson(const NotificationStore& store)
{
    QJsonArray list;
    for (const auto& e : store.notifications) {
        QJsonObject item;
        item["id"] = e.identifier;
        item["handle"] = e.handle;
        list.append(item);
    }

    QJsonObject payload;
    payload["notifications"] = list;
    payload["returnConfig"] = store.returnConfig.toJson();
    payload["lastForegroundUnixTime"] = store.lastForegroundUnixTime;
    return payload;
}

} // namespace

QByteArray NotificationStore::checksumOf(const QByteArray& compactPayload)
{
    return QCryptographicHash::hash(compactPayload, QCryptographicHash::Sha256).toHex();
}

QByteArray NotificationStore::encode() const
{
    QJsonObject payload = payloadToJson(*this);
    QByteArray compact = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    QJsonObject root;
    root["version"] = kFormatVersion;
    root["payload"] = payload;
    root["checksum"] = QString::fromLatin1(checksumOf(compact));
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

NotificationStore::DecodeStatus NotificationStore::decode(const QByteArray& data, NotificationStore& out)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return DecodeStatus::Corrupted;

    QJsonObject root = doc.object();
    if (!root.value("version").isDouble() || !root.value("payload").isObject()
        || !root.value("checksum").isString())
        return DecodeStatus::Corrupted;

    if (root.value("version").toInt() != kFormatVersion)
        return DecodeStatus::Unsupported;

    QJsonObject payload = root.value("payload").toObject();
    QByteArray compact = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    if (checksumOf(compact) != root.value("checksum").toString().toLatin1())
        return DecodeStatus::Corrupted;

    NotificationStore store;
    for (const auto& v : payload.value("notifications").toArray()) {
        QJsonObject item = v.toObject();
        QString id = item.value("id").toString();
        if (id.isEmpty()) continue;
        store.notifications.append({id, item.value("handle").toInteger(kInvalidHandle)});
    }
    if (payload.value("returnConfig").isObject())
        store.returnConfig = ReturnNotificationConfig::fromJson(payload.value("returnConfig").toObject());
    store.lastForegroundUnixTime = payload.value("lastForegroundUnixTime").toInteger(0);

    out = store;
    return DecodeStatus::Ok;
}

bool NotificationStore::decodeLegacy(const QByteArray& data, NotificationStore& out)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return false;

    QJsonObject root = doc.object();
    if (!root.value("identifiers").isArray() || !root.value("ids").isArray())
        return false;

    QJsonArray identifiers = root.value("identifiers").toArray();
    QJsonArray ids = root.value("ids").toArray();

    NotificationStore store;
    const auto n = std::min(identifiers.size(), ids.size());
    for (qsizetype i = 0; i < n; ++i) {
        QString id = identifiers.at(i).toString();
        if (id.isEmpty()) continue;
        store.notifications.append({id, ids.at(i).toInteger(kInvalidHandle)});
    }

    out = store;
    return true;
}

} // namespace lnc
