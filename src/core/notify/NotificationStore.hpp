#pragma once

#include "core/notify/IdentifierRegistry.hpp"
#include "core/notify/NotificationTypes.hpp"
#include <QByteArray>
#include <QList>

namespace lnc {

/// Everything that survives a restart.
struct NotificationStore {
    static constexpr int kFormatVersion = 2;

    QList<RegistryEntry> notifications;   // oldest first
    ReturnNotificationConfig returnConfig;
    qint64 lastForegroundUnixTime = 0;

    bool isEmpty() const { return notifications.isEmpty() && lastForegroundUnixTime == 0; }

    enum class DecodeStatus {
        Ok,
        Corrupted,    // unparsable, missing fields or checksum mismatch
        Unsupported   // well-formed but unknown version
    };

    /// {"checksum": sha256(payload), "payload": {...}, "version": 2}
    QByteArray encode() const;
    static DecodeStatus decode(const QByteArray& data, NotificationStore& out);

    /// Reads the pre-checksum {"identifiers": [...], "ids": [...]} layout.
    static bool decodeLegacy(const QByteArray& data, NotificationStore& out);

    static QByteArray checksumOf(const QByteArray& compactPayload);
};

} // namespace lnc
