#pragma once

#include <QHash>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>

namespace lnc {

/// Group key -> member identifiers. Empty groups are dropped. Thread-safe.
class GroupIndex {
public:
    void addMember(const QString& groupKey, const QString& identifier);
    /// Removes the identifier from every group it belongs to.
    void removeMember(const QString& identifier);

    QSet<QString> membersOf(const QString& groupKey) const;
    int countOf(const QString& groupKey) const;
    int groupCount() const;
    QStringList groupKeys() const;
    void clear();

private:
    mutable QMutex mutex_;
    QHash<QString, QSet<QString>> groups_;
};

} // namespace lnc
