#pragma once

#include "core/notify/NotificationTypes.hpp"
#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <list>
#include <optional>

namespace lnc {

struct RegistryEntry {
    QString identifier;
    PlatformHandle handle = kInvalidHandle;

    bool operator==(const RegistryEntry& o) const
    {
        return identifier == o.identifier && handle == o.handle;
    }
};

/**
 * Bounded map of identifier -> platform handle that remembers insertion order.
 *
 * When full, inserting a new identifier evicts the oldest surviving entry
 * (strict FIFO). Re-inserting an identifier that is already tracked replaces
 * its handle and moves it to the newest position without evicting anything.
 *
 * All operations are O(1) apart from snapshot() and the batch calls.
 * Thread-safe: mutations take the write lock, lookups the read lock.
 */
class IdentifierRegistry {
public:
    static constexpr int kDefaultCapacity = 100;

    struct InsertResult {
        std::optional<RegistryEntry> evicted;
        std::optional<PlatformHandle> replacedHandle;
    };

    explicit IdentifierRegistry(int capacity = kDefaultCapacity);

    InsertResult insert(const QString& identifier, PlatformHandle handle);
    /// Inserts all entries under a single lock. Returns every evicted entry.
    QList<RegistryEntry> insertMany(const QList<RegistryEntry>& entries);

    std::optional<PlatformHandle> remove(const QString& identifier);
    /// Removes all listed identifiers under a single lock. Unknown ids are skipped.
    QList<RegistryEntry> removeMany(const QStringList& identifiers);

    bool contains(const QString& identifier) const;
    std::optional<PlatformHandle> handleOf(const QString& identifier) const;
    int count() const;
    int capacity() const { return capacity_; }

    /// Entries oldest first.
    QList<RegistryEntry> snapshot() const;
    QStringList identifiers() const;

    void clear();
    /// Replaces the contents. Keeps only the newest capacity() entries.
    void restore(const QList<RegistryEntry>& entries);

private:
    using Order = std::list<RegistryEntry>;

    InsertResult insertLocked(const QString& identifier, PlatformHandle handle);

    const int capacity_;
    mutable QReadWriteLock lock_;
    Order order_;
    QHash<QString, Order::iterator> index_;
};

} // namespace lnc
