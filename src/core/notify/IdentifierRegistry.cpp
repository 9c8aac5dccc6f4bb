#include "core/notify/IdentifierRegistry.hpp"
#include <boost/log/trivial.hpp>
#include <iterator>

namespace lnc {

IdentifierRegistry::IdentifierRegistry(int capacity)
    : capacity_(capacity > 0 ? capacity : 1)
{
}

IdentifierRegistry::InsertResult IdentifierRegistry::insertLocked(const QString& identifier,
                                                                  PlatformHandle handle)
{
    InsertResult result;

    auto existing = index_.find(identifier);
    if (existing != index_.end()) {
        result.replacedHandle = existing.value()->handle;
        order_.erase(existing.value());
        index_.erase(existing);
    }

    if (static_cast<int>(order_.size()) >= capacity_) {
        RegistryEntry oldest = order_.front();
        order_.pop_front();
        index_.remove(oldest.identifier);
        BOOST_LOG_TRIVIAL(warning) << "[IdentifierRegistry] Capacity " << capacity_
                                   << " reached, evicting oldest: "
                                   << oldest.identifier.toStdString();
        result.evicted = oldest;
    }

    order_.push_back({identifier, handle});
    index_.insert(identifier, std::prev(order_.end()));
    return result;
}

IdentifierRegistry::InsertResult IdentifierRegistry::insert(const QString& identifier,
                                                            PlatformHandle handle)
{
    QWriteLocker locker(&lock_);
    return insertLocked(identifier, handle);
}

QList<RegistryEntry> IdentifierRegistry::insertMany(const QList<RegistryEntry>& entries)
{
    QList<RegistryEntry> evicted;
    QWriteLocker locker(&lock_);
    for (const auto& e : entries) {
        auto r = insertLocked(e.identifier, e.handle);
        if (r.evicted)
            evicted.append(*r.evicted);
    }
    return evicted;
}

std::optional<PlatformHandle> IdentifierRegistry::remove(const QString& identifier)
{
    QWriteLocker locker(&lock_);
    auto it = index_.find(identifier);
    if (it == index_.end())
        return std::nullopt;

    PlatformHandle handle = it.value()->handle;
    order_.erase(it.value());
    index_.erase(it);
    return handle;
}

QList<RegistryEntry> IdentifierRegistry::removeMany(const QStringList& identifiers)
{
    QList<RegistryEntry> removed;
    QWriteLocker locker(&lock_);
    for (const auto& id : identifiers) {
        auto it = index_.find(id);
        if (it == index_.end()) continue;
        removed.append(*it.value());
        order_.erase(it.value());
        index_.erase(it);
    }
    return removed;
}

bool IdentifierRegistry::contains(const QString& identifier) const
{
    QReadLocker locker(&lock_);
    return index_.contains(identifier);
}

std::optional<PlatformHandle> IdentifierRegistry::handleOf(const QString& identifier) const
{
    QReadLocker locker(&lock_);
    auto it = index_.constFind(identifier);
    if (it == index_.constEnd())
        return std::nullopt;
    return it.value()->handle;
}

int IdentifierRegistry::count() const
{
    QReadLocker locker(&lock_);
    return static_cast<int>(order_.size());
}

QList<RegistryEntry> IdentifierRegistry::snapshot() const
{
    QReadLocker locker(&lock_);
    QList<RegistryEntry> out;
    out.reserve(static_cast<int>(order_.size()));
    for (const auto& e : order_)
        out.append(e);
    return out;
}

QStringList IdentifierRegistry::identifiers() const
{
    QReadLocker locker(&lock_);
    QStringList out;
    out.reserve(static_cast<int>(order_.size()));
    for (const auto& e : order_)
        out.append(e.identifier);
    return out;
}

void IdentifierRegistry::clear()
{
    QWriteLocker locker(&lock_);
    order_.clear();
    index_.clear();
}

void IdentifierRegistry::restore(const QList<RegistryEntry>& entries)
{
    QWriteLocker locker(&lock_);
    order_.clear();
    index_.clear();

    int start = entries.size() > capacity_ ? entries.size() - capacity_ : 0;
    for (int i = start; i < entries.size(); ++i) {
        const auto& e = entries.at(i);
        if (e.identifier.isEmpty()) continue;
        auto existing = index_.find(e.identifier);
        if (existing != index_.end()) {
            order_.erase(existing.value());
            index_.erase(existing);
        }
        order_.push_back(e);
        index_.insert(e.identifier, std::prev(order_.end()));
    }
}

} // namespace lnc
