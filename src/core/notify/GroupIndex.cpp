#include "core/notify/GroupIndex.hpp"

namespace lnc {

void GroupIndex::addMember(const QString& groupKey, const QString& identifier)
{
    if (groupKey.isEmpty() || identifier.isEmpty())
        return;

    QMutexLocker lock(&mutex_);
    groups_[groupKey].insert(identifier);
}

void GroupIndex::removeMember(const QString& identifier)
{
    QMutexLocker lock(&mutex_);
    for (auto it = groups_.begin(); it != groups_.end();) {
        it->remove(identifier);
        if (it->isEmpty())
            it = groups_.erase(it);
        else
            ++it;
    }
}

QSet<QString> GroupIndex::membersOf(const QString& groupKey) const
{
    QMutexLocker lock(&mutex_);
    return groups_.value(groupKey);
}

int GroupIndex::countOf(const QString& groupKey) const
{
    QMutexLocker lock(&mutex_);
    auto it = groups_.constFind(groupKey);
    return it == groups_.constEnd() ? 0 : static_cast<int>(it->size());
}

int GroupIndex::groupCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(groups_.size());
}

QStringList GroupIndex::groupKeys() const
{
    QMutexLocker lock(&mutex_);
    return groups_.keys();
}

void GroupIndex::clear()
{
    QMutexLocker lock(&mutex_);
    groups_.clear();
}

} // namespace lnc
