#include "core/notify/Metrics.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>
#include <QTextStream>
#include <boost/log/trivial.hpp>
#include <unistd.h>

namespace lnc {

QJsonObject MetricsSnapshot::toJson() const
{
    QJsonObject obj;
    obj["totalScheduled"] = static_cast<qint64>(totalScheduled);
    obj["totalCancelled"] = static_cast<qint64>(totalCancelled);
    obj["totalErrors"] = static_cast<qint64>(totalErrors);
    obj["poolHits"] = static_cast<qint64>(poolHits);
    obj["poolMisses"] = static_cast<qint64>(poolMisses);
    obj["poolHitRate"] = poolHitRate();
    obj["queueDrops"] = static_cast<qint64>(queueDrops);
    obj["saveCount"] = static_cast<qint64>(saveCount);
    obj["averageSaveTimeMs"] = averageSaveTimeMs;
    obj["startTime"] = startTime.toString(Qt::ISODate);
    obj["uptimeSeconds"] = startTime.secsTo(QDateTime::currentDateTimeUtc());
    obj["currentMemoryBytes"] = static_cast<qint64>(currentMemoryBytes);
    obj["peakMemoryBytes"] = static_cast<qint64>(peakMemoryBytes);
    return obj;
}

Metrics::Metrics()
{
    data_.startTime = QDateTime::currentDateTimeUtc();
}

void Metrics::recordSaveTime(double ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    totalSaveMs_ += ms;
    ++data_.saveCount;
    data_.averageSaveTimeMs = totalSaveMs_ / static_cast<double>(data_.saveCount);
}

void Metrics::flush()
{
    int64_t rss = residentMemoryBytes();

    std::lock_guard<std::mutex> lock(mutex_);
    data_.totalScheduled += scheduled_.exchange(0, std::memory_order_relaxed);
    data_.totalCancelled += cancelled_.exchange(0, std::memory_order_relaxed);
    data_.totalErrors += errors_.exchange(0, std::memory_order_relaxed);
    data_.poolHits += poolHits_.exchange(0, std::memory_order_relaxed);
    data_.poolMisses += poolMisses_.exchange(0, std::memory_order_relaxed);
    data_.queueDrops += queueDrops_.exchange(0, std::memory_order_relaxed);

    if (rss > 0) {
        data_.currentMemoryBytes = rss;
        if (rss > data_.peakMemoryBytes)
            data_.peakMemoryBytes = rss;
    }
}

MetricsSnapshot Metrics::snapshot()
{
    flush();
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void Metrics::reset()
{
    scheduled_.store(0, std::memory_order_relaxed);
    cancelled_.store(0, std::memory_order_relaxed);
    errors_.store(0, std::memory_order_relaxed);
    poolHits_.store(0, std::memory_order_relaxed);
    poolMisses_.store(0, std::memory_order_relaxed);
    queueDrops_.store(0, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    data_ = MetricsSnapshot{};
    data_.startTime = QDateTime::currentDateTimeUtc();
    totalSaveMs_ = 0.0;
}

bool Metrics::exportToFile(const QString& path)
{
    MetricsSnapshot snap = snapshot();

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[Metrics] Cannot open " << path.toStdString()
                                   << ": " << file.errorString().toStdString();
        return false;
    }
    file.write(QJsonDocument(snap.toJson()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(warning) << "[Metrics] Export failed: " << file.errorString().toStdString();
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "[Metrics] Exported to " << path.toStdString();
    return true;
}

int64_t Metrics::residentMemoryBytes()
{
    // /proc/self/statm: size resident shared text lib data dt (in pages)
    QFile statm(QStringLiteral("/proc/self/statm"));
    if (!statm.open(QIODevice::ReadOnly | QIODevice::Text))
        return 0;

    QTextStream in(&statm);
    qint64 sizePages = 0;
    qint64 residentPages = 0;
    in >> sizePages >> residentPages;
    long pageSize = sysconf(_SC_PAGESIZE);
    return pageSize > 0 ? residentPages * pageSize : 0;
}

} // namespace lnc
