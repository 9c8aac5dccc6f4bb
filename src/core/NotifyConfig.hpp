#pragma once

#include <QString>
#include <yaml-cpp/yaml.h>

namespace lnc {

/**
 * YAML configuration with built-in defaults.
 *
 * load() overlays a file on top of the defaults, so a partial file only
 * changes the keys it names. Every getter also carries its default.
 */
class NotifyConfig {
public:
    NotifyConfig();

    /// Returns false (and keeps the previous values) if the file cannot be parsed.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Platform: "android", "ios", "null" or "auto"
    QString platform() const;
    void setPlatform(const QString& v);

    // Registry
    int maxTracked() const;
    void setMaxTracked(int v);

    // Limits
    int iosMaxPending() const;
    int androidMaxPending() const;
    int maxBatchSize() const;
    void setMaxBatchSize(int v);

    // Main-thread queue
    int queueCapacity() const;
    void setQueueCapacity(int v);
    int maxActionsPerTick() const;
    int tickBudgetMs() const;
    int tickIntervalMs() const;
    void setTickIntervalMs(int v);

    // Circuit breaker
    int circuitThreshold() const;
    void setCircuitThreshold(int v);
    int circuitCooldownMs() const;
    void setCircuitCooldownMs(int v);

    // Persistence
    QString storePath() const;        // resolved, never empty
    void setStorePath(const QString& v);
    QString legacyStorePath() const;  // resolved, never empty
    void setLegacyStorePath(const QString& v);
    int debounceMs() const;
    void setDebounceMs(int v);
    int saveRetryAttempts() const;
    int saveRetryDelayMs() const;
    void setSaveRetryDelayMs(int v);
    qint64 maxStoreBytes() const;

    // Pools
    int requestPoolSize() const;
    int eventPoolSize() const;

    // Async
    int asyncTimeoutMs() const;
    void setAsyncTimeoutMs(int v);
    int permissionTimeoutMs() const;

    // Metrics
    int metricsFlushIntervalMs() const;
    QString metricsExportPath() const;

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Android
    QString androidChannelId() const;
    QString androidChannelName() const;
    QString androidChannelDescription() const;
    QString androidImportance() const;
    int androidSdkLevel() const;
    void setAndroidSdkLevel(int v);

    // iOS
    bool iosAutoIncrementBadge() const;

private:
    static YAML::Node buildDefaults();
    QString dataDir() const;

    YAML::Node root_;
};

} // namespace lnc
