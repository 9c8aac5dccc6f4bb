#include "core/NotifyConfig.hpp"
#include <QDir>
#include <QStandardPaths>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace lnc {

namespace {

// Mappings merge key by key; scalars and sequences from the file win outright.
void overlay(YAML::Node base, const YAML::Node& file)
{
    for (auto it = file.begin(); it != file.end(); ++it) {
        const auto key = it->first.as<std::string>();
        YAML::Node current = base[key];
        if (current.IsMap() && it->second.IsMap())
            overlay(current, it->second);
        else
            base[key] = YAML::Clone(it->second);
    }
}

template <typename T>
T read(const YAML::Node& root, const char* section, const char* key, const T& fallback)
{
    const YAML::Node s = root[section];
    if (!s.IsMap())
        return fallback;
    return s[key].as<T>(fallback);
}

QString readString(const YAML::Node& root, const char* section, const char* key, const char* fallback)
{
    return QString::fromStdString(read<std::string>(root, section, key, fallback));
}

} // namespace

NotifyConfig::NotifyConfig()
    : root_(buildDefaults())
{
}

YAML::Node NotifyConfig::buildDefaults()
{
    YAML::Node root(YAML::NodeType::Map);

    root["platform"] = "auto";

    root["registry"]["max_tracked"] = 100;

    root["limits"]["ios_max_pending"] = 64;
    root["limits"]["android_max_pending"] = 500;
    root["limits"]["max_batch_size"] = 50;

    root["queue"]["capacity"] = 1024;
    root["queue"]["max_actions_per_tick"] = 128;
    root["queue"]["time_budget_ms"] = 2;
    root["queue"]["tick_interval_ms"] = 16;

    root["circuit_breaker"]["threshold"] = 5;
    root["circuit_breaker"]["cooldown_ms"] = 60000;

    root["persistence"]["path"] = "";
    root["persistence"]["legacy_path"] = "";
    root["persistence"]["debounce_ms"] = 500;
    root["persistence"]["retry_attempts"] = 3;
    root["persistence"]["retry_delay_ms"] = 100;
    root["persistence"]["max_file_bytes"] = 5 * 1024 * 1024;

    root["pools"]["notification_requests"] = 20;
    root["pools"]["events"] = 10;

    root["async"]["timeout_ms"] = 5000;
    root["async"]["permission_timeout_ms"] = 10000;

    root["metrics"]["flush_interval_ms"] = 1000;
    root["metrics"]["export_path"] = "";

    root["logging"]["level"] = "info";

    root["android"]["channel_id"] = "default_channel";
    root["android"]["channel_name"] = "Default Channel";
    root["android"]["channel_description"] = "Default notification channel";
    root["android"]["importance"] = "high";
    root["android"]["sdk_level"] = 33;

    root["ios"]["auto_increment_badge"] = true;

    return root;
}

bool NotifyConfig::load(const QString& filePath)
{
    try {
        YAML::Node file = YAML::LoadFile(filePath.toStdString());
        YAML::Node merged = buildDefaults();
        if (file.IsMap()) {
            overlay(merged, file);
        } else if (file.IsDefined() && !file.IsNull()) {
            BOOST_LOG_TRIVIAL(warning) << "[NotifyConfig] " << filePath.toStdString()
                                       << " is not a mapping, ignored";
            return false;
        }
        root_ = merged;
        BOOST_LOG_TRIVIAL(info) << "[NotifyConfig] Loaded " << filePath.toStdString();
        return true;
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[NotifyConfig] Failed to load " << filePath.toStdString()
                                 << ": " << e.what();
        return false;
    }
}

bool NotifyConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "[NotifyConfig] Cannot write " << filePath.toStdString();
        return false;
    }
    fout << root_ << '\n';
    return static_cast<bool>(fout);
}

QString NotifyConfig::dataDir() const
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + "/.notifcore";
    return dir;
}

// --- Platform ---

QString NotifyConfig::platform() const
{
    return QString::fromStdString(root_["platform"].as<std::string>("auto")).toLower();
}

void NotifyConfig::setPlatform(const QString& v)
{
    root_["platform"] = v.toStdString();
}

// --- Registry / limits ---

int NotifyConfig::maxTracked() const
{
    return read<int>(root_, "registry", "max_tracked", 100);
}

void NotifyConfig::setMaxTracked(int v)
{
    root_["registry"]["max_tracked"] = v;
}

int NotifyConfig::iosMaxPending() const
{
    return read<int>(root_, "limits", "ios_max_pending", 64);
}

int NotifyConfig::androidMaxPending() const
{
    return read<int>(root_, "limits", "android_max_pending", 500);
}

int NotifyConfig::maxBatchSize() const
{
    return read<int>(root_, "limits", "max_batch_size", 50);
}

void NotifyConfig::setMaxBatchSize(int v)
{
    root_["limits"]["max_batch_size"] = v;
}

// --- Queue ---

int NotifyConfig::queueCapacity() const
{
    return read<int>(root_, "queue", "capacity", 1024);
}

void NotifyConfig::setQueueCapacity(int v)
{
    root_["queue"]["capacity"] = v;
}

int NotifyConfig::maxActionsPerTick() const
{
    return read<int>(root_, "queue", "max_actions_per_tick", 128);
}

int NotifyConfig::tickBudgetMs() const
{
    return read<int>(root_, "queue", "time_budget_ms", 2);
}

int NotifyConfig::tickIntervalMs() const
{
    return read<int>(root_, "queue", "tick_interval_ms", 16);
}

void NotifyConfig::setTickIntervalMs(int v)
{
    root_["queue"]["tick_interval_ms"] = v;
}

// --- Circuit breaker ---

int NotifyConfig::circuitThreshold() const
{
    return read<int>(root_, "circuit_breaker", "threshold", 5);
}

void NotifyConfig::setCircuitThreshold(int v)
{
    root_["circuit_breaker"]["threshold"] = v;
}

int NotifyConfig::circuitCooldownMs() const
{
    return read<int>(root_, "circuit_breaker", "cooldown_ms", 60000);
}

void NotifyConfig::setCircuitCooldownMs(int v)
{
    root_["circuit_breaker"]["cooldown_ms"] = v;
}

// --- Persistence ---

QString NotifyConfig::storePath() const
{
    QString p = readString(root_, "persistence", "path", "");
    return p.isEmpty() ? dataDir() + "/notification_store.dat" : p;
}

void NotifyConfig::setStorePath(const QString& v)
{
    root_["persistence"]["path"] = v.toStdString();
}

QString NotifyConfig::legacyStorePath() const
{
    QString p = readString(root_, "persistence", "legacy_path", "");
    return p.isEmpty() ? dataDir() + "/scheduled_notification_ids.json" : p;
}

void NotifyConfig::setLegacyStorePath(const QString& v)
{
    root_["persistence"]["legacy_path"] = v.toStdString();
}

int NotifyConfig::debounceMs() const
{
    return read<int>(root_, "persistence", "debounce_ms", 500);
}

void NotifyConfig::setDebounceMs(int v)
{
    root_["persistence"]["debounce_ms"] = v;
}

int NotifyConfig::saveRetryAttempts() const
{
    return read<int>(root_, "persistence", "retry_attempts", 3);
}

int NotifyConfig::saveRetryDelayMs() const
{
    return read<int>(root_, "persistence", "retry_delay_ms", 100);
}

void NotifyConfig::setSaveRetryDelayMs(int v)
{
    root_["persistence"]["retry_delay_ms"] = v;
}

qint64 NotifyConfig::maxStoreBytes() const
{
    return read<long long>(root_, "persistence", "max_file_bytes", 5LL * 1024 * 1024);
}

// --- Pools ---

int NotifyConfig::requestPoolSize() const
{
    return read<int>(root_, "pools", "notification_requests", 20);
}

int NotifyConfig::eventPoolSize() const
{
    return read<int>(root_, "pools", "events", 10);
}

// --- Async ---

int NotifyConfig::asyncTimeoutMs() const
{
    return read<int>(root_, "async", "timeout_ms", 5000);
}

void NotifyConfig::setAsyncTimeoutMs(int v)
{
    root_["async"]["timeout_ms"] = v;
}

int NotifyConfig::permissionTimeoutMs() const
{
    return read<int>(root_, "async", "permission_timeout_ms", 10000);
}

// --- Metrics ---

int NotifyConfig::metricsFlushIntervalMs() const
{
    return read<int>(root_, "metrics", "flush_interval_ms", 1000);
}

QString NotifyConfig::metricsExportPath() const
{
    return readString(root_, "metrics", "export_path", "");
}

// --- Logging ---

QString NotifyConfig::logLevel() const
{
    return readString(root_, "logging", "level", "info");
}

void NotifyConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Android ---

QString NotifyConfig::androidChannelId() const
{
    return readString(root_, "android", "channel_id", "default_channel");
}

QString NotifyConfig::androidChannelName() const
{
    return readString(root_, "android", "channel_name", "Default Channel");
}

QString NotifyConfig::androidChannelDescription() const
{
    return readString(root_, "android", "channel_description", "Default notification channel");
}

QString NotifyConfig::androidImportance() const
{
    return readString(root_, "android", "importance", "high");
}

int NotifyConfig::androidSdkLevel() const
{
    return read<int>(root_, "android", "sdk_level", 33);
}

void NotifyConfig::setAndroidSdkLevel(int v)
{
    root_["android"]["sdk_level"] = v;
}

// --- iOS ---

bool NotifyConfig::iosAutoIncrementBadge() const
{
    return read<bool>(root_, "ios", "auto_increment_badge", true);
}

} // namespace lnc
