#include "app/settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>
#include <limits>

namespace tally::app {

namespace {

constexpr auto kSettingsDatabasePath = "sync/database_path";
constexpr auto kSettingsEndpoint = "sync/endpoint";
constexpr auto kSettingsApiKey = "sync/api_key";
constexpr auto kSettingsMaxAttempts = "sync/max_attempts";
constexpr auto kSettingsBackoffBaseMs = "sync/backoff_base_ms";
constexpr auto kSettingsBackoffCapMs = "sync/backoff_cap_ms";
constexpr auto kSettingsDebounceMs = "sync/debounce_ms";
constexpr auto kSettingsSyncedDisplayMs = "sync/synced_display_ms";
constexpr auto kSettingsRequestTimeoutMs = "sync/request_timeout_ms";

// The attempt budget may be lowered but never raised past the default.
const int kMaxAttemptsCap = RetryPolicy{}.max_attempts;

int read_int(QSettings& settings, const char* key, int fallback, int min_value,
             int max_value = std::numeric_limits<int>::max()) {
    bool ok = false;
    const int value = settings.value(QString::fromLatin1(key), fallback).toInt(&ok);
    return ok ? std::clamp(value, min_value, max_value) : fallback;
}

void override_string(QString& target, const char* env) {
    const auto value = qEnvironmentVariable(env);
    if (!value.isEmpty()) {
        target = value;
    }
}

} // namespace

RetryPolicy SyncSettings::retry_policy() const {
    return RetryPolicy{
        .max_attempts = std::clamp(max_attempts, 1, kMaxAttemptsCap),
        .backoff_base = std::chrono::milliseconds(backoff_base_ms),
        .backoff_cap = std::chrono::milliseconds(backoff_cap_ms)
    };
}

SyncSettings load_sync_settings() {
    QSettings settings;
    SyncSettings result;

    result.database_path = settings.value(QString::fromLatin1(kSettingsDatabasePath)).toString();
    result.endpoint = settings.value(QString::fromLatin1(kSettingsEndpoint)).toString();
    result.api_key = settings.value(QString::fromLatin1(kSettingsApiKey)).toString();
    result.max_attempts = read_int(settings, kSettingsMaxAttempts, result.max_attempts, 1, kMaxAttemptsCap);
    result.backoff_base_ms = read_int(settings, kSettingsBackoffBaseMs, result.backoff_base_ms, 0);
    result.backoff_cap_ms = read_int(settings, kSettingsBackoffCapMs, result.backoff_cap_ms, 0);
    result.debounce_ms = read_int(settings, kSettingsDebounceMs, result.debounce_ms, 0);
    result.synced_display_ms = read_int(settings, kSettingsSyncedDisplayMs, result.synced_display_ms, 0);
    result.request_timeout_ms = read_int(settings, kSettingsRequestTimeoutMs, result.request_timeout_ms, 1);

    override_string(result.database_path, "TALLY_DB_PATH");
    override_string(result.endpoint, "TALLY_ENDPOINT");
    override_string(result.api_key, "TALLY_API_KEY");
    override_string(result.access_token, "TALLY_ACCESS_TOKEN");
    result.debug_sync = qEnvironmentVariableIsSet("TALLY_DEBUG_SYNC");

    return result;
}

void save_sync_settings(const SyncSettings& settings) {
    QSettings store;
    store.setValue(QString::fromLatin1(kSettingsEndpoint), settings.endpoint);
    store.setValue(QString::fromLatin1(kSettingsMaxAttempts), settings.max_attempts);
    store.setValue(QString::fromLatin1(kSettingsBackoffBaseMs), settings.backoff_base_ms);
    store.setValue(QString::fromLatin1(kSettingsBackoffCapMs), settings.backoff_cap_ms);
    store.setValue(QString::fromLatin1(kSettingsDebounceMs), settings.debounce_ms);
    store.setValue(QString::fromLatin1(kSettingsSyncedDisplayMs), settings.synced_display_ms);
    store.setValue(QString::fromLatin1(kSettingsRequestTimeoutMs), settings.request_timeout_ms);
}

QString resolve_database_path(const QString& configured) {
    if (!configured.isEmpty()) {
        QFileInfo info(configured);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(dataPath);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dataPath + "/tally.db";
}

} // namespace tally::app
