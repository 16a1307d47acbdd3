#pragma once

#include "core/write_record.hpp"
#include <QString>

namespace tally::app {

/**
 * SyncSettings - Configuration of the sync core.
 *
 * Read from QSettings (group "sync/"), then overridden by TALLY_*
 * environment variables. Command line flags are applied on top by main().
 */
struct SyncSettings {
    QString database_path;
    QString endpoint;
    QString api_key;
    QString access_token;
    int max_attempts = 5;
    int backoff_base_ms = 1000;
    int backoff_cap_ms = 60000;
    int debounce_ms = 750;
    int synced_display_ms = 2000;
    int request_timeout_ms = 15000;
    bool debug_sync = false;
    bool auto_sync = true;  // Sync at startup when online with records queued

    [[nodiscard]] RetryPolicy retry_policy() const;
};

[[nodiscard]] SyncSettings load_sync_settings();

/**
 * Persist the user-editable keys (endpoint and retry tuning).
 */
void save_sync_settings(const SyncSettings& settings);

/**
 * Absolute database path; creates the parent directory. An empty
 * argument means <AppDataLocation>/tally.db.
 */
[[nodiscard]] QString resolve_database_path(const QString& configured);

} // namespace tally::app
