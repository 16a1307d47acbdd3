#pragma once

#include <QString>

namespace tally::app {

// <AppLocalDataLocation>/logs/tally.log, or empty when there is none.
QString default_log_file_path();

// Appends every message to `path` and still forwards it to the previous
// handler (stderr for the CLI). Returns false when the file cannot be
// opened; messages then only reach the previous handler.
bool install_file_logging(const QString& path = default_log_file_path());

// Turns on debug output for every tally.* category.
void enable_sync_debug_logging();

} // namespace tally::app
