#pragma once

#include <QLoggingCategory>

// Logging categories for the sync core. Enable debug output with
// QT_LOGGING_RULES="tally.*.debug=true" or the --debug-sync flag.
Q_DECLARE_LOGGING_CATEGORY(tallyQueueLog)
Q_DECLARE_LOGGING_CATEGORY(tallySyncLog)
Q_DECLARE_LOGGING_CATEGORY(tallyConnectivityLog)
Q_DECLARE_LOGGING_CATEGORY(tallyRemoteLog)
Q_DECLARE_LOGGING_CATEGORY(tallyRouterLog)
