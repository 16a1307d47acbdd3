#include "core/log_categories.hpp"

Q_LOGGING_CATEGORY(tallyQueueLog, "tally.queue")
Q_LOGGING_CATEGORY(tallySyncLog, "tally.sync")
Q_LOGGING_CATEGORY(tallyConnectivityLog, "tally.connectivity")
Q_LOGGING_CATEGORY(tallyRemoteLog, "tally.remote")
Q_LOGGING_CATEGORY(tallyRouterLog, "tally.router")
