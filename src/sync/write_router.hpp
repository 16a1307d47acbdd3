#pragma once

#include "core/expense.hpp"
#include "core/expense_ledger.hpp"
#include "core/result.hpp"
#include "network/connectivity_monitor.hpp"
#include "sync/queue_service.hpp"
#include "sync/remote_repository.hpp"
#include <QObject>
#include <QString>
#include <deque>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tally::sync {

enum class WriteOutcome {
    Synced,   // The remote accepted the write directly
    Queued    // Durably queued for a later pass
};

/**
 * WriteRouter - Entry point for every expense write.
 *
 * The mutation is applied to the ledger first. Online, the remote is
 * tried directly; a transient failure falls back to the queue with the
 * attempt already counted. Offline, the write is queued straight away.
 * The ledger entry is restored to its exact prior state only when the
 * write cannot succeed: the queue cannot persist it, or the remote
 * rejects it as invalid.
 *
 * Writes to one expense reach the remote in the order they were made.
 * While a direct write for an expense is in flight, later writes for it
 * wait in the router; while the queue holds a record for it, later
 * writes are queued behind that record instead of sent directly.
 *
 * Batches are always queued and dispatched right away when online.
 */
class WriteRouter : public QObject {
    Q_OBJECT

public:
    using Completion = std::function<void(Result<WriteOutcome, Error>)>;

    WriteRouter(ExpenseLedger& ledger,
                QueueService& queue,
                RemoteRepository& remote,
                network::ConnectivityMonitor& monitor,
                QObject* parent = nullptr);

    void createExpense(const Expense& expense, Completion done = {});
    void updateExpense(const Expense& expense, Completion done = {});
    void removeExpense(const Uuid& id, Completion done = {});

    /**
     * Multi-item import (e.g. a scanned receipt): one batch of creates.
     */
    void submitBatch(const std::vector<Expense>& expenses, Completion done = {});

signals:
    void writeRolledBack(const QString& entity_id, const QString& message);

private:
    ExpenseLedger& ledger_;
    QueueService& queue_;
    RemoteRepository& remote_;
    network::ConnectivityMonitor& monitor_;

    std::unordered_set<Uuid> in_flight_;
    std::unordered_map<Uuid, std::deque<std::function<void()>>> waiting_;

    void resumeWaiting(const Uuid& entity_id);
    void route(OperationType operation,
               const Expense& expense,
               LedgerSnapshot snapshot,
               Completion done);
    void enqueue(const WriteRequest& request,
                 const LedgerSnapshot& snapshot,
                 const std::optional<Error>& failed_attempt,
                 const Completion& done);
    void rollback(const LedgerSnapshot& snapshot, const Error& error);
};

} // namespace tally::sync
