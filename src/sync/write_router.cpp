#include "sync/write_router.hpp"
#include "sync/payload_codec.hpp"
#include "core/log_categories.hpp"
#include <QPointer>

namespace tally::sync {

namespace {

void complete(const WriteRouter::Completion& done, Result<WriteOutcome, Error> result) {
    if (done) {
        done(std::move(result));
    }
}

} // namespace

WriteRouter::WriteRouter(ExpenseLedger& ledger,
                         QueueService& queue,
                         RemoteRepository& remote,
                         network::ConnectivityMonitor& monitor,
                         QObject* parent)
    : QObject(parent)
    , ledger_(ledger)
    , queue_(queue)
    , remote_(remote)
    , monitor_(monitor)
{
}

void WriteRouter::createExpense(const Expense& expense, Completion done) {
    auto snapshot = ledger_.apply_create(expense);
    if (snapshot.is_err()) {
        complete(done, Result<WriteOutcome, Error>::err(snapshot.unwrap_err()));
        return;
    }
    route(OperationType::Create, expense, std::move(snapshot).unwrap(), std::move(done));
}

void WriteRouter::updateExpense(const Expense& expense, Completion done) {
    auto snapshot = ledger_.apply_update(expense);
    if (snapshot.is_err()) {
        complete(done, Result<WriteOutcome, Error>::err(snapshot.unwrap_err()));
        return;
    }
    route(OperationType::Update, expense, std::move(snapshot).unwrap(), std::move(done));
}

void WriteRouter::removeExpense(const Uuid& id, Completion done) {
    auto snapshot = ledger_.apply_remove(id);
    if (snapshot.is_err()) {
        complete(done, Result<WriteOutcome, Error>::err(snapshot.unwrap_err()));
        return;
    }
    auto captured = std::move(snapshot).unwrap();
    const auto expense = *captured.prior;
    route(OperationType::Delete, expense, std::move(captured), std::move(done));
}

void WriteRouter::route(OperationType operation,
                        const Expense& expense,
                        LedgerSnapshot snapshot,
                        Completion done) {
    const auto request = make_expense_request(operation, expense);

    if (in_flight_.contains(expense.id)) {
        qCDebug(tallyRouterLog) << "ROUTER: waiting for the direct write of entity="
                                << QString::fromStdString(expense.id.to_string());
        waiting_[expense.id].push_back([this, operation, expense, snapshot, done]() {
            route(operation, expense, snapshot, done);
        });
        return;
    }

    if (!monitor_.isOnline()) {
        qCDebug(tallyRouterLog) << "ROUTER: offline, queueing"
                                << QString::fromStdString(std::string(to_string(operation)));
        enqueue(request, snapshot, std::nullopt, done);
        return;
    }

    if (queue_.hasOutstandingWrite(expense.id)) {
        qCDebug(tallyRouterLog) << "ROUTER: queueing behind earlier writes of entity="
                                << QString::fromStdString(expense.id.to_string());
        enqueue(request, snapshot, std::nullopt, done);
        queue_.processQueue();
        return;
    }

    in_flight_.insert(expense.id);
    QPointer<WriteRouter> self(this);
    auto on_remote = [self, request, snapshot, done](Result<void, Error> result) {
        if (!self) return;
        self->in_flight_.erase(request.entity_id);

        if (result.is_ok()) {
            qCDebug(tallyRouterLog) << "ROUTER: direct write ok entity="
                                    << QString::fromStdString(request.entity_id.to_string());
            complete(done, Result<WriteOutcome, Error>::ok(WriteOutcome::Synced));
        } else if (!result.unwrap_err().is_retryable()) {
            self->rollback(snapshot, result.unwrap_err());
            complete(done, Result<WriteOutcome, Error>::err(result.unwrap_err()));
        } else {
            qCInfo(tallyRouterLog) << "ROUTER: direct write failed, queueing:"
                                   << QString::fromStdString(result.unwrap_err().message);
            self->enqueue(request, snapshot, result.unwrap_err(), done);
        }

        if (self) {
            self->resumeWaiting(request.entity_id);
        }
    };

    switch (operation) {
        case OperationType::Create:
            remote_.create(expense, std::move(on_remote));
            break;
        case OperationType::Update:
            remote_.update(expense, std::move(on_remote));
            break;
        case OperationType::Delete:
            remote_.remove(expense.id, std::move(on_remote));
            break;
    }
}

void WriteRouter::resumeWaiting(const Uuid& entity_id) {
    // Each resumed write may start a new direct write; the rest wait for it.
    auto it = waiting_.find(entity_id);
    while (it != waiting_.end() && !in_flight_.contains(entity_id)) {
        auto next = std::move(it->second.front());
        it->second.pop_front();
        if (it->second.empty()) {
            waiting_.erase(it);
        }
        next();
        it = waiting_.find(entity_id);
    }
}

void WriteRouter::enqueue(const WriteRequest& request,
                          const LedgerSnapshot& snapshot,
                          const std::optional<Error>& failed_attempt,
                          const Completion& done) {
    auto queued = queue_.enqueueSingle(request, failed_attempt);
    if (queued.is_err()) {
        rollback(snapshot, queued.unwrap_err());
        complete(done, Result<WriteOutcome, Error>::err(queued.unwrap_err()));
        return;
    }
    complete(done, Result<WriteOutcome, Error>::ok(WriteOutcome::Queued));
}

void WriteRouter::submitBatch(const std::vector<Expense>& expenses, Completion done) {
    std::vector<LedgerSnapshot> snapshots;
    std::vector<WriteRequest> requests;

    auto undo = [&]() {
        for (auto it = snapshots.rbegin(); it != snapshots.rend(); ++it) {
            ledger_.restore(*it);
        }
    };

    for (const auto& expense : expenses) {
        auto snapshot = ledger_.apply_create(expense);
        if (snapshot.is_err()) {
            undo();
            complete(done, Result<WriteOutcome, Error>::err(snapshot.unwrap_err()));
            return;
        }
        snapshots.push_back(std::move(snapshot).unwrap());
        requests.push_back(make_expense_request(OperationType::Create, expense));
    }

    auto queued = queue_.enqueueBatch(requests);
    if (queued.is_err()) {
        qCWarning(tallyRouterLog) << "ROUTER: batch rolled back:"
                                  << QString::fromStdString(queued.unwrap_err().message);
        undo();
        for (const auto& snapshot : snapshots) {
            emit writeRolledBack(QString::fromStdString(snapshot.expense_id.to_string()),
                                 QString::fromStdString(queued.unwrap_err().message));
        }
        complete(done, Result<WriteOutcome, Error>::err(queued.unwrap_err()));
        return;
    }

    if (monitor_.isOnline()) {
        queue_.processQueue();
    }
    complete(done, Result<WriteOutcome, Error>::ok(WriteOutcome::Queued));
}

void WriteRouter::rollback(const LedgerSnapshot& snapshot, const Error& error) {
    qCWarning(tallyRouterLog) << "ROUTER: rolled back entity="
                              << QString::fromStdString(snapshot.expense_id.to_string())
                              << QString::fromStdString(error.message);
    ledger_.restore(snapshot);
    emit writeRolledBack(QString::fromStdString(snapshot.expense_id.to_string()),
                         QString::fromStdString(error.message));
}

} // namespace tally::sync
