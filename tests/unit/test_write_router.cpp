#include <catch2/catch_test_macros.hpp>
#include "sync/write_router.hpp"
#include "test_support.hpp"
#include <QSignalSpy>

using namespace tally;
using namespace tally::sync;
using namespace tally::testing;
using namespace std::chrono_literals;

namespace {

struct RouterFixture {
    storage::Database db = open_test_database();
    storage::PersistentQueueStore store{db};
    FakeRemote remote;
    ExpenseLedger ledger;
    network::ManualConnectivityBackend* backend = nullptr;
    std::unique_ptr<network::ConnectivityMonitor> monitor;
    std::unique_ptr<QueueService> queue;
    std::unique_ptr<WriteRouter> router;

    RouterFixture(bool online, std::vector<Expense> existing = {})
        : ledger(std::move(existing))
    {
        auto manual = std::make_unique<network::ManualConnectivityBackend>(online);
        backend = manual.get();
        monitor = std::make_unique<network::ConnectivityMonitor>(std::move(manual), 0ms);
        monitor->start();

        queue = std::make_unique<QueueService>(store, remote, RetryPolicy{});
        queue->setOnlineCheck([this]() { return monitor->isOnline(); });
        queue->loadFromStore().unwrap();

        router = std::make_unique<WriteRouter>(ledger, *queue, remote, *monitor);
    }

    std::optional<Result<WriteOutcome, Error>> create(const Expense& expense) {
        std::optional<Result<WriteOutcome, Error>> outcome;
        router->createExpense(expense, [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });
        return outcome;
    }
};

const std::vector<Expense>& seeded() {
    static const std::vector<Expense> expenses{
        sample_expense("rent", 900.0, Timestamp(1'700'300'000'000)),
        sample_expense("groceries", 54.2, Timestamp(1'700'200'000'000)),
        sample_expense("bus", 2.5, Timestamp(1'700'100'000'000)),
    };
    return expenses;
}

} // namespace

TEST_CASE("Router: online write goes straight to the remote", "[router]") {
    RouterFixture f(true);
    const auto expense = sample_expense();

    auto outcome = f.create(expense);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->unwrap() == WriteOutcome::Synced);

    REQUIRE(f.remote.calls.size() == 1);
    REQUIRE(f.remote.calls[0].operation == OperationType::Create);
    REQUIRE(f.ledger.find(expense.id) == expense);
    REQUIRE(f.queue->records().empty());
    REQUIRE(f.store.count().unwrap() == 0);
}

TEST_CASE("Router: offline write is queued without a remote call", "[router]") {
    RouterFixture f(false);
    const auto expense = sample_expense();

    auto outcome = f.create(expense);
    REQUIRE(outcome->unwrap() == WriteOutcome::Queued);
    REQUIRE(f.remote.calls.empty());
    REQUIRE(f.ledger.find(expense.id).has_value());

    const auto records = f.queue->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].entity_id == expense.id);
    REQUIRE(records[0].attempt_count == 0);
    REQUIRE(f.store.count().unwrap() == 1);
}

TEST_CASE("Router: a dropped online write falls back to the queue", "[router]") {
    RouterFixture f(true);
    QSignalSpy rolled_back(f.router.get(), &WriteRouter::writeRolledBack);
    f.remote.script.push_back(transient_failure());

    const auto expense = sample_expense();
    auto outcome = f.create(expense);
    REQUIRE(outcome->unwrap() == WriteOutcome::Queued);

    // The optimistic entry stays.
    REQUIRE(f.ledger.find(expense.id) == expense);
    REQUIRE(rolled_back.count() == 0);

    const auto records = f.queue->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].entity_id == expense.id);
    REQUIRE(records[0].status == RecordStatus::Pending);
    REQUIRE(records[0].attempt_count == 1);
    REQUIRE(records[0].last_error == "connection reset");
    REQUIRE(f.queue->scheduledRetryCount() == 1);
}

TEST_CASE("Router: a rejected online write is rolled back", "[router]") {
    RouterFixture f(true, seeded());
    QSignalSpy rolled_back(f.router.get(), &WriteRouter::writeRolledBack);
    f.remote.script.push_back(validation_failure());

    const auto before = f.ledger.all();
    auto changed = with_amount(seeded()[1], -5.0);

    std::optional<Result<WriteOutcome, Error>> outcome;
    f.router->updateExpense(changed, [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });

    REQUIRE(outcome->unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(f.ledger.all() == before);
    REQUIRE(f.queue->records().empty());
    REQUIRE(rolled_back.count() == 1);
    REQUIRE(rolled_back.at(0).at(0).toString().toStdString() == changed.id.to_string());
}

TEST_CASE("Router: storage failure restores the exact prior state", "[router]") {
    RouterFixture f(false, seeded());
    QSignalSpy rolled_back(f.router.get(), &WriteRouter::writeRolledBack);
    const auto before = f.ledger.all();
    make_read_only(f.db);

    std::optional<Result<WriteOutcome, Error>> outcome;
    auto done = [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); };

    SECTION("create") {
        f.router->createExpense(sample_expense("new"), done);
    }

    SECTION("update") {
        auto changed = with_description(seeded()[2], "taxi");
        changed.date = Timestamp(1'700'400'000'000);
        f.router->updateExpense(changed, done);
    }

    SECTION("remove") {
        f.router->removeExpense(seeded()[1].id, done);
    }

    SECTION("transient fallback that cannot be queued") {
        f.backend->set_online(true);
        f.remote.script.push_back(transient_failure());
        f.router->createExpense(sample_expense("new"), done);
        REQUIRE(f.remote.calls.size() == 1);
    }

    REQUIRE(outcome.has_value());
    REQUIRE(outcome->unwrap_err().kind == ErrorKind::Durability);
    REQUIRE(f.ledger.all() == before);
    REQUIRE(rolled_back.count() == 1);
    REQUIRE(f.queue->records().empty());
}

TEST_CASE("Router: removals", "[router]") {
    SECTION("offline removal queues a delete carrying the id") {
        RouterFixture f(false, seeded());
        const auto target = seeded()[0];

        std::optional<Result<WriteOutcome, Error>> outcome;
        f.router->removeExpense(target.id, [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });

        REQUIRE(outcome->unwrap() == WriteOutcome::Queued);
        REQUIRE_FALSE(f.ledger.find(target.id).has_value());
        const auto records = f.queue->records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].operation == OperationType::Delete);
        REQUIRE(records[0].entity_id == target.id);
    }

    SECTION("unknown id is reported without side effects") {
        RouterFixture f(true, seeded());
        std::optional<Result<WriteOutcome, Error>> outcome;
        f.router->removeExpense(Uuid::generate(), [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });

        REQUIRE(outcome->is_err());
        REQUIRE(f.remote.calls.empty());
        REQUIRE(f.ledger.size() == 3);
    }
}

TEST_CASE("Router: batch submit", "[router]") {
    const std::vector<Expense> receipt{
        sample_expense("bread", 3.2), sample_expense("milk", 1.1), sample_expense("eggs", 4.0)};

    SECTION("offline batch is queued as one group") {
        RouterFixture f(false);
        std::optional<Result<WriteOutcome, Error>> outcome;
        f.router->submitBatch(receipt, [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });

        REQUIRE(outcome->unwrap() == WriteOutcome::Queued);
        REQUIRE(f.ledger.size() == 3);
        const auto records = f.queue->records();
        REQUIRE(records.size() == 3);
        REQUIRE(records[0].batch_id.has_value());
        REQUIRE(f.queue->batch(*records[0].batch_id)->records.size() == 3);
        REQUIRE(f.remote.calls.empty());
    }

    SECTION("online batch is dispatched in order") {
        RouterFixture f(true);
        f.router->submitBatch(receipt);

        REQUIRE(wait_until([&]() { return f.queue->records().empty() && !f.queue->isProcessing(); }));
        REQUIRE(f.remote.calls.size() == 3);
        for (size_t i = 0; i < receipt.size(); ++i) {
            REQUIRE(f.remote.calls[i].entity_id == receipt[i].id);
        }
        REQUIRE(f.ledger.size() == 3);
    }

    SECTION("storage failure rolls back every member") {
        RouterFixture f(false, seeded());
        QSignalSpy rolled_back(f.router.get(), &WriteRouter::writeRolledBack);
        const auto before = f.ledger.all();
        make_read_only(f.db);

        std::optional<Result<WriteOutcome, Error>> outcome;
        f.router->submitBatch(receipt, [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });

        REQUIRE(outcome->unwrap_err().kind == ErrorKind::Durability);
        REQUIRE(f.ledger.all() == before);
        REQUIRE(rolled_back.count() == 3);
    }

    SECTION("empty batch is rejected") {
        RouterFixture f(false);
        std::optional<Result<WriteOutcome, Error>> outcome;
        f.router->submitBatch({}, [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });

        REQUIRE(outcome->unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(f.ledger.size() == 0);
    }
}

TEST_CASE("Router: later writes queue behind a queued write of the same expense", "[router]") {
    RouterFixture f(true);
    f.remote.script.push_back(transient_failure());

    auto expense = sample_expense("draft", 5.0);
    REQUIRE(f.create(expense)->unwrap() == WriteOutcome::Queued);

    std::optional<Result<WriteOutcome, Error>> updated;
    f.router->updateExpense(with_amount(expense, 7.5),
        [&](Result<WriteOutcome, Error> r) { updated = std::move(r); });
    REQUIRE(updated->unwrap() == WriteOutcome::Queued);

    // Only the first create reached the remote; the update waits for its retry.
    REQUIRE(f.remote.calls.size() == 1);
    const auto records = f.queue->records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].operation == OperationType::Create);
    REQUIRE(records[0].attempt_count == 1);
    REQUIRE(records[1].operation == OperationType::Update);
    REQUIRE(records[1].attempt_count == 0);
    REQUIRE(f.ledger.find(expense.id)->amount == 7.5);

    SECTION("other expenses still go direct") {
        const auto other = sample_expense("other");
        REQUIRE(f.create(other)->unwrap() == WriteOutcome::Synced);
        REQUIRE(f.remote.calls.size() == 2);
        REQUIRE(f.remote.calls[1].entity_id == other.id);
    }
}

TEST_CASE("Router: a second write waits for the direct write in flight", "[router]") {
    RouterFixture f(true);
    f.remote.hold = true;

    auto expense = sample_expense("draft", 5.0);
    std::optional<Result<WriteOutcome, Error>> created;
    f.router->createExpense(expense,
        [&](Result<WriteOutcome, Error> r) { created = std::move(r); });
    REQUIRE_FALSE(created.has_value());

    std::optional<Result<WriteOutcome, Error>> updated;
    f.router->updateExpense(with_amount(expense, 7.5),
        [&](Result<WriteOutcome, Error> r) { updated = std::move(r); });
    REQUIRE_FALSE(updated.has_value());
    REQUIRE(f.remote.calls.size() == 1);

    f.remote.hold = false;

    SECTION("delivered create releases the update") {
        f.remote.release_one();
        REQUIRE(created->unwrap() == WriteOutcome::Synced);
        REQUIRE(updated.has_value());
        REQUIRE(updated->unwrap() == WriteOutcome::Synced);
        REQUIRE(f.remote.calls.size() == 2);
        REQUIRE(f.remote.calls[1].operation == OperationType::Update);
        REQUIRE(f.queue->records().empty());
    }

    SECTION("dropped create queues the update behind it") {
        f.remote.script.push_back(transient_failure());
        f.remote.release_one();
        REQUIRE(created->unwrap() == WriteOutcome::Queued);
        REQUIRE(updated.has_value());
        REQUIRE(updated->unwrap() == WriteOutcome::Queued);
        REQUIRE(f.remote.calls.size() == 1);

        const auto records = f.queue->records();
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].operation == OperationType::Create);
        REQUIRE(records[1].operation == OperationType::Update);
    }
}
