#include <catch2/catch_test_macros.hpp>
#include "app/sync_engine.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace tally;
using namespace tally::app;
using namespace tally::sync;
using namespace tally::testing;

namespace {

SyncSettings fast_settings() {
    SyncSettings settings;
    settings.database_path = QStringLiteral(":memory:");
    settings.backoff_base_ms = 1;
    settings.backoff_cap_ms = 20;
    settings.debounce_ms = 0;
    settings.synced_display_ms = 50;
    return settings;
}

struct Harness {
    network::ManualConnectivityBackend* backend = nullptr;
    FakeRemote* remote = nullptr;
    std::unique_ptr<SyncEngine> engine;

    explicit Harness(bool online) {
        auto manual = std::make_unique<network::ManualConnectivityBackend>(online);
        auto fake = std::make_unique<FakeRemote>();
        backend = manual.get();
        remote = fake.get();
        engine = std::make_unique<SyncEngine>(fast_settings(), std::move(manual), std::move(fake));
        engine->initialize().unwrap();
    }

    WriteOutcome create(const Expense& expense) {
        std::optional<Result<WriteOutcome, Error>> outcome;
        engine->router().createExpense(expense,
            [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });
        REQUIRE(wait_until([&]() { return outcome.has_value(); }));
        return outcome->unwrap();
    }

    bool settled() {
        return wait_until([&]() { return !engine->queue().isProcessing(); });
    }
};

} // namespace

TEST_CASE("Offline: three writes sync after connectivity returns", "[integration]") {
    Harness h(false);
    std::vector<SyncPhase> phases;
    QObject::connect(&h.engine->coordinator(), &SyncCoordinator::phaseChanged,
                     [&]() { phases.push_back(h.engine->coordinator().phase()); });

    const std::vector<Expense> expenses{
        sample_expense("coffee", 3.5), sample_expense("lunch", 11.0), sample_expense("cinema", 14.0)};
    for (const auto& e : expenses) {
        REQUIRE(h.create(e) == WriteOutcome::Queued);
    }

    auto& coordinator = h.engine->coordinator();
    REQUIRE(coordinator.pendingCount() == 3);
    REQUIRE(coordinator.phase() == SyncPhase::Pending);
    REQUIRE(h.engine->ledger().size() == 3);

    h.backend->set_online(true);
    REQUIRE(wait_until([&]() {
        return std::find(phases.begin(), phases.end(), SyncPhase::Synced) != phases.end();
    }));

    REQUIRE(std::find(phases.begin(), phases.end(), SyncPhase::Syncing) != phases.end());
    REQUIRE(coordinator.pendingCount() == 0);
    REQUIRE(h.engine->queue().records().empty());
    REQUIRE(h.remote->calls.size() == 3);
    for (size_t i = 0; i < expenses.size(); ++i) {
        REQUIRE(h.remote->calls[i].entity_id == expenses[i].id);
    }
    REQUIRE(h.engine->ledger().size() == 3);
}

TEST_CASE("Offline: a write the remote always rejects ends failed", "[integration]") {
    Harness h(false);
    h.remote->responder = [](const FakeRemote::Call&) { return validation_failure(); };

    const auto expense = sample_expense("bad amount", -1.0);
    REQUIRE(h.create(expense) == WriteOutcome::Queued);

    h.backend->set_online(true);
    REQUIRE(h.settled());
    REQUIRE(wait_until([&]() { return h.engine->coordinator().phase() == SyncPhase::Error; }));

    auto& coordinator = h.engine->coordinator();
    REQUIRE(coordinator.failedCount() == 1);

    const auto records = coordinator.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].status == RecordStatus::Failed);
    REQUIRE(records[0].attempt_count == 5);
    REQUIRE(h.remote->calls_for(expense.id) == 1);

    // The optimistic entry is kept; the failure is shown in the details view.
    REQUIRE(h.engine->ledger().find(expense.id).has_value());
}

TEST_CASE("Online: a write dropped mid-call is queued and retried", "[integration]") {
    Harness h(true);
    h.remote->script.push_back(transient_failure());

    const auto expense = sample_expense();
    REQUIRE(h.create(expense) == WriteOutcome::Queued);
    REQUIRE(h.engine->ledger().find(expense.id) == expense);
    REQUIRE(h.engine->queue().pendingCount() == 1);

    // The retry timer delivers it without further action.
    REQUIRE(wait_until([&]() { return h.engine->queue().records().empty(); }));
    REQUIRE(h.remote->calls_for(expense.id) == 2);
    REQUIRE(h.engine->ledger().find(expense.id) == expense);
}

TEST_CASE("Offline: edits of one expense replay in order", "[integration]") {
    Harness h(false);
    auto expense = sample_expense("draft", 5.0);
    REQUIRE(h.create(expense) == WriteOutcome::Queued);

    std::optional<Result<WriteOutcome, Error>> updated;
    h.engine->router().updateExpense(with_amount(expense, 7.5),
        [&](Result<WriteOutcome, Error> r) { updated = std::move(r); });
    REQUIRE(updated->unwrap() == WriteOutcome::Queued);

    std::optional<Result<WriteOutcome, Error>> removed;
    h.engine->router().removeExpense(expense.id,
        [&](Result<WriteOutcome, Error> r) { removed = std::move(r); });
    REQUIRE(removed->unwrap() == WriteOutcome::Queued);
    REQUIRE_FALSE(h.engine->ledger().find(expense.id).has_value());

    h.backend->set_online(true);
    REQUIRE(wait_until([&]() { return h.engine->queue().records().empty(); }));

    REQUIRE(h.remote->calls.size() == 3);
    REQUIRE(h.remote->calls[0].operation == OperationType::Create);
    REQUIRE(h.remote->calls[1].operation == OperationType::Update);
    REQUIRE(h.remote->calls[2].operation == OperationType::Delete);
}

TEST_CASE("Offline: a retried create is not overtaken by its edits", "[integration]") {
    Harness h(false);
    auto expense = sample_expense("draft", 5.0);
    REQUIRE(h.create(expense) == WriteOutcome::Queued);

    std::optional<Result<WriteOutcome, Error>> updated;
    h.engine->router().updateExpense(with_amount(expense, 7.5),
        [&](Result<WriteOutcome, Error> r) { updated = std::move(r); });
    REQUIRE(updated->unwrap() == WriteOutcome::Queued);

    SECTION("create, retried create, then update") {
        h.remote->script.push_back(transient_failure());
        h.backend->set_online(true);
        REQUIRE(wait_until([&]() { return h.engine->queue().records().empty(); }));

        REQUIRE(h.remote->calls.size() == 3);
        REQUIRE(h.remote->calls[0].operation == OperationType::Create);
        REQUIRE(h.remote->calls[1].operation == OperationType::Create);
        REQUIRE(h.remote->calls[2].operation == OperationType::Update);
        REQUIRE(h.engine->ledger().find(expense.id)->amount == 7.5);
    }

    SECTION("a later delete waits for the create as well") {
        std::optional<Result<WriteOutcome, Error>> removed;
        h.engine->router().removeExpense(expense.id,
            [&](Result<WriteOutcome, Error> r) { removed = std::move(r); });
        REQUIRE(removed->unwrap() == WriteOutcome::Queued);

        h.remote->script.push_back(transient_failure());
        h.remote->script.push_back(transient_failure());
        h.backend->set_online(true);
        REQUIRE(wait_until([&]() { return h.engine->queue().records().empty(); }));

        REQUIRE(h.remote->calls.size() == 5);
        for (size_t i = 0; i < 3; ++i) {
            REQUIRE(h.remote->calls[i].operation == OperationType::Create);
        }
        REQUIRE(h.remote->calls[3].operation == OperationType::Update);
        REQUIRE(h.remote->calls[4].operation == OperationType::Delete);
    }
}

TEST_CASE("Offline: a receipt import syncs as one batch", "[integration]") {
    Harness h(false);
    const std::vector<Expense> receipt{
        sample_expense("apples", 2.0), sample_expense("flour", 1.4)};

    std::optional<Result<WriteOutcome, Error>> outcome;
    h.engine->router().submitBatch(receipt,
        [&](Result<WriteOutcome, Error> r) { outcome = std::move(r); });
    REQUIRE(outcome->unwrap() == WriteOutcome::Queued);
    REQUIRE(h.engine->coordinator().pendingCount() == 2);

    h.backend->set_online(true);
    REQUIRE(wait_until([&]() { return h.engine->queue().records().empty(); }));
    REQUIRE(h.remote->calls[0].entity_id == receipt[0].id);
    REQUIRE(h.remote->calls[1].entity_id == receipt[1].id);
}
