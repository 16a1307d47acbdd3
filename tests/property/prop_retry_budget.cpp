#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/queue_service.hpp"
#include "test_support.hpp"
#include <map>

using namespace tally;
using namespace tally::sync;
using namespace tally::testing;

namespace {

enum Outcome { Ok = 0, Transient = 1, Invalid = 2 };

struct Expected {
    bool delivered = false;
    int calls = 0;
};

// What should happen to one record whose remote answers follow `script`
// (answers past the end of the script are successes).
Expected expected_for(const std::vector<int>& script, int max_attempts) {
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        const int outcome = attempt < static_cast<int>(script.size()) ? script[attempt] : Ok;
        if (outcome == Ok) return Expected{true, attempt + 1};
        if (outcome == Invalid) return Expected{false, attempt + 1};
    }
    return Expected{false, max_attempts};
}

Result<void, Error> answer(int outcome) {
    switch (outcome) {
        case Transient: return transient_failure();
        case Invalid: return validation_failure();
        default: return Result<void, Error>::ok();
    }
}

} // namespace

TEST_CASE("Property: a transition sequence never exceeds the budget", "[property][retry]") {
    rc::check("records end removed, or failed with attempt_count == max_attempts",
        []() {
            const int max_attempts = *rc::gen::inRange(1, 8);
            const auto script = *rc::gen::container<std::vector<int>>(
                static_cast<size_t>(*rc::gen::inRange(0, 10)), rc::gen::inRange(0, 3));
            const RetryPolicy policy{
                .max_attempts = max_attempts,
                .backoff_base = std::chrono::milliseconds(1000),
                .backoff_cap = std::chrono::milliseconds(60000)
            };

            auto record = make_record(sample_request(sample_expense()), Timestamp(1));
            int calls = 0;
            bool delivered = false;
            while (record.status == RecordStatus::Pending) {
                record = mark_syncing(record, Timestamp(100 + calls));
                const int outcome = calls < static_cast<int>(script.size()) ? script[calls] : Ok;
                ++calls;
                if (outcome == Ok) {
                    delivered = true;
                    break;
                }
                record = mark_attempt_failed(record, answer(outcome).unwrap_err(), policy,
                                             Timestamp(100 + calls));
                RC_ASSERT(record.attempt_count <= max_attempts);
            }

            const auto expected = expected_for(script, max_attempts);
            RC_ASSERT(delivered == expected.delivered);
            RC_ASSERT(calls == expected.calls);
            if (!delivered) {
                RC_ASSERT(record.status == RecordStatus::Failed);
                RC_ASSERT(record.attempt_count == max_attempts);
            }
            return true;
        }
    );
}

TEST_CASE("Property: the queue honours the attempt budget end to end", "[property][retry]") {
    rc::check("every queued record is delivered or fails after exactly max_attempts",
        []() {
            const int max_attempts = *rc::gen::inRange(1, 6);
            const int record_count = *rc::gen::inRange(1, 6);

            auto db = open_test_database();
            storage::PersistentQueueStore store(db);
            FakeRemote remote;
            QueueService queue(store, remote, RetryPolicy{
                .max_attempts = max_attempts,
                .backoff_base = std::chrono::milliseconds(0),
                .backoff_cap = std::chrono::milliseconds(0)
            });
            RC_ASSERT(queue.loadFromStore().is_ok());

            std::map<Uuid, std::vector<int>> scripts;
            std::map<Uuid, Uuid> record_of;
            for (int i = 0; i < record_count; ++i) {
                const auto expense = sample_expense("item " + std::to_string(i));
                scripts[expense.id] = *rc::gen::container<std::vector<int>>(
                    static_cast<size_t>(*rc::gen::inRange(0, 8)), rc::gen::inRange(0, 3));
                record_of[expense.id] = queue.enqueueSingle(sample_request(expense)).unwrap();
            }

            remote.responder = [&](const FakeRemote::Call& call) {
                const auto& script = scripts[call.entity_id];
                const auto attempt = static_cast<size_t>(remote.calls_for(call.entity_id) - 1);
                return answer(attempt < script.size() ? script[attempt] : Ok);
            };

            queue.processQueue();
            RC_ASSERT(wait_until([&]() { return queue.pendingCount() == 0 && !queue.isProcessing(); }));

            for (const auto& [entity_id, script] : scripts) {
                const auto expected = expected_for(script, max_attempts);
                RC_ASSERT(remote.calls_for(entity_id) == expected.calls);

                const auto record = queue.record(record_of[entity_id]);
                const auto stored = store.get(record_of[entity_id]).unwrap();
                if (expected.delivered) {
                    RC_ASSERT(!record.has_value());
                    RC_ASSERT(!stored.has_value());
                } else {
                    RC_ASSERT(record.has_value());
                    RC_ASSERT(record->status == RecordStatus::Failed);
                    RC_ASSERT(record->attempt_count == max_attempts);
                    RC_ASSERT(stored.has_value());
                    RC_ASSERT(*stored == *record);
                }
            }
            RC_ASSERT(queue.scheduledRetryCount() == 0);
            return true;
        }
    );
}
