#include <catch2/catch_test_macros.hpp>
#include "core/expense_ledger.hpp"

using namespace tally;

namespace {

Expense at(std::string description, int64_t day) {
    return create_expense(std::move(description), 10.0, "food", "essential",
                          Timestamp(day * 86'400'000));
}

} // namespace

TEST_CASE("Ledger keeps entries newest first", "[ledger]") {
    ExpenseLedger ledger({at("old", 1), at("new", 3), at("mid", 2)});

    REQUIRE(ledger.all()[0].description == "new");
    REQUIRE(ledger.all()[1].description == "mid");
    REQUIRE(ledger.all()[2].description == "old");

    REQUIRE(ledger.apply_create(at("newest", 4)).is_ok());
    REQUIRE(ledger.all().front().description == "newest");
    REQUIRE(ledger.total_amount() == 40.0);
}

TEST_CASE("Ledger snapshots undo each mutation exactly", "[ledger]") {
    const auto a = at("a", 3);
    const auto b = at("b", 2);
    const auto c = at("c", 1);
    ExpenseLedger ledger({a, b, c});
    const auto before = ledger.all();

    int notifications = 0;
    ledger.on_changed = [&]() { ++notifications; };

    SECTION("create") {
        auto snapshot = ledger.apply_create(at("d", 5)).unwrap();
        REQUIRE(ledger.size() == 4);
        ledger.restore(snapshot);
        REQUIRE(ledger.all() == before);
    }

    SECTION("update that moves the entry") {
        auto snapshot = ledger.apply_update(with_description(
            Expense{b.id, b.description, 99.0, b.category, b.type, Timestamp(10 * 86'400'000), b.note},
            "moved")).unwrap();
        REQUIRE(ledger.all().front().description == "moved");
        ledger.restore(snapshot);
        REQUIRE(ledger.all() == before);
    }

    SECTION("remove from the middle") {
        auto snapshot = ledger.apply_remove(b.id).unwrap();
        REQUIRE_FALSE(ledger.find(b.id).has_value());
        ledger.restore(snapshot);
        REQUIRE(ledger.all() == before);
        REQUIRE(ledger.all()[1] == b);
    }

    REQUIRE(notifications == 2);
}

TEST_CASE("Ledger rejects impossible mutations", "[ledger]") {
    const auto a = at("a", 1);
    ExpenseLedger ledger({a});

    REQUIRE(ledger.apply_create(a).is_err());
    REQUIRE(ledger.apply_update(at("ghost", 2)).is_err());
    REQUIRE(ledger.apply_remove(Uuid::generate()).is_err());
    REQUIRE(ledger.size() == 1);
}
