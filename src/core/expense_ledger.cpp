#include "core/expense_ledger.hpp"

#include <algorithm>

namespace tally {

namespace {

bool newer_first(const Expense& a, const Expense& b) {
    return a.date > b.date;
}

} // namespace

ExpenseLedger::ExpenseLedger(std::vector<Expense> expenses)
    : expenses_(std::move(expenses))
{
    std::stable_sort(expenses_.begin(), expenses_.end(), newer_first);
}

std::optional<size_t> ExpenseLedger::index_of(const Uuid& id) const {
    for (size_t i = 0; i < expenses_.size(); ++i) {
        if (expenses_[i].id == id) return i;
    }
    return std::nullopt;
}

std::optional<Expense> ExpenseLedger::find(const Uuid& id) const {
    auto index = index_of(id);
    if (!index) return std::nullopt;
    return expenses_[*index];
}

void ExpenseLedger::insert_sorted(Expense expense) {
    auto pos = std::upper_bound(expenses_.begin(), expenses_.end(), expense, newer_first);
    expenses_.insert(pos, std::move(expense));
}

void ExpenseLedger::notify() {
    if (on_changed) on_changed();
}

Result<LedgerSnapshot, Error> ExpenseLedger::apply_create(const Expense& expense) {
    if (index_of(expense.id)) {
        return Result<LedgerSnapshot, Error>::err(
            Error{"Expense " + expense.id.to_string() + " already exists"});
    }

    LedgerSnapshot snapshot{.expense_id = expense.id, .prior = std::nullopt, .prior_index = 0};
    insert_sorted(expense);
    notify();
    return Result<LedgerSnapshot, Error>::ok(std::move(snapshot));
}

Result<LedgerSnapshot, Error> ExpenseLedger::apply_update(const Expense& expense) {
    auto index = index_of(expense.id);
    if (!index) {
        return Result<LedgerSnapshot, Error>::err(
            Error{"Expense " + expense.id.to_string() + " not found"});
    }

    LedgerSnapshot snapshot{.expense_id = expense.id,
                            .prior = expenses_[*index],
                            .prior_index = *index};
    expenses_.erase(expenses_.begin() + static_cast<std::ptrdiff_t>(*index));
    insert_sorted(expense);
    notify();
    return Result<LedgerSnapshot, Error>::ok(std::move(snapshot));
}

Result<LedgerSnapshot, Error> ExpenseLedger::apply_remove(const Uuid& id) {
    auto index = index_of(id);
    if (!index) {
        return Result<LedgerSnapshot, Error>::err(
            Error{"Expense " + id.to_string() + " not found"});
    }

    LedgerSnapshot snapshot{.expense_id = id,
                            .prior = expenses_[*index],
                            .prior_index = *index};
    expenses_.erase(expenses_.begin() + static_cast<std::ptrdiff_t>(*index));
    notify();
    return Result<LedgerSnapshot, Error>::ok(std::move(snapshot));
}

void ExpenseLedger::restore(const LedgerSnapshot& snapshot) {
    if (auto current = index_of(snapshot.expense_id)) {
        expenses_.erase(expenses_.begin() + static_cast<std::ptrdiff_t>(*current));
    }
    if (snapshot.prior) {
        auto index = std::min(snapshot.prior_index, expenses_.size());
        expenses_.insert(expenses_.begin() + static_cast<std::ptrdiff_t>(index), *snapshot.prior);
    }
    notify();
}

double ExpenseLedger::total_amount() const {
    double total = 0.0;
    for (const auto& expense : expenses_) {
        total += expense.amount;
    }
    return total;
}

} // namespace tally
