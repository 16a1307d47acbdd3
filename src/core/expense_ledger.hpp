#pragma once

#include "core/expense.hpp"
#include "core/result.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace tally {

/**
 * LedgerSnapshot - Prior state of one expense, captured before an
 * optimistic mutation so it can be undone.
 *
 * prior == nullopt means the expense did not exist (a create).
 */
struct LedgerSnapshot {
    Uuid expense_id;
    std::optional<Expense> prior;
    size_t prior_index = 0;
};

/**
 * ExpenseLedger - In-memory view of the user's expenses.
 *
 * Entries are kept newest-first by date. Every mutation returns the
 * snapshot needed to compensate it.
 */
class ExpenseLedger {
public:
    ExpenseLedger() = default;
    explicit ExpenseLedger(std::vector<Expense> expenses);

    [[nodiscard]] const std::vector<Expense>& all() const { return expenses_; }
    [[nodiscard]] size_t size() const { return expenses_.size(); }
    [[nodiscard]] std::optional<Expense> find(const Uuid& id) const;

    [[nodiscard]] Result<LedgerSnapshot, Error> apply_create(const Expense& expense);
    [[nodiscard]] Result<LedgerSnapshot, Error> apply_update(const Expense& expense);
    [[nodiscard]] Result<LedgerSnapshot, Error> apply_remove(const Uuid& id);

    /**
     * Undo a mutation: the entry returns to exactly its captured state
     * and position.
     */
    void restore(const LedgerSnapshot& snapshot);

    /**
     * Total amount over all entries.
     */
    [[nodiscard]] double total_amount() const;

    // Fired after every mutation or restore.
    std::function<void()> on_changed;

private:
    std::vector<Expense> expenses_;

    [[nodiscard]] std::optional<size_t> index_of(const Uuid& id) const;
    void insert_sorted(Expense expense);
    void notify();
};

} // namespace tally
