#pragma once

#include "core/types.hpp"
#include <string>
#include <optional>

namespace tally {

/**
 * Expense - A user-owned spending entry.
 *
 * Category and type are free-form labels chosen in the entry form; the
 * taxonomy behind them lives outside the sync core.
 */
struct Expense {
    Uuid id;
    std::string description;
    double amount = 0.0;
    std::string category;
    std::string type;
    Timestamp date;
    std::optional<std::string> note;

    bool operator==(const Expense&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a new expense with a locally generated id.
 */
[[nodiscard]] inline Expense create_expense(
    std::string description,
    double amount,
    std::string category,
    std::string type,
    Timestamp date = Timestamp::now(),
    std::optional<std::string> note = std::nullopt
) {
    return Expense{
        .id = Uuid::generate(),
        .description = std::move(description),
        .amount = amount,
        .category = std::move(category),
        .type = std::move(type),
        .date = date,
        .note = std::move(note)
    };
}

[[nodiscard]] inline Expense with_amount(Expense expense, double amount) {
    expense.amount = amount;
    return expense;
}

[[nodiscard]] inline Expense with_description(Expense expense, std::string description) {
    expense.description = std::move(description);
    return expense;
}

[[nodiscard]] inline Expense with_note(Expense expense, std::optional<std::string> note) {
    expense.note = std::move(note);
    return expense;
}

} // namespace tally
