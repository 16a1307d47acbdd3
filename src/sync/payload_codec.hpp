#pragma once

#include "core/expense.hpp"
#include "core/write_record.hpp"
#include "core/result.hpp"
#include <QJsonObject>
#include <string>
#include <string_view>

namespace tally::sync {

// Collection name used for expense writes.
inline constexpr const char* EXPENSES_COLLECTION = "expenses";

/**
 * Expense <-> JSON object with the remote column names:
 * id, description, amount, category, type, date (ISO 8601 UTC), note.
 */
[[nodiscard]] QJsonObject expense_to_json(const Expense& expense);
[[nodiscard]] Result<Expense, Error> expense_from_json(const QJsonObject& object);

/**
 * Compact JSON text, as stored in QueuedWriteRecord::payload.
 */
[[nodiscard]] std::string encode_expense(const Expense& expense);
[[nodiscard]] Result<Expense, Error> decode_expense(std::string_view payload);

/**
 * Build the queued form of an expense write. Deletes carry only the id.
 */
[[nodiscard]] WriteRequest make_expense_request(OperationType operation, const Expense& expense);

} // namespace tally::sync
