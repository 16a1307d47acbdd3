#pragma once

#include "core/expense.hpp"
#include "core/result.hpp"
#include <functional>

namespace tally::sync {

/**
 * RemoteRepository - The remote expense store.
 *
 * Every call completes exactly once, asynchronously or not, with ok or
 * an error of kind Transient or Validation.
 */
class RemoteRepository {
public:
    using Completion = std::function<void(Result<void, Error>)>;

    virtual ~RemoteRepository() = default;

    virtual void create(const Expense& expense, Completion done) = 0;
    virtual void update(const Expense& expense, Completion done) = 0;
    virtual void remove(const Uuid& id, Completion done) = 0;
};

} // namespace tally::sync
