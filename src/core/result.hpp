#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace tally {

/**
 * ErrorKind - Classification that drives retry decisions.
 *
 * - Transient:  network drop, timeout, 5xx. Retried with backoff.
 * - Validation: the remote rejected the write. Never retried automatically.
 * - Durability: the local store could not persist the write.
 * - State:      API misuse (store not open, unknown record, ...).
 */
enum class ErrorKind {
    Transient,
    Validation,
    Durability,
    State
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Durability: return "durability";
        case ErrorKind::State: return "state";
    }
    return "state";
}

[[nodiscard]] inline ErrorKind error_kind_from_string(std::string_view text) noexcept {
    if (text == "transient") return ErrorKind::Transient;
    if (text == "validation") return ErrorKind::Validation;
    if (text == "durability") return ErrorKind::Durability;
    return ErrorKind::State;
}

/**
 * Error type for Result - a failure with a message, an optional
 * backend code (SQLite rc, HTTP status) and a kind.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::State};

    Error() = default;
    explicit Error(std::string msg, int c = 0, ErrorKind k = ErrorKind::State)
        : message(std::move(msg)), code(c), kind(k) {}

    [[nodiscard]] static Error transient(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Transient};
    }

    [[nodiscard]] static Error validation(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Validation};
    }

    [[nodiscard]] static Error durability(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Durability};
    }

    [[nodiscard]] bool is_retryable() const noexcept {
        return kind == ErrorKind::Transient;
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Result<T, E> - Either a value (ok) or an error (err).
 *
 * Usage:
 *   Result<Uuid> enqueue(...) {
 *       if (!store_open) return Result<Uuid>::err(Error{"store closed"});
 *       return Result<Uuid>::ok(id);
 *   }
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     */
    [[nodiscard]] T& unwrap() & {
        ensure_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        ensure_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        ensure_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    /**
     * Run a side effect (usually logging) on error, returning this unchanged.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void ensure_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based access so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using Status = Result<void, Error>;

} // namespace tally
