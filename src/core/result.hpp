#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace nom {

/**
 * ErrorKind - The failure classes a store operation can report.
 */
enum class ErrorKind {
    Persistence,   // Underlying medium unreadable or unwritable
    NotFound,      // No item with the requested identifier
    InvalidState,  // Illegal batch nesting or call sequencing
    InvalidInput   // Malformed data handed in from outside the store
};

[[nodiscard]] inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Persistence: return "persistence";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::InvalidState: return "invalid state";
        case ErrorKind::InvalidInput: return "invalid input";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure kind, a message and an optional code.
 *
 * For persistence failures `code` holds the SQLite result code.
 */
struct Error {
    ErrorKind kind{ErrorKind::Persistence};
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    [[nodiscard]] static Error persistence(std::string msg, int c = 0) {
        return Error{ErrorKind::Persistence, std::move(msg), c};
    }

    [[nodiscard]] static Error not_found(std::string msg) {
        return Error{ErrorKind::NotFound, std::move(msg)};
    }

    [[nodiscard]] static Error invalid_state(std::string msg) {
        return Error{ErrorKind::InvalidState, std::move(msg)};
    }

    [[nodiscard]] static Error invalid_input(std::string msg) {
        return Error{ErrorKind::InvalidInput, std::move(msg)};
    }

    [[nodiscard]] bool is_not_found() const noexcept { return kind == ErrorKind::NotFound; }
    [[nodiscard]] bool is_invalid_state() const noexcept { return kind == ErrorKind::InvalidState; }
    [[nodiscard]] bool is_persistence() const noexcept { return kind == ErrorKind::Persistence; }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - Either a success value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<Item> find(int64_t id) {
 *       if (!known(id)) return Result<Item>::err(Error::not_found("no such item"));
 *       return Result<Item>::ok(lookup(id));
 *   }
 *
 *   auto title = find(7).map([](const Item& i) { return i.title; });
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

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
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

    // Index-based access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
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

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

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

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

using VoidResult = Result<void, Error>;

} // namespace nom
