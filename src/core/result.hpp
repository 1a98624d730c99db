#pragma once

#include <cstddef>
#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace clockface {

/**
 * Failure categories carried in Error::code.
 */
enum class ErrorCode : int {
    None = 0,
    TypeMismatch = 1,   // a component or delta is not an integral value
    OutOfRange = 2,     // a component lies outside its bound
    Malformed = 3,      // input is not shaped like a clock value
    Usage = 4,          // command line does not name a known command or arity
};

/**
 * Error type for Result - a message plus an ErrorCode stored as int.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(std::string msg, ErrorCode c) : message(std::move(msg)), code(static_cast<int>(c)) {}

    [[nodiscard]] static Error type_mismatch(std::string msg) {
        return Error{std::move(msg), ErrorCode::TypeMismatch};
    }

    [[nodiscard]] static Error out_of_range(std::string msg) {
        return Error{std::move(msg), ErrorCode::OutOfRange};
    }

    [[nodiscard]] static Error malformed(std::string msg) {
        return Error{std::move(msg), ErrorCode::Malformed};
    }

    [[nodiscard]] static Error usage(std::string msg) {
        return Error{std::move(msg), ErrorCode::Usage};
    }

    [[nodiscard]] ErrorCode kind() const noexcept {
        return static_cast<ErrorCode>(code);
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

/**
 * Result<T, E> - either a success value (Ok) or an error (Err).
 *
 * Fallible clock operations return a Result instead of throwing:
 *
 *   auto text = ClockValue::create(12, 30, 45)
 *       .map([](ClockValue c) { return c.add_seconds(3665).to_string(); });
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
     * Get the success value, throwing std::runtime_error if this is an error.
     * Reserved for branches where the error case cannot happen.
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
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
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, NewE>::ok(std::get<0>(data_));
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
     * or_else : Result<T, E> -> (E -> Result<T, F>) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto or_else(F&& f) const& -> std::invoke_result_t<F, const E&> {
        using ResultT = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return ResultT::ok(std::get<0>(data_));
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed access keeps T == E (e.g. Result<Error>) unambiguous.
    std::variant<T, E> data_;
};

template<typename T>
using Res = Result<T, Error>;

} // namespace clockface
