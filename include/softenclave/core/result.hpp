#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace softenclave::channel {

/// Value type of results that carry no payload.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/// Error in transit from SOFTENCLAVE_TRY; converts into any Result with error type E.
template<typename E>
struct PropagatedError {
    E error;
};

template<typename E>
[[nodiscard]] PropagatedError<std::decay_t<E>> Propagate(E&& error) {
    return PropagatedError<std::decay_t<E>>{std::forward<E>(error)};
}

/**
 * @brief Either a value of T or an error of E
 *
 * Every fallible operation in the library returns one of these. Unwrapping the
 * wrong side is a programming error and throws std::logic_error.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(PropagatedError<E> propagated)
        : state_(std::in_place_index<kErrIndex>, std::move(propagated.error)) {}

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<kOkIndex>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<kErrIndex>, std::move(error));
    }

    [[nodiscard]] static Result FromOptional(std::optional<T> value, E error_if_empty) {
        return value.has_value() ? Ok(std::move(*value)) : Err(std::move(error_if_empty));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kOkIndex; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kErrIndex; }

    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<kErrIndex>(state_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOkIndex>(state_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOkIndex>(state_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOkIndex>(std::move(state_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErrIndex>(state_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErrIndex>(state_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErrIndex>(std::move(state_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<kOkIndex>(std::move(state_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kErrIndex>(std::move(state_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kOkIndex>(std::move(state_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kOkIndex>(std::move(state_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<kErrIndex>(std::move(state_))));
    }

    /// Chains another fallible step; the step must fail with the same error type.
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind step must return a Result with the same error type");
        if (IsErr()) {
            return Next::Err(std::get<kErrIndex>(std::move(state_)));
        }
        return std::forward<F>(func)(std::get<kOkIndex>(std::move(state_)));
    }

    template<typename F>
    Result& InspectErr(F&& func) & {
        if (IsErr()) {
            std::forward<F>(func)(std::get<kErrIndex>(state_));
        }
        return *this;
    }

private:
    static constexpr std::size_t kOkIndex = 0;
    static constexpr std::size_t kErrIndex = 1;

    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> index, V&& value)
        : state_(index, std::forward<V>(value)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Result::Unwrap called on an error");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("Result::UnwrapErr called on a value");
        }
    }

    std::variant<T, E> state_;
};

}  // namespace softenclave::channel

// Early-returns the error of result_expr from a function whose Result has the same error type.
#define SOFTENCLAVE_TRY(result_expr) \
    do { \
        auto&& softenclave_try_result_ = (result_expr); \
        if (softenclave_try_result_.IsErr()) { \
            return ::softenclave::channel::Propagate( \
                std::move(softenclave_try_result_).UnwrapErr()); \
        } \
    } while (0)
