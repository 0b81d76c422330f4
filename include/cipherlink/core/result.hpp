#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace cipherlink {

/// Success payload of operations that produce nothing
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};

inline constexpr Unit unit{};

/**
 * @brief Value or failure, never both
 *
 * Every fallible operation in the library returns a Result; exceptions are
 * reserved for misuse (unwrapping the wrong side).
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) { return Result(std::in_place_index<VALUE_SIDE>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<ERROR_SIDE>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == VALUE_SIDE; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == ERROR_SIDE; }

    [[nodiscard]] T& Unwrap() & { return Checked<VALUE_SIDE>(state_); }
    [[nodiscard]] const T& Unwrap() const& { return Checked<VALUE_SIDE>(state_); }
    [[nodiscard]] T Unwrap() && { return std::move(Checked<VALUE_SIDE>(state_)); }

    [[nodiscard]] E& UnwrapErr() & { return Checked<ERROR_SIDE>(state_); }
    [[nodiscard]] const E& UnwrapErr() const& { return Checked<ERROR_SIDE>(state_); }
    [[nodiscard]] E UnwrapErr() && { return std::move(Checked<ERROR_SIDE>(state_)); }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::move(std::get<VALUE_SIDE>(state_)) : std::move(fallback);
    }

    /// Discards the failure
    [[nodiscard]] std::optional<T> Ok() && {
        if (IsErr()) {
            return std::nullopt;
        }
        return std::optional<T>(std::move(std::get<VALUE_SIDE>(state_)));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& transform) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::move(std::get<ERROR_SIDE>(state_)));
        }
        return Mapped::Ok(std::forward<F>(transform)(std::move(std::get<VALUE_SIDE>(state_))));
    }

    /// Chains a step that can itself fail with the same error type
    template<typename F>
    [[nodiscard]] auto Bind(F&& next) && -> std::invoke_result_t<F, T> {
        using Chained = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Chained::error_type, E>, "Bind must keep the error type");
        if (IsErr()) {
            return Chained::Err(std::move(std::get<ERROR_SIDE>(state_)));
        }
        return std::forward<F>(next)(std::move(std::get<VALUE_SIDE>(state_)));
    }

    template<typename F>
    Result& InspectErr(F&& observer) & {
        if (const auto* error = std::get_if<ERROR_SIDE>(&state_)) {
            std::forward<F>(observer)(*error);
        }
        return *this;
    }

private:
    static constexpr std::size_t VALUE_SIDE = 0;
    static constexpr std::size_t ERROR_SIDE = 1;

    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> side, Args&&... args)
        : state_(side, std::forward<Args>(args)...) {}

    template<std::size_t I, typename Storage>
    static decltype(auto) Checked(Storage& state) {
        if (state.index() != I) {
            throw std::runtime_error(I == VALUE_SIDE ? "Unwrap() on a failed Result" : "UnwrapErr() on a successful Result");
        }
        return std::get<I>(state);
    }

    std::variant<T, E> state_;
};

} // namespace cipherlink
