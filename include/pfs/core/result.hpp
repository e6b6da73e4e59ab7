#pragma once
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace pfs::protocol {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/// Carries a failure out of a function without naming the full Result type.
template<typename E>
struct Failed {
    E error;
};

template<typename E>
Failed<std::decay_t<E>> Fail(E&& error) {
    return Failed<std::decay_t<E>>{std::forward<E>(error)};
}

/// Value-or-failure return type used across the public API. Nothing in pfs-core throws
/// across a module boundary; failures travel as the E alternative.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    Result(Failed<E> failed)
        : storage_(std::in_place_index<1>, std::move(failed.error)) {}

    static Result FromOptional(std::optional<T> opt, E error_if_none) {
        if (opt) {
            return Ok(std::move(*opt));
        }
        return Err(std::move(error_if_none));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<1>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<0>(std::move(storage_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] T UnwrapOrElse(F&& f) && {
        if (IsOk()) {
            return std::get<0>(std::move(storage_));
        }
        return std::invoke(std::forward<F>(f), std::get<1>(std::move(storage_)));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<1>(std::move(storage_)));
        }
        return Result<U, E>::Ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& f) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<0>(std::move(storage_)));
        }
        return Result<T, U>::Err(std::invoke(std::forward<F>(f), std::get<1>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto Bind(F&& f) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsErr()) {
            return Next::Err(std::get<1>(std::move(storage_)));
        }
        return std::invoke(std::forward<F>(f), std::get<0>(std::move(storage_)));
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : storage_(idx, std::forward<Args>(args)...) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> storage_;
};

}

// Early-returns the failure of `expr` from a function whose return type is
// Result<U, E> for the same E.
#define PFS_TRY(expr) \
    do { \
        auto&& pfs_try_result_ = (expr); \
        if (pfs_try_result_.IsErr()) { \
            return ::pfs::protocol::Fail(std::move(pfs_try_result_).UnwrapErr()); \
        } \
    } while (0)
