#pragma once

#include <types/failure.hpp>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace TransferHub
{

/**
 * Outcome of a public operation: either a value or a Failure.
 * Expected error conditions travel through here, never as exceptions.
 */
template <typename T>
class Result
{
    public:
    static Result success(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result fail(Failure failure)
    {
        return Result(std::in_place_index<1>, std::move(failure));
    }

    template <typename F, typename = std::enable_if_t<std::is_constructible_v<Failure, F>>>
    static Result fail(F failure)
    {
        return Result(std::in_place_index<1>, Failure(std::move(failure)));
    }

    bool isSuccess() const
    {
        return outcome.index() == 0;
    }

    bool isFailure() const
    {
        return outcome.index() == 1;
    }

    explicit operator bool() const
    {
        return isSuccess();
    }

    const T &value() const &
    {
        if (!isSuccess())
        {
            throw std::logic_error("Result::value() called on a failure: " + failureMessage(std::get<1>(outcome)));
        }
        return std::get<0>(outcome);
    }

    T &value() &
    {
        if (!isSuccess())
        {
            throw std::logic_error("Result::value() called on a failure: " + failureMessage(std::get<1>(outcome)));
        }
        return std::get<0>(outcome);
    }

    T &&value() &&
    {
        if (!isSuccess())
        {
            throw std::logic_error("Result::value() called on a failure: " + failureMessage(std::get<1>(outcome)));
        }
        return std::get<0>(std::move(outcome));
    }

    T valueOr(T fallback) const
    {
        return isSuccess() ? std::get<0>(outcome) : std::move(fallback);
    }

    const Failure &failure() const
    {
        if (!isFailure())
        {
            throw std::logic_error("Result::failure() called on a success");
        }
        return std::get<1>(outcome);
    }

    private:
    template <size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V &&v) : outcome(tag, std::forward<V>(v))
    {
    }

    std::variant<T, Failure> outcome;
};

template <>
class Result<void>
{
    public:
    static Result success()
    {
        return Result();
    }

    static Result fail(Failure failure)
    {
        Result result;
        result.error = std::move(failure);
        return result;
    }

    template <typename F, typename = std::enable_if_t<std::is_constructible_v<Failure, F>>>
    static Result fail(F failure)
    {
        return fail(Failure(std::move(failure)));
    }

    bool isSuccess() const
    {
        return !error.has_value();
    }

    bool isFailure() const
    {
        return error.has_value();
    }

    explicit operator bool() const
    {
        return isSuccess();
    }

    const Failure &failure() const
    {
        if (!error)
        {
            throw std::logic_error("Result::failure() called on a success");
        }
        return *error;
    }

    private:
    Result() = default;

    std::optional<Failure> error;
};

} // namespace TransferHub
