#ifndef SLOTWATCH_CORE_RESULT_HPP
#define SLOTWATCH_CORE_RESULT_HPP

/**
 * @file Result.hpp
 * @brief Value-or-status return type.
 *
 * A lightweight `Result<T>` similar to C++23's `std::expected`, built on
 * the shared `Status` so callers can forward failures unchanged.
 */

#include "common/Types.hpp"

#include <utility>

namespace slotwatch
{
/**
 * @brief Result type for operations that return a value or error.
 *
 * @tparam T The type of the value on success
 *
 * Example usage:
 * @code
 * auto result = api.fetchLocationDates(location);
 * if (result.failed()) {
 *     return result.status;
 * }
 * use(result.value);
 * @endcode
 */
template<typename T>
struct Result
{
    Status status{Status::Ok()};
    T value{};

    Result() = default;

    explicit Result(T val)
        : status(Status::Ok())
        , value(std::move(val))
    {
    }

    explicit Result(const Status err)
        : status(err)
        , value{}
    {
    }

    [[nodiscard]] bool ok() const
    {
        return status.ok();
    }

    [[nodiscard]] bool failed() const
    {
        return status.failed();
    }

    [[nodiscard]] explicit operator bool() const
    {
        return ok();
    }

    [[nodiscard]] static Result<T> Ok(T val)
    {
        return Result<T>{std::move(val)};
    }

    [[nodiscard]] static Result<T> Error(const Status err)
    {
        return Result<T>{err};
    }
};
} // namespace slotwatch

#endif // SLOTWATCH_CORE_RESULT_HPP
