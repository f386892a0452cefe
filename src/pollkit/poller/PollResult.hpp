#pragma once

#include <cstddef>
#include <optional>
#include <utility>

namespace pollkit
{

// Outcome of one Poll call: attempts made and the output of the last one.
// result is empty when the last attempt ended in a suppressed exception.
template <typename T>
struct PollResult
{
    std::size_t count = 0;
    std::optional<T> result;

    bool HasResult() const noexcept { return result.has_value(); }

    // Throws std::bad_optional_access when there is no result.
    const T& Get() const { return result.value(); }

    template <typename U>
    T ValueOr(U&& fallback) const
    {
        return result.value_or(std::forward<U>(fallback));
    }
};

} // namespace pollkit
