#pragma once

#include "ExceptionMatcher.hpp"
#include "PollResult.hpp"
#include "PollerError.hpp"
#include "../api/Logger.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace pollkit
{

namespace detail
{

template <typename T>
struct is_std_function : std::false_type
{
};

template <typename R, typename... Args>
struct is_std_function<std::function<R(Args...)>> : std::true_type
{
};

template <typename F>
bool IsEmptyCallable(const F& f)
{
    using Decayed = std::decay_t<F>;
    if constexpr (is_std_function<Decayed>::value)
        return !f;
    else if constexpr (std::is_pointer_v<Decayed> || std::is_member_pointer_v<Decayed>)
        return f == nullptr;
    else
        return false;
}

} // namespace detail

/**
 * @brief Re-runs a function until its output satisfies a predicate
 *
 * The subclass decides when to give up (attempt budget, time budget). The
 * base class owns the exception allow-list: an exception matching one of
 * the entries is logged and turns the attempt into an output-less one;
 * anything else leaves Poll unchanged.
 *
 * Poll keeps all per-call state on the stack, so one instance can be used
 * from several threads at once.
 */
class Poller
{
public:
    // One attempt; returns true when polling should stop successfully.
    using Attempt = std::function<bool()>;

    virtual ~Poller() = default;

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    /**
     * @brief Poll with fresh input each attempt
     * @param supplier Called once per attempt to produce the function's input
     * @param function Work to retry; may throw
     * @param predicate Tested against every produced output
     * @return Attempts made and the last output (empty if it was suppressed)
     */
    template <typename Supplier, typename Function, typename Predicate>
    auto Poll(Supplier&& supplier, Function&& function, Predicate&& predicate) const
        -> PollResult<std::decay_t<std::invoke_result_t<Function&, std::invoke_result_t<Supplier&>>>>
    {
        using Output = std::decay_t<std::invoke_result_t<Function&, std::invoke_result_t<Supplier&>>>;
        static_assert(!std::is_void_v<Output>, "Poll(action, condition) handles functions without output");

        CheckCallable(supplier, "input supplier");
        CheckCallable(function, "function");
        CheckCallable(predicate, "predicate");

        std::optional<Output> last;
        const auto count = RunAttempts([&]() {
            last = Execute(function, std::invoke(supplier));
            return last.has_value() && static_cast<bool>(std::invoke(predicate, std::as_const(*last)));
        });
        return PollResult<Output>{ count, std::move(last) };
    }

    /**
     * @brief Poll a side effect until an external condition holds
     * @return Number of attempts made
     */
    template <typename Action, typename Condition>
    std::size_t Poll(Action&& action, Condition&& condition) const
    {
        CheckCallable(action, "action");
        CheckCallable(condition, "condition");

        auto run = [&action](bool) {
            std::invoke(action);
            return true;
        };
        return RunAttempts([&]() {
            return Execute(run, true).has_value() && static_cast<bool>(std::invoke(condition));
        });
    }

    /**
     * @brief Poll with the same input on every attempt
     *
     * The input is passed by lvalue reference, so the function may mutate
     * it between attempts. When the function returns void, predicate is a
     * zero-argument condition and the attempt count is returned, as with
     * Poll(action, condition). An input that is itself callable with no
     * arguments selects the supplier overload instead.
     */
    template <typename Input, typename Function, typename Predicate,
              std::enable_if_t<!std::is_invocable_v<Input&>, int> = 0>
    auto Poll(Input&& input, Function&& function, Predicate&& predicate) const
    {
        CheckCallable(function, "function");

        if constexpr (std::is_void_v<std::invoke_result_t<Function&, Input&>>)
        {
            return Poll([&]() { std::invoke(function, input); }, std::forward<Predicate>(predicate));
        }
        else
        {
            return Poll([&]() -> Input& { return input; }, function, std::forward<Predicate>(predicate));
        }
    }

    const std::vector<ExceptionMatcher>& IgnoredExceptions() const { return ignored_exceptions_; }

protected:
    Poller(std::vector<ExceptionMatcher> ignored_exceptions, Logger logger);

    // Drives attempts until the strategy stops; returns the attempts made.
    virtual std::size_t RunAttempts(const Attempt& attempt) const = 0;

    template <typename Function, typename Input>
    auto Execute(Function& function, Input&& input) const
        -> std::optional<std::decay_t<std::invoke_result_t<Function&, Input&&>>>
    {
        try
        {
            return std::invoke(function, std::forward<Input>(input));
        }
        catch (const std::exception& error)
        {
            if (!IsIgnored(error))
                throw;
            return std::nullopt;
        }
    }

    // True (and logged) when error matches an allow-list entry.
    bool IsIgnored(const std::exception& error) const;

    const Logger& Log() const { return logger_; }

private:
    template <typename F>
    static void CheckCallable(const F& f, const char* what)
    {
        if (detail::IsEmptyCallable(f))
            ThrowEmptyCallable(what);
    }

    [[noreturn]] static void ThrowEmptyCallable(const char* what);

    std::vector<ExceptionMatcher> ignored_exceptions_;
    Logger logger_;
};

} // namespace pollkit
