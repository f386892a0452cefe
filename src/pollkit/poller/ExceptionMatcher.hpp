#pragma once

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <typeinfo>
#include <utility>

namespace pollkit
{

// Human-readable (demangled where supported) name of a type.
std::string TypeName(const std::type_info& type);

// "<dynamic type>: <what()>"
std::string DescribeException(const std::exception& error);

/**
 * @brief One allow-list entry of a poller
 *
 * kind labels the entry in logs and configuration; matches decides whether
 * a caught exception belongs to it.
 */
struct ExceptionMatcher
{
    std::string kind;
    std::function<bool(const std::exception&)> matches;

    bool Matches(const std::exception& error) const { return matches && matches(error); }
};

// Matches E and every type derived from it.
template <typename E>
ExceptionMatcher IgnoreException(std::string kind = TypeName(typeid(E)))
{
    return ExceptionMatcher{ std::move(kind),
                             [](const std::exception& error) { return dynamic_cast<const E*>(&error) != nullptr; } };
}

inline ExceptionMatcher IgnoreWhen(std::string kind, std::function<bool(const std::exception&)> predicate)
{
    return ExceptionMatcher{ std::move(kind), std::move(predicate) };
}

// Matchers for the standard library exception types, keyed by their
// unqualified names ("runtime_error", "filesystem_error", ...).
const std::map<std::string, ExceptionMatcher>& StandardExceptionKinds();

} // namespace pollkit
