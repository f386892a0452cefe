#include "ExceptionMatcher.hpp"

#include <filesystem>
#include <memory>
#include <new>
#include <stdexcept>
#include <system_error>

#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

namespace pollkit
{

std::string TypeName(const std::type_info& type)
{
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
                                                     std::free);
    if (status == 0 && demangled)
    {
        return demangled.get();
    }
#endif
    return type.name();
}

std::string DescribeException(const std::exception& error)
{
    return TypeName(typeid(error)) + ": " + error.what();
}

const std::map<std::string, ExceptionMatcher>& StandardExceptionKinds()
{
    static const std::map<std::string, ExceptionMatcher> kinds = [] {
        std::map<std::string, ExceptionMatcher> m;
        auto add = [&m](ExceptionMatcher matcher) { m.emplace(matcher.kind, std::move(matcher)); };
        add(IgnoreException<std::exception>("exception"));
        add(IgnoreException<std::logic_error>("logic_error"));
        add(IgnoreException<std::invalid_argument>("invalid_argument"));
        add(IgnoreException<std::domain_error>("domain_error"));
        add(IgnoreException<std::length_error>("length_error"));
        add(IgnoreException<std::out_of_range>("out_of_range"));
        add(IgnoreException<std::runtime_error>("runtime_error"));
        add(IgnoreException<std::range_error>("range_error"));
        add(IgnoreException<std::overflow_error>("overflow_error"));
        add(IgnoreException<std::underflow_error>("underflow_error"));
        add(IgnoreException<std::system_error>("system_error"));
        add(IgnoreException<std::filesystem::filesystem_error>("filesystem_error"));
        add(IgnoreException<std::bad_alloc>("bad_alloc"));
        return m;
    }();
    return kinds;
}

} // namespace pollkit
