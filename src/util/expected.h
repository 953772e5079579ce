// Copyright (c) The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://opensource.org/license/mit/.

#ifndef BIP380_UTIL_EXPECTED_H
#define BIP380_UTIL_EXPECTED_H

#include <exception>
#include <utility>
#include <variant>

namespace util {

/// The util::Unexpected class represents an unexpected value stored in
/// util::Expected.
template <class E>
class Unexpected
{
public:
    constexpr explicit Unexpected(E e) : err(std::move(e)) {}
    E err;
};

struct BadExpectedAccess : std::exception {
    const char* what() const noexcept override { return "Bad util::Expected access"; }
};

/// The util::Expected class provides a standard way for low-level functions to
/// return either error values or result values.
///
/// It provides a smaller version of std::expected from C++23. Missing features
/// can be added, if needed.
template <class T, class E>
class Expected
{
private:
    using ValueType = T;
    using ErrorType = E;
    std::variant<ValueType, ErrorType> m_data;

public:
    constexpr Expected() : m_data{std::in_place_index_t<0>{}, ValueType{}} {}
    constexpr Expected(ValueType v) : m_data{std::in_place_index_t<0>{}, std::move(v)} {}
    template <class Err>
    constexpr Expected(Unexpected<Err> u) : m_data{std::in_place_index_t<1>{}, std::move(u.err)}
    {
    }

    constexpr bool has_value() const noexcept { return m_data.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr const ValueType& value() const&
    {
        if (!has_value()) throw BadExpectedAccess{};
        return std::get<0>(m_data);
    }
    constexpr ValueType& value() &
    {
        if (!has_value()) throw BadExpectedAccess{};
        return std::get<0>(m_data);
    }
    constexpr ValueType&& value() &&
    {
        if (!has_value()) throw BadExpectedAccess{};
        return std::move(std::get<0>(m_data));
    }

    template <class U>
    ValueType value_or(U&& default_value) const&
    {
        return has_value() ? value() : std::forward<U>(default_value);
    }

    constexpr const ErrorType& error() const& { return std::get<1>(m_data); }
    constexpr ErrorType& error() & { return std::get<1>(m_data); }
    constexpr ErrorType&& error() && { return std::move(std::get<1>(m_data)); }

    constexpr ValueType& operator*() & { return value(); }
    constexpr const ValueType& operator*() const& { return value(); }
    constexpr ValueType&& operator*() && { return std::move(value()); }

    constexpr ValueType* operator->() { return &value(); }
    constexpr const ValueType* operator->() const { return &value(); }
};

template <class E>
class Expected<void, E>
{
private:
    std::variant<std::monostate, E> m_data;

public:
    constexpr Expected() : m_data{std::in_place_index_t<0>{}, std::monostate{}} {}
    template <class Err>
    constexpr Expected(Unexpected<Err> u) : m_data{std::in_place_index_t<1>{}, std::move(u.err)}
    {
    }

    constexpr bool has_value() const noexcept { return m_data.index() == 0; }
    constexpr explicit operator bool() const noexcept { return has_value(); }

    constexpr void value() const
    {
        if (!has_value()) throw BadExpectedAccess{};
    }

    constexpr const E& error() const& { return std::get<1>(m_data); }
    constexpr E& error() & { return std::get<1>(m_data); }
    constexpr E&& error() && { return std::move(std::get<1>(m_data)); }
};

} // namespace util

#endif // BIP380_UTIL_EXPECTED_H
