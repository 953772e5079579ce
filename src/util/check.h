// Copyright (c) 2019-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_UTIL_CHECK_H
#define BIP380_UTIL_CHECK_H

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

std::string StrFormatInternalBug(std::string_view msg, const std::source_location& loc);

class NonFatalCheckError : public std::runtime_error
{
public:
    NonFatalCheckError(std::string_view msg, const std::source_location& loc);
};

/** Helper for CHECK_NONFATAL() */
template <typename T>
T&& inline_check_non_fatal(T&& val, const std::source_location& loc, std::string_view assertion)
{
    if (!val) {
        throw NonFatalCheckError{assertion, loc};
    }
    return std::forward<T>(val);
}

/**
 * Identity function. Throw a NonFatalCheckError when the condition evaluates to false
 *
 * This should only be used
 * - where the condition is assumed to be true, not for error handling or validating user input
 * - where a failure to fulfill the condition is recoverable and does not abort the program
 *
 * For example in library code, where it is undesirable to crash the whole program, this can be used to replace
 * asserts on internal invariants. A NonFatalCheckError is caught by the command-line tool and reported.
 */
#define CHECK_NONFATAL(condition) \
    inline_check_non_fatal(condition, std::source_location::current(), #condition)

#endif // BIP380_UTIL_CHECK_H
