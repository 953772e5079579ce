// Copyright (c) 2024-present The Tidecoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_SCRIPT_DESCRIPTOR_ERROR_H
#define BIP380_SCRIPT_DESCRIPTOR_ERROR_H

#include <util/expected.h>

#include <cstddef>
#include <string>
#include <utility>

namespace descriptor {

/** Broad failure categories reported to callers. */
enum class ErrorClass {
    SYNTAX,
    CHECKSUM,
    SEMANTIC,
    KEY_ENCODING,
    DERIVATION,
};

enum class ErrorKind {
    // SYNTAX
    UNEXPECTED_TOKEN,
    UNBALANCED_PARENTHESES,
    UNKNOWN_FUNCTION,
    NESTING_TOO_DEEP,
    // CHECKSUM
    MALFORMED_CHECKSUM,
    CHECKSUM_MISMATCH,
    // SEMANTIC
    INVALID_CONTEXT,
    INVALID_THRESHOLD,
    INVALID_KEY_COUNT,
    UNCOMPRESSED_KEY,
    MULTIPATH_MISMATCH,
    // KEY_ENCODING
    INVALID_KEY_ENCODING,
    INVALID_HEX,
    INVALID_ADDRESS,
    // DERIVATION
    HARDENED_FROM_PUBLIC,
    INVALID_CHILD_KEY,
    MAX_DEPTH_EXCEEDED,
    INVALID_PATH,
};

ErrorClass GetErrorClass(ErrorKind kind);
std::string ErrorClassString(ErrorClass cls);

struct Error {
    ErrorKind kind;
    //! Byte offset into the descriptor text where the problem was detected.
    size_t offset{0};
    std::string message;

    ErrorClass Class() const { return GetErrorClass(kind); }
};

template <typename T>
using Result = util::Expected<T, Error>;

inline util::Unexpected<Error> MakeError(ErrorKind kind, size_t offset, std::string message)
{
    return util::Unexpected<Error>{Error{kind, offset, std::move(message)}};
}

} // namespace descriptor

#endif // BIP380_SCRIPT_DESCRIPTOR_ERROR_H
