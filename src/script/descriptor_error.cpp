// Copyright (c) 2024-present The Tidecoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/descriptor_error.h>

#include <cassert>

namespace descriptor {

ErrorClass GetErrorClass(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::UNEXPECTED_TOKEN:
    case ErrorKind::UNBALANCED_PARENTHESES:
    case ErrorKind::UNKNOWN_FUNCTION:
    case ErrorKind::NESTING_TOO_DEEP:
        return ErrorClass::SYNTAX;
    case ErrorKind::MALFORMED_CHECKSUM:
    case ErrorKind::CHECKSUM_MISMATCH:
        return ErrorClass::CHECKSUM;
    case ErrorKind::INVALID_CONTEXT:
    case ErrorKind::INVALID_THRESHOLD:
    case ErrorKind::INVALID_KEY_COUNT:
    case ErrorKind::UNCOMPRESSED_KEY:
    case ErrorKind::MULTIPATH_MISMATCH:
        return ErrorClass::SEMANTIC;
    case ErrorKind::INVALID_KEY_ENCODING:
    case ErrorKind::INVALID_HEX:
    case ErrorKind::INVALID_ADDRESS:
        return ErrorClass::KEY_ENCODING;
    case ErrorKind::HARDENED_FROM_PUBLIC:
    case ErrorKind::INVALID_CHILD_KEY:
    case ErrorKind::MAX_DEPTH_EXCEEDED:
    case ErrorKind::INVALID_PATH:
        return ErrorClass::DERIVATION;
    } // no default case, so the compiler can warn about missing cases
    assert(false);
}

std::string ErrorClassString(ErrorClass cls)
{
    switch (cls) {
    case ErrorClass::SYNTAX: return "syntax";
    case ErrorClass::CHECKSUM: return "checksum";
    case ErrorClass::SEMANTIC: return "semantic";
    case ErrorClass::KEY_ENCODING: return "key encoding";
    case ErrorClass::DERIVATION: return "derivation";
    } // no default case, so the compiler can warn about missing cases
    assert(false);
}

} // namespace descriptor
