// Copyright (c) 2022-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util/check.h>

#include <util/string.h>

std::string StrFormatInternalBug(std::string_view msg, const std::source_location& loc)
{
    return strprintf("Internal bug detected: %s\n%s:%d (%s)\n"
                     "Please report this issue.\n",
                     msg, loc.file_name(), loc.line(), loc.function_name());
}

NonFatalCheckError::NonFatalCheckError(std::string_view msg, const std::source_location& loc)
    : std::runtime_error{StrFormatInternalBug(msg, loc)}
{
}
