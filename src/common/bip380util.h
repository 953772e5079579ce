// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_COMMON_BIP380UTIL_H
#define BIP380_COMMON_BIP380UTIL_H

#include <util/expected.h>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class ArgsManager;

/** Output of a bip380-util command for one value, or the error message. */
using CommandResult = util::Expected<std::string, std::string>;

/** Register the bip380-util options and commands. */
void SetupBip380UtilArgs(ArgsManager& argsman);

/**
 * Values come from the command line, or from `in` (one per line, blank
 * lines skipped) when a lone '-' is given.
 */
std::vector<std::string> ReadValues(const std::vector<std::string>& cmd_args, std::istream& in);

/** Parse "<index>" or "<begin>-<end>", both ends unhardened and begin <= end. */
std::optional<std::pair<uint32_t, uint32_t>> ParseDeriveRange(const std::string& str);

/** derive-key: "xpub:xprv" of the key at -path, with an empty xprv for public input. */
CommandResult DeriveKeyCommand(const ArgsManager& args, const std::string& value);

/** key-expression: echo a valid key expression. */
CommandResult KeyExpressionCommand(const ArgsManager& args, const std::string& value);

/**
 * script-expression: echo a valid descriptor, or act on it according to
 * -verify-checksum, -compute-checksum, -derive and -address.
 */
CommandResult ScriptExpressionCommand(const ArgsManager& args, const std::string& value);

#endif // BIP380_COMMON_BIP380UTIL_H
