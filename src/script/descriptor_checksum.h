// Copyright (c) 2018-2021 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_SCRIPT_DESCRIPTOR_CHECKSUM_H
#define BIP380_SCRIPT_DESCRIPTOR_CHECKSUM_H

#include <script/descriptor_error.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace descriptor {

static constexpr size_t CHECKSUM_LENGTH = 8;

/** Position of the first character outside the descriptor alphabet, if any. */
std::optional<size_t> FindInvalidDescriptorChar(std::span<const char> span);

/** Compute the 8-character checksum of `span`, or "" if it contains characters outside the alphabet. */
std::string DescriptorChecksum(std::span<const char> span);

/** Whether `checksum` is the checksum of `span`. */
bool VerifyDescriptorChecksum(std::span<const char> span, std::string_view checksum);

/** Append '#' and the checksum of str. str must not already carry one. */
std::string AddChecksum(const std::string& str);

/** Check a descriptor checksum and return the checksum-less part.
 *
 * Offsets in a returned error are relative to the start of sp. When
 * out_checksum is set, it receives the computed checksum.
 */
Result<std::span<const char>> CheckChecksum(std::span<const char> sp, bool require_checksum, std::string* out_checksum = nullptr);

/** Get the checksum for a `descriptor`.
 *
 * - If it already has one, and it is correct, return the checksum in the input.
 * - If it already has one that is wrong, return "".
 * - If it does not already have one, return the checksum that would need to be added.
 */
std::string GetDescriptorChecksum(const std::string& descriptor);

} // namespace descriptor

#endif // BIP380_SCRIPT_DESCRIPTOR_CHECKSUM_H
