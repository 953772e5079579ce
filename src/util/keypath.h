// Copyright (c) 2024-present The Tidecoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_UTIL_KEYPATH_H
#define BIP380_UTIL_KEYPATH_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * Parse an HD keypath like "m/7/0'/2000" or "/0h/1".
 *
 * A leading "m" or "/" is optional. Hardened elements are marked with ', h or H.
 * Returns false if any element is empty, not a number, or does not fit in 31 bits.
 */
[[nodiscard]] bool ParseHDKeypath(const std::string& keypath_str, std::vector<uint32_t>& keypath);

/** Format a keypath without the leading "m", using h (or ' when apostrophe is set) as hardened marker. */
std::string FormatHDKeypath(const std::vector<uint32_t>& path, bool apostrophe = false);

/** Write a keypath string with a leading "m". */
std::string WriteHDKeypath(const std::vector<uint32_t>& path, bool apostrophe = false);

#endif // BIP380_UTIL_KEYPATH_H
