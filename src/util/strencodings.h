// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef BIP380_UTIL_STRENCODINGS_H
#define BIP380_UTIL_STRENCODINGS_H

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

/** Parse the hex string into bytes. Returns nullopt on any non-hex character or odd length. */
template <typename Byte = unsigned char>
std::optional<std::vector<Byte>> TryParseHex(std::string_view str);
/** Like TryParseHex, but returns an empty vector on invalid input. */
template <typename Byte = unsigned char>
std::vector<Byte> ParseHex(std::string_view hex_str)
{
    return TryParseHex<Byte>(hex_str).value_or(std::vector<Byte>{});
}
/** Returns true if each character in str is a hex character, and has an even number of hex digits. */
bool IsHex(std::string_view str);

/**
 * Convert a span of bytes to a lower-case hexadecimal string.
 */
std::string HexStr(std::span<const uint8_t> s);
inline std::string HexStr(std::span<const char> s) { return HexStr(std::span{reinterpret_cast<const uint8_t*>(s.data()), s.size()}); }
inline std::string HexStr(std::span<const std::byte> s) { return HexStr(std::span{reinterpret_cast<const uint8_t*>(s.data()), s.size()}); }

/**
 * Tests if the given character is a whitespace character. The whitespace characters
 * are: space, form-feed ('\f'), newline ('\n'), carriage return ('\r'), horizontal
 * tab ('\t'), and vertical tab ('\v').
 *
 * This function is locale independent.
 */
constexpr inline bool IsSpace(char c) noexcept {
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}

/** Returns true if c is an ASCII decimal digit. */
constexpr inline bool IsDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/**
 * Convert string to integral type T. Leading whitespace, a leading +, or any
 * trailing character fail the parsing. The required format expressed as regex
 * is `-?[0-9]+`. The minus sign is only permitted for signed integer types.
 *
 * @returns std::nullopt if the entire string could not be parsed, or if the
 *   parsed value is not in the range representable by the type T.
 */
template <typename T>
std::optional<T> ToIntegral(std::string_view str)
{
    static_assert(std::is_integral_v<T>);
    T result;
    const auto [first_nonmatching, error_condition] = std::from_chars(str.data(), str.data() + str.size(), result);
    if (first_nonmatching != str.data() + str.size() || error_condition != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

/**
 * Returns the lowercase equivalent of the given character.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 */
constexpr char ToLower(char c)
{
    return (c >= 'A' && c <= 'Z' ? (c - 'A') + 'a' : c);
}

/** Returns the lowercase equivalent of the given string (ASCII only). */
std::string ToLower(std::string_view str);

/**
 * Convert from one power-of-2 number base to another.
 *
 * The value of `outfn` is called for every output group.
 */
template<int frombits, int tobits, bool pad, typename O, typename It>
bool ConvertBits(O outfn, It it, It end) {
    size_t acc = 0;
    size_t bits = 0;
    constexpr size_t maxv = (1 << tobits) - 1;
    constexpr size_t max_acc = (1 << (frombits + tobits - 1)) - 1;
    while (it != end) {
        int v = *it;
        acc = ((acc << frombits) | v) & max_acc;
        bits += frombits;
        while (bits >= tobits) {
            bits -= tobits;
            outfn((acc >> bits) & maxv);
        }
        ++it;
    }
    if (pad) {
        if (bits) outfn((acc << (tobits - bits)) & maxv);
    } else if (bits >= frombits || ((acc << (tobits - bits)) & maxv)) {
        return false;
    }
    return true;
}

#endif // BIP380_UTIL_STRENCODINGS_H
