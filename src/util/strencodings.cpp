// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util/strencodings.h>

#include <array>
#include <cstdint>

namespace {

constexpr signed char HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool IsHex(std::string_view str)
{
    for (char c : str) {
        if (HexDigit(c) < 0) return false;
    }
    return (str.size() > 0) && (str.size() % 2 == 0);
}

template <typename Byte>
std::optional<std::vector<Byte>> TryParseHex(std::string_view str)
{
    if (str.size() % 2 != 0) return std::nullopt;
    std::vector<Byte> vch;
    vch.reserve(str.size() / 2);
    for (size_t i = 0; i < str.size(); i += 2) {
        const signed char hi = HexDigit(str[i]);
        const signed char lo = HexDigit(str[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        vch.push_back(Byte(uint8_t((hi << 4) | lo)));
    }
    return vch;
}
template std::optional<std::vector<std::byte>> TryParseHex(std::string_view);
template std::optional<std::vector<uint8_t>> TryParseHex(std::string_view);

std::string HexStr(const std::span<const uint8_t> s)
{
    static constexpr char hexmap[] = "0123456789abcdef";
    std::string rv(s.size() * 2, '\0');
    auto it = rv.begin();
    for (uint8_t v : s) {
        *it++ = hexmap[v >> 4];
        *it++ = hexmap[v & 15];
    }
    return rv;
}

std::string ToLower(std::string_view str)
{
    std::string r;
    r.reserve(str.size());
    for (auto ch : str) r += ToLower(ch);
    return r;
}
