// Copyright (c) 2024-present The Tidecoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util/keypath.h>

#include <util/strencodings.h>
#include <util/string.h>

#include <optional>

namespace {
std::string FormatPathElem(uint32_t elem, bool apostrophe)
{
    const bool hardened = (elem & 0x80000000U) != 0;
    const uint32_t index = elem & 0x7fffffffU;
    std::string out = std::to_string(index);
    if (hardened) out += (apostrophe ? "'" : "h");
    return out;
}
} // namespace

bool ParseHDKeypath(const std::string& keypath_str, std::vector<uint32_t>& keypath)
{
    keypath.clear();
    std::string_view path{keypath_str};
    if (!path.empty() && path.front() == 'm') {
        path.remove_prefix(1);
        if (path.empty()) return true;
        if (path.front() != '/') return false;
    }
    if (!path.empty() && path.front() == '/') path.remove_prefix(1);
    if (path.empty()) return true;

    for (const std::string_view item : util::Split<std::string_view>(path, '/')) {
        std::string_view elem{item};
        uint32_t path_index = 0;
        if (!elem.empty() && (elem.back() == '\'' || elem.back() == 'h' || elem.back() == 'H')) {
            elem.remove_suffix(1);
            path_index |= 0x80000000U;
        }
        // Signs and whitespace are not accepted by the digit check below.
        if (elem.empty()) return false;
        for (char c : elem) {
            if (!IsDigit(c)) return false;
        }
        const std::optional<uint32_t> number{ToIntegral<uint32_t>(elem)};
        if (!number || *number & 0x80000000U) return false;
        keypath.push_back(path_index | *number);
    }
    return true;
}

std::string FormatHDKeypath(const std::vector<uint32_t>& path, bool apostrophe)
{
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i != 0) out += '/';
        out += FormatPathElem(path[i], apostrophe);
    }
    return out;
}

std::string WriteHDKeypath(const std::vector<uint32_t>& path, bool apostrophe)
{
    if (path.empty()) return "m";
    return "m/" + FormatHDKeypath(path, apostrophe);
}
