// Copyright (c) 2019-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_SCRIPT_KEYORIGIN_H
#define BIP380_SCRIPT_KEYORIGIN_H

#include <array>
#include <cstdint>
#include <vector>

struct KeyOriginInfo
{
    std::array<unsigned char, 4> fingerprint{}; //!< First 32 bits of the Hash160 of the public key at the root of the path
    std::vector<uint32_t> path;

    friend bool operator==(const KeyOriginInfo& a, const KeyOriginInfo& b)
    {
        return a.fingerprint == b.fingerprint && a.path == b.path;
    }

    friend bool operator<(const KeyOriginInfo& a, const KeyOriginInfo& b)
    {
        // Compare the fingerprints lexicographically
        if (a.fingerprint != b.fingerprint) return a.fingerprint < b.fingerprint;
        // Compare the sizes of the paths, shorter is "less than"
        if (a.path.size() < b.path.size()) {
            return true;
        } else if (a.path.size() > b.path.size()) {
            return false;
        }
        // Paths same length, compare them lexicographically
        return a.path < b.path;
    }

    void clear()
    {
        fingerprint.fill(0);
        path.clear();
    }
};

#endif // BIP380_SCRIPT_KEYORIGIN_H
