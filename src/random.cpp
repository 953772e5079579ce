// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

#include <openssl/rand.h>

#include <climits>
#include <stdexcept>

void GetRandBytes(std::span<unsigned char> bytes)
{
    while (!bytes.empty()) {
        const size_t chunk = bytes.size() > INT_MAX ? INT_MAX : bytes.size();
        if (RAND_bytes(bytes.data(), static_cast<int>(chunk)) != 1) {
            throw std::runtime_error("GetRandBytes: RAND_bytes failed");
        }
        bytes = bytes.subspan(chunk);
    }
}
