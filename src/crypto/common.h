// Copyright (c) 2014-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_CRYPTO_COMMON_H
#define BIP380_CRYPTO_COMMON_H

#include <cstdint>

uint32_t static inline ReadLE32(const unsigned char* ptr)
{
    return uint32_t(ptr[0]) | (uint32_t(ptr[1]) << 8) | (uint32_t(ptr[2]) << 16) | (uint32_t(ptr[3]) << 24);
}

uint32_t static inline ReadBE32(const unsigned char* ptr)
{
    return (uint32_t(ptr[0]) << 24) | (uint32_t(ptr[1]) << 16) | (uint32_t(ptr[2]) << 8) | uint32_t(ptr[3]);
}

void static inline WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = x >> 24;
    ptr[1] = x >> 16;
    ptr[2] = x >> 8;
    ptr[3] = x;
}

#endif // BIP380_CRYPTO_COMMON_H
