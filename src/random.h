// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_RANDOM_H
#define BIP380_RANDOM_H

#include <cstddef>
#include <span>

/**
 * Fill a buffer with bytes from the OpenSSL CSPRNG.
 *
 * Throws std::runtime_error when the generator could not be seeded.
 */
void GetRandBytes(std::span<unsigned char> bytes);

#endif // BIP380_RANDOM_H
