// Copyright (c) 2014-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_CRYPTO_SHA256_H
#define BIP380_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <vector>

/** A hasher class for SHA-256. Backed by OpenSSL's EVP digest interface. */
class CSHA256
{
private:
    std::vector<unsigned char> m_buffer;

public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256() = default;
    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();
};

#endif // BIP380_CRYPTO_SHA256_H
