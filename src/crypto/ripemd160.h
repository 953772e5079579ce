// Copyright (c) 2014-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_CRYPTO_RIPEMD160_H
#define BIP380_CRYPTO_RIPEMD160_H

#include <cstddef>
#include <cstdint>
#include <vector>

/** A hasher class for RIPEMD-160. Backed by OpenSSL's EVP digest interface. */
class CRIPEMD160
{
private:
    std::vector<unsigned char> m_buffer;

public:
    static const size_t OUTPUT_SIZE = 20;

    CRIPEMD160() = default;
    CRIPEMD160& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CRIPEMD160& Reset();
};

#endif // BIP380_CRYPTO_RIPEMD160_H
