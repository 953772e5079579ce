// Copyright (c) 2014-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_CRYPTO_HMAC_SHA512_H
#define BIP380_CRYPTO_HMAC_SHA512_H

#include <support/cleanse.h>

#include <cstddef>
#include <cstdint>
#include <vector>

/** A hasher class for HMAC-SHA-512. */
class CHMAC_SHA512
{
private:
    std::vector<unsigned char> m_key;
    std::vector<unsigned char> m_message;

public:
    static const size_t OUTPUT_SIZE = 64;

    CHMAC_SHA512(const unsigned char* key, size_t keylen);
    ~CHMAC_SHA512();
    CHMAC_SHA512& Write(const unsigned char* data, size_t len)
    {
        m_message.insert(m_message.end(), data, data + len);
        return *this;
    }
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
};

#endif // BIP380_CRYPTO_HMAC_SHA512_H
