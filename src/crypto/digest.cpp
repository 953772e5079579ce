// Copyright (c) 2014-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/hmac_sha512.h>
#include <crypto/ripemd160.h>
#include <crypto/sha256.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>
#include <string>

namespace {

void EvpDigest(const EVP_MD* md, const std::vector<unsigned char>& data, unsigned char* out, unsigned int expected_size)
{
    unsigned int out_len = 0;
    if (md == nullptr || EVP_Digest(data.data(), data.size(), out, &out_len, md, nullptr) != 1 || out_len != expected_size) {
        throw std::runtime_error(std::string{"OpenSSL digest failure: "} + (md ? EVP_MD_get0_name(md) : "unavailable"));
    }
}

} // namespace

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    m_buffer.insert(m_buffer.end(), data, data + len);
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    EvpDigest(EVP_sha256(), m_buffer, hash, OUTPUT_SIZE);
}

CSHA256& CSHA256::Reset()
{
    m_buffer.clear();
    return *this;
}

CRIPEMD160& CRIPEMD160::Write(const unsigned char* data, size_t len)
{
    m_buffer.insert(m_buffer.end(), data, data + len);
    return *this;
}

void CRIPEMD160::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    EvpDigest(EVP_ripemd160(), m_buffer, hash, OUTPUT_SIZE);
}

CRIPEMD160& CRIPEMD160::Reset()
{
    m_buffer.clear();
    return *this;
}

CHMAC_SHA512::CHMAC_SHA512(const unsigned char* key, size_t keylen) : m_key(key, key + keylen) {}

CHMAC_SHA512::~CHMAC_SHA512()
{
    if (!m_key.empty()) memory_cleanse(m_key.data(), m_key.size());
    if (!m_message.empty()) memory_cleanse(m_message.data(), m_message.size());
}

void CHMAC_SHA512::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int out_len = 0;
    if (HMAC(EVP_sha512(), m_key.data(), static_cast<int>(m_key.size()), m_message.data(), m_message.size(), hash, &out_len) == nullptr ||
        out_len != OUTPUT_SIZE) {
        throw std::runtime_error("OpenSSL HMAC-SHA512 failure");
    }
}
