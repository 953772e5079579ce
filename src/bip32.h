// Copyright (c) 2024-present The Tidecoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_BIP32_H
#define BIP380_BIP32_H

#include <key.h>
#include <pubkey.h>
#include <util/expected.h>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <variant>

/**
 * BIP32 derivation over extended keys.
 *
 * This module only ever derives concrete paths. Wildcards and multipath steps
 * must be resolved to fixed indices by the caller before reaching it.
 */
namespace bip32 {

static constexpr uint32_t HARDENED_BIT = 0x80000000U;

enum class DerivationError {
    //! A hardened index was requested from a key without private material.
    HARDENED_FROM_PUBLIC,
    //! The tweak was not below the curve order or produced the zero key.
    INVALID_CHILD_KEY,
    //! Derivation would exceed depth 255.
    MAX_DEPTH_EXCEEDED,
    //! The path could not be parsed.
    INVALID_PATH,
};

std::string DerivationErrorString(DerivationError error);

using Fingerprint = std::array<unsigned char, 4>;

/** An extended key that is either public-only or carries the private scalar. */
class HDKey
{
    std::variant<CExtPubKey, CExtKey> m_key;

public:
    explicit HDKey(const CExtPubKey& xpub) : m_key{xpub} {}
    explicit HDKey(const CExtKey& xprv) : m_key{xprv} {}

    bool IsPrivate() const { return std::holds_alternative<CExtKey>(m_key); }

    CExtPubKey GetExtPubKey() const;
    //! Only valid when IsPrivate().
    const CExtKey& GetExtKey() const { return std::get<CExtKey>(m_key); }
    CPubKey GetPubKey() const { return GetExtPubKey().pubkey; }

    unsigned char GetDepth() const;
    //! First four bytes of HASH160 of this key's compressed public point.
    Fingerprint GetFingerprint() const;

    /** Derive one child. Does not modify this key. */
    util::Expected<HDKey, DerivationError> Derive(uint32_t index) const;

    friend bool operator==(const HDKey& a, const HDKey& b) { return a.m_key == b.m_key; }
};

/** Derive along a path of concrete indices, returning a new key. */
util::Expected<HDKey, DerivationError> DeriveHDKey(const HDKey& key, std::span<const uint32_t> path);

} // namespace bip32

#endif // BIP380_BIP32_H
