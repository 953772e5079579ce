// Copyright (c) 2024-present The Tidecoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bip32.h>

#include <logging.h>
#include <util/overloaded.h>

#include <cassert>
#include <cstring>
#include <limits>

namespace bip32 {

std::string DerivationErrorString(DerivationError error)
{
    switch (error) {
    case DerivationError::HARDENED_FROM_PUBLIC: return "Cannot derive a hardened child from a public key";
    case DerivationError::INVALID_CHILD_KEY: return "Derived child key is invalid";
    case DerivationError::MAX_DEPTH_EXCEEDED: return "Maximum derivation depth exceeded";
    case DerivationError::INVALID_PATH: return "Invalid derivation path";
    } // no default case, so the compiler can warn about missing cases
    assert(false);
}

CExtPubKey HDKey::GetExtPubKey() const
{
    return std::visit(util::Overloaded{
        [](const CExtPubKey& xpub) { return xpub; },
        [](const CExtKey& xprv) { return xprv.Neuter(); },
    }, m_key);
}

unsigned char HDKey::GetDepth() const
{
    return std::visit([](const auto& k) { return k.nDepth; }, m_key);
}

Fingerprint HDKey::GetFingerprint() const
{
    Fingerprint out;
    const CKeyID id{GetPubKey().GetID()};
    std::memcpy(out.data(), id.begin(), out.size());
    return out;
}

util::Expected<HDKey, DerivationError> HDKey::Derive(uint32_t index) const
{
    if (GetDepth() == std::numeric_limits<unsigned char>::max()) {
        return util::Unexpected{DerivationError::MAX_DEPTH_EXCEEDED};
    }
    if (const auto* xprv = std::get_if<CExtKey>(&m_key)) {
        CExtKey child;
        if (!xprv->Derive(child, index)) {
            LogDebug(BCLog::BIP32, "Child %u of private key is invalid\n", index);
            return util::Unexpected{DerivationError::INVALID_CHILD_KEY};
        }
        return HDKey{child};
    }
    if (index & HARDENED_BIT) {
        return util::Unexpected{DerivationError::HARDENED_FROM_PUBLIC};
    }
    CExtPubKey child;
    if (!std::get<CExtPubKey>(m_key).Derive(child, index)) {
        LogDebug(BCLog::BIP32, "Child %u of public key is invalid\n", index);
        return util::Unexpected{DerivationError::INVALID_CHILD_KEY};
    }
    return HDKey{child};
}

util::Expected<HDKey, DerivationError> DeriveHDKey(const HDKey& key, std::span<const uint32_t> path)
{
    HDKey current{key};
    for (const uint32_t index : path) {
        auto child{current.Derive(index)};
        if (!child) return util::Unexpected{child.error()};
        current = std::move(*child);
    }
    return current;
}

} // namespace bip32
