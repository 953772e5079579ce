// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_KERNEL_CHAINPARAMS_H
#define BIP380_KERNEL_CHAINPARAMS_H

#include <util/chaintype.h>

#include <memory>
#include <string>
#include <vector>

/**
 * CChainParams defines the encoding parameters of a given instance of the
 * Bitcoin system: the base58 prefixes of addresses, secret keys and extended
 * keys, and the human readable part of segwit addresses.
 */
class CChainParams
{
public:
    enum Base58Type {
        PUBKEY_ADDRESS,
        SCRIPT_ADDRESS,
        SECRET_KEY,
        EXT_PUBLIC_KEY,
        EXT_SECRET_KEY,

        MAX_BASE58_TYPES
    };

    virtual ~CChainParams() = default;

    const std::vector<unsigned char>& Base58Prefix(Base58Type type) const { return base58Prefixes[type]; }
    const std::string& Bech32HRP() const { return bech32_hrp; }
    std::string GetChainTypeString() const { return ChainTypeToString(m_chain_type); }
    ChainType GetChainType() const { return m_chain_type; }

    static std::unique_ptr<const CChainParams> Main();
    static std::unique_ptr<const CChainParams> TestNet();
    static std::unique_ptr<const CChainParams> RegTest();

protected:
    CChainParams() = default;

    std::vector<unsigned char> base58Prefixes[MAX_BASE58_TYPES];
    std::string bech32_hrp;
    ChainType m_chain_type;
};

#endif // BIP380_KERNEL_CHAINPARAMS_H
