// Copyright (c) 2018-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/descriptor.h>

#include <addresstype.h>
#include <key_io.h>
#include <logging.h>
#include <script/solver.h>
#include <util/check.h>
#include <util/keypath.h>
#include <util/overloaded.h>
#include <util/strencodings.h>
#include <util/string.h>

#include <algorithm>
#include <cstring>

namespace descriptor {
namespace {

std::string FormatIndex(uint32_t index, bool apostrophe)
{
    std::string ret = strprintf("%u", index & ~bip32::HARDENED_BIT);
    if (index & bip32::HARDENED_BIT) ret += apostrophe ? '\'' : 'h';
    return ret;
}

std::string FormatPath(const std::vector<PathStep>& path, bool apostrophe)
{
    std::string ret;
    for (const PathStep& step : path) {
        ret += '/';
        switch (step.type) {
        case PathStep::Type::INDEX:
            ret += FormatIndex(step.indices.at(0), apostrophe);
            break;
        case PathStep::Type::WILDCARD:
            ret += '*';
            if (step.hardened) ret += apostrophe ? '\'' : 'h';
            break;
        case PathStep::Type::MULTIPATH:
            ret += '<';
            ret += util::Join(step.indices, ";", [&](uint32_t i) { return FormatIndex(i, apostrophe); });
            ret += '>';
            break;
        } // no default case, so the compiler can warn about missing cases
    }
    return ret;
}

ErrorKind ToErrorKind(bip32::DerivationError error)
{
    switch (error) {
    case bip32::DerivationError::HARDENED_FROM_PUBLIC: return ErrorKind::HARDENED_FROM_PUBLIC;
    case bip32::DerivationError::INVALID_CHILD_KEY: return ErrorKind::INVALID_CHILD_KEY;
    case bip32::DerivationError::MAX_DEPTH_EXCEEDED: return ErrorKind::MAX_DEPTH_EXCEEDED;
    case bip32::DerivationError::INVALID_PATH: return ErrorKind::INVALID_PATH;
    } // no default case, so the compiler can warn about missing cases
    return ErrorKind::INVALID_PATH;
}

/** Replace wildcard and multipath steps of one key by concrete indices. */
Result<KeyExpression> InstantiateKey(const KeyExpression& key, uint32_t pos, size_t multipath_index)
{
    KeyExpression ret{key};
    auto* ext = std::get_if<ExtendedKey>(&ret.body);
    if (!ext) return ret;
    for (PathStep& step : ext->path) {
        if (step.type == PathStep::Type::WILDCARD) {
            if (pos & bip32::HARDENED_BIT) {
                return MakeError(ErrorKind::INVALID_PATH, key.offset, strprintf("Derivation index %u is out of range", pos));
            }
            step = PathStep::Index(step.hardened ? pos | bip32::HARDENED_BIT : pos);
        } else if (step.type == PathStep::Type::MULTIPATH) {
            if (multipath_index >= step.indices.size()) {
                return MakeError(ErrorKind::INVALID_PATH, key.offset, strprintf("Multipath index %u is out of range, the key has %u alternatives", multipath_index, step.indices.size()));
            }
            step = PathStep::Index(step.indices[multipath_index]);
        }
    }
    return ret;
}

/** Compile one node, consuming keys from the front of `keys`. */
// NOLINTNEXTLINE(misc-no-recursion)
std::vector<CScript> BuildScripts(const ScriptExpression& expr, std::span<const ResolvedKey>& keys)
{
    const auto next_key = [&]() -> const CPubKey& {
        CHECK_NONFATAL(!keys.empty());
        const CPubKey& pubkey = keys.front().pubkey;
        keys = keys.subspan(1);
        return pubkey;
    };

    return std::visit(util::Overloaded{
        [&](const Pk&) -> std::vector<CScript> {
            return {GetScriptForRawPubKey(next_key())};
        },
        [&](const Pkh&) -> std::vector<CScript> {
            return {GetScriptForDestination(PKHash(next_key()))};
        },
        [&](const Wpkh&) -> std::vector<CScript> {
            return {GetScriptForDestination(WitnessV0KeyHash(next_key()))};
        },
        [&](const Combo&) -> std::vector<CScript> {
            const CPubKey& pubkey = next_key();
            std::vector<CScript> ret;
            ret.emplace_back(GetScriptForRawPubKey(pubkey)); // P2PK
            ret.emplace_back(GetScriptForDestination(PKHash(pubkey))); // P2PKH
            if (pubkey.IsCompressed()) {
                CScript p2wpkh{GetScriptForDestination(WitnessV0KeyHash(pubkey))};
                ret.emplace_back(p2wpkh); // P2WPKH
                ret.emplace_back(GetScriptForDestination(ScriptHash(p2wpkh))); // P2SH-P2WPKH
            }
            return ret;
        },
        [&](const Sh& n) {
            std::vector<CScript> ret;
            for (const CScript& inner : BuildScripts(*n.inner, keys)) {
                ret.emplace_back(GetScriptForDestination(ScriptHash(inner)));
            }
            return ret;
        },
        [&](const Wsh& n) {
            std::vector<CScript> ret;
            for (const CScript& inner : BuildScripts(*n.inner, keys)) {
                ret.emplace_back(GetScriptForDestination(WitnessV0ScriptHash(inner)));
            }
            return ret;
        },
        [&]<bool Sorted>(const MultiNode<Sorted>& n) -> std::vector<CScript> {
            std::vector<CPubKey> pubkeys;
            for (size_t i = 0; i < n.keys.size(); ++i) pubkeys.push_back(next_key());
            if constexpr (Sorted) std::sort(pubkeys.begin(), pubkeys.end());
            return {GetScriptForMultisig(n.threshold, pubkeys)};
        },
        [&](const Addr& n) -> std::vector<CScript> {
            return {GetScriptForDestination(n.destination)};
        },
        [&](const Raw& n) -> std::vector<CScript> {
            return {n.script};
        },
    }, expr.node);
}

} // namespace

std::string KeyToString(const KeyExpression& key, StringType type)
{
    std::string ret;
    if (key.origin) {
        ret = "[" + HexStr(key.origin->fingerprint);
        if (!key.origin->path.empty()) ret += "/" + FormatHDKeypath(key.origin->path, key.apostrophe);
        ret += "]";
    }
    ret += std::visit(util::Overloaded{
        [&](const RawPublicKey& k) { return HexStr(k.pubkey); },
        [&](const RawPrivateKey& k) {
            if (type == StringType::PUBLIC) return HexStr(k.key.GetPubKey());
            return EncodeSecret(k.key);
        },
        [&](const ExtendedKey& k) {
            std::string str;
            if (k.key.IsPrivate() && type == StringType::CANONICAL) {
                str = EncodeExtKey(k.key.GetExtKey());
            } else {
                str = EncodeExtPubKey(k.key.GetExtPubKey());
            }
            return str + FormatPath(k.path, key.apostrophe);
        },
    }, key.body);
    return ret;
}

// NOLINTNEXTLINE(misc-no-recursion)
std::string Serialize(const ScriptExpression& root, StringType type)
{
    const std::string args = std::visit(util::Overloaded{
        [&]<typename Tag>(const KeyNode<Tag>& n) { return KeyToString(n.key, type); },
        [&]<typename Tag>(const WrapperNode<Tag>& n) { return Serialize(*n.inner, type); },
        [&]<bool Sorted>(const MultiNode<Sorted>& n) {
            std::string ret = strprintf("%u", n.threshold);
            for (const KeyExpression& key : n.keys) ret += "," + KeyToString(key, type);
            return ret;
        },
        [&](const Addr& n) { return EncodeDestination(n.destination); },
        [&](const Raw& n) { return HexStr(n.script); },
    }, root.node);
    return strprintf("%s(%s)", root.Name(), args);
}

// NOLINTNEXTLINE(misc-no-recursion)
Result<ScriptExpression> Instantiate(const ScriptExpression& root, uint32_t pos, size_t multipath_index)
{
    ScriptExpression ret;
    ret.offset = root.offset;
    std::optional<Error> error;
    std::visit(util::Overloaded{
        [&]<typename Tag>(const KeyNode<Tag>& n) {
            auto key{InstantiateKey(n.key, pos, multipath_index)};
            if (!key) {
                error = std::move(key.error());
                return;
            }
            ret.node = KeyNode<Tag>{std::move(*key)};
        },
        [&]<typename Tag>(const WrapperNode<Tag>& n) {
            auto inner{Instantiate(*n.inner, pos, multipath_index)};
            if (!inner) {
                error = std::move(inner.error());
                return;
            }
            ret.node = WrapperNode<Tag>{std::make_unique<ScriptExpression>(std::move(*inner))};
        },
        [&]<bool Sorted>(const MultiNode<Sorted>& n) {
            MultiNode<Sorted> multi{n.threshold, {}};
            for (const KeyExpression& k : n.keys) {
                auto key{InstantiateKey(k, pos, multipath_index)};
                if (!key) {
                    error = std::move(key.error());
                    return;
                }
                multi.keys.push_back(std::move(*key));
            }
            ret.node = std::move(multi);
        },
        [&](const Addr& n) { ret.node = n; },
        [&](const Raw& n) { ret.node = n; },
    }, root.node);
    if (error) return util::Unexpected{std::move(*error)};
    return ret;
}

Result<std::vector<ResolvedKey>> ResolveKeys(const ScriptExpression& root, uint32_t pos, size_t multipath_index)
{
    auto concrete{Instantiate(root, pos, multipath_index)};
    if (!concrete) return util::Unexpected{std::move(concrete.error())};

    std::vector<ResolvedKey> ret;
    for (const KeyExpression* key : concrete->GetKeys()) {
        ResolvedKey resolved;
        std::vector<uint32_t> derivation;
        std::visit(util::Overloaded{
            [&](const RawPublicKey& k) { resolved.pubkey = k.pubkey; },
            [&](const RawPrivateKey& k) { resolved.pubkey = k.key.GetPubKey(); },
            [&](const ExtendedKey& k) {
                for (const PathStep& step : k.path) derivation.push_back(step.indices.at(0));
            },
        }, key->body);

        bip32::Fingerprint own_fingerprint{};
        if (const auto* ext = std::get_if<ExtendedKey>(&key->body)) {
            auto derived{bip32::DeriveHDKey(ext->key, derivation)};
            if (!derived) {
                LogDebug(BCLog::DESCRIPTOR, "Derivation of %s failed: %s\n", KeyToString(*key, StringType::PUBLIC), bip32::DerivationErrorString(derived.error()));
                return MakeError(ToErrorKind(derived.error()), key->offset, strprintf("Key %s: %s", KeyToString(*key, StringType::PUBLIC), bip32::DerivationErrorString(derived.error())));
            }
            resolved.pubkey = derived->GetPubKey();
            own_fingerprint = ext->key.GetFingerprint();
        } else {
            const CKeyID id{resolved.pubkey.GetID()};
            std::memcpy(own_fingerprint.data(), id.begin(), own_fingerprint.size());
        }

        if (key->origin) {
            resolved.origin = *key->origin;
        } else {
            resolved.origin.fingerprint = own_fingerprint;
        }
        resolved.origin.path.insert(resolved.origin.path.end(), derivation.begin(), derivation.end());
        ret.push_back(std::move(resolved));
    }
    return ret;
}

std::vector<CScript> Build(const ScriptExpression& root, std::span<const ResolvedKey> keys)
{
    std::vector<CScript> ret = BuildScripts(root, keys);
    CHECK_NONFATAL(keys.empty());
    return ret;
}

Result<std::vector<CScript>> Expand(const DescriptorDocument& doc, uint32_t pos, size_t multipath_index)
{
    auto keys{ResolveKeys(doc.root, pos, multipath_index)};
    if (!keys) return util::Unexpected{std::move(keys.error())};
    return Build(doc.root, *keys);
}

} // namespace descriptor
