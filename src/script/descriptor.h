// Copyright (c) 2018-2021 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BIP380_SCRIPT_DESCRIPTOR_H
#define BIP380_SCRIPT_DESCRIPTOR_H

#include <addresstype.h>
#include <bip32.h>
#include <key.h>
#include <pubkey.h>
#include <script/descriptor_error.h>
#include <script/keyorigin.h>
#include <script/script.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * Output script descriptors (BIP 380 and the script expressions of BIP 381-384).
 *
 * Descriptors are strings that describe a set of scriptPubKeys. Parsing turns
 * the text into a tree of script expressions whose leaves are key
 * expressions. The tree is a value type: every node owns its children, and
 * all operations (validation, serialization, instantiation, building) walk it
 * with explicit variant matching.
 *
 * A typical pipeline:
 *   ParseDescriptor(text) -> DescriptorDocument
 *   Expand(document, pos, multipath_index) -> output scripts
 *
 * Reference documentation about the descriptor language can be found in
 * doc/descriptors.md.
 */
namespace descriptor {

/** Wrapper nesting limit: sh(wsh(...)) is the deepest allowed chain. */
static constexpr int MAX_WRAPPER_DEPTH = 2;

/** One step of a key derivation path. */
struct PathStep {
    enum class Type {
        INDEX,     //!< A fixed index, hardened or not
        WILDCARD,  //!< '*', replaced by the expansion position
        MULTIPATH, //!< '<a;b;...>', one sibling descriptor per element
    };

    Type type{Type::INDEX};
    //! One element for INDEX, two or more for MULTIPATH, none for WILDCARD. Hardened elements carry bip32::HARDENED_BIT.
    std::vector<uint32_t> indices;
    //! Only meaningful for WILDCARD.
    bool hardened{false};

    static PathStep Index(uint32_t index) { return PathStep{Type::INDEX, {index}, false}; }
    static PathStep Wildcard(bool hardened) { return PathStep{Type::WILDCARD, {}, hardened}; }
    static PathStep Multipath(std::vector<uint32_t> indices) { return PathStep{Type::MULTIPATH, std::move(indices), false}; }

    friend bool operator==(const PathStep&, const PathStep&) = default;
};

/** A hex-encoded public key. */
struct RawPublicKey {
    CPubKey pubkey;
    friend bool operator==(const RawPublicKey&, const RawPublicKey&) = default;
};

/** A WIF private key. Whether it yields a compressed pubkey is part of the encoding. */
struct RawPrivateKey {
    CKey key;
    friend bool operator==(const RawPrivateKey&, const RawPrivateKey&) = default;
};

/** An xpub or xprv followed by a derivation path applied at expansion time. */
struct ExtendedKey {
    bip32::HDKey key;
    std::vector<PathStep> path;
    friend bool operator==(const ExtendedKey&, const ExtendedKey&) = default;
};

struct KeyExpression {
    std::optional<KeyOriginInfo> origin;
    std::variant<RawPublicKey, RawPrivateKey, ExtendedKey> body;
    //! Whether ' (rather than h) was used as hardened marker anywhere in this expression.
    bool apostrophe{false};
    //! Byte offset of the expression in the source text. Not part of the value.
    size_t offset{0};

    /** Whether the path ends in a wildcard. */
    bool IsRange() const;
    /** Number of alternatives of the multipath step, 1 when there is none. */
    size_t GetMultipathCount() const;
    /** Whether the key yields an uncompressed public key. */
    bool IsUncompressed() const;
    /** Whether any step of the derivation path is hardened. */
    bool HasHardenedDerivation() const;

    friend bool operator==(const KeyExpression& a, const KeyExpression& b)
    {
        return a.origin == b.origin && a.body == b.body && a.apostrophe == b.apostrophe;
    }
};

struct ScriptExpression;
bool operator==(const ScriptExpression& a, const ScriptExpression& b);

template <typename Tag>
struct KeyNode {
    KeyExpression key;
    friend bool operator==(const KeyNode&, const KeyNode&) = default;
};

template <typename Tag>
struct WrapperNode {
    std::unique_ptr<ScriptExpression> inner;

    friend bool operator==(const WrapperNode& a, const WrapperNode& b)
    {
        if (!a.inner || !b.inner) return a.inner == b.inner;
        return *a.inner == *b.inner;
    }
};

template <bool Sorted>
struct MultiNode {
    uint32_t threshold{0};
    std::vector<KeyExpression> keys;
    friend bool operator==(const MultiNode&, const MultiNode&) = default;
};

struct PkTag {};
struct PkhTag {};
struct WpkhTag {};
struct ComboTag {};
struct ShTag {};
struct WshTag {};

using Pk = KeyNode<PkTag>;
using Pkh = KeyNode<PkhTag>;
using Wpkh = KeyNode<WpkhTag>;
using Combo = KeyNode<ComboTag>;
using Sh = WrapperNode<ShTag>;
using Wsh = WrapperNode<WshTag>;
using Multi = MultiNode<false>;
using SortedMulti = MultiNode<true>;

struct Addr {
    CTxDestination destination;
    friend bool operator==(const Addr&, const Addr&) = default;
};

struct Raw {
    CScript script;
    friend bool operator==(const Raw&, const Raw&) = default;
};

struct ScriptExpression {
    std::variant<Pk, Pkh, Wpkh, Combo, Sh, Wsh, Multi, SortedMulti, Addr, Raw> node;
    //! Byte offset of the expression in the source text. Not part of the value.
    size_t offset{0};

    /** The function name, e.g. "sh". */
    std::string_view Name() const;
    /** Deep copy. */
    ScriptExpression Clone() const;
    /** All key expressions, in the order they appear in the text. */
    std::vector<const KeyExpression*> GetKeys() const;

    friend bool operator==(const ScriptExpression& a, const ScriptExpression& b) { return a.node == b.node; }
};

enum class StringType {
    CANONICAL, //!< Keep private keys as given
    PUBLIC,    //!< Replace WIF keys by their pubkey and xprvs by their xpub
};

/** A parsed descriptor: one script expression tree and the checksum it came with. */
struct DescriptorDocument {
    ScriptExpression root;
    //! The checksum found in the input, if any. Serialization always recomputes it.
    std::optional<std::string> checksum;

    /** Whether the expansion of this descriptor depends on the position. */
    bool IsRange() const;
    /** Number of sibling descriptors multipath steps expand to, 1 without multipath. */
    size_t GetMultipathCount() const;
    /** Convert the descriptor back to a string with checksum, undoing parsing. */
    std::string ToString(StringType type = StringType::CANONICAL) const;
};

/** A key expression resolved to a concrete public key. */
struct ResolvedKey {
    CPubKey pubkey;
    KeyOriginInfo origin;
};

/** Parse a single key expression, e.g. "[d34db33f/44h]xpub.../0/*". */
Result<KeyExpression> ParseKeyExpression(std::string_view text);

/** Parse a descriptor without semantic validation.
 *
 * If the descriptor has a checksum, it must be valid. If `require_checksum`
 * is set, the checksum is mandatory - otherwise it is optional.
 */
Result<DescriptorDocument> Parse(std::string_view text, bool require_checksum = false);

/** Check the placement, threshold, key count, compression and multipath rules. */
util::Expected<void, Error> Validate(const ScriptExpression& root);

/** Parse, then validate. */
Result<DescriptorDocument> ParseDescriptor(std::string_view text, bool require_checksum = false);

/** Serialize a key expression. */
std::string KeyToString(const KeyExpression& key, StringType type = StringType::CANONICAL);

/** Serialize a tree, without checksum. */
std::string Serialize(const ScriptExpression& root, StringType type = StringType::CANONICAL);

/**
 * Produce a concrete tree: wildcards become `pos` and multipath steps their
 * `multipath_index`-th element. The template is not modified.
 */
Result<ScriptExpression> Instantiate(const ScriptExpression& root, uint32_t pos, size_t multipath_index);

/** Derive the public key of every key expression, left to right. */
Result<std::vector<ResolvedKey>> ResolveKeys(const ScriptExpression& root, uint32_t pos, size_t multipath_index);

/**
 * Compile a tree into its output scripts, consuming `keys` left to right.
 * `keys` must come from ResolveKeys on the same tree.
 */
std::vector<CScript> Build(const ScriptExpression& root, std::span<const ResolvedKey> keys);

/** Resolve the keys and build the output scripts at one position. */
Result<std::vector<CScript>> Expand(const DescriptorDocument& doc, uint32_t pos, size_t multipath_index = 0);

} // namespace descriptor

#endif // BIP380_SCRIPT_DESCRIPTOR_H
