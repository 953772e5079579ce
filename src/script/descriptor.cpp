// Copyright (c) 2018-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/descriptor.h>

#include <key_io.h>
#include <logging.h>
#include <pubkey.h>
#include <script/descriptor_checksum.h>
#include <script/parsing.h>
#include <util/overloaded.h>
#include <util/strencodings.h>
#include <util/string.h>

#include <algorithm>
#include <cassert>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace descriptor {

////////////////////////////////////////////////////////////////////////////
// Internal representation                                                //
////////////////////////////////////////////////////////////////////////////

bool KeyExpression::IsRange() const
{
    const auto* ext = std::get_if<ExtendedKey>(&body);
    return ext && !ext->path.empty() && ext->path.back().type == PathStep::Type::WILDCARD;
}

size_t KeyExpression::GetMultipathCount() const
{
    if (const auto* ext = std::get_if<ExtendedKey>(&body)) {
        for (const PathStep& step : ext->path) {
            if (step.type == PathStep::Type::MULTIPATH) return step.indices.size();
        }
    }
    return 1;
}

bool KeyExpression::IsUncompressed() const
{
    return std::visit(util::Overloaded{
        [](const RawPublicKey& k) { return !k.pubkey.IsCompressed(); },
        [](const RawPrivateKey& k) { return !k.key.IsCompressed(); },
        [](const ExtendedKey&) { return false; },
    }, body);
}

bool KeyExpression::HasHardenedDerivation() const
{
    const auto* ext = std::get_if<ExtendedKey>(&body);
    if (!ext) return false;
    return std::any_of(ext->path.begin(), ext->path.end(), [](const PathStep& step) {
        if (step.type == PathStep::Type::WILDCARD) return step.hardened;
        return std::any_of(step.indices.begin(), step.indices.end(), [](uint32_t i) { return (i & bip32::HARDENED_BIT) != 0; });
    });
}

std::string_view ScriptExpression::Name() const
{
    return std::visit(util::Overloaded{
        [](const Pk&) { return "pk"; },
        [](const Pkh&) { return "pkh"; },
        [](const Wpkh&) { return "wpkh"; },
        [](const Combo&) { return "combo"; },
        [](const Sh&) { return "sh"; },
        [](const Wsh&) { return "wsh"; },
        [](const Multi&) { return "multi"; },
        [](const SortedMulti&) { return "sortedmulti"; },
        [](const Addr&) { return "addr"; },
        [](const Raw&) { return "raw"; },
    }, node);
}

// NOLINTNEXTLINE(misc-no-recursion)
ScriptExpression ScriptExpression::Clone() const
{
    ScriptExpression ret;
    ret.offset = offset;
    std::visit(util::Overloaded{
        [&]<typename Tag>(const WrapperNode<Tag>& w) {
            ret.node = WrapperNode<Tag>{std::make_unique<ScriptExpression>(w.inner->Clone())};
        },
        [&](const auto& n) { ret.node = n; },
    }, node);
    return ret;
}

// NOLINTNEXTLINE(misc-no-recursion)
std::vector<const KeyExpression*> ScriptExpression::GetKeys() const
{
    std::vector<const KeyExpression*> keys;
    std::visit(util::Overloaded{
        [&]<typename Tag>(const KeyNode<Tag>& n) { keys.push_back(&n.key); },
        [&]<typename Tag>(const WrapperNode<Tag>& w) { keys = w.inner->GetKeys(); },
        [&]<bool Sorted>(const MultiNode<Sorted>& m) {
            for (const KeyExpression& k : m.keys) keys.push_back(&k);
        },
        [](const Addr&) {},
        [](const Raw&) {},
    }, node);
    return keys;
}

bool DescriptorDocument::IsRange() const
{
    const auto keys{root.GetKeys()};
    return std::any_of(keys.begin(), keys.end(), [](const KeyExpression* k) { return k->IsRange(); });
}

size_t DescriptorDocument::GetMultipathCount() const
{
    size_t count = 1;
    for (const KeyExpression* k : root.GetKeys()) count = std::max(count, k->GetMultipathCount());
    return count;
}

std::string DescriptorDocument::ToString(StringType type) const
{
    return AddChecksum(Serialize(root, type));
}

////////////////////////////////////////////////////////////////////////////
// Parser                                                                 //
////////////////////////////////////////////////////////////////////////////

namespace {

/** Recursive descent over a checksum-less descriptor. Offsets are relative to the original text. */
class Parser
{
    const char* const m_base;

    size_t Offset(std::span<const char> sp) const { return sp.data() - m_base; }

    static std::string Str(std::span<const char> sp) { return std::string(sp.begin(), sp.end()); }

    util::Unexpected<Error> Fail(ErrorKind kind, std::span<const char> at, std::string message) const
    {
        return MakeError(kind, Offset(at), std::move(message));
    }

    std::optional<uint32_t> ParseKeyPathNum(std::span<const char> elem, bool& apostrophe, std::optional<Error>& error) const
    {
        bool hardened = false;
        const std::span<const char> full{elem};
        if (elem.size() > 0) {
            const char last = elem[elem.size() - 1];
            if (last == '\'' || last == 'h') {
                elem = elem.first(elem.size() - 1);
                hardened = true;
                apostrophe = apostrophe || last == '\'';
            }
        }
        const auto p{ToIntegral<uint32_t>(std::string_view{elem.begin(), elem.end()})};
        if (!p) {
            error = Error{ErrorKind::INVALID_PATH, Offset(full), strprintf("Key path value '%s' is not a valid uint32", std::string_view{elem.begin(), elem.end()})};
            return std::nullopt;
        } else if (*p > 0x7FFFFFFFUL) {
            error = Error{ErrorKind::INVALID_PATH, Offset(full), strprintf("Key path value %u is out of range", *p)};
            return std::nullopt;
        }
        return std::make_optional<uint32_t>(*p | (((uint32_t)hardened) << 31));
    }

    /**
     * Parse a key path, being passed a split list of elements (the first element is ignored).
     *
     * Fixed-only paths (key origins) reject wildcards and multipath steps.
     */
    Result<std::vector<PathStep>> ParseKeyPath(const std::vector<std::span<const char>>& split, bool fixed_only, bool& apostrophe) const
    {
        std::vector<PathStep> path;
        bool have_multipath = false;
        for (size_t i = 1; i < split.size(); ++i) {
            std::span<const char> elem = split[i];
            std::optional<Error> error;

            if (!fixed_only && (std::ranges::equal(elem, std::string_view{"*"}) || std::ranges::equal(elem, std::string_view{"*'"}) || std::ranges::equal(elem, std::string_view{"*h"}))) {
                if (i != split.size() - 1) {
                    return Fail(ErrorKind::INVALID_PATH, elem, "'*' may only appear as the last element of a derivation path");
                }
                apostrophe = apostrophe || elem.back() == '\'';
                path.push_back(PathStep::Wildcard(/*hardened=*/elem.size() == 2));
                continue;
            }

            if (!elem.empty() && elem.front() == '<') {
                if (fixed_only) {
                    return Fail(ErrorKind::INVALID_PATH, elem, strprintf("Key path value '%s' specifies multipath in a section where multipath is not allowed", Str(elem)));
                }
                if (have_multipath) {
                    return Fail(ErrorKind::INVALID_PATH, elem, "Multiple multipath key path specifiers found");
                }
                bool all_hardened = false;
                std::span<const char> body{elem};
                if (body.size() >= 2 && body.back() != '>' && (body.back() == '\'' || body.back() == 'h')) {
                    all_hardened = true;
                    apostrophe = apostrophe || body.back() == '\'';
                    body = body.first(body.size() - 1);
                }
                if (body.size() < 2 || body.back() != '>') {
                    return Fail(ErrorKind::INVALID_PATH, elem, strprintf("Multipath key path specifier '%s' is missing a closing '>'", Str(elem)));
                }
                const auto nums = util::Split(body.subspan(1, body.size() - 2), ';');
                if (nums.size() < 2) {
                    return Fail(ErrorKind::INVALID_PATH, elem, "Multipath key path specifiers must have at least two items");
                }
                std::vector<uint32_t> indices;
                std::set<uint32_t> seen;
                for (const auto& num : nums) {
                    auto op_num = ParseKeyPathNum(num, apostrophe, error);
                    if (!op_num) return util::Unexpected{std::move(*error)};
                    if (all_hardened) *op_num |= bip32::HARDENED_BIT;
                    if (!seen.insert(*op_num).second) {
                        return Fail(ErrorKind::INVALID_PATH, num, strprintf("Duplicated key path value %u in multipath specifier", *op_num & ~bip32::HARDENED_BIT));
                    }
                    indices.push_back(*op_num);
                }
                have_multipath = true;
                path.push_back(PathStep::Multipath(std::move(indices)));
                continue;
            }

            auto index = ParseKeyPathNum(elem, apostrophe, error);
            if (!index) return util::Unexpected{std::move(*error)};
            path.push_back(PathStep::Index(*index));
        }
        return path;
    }

    /** Parse a public key that excludes origin information. */
    Result<KeyExpression> ParseKeyInner(std::span<const char> sp, bool& apostrophe) const
    {
        auto split = util::Split(sp, '/');
        std::string str = Str(split[0]);
        if (str.size() == 0) {
            return Fail(ErrorKind::UNEXPECTED_TOKEN, sp, "No key provided");
        }
        if (IsSpace(str.front()) || IsSpace(str.back())) {
            return Fail(ErrorKind::UNEXPECTED_TOKEN, sp, strprintf("Key '%s' is invalid due to whitespace", str));
        }
        KeyExpression ret;
        if (IsHex(str)) {
            if (split.size() > 1) {
                return Fail(ErrorKind::UNEXPECTED_TOKEN, split[1], strprintf("Pubkey '%s' cannot have a derivation path", str));
            }
            std::vector<unsigned char> data = ParseHex(str);
            CPubKey pubkey(data);
            if (pubkey.IsValid() && !pubkey.IsValidNonHybrid()) {
                return Fail(ErrorKind::INVALID_KEY_ENCODING, sp, "Hybrid public keys are not allowed");
            }
            if (pubkey.IsFullyValid()) {
                ret.body = RawPublicKey{pubkey};
                return ret;
            }
            return Fail(ErrorKind::INVALID_KEY_ENCODING, sp, strprintf("Pubkey '%s' is invalid", str));
        }
        CKey key = DecodeSecret(str);
        if (key.IsValid()) {
            if (split.size() > 1) {
                return Fail(ErrorKind::UNEXPECTED_TOKEN, split[1], "Private key in WIF format cannot have a derivation path");
            }
            ret.body = RawPrivateKey{std::move(key)};
            return ret;
        }
        CExtKey extkey = DecodeExtKey(str);
        CExtPubKey extpubkey = DecodeExtPubKey(str);
        if (!extkey.key.IsValid() && !extpubkey.pubkey.IsValid()) {
            return Fail(ErrorKind::INVALID_KEY_ENCODING, sp, strprintf("key '%s' is not valid", str));
        }
        auto path{ParseKeyPath(split, /*fixed_only=*/false, apostrophe)};
        if (!path) return util::Unexpected{std::move(path.error())};
        if (extkey.key.IsValid()) {
            ret.body = ExtendedKey{bip32::HDKey{extkey}, std::move(*path)};
        } else {
            ret.body = ExtendedKey{bip32::HDKey{extpubkey}, std::move(*path)};
        }
        return ret;
    }

public:
    explicit Parser(const char* base) : m_base{base} {}

    /** Parse a public key including origin information (if enabled). */
    Result<KeyExpression> ParseKey(std::span<const char> sp) const
    {
        bool apostrophe = false;
        auto origin_split = util::Split(sp, ']');
        if (origin_split.size() > 2) {
            return Fail(ErrorKind::UNEXPECTED_TOKEN, origin_split[2], "Multiple ']' characters found for a single pubkey");
        }
        if (origin_split.size() == 1) {
            if (!sp.empty() && sp.front() == '[') {
                return Fail(ErrorKind::UNEXPECTED_TOKEN, sp, "Key origin end ']' character expected but not found");
            }
            auto ret{ParseKeyInner(sp, apostrophe)};
            if (!ret) return ret;
            ret->apostrophe = apostrophe;
            ret->offset = Offset(sp);
            return ret;
        }
        if (origin_split[0].empty() || origin_split[0][0] != '[') {
            return Fail(ErrorKind::UNEXPECTED_TOKEN, sp, strprintf("Key origin start '[ character expected but not found, got '%c' instead",
                                                                  origin_split[0].empty() ? ']' : origin_split[0][0]));
        }
        auto slash_split = util::Split(origin_split[0].subspan(1), '/');
        if (slash_split[0].size() != 8) {
            return Fail(ErrorKind::INVALID_HEX, slash_split[0], strprintf("Fingerprint is not 4 bytes (%u characters instead of 8 characters)", slash_split[0].size()));
        }
        std::string fpr_hex = Str(slash_split[0]);
        if (!IsHex(fpr_hex)) {
            return Fail(ErrorKind::INVALID_HEX, slash_split[0], strprintf("Fingerprint '%s' is not hex", fpr_hex));
        }
        auto fpr_bytes = ParseHex(fpr_hex);
        KeyOriginInfo info;
        static_assert(sizeof(info.fingerprint) == 4, "Fingerprint must be 4 bytes");
        assert(fpr_bytes.size() == 4);
        std::copy(fpr_bytes.begin(), fpr_bytes.end(), info.fingerprint.begin());
        auto origin_path{ParseKeyPath(slash_split, /*fixed_only=*/true, apostrophe)};
        if (!origin_path) return util::Unexpected{std::move(origin_path.error())};
        for (const PathStep& step : *origin_path) info.path.push_back(step.indices.at(0));

        auto ret{ParseKeyInner(origin_split[1], apostrophe)};
        if (!ret) return ret;
        ret->origin = std::move(info);
        ret->apostrophe = apostrophe;
        ret->offset = Offset(sp);
        return ret;
    }

    /** Parse a script expression; `depth` is the number of enclosing sh()/wsh() wrappers. */
    // NOLINTNEXTLINE(misc-no-recursion)
    Result<ScriptExpression> ParseScript(std::span<const char> expr, int depth) const
    {
        using namespace script;
        ScriptExpression ret;
        ret.offset = Offset(expr);
        const std::span<const char> name_span = FuncName(expr);
        const std::string name = Str(name_span);

        if (name_span.size() == expr.size()) {
            if (depth > 0) {
                return Fail(ErrorKind::UNEXPECTED_TOKEN, expr, "A function is needed within P2SH or P2WSH");
            }
            return Fail(ErrorKind::UNKNOWN_FUNCTION, expr, strprintf("'%s' is not a valid descriptor function", Str(expr)));
        }
        static const std::set<std::string> FUNCTIONS{"pk", "pkh", "wpkh", "combo", "sh", "wsh", "multi", "sortedmulti", "addr", "raw"};
        if (!FUNCTIONS.contains(name)) {
            return Fail(ErrorKind::UNKNOWN_FUNCTION, expr, strprintf("'%s' is not a valid descriptor function", name));
        }
        std::span<const char> args{expr};
        if (!Func(name, args)) {
            // Parentheses are balanced, so the call closes before the end of expr.
            size_t close = name.size();
            for (int level = 0; close < expr.size(); ++close) {
                if (expr[close] == '(') ++level;
                if (expr[close] == ')' && --level == 0) break;
            }
            return Fail(ErrorKind::UNEXPECTED_TOKEN, expr.subspan(std::min(close + 1, expr.size())), strprintf("Unexpected characters after %s()", name));
        }

        const auto single_arg = [&](std::span<const char>& sp) -> std::optional<Error> {
            std::span<const char> arg = Expr(sp);
            if (!sp.empty()) {
                return Error{ErrorKind::UNEXPECTED_TOKEN, Offset(sp), strprintf("%s(): expected ')', got '%c'", name, sp[0])};
            }
            sp = arg;
            return std::nullopt;
        };

        if (name == "pk" || name == "pkh" || name == "wpkh" || name == "combo") {
            if (auto error = single_arg(args)) return util::Unexpected{std::move(*error)};
            auto key{ParseKey(args)};
            if (!key) {
                key.error().message = strprintf("%s(): %s", name, key.error().message);
                return util::Unexpected{std::move(key.error())};
            }
            if (name == "pk") {
                ret.node = Pk{std::move(*key)};
            } else if (name == "pkh") {
                ret.node = Pkh{std::move(*key)};
            } else if (name == "wpkh") {
                ret.node = Wpkh{std::move(*key)};
            } else {
                ret.node = Combo{std::move(*key)};
            }
            return ret;
        }
        if (name == "sh" || name == "wsh") {
            // Bound the recursion before descending.
            if (depth >= MAX_WRAPPER_DEPTH) {
                return Fail(ErrorKind::NESTING_TOO_DEEP, expr, strprintf("%s(): script nesting exceeds the maximum depth of %d", name, MAX_WRAPPER_DEPTH));
            }
            if (auto error = single_arg(args)) return util::Unexpected{std::move(*error)};
            auto inner{ParseScript(args, depth + 1)};
            if (!inner) return inner;
            auto boxed = std::make_unique<ScriptExpression>(std::move(*inner));
            if (name == "sh") {
                ret.node = Sh{std::move(boxed)};
            } else {
                ret.node = Wsh{std::move(boxed)};
            }
            return ret;
        }
        if (name == "multi" || name == "sortedmulti") {
            auto threshold = Expr(args);
            const auto maybe_thres{ToIntegral<uint32_t>(std::string_view{threshold.begin(), threshold.end()})};
            if (!maybe_thres) {
                return Fail(ErrorKind::UNEXPECTED_TOKEN, threshold, strprintf("Multi threshold '%s' is not valid", Str(threshold)));
            }
            std::vector<KeyExpression> keys;
            while (args.size()) {
                if (!Const(",", args)) {
                    return Fail(ErrorKind::UNEXPECTED_TOKEN, args, strprintf("Multi: expected ',', got '%c'", args[0]));
                }
                auto arg = Expr(args);
                auto key{ParseKey(arg)};
                if (!key) {
                    key.error().message = strprintf("Multi: %s", key.error().message);
                    return util::Unexpected{std::move(key.error())};
                }
                keys.push_back(std::move(*key));
            }
            if (name == "multi") {
                ret.node = Multi{*maybe_thres, std::move(keys)};
            } else {
                ret.node = SortedMulti{*maybe_thres, std::move(keys)};
            }
            return ret;
        }
        if (name == "addr") {
            std::string error_msg;
            CTxDestination dest = DecodeDestination(Str(args), error_msg);
            if (!IsValidDestination(dest)) {
                LogDebug(BCLog::DESCRIPTOR, "addr() rejected: %s\n", error_msg);
                return Fail(ErrorKind::INVALID_ADDRESS, args, "Address is not valid");
            }
            ret.node = Addr{std::move(dest)};
            return ret;
        }
        // raw
        std::string str = Str(args);
        if (!IsHex(str)) {
            return Fail(ErrorKind::INVALID_HEX, args, "Raw script is not hex");
        }
        auto bytes = ParseHex(str);
        ret.node = Raw{CScript(bytes.begin(), bytes.end())};
        return ret;
    }
};

/** Report the first parenthesis that has no partner. */
std::optional<Error> CheckParentheses(std::span<const char> sp)
{
    std::vector<size_t> open;
    for (size_t i = 0; i < sp.size(); ++i) {
        if (sp[i] == '(') {
            open.push_back(i);
        } else if (sp[i] == ')') {
            if (open.empty()) {
                return Error{ErrorKind::UNBALANCED_PARENTHESES, i, "Unexpected ')' without matching '('"};
            }
            open.pop_back();
        }
    }
    if (!open.empty()) {
        return Error{ErrorKind::UNBALANCED_PARENTHESES, open.front(), "Missing ')' for '('"};
    }
    return std::nullopt;
}

} // namespace

Result<KeyExpression> ParseKeyExpression(std::string_view text)
{
    const std::span<const char> sp{text};
    if (const auto pos{FindInvalidDescriptorChar(sp)}) {
        return MakeError(ErrorKind::UNEXPECTED_TOKEN, *pos, strprintf("Invalid character '%c' in key expression", text[*pos]));
    }
    return Parser{sp.data()}.ParseKey(sp);
}

Result<DescriptorDocument> Parse(std::string_view text, bool require_checksum)
{
    std::span<const char> sp{text};
    std::string checksum;
    auto payload{CheckChecksum(sp, require_checksum, &checksum)};
    if (!payload) {
        LogDebug(BCLog::DESCRIPTOR, "Checksum check failed at offset %u: %s\n", payload.error().offset, payload.error().message);
        return util::Unexpected{std::move(payload.error())};
    }
    sp = *payload;
    if (auto error{CheckParentheses(sp)}) return util::Unexpected{std::move(*error)};

    const Parser parser{text.data()};
    auto expr = script::Expr(sp);
    if (!sp.empty()) {
        return MakeError(ErrorKind::UNEXPECTED_TOKEN, sp.data() - text.data(), strprintf("Unexpected '%c' after the descriptor", sp[0]));
    }
    auto root{parser.ParseScript(expr, /*depth=*/0)};
    if (!root) {
        LogDebug(BCLog::DESCRIPTOR, "Parse failed at offset %u: %s\n", root.error().offset, root.error().message);
        return util::Unexpected{std::move(root.error())};
    }

    DescriptorDocument doc;
    doc.root = std::move(*root);
    if (payload->size() != text.size()) doc.checksum = std::move(checksum);
    return doc;
}

Result<DescriptorDocument> ParseDescriptor(std::string_view text, bool require_checksum)
{
    auto doc{Parse(text, require_checksum)};
    if (!doc) return doc;
    if (auto valid{Validate(doc->root)}; !valid) {
        LogDebug(BCLog::DESCRIPTOR, "Validation failed at offset %u: %s\n", valid.error().offset, valid.error().message);
        return util::Unexpected{std::move(valid.error())};
    }
    return doc;
}

} // namespace descriptor
