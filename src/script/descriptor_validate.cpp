// Copyright (c) 2018-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/descriptor.h>

#include <script/script.h>
#include <util/overloaded.h>
#include <util/string.h>

#include <optional>

namespace descriptor {
namespace {

enum class ParseScriptContext {
    TOP,     //!< Top-level context (script goes directly in scriptPubKey)
    P2SH,    //!< Inside sh() (script becomes P2SH redeemScript)
    P2WPKH,  //!< Inside wpkh() (no script, pubkey only)
    P2WSH,   //!< Inside wsh() (script becomes v0 witness script)
};

std::string ContextName(ParseScriptContext ctx)
{
    switch (ctx) {
    case ParseScriptContext::TOP: return "top level";
    case ParseScriptContext::P2SH: return "sh()";
    case ParseScriptContext::P2WPKH: return "wpkh()";
    case ParseScriptContext::P2WSH: return "wsh()";
    } // no default case, so the compiler can warn about missing cases
    return "";
}

std::optional<Error> CheckKey(const KeyExpression& key, ParseScriptContext ctx)
{
    if ((ctx == ParseScriptContext::P2WPKH || ctx == ParseScriptContext::P2WSH) && key.IsUncompressed()) {
        return Error{ErrorKind::UNCOMPRESSED_KEY, key.offset, strprintf("Uncompressed keys are not allowed inside %s", ContextName(ctx))};
    }
    return std::nullopt;
}

// NOLINTNEXTLINE(misc-no-recursion)
std::optional<Error> CheckScript(const ScriptExpression& expr, ParseScriptContext ctx)
{
    const auto placement = [&](const char* allowed) -> std::optional<Error> {
        return Error{ErrorKind::INVALID_CONTEXT, expr.offset, strprintf("Can only have %s() %s", expr.Name(), allowed)};
    };

    return std::visit(util::Overloaded{
        [&](const Pk& n) { return CheckKey(n.key, ctx); },
        [&](const Pkh& n) { return CheckKey(n.key, ctx); },
        [&](const Wpkh& n) -> std::optional<Error> {
            if (ctx != ParseScriptContext::TOP && ctx != ParseScriptContext::P2SH) return placement("at top level or inside sh()");
            return CheckKey(n.key, ParseScriptContext::P2WPKH);
        },
        [&](const Combo&) -> std::optional<Error> {
            if (ctx != ParseScriptContext::TOP) return placement("at top level");
            return std::nullopt;
        },
        [&](const Sh& n) -> std::optional<Error> {
            if (ctx != ParseScriptContext::TOP) return placement("at top level");
            return CheckScript(*n.inner, ParseScriptContext::P2SH);
        },
        [&](const Wsh& n) -> std::optional<Error> {
            if (ctx != ParseScriptContext::TOP && ctx != ParseScriptContext::P2SH) return placement("at top level or inside sh()");
            return CheckScript(*n.inner, ParseScriptContext::P2WSH);
        },
        [&]<bool Sorted>(const MultiNode<Sorted>& n) -> std::optional<Error> {
            if (n.threshold < 1) {
                return Error{ErrorKind::INVALID_THRESHOLD, expr.offset, strprintf("Multi threshold cannot be %d, must be at least 1", n.threshold)};
            }
            if (n.keys.empty() || n.keys.size() > (size_t)MAX_PUBKEYS_PER_MULTISIG) {
                return Error{ErrorKind::INVALID_KEY_COUNT, expr.offset, strprintf("Cannot have %u keys in multisig; must have between 1 and %d keys, inclusive", n.keys.size(), MAX_PUBKEYS_PER_MULTISIG)};
            }
            if (n.threshold > n.keys.size()) {
                return Error{ErrorKind::INVALID_THRESHOLD, expr.offset, strprintf("Multi threshold cannot be larger than the number of keys; threshold is %d but only %u keys specified", n.threshold, n.keys.size())};
            }
            for (const KeyExpression& key : n.keys) {
                if (auto error = CheckKey(key, ctx)) return error;
            }
            return std::nullopt;
        },
        [&](const Addr&) -> std::optional<Error> {
            if (ctx != ParseScriptContext::TOP) return placement("at top level");
            return std::nullopt;
        },
        [&](const Raw&) -> std::optional<Error> {
            if (ctx != ParseScriptContext::TOP) return placement("at top level");
            return std::nullopt;
        },
    }, expr.node);
}

std::optional<Error> CheckMultipath(const ScriptExpression& root)
{
    size_t count = 1;
    for (const KeyExpression* key : root.GetKeys()) {
        const size_t n = key->GetMultipathCount();
        if (n == 1) continue;
        if (count == 1) {
            count = n;
        } else if (n != count) {
            return Error{ErrorKind::MULTIPATH_MISMATCH, key->offset, "Multipath derivation paths have mismatched lengths"};
        }
    }
    return std::nullopt;
}

} // namespace

util::Expected<void, Error> Validate(const ScriptExpression& root)
{
    if (auto error = CheckScript(root, ParseScriptContext::TOP)) return util::Unexpected{std::move(*error)};
    if (auto error = CheckMultipath(root)) return util::Unexpected{std::move(*error)};
    return {};
}

} // namespace descriptor
