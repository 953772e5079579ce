// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <common/bip380util.h>

#include <addresstype.h>
#include <bip32.h>
#include <common/args.h>
#include <key.h>
#include <key_io.h>
#include <logging.h>
#include <script/descriptor.h>
#include <script/descriptor_checksum.h>
#include <util/keypath.h>
#include <util/strencodings.h>
#include <util/string.h>

#include <istream>

void SetupBip380UtilArgs(ArgsManager& argsman)
{
    SetupHelpOptions(argsman);

    argsman.AddArg("-path=<path>", "derive-key: derivation path applied to the key, e.g. m/0h/1/2 (hardened markers h, H or ')", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);
    argsman.AddArg("-verify-checksum", "script-expression: require a checksum and print OK if it matches", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);
    argsman.AddArg("-compute-checksum", "script-expression: print the expression with its computed checksum, ignoring any given checksum", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);
    argsman.AddArg("-derive=<index>|<begin>-<end>", "script-expression: print the output script for each index (and each multipath branch)", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);
    argsman.AddArg("-address", "script-expression: with -derive, also print the address of each output script", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);

    argsman.AddArg("-chain=<chain>", "Use the chain <chain> (default: main). Allowed values: main, test, regtest", ArgsManager::ALLOW_ANY, OptionsCategory::CHAINPARAMS);

    argsman.AddArg("-debug=<category>", strprintf("Output debug logging to stderr. Supported categories: %s. If <category> is not supplied or is 1 or all, output all debug logging.", LogInstance().LogCategoriesString()), ArgsManager::ALLOW_ANY, OptionsCategory::DEBUG_TEST);

    argsman.AddCommand("derive-key", "Derive an extended key along -path and print xpub:xprv");
    argsman.AddCommand("key-expression", "Validate a key expression and echo it");
    argsman.AddCommand("script-expression", "Validate a descriptor and echo it, or act on it as the options request");
}

std::vector<std::string> ReadValues(const std::vector<std::string>& cmd_args, std::istream& in)
{
    bool use_stdin = false;
    std::vector<std::string> values;
    for (const std::string& arg : cmd_args) {
        if (arg == "-") {
            use_stdin = true;
        } else {
            values.push_back(arg);
        }
    }
    if (!use_stdin) return values;

    values.clear();
    std::string line;
    while (std::getline(in, line)) {
        std::string value{TrimString(line)};
        if (!value.empty()) values.push_back(std::move(value));
    }
    return values;
}

std::optional<std::pair<uint32_t, uint32_t>> ParseDeriveRange(const std::string& str)
{
    const auto parts{util::SplitString(str, '-')};
    if (parts.size() > 2) return std::nullopt;
    const auto begin{ToIntegral<uint32_t>(parts.front())};
    const auto end{ToIntegral<uint32_t>(parts.back())};
    if (!begin || !end || *begin > *end || *end & bip32::HARDENED_BIT) return std::nullopt;
    return std::make_pair(*begin, *end);
}

CommandResult DeriveKeyCommand(const ArgsManager& args, const std::string& value)
{
    std::vector<uint32_t> path;
    const std::string path_str{args.GetArg("-path", "")};
    if (!ParseHDKeypath(path_str, path)) {
        return util::Unexpected{strprintf("Invalid derivation path '%s'", path_str)};
    }

    std::optional<bip32::HDKey> key;
    if (const CExtKey xprv{DecodeExtKey(value)}; xprv.key.IsValid()) {
        key.emplace(xprv);
    } else if (const CExtPubKey xpub{DecodeExtPubKey(value)}; xpub.pubkey.IsValid()) {
        key.emplace(xpub);
    } else {
        return util::Unexpected{strprintf("key '%s' is not a valid extended key", value)};
    }

    const auto derived{bip32::DeriveHDKey(*key, path)};
    if (!derived) {
        return util::Unexpected{strprintf("%s at path %s", bip32::DerivationErrorString(derived.error()), WriteHDKeypath(path))};
    }
    const std::string xprv_str{derived->IsPrivate() ? EncodeExtKey(derived->GetExtKey()) : ""};
    return strprintf("%s:%s", EncodeExtPubKey(derived->GetExtPubKey()), xprv_str);
}

CommandResult KeyExpressionCommand(const ArgsManager&, const std::string& value)
{
    const auto key{descriptor::ParseKeyExpression(value)};
    if (!key) return util::Unexpected{key.error().message};
    return value;
}

CommandResult ScriptExpressionCommand(const ArgsManager& args, const std::string& value)
{
    const bool verify{args.GetBoolArg("-verify-checksum", false)};
    const bool compute{args.GetBoolArg("-compute-checksum", false)};
    if (verify && compute) {
        return util::Unexpected{std::string{"-verify-checksum and -compute-checksum cannot be used together"}};
    }

    // Checksum modes only look at the character set and the checksum, not the grammar.
    if (compute) {
        const std::string payload{value.substr(0, value.find('#'))};
        const std::string checksum{descriptor::DescriptorChecksum(payload)};
        if (checksum.empty()) {
            return util::Unexpected{strprintf("Invalid character in '%s'", payload)};
        }
        return payload + "#" + checksum;
    }
    if (verify) {
        const auto payload{descriptor::CheckChecksum(value, /*require_checksum=*/true)};
        if (!payload) return util::Unexpected{payload.error().message};
        return std::string{"OK"};
    }

    const auto doc{descriptor::ParseDescriptor(value)};
    if (!doc) return util::Unexpected{doc.error().message};

    if (!args.IsArgSet("-derive")) return value;

    const std::string range_str{args.GetArg("-derive", "")};
    const auto range{ParseDeriveRange(range_str)};
    if (!range) {
        return util::Unexpected{strprintf("Invalid -derive value '%s'; expected <index> or <begin>-<end>", range_str)};
    }
    const bool with_address{args.GetBoolArg("-address", false)};
    auto [begin, end] = *range;
    if (!doc->IsRange()) end = begin;

    std::vector<std::string> lines;
    for (size_t branch = 0; branch < doc->GetMultipathCount(); ++branch) {
        for (uint32_t pos = begin;; ++pos) {
            const auto scripts{descriptor::Expand(*doc, pos, branch)};
            if (!scripts) return util::Unexpected{scripts.error().message};
            for (const CScript& script : *scripts) {
                std::string line{HexStr(script)};
                CTxDestination dest;
                if (with_address && ExtractDestination(script, dest)) line += " " + EncodeDestination(dest);
                lines.push_back(std::move(line));
            }
            if (pos == end) break;
        }
    }
    return util::Join(lines, "\n");
}
