// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <common/args.h>

#include <util/strencodings.h>
#include <util/string.h>

#include <algorithm>
#include <cassert>

namespace {

/** Interpret a string argument as a boolean.
 *
 * The definition of LocaleIndependentAtoi<int>() requires that non-numeric
 * string values like "foo", return 0. This means that if a user unintentionally
 * supplies a non-integer argument here, the return value is always false.
 * This means that -foo=false does what the user probably expects, but -foo=true
 * is well defined but does not do what they probably expected.
 */
bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return ToIntegral<int>(strValue).value_or(0) != 0;
}

/** Strip the leading dash(es) from a parameter name; "--foo" and "-foo" are the same. */
std::string SettingName(const std::string& arg)
{
    size_t start = 0;
    while (start < arg.size() && start < 2 && arg[start] == '-') ++start;
    return arg.substr(start);
}

constexpr int SCREEN_WIDTH{79};
constexpr int OPT_INDENT{2};
constexpr int MSG_INDENT{7};

/** Wrap a paragraph at word boundaries, indenting continuation lines. */
std::string FormatParagraph(std::string_view in, size_t width, size_t indent)
{
    std::string out;
    size_t col = 0;
    for (const auto& word : util::SplitString(in, ' ')) {
        if (word.empty()) continue;
        if (col > 0 && col + 1 + word.size() > width) {
            out += '\n';
            out += std::string(indent, ' ');
            col = indent;
        } else if (col > 0) {
            out += ' ';
            ++col;
        }
        out += word;
        col += word.size();
    }
    return out;
}

} // namespace

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_settings.clear();
    m_negated.clear();
    m_command.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);

        if (key.size() < 2 || key[0] != '-') {
            m_command.push_back(key);
            continue;
        }

        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        std::string name = SettingName(key);
        bool negated = false;
        if (name.starts_with("no") && m_available_args.size() > 0) {
            const std::string positive = name.substr(2);
            if (!GetArgFlags_("-" + name) && GetArgFlags_("-" + positive)) {
                name = positive;
                negated = true;
            }
        }

        const auto flags = GetArgFlags_("-" + name);
        if (!flags) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }
        if (negated) {
            if (*flags & ArgsManager::DISALLOW_NEGATION) {
                error = strprintf("Negating of -%s is meaningless and therefore forbidden", name);
                return false;
            }
            if (!val.empty()) {
                error = strprintf("Negated parameter -%s cannot take a value, got '%s'", name, val);
                return false;
            }
            m_settings.erase(name);
            m_negated.insert(name);
            continue;
        }
        if ((*flags & ArgsManager::ALLOW_INT) && !val.empty() && !ToIntegral<int64_t>(val)) {
            error = strprintf("Invalid non-integer value for -%s=%s", name, val);
            return false;
        }
        m_negated.erase(name);
        m_settings[name].push_back(val);
    }

    return true;
}

std::optional<unsigned int> ArgsManager::GetArgFlags_(const std::string& name) const
{
    for (const auto& arg_map : m_available_args) {
        const auto search = arg_map.second.find(name);
        if (search != arg_map.second.end()) {
            return search->second.m_flags;
        }
    }
    return std::nullopt;
}

std::optional<const ArgsManager::Command> ArgsManager::GetCommand() const
{
    Command ret;
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = m_command.begin();
    if (it == m_command.end()) {
        // No command was passed
        return std::nullopt;
    }
    if (!m_accept_any_command) {
        // The registered command
        ret.command = *(it++);
    }
    while (it != m_command.end()) {
        // The unregistered command and args (if any)
        ret.args.push_back(*(it++));
    }
    return ret;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const auto it = m_settings.find(SettingName(strArg));
    if (it == m_settings.end()) return {};
    return it->second;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const std::string name = SettingName(strArg);
    return m_settings.count(name) > 0 || m_negated.count(name) > 0;
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return m_negated.count(SettingName(strArg)) > 0;
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    return GetArg(strArg).value_or(strDefault);
}

std::optional<std::string> ArgsManager::GetArg(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const std::string name = SettingName(strArg);
    if (m_negated.count(name)) return "0";
    const auto it = m_settings.find(name);
    if (it == m_settings.end() || it->second.empty()) return std::nullopt;
    // The last value given wins.
    return it->second.back();
}

int64_t ArgsManager::GetIntArg(const std::string& strArg, int64_t nDefault) const
{
    return GetIntArg(strArg).value_or(nDefault);
}

std::optional<int64_t> ArgsManager::GetIntArg(const std::string& strArg) const
{
    const auto value = GetArg(strArg);
    if (!value) return std::nullopt;
    return ToIntegral<int64_t>(*value).value_or(0);
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    const auto value = GetArg(strArg);
    if (!value) return fDefault;
    return InterpretBool(*value);
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    const std::string name = SettingName(strArg);
    m_negated.erase(name);
    m_settings[name] = {strValue};
}

std::optional<ChainType> ArgsManager::GetChainType() const
{
    return ChainTypeFromString(GetArg("-chain", ChainTypeToString(ChainType::MAIN)));
}

void ArgsManager::AddCommand(const std::string& cmd, const std::string& help)
{
    assert(cmd.find('=') == std::string::npos);
    assert(cmd.at(0) != '-');

    std::lock_guard<std::mutex> lock(cs_args);
    m_accept_any_command = false; // latch to false
    std::map<std::string, Arg>& arg_map = m_available_args[OptionsCategory::COMMANDS];
    auto ret = arg_map.emplace(cmd, Arg{"", help, ArgsManager::COMMAND});
    assert(ret.second); // Fail on duplicate commands
}

void ArgsManager::AddArg(const std::string& name, const std::string& help, unsigned int flags, const OptionsCategory& cat)
{
    assert((flags & ArgsManager::COMMAND) == 0); // use AddCommand

    // Split arg name from its help param
    size_t eq_index = name.find('=');
    if (eq_index == std::string::npos) {
        eq_index = name.size();
    }
    std::string arg_name = name.substr(0, eq_index);

    std::lock_guard<std::mutex> lock(cs_args);
    std::map<std::string, Arg>& arg_map = m_available_args[cat];
    auto ret = arg_map.emplace(arg_name, Arg{name.substr(eq_index, name.size() - eq_index), help, flags});
    assert(ret.second); // Make sure an insertion actually happened
}

void ArgsManager::AddHiddenArgs(const std::vector<std::string>& names)
{
    for (const std::string& name : names) {
        AddArg(name, "", ArgsManager::ALLOW_ANY, OptionsCategory::HIDDEN);
    }
}

std::string ArgsManager::GetHelpMessage() const
{
    std::string usage;
    std::lock_guard<std::mutex> lock(cs_args);
    for (const auto& arg_map : m_available_args) {
        switch(arg_map.first) {
            case OptionsCategory::OPTIONS:
                usage += HelpMessageGroup("Options:");
                break;
            case OptionsCategory::CHAINPARAMS:
                usage += HelpMessageGroup("Chain selection options:");
                break;
            case OptionsCategory::DEBUG_TEST:
                usage += HelpMessageGroup("Debugging/Testing options:");
                break;
            case OptionsCategory::COMMANDS:
                usage += HelpMessageGroup("Commands:");
                break;
            default:
                break;
        }

        // When we get to the hidden options, stop
        if (arg_map.first == OptionsCategory::HIDDEN) break;

        for (const auto& arg : arg_map.second) {
            std::string name;
            if (arg.second.m_help_param.empty()) {
                name = arg.first;
            } else {
                name = arg.first + arg.second.m_help_param;
            }
            usage += HelpMessageOpt(name, arg.second.m_help_text);
        }
    }
    return usage;
}

bool HelpRequested(const ArgsManager& args)
{
    return args.IsArgSet("-?") || args.IsArgSet("-h") || args.IsArgSet("-help");
}

void SetupHelpOptions(ArgsManager& args)
{
    args.AddArg("-help", "Print this help message and exit (also -h or -?)", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);
    args.AddHiddenArgs({"-h", "-?"});
}

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    return std::string(OPT_INDENT, ' ') + std::string(option) +
           std::string("\n") + std::string(MSG_INDENT, ' ') +
           FormatParagraph(message, SCREEN_WIDTH - MSG_INDENT, MSG_INDENT) +
           std::string("\n\n");
}
