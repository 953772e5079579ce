// Copyright (c) 2012-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <common/args.h>
#include <test/util/setup_common.h>
#include <util/chaintype.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

class TestArgsManager : public ArgsManager
{
public:
    void SetupArgs(const std::vector<std::pair<std::string, unsigned int>>& args)
    {
        for (const auto& [name, flags] : args) {
            AddArg(name, "", flags, OptionsCategory::OPTIONS);
        }
    }
};

bool Parse(ArgsManager& args, const std::vector<std::string>& argv, std::string& error)
{
    std::vector<const char*> ptrs{"bip380-util"};
    for (const std::string& arg : argv) ptrs.push_back(arg.c_str());
    return args.ParseParameters((int)ptrs.size(), ptrs.data(), error);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(argsman_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(argsman_parse)
{
    TestArgsManager args;
    args.SetupArgs({{"-path", ArgsManager::ALLOW_ANY}, {"-address", ArgsManager::ALLOW_ANY}, {"-count", ArgsManager::ALLOW_INT}});
    std::string error;

    BOOST_REQUIRE(Parse(args, {"-path=m/0h/1", "--address", "-count=7"}, error));
    BOOST_CHECK_EQUAL(args.GetArg("-path", ""), "m/0h/1");
    BOOST_CHECK(args.GetBoolArg("-address", false));
    BOOST_CHECK_EQUAL(args.GetIntArg("-count", 0), 7);
    BOOST_CHECK(!args.IsArgSet("-missing"));
    BOOST_CHECK_EQUAL(args.GetArg("-missing", "default"), "default");

    // The last value wins; all values are kept.
    BOOST_REQUIRE(Parse(args, {"-path=1", "-path=2"}, error));
    BOOST_CHECK_EQUAL(args.GetArg("-path", ""), "2");
    BOOST_CHECK(args.GetArgs("-path") == (std::vector<std::string>{"1", "2"}));

    // Negation
    BOOST_REQUIRE(Parse(args, {"-address", "-noaddress"}, error));
    BOOST_CHECK(args.IsArgNegated("-address"));
    BOOST_CHECK(!args.GetBoolArg("-address", true));
    BOOST_CHECK(!Parse(args, {"-noaddress=1"}, error));

    // Values of boolean options
    BOOST_REQUIRE(Parse(args, {"-address=0"}, error));
    BOOST_CHECK(!args.GetBoolArg("-address", true));
    BOOST_REQUIRE(Parse(args, {"-address=1"}, error));
    BOOST_CHECK(args.GetBoolArg("-address", false));
}

BOOST_AUTO_TEST_CASE(argsman_errors)
{
    TestArgsManager args;
    args.SetupArgs({{"-count", ArgsManager::ALLOW_INT}});
    std::string error;

    BOOST_CHECK(!Parse(args, {"-unknown"}, error));
    BOOST_CHECK_EQUAL(error, "Invalid parameter -unknown");
    BOOST_CHECK(!Parse(args, {"-count=abc"}, error));
    BOOST_CHECK_EQUAL(error, "Invalid non-integer value for -count=abc");
}

BOOST_AUTO_TEST_CASE(argsman_commands)
{
    ArgsManager args;
    args.AddCommand("script-expression", "");
    args.AddCommand("key-expression", "");
    args.AddArg("-derive=<index>", "", ArgsManager::ALLOW_ANY, OptionsCategory::OPTIONS);
    std::string error;

    BOOST_REQUIRE(Parse(args, {}, error));
    BOOST_CHECK(!args.GetCommand());

    // Options may follow the command; a lone '-' is a command argument.
    BOOST_REQUIRE(Parse(args, {"script-expression", "pk(A)", "-derive=0-3", "-"}, error));
    const auto cmd{args.GetCommand()};
    BOOST_REQUIRE(cmd);
    BOOST_CHECK_EQUAL(cmd->command, "script-expression");
    BOOST_CHECK(cmd->args == (std::vector<std::string>{"pk(A)", "-"}));
    BOOST_CHECK_EQUAL(args.GetArg("-derive", ""), "0-3");
}

BOOST_AUTO_TEST_CASE(argsman_chain_and_help)
{
    ArgsManager args;
    SetupHelpOptions(args);
    args.AddArg("-chain=<chain>", "Use the chain <chain>", ArgsManager::ALLOW_ANY, OptionsCategory::CHAINPARAMS);
    std::string error;

    BOOST_REQUIRE(Parse(args, {}, error));
    BOOST_CHECK(args.GetChainType() == ChainType::MAIN);
    BOOST_CHECK(!HelpRequested(args));

    BOOST_REQUIRE(Parse(args, {"-chain=regtest", "-?"}, error));
    BOOST_CHECK(args.GetChainType() == ChainType::REGTEST);
    BOOST_CHECK(HelpRequested(args));

    BOOST_REQUIRE(Parse(args, {"-chain=nosuchchain"}, error));
    BOOST_CHECK(!args.GetChainType());

    const std::string help{args.GetHelpMessage()};
    BOOST_CHECK(help.find("-chain=<chain>") != std::string::npos);
    BOOST_CHECK(help.find("Chain selection options:") != std::string::npos);
    BOOST_CHECK(help.find("-?") == std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
