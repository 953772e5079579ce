// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chainparams.h>
#include <common/args.h>
#include <common/bip380util.h>
#include <key.h>
#include <logging.h>
#include <util/check.h>

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

// This function returns either one of EXIT_ codes when it's expected to stop the process or
// CONTINUE_EXECUTION when it's expected to continue further.
static constexpr int CONTINUE_EXECUTION{-1};
static int AppInitUtil(ArgsManager& args, int argc, char* argv[])
{
    SetupBip380UtilArgs(args);
    std::string error;
    if (!args.ParseParameters(argc, argv, error)) {
        tfm::format(std::cerr, "error: Error parsing command line arguments: %s\n", error);
        return EXIT_FAILURE;
    }

    if (HelpRequested(args)) {
        // First part of help message is specific to this utility
        std::string strUsage = "bip380-util: output script descriptor utility\n";
        strUsage += "\n"
                    "The bip380-util tool parses and validates output script descriptors (BIP 380-386), "
                    "derives extended keys and computes descriptor checksums.\n"
                    "\n"
                    "Usage:  bip380-util [options] <command> [<value>...] [-]\n"
                    "A lone '-' reads the values from stdin, one per line.\n";
        strUsage += "\n" + args.GetHelpMessage();
        tfm::format(std::cout, "%s", strUsage);
        return EXIT_SUCCESS;
    }

    const auto chain{args.GetChainType()};
    if (!chain) {
        tfm::format(std::cerr, "error: Unknown chain %s\n", args.GetArg("-chain", ""));
        return EXIT_FAILURE;
    }
    SelectParams(*chain);

    if (args.IsArgSet("-debug")) {
        for (const std::string& category : args.GetArgs("-debug")) {
            if (!LogInstance().EnableCategory(category)) {
                tfm::format(std::cerr, "error: Unsupported logging category -debug=%s\n", category);
                return EXIT_FAILURE;
            }
        }
        LogInstance().m_print_to_console = true;
    }

    return CONTINUE_EXECUTION;
}

static int CommandLineUtil(int argc, char* argv[])
{
    ArgsManager args;
    int exit_status = AppInitUtil(args, argc, argv);
    if (exit_status != CONTINUE_EXECUTION) return exit_status;

    const auto cmd{args.GetCommand()};
    if (!cmd) {
        tfm::format(std::cerr, "error: must specify a command\n");
        return EXIT_FAILURE;
    }

    std::function<CommandResult(const ArgsManager&, const std::string&)> handler;
    if (cmd->command == "derive-key") {
        handler = DeriveKeyCommand;
    } else if (cmd->command == "key-expression") {
        handler = KeyExpressionCommand;
    } else if (cmd->command == "script-expression") {
        handler = ScriptExpressionCommand;
    } else {
        tfm::format(std::cerr, "error: Unknown command %s\n", cmd->command);
        return EXIT_FAILURE;
    }

    const std::vector<std::string> values{ReadValues(cmd->args, std::cin)};
    if (values.empty()) {
        tfm::format(std::cerr, "error: %s requires a value\n", cmd->command);
        return EXIT_FAILURE;
    }

    ECC_Context ecc_context{};
    exit_status = EXIT_SUCCESS;
    for (const std::string& value : values) {
        const CommandResult result{handler(args, value)};
        if (result) {
            tfm::format(std::cout, "%s\n", *result);
        } else {
            tfm::format(std::cerr, "error: %s\n", result.error());
            exit_status = EXIT_FAILURE;
        }
    }
    return exit_status;
}

int main(int argc, char* argv[])
{
    try {
        return CommandLineUtil(argc, argv);
    } catch (const NonFatalCheckError& e) {
        tfm::format(std::cerr, "error: %s\n", e.what());
    } catch (const std::exception& e) {
        tfm::format(std::cerr, "error: %s\n", e.what());
    }
    return EXIT_FAILURE;
}
