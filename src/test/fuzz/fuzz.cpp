// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test/fuzz/fuzz.h>

#include <tinyformat.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <tuple>

namespace {

std::map<std::string_view, std::tuple<TypeTestOneInput, FuzzTargetOptions>>& FuzzTargets()
{
    static std::map<std::string_view, std::tuple<TypeTestOneInput, FuzzTargetOptions>> g_fuzz_targets;
    return g_fuzz_targets;
}

const TypeTestOneInput* g_test_one_input{nullptr};

void Initialize()
{
    // A target can be selected with the FUZZ environment variable. With a
    // single registered target the variable is optional.
    std::string_view fuzz_target;
    if (const char* env_fuzz{std::getenv("FUZZ")}) {
        fuzz_target = env_fuzz;
    } else if (FuzzTargets().size() == 1) {
        fuzz_target = FuzzTargets().begin()->first;
    } else {
        std::cerr << "Must select fuzz target with the FUZZ env var." << std::endl;
        std::cerr << "Hint: Set the PRINT_ALL_FUZZ_TARGETS_AND_ABORT=1 env var to see all compiled targets." << std::endl;
        std::exit(EXIT_FAILURE);
    }
    if (std::getenv("PRINT_ALL_FUZZ_TARGETS_AND_ABORT")) {
        for (const auto& [name, t] : FuzzTargets()) std::cout << name << std::endl;
        std::exit(EXIT_SUCCESS);
    }
    const auto it = FuzzTargets().find(fuzz_target);
    if (it == FuzzTargets().end()) {
        std::cerr << tfm::format("No fuzz target compiled for %s.", fuzz_target) << std::endl;
        std::exit(EXIT_FAILURE);
    }
    g_test_one_input = &std::get<0>(it->second);
    std::get<1>(it->second).init();
}

} // namespace

void FuzzFrameworkRegisterTarget(std::string_view name, TypeTestOneInput target, FuzzTargetOptions opts)
{
    const auto [it, inserted]{FuzzTargets().try_emplace(name, std::move(target), std::move(opts))};
    if (!inserted) throw std::logic_error(tfm::format("Duplicate fuzz target name %s", name));
}

extern "C" int LLVMFuzzerInitialize(int* argc, char*** argv)
{
    Initialize();
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    static const auto& test_one_input = *g_test_one_input;
    test_one_input({data, size});
    return 0;
}
