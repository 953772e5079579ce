// Copyright (c) 2018-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/descriptor.h>

#include <addresstype.h>
#include <bip32.h>
#include <key_io.h>
#include <script/descriptor_checksum.h>
#include <test/util/setup_common.h>
#include <tinyformat.h>
#include <util/strencodings.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

using namespace descriptor;

namespace {

const std::string WIF_COMPRESSED{"L4rK1yDtCWekvXuE6oXD9jCYfFNV2cWRpVuPLBcCU2z8TrisoyY1"};
const std::string WIF_UNCOMPRESSED{"5KYZdUEo39z3FPrtuX2QbbwGnNP5zTd7yyr2SC1j299sBCnWjss"};
const std::string PUB_COMPRESSED{"03a34b99f22c790c4e36b2b3c2c35a36db06226e41c692fc82b8b56ac1c540c5bd"};
const std::string PUB_UNCOMPRESSED{"04a34b99f22c790c4e36b2b3c2c35a36db06226e41c692fc82b8b56ac1c540c5bd5b8dec5235a0fa8722476c7709c02559e3aa73aa03918ba2d492eea75abea235"};
//! The secp256k1 generator point.
const std::string PUB_G{"0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"};

//! BIP32 test vector 1, master key.
const std::string XPUB_M{"xpub661MyMwAqRbcFtXgS5sYJABqqG9YLmC4Q1Rdap9gSE8NqtwybGhePY2gZ29ESFjqJoCu1Rupje8YtGqsefD265TMg7usUDFdp6W1EGMcet8"};
const std::string XPRV_M{"xprv9s21ZrQH143K3QTDL4LXw2F7HEK3wJUD2nW2nRk4stbPy6cq3jPPqjiChkVvvNKmPGJxWUtg6LnF5kejMRNNU3TGtRBeJgk33yuGBxrMPHi"};

/** Compare two descriptors. If only one of them has a checksum, the checksum is ignored. */
bool EqualDescriptor(std::string a, std::string b)
{
    const bool a_check{a.size() > 9 && a[a.size() - 9] == '#'};
    const bool b_check{b.size() > 9 && b[b.size() - 9] == '#'};
    if (a_check != b_check) {
        if (a_check) a = a.substr(0, a.size() - 9);
        if (b_check) b = b.substr(0, b.size() - 9);
    }
    return a == b;
}

std::vector<std::string> ToHex(const std::vector<CScript>& scripts)
{
    std::vector<std::string> ret;
    for (const CScript& script : scripts) ret.push_back(HexStr(script));
    return ret;
}

DescriptorDocument ParseOK(const std::string& text)
{
    auto doc{ParseDescriptor(text)};
    BOOST_REQUIRE_MESSAGE(doc, text + ": " + (doc ? "" : doc.error().message));
    return std::move(*doc);
}

std::vector<std::string> ExpandOK(const std::string& text, uint32_t pos = 0, size_t multipath_index = 0)
{
    const DescriptorDocument doc{ParseOK(text)};
    const auto scripts{Expand(doc, pos, multipath_index)};
    BOOST_REQUIRE_MESSAGE(scripts, text + ": " + (scripts ? "" : scripts.error().message));
    return ToHex(*scripts);
}

/** Check that parsing plus validation fails with the given kind, at the given offset. */
void CheckError(const std::string& text, ErrorKind kind, size_t offset)
{
    const auto doc{ParseDescriptor(text)};
    BOOST_REQUIRE_MESSAGE(!doc, text + " unexpectedly parsed");
    BOOST_CHECK_MESSAGE(doc.error().kind == kind, text + ": " + doc.error().message);
    BOOST_CHECK_MESSAGE(doc.error().offset == offset, strprintf("%s: offset %u, expected %u", text, doc.error().offset, offset));
}

/** Check that parsing and validation fail with the given kind. */
void CheckError(const std::string& text, ErrorKind kind)
{
    const auto doc{ParseDescriptor(text)};
    BOOST_REQUIRE_MESSAGE(!doc, text + " unexpectedly parsed");
    BOOST_CHECK_MESSAGE(doc.error().kind == kind, text + ": " + doc.error().message);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(descriptor_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(descriptor_single_key_scripts)
{
    // Basic single-key compressed
    BOOST_CHECK(ExpandOK("pk(" + WIF_COMPRESSED + ")") == std::vector<std::string>{"21" + PUB_COMPRESSED + "ac"});
    BOOST_CHECK(ExpandOK("pk(" + PUB_COMPRESSED + ")") == std::vector<std::string>{"21" + PUB_COMPRESSED + "ac"});
    BOOST_CHECK(ExpandOK("pkh([deadbeef/1/2'/3/4']" + WIF_COMPRESSED + ")") == std::vector<std::string>{"76a9149a1c78a507689f6f54b847ad1cef1e614ee23f1e88ac"});
    BOOST_CHECK(ExpandOK("wpkh(" + WIF_COMPRESSED + ")") == std::vector<std::string>{"00149a1c78a507689f6f54b847ad1cef1e614ee23f1e"});
    BOOST_CHECK(ExpandOK("sh(wpkh(" + PUB_COMPRESSED + "))") == std::vector<std::string>{"a91484ab21b1b2fd065d4504ff693d832434b6108d7b87"});

    // Basic single-key uncompressed
    BOOST_CHECK(ExpandOK("pk(" + WIF_UNCOMPRESSED + ")") == std::vector<std::string>{"41" + PUB_UNCOMPRESSED + "ac"});
    BOOST_CHECK(ExpandOK("pkh(" + WIF_UNCOMPRESSED + ")") == std::vector<std::string>{"76a914b5bd079c4d57cc7fc28ecf8213a6b791625b818388ac"});
    BOOST_CHECK(ExpandOK("pkh(" + PUB_UNCOMPRESSED + ")") == std::vector<std::string>{"76a914b5bd079c4d57cc7fc28ecf8213a6b791625b818388ac"});
}

BOOST_AUTO_TEST_CASE(descriptor_combo)
{
    BOOST_CHECK(ExpandOK("combo(" + WIF_COMPRESSED + ")") == (std::vector<std::string>{
        "21" + PUB_COMPRESSED + "ac",
        "76a9149a1c78a507689f6f54b847ad1cef1e614ee23f1e88ac",
        "00149a1c78a507689f6f54b847ad1cef1e614ee23f1e",
        "a91484ab21b1b2fd065d4504ff693d832434b6108d7b87",
    }));
    // Uncompressed keys have no segwit outputs.
    BOOST_CHECK(ExpandOK("combo(" + WIF_UNCOMPRESSED + ")") == (std::vector<std::string>{
        "41" + PUB_UNCOMPRESSED + "ac",
        "76a914b5bd079c4d57cc7fc28ecf8213a6b791625b818388ac",
    }));
}

BOOST_AUTO_TEST_CASE(descriptor_wrappers)
{
    const CPubKey pubkey{ParseHex(PUB_COMPRESSED)};
    const CScript p2pk{CScript() << ToByteVector(pubkey) << OP_CHECKSIG};
    const CScript p2pkh{GetScriptForDestination(PKHash(pubkey))};

    const std::vector<std::string> sh_pk{ExpandOK("sh(pk(" + PUB_COMPRESSED + "))")};
    BOOST_CHECK(sh_pk == std::vector<std::string>{HexStr(GetScriptForDestination(ScriptHash(p2pk)))});

    const std::vector<std::string> wsh_pk{ExpandOK("wsh(pk(" + PUB_COMPRESSED + "))")};
    BOOST_CHECK(wsh_pk == std::vector<std::string>{HexStr(GetScriptForDestination(WitnessV0ScriptHash(p2pk)))});

    const CScript wsh_pkh{GetScriptForDestination(WitnessV0ScriptHash(p2pkh))};
    const std::vector<std::string> sh_wsh_pkh{ExpandOK("sh(wsh(pkh(" + WIF_COMPRESSED + ")))")};
    BOOST_CHECK(sh_wsh_pkh == std::vector<std::string>{HexStr(GetScriptForDestination(ScriptHash(wsh_pkh)))});
    BOOST_CHECK_EQUAL(sh_wsh_pkh.at(0).size(), 46U);
    BOOST_CHECK(sh_wsh_pkh.at(0).starts_with("a914"));
}

BOOST_AUTO_TEST_CASE(descriptor_multisig)
{
    const std::string expected{"5121" + PUB_COMPRESSED + "41" + PUB_UNCOMPRESSED + "52ae"};
    BOOST_CHECK(ExpandOK("multi(1," + WIF_COMPRESSED + "," + WIF_UNCOMPRESSED + ")") == std::vector<std::string>{expected});
    // sortedmulti orders the keys by their serialization
    BOOST_CHECK(ExpandOK("sortedmulti(1," + WIF_UNCOMPRESSED + "," + WIF_COMPRESSED + ")") == std::vector<std::string>{expected});
    // multi keeps the given order
    BOOST_CHECK(ExpandOK("multi(1," + WIF_UNCOMPRESSED + "," + WIF_COMPRESSED + ")") != std::vector<std::string>{expected});

    const std::string two_of_two{ExpandOK("multi(2," + PUB_G + "," + PUB_COMPRESSED + ")").at(0)};
    BOOST_CHECK_EQUAL(two_of_two, "5221" + PUB_G + "21" + PUB_COMPRESSED + "52ae");
    BOOST_CHECK(ExpandOK("sortedmulti(2," + PUB_COMPRESSED + "," + PUB_G + ")") == std::vector<std::string>{two_of_two});

    // 20 keys is the maximum
    std::string twenty{"multi(20"};
    for (int i = 0; i < 20; ++i) twenty += "," + PUB_G;
    twenty += ")";
    const std::string script{ExpandOK("wsh(" + twenty + ")").at(0)};
    BOOST_CHECK(script.starts_with("0020"));
}

BOOST_AUTO_TEST_CASE(descriptor_extended_keys)
{
    BOOST_CHECK(ExpandOK("pk(xprv9uPDJpEQgRQfDcW7BkF7eTya6RPxXeJCqCJGHuCJ4GiRVLzkTXBAJMu2qaMWPrS7AANYqdq6vcBcBUdJCVVFceUvJFjaPdGZ2y9WACViL4L/0)") ==
                std::vector<std::string>{"210379e45b3cf75f9c5f9befd8e9506fb962f6a9d185ac87001ec44a8d3df8d4a9e3ac"});
    BOOST_CHECK(ExpandOK("pk(xpub68NZiKmJWnxxS6aaHmn81bvJeTESw724CRDs6HbuccFQN9Ku14VQrADWgqbhhTHBaohPX4CjNLf9fq9MYo6oDaPPLPxSb7gwQN3ih19Zm4Y/0)") ==
                std::vector<std::string>{"210379e45b3cf75f9c5f9befd8e9506fb962f6a9d185ac87001ec44a8d3df8d4a9e3ac"});

    const std::string xprv_desc{"pkh(xprv9s21ZrQH143K31xYSDQpPDxsXRTUcvj2iNHm5NUtrGiGG5e2DtALGdso3pGz6ssrdK4PFmM8NSpSBHNqPqm55Qn3LqFtT2emdEXVYsCzC2U/2147483647'/0)"};
    BOOST_CHECK(ExpandOK(xprv_desc) == std::vector<std::string>{"76a914ebdc90806a9c4356c1c88e42216611e1cb4c1c1788ac"});
    const DescriptorDocument doc{ParseOK(xprv_desc)};
    BOOST_CHECK(EqualDescriptor(doc.ToString(StringType::PUBLIC),
                                "pkh(xpub661MyMwAqRbcFW31YEwpkMuc5THy2PSt5bDMsktWQcFF8syAmRUapSCGu8ED9W6oDMSgv6Zz8idoc4a6mr8BDzTJY47LJhkJ8UB7WEGuduB/2147483647'/0)"));
    BOOST_CHECK(EqualDescriptor(doc.ToString(), xprv_desc));
    BOOST_CHECK(!doc.IsRange());
}

BOOST_AUTO_TEST_CASE(descriptor_ranged)
{
    const std::string xprv{"pkh([ffffffff/13']xprv9vHkqa6EV4sPZHYqZznhT2NPtPCjKuDKGY38FBWLvgaDx45zo9WQRUT3dKYnjwih2yJD9mkrocEZXo1ex8G81dwSM1fwqWpWkeS3v86pgKt/1/2/*)"};
    const std::string xpub{"pkh([ffffffff/13']xpub69H7F5d8KSRgmmdJg2KhpAK8SR3DjMwAdkxj3ZuxV27CprR9LgpeyGmXUbC6wb7ERfvrnKZjXoUmmDznezpbZb7ap6r1D3tgFxHmwMkQTPH/1/2/*)"};
    const std::vector<std::string> expected{
        "76a914326b2249e3a25d5dc60935f044ee835d090ba85988ac",
        "76a914af0bd98abc2f2cae66e36896a39ffe2d32984fb788ac",
        "76a9141fa798efd1cbf95cebf912c031b8a4a6e9fb9f2788ac",
    };
    for (uint32_t pos = 0; pos < expected.size(); ++pos) {
        BOOST_CHECK(ExpandOK(xprv, pos) == std::vector<std::string>{expected[pos]});
        BOOST_CHECK(ExpandOK(xpub, pos) == std::vector<std::string>{expected[pos]});
    }

    const DescriptorDocument doc{ParseOK(xprv)};
    BOOST_CHECK(doc.IsRange());
    BOOST_CHECK_EQUAL(doc.GetMultipathCount(), 1U);
    BOOST_CHECK(EqualDescriptor(doc.ToString(StringType::PUBLIC), xpub));

    // Expansion is deterministic and does not touch the template.
    const auto first{Expand(doc, 5)};
    const auto second{Expand(doc, 5)};
    BOOST_REQUIRE(first && second);
    BOOST_CHECK(*first == *second);
    BOOST_CHECK(EqualDescriptor(doc.ToString(), xprv));

    // A hardened wildcard needs the private key.
    BOOST_CHECK(ExpandOK("wpkh(" + XPRV_M + "/1/*h)", 3).size() == 1);
    const DescriptorDocument hardened{ParseOK("wpkh(" + XPUB_M + "/1/*h)")};
    const auto failed{Expand(hardened, 3)};
    BOOST_REQUIRE(!failed);
    BOOST_CHECK(failed.error().kind == ErrorKind::HARDENED_FROM_PUBLIC);
    BOOST_CHECK(failed.error().Class() == ErrorClass::DERIVATION);

    // Positions that do not fit a non-hardened index are rejected.
    const auto too_far{Expand(doc, 0x80000000U)};
    BOOST_REQUIRE(!too_far);
    BOOST_CHECK(too_far.error().kind == ErrorKind::INVALID_PATH);
}

BOOST_AUTO_TEST_CASE(descriptor_multipath)
{
    const DescriptorDocument doc{ParseOK("wpkh(" + XPUB_M + "/<0;1>/*)")};
    BOOST_CHECK_EQUAL(doc.GetMultipathCount(), 2U);
    BOOST_CHECK(doc.IsRange());

    for (uint32_t pos : {0U, 7U}) {
        BOOST_CHECK(ExpandOK("wpkh(" + XPUB_M + "/<0;1>/*)", pos, 0) == ExpandOK("wpkh(" + XPUB_M + "/0/*)", pos));
        BOOST_CHECK(ExpandOK("wpkh(" + XPUB_M + "/<0;1>/*)", pos, 1) == ExpandOK("wpkh(" + XPUB_M + "/1/*)", pos));
    }

    // Multipath and fixed keys can be mixed; multipath keys move together.
    const std::string mixed{"sortedmulti(1," + PUB_G + "," + XPUB_M + "/<3;4;5>," + XPRV_M + "/<6;7;8>/*)"};
    const DescriptorDocument mixed_doc{ParseOK(mixed)};
    BOOST_CHECK_EQUAL(mixed_doc.GetMultipathCount(), 3U);
    BOOST_CHECK(ExpandOK(mixed, 2, 1) == ExpandOK("sortedmulti(1," + PUB_G + "," + XPUB_M + "/4," + XPRV_M + "/7/*)", 2));

    const auto out_of_range{Expand(doc, 0, 2)};
    BOOST_REQUIRE(!out_of_range);
    BOOST_CHECK(out_of_range.error().kind == ErrorKind::INVALID_PATH);

    // Instantiating yields a concrete tree and leaves the template unchanged.
    const auto concrete{Instantiate(doc.root, 9, 1)};
    BOOST_REQUIRE(concrete);
    BOOST_CHECK_EQUAL(Serialize(*concrete), "wpkh(" + XPUB_M + "/1/9)");
    BOOST_CHECK_EQUAL(Serialize(doc.root), "wpkh(" + XPUB_M + "/<0;1>/*)");
}

BOOST_AUTO_TEST_CASE(descriptor_resolve_keys)
{
    const DescriptorDocument with_origin{ParseOK("pkh([ffffffff/13']xpub69H7F5d8KSRgmmdJg2KhpAK8SR3DjMwAdkxj3ZuxV27CprR9LgpeyGmXUbC6wb7ERfvrnKZjXoUmmDznezpbZb7ap6r1D3tgFxHmwMkQTPH/1/2/*)")};
    const auto keys{ResolveKeys(with_origin.root, 2, 0)};
    BOOST_REQUIRE(keys);
    BOOST_REQUIRE_EQUAL(keys->size(), 1U);
    BOOST_CHECK_EQUAL(HexStr(keys->at(0).origin.fingerprint), "ffffffff");
    BOOST_CHECK(keys->at(0).origin.path == (std::vector<uint32_t>{0x8000000DU, 1, 2, 2}));
    BOOST_CHECK_EQUAL(HexStr(GetScriptForDestination(PKHash(keys->at(0).pubkey))), "76a9141fa798efd1cbf95cebf912c031b8a4a6e9fb9f2788ac");

    // Without an origin, the key's own fingerprint starts the path.
    const DescriptorDocument no_origin{ParseOK("multi(1," + PUB_COMPRESSED + "," + XPUB_M + "/0/*)")};
    const auto multi_keys{ResolveKeys(no_origin.root, 4, 0)};
    BOOST_REQUIRE(multi_keys);
    BOOST_REQUIRE_EQUAL(multi_keys->size(), 2U);
    BOOST_CHECK_EQUAL(HexStr(multi_keys->at(0).pubkey), PUB_COMPRESSED);
    BOOST_CHECK_EQUAL(HexStr(multi_keys->at(0).origin.fingerprint), "9a1c78a5");
    BOOST_CHECK(multi_keys->at(0).origin.path.empty());
    BOOST_CHECK_EQUAL(HexStr(multi_keys->at(1).origin.fingerprint), "3442193e");
    BOOST_CHECK(multi_keys->at(1).origin.path == (std::vector<uint32_t>{0, 4}));

    // Build consumes the resolved keys left to right.
    const std::vector<CScript> scripts{Build(no_origin.root, *multi_keys)};
    BOOST_REQUIRE_EQUAL(scripts.size(), 1U);
    BOOST_CHECK(HexStr(scripts.at(0)).starts_with("5121" + PUB_COMPRESSED + "21"));
}

BOOST_AUTO_TEST_CASE(descriptor_addr_raw)
{
    BOOST_CHECK(ExpandOK("addr(bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4)") == std::vector<std::string>{"0014751e76e8199196d454941c45d1b3a323f1433bd6"});
    BOOST_CHECK(ExpandOK("addr(3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy)") == std::vector<std::string>{"a914b472a266d0bd89c13706a4132ccfb16f7c3b9fcb87"});
    BOOST_CHECK(ExpandOK("raw(deadbeef)") == std::vector<std::string>{"deadbeef"});
}

BOOST_AUTO_TEST_CASE(descriptor_serialization)
{
    const auto check = [](const std::string& in, const std::string& canonical, const std::string& pub) {
        const DescriptorDocument doc{ParseOK(in)};
        BOOST_CHECK_MESSAGE(EqualDescriptor(doc.ToString(), canonical), doc.ToString());
        BOOST_CHECK_MESSAGE(EqualDescriptor(doc.ToString(StringType::PUBLIC), pub), doc.ToString(StringType::PUBLIC));
        // Serialization round-trips to the same tree.
        const DescriptorDocument again{ParseOK(doc.ToString())};
        BOOST_CHECK(again.root == doc.root);
        BOOST_CHECK(ParseOK(doc.ToString(StringType::PUBLIC)).root == ParseOK(pub).root);
    };

    // Hex is lower-cased.
    check("pk(03A34B99F22C790C4E36B2B3C2C35A36DB06226E41C692FC82B8B56AC1C540C5BD)", "pk(" + PUB_COMPRESSED + ")", "pk(" + PUB_COMPRESSED + ")");
    check("raw(DEADBEEF)", "raw(deadbeef)", "raw(deadbeef)");
    check("pkh([DEADBEEF]" + PUB_COMPRESSED + ")", "pkh([deadbeef]" + PUB_COMPRESSED + ")", "pkh([deadbeef]" + PUB_COMPRESSED + ")");

    // WIF keys become pubkeys in public form.
    check("wpkh(" + WIF_COMPRESSED + ")", "wpkh(" + WIF_COMPRESSED + ")", "wpkh(" + PUB_COMPRESSED + ")");

    // Hardened markers follow the first style used, leading zeros disappear.
    check("pkh([d34db33f/44'/0h/00]" + XPRV_M + "/01/*)", "pkh([d34db33f/44'/0'/0]" + XPRV_M + "/1/*)", "pkh([d34db33f/44'/0'/0]" + XPUB_M + "/1/*)");
    check("pkh([d34db33f/44h/0h]" + XPUB_M + "/1h/*h)", "pkh([d34db33f/44h/0h]" + XPUB_M + "/1h/*h)", "pkh([d34db33f/44h/0h]" + XPUB_M + "/1h/*h)");
    check("wpkh(" + XPUB_M + "/1h/*')", "wpkh(" + XPUB_M + "/1'/*')", "wpkh(" + XPUB_M + "/1'/*')");

    // A trailing hardener on a multipath step applies to every element.
    check("wpkh(" + XPRV_M + "/<0;1>h/*)", "wpkh(" + XPRV_M + "/<0h;1h>/*)", "wpkh(" + XPUB_M + "/<0h;1h>/*)");
    check("wpkh(" + XPRV_M + "/<0;1'>/*)", "wpkh(" + XPRV_M + "/<0;1'>/*)", "wpkh(" + XPUB_M + "/<0;1'>/*)");

    // Addresses are re-encoded.
    check("addr(BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4)", "addr(bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4)", "addr(bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4)");

    // Nested and multi-key expressions
    check("sh(wsh(sortedmulti(1," + PUB_G + "," + WIF_COMPRESSED + ")))",
          "sh(wsh(sortedmulti(1," + PUB_G + "," + WIF_COMPRESSED + ")))",
          "sh(wsh(sortedmulti(1," + PUB_G + "," + PUB_COMPRESSED + ")))");
}

BOOST_AUTO_TEST_CASE(descriptor_checksum_handling)
{
    const std::string desc{"pkh([d34db33f/44'/0'/0']" + XPUB_M + "/0/*)"};
    const std::string with_checksum{AddChecksum(desc)};

    const auto doc{Parse(with_checksum, /*require_checksum=*/true)};
    BOOST_REQUIRE(doc);
    BOOST_REQUIRE(doc->checksum);
    BOOST_CHECK_EQUAL(*doc->checksum, with_checksum.substr(with_checksum.size() - 8));
    BOOST_CHECK(std::holds_alternative<Pkh>(doc->root.node));
    BOOST_CHECK(doc->IsRange());
    BOOST_CHECK_EQUAL(doc->ToString(), with_checksum);

    // Mutating the last checksum character is a checksum error.
    std::string mutated{with_checksum};
    mutated.back() = mutated.back() == 'q' ? 'p' : 'q';
    const auto bad{Parse(mutated)};
    BOOST_REQUIRE(!bad);
    BOOST_CHECK(bad.error().Class() == ErrorClass::CHECKSUM);
    BOOST_CHECK(bad.error().kind == ErrorKind::CHECKSUM_MISMATCH);
    BOOST_CHECK_EQUAL(bad.error().offset, desc.size() + 1);

    // Missing when required.
    const auto missing{Parse(desc, /*require_checksum=*/true)};
    BOOST_REQUIRE(!missing);
    BOOST_CHECK(missing.error().kind == ErrorKind::MALFORMED_CHECKSUM);
    BOOST_CHECK(Parse(desc));
}

BOOST_AUTO_TEST_CASE(descriptor_syntax_errors)
{
    const std::string pk{"pk(" + PUB_COMPRESSED + ")"};

    CheckError("pk(" + PUB_COMPRESSED, ErrorKind::UNBALANCED_PARENTHESES, 2);
    CheckError(pk + ")", ErrorKind::UNBALANCED_PARENTHESES, pk.size());
    CheckError("foo(" + PUB_COMPRESSED + ")", ErrorKind::UNKNOWN_FUNCTION, 0);
    CheckError("sh(foo(" + PUB_COMPRESSED + "))", ErrorKind::UNKNOWN_FUNCTION, 3);
    CheckError("", ErrorKind::UNKNOWN_FUNCTION, 0);
    CheckError(pk + "x", ErrorKind::UNEXPECTED_TOKEN, pk.size());
    CheckError(pk + "," + pk, ErrorKind::UNEXPECTED_TOKEN, pk.size());
    CheckError("pk(" + PUB_COMPRESSED + "," + PUB_G + ")", ErrorKind::UNEXPECTED_TOKEN, 3 + PUB_COMPRESSED.size());
    CheckError("sh(" + PUB_COMPRESSED + ")", ErrorKind::UNEXPECTED_TOKEN, 3);
    CheckError("multi(x," + PUB_G + ")", ErrorKind::UNEXPECTED_TOKEN, 6);
    CheckError("pk()", ErrorKind::UNEXPECTED_TOKEN, 3);
    CheckError("pk(" + PUB_COMPRESSED + ")\x01", ErrorKind::UNEXPECTED_TOKEN, pk.size());
    CheckError("pk( " + PUB_COMPRESSED + ")", ErrorKind::UNEXPECTED_TOKEN, 3);

    // Wrapper nesting is bounded before recursing.
    CheckError("sh(sh(sh(pk(" + PUB_COMPRESSED + "))))", ErrorKind::NESTING_TOO_DEEP, 6);
    CheckError("sh(wsh(wsh(pk(" + PUB_COMPRESSED + "))))", ErrorKind::NESTING_TOO_DEEP, 7);
    std::string deep;
    for (int i = 0; i < 10000; ++i) deep += "sh(";
    deep += pk + std::string(10000, ')');
    CheckError(deep, ErrorKind::NESTING_TOO_DEEP, 6);

    const auto error{ParseDescriptor("foo()")};
    BOOST_REQUIRE(!error);
    BOOST_CHECK_EQUAL(error.error().message, "'foo' is not a valid descriptor function");
    BOOST_CHECK(error.error().Class() == ErrorClass::SYNTAX);
}

BOOST_AUTO_TEST_CASE(descriptor_key_errors)
{
    CheckError("pk(" + WIF_COMPRESSED + "/0)", ErrorKind::UNEXPECTED_TOKEN);
    CheckError("pk(" + PUB_COMPRESSED + "/0)", ErrorKind::UNEXPECTED_TOKEN);
    CheckError("pk(02" + std::string(64, 'f') + ")", ErrorKind::INVALID_KEY_ENCODING, 3);
    CheckError("pk(03a34b)", ErrorKind::INVALID_KEY_ENCODING, 3);
    CheckError("pk(xpubnotakey)", ErrorKind::INVALID_KEY_ENCODING, 3);
    // Version bytes of an xprv over a public key
    CheckError("pk(xprv9s21ZrQH143K24Mfq5zL5MhWK9hUhhGbd45hLXo2Pq2oqzMMo63oStZzF93Y5wvzdUayhgkkFoicQZcP3y52uPPxFnfoLZB21Teqt1VvEHx)", ErrorKind::INVALID_KEY_ENCODING);

    // Origins
    CheckError("pk([deadbee]" + PUB_COMPRESSED + ")", ErrorKind::INVALID_HEX, 4);
    CheckError("pk([deadbeeg]" + PUB_COMPRESSED + ")", ErrorKind::INVALID_HEX, 4);
    CheckError("pk([deadbeef]" + PUB_COMPRESSED + "])", ErrorKind::UNEXPECTED_TOKEN);
    CheckError("pk([deadbeef/0" + PUB_COMPRESSED + ")", ErrorKind::UNEXPECTED_TOKEN, 3);
    CheckError("pk(deadbeef]" + PUB_COMPRESSED + ")", ErrorKind::UNEXPECTED_TOKEN, 3);
    CheckError("pk([deadbeef])", ErrorKind::UNEXPECTED_TOKEN);
    CheckError("pk([deadbeef/<0;1>]" + XPUB_M + ")", ErrorKind::INVALID_PATH);
    CheckError("pk([deadbeef/*]" + XPUB_M + ")", ErrorKind::INVALID_PATH);

    // Paths
    CheckError("pk(" + XPUB_M + "/*/0)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/2147483648)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/1x)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/1H)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/<0;1>/<2;3>)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/<0>)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/<0;0>)", ErrorKind::INVALID_PATH);
    CheckError("pk(" + XPUB_M + "/<0;1)", ErrorKind::INVALID_PATH);

    // addr() and raw()
    CheckError("addr(notanaddress)", ErrorKind::INVALID_ADDRESS, 5);
    CheckError("addr(tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx)", ErrorKind::INVALID_ADDRESS, 5);
    CheckError("raw(xyz)", ErrorKind::INVALID_HEX, 4);
    CheckError("raw(abc)", ErrorKind::INVALID_HEX, 4);
    CheckError("raw()", ErrorKind::INVALID_HEX, 4);
}

BOOST_AUTO_TEST_CASE(descriptor_semantic_errors)
{
    const std::string pk{"pk(" + PUB_COMPRESSED + ")"};

    // Placement
    CheckError("wsh(wsh(" + pk + "))", ErrorKind::INVALID_CONTEXT, 4);
    CheckError("wsh(wpkh(" + PUB_COMPRESSED + "))", ErrorKind::INVALID_CONTEXT, 4);
    CheckError("wsh(sh(" + pk + "))", ErrorKind::INVALID_CONTEXT, 4);
    CheckError("sh(combo(" + PUB_COMPRESSED + "))", ErrorKind::INVALID_CONTEXT, 3);
    CheckError("sh(addr(3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy))", ErrorKind::INVALID_CONTEXT, 3);
    CheckError("wsh(raw(deadbeef))", ErrorKind::INVALID_CONTEXT, 4);
    const auto placement{ParseDescriptor("wsh(wsh(" + pk + "))")};
    BOOST_REQUIRE(!placement);
    BOOST_CHECK_EQUAL(placement.error().message, "Can only have wsh() at top level or inside sh()");
    BOOST_CHECK(placement.error().Class() == ErrorClass::SEMANTIC);
    // ... but the grammar itself accepts it.
    BOOST_CHECK(Parse("wsh(wsh(" + pk + "))"));

    // Threshold and key count
    CheckError("multi(3," + PUB_G + "," + PUB_COMPRESSED + ")", ErrorKind::INVALID_THRESHOLD, 0);
    CheckError("multi(0," + PUB_G + ")", ErrorKind::INVALID_THRESHOLD, 0);
    CheckError("multi(1)", ErrorKind::INVALID_KEY_COUNT, 0);
    std::string twentyone{"sortedmulti(1"};
    for (int i = 0; i < 21; ++i) twentyone += "," + PUB_G;
    twentyone += ")";
    CheckError(twentyone, ErrorKind::INVALID_KEY_COUNT, 0);

    // Uncompressed keys inside segwit
    CheckError("wpkh(" + WIF_UNCOMPRESSED + ")", ErrorKind::UNCOMPRESSED_KEY, 5);
    CheckError("sh(wpkh(" + PUB_UNCOMPRESSED + "))", ErrorKind::UNCOMPRESSED_KEY, 8);
    CheckError("wsh(pk(" + PUB_UNCOMPRESSED + "))", ErrorKind::UNCOMPRESSED_KEY, 7);
    CheckError("wsh(multi(1," + PUB_G + "," + WIF_UNCOMPRESSED + "))", ErrorKind::UNCOMPRESSED_KEY, 13 + PUB_G.size());
    BOOST_CHECK(ParseDescriptor("sh(pk(" + PUB_UNCOMPRESSED + "))"));

    // Multipath lengths
    const std::string second_key{XPRV_M + "/<0;1;2>/*"};
    const std::string mismatch{"multi(1," + XPUB_M + "/<0;1>/*," + second_key + ")"};
    CheckError(mismatch, ErrorKind::MULTIPATH_MISMATCH, mismatch.size() - 1 - second_key.size());
}

BOOST_AUTO_TEST_CASE(descriptor_key_expression)
{
    const auto key{ParseKeyExpression("[d34db33f/44h/0'/0h]" + XPUB_M + "/1/*h")};
    BOOST_REQUIRE(key);
    BOOST_REQUIRE(key->origin);
    BOOST_CHECK_EQUAL(HexStr(key->origin->fingerprint), "d34db33f");
    BOOST_CHECK(key->origin->path == (std::vector<uint32_t>{44 | bip32::HARDENED_BIT, bip32::HARDENED_BIT, bip32::HARDENED_BIT}));
    BOOST_CHECK(key->IsRange());
    BOOST_CHECK(key->HasHardenedDerivation());
    BOOST_CHECK(key->apostrophe);
    BOOST_CHECK_EQUAL(KeyToString(*key), "[d34db33f/44'/0'/0']" + XPUB_M + "/1/*'");

    const auto* ext = std::get_if<ExtendedKey>(&key->body);
    BOOST_REQUIRE(ext);
    BOOST_CHECK(!ext->key.IsPrivate());
    BOOST_REQUIRE_EQUAL(ext->path.size(), 2U);
    BOOST_CHECK(ext->path[0] == PathStep::Index(1));
    BOOST_CHECK(ext->path[1] == PathStep::Wildcard(/*hardened=*/true));

    const auto wif{ParseKeyExpression(WIF_UNCOMPRESSED)};
    BOOST_REQUIRE(wif);
    BOOST_CHECK(wif->IsUncompressed());
    BOOST_CHECK(!wif->IsRange());
    BOOST_CHECK_EQUAL(KeyToString(*wif, StringType::PUBLIC), PUB_UNCOMPRESSED);

    const auto multipath{ParseKeyExpression(XPUB_M + "/<0;1;2>")};
    BOOST_REQUIRE(multipath);
    BOOST_CHECK_EQUAL(multipath->GetMultipathCount(), 3U);

    BOOST_CHECK(!ParseKeyExpression(""));
    BOOST_CHECK(!ParseKeyExpression("pk(" + PUB_COMPRESSED + ")"));
    BOOST_CHECK(!ParseKeyExpression(PUB_COMPRESSED + "\n"));
}

BOOST_AUTO_TEST_SUITE_END()
