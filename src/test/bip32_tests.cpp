// Copyright (c) 2013-present The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bip32.h>

#include <key.h>
#include <key_io.h>
#include <test/util/setup_common.h>
#include <util/keypath.h>
#include <util/strencodings.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

namespace {

struct TestDerivation {
    std::string pub;
    std::string prv;
    unsigned int nChild;
};

struct TestVector {
    std::string strHexMaster;
    std::vector<TestDerivation> vDerive;

    explicit TestVector(std::string strHexMasterIn) : strHexMaster(strHexMasterIn) {}

    TestVector& operator()(std::string pub, std::string prv, unsigned int nChild) {
        vDerive.emplace_back();
        TestDerivation &der = vDerive.back();
        der.pub = pub;
        der.prv = prv;
        der.nChild = nChild;
        return *this;
    }
};

// Chain of BIP 32 test vector 1, starting at the master key.
TestVector test1 =
  TestVector("000102030405060708090a0b0c0d0e0f")
    ("xpub661MyMwAqRbcFtXgS5sYJABqqG9YLmC4Q1Rdap9gSE8NqtwybGhePY2gZ29ESFjqJoCu1Rupje8YtGqsefD265TMg7usUDFdp6W1EGMcet8",
     "xprv9s21ZrQH143K3QTDL4LXw2F7HEK3wJUD2nW2nRk4stbPy6cq3jPPqjiChkVvvNKmPGJxWUtg6LnF5kejMRNNU3TGtRBeJgk33yuGBxrMPHi",
     0x80000000)
    ("xpub68Gmy5EdvgibQVfPdqkBBCHxA5htiqg55crXYuXoQRKfDBFA1WEjWgP6LHhwBZeNK1VTsfTFUHCdrfp1bgwQ9xv5ski8PX9rL2dZXvgGDnw",
     "xprv9uHRZZhk6KAJC1avXpDAp4MDc3sQKNxDiPvvkX8Br5ngLNv1TxvUxt4cV1rGL5hj6KCesnDYUhd7oWgT11eZG7XnxHrnYeSvkzY7d2bhkJ7",
     1)
    ("xpub6ASuArnXKPbfEwhqN6e3mwBcDTgzisQN1wXN9BJcM47sSikHjJf3UFHKkNAWbWMiGj7Wf5uMash7SyYq527Hqck2AxYysAA7xmALppuCkwQ",
     "xprv9wTYmMFdV23N2TdNG573QoEsfRrWKQgWeibmLntzniatZvR9BmLnvSxqu53Kw1UmYPxLgboyZQaXwTCg8MSY3H2EU4pWcQDnRnrVA1xe8fs",
     0x80000002)
    ("xpub6D4BDPcP2GT577Vvch3R8wDkScZWzQzMMUm3PWbmWvVJrZwQY4VUNgqFJPMM3No2dFDFGTsxxpG5uJh7n7epu4trkrX7x7DogT5Uv6fcLW5",
     "xprv9z4pot5VBttmtdRTWfWQmoH1taj2axGVzFqSb8C9xaxKymcFzXBDptWmT7FwuEzG3ryjH4ktypQSAewRiNMjANTtpgP4mLTj34bhnZX7UiM",
     2)
    ("xpub6FHa3pjLCk84BayeJxFW2SP4XRrFd1JYnxeLeU8EqN3vDfZmbqBqaGJAyiLjTAwm6ZLRQUMv1ZACTj37sR62cfN7fe5JnJ7dh8zL4fiyLHV",
     "xprvA2JDeKCSNNZky6uBCviVfJSKyQ1mDYahRjijr5idH2WwLsEd4Hsb2Tyh8RfQMuPh7f7RtyzTtdrbdqqsunu5Mm3wDvUAKRHSC34sJ7in334",
     1000000000)
    ("xpub6H1LXWLaKsWFhvm6RVpEL9P4KfRZSW7abD2ttkWP3SSQvnyA8FSVqNTEcYFgJS2UaFcxupHiYkro49S8yGasTvXEYBVPamhGW6cFJodrTHy",
     "xprvA41z7zogVVwxVSgdKUHDy1SKmdb533PjDz7J6N6mV6uS3ze1ai8FHa8kmHScGpWmj4WggLyQjgPie1rFSruoUihUZREPSL39UNdE3BBDu76",
     0);

bip32::HDKey DecodeHDKey(const std::string& str)
{
    if (const CExtKey xprv{DecodeExtKey(str)}; xprv.key.IsValid()) return bip32::HDKey{xprv};
    const CExtPubKey xpub{DecodeExtPubKey(str)};
    BOOST_REQUIRE_MESSAGE(xpub.pubkey.IsValid(), "undecodable key " + str);
    return bip32::HDKey{xpub};
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(bip32_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(bip32_test1)
{
    bip32::HDKey key{DecodeHDKey(test1.vDerive.front().prv)};
    BOOST_CHECK_EQUAL(HexStr(key.GetFingerprint()), "3442193e");
    for (size_t i = 0; i < test1.vDerive.size(); ++i) {
        const TestDerivation& derive = test1.vDerive[i];
        BOOST_CHECK(key.IsPrivate());
        BOOST_CHECK_EQUAL((size_t)key.GetDepth(), i);
        BOOST_CHECK_EQUAL(EncodeExtKey(key.GetExtKey()), derive.prv);
        BOOST_CHECK_EQUAL(EncodeExtPubKey(key.GetExtPubKey()), derive.pub);

        // Public derivation agrees where it is possible.
        if (!(derive.nChild & bip32::HARDENED_BIT)) {
            const bip32::HDKey pub{DecodeHDKey(derive.pub)};
            const auto pub_child{pub.Derive(derive.nChild)};
            BOOST_REQUIRE(pub_child);
            BOOST_CHECK(!pub_child->IsPrivate());
            if (i + 1 < test1.vDerive.size()) {
                BOOST_CHECK_EQUAL(EncodeExtPubKey(pub_child->GetExtPubKey()), test1.vDerive[i + 1].pub);
            }
        }

        auto child{key.Derive(derive.nChild)};
        BOOST_REQUIRE(child);
        key = std::move(*child);
    }
}

BOOST_AUTO_TEST_CASE(bip32_derive_path)
{
    const bip32::HDKey master{DecodeHDKey(test1.vDerive[0].prv)};
    std::vector<uint32_t> path;
    BOOST_REQUIRE(ParseHDKeypath("m/0h/1/2H/2/1000000000", path));

    const auto derived{bip32::DeriveHDKey(master, path)};
    BOOST_REQUIRE(derived);
    BOOST_CHECK_EQUAL(EncodeExtKey(derived->GetExtKey()), test1.vDerive[5].prv);
    BOOST_CHECK_EQUAL(EncodeExtPubKey(derived->GetExtPubKey()), test1.vDerive[5].pub);

    // Derivation composes: (m/0h/1) then (2h/2/1000000000).
    const auto mid{bip32::DeriveHDKey(master, std::vector<uint32_t>(path.begin(), path.begin() + 2))};
    BOOST_REQUIRE(mid);
    const auto rest{bip32::DeriveHDKey(*mid, std::vector<uint32_t>(path.begin() + 2, path.end()))};
    BOOST_REQUIRE(rest);
    BOOST_CHECK(*rest == *derived);

    // From the public key at m/0h/1/2h, only the unhardened tail can be derived.
    const bip32::HDKey xpub{DecodeHDKey(test1.vDerive[3].pub)};
    const auto pub_derived{bip32::DeriveHDKey(xpub, std::vector<uint32_t>{2, 1000000000})};
    BOOST_REQUIRE(pub_derived);
    BOOST_CHECK(!pub_derived->IsPrivate());
    BOOST_CHECK_EQUAL(EncodeExtPubKey(pub_derived->GetExtPubKey()), test1.vDerive[5].pub);

    // Empty path
    const auto same{bip32::DeriveHDKey(master, {})};
    BOOST_REQUIRE(same);
    BOOST_CHECK(*same == master);
}

BOOST_AUTO_TEST_CASE(bip32_hardened_from_public)
{
    const bip32::HDKey xpub{DecodeHDKey(test1.vDerive[0].pub)};
    const auto child{xpub.Derive(0 | bip32::HARDENED_BIT)};
    BOOST_REQUIRE(!child);
    BOOST_CHECK(child.error() == bip32::DerivationError::HARDENED_FROM_PUBLIC);

    const auto path_child{bip32::DeriveHDKey(xpub, std::vector<uint32_t>{1, 2 | bip32::HARDENED_BIT, 3})};
    BOOST_REQUIRE(!path_child);
    BOOST_CHECK(path_child.error() == bip32::DerivationError::HARDENED_FROM_PUBLIC);
    BOOST_CHECK(!bip32::DerivationErrorString(path_child.error()).empty());
}

BOOST_AUTO_TEST_CASE(bip32_max_depth)
{
    bip32::HDKey key{DecodeHDKey(test1.vDerive[0].pub)};
    for (int i = 0; i < 255; ++i) {
        auto child{key.Derive(0)};
        BOOST_REQUIRE(child);
        key = std::move(*child);
    }
    BOOST_CHECK_EQUAL((int)key.GetDepth(), 255);
    const auto overflow{key.Derive(0)};
    BOOST_REQUIRE(!overflow);
    BOOST_CHECK(overflow.error() == bip32::DerivationError::MAX_DEPTH_EXCEEDED);
}

BOOST_AUTO_TEST_CASE(bip32_keypath)
{
    std::vector<uint32_t> keypath;

    BOOST_CHECK(ParseHDKeypath("1", keypath));
    BOOST_CHECK(!ParseHDKeypath("///////////////////////////", keypath));

    BOOST_CHECK(ParseHDKeypath("1'/1", keypath));
    BOOST_CHECK(keypath == (std::vector<uint32_t>{0x80000001, 1}));
    BOOST_CHECK(ParseHDKeypath("/1h/1", keypath));
    BOOST_CHECK(keypath == (std::vector<uint32_t>{0x80000001, 1}));

    BOOST_CHECK(ParseHDKeypath("m", keypath));
    BOOST_CHECK(keypath.empty());
    BOOST_CHECK(ParseHDKeypath("", keypath));
    BOOST_CHECK(keypath.empty());
    BOOST_CHECK(!ParseHDKeypath("n/0", keypath));
    BOOST_CHECK(!ParseHDKeypath("m0", keypath));
    BOOST_CHECK(!ParseHDKeypath("m/0//1", keypath));
    BOOST_CHECK(!ParseHDKeypath("m/-1", keypath));
    BOOST_CHECK(!ParseHDKeypath("m/+1", keypath));
    BOOST_CHECK(!ParseHDKeypath("m/ 1", keypath));
    BOOST_CHECK(!ParseHDKeypath("m/1''", keypath));
    BOOST_CHECK(!ParseHDKeypath("m/2147483648", keypath));
    BOOST_CHECK(ParseHDKeypath("m/2147483647'", keypath));
    BOOST_CHECK(keypath == (std::vector<uint32_t>{0xFFFFFFFF}));
    BOOST_CHECK(!ParseHDKeypath("m/4294967296", keypath));

    BOOST_CHECK_EQUAL(FormatHDKeypath({}), "");
    BOOST_CHECK_EQUAL(FormatHDKeypath({0x80000000, 1, 0x80000002}), "0h/1/2h");
    BOOST_CHECK_EQUAL(FormatHDKeypath({0x80000000, 1, 0x80000002}, /*apostrophe=*/true), "0'/1/2'");
    BOOST_CHECK_EQUAL(WriteHDKeypath({}), "m");
    BOOST_CHECK_EQUAL(WriteHDKeypath({0x80000000, 1}), "m/0h/1");
}

BOOST_AUTO_TEST_SUITE_END()
