// ETHLEDGER - Address Search Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/wallet/address_search.h>

namespace ethledger {
namespace wallet {
namespace test {

class AddressSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto seed = MnemonicToSeed("test test test test test test test test test test test junk");
        auto master = ExtendedPrivateKey::FromSeed(seed.data(), seed.size());
        ASSERT_TRUE(master.has_value());
        auto base = master->DerivePath(*DerivationPath::FromString("m/44'/60'/0'/0"));
        ASSERT_TRUE(base.has_value());

        auto pub = base->GetPublicKey();
        auto root = KeyDeriver::MakeRoot(std::vector<Byte>(pub.begin(), pub.end()),
                                         std::vector<Byte>(base->GetChainCode().begin(),
                                                           base->GetChainCode().end()),
                                         "m/44'/60'/0'/0", "44'/60'/0'/0");
        ASSERT_TRUE(root.has_value());
        root_ = *root;
    }

    static eth::Address Addr(const std::string& hex) {
        return *eth::Address::FromHex(hex);
    }

    ExtendedKey root_;
};

TEST_F(AddressSearchTest, FindsFirstChild) {
    auto result = FindPathForAddress(root_, Addr("0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266"));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.examined, 1u);
    EXPECT_EQ(result.key->derivationPath, "m/44'/60'/0'/0/0");
}

TEST_F(AddressSearchTest, FindsLaterChild) {
    auto result = FindPathForAddress(root_, Addr("0x3c44cdddb6a900fa2b585dd299e03d12fa4293bc"));
    ASSERT_TRUE(result.Found());
    EXPECT_EQ(result.examined, 3u);
    EXPECT_EQ(result.key->derivationPath, "m/44'/60'/0'/0/2");
    EXPECT_FALSE(result.derivationFailed);
}

TEST_F(AddressSearchTest, SearchIsBounded) {
    auto result = FindPathForAddress(root_, Addr("0x3c44cdddb6a900fa2b585dd299e03d12fa4293bc"), 2);
    EXPECT_FALSE(result.Found());
    EXPECT_EQ(result.examined, 2u);
    EXPECT_FALSE(result.derivationFailed);
}

TEST_F(AddressSearchTest, UnknownAddressExhaustsLimit) {
    auto result = FindPathForAddress(root_, Addr("0x0000000000000000000000000000000000000001"), 25);
    EXPECT_FALSE(result.Found());
    EXPECT_EQ(result.examined, 25u);
}

TEST_F(AddressSearchTest, ZeroLimitExaminesNothing) {
    auto result = FindPathForAddress(root_, Addr("0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266"), 0);
    EXPECT_FALSE(result.Found());
    EXPECT_EQ(result.examined, 0u);
}

TEST_F(AddressSearchTest, ListAccountsInIndexOrder) {
    auto accounts = ListAccounts(root_, 3);
    ASSERT_TRUE(accounts.has_value());
    ASSERT_EQ(accounts->size(), 3u);
    EXPECT_EQ((*accounts)[0].address.ToString(), "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266");
    EXPECT_EQ((*accounts)[1].address.ToString(), "0x70997970c51812dc3a010c7d01b50e0d17dc79c8");
    EXPECT_EQ((*accounts)[2].address.ToString(), "0x3c44cdddb6a900fa2b585dd299e03d12fa4293bc");
}

TEST_F(AddressSearchTest, ListAccountsRejectsHardenedRange) {
    EXPECT_FALSE(ListAccounts(root_, MAX_CHILD_COUNT + 1).has_value());
    EXPECT_FALSE(ListAccounts(root_, 4000000000u).has_value());
}

TEST_F(AddressSearchTest, ListAccountsEmpty) {
    auto accounts = ListAccounts(root_, 0);
    ASSERT_TRUE(accounts.has_value());
    EXPECT_TRUE(accounts->empty());
}

} // namespace test
} // namespace wallet
} // namespace ethledger
