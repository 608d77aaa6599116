// ETHLEDGER - Signing Session Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/signer/signing_session.h>
#include <ethledger/core/hex.h>
#include <ethledger/crypto/secp256k1.h>
#include <ethledger/eth/address.h>
#include <ethledger/eth/message.h>
#include <ethledger/eth/transaction.h>
#include <ethledger/util/logging.h>
#include "signer/fake_device.h"

#include <cstring>
#include <memory>
#include <stdexcept>

namespace ethledger {
namespace signer {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class SigningSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakeDeviceFactory>();

        config_.networkId = 31337;
        config_.baseDerivationPath = HARDHAT_BASE_PATH;
        config_.addressSearchLimit = 10;
        config_.numAddressesToFetch = 3;

        session_ = std::make_unique<SigningSession>(factory_, config_);

        tx_.from = HARDHAT_ACCOUNT_0;
        tx_.to = HARDHAT_ACCOUNT_1;
        tx_.nonce = "0x0";
        tx_.gas = "0x5208";
        tx_.maxFeePerGas = "0x77359400";
        tx_.maxPriorityFeePerGas = "0x3b9aca00";
        tx_.value = "0xde0b6b3a7640000";
    }

    /// Every operation must return the device, success or failure
    void ExpectNoOpenSession() const {
        EXPECT_EQ(session_->OpenSessionCount(), 0u);
        EXPECT_EQ(factory_->live.load(), 0);
        EXPECT_EQ(factory_->opened.load(), factory_->closed.load());
    }

    /// Sign `hash` with the private key 0x00..01, shaped like device output
    static device::DeviceSignature SignWithKeyOne(const Hash256& hash, uint64_t vBase) {
        std::array<uint8_t, 32> key{};
        key[31] = 1;
        secp256k1::RecoverableSignature sig;
        if (!secp256k1::ECDSASignRecoverable(hash.data(), key.data(), sig)) {
            throw std::runtime_error("signing failed");
        }
        device::DeviceSignature out;
        out.r = BytesToHex(sig.r.data(), sig.r.size());
        out.s = BytesToHex(sig.s.data(), sig.s.size());
        out.v = vBase + static_cast<uint64_t>(sig.recid);
        return out;
    }

    void Script(FakeDeviceScript script) { factory_->SetScript(std::move(script)); }

    std::shared_ptr<FakeDeviceFactory> factory_;
    SubproviderConfig config_;
    std::unique_ptr<SigningSession> session_;
    eth::TxParams tx_;
};

// ============================================================================
// Construction / Configuration
// ============================================================================

TEST_F(SigningSessionTest, ConstructorRejectsInvalidConfig) {
    SubproviderConfig bad = config_;
    bad.networkId = 0;
    EXPECT_THROW(SigningSession(factory_, bad), std::invalid_argument);

    bad = config_;
    bad.baseDerivationPath = "44'/x/0'";
    EXPECT_THROW(SigningSession(factory_, bad), std::invalid_argument);

    EXPECT_THROW(SigningSession(nullptr, config_), std::invalid_argument);
}

TEST_F(SigningSessionTest, SetPathValidates) {
    SignerStatus status = session_->SetPath("44'/60'/bad");
    EXPECT_FALSE(status);
    EXPECT_EQ(status.error, SignerError::InvalidDerivationPath);
    EXPECT_EQ(session_->GetPath(), HARDHAT_BASE_PATH);

    EXPECT_TRUE(session_->SetPath("m/44'/60'/1'/0"));
    EXPECT_EQ(session_->GetPath(), "m/44'/60'/1'/0");
    EXPECT_EQ(session_->GetConfig().baseDerivationPath, "m/44'/60'/1'/0");
}

TEST_F(SigningSessionTest, SetPathChangesAccounts) {
    ASSERT_TRUE(session_->SetPath("44'/60'/1'/0"));
    auto accounts = session_->GetAccounts(1);
    ASSERT_TRUE(accounts) << accounts.message;
    EXPECT_NE(accounts.value->front(), "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266");
    EXPECT_EQ(factory_->LastPath(), "m/44'/60'/1'/0");
}

// ============================================================================
// Accounts
// ============================================================================

TEST_F(SigningSessionTest, GetAccountsReturnsLowercaseChildren) {
    auto accounts = session_->GetAccounts(3);
    ASSERT_TRUE(accounts) << accounts.message;
    ASSERT_EQ(accounts.value->size(), 3u);
    EXPECT_EQ((*accounts.value)[0], "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266");
    EXPECT_EQ((*accounts.value)[1], "0x70997970c51812dc3a010c7d01b50e0d17dc79c8");
    EXPECT_EQ((*accounts.value)[2], "0x3c44cdddb6a900fa2b585dd299e03d12fa4293bc");

    // One device round trip at the base path
    EXPECT_EQ(factory_->addressCalls.load(), 1);
    EXPECT_EQ(factory_->LastPath(), "m/44'/60'/0'/0");
    EXPECT_FALSE(factory_->lastConfirm.load());
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, ConfirmationFlagReachesDevice) {
    config_.shouldAskForOnDeviceConfirmation = true;
    SigningSession confirming(factory_, config_);
    ASSERT_TRUE(confirming.GetAccounts(1));
    EXPECT_TRUE(factory_->lastConfirm.load());
}

TEST_F(SigningSessionTest, GetAccountsRejectsHardenedRange) {
    auto accounts = session_->GetAccounts(4000000000u);
    EXPECT_FALSE(accounts);
    EXPECT_EQ(accounts.error, SignerError::InvalidConfiguration);
    EXPECT_EQ(factory_->opened.load(), 0);

    accounts = session_->GetAccounts(wallet::MAX_CHILD_COUNT + 1);
    EXPECT_EQ(accounts.error, SignerError::InvalidConfiguration);
}

TEST_F(SigningSessionTest, ResolveSigningKeyFindsChild) {
    auto key = session_->ResolveSigningKey(HARDHAT_ACCOUNT_2);
    ASSERT_TRUE(key) << key.message;
    EXPECT_EQ(key.value->derivationPath, "m/44'/60'/0'/0/2");
    EXPECT_EQ(key.value->address.ToString(), "0x3c44cdddb6a900fa2b585dd299e03d12fa4293bc");
}

TEST_F(SigningSessionTest, AddressBeyondSearchLimitNotFound) {
    config_.addressSearchLimit = 2;
    SigningSession narrow(factory_, config_);
    auto key = narrow.ResolveSigningKey(HARDHAT_ACCOUNT_2);
    EXPECT_FALSE(key);
    EXPECT_EQ(key.error, SignerError::AddressNotFound);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, DeviceFailuresReleaseTheSession) {
    FakeDeviceScript script;
    script.failOpen = true;
    Script(script);
    auto accounts = session_->GetAccounts(1);
    EXPECT_EQ(accounts.error, SignerError::DeviceCommunicationError);
    ExpectNoOpenSession();

    script = FakeDeviceScript();
    script.failGetAddress = true;
    Script(script);
    accounts = session_->GetAccounts(1);
    EXPECT_EQ(accounts.error, SignerError::DeviceCommunicationError);
    EXPECT_EQ(accounts.Kind(), ErrorKind::DeviceCommunication);
    ExpectNoOpenSession();

    script = FakeDeviceScript();
    script.corruptPublicKey = true;
    Script(script);
    accounts = session_->GetAccounts(1);
    EXPECT_EQ(accounts.error, SignerError::InvalidKeyMaterial);
    ExpectNoOpenSession();

    script = FakeDeviceScript();
    script.dropChainCode = true;
    Script(script);
    accounts = session_->GetAccounts(1);
    EXPECT_EQ(accounts.error, SignerError::InvalidKeyMaterial);
    ExpectNoOpenSession();

    // A failing close is logged, the result still stands
    script = FakeDeviceScript();
    script.failClose = true;
    Script(script);
    accounts = session_->GetAccounts(1);
    EXPECT_TRUE(accounts);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, ReentrantCallRejected) {
    SignerResult<std::vector<std::string>> inner;
    FakeDeviceScript script;
    script.onGetAddress = [this, &inner]() { inner = session_->GetAccounts(1); };
    Script(script);

    auto outer = session_->GetAccounts(1);
    EXPECT_TRUE(outer) << outer.message;
    EXPECT_FALSE(inner);
    EXPECT_EQ(inner.error, SignerError::MultipleOpenConnectionsDisallowed);
    EXPECT_EQ(inner.Kind(), ErrorKind::ProtocolViolation);
    EXPECT_EQ(factory_->maxLive.load(), 1);
    ExpectNoOpenSession();
}

// ============================================================================
// Transactions
// ============================================================================

TEST_F(SigningSessionTest, SignsFeeMarketTransaction) {
    auto signedTx = session_->SignTransaction(tx_);
    ASSERT_TRUE(signedTx) << signedTx.message;
    ASSERT_EQ(signedTx.value->substr(0, 4), "0x02");

    eth::Transaction decoded = eth::Transaction::Deserialize(HexToBytes(*signedTx.value));
    EXPECT_EQ(decoded.GetType(), eth::TxType::FeeMarket);
    EXPECT_EQ(decoded.GetChainId(), 31337u);
    EXPECT_TRUE(decoded.ValidateSignature());
    auto sender = decoded.GetSenderAddress();
    ASSERT_TRUE(sender.has_value());
    EXPECT_EQ(sender->ToChecksumString(), HARDHAT_ACCOUNT_0);

    // The device signs the digest at the account's child path
    EXPECT_EQ(factory_->LastPath(), "m/44'/60'/0'/0/0");
    EXPECT_EQ(factory_->LastPayload(), decoded.GetSigningHash().ToHex());
    EXPECT_EQ(factory_->transactionCalls.load(), 1);
    EXPECT_EQ(factory_->maxLive.load(), 1);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, SignsLegacyTransactionWithReplayProtection) {
    tx_.maxFeePerGas.reset();
    tx_.maxPriorityFeePerGas.reset();
    tx_.gasPrice = "0x4a817c800";
    tx_.from = HARDHAT_ACCOUNT_1;

    auto signedTx = session_->SignTransaction(tx_);
    ASSERT_TRUE(signedTx) << signedTx.message;

    eth::Transaction decoded = eth::Transaction::Deserialize(HexToBytes(*signedTx.value));
    EXPECT_EQ(decoded.GetType(), eth::TxType::Legacy);
    EXPECT_TRUE(decoded.GetV() == 35 + 2 * 31337 || decoded.GetV() == 36 + 2 * 31337);
    EXPECT_EQ(decoded.GetSenderAddress()->ToChecksumString(), HARDHAT_ACCOUNT_1);
}

TEST_F(SigningSessionTest, InvalidParamsRejectedBeforeDevice) {
    tx_.gas.reset();
    auto result = session_->SignTransaction(tx_);
    EXPECT_EQ(result.error, SignerError::InvalidTransactionParams);

    tx_.gas = "0x5208";
    tx_.chainId = "0x1";
    result = session_->SignTransaction(tx_);
    EXPECT_EQ(result.error, SignerError::InvalidTransactionParams);

    EXPECT_EQ(factory_->opened.load(), 0);
}

TEST_F(SigningSessionTest, FromAddressChecked) {
    tx_.from.reset();
    EXPECT_EQ(session_->SignTransaction(tx_).error, SignerError::FromAddressMissingOrInvalid);

    tx_.from = "0x1234";
    EXPECT_EQ(session_->SignTransaction(tx_).error, SignerError::FromAddressMissingOrInvalid);

    // Bad EIP-55 checksum
    tx_.from = "0xF39Fd6e51aad88F6F4ce6aB8827279cffFb92266";
    EXPECT_EQ(session_->SignTransaction(tx_).error, SignerError::FromAddressMissingOrInvalid);

    EXPECT_EQ(factory_->opened.load(), 0);

    // Lowercase is accepted without a checksum
    tx_.from = "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266";
    EXPECT_TRUE(session_->SignTransaction(tx_));
}

TEST_F(SigningSessionTest, ForeignSenderNotFound) {
    tx_.from = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";
    auto result = session_->SignTransaction(tx_);
    EXPECT_EQ(result.error, SignerError::AddressNotFound);
    EXPECT_EQ(factory_->transactionCalls.load(), 0);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, DeviceRejectionReported) {
    FakeDeviceScript script;
    script.failSignTransaction = true;
    Script(script);
    auto result = session_->SignTransaction(tx_);
    EXPECT_EQ(result.error, SignerError::DeviceCommunicationError);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, SignatureFromOtherKeyIsWrongSigner) {
    eth::Transaction tx = eth::Transaction::FromParams(tx_, config_.GetChainRules());
    FakeDeviceScript script;
    script.transactionSignature = SignWithKeyOne(tx.GetSigningHash(), 0);
    Script(script);

    auto result = session_->SignTransaction(tx_);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, SignerError::WrongSigner);
    EXPECT_EQ(result.Kind(), ErrorKind::Validation);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, ConnectionHeldUntilSignerChecked) {
    eth::Transaction tx = eth::Transaction::FromParams(tx_, config_.GetChainRules());
    FakeDeviceScript script;
    script.transactionSignature = SignWithKeyOne(tx.GetSigningHash(), 0);
    Script(script);

    auto& logger = util::Logger::Instance();
    const util::LogLevel previous = logger.GetLevel();
    logger.SetLevel(util::LogLevel::Warn);
    logger.EnableAllCategories();

    int liveAtCheck = -1;
    auto sink = std::make_shared<util::CallbackSink>(
        [&](const util::LogEntry& entry) {
            if (entry.message.rfind("Signed by", 0) == 0) {
                liveAtCheck = factory_->live.load();
            }
        },
        util::LogLevel::Warn);
    logger.AddSink(sink);

    auto result = session_->SignTransaction(tx_);

    logger.RemoveSink(sink);
    logger.SetLevel(previous);

    EXPECT_EQ(result.error, SignerError::WrongSigner);
    EXPECT_EQ(liveAtCheck, 1);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, MalformedSignatureIsWrongSignature) {
    device::DeviceSignature bad;
    bad.r = std::string(64, '1');
    bad.s = std::string(64, '2');
    bad.v = 99;

    FakeDeviceScript script;
    script.transactionSignature = bad;
    Script(script);
    EXPECT_EQ(session_->SignTransaction(tx_).error, SignerError::WrongSignature);

    bad.v = 0;
    bad.r = "xyz";
    script.transactionSignature = bad;
    Script(script);
    EXPECT_EQ(session_->SignTransaction(tx_).error, SignerError::WrongSignature);

    // Zero r never validates
    bad.r = std::string(64, '0');
    script.transactionSignature = bad;
    Script(script);
    EXPECT_EQ(session_->SignTransaction(tx_).error, SignerError::WrongSignature);
    ExpectNoOpenSession();
}

// ============================================================================
// Messages
// ============================================================================

TEST_F(SigningSessionTest, PersonalMessageRecoversToAccount) {
    auto result = session_->SignPersonalMessage(std::string("0x68656c6c6f"), HARDHAT_ACCOUNT_0);
    ASSERT_TRUE(result) << result.message;
    const std::string& sig = *result.value;
    ASSERT_EQ(sig.size(), 2u + 130u);
    EXPECT_EQ(factory_->LastPayload(), "68656c6c6f");

    Bytes raw = HexToBytes(sig);
    int recid = raw[64];
    ASSERT_TRUE(recid == 0 || recid == 1);

    Bytes message = HexToBytes("68656c6c6f");
    Hash256 hash = eth::PersonalMessageHash(message);
    auto pub = secp256k1::ECDSARecover(hash.data(), raw.data(), raw.data() + 32, recid);
    ASSERT_TRUE(pub.has_value());
    EXPECT_EQ(eth::Address::FromPublicKey(*pub).ToChecksumString(), HARDHAT_ACCOUNT_0);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, PersonalSignatureLayout) {
    const std::string r = "1b" + std::string(62, 'a');
    const std::string s = "2c" + std::string(62, 'b');

    device::DeviceSignature scripted;
    scripted.r = r;
    scripted.s = s;
    scripted.v = 28;
    FakeDeviceScript script;
    script.personalSignature = scripted;
    Script(script);

    auto result = session_->SignPersonalMessage(std::string("0xdeadbeef"), HARDHAT_ACCOUNT_1);
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(*result.value, "0x" + r + s + "01");

    scripted.v = 27;
    script.personalSignature = scripted;
    Script(script);
    result = session_->SignPersonalMessage(std::string("0xdeadbeef"), HARDHAT_ACCOUNT_1);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result.value, "0x" + r + s + "00");
}

TEST_F(SigningSessionTest, PersonalMessageErrors) {
    auto missing = session_->SignPersonalMessage(std::nullopt, HARDHAT_ACCOUNT_0);
    EXPECT_EQ(missing.error, SignerError::DataMissingForSignPersonalMessage);
    EXPECT_EQ(factory_->opened.load(), 0);

    auto badAddress = session_->SignPersonalMessage(std::string("0x00"), "0xnothex");
    EXPECT_EQ(badAddress.error, SignerError::FromAddressMissingOrInvalid);

    FakeDeviceScript script;
    script.failSignPersonalMessage = true;
    Script(script);
    auto rejected = session_->SignPersonalMessage(std::string("0x00"), HARDHAT_ACCOUNT_0);
    EXPECT_EQ(rejected.error, SignerError::DeviceCommunicationError);
    ExpectNoOpenSession();
}

TEST_F(SigningSessionTest, TypedDataNotSupported) {
    auto result = session_->SignTypedData(HARDHAT_ACCOUNT_0, "{\"types\":{}}");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, SignerError::MethodNotSupported);
    EXPECT_EQ(result.Kind(), ErrorKind::Unsupported);
    EXPECT_EQ(factory_->opened.load(), 0);
}

// ============================================================================
// Recovery id normalisation
// ============================================================================

TEST(NormalizeRecoveryIdTest, AcceptsKnownEncodings) {
    EXPECT_EQ(NormalizeRecoveryId(0, 1), 0);
    EXPECT_EQ(NormalizeRecoveryId(1, 1), 1);
    EXPECT_EQ(NormalizeRecoveryId(27, 1), 0);
    EXPECT_EQ(NormalizeRecoveryId(28, 1), 1);
    EXPECT_EQ(NormalizeRecoveryId(37, 1), 0);
    EXPECT_EQ(NormalizeRecoveryId(38, 1), 1);
    EXPECT_EQ(NormalizeRecoveryId(35 + 2 * 31337, 31337), 0);
    EXPECT_EQ(NormalizeRecoveryId(36 + 2 * 31337, 31337), 1);
}

TEST(NormalizeRecoveryIdTest, RejectsOthers) {
    EXPECT_FALSE(NormalizeRecoveryId(2, 1).has_value());
    EXPECT_FALSE(NormalizeRecoveryId(29, 1).has_value());
    EXPECT_FALSE(NormalizeRecoveryId(37, 5).has_value());
    EXPECT_FALSE(NormalizeRecoveryId(39, 1).has_value());
}

} // namespace test
} // namespace signer
} // namespace ethledger
