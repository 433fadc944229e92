// test/unit/test_config_parser.cpp
// -----------------------------------------------------------

#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/ledger_config.hpp"
#include "config/ledger_params.hpp"
#include "test_support.hpp"
#include "util/config_parser.hpp"

namespace {

using rewardledger::config::LedgerConfig;
using rewardledger::util::ConfigParser;

TEST(ConfigParserTest, DefaultsMatchDocumentedValues) {
    LedgerConfig cfg;
    EXPECT_EQ(cfg.ledgerIdentity, "0xrewardledger");
    EXPECT_EQ(cfg.verifierScheme, "ecdsa");
    EXPECT_EQ(cfg.storeBackend, "sqlite");
    EXPECT_EQ(cfg.network, "mainnet");
    EXPECT_EQ(cfg.logLevel, "INFO");
    EXPECT_EQ(cfg.rewardPerClick, 250000u);
    EXPECT_EQ(cfg.inMemorySeedBalance, 0u);
    EXPECT_TRUE(cfg.gatewayEndpoint.empty());
}

TEST(ConfigParserTest, ReadsKeysCommentsAndWhitespace) {
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in(
        "# reward ledger\n"
        "\n"
        "ledgerIdentity = 0xLedger\n"
        "authorityAddress=0xauthority\n"
        "verifierScheme=hmac\n"
        "authoritySecret=  s3cret  \n"
        "storeBackend=memory\n"
        "network=devnet\n"
        "logLevel=debug\n"
        "rewardPerClick=42\n"
        "inMemorySeedBalance=1000\n"
        "someFutureKey=ignored\n");
    parser.loadFromStream(in);

    EXPECT_EQ(cfg.ledgerIdentity, "0xLedger");
    EXPECT_EQ(cfg.authorityAddress, "0xauthority");
    EXPECT_EQ(cfg.verifierScheme, "hmac");
    EXPECT_EQ(cfg.authoritySecret, "s3cret");
    EXPECT_EQ(cfg.storeBackend, "memory");
    EXPECT_EQ(cfg.network, "devnet");
    EXPECT_EQ(cfg.rewardPerClick, 42u);
    EXPECT_EQ(cfg.inMemorySeedBalance, 1000u);
    EXPECT_NO_THROW(parser.validate());
}

TEST(ConfigParserTest, MalformedLinesAndNumbersThrow) {
    LedgerConfig cfg;
    ConfigParser parser(cfg);

    std::istringstream noEquals("authorityAddress 0xa\n");
    EXPECT_THROW(parser.loadFromStream(noEquals), std::runtime_error);

    std::istringstream negative("rewardPerClick=-1\n");
    EXPECT_THROW(parser.loadFromStream(negative), std::runtime_error);

    std::istringstream suffix("inMemorySeedBalance=10abc\n");
    EXPECT_THROW(parser.loadFromStream(suffix), std::runtime_error);
}

TEST(ConfigParserTest, ValidateCatchesInconsistentSettings) {
    auto expectInvalid = [](const std::string &text) {
        LedgerConfig cfg;
        ConfigParser parser(cfg);
        std::istringstream in(text);
        parser.loadFromStream(in);
        EXPECT_THROW(parser.validate(), std::runtime_error) << text;
    };

    expectInvalid("verifierScheme=ecdsa\nauthorityPublicKey=04ab\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=ecdsa\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=hmac\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=rsa\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=hmac\nauthoritySecret=x\nstoreBackend=redis\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=hmac\nauthoritySecret=x\nnetwork=moonnet\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=hmac\nauthoritySecret=x\nlogLevel=LOUD\n");
    expectInvalid("authorityAddress=0xa\nverifierScheme=hmac\nauthoritySecret=x\nrewardPerClick=0\n");
}

TEST(ConfigParserTest, DurableStoreNeedsExternalCustody) {
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in("authorityAddress=0xa\nverifierScheme=hmac\nauthoritySecret=x\n"
                          "storeBackend=sqlite\ninMemorySeedBalance=100\n");
    parser.loadFromStream(in);
    EXPECT_THROW(parser.validate(), std::runtime_error);

    std::istringstream endpoint("gatewayEndpoint=http://127.0.0.1:8080/custody\n");
    parser.loadFromStream(endpoint);
    EXPECT_NO_THROW(parser.validate());
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("does_not_exist.conf"));
    EXPECT_EQ(cfg.storeBackend, "sqlite");
}

TEST(ConfigParserTest, LoadsFromFile) {
    rewardledger::test::ScratchFile file("test_reward_ledger.conf");
    {
        std::ofstream out(file.Path());
        out << "authorityAddress=0xboss\nnetwork=testnet\n";
    }
    LedgerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(file.Path()));
    EXPECT_EQ(cfg.authorityAddress, "0xboss");
    EXPECT_EQ(cfg.network, "testnet");
}

TEST(LedgerParamsTest, PresetsByNetwork) {
    EXPECT_EQ(rewardledger::config::getParamsForNetwork("mainnet").maxBatchSize, 500u);
    EXPECT_EQ(rewardledger::config::getParamsForNetwork("testnet").maxBatchSize, 200u);
    EXPECT_EQ(rewardledger::config::getParamsForNetwork("devnet").maxBatchSize, 50u);
    EXPECT_EQ(rewardledger::config::getParamsForNetwork("devnet").assetDecimals, 8u);
    EXPECT_THROW(rewardledger::config::getParamsForNetwork("unknown"), std::invalid_argument);
}

} // namespace
