#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "config/delegation_config.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace {
  const char* kDelegationKeys[] = {
    "RPC_URL", "ALCHEMY_KEY", "RPC_AUTH_HEADER", "RPC_TIMEOUT_MS", "CHAIN_ID",
    "AUTHORIZER_PRIVATE_KEY", "RELAYER_PRIVATE_KEY", "DELEGATOR_ADDRESS",
    "ERC20_ADDRESS", "ERC20_RECIPIENT_1_ADDRESS", "ERC20_RECIPIENT_2_ADDRESS",
    "TRANSFER_AMOUNT", "MAX_PRIORITY_FEE_PER_GAS", "MAX_FEE_PER_GAS", "GAS_LIMIT",
    "BATCH_SIGNER_PRIVATE_KEY", "EXECUTOR_ADMIN_PRIVATE_KEY", "BATCH_NONCE", "BATCH_TTL_SECONDS", "ALLOW_UNSIGNED_BATCH",
    "LOG_FILE", "LOG_LEVEL"
  };
  const std::string kDelegator = "0x" + testutil::Repeat("ab", 20);
}

class config : public ::testing::Test {
protected:
  std::string path_;

  void SetUp() override {
    for (const char* k : kDelegationKeys) unsetenv(k);
    path_ = ::testing::TempDir() + "setcode_config_test.env";
  }

  void TearDown() override {
    std::remove(path_.c_str());
    unsetenv("SETCODE_TEST_OVERRIDE");
  }

  void WriteEnv(const std::string& content) {
    std::ofstream out(path_, std::ios::trunc);
    out << content;
    out.close();
    ConfigManager::Initialize(path_);
  }
};

TEST_F(config, parses_dotenv_syntax) {
  WriteEnv("# comment\n"
           "PLAIN=value\n"
           "  SPACED  =  padded  \n"
           "export EXPORTED=yes\n"
           "QUOTED=\"with spaces\"\n"
           "SINGLE='single'\n"
           "EMPTY=\n"
           "not a pair\n");
  EXPECT_EQ(ConfigManager::Get("PLAIN").value(), "value");
  EXPECT_EQ(ConfigManager::Get("SPACED").value(), "padded");
  EXPECT_EQ(ConfigManager::Get("EXPORTED").value(), "yes");
  EXPECT_EQ(ConfigManager::Get("QUOTED").value(), "with spaces");
  EXPECT_EQ(ConfigManager::Get("SINGLE").value(), "single");
  EXPECT_FALSE(ConfigManager::Get("EMPTY").has_value());
  EXPECT_FALSE(ConfigManager::Get("MISSING").has_value());
  EXPECT_THROW(ConfigManager::GetOrThrow("MISSING"), ConfigError);
}

TEST_F(config, environment_overrides_file) {
  WriteEnv("SETCODE_TEST_OVERRIDE=file\n");
  EXPECT_EQ(ConfigManager::Get("SETCODE_TEST_OVERRIDE").value(), "file");
  setenv("SETCODE_TEST_OVERRIDE", "env", 1);
  EXPECT_EQ(ConfigManager::Get("SETCODE_TEST_OVERRIDE").value(), "env");
}

TEST_F(config, typed_getters) {
  WriteEnv("INT=42\nBAD_INT=4x\nBIG=18446744073709551615\nHUGE=18446744073709551616\nNEG=-1\n"
           "T=TRUE\nF=no\nB=maybe\n");
  EXPECT_EQ(ConfigManager::GetIntOr("INT", 0), 42);
  EXPECT_EQ(ConfigManager::GetIntOr("ABSENT", 7), 7);
  EXPECT_THROW(ConfigManager::GetIntOr("BAD_INT", 0), ConfigError);
  EXPECT_EQ(ConfigManager::GetUint64Or("BIG", 0), 18446744073709551615ULL);
  EXPECT_THROW(ConfigManager::GetUint64Or("HUGE", 0), ConfigError);
  EXPECT_THROW(ConfigManager::GetUint64Or("NEG", 0), ConfigError);
  EXPECT_TRUE(ConfigManager::GetBoolOr("T", false));
  EXPECT_FALSE(ConfigManager::GetBoolOr("F", true));
  EXPECT_THROW(ConfigManager::GetBoolOr("B", false), ConfigError);
  ConfigManager::Set("INT", "43");
  EXPECT_EQ(ConfigManager::GetIntOr("INT", 0), 43);
}

TEST_F(config, loads_delegation_config) {
  WriteEnv("ALCHEMY_KEY=abc123\n"
           "AUTHORIZER_PRIVATE_KEY=" + testutil::KeyHex(1) + "\n"
           "RELAYER_PRIVATE_KEY=" + testutil::KeyHex(2) + "\n"
           "DELEGATOR_ADDRESS=0x" + testutil::Repeat("AB", 20) + "\n"
           "ERC20_ADDRESS=0x" + testutil::Repeat("70", 20) + "\n"
           "GAS_LIMIT=500000\n"
           "EXECUTOR_ADMIN_PRIVATE_KEY=" + testutil::KeyHex(3) + "\n"
           "ALLOW_UNSIGNED_BATCH=true\n"
           "LOG_LEVEL=debug\n");
  auto cfg = LoadDelegationConfig();
  EXPECT_EQ(cfg.rpc_url, "https://eth-sepolia.g.alchemy.com/v2/abc123");
  EXPECT_EQ(cfg.delegator_address, kDelegator);
  ASSERT_TRUE(cfg.erc20_address.has_value());
  EXPECT_FALSE(cfg.erc20_recipient_1.has_value());
  EXPECT_EQ(cfg.gas_limit, 500000u);
  EXPECT_EQ(cfg.max_fee_per_gas, 10000000000ULL);
  EXPECT_FALSE(cfg.chain_id.has_value());
  EXPECT_FALSE(cfg.batch_nonce.has_value());
  EXPECT_EQ(cfg.executor_admin_private_key.value_or(""), testutil::KeyHex(3));
  EXPECT_FALSE(cfg.batch_signer_private_key.has_value());
  EXPECT_EQ(cfg.batch_ttl_seconds, 600u);
  EXPECT_TRUE(cfg.allow_unsigned_batch);
  EXPECT_EQ(cfg.log_level, LogLevel::DEBUG);
}

TEST_F(config, rpc_url_wins_over_alchemy_key) {
  WriteEnv("RPC_URL=http://localhost:8545\nALCHEMY_KEY=abc\nCHAIN_ID=31337\n"
           "AUTHORIZER_PRIVATE_KEY=k1\nRELAYER_PRIVATE_KEY=k2\nDELEGATOR_ADDRESS=" + kDelegator + "\n");
  auto cfg = LoadDelegationConfig();
  EXPECT_EQ(cfg.rpc_url, "http://localhost:8545");
  EXPECT_EQ(cfg.chain_id.value(), 31337u);
}

TEST_F(config, rejects_missing_and_malformed_values) {
  WriteEnv("AUTHORIZER_PRIVATE_KEY=k1\nRELAYER_PRIVATE_KEY=k2\nDELEGATOR_ADDRESS=" + kDelegator + "\n");
  EXPECT_THROW(LoadDelegationConfig(), ConfigError);

  WriteEnv("RPC_URL=http://x\nRELAYER_PRIVATE_KEY=k2\nDELEGATOR_ADDRESS=" + kDelegator + "\n");
  EXPECT_THROW(LoadDelegationConfig(), ConfigError);

  WriteEnv("RPC_URL=http://x\nAUTHORIZER_PRIVATE_KEY=k1\nRELAYER_PRIVATE_KEY=k2\nDELEGATOR_ADDRESS=0x1234\n");
  EXPECT_THROW(LoadDelegationConfig(), ConfigError);

  WriteEnv("RPC_URL=http://x\nAUTHORIZER_PRIVATE_KEY=k1\nRELAYER_PRIVATE_KEY=k2\nDELEGATOR_ADDRESS=" + kDelegator +
           "\nMAX_PRIORITY_FEE_PER_GAS=10\nMAX_FEE_PER_GAS=5\n");
  EXPECT_THROW(LoadDelegationConfig(), ConfigError);

  WriteEnv("RPC_URL=http://x\nAUTHORIZER_PRIVATE_KEY=k1\nRELAYER_PRIVATE_KEY=k2\nDELEGATOR_ADDRESS=" + kDelegator +
           "\nLOG_LEVEL=loud\n");
  EXPECT_THROW(LoadDelegationConfig(), ConfigError);
}

TEST(logger, parses_levels) {
  EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::INFO);
  EXPECT_EQ(ParseLogLevel("warn"), LogLevel::WARNING);
  EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::WARNING);
  EXPECT_EQ(ParseLogLevel("critical"), LogLevel::CRITICAL);
  EXPECT_THROW(ParseLogLevel("verbose"), ConfigError);
}

TEST(logger, writes_file_sink) {
  std::string path = ::testing::TempDir() + "setcode_logger_test.log";
  std::remove(path.c_str());
  Logger::Initialize(path, LogLevel::INFO);
  EXPECT_TRUE(Logger::IsEnabled(LogLevel::WARNING));
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::DEBUG));
  Logger::Debug("hidden line");
  Logger::Info("visible line", __FILE__, __LINE__);
  Logger::Shutdown();
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::CRITICAL));

  std::ifstream in(path);
  std::string all((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_NE(all.find("[INFO]"), std::string::npos);
  EXPECT_NE(all.find("visible line"), std::string::npos);
  EXPECT_NE(all.find("config_test.cpp"), std::string::npos);
  EXPECT_EQ(all.find("hidden line"), std::string::npos);
  std::remove(path.c_str());
}
