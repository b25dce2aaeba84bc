#include "config/delegation_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

static std::string RequireAddress(const std::string& key) {
  auto v = ConfigManager::GetOrThrow(key);
  if (!Hex::IsAddress(v)) throw ConfigError(key + " is not a 20-byte address: " + v);
  return Hex::NormalizeAddress(v);
}

static std::optional<std::string> OptionalAddress(const std::string& key) {
  auto v = ConfigManager::Get(key);
  if (!v) return std::nullopt;
  if (!Hex::IsAddress(*v)) throw ConfigError(key + " is not a 20-byte address: " + *v);
  return Hex::NormalizeAddress(*v);
}

DelegationConfig LoadDelegationConfig() {
  DelegationConfig cfg;
  if (auto url = ConfigManager::Get("RPC_URL")) {
    cfg.rpc_url = *url;
  } else if (auto key = ConfigManager::Get("ALCHEMY_KEY")) {
    cfg.rpc_url = "https://eth-sepolia.g.alchemy.com/v2/" + *key;
  } else {
    throw ConfigError("Missing required config: RPC_URL or ALCHEMY_KEY");
  }
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) cfg.auth_header = *a;
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc_timeout_ms);
  if (cfg.rpc_timeout_ms <= 0) throw ConfigError("RPC_TIMEOUT_MS must be positive");
  cfg.chain_id = ConfigManager::GetUint64("CHAIN_ID");

  cfg.authorizer_private_key = ConfigManager::GetOrThrow("AUTHORIZER_PRIVATE_KEY");
  cfg.relayer_private_key = ConfigManager::GetOrThrow("RELAYER_PRIVATE_KEY");
  cfg.delegator_address = RequireAddress("DELEGATOR_ADDRESS");
  cfg.erc20_address = OptionalAddress("ERC20_ADDRESS");
  cfg.erc20_recipient_1 = OptionalAddress("ERC20_RECIPIENT_1_ADDRESS");
  cfg.erc20_recipient_2 = OptionalAddress("ERC20_RECIPIENT_2_ADDRESS");

  cfg.transfer_amount = ConfigManager::GetUint64Or("TRANSFER_AMOUNT", cfg.transfer_amount);
  cfg.max_priority_fee_per_gas = ConfigManager::GetUint64Or("MAX_PRIORITY_FEE_PER_GAS", cfg.max_priority_fee_per_gas);
  cfg.max_fee_per_gas = ConfigManager::GetUint64Or("MAX_FEE_PER_GAS", cfg.max_fee_per_gas);
  cfg.gas_limit = ConfigManager::GetUint64Or("GAS_LIMIT", cfg.gas_limit);
  if (cfg.max_priority_fee_per_gas > cfg.max_fee_per_gas)
    throw ConfigError("MAX_PRIORITY_FEE_PER_GAS exceeds MAX_FEE_PER_GAS");

  if (auto k = ConfigManager::Get("BATCH_SIGNER_PRIVATE_KEY")) cfg.batch_signer_private_key = *k;
  if (auto k = ConfigManager::Get("EXECUTOR_ADMIN_PRIVATE_KEY")) cfg.executor_admin_private_key = *k;
  cfg.batch_nonce = ConfigManager::GetUint64("BATCH_NONCE");
  cfg.batch_ttl_seconds = ConfigManager::GetUint64Or("BATCH_TTL_SECONDS", cfg.batch_ttl_seconds);
  cfg.allow_unsigned_batch = ConfigManager::GetBoolOr("ALLOW_UNSIGNED_BATCH", cfg.allow_unsigned_batch);

  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  if (ConfigManager::Has("LOG_LEVEL")) cfg.log_level = ParseLogLevel(ConfigManager::GetOrThrow("LOG_LEVEL"));
  return cfg;
}
