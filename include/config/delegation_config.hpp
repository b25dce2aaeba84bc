#pragma once
#include <string>
#include <optional>
#include "common/logger.hpp"

struct DelegationConfig {
  std::string rpc_url;
  std::optional<std::string> auth_header;
  int rpc_timeout_ms = 10000;
  // Fixes the chain id instead of asking the node (eth_chainId).
  std::optional<unsigned long long> chain_id;
  std::string authorizer_private_key;
  std::string relayer_private_key;
  std::string delegator_address;
  std::optional<std::string> erc20_address;
  std::optional<std::string> erc20_recipient_1;
  std::optional<std::string> erc20_recipient_2;
  unsigned long long transfer_amount = 1000000000000000000ULL; // 1e18
  unsigned long long max_priority_fee_per_gas = 1000000000ULL; // 1 gwei
  unsigned long long max_fee_per_gas = 10000000000ULL;        // 10 gwei
  unsigned long long gas_limit = 2000000ULL;
  // Allowed-caller key that signs executeBatch requests. Without it the batch is
  // sent through the unsigned entry point, which requires allow_unsigned_batch.
  std::optional<std::string> batch_signer_private_key;
  // Signs setAdmin and updateCallers requests; must be the executor's current admin.
  std::optional<std::string> executor_admin_private_key;
  // Executor request nonce for executeBatch, setAdmin and updateCallers; defaults to the current unix time.
  std::optional<unsigned long long> batch_nonce;
  unsigned long long batch_ttl_seconds = 600;
  bool allow_unsigned_batch = false;
  std::string log_file = "setcode.log";
  LogLevel log_level = LogLevel::INFO;
};

// Loads configuration from ConfigManager. RPC_URL wins over ALCHEMY_KEY, which
// selects the Sepolia Alchemy endpoint. Throws ConfigError for missing keys or
// malformed values. Addresses are validated here; private keys only by Signer.
DelegationConfig LoadDelegationConfig();
