#pragma once
#include <optional>
#include <string>
#include <vector>
#include "eip7702/set_code_transaction.hpp"
#include "executor/executor_types.hpp"

class RpcClient;
class Signer;
struct DelegationConfig;

// What the relayer's set-code transaction should do besides installing the delegation.
struct DelegationRequest {
  std::string delegate_address;  // zero address revokes
  std::string to;
  unsigned long long value = 0;
  Bytes data;
  unsigned long long max_priority_fee_per_gas = 0;
  unsigned long long max_fee_per_gas = 0;
  unsigned long long gas_limit = 0;
};

// Everything decided before broadcast, kept for reporting.
struct DelegationPlan {
  unsigned long long chain_id = 0;
  std::string authorizer;
  std::string relayer;
  unsigned long long authorization_nonce = 0;
  unsigned long long relayer_nonce = 0;
  Eip7702::AuthorizationEntry authorization;
  Eip7702::SetCodeTransaction tx;
  std::string raw_tx;
};

// Delegation only: transaction to the zero address with empty data.
DelegationRequest MakeDelegateRequest(const DelegationConfig& cfg);
// Delegation plus executeBatch(calls) on the authorizer's own account, where the
// calls are two ERC-20 transfers of cfg.transfer_amount. With a batch signer the
// signed entry point is used (nonce cfg.batch_nonce or `now`, deadline now + ttl);
// without one the unsigned entry point is used if cfg.allow_unsigned_batch is set,
// otherwise ConfigError is thrown.
DelegationRequest MakeDelegateAndExecuteRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                                const Signer* batch_signer, unsigned long long now);
// Clears the delegation by authorizing the zero address.
DelegationRequest MakeRevokeRequest(const DelegationConfig& cfg);
Batch MakeTransferBatch(const DelegationConfig& cfg);

// Executor administration on the authorizer's account. Each request carries a
// fresh authorization for cfg.delegator_address, since a set-code transaction
// needs a non-empty authorization list. Signed requests use the executor nonce
// cfg.batch_nonce (or `now`) and the deadline now + cfg.batch_ttl_seconds.
DelegationRequest MakeInitializeExecutorRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                                const std::string& admin);
// setAdmin(newAdmin) signed by the current admin.
DelegationRequest MakeSetAdminRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                      const Signer& admin, const std::string& new_admin, unsigned long long now);

struct CallerChanges {
  std::vector<std::string> callers;
  std::vector<bool> is_adding;
};
// "+0x..." allows a caller, "-0x..." removes one. Throws ValidationError on a
// missing sign, a malformed address or an empty list.
CallerChanges ParseCallerChanges(const std::vector<std::string>& args);
// updateCallers(callers, isAdding) signed by the current admin.
DelegationRequest MakeUpdateCallersRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                           const Signer& admin, const CallerChanges& changes, unsigned long long now);

// Builds, signs and submits one set-code transaction in which `relayer` pays for
// an authorization signed by `authorizer`.
class DelegationFlow {
public:
  DelegationFlow(RpcClient& rpc, const Signer& authorizer, const Signer& relayer);
  // Fetches the chain id (unless fixed) and both pending nonces, then signs.
  DelegationPlan Prepare(const DelegationRequest& request,
                         const std::optional<unsigned long long>& fixed_chain_id = std::nullopt);
  // Single broadcast attempt; returns the transaction hash.
  std::string Submit(const DelegationPlan& plan);
  // Pure part of Prepare, usable offline.
  DelegationPlan Sign(const DelegationRequest& request, unsigned long long chain_id,
                      unsigned long long authorizer_nonce, unsigned long long relayer_nonce) const;
private:
  RpcClient& rpc_;
  const Signer& authorizer_;
  const Signer& relayer_;
};
