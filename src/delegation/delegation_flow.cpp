#include "delegation/delegation_flow.hpp"
#include "config/delegation_config.hpp"
#include "node_connection/rpc_client.hpp"
#include "node_connection/transaction_submitter.hpp"
#include "executor/executor_abi.hpp"
#include "protocols/erc20.hpp"
#include "wallet/signer.hpp"
#include "wallet/nonce_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <utility>

static DelegationRequest BaseRequest(const DelegationConfig& cfg) {
  DelegationRequest r;
  r.max_priority_fee_per_gas = cfg.max_priority_fee_per_gas;
  r.max_fee_per_gas = cfg.max_fee_per_gas;
  r.gas_limit = cfg.gas_limit;
  return r;
}

static unsigned long long RequestNonce(const DelegationConfig& cfg, unsigned long long now) {
  return cfg.batch_nonce.value_or(now);
}

static DelegationRequest ExecutorRequest(const DelegationConfig& cfg, const std::string& authorizer_address, Bytes data) {
  DelegationRequest r = BaseRequest(cfg);
  r.delegate_address = cfg.delegator_address;
  r.to = authorizer_address;
  r.data = std::move(data);
  return r;
}

static std::string RequireAddressArg(const std::string& what, const std::string& value) {
  if (!Hex::IsAddress(value)) throw ValidationError(what + " is not a 20-byte address: " + value);
  return Hex::NormalizeAddress(value);
}

DelegationRequest MakeDelegateRequest(const DelegationConfig& cfg) {
  DelegationRequest r = BaseRequest(cfg);
  r.delegate_address = cfg.delegator_address;
  r.to = Hex::kZeroAddress;
  return r;
}

Batch MakeTransferBatch(const DelegationConfig& cfg) {
  if (!cfg.erc20_address || !cfg.erc20_recipient_1 || !cfg.erc20_recipient_2)
    throw ConfigError("ERC20_ADDRESS, ERC20_RECIPIENT_1_ADDRESS and ERC20_RECIPIENT_2_ADDRESS are required");
  Batch calls;
  calls.push_back(Call{*cfg.erc20_address, 0, ERC20::TransferCalldata(*cfg.erc20_recipient_1, cfg.transfer_amount), true});
  calls.push_back(Call{*cfg.erc20_address, 0, ERC20::TransferCalldata(*cfg.erc20_recipient_2, cfg.transfer_amount), true});
  return calls;
}

DelegationRequest MakeDelegateAndExecuteRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                                const Signer* batch_signer, unsigned long long now) {
  DelegationRequest r = BaseRequest(cfg);
  r.delegate_address = cfg.delegator_address;
  r.to = authorizer_address;
  Batch calls = MakeTransferBatch(cfg);
  if (batch_signer) {
    SignedBatch batch;
    batch.calls = calls;
    batch.nonce = RequestNonce(cfg, now);
    batch.deadline = now + cfg.batch_ttl_seconds;
    batch.signature = batch_signer->SignExecutorDigest(ExecutorABI::BatchHash(batch.calls, batch.nonce, batch.deadline));
    r.data = ExecutorABI::BuildExecuteBatchCalldata(batch);
    Logger::Info("batch signed by " + batch_signer->Address() + " nonce=" + std::to_string(batch.nonce) +
                     " deadline=" + std::to_string(batch.deadline));
  } else if (cfg.allow_unsigned_batch) {
    Logger::Warning("sending UNSIGNED executeBatch; any invoker could run calls on " + authorizer_address);
    r.data = ExecutorABI::BuildExecuteBatchUnsignedCalldata(calls);
  } else {
    throw ConfigError("BATCH_SIGNER_PRIVATE_KEY is required unless ALLOW_UNSIGNED_BATCH=true");
  }
  return r;
}

DelegationRequest MakeInitializeExecutorRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                                const std::string& admin) {
  std::string normalized = RequireAddressArg("admin", admin);
  Logger::Info("initializing executor on " + authorizer_address + " with admin " + normalized);
  return ExecutorRequest(cfg, authorizer_address, ExecutorABI::BuildInitializeCalldata(normalized));
}

DelegationRequest MakeSetAdminRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                      const Signer& admin, const std::string& new_admin, unsigned long long now) {
  AdminChange change;
  change.new_admin = RequireAddressArg("new admin", new_admin);
  change.nonce = RequestNonce(cfg, now);
  change.deadline = now + cfg.batch_ttl_seconds;
  change.signature = admin.SignExecutorDigest(ExecutorABI::AdminChangeHash(change.new_admin, change.nonce, change.deadline));
  Logger::Info("admin change to " + change.new_admin + " signed by " + admin.Address() +
                   " nonce=" + std::to_string(change.nonce));
  return ExecutorRequest(cfg, authorizer_address, ExecutorABI::BuildSetAdminCalldata(change));
}

CallerChanges ParseCallerChanges(const std::vector<std::string>& args) {
  if (args.empty()) throw ValidationError("at least one +address or -address is required");
  CallerChanges out;
  for (const auto& a : args) {
    if (a.empty() || (a[0] != '+' && a[0] != '-'))
      throw ValidationError("caller change must start with + or -: " + a);
    out.callers.push_back(RequireAddressArg("caller", a.substr(1)));
    out.is_adding.push_back(a[0] == '+');
  }
  return out;
}

DelegationRequest MakeUpdateCallersRequest(const DelegationConfig& cfg, const std::string& authorizer_address,
                                           const Signer& admin, const CallerChanges& changes, unsigned long long now) {
  CallerUpdate update;
  update.callers = changes.callers;
  update.is_adding = changes.is_adding;
  update.nonce = RequestNonce(cfg, now);
  update.deadline = now + cfg.batch_ttl_seconds;
  update.signature = admin.SignExecutorDigest(
    ExecutorABI::CallerUpdateHash(update.callers, update.is_adding, update.nonce, update.deadline));
  Logger::Info("caller update of " + std::to_string(update.callers.size()) + " address(es) signed by " +
                   admin.Address() + " nonce=" + std::to_string(update.nonce));
  return ExecutorRequest(cfg, authorizer_address, ExecutorABI::BuildUpdateCallersCalldata(update));
}

DelegationRequest MakeRevokeRequest(const DelegationConfig& cfg) {
  DelegationRequest r = BaseRequest(cfg);
  r.delegate_address = Hex::kZeroAddress;
  r.to = Hex::kZeroAddress;
  return r;
}

DelegationFlow::DelegationFlow(RpcClient& rpc, const Signer& authorizer, const Signer& relayer)
  : rpc_(rpc), authorizer_(authorizer), relayer_(relayer) {}

DelegationPlan DelegationFlow::Sign(const DelegationRequest& request, unsigned long long chain_id,
                                    unsigned long long authorizer_nonce, unsigned long long relayer_nonce) const {
  DelegationPlan plan;
  plan.chain_id = chain_id;
  plan.authorizer = authorizer_.Address();
  plan.relayer = relayer_.Address();
  plan.relayer_nonce = relayer_nonce;
  plan.authorization_nonce = AuthorizationNonceFor(plan.authorizer, plan.relayer, authorizer_nonce, relayer_nonce);
  plan.authorization = authorizer_.SignAuthorization(chain_id, request.delegate_address, plan.authorization_nonce);

  plan.tx.chain_id = chain_id;
  plan.tx.nonce = relayer_nonce;
  plan.tx.max_priority_fee_per_gas = request.max_priority_fee_per_gas;
  plan.tx.max_fee_per_gas = request.max_fee_per_gas;
  plan.tx.gas_limit = request.gas_limit;
  plan.tx.to = Hex::NormalizeAddress(request.to);
  plan.tx.value = request.value;
  plan.tx.data = request.data;
  plan.tx.authorization_list = {plan.authorization};
  plan.raw_tx = relayer_.SignSetCodeTransaction(plan.tx);
  return plan;
}

DelegationPlan DelegationFlow::Prepare(const DelegationRequest& request,
                                       const std::optional<unsigned long long>& fixed_chain_id) {
  unsigned long long chain_id = fixed_chain_id ? *fixed_chain_id : rpc_.EthChainId();
  NonceManager nonces(rpc_);
  unsigned long long relayer_nonce = nonces.Peek(relayer_.Address());
  unsigned long long authorizer_nonce = nonces.AuthorizationNonce(authorizer_.Address(), relayer_.Address(), relayer_nonce);
  Logger::Info("chainId=" + std::to_string(chain_id) +
                   " authorizer=" + authorizer_.Address() + " nonce=" + std::to_string(authorizer_nonce) +
                   " relayer=" + relayer_.Address() + " nonce=" + std::to_string(relayer_nonce));
  return Sign(request, chain_id, authorizer_nonce, relayer_nonce);
}

std::string DelegationFlow::Submit(const DelegationPlan& plan) {
  TransactionSubmitter submitter(rpc_);
  return submitter.Submit(plan.raw_tx);
}
