#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "config/delegation_config.hpp"
#include "crypto/keccak.hpp"
#include "delegation/delegation_flow.hpp"
#include "eip7702/authorization.hpp"
#include "executor/batch_executor.hpp"
#include "executor/executor_abi.hpp"
#include "executor/local_ledger.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "wallet/signer.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

static void PrintUsage() {
  std::cout << "usage: setcode <command>\n"
            << "  delegate               authorize DELEGATOR_ADDRESS for the authorizer EOA\n"
            << "  delegate-and-execute   authorize and run executeBatch (two ERC-20 transfers) atomically\n"
            << "  revoke                 authorize the zero address, clearing the delegation\n"
            << "  init-executor [admin]  initialize the executor; admin defaults to EXECUTOR_ADMIN_PRIVATE_KEY's address\n"
            << "  set-admin <address>    rotate the executor admin (signed with EXECUTOR_ADMIN_PRIVATE_KEY)\n"
            << "  update-callers <+address|-address>...\n"
            << "                         allow or remove batch callers (signed with EXECUTOR_ADMIN_PRIVATE_KEY)\n"
            << "  simulate               run the configured batch against an in-memory executor\n"
            << "  auth-hash <chainId> <address> <nonce>\n"
            << "                         print the authorization preimage and hash\n"
            << "configuration is read from .env and the environment; DRY_RUN=true signs without sending\n";
}

static unsigned long long NowSeconds() {
  return static_cast<unsigned long long>(
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

static unsigned long long ParseUintArg(const std::string& name, const std::string& v) {
  try {
    if (v.rfind("0x", 0) == 0) return Hex::ToUint(v);
    size_t used = 0;
    unsigned long long out = std::stoull(v, &used);
    if (used != v.size() || v[0] == '-') throw std::invalid_argument(v);
    return out;
  } catch (const std::exception&) {
    throw ValidationError(name + " must be an unsigned integer: " + v);
  }
}

static int RunAuthHash(int argc, char** argv) {
  if (argc != 5) { PrintUsage(); return 2; }
  auto chain_id = ParseUintArg("chainId", argv[2]);
  std::string address = argv[3];
  auto nonce = ParseUintArg("nonce", argv[4]);
  auto preimage = Eip7702::AuthorizationPreimage(chain_id, address, nonce);
  std::cout << "preimage: " << Hex::FromBytes(preimage) << std::endl;
  std::cout << "hash:     " << Hex::FromBytes(Crypto::Keccak256(preimage)) << std::endl;
  return 0;
}

static int RunSimulation(const DelegationConfig& cfg) {
  Signer authorizer(cfg.authorizer_private_key);
  Signer admin(cfg.relayer_private_key);
  if (!cfg.batch_signer_private_key) throw ConfigError("simulate requires BATCH_SIGNER_PRIVATE_KEY");
  Signer caller(*cfg.batch_signer_private_key);

  unsigned long long now = NowSeconds();
  LocalLedger ledger(now);
  Batch calls = MakeTransferBatch(cfg);
  ledger.DeployToken(*cfg.erc20_address);
  ledger.Mint(*cfg.erc20_address, authorizer.Address(), cfg.transfer_amount * 2);

  BatchExecutor executor(ledger, authorizer.Address());
  executor.Initialize(admin.Address());
  CallerUpdate update;
  update.callers = {caller.Address()};
  update.is_adding = {true};
  update.nonce = 0;
  update.deadline = now + cfg.batch_ttl_seconds;
  update.signature = admin.SignExecutorDigest(executor.GetCallerUpdateHash(update.callers, update.is_adding, update.nonce, update.deadline));
  executor.UpdateCallers(update);

  SignedBatch batch;
  batch.calls = calls;
  batch.nonce = cfg.batch_nonce.value_or(1);
  batch.deadline = now + cfg.batch_ttl_seconds;
  batch.signature = caller.SignExecutorDigest(executor.GetBatchHash(batch.calls, batch.nonce, batch.deadline));
  auto results = executor.ExecuteBatch(batch, admin.Address());

  std::cout << "Executor:    " << executor.SelfAddress() << std::endl;
  std::cout << "Admin:       " << executor.Admin() << std::endl;
  std::cout << "Caller:      " << caller.Address() << std::endl;
  for (size_t i = 0; i < results.size(); ++i)
    std::cout << "Call " << i << " -> " << Hex::FromBytes(results[i]) << std::endl;
  std::cout << "Recipient 1 balance: " << ledger.TokenBalanceOf(*cfg.erc20_address, *cfg.erc20_recipient_1) << std::endl;
  std::cout << "Recipient 2 balance: " << ledger.TokenBalanceOf(*cfg.erc20_address, *cfg.erc20_recipient_2) << std::endl;
  return 0;
}

static std::unique_ptr<Signer> RequireAdminSigner(const DelegationConfig& cfg, const std::string& command) {
  if (!cfg.executor_admin_private_key) throw ConfigError(command + " requires EXECUTOR_ADMIN_PRIVATE_KEY");
  return std::unique_ptr<Signer>(new Signer(*cfg.executor_admin_private_key));
}

static DelegationRequest BuildRequest(const std::string& command, const std::vector<std::string>& args,
                                      const DelegationConfig& cfg, const Signer& authorizer) {
  if (command == "delegate") return MakeDelegateRequest(cfg);
  if (command == "revoke") return MakeRevokeRequest(cfg);
  if (command == "delegate-and-execute") {
    std::unique_ptr<Signer> batch_signer;
    if (cfg.batch_signer_private_key) batch_signer.reset(new Signer(*cfg.batch_signer_private_key));
    return MakeDelegateAndExecuteRequest(cfg, authorizer.Address(), batch_signer.get(), NowSeconds());
  }
  if (command == "init-executor") {
    if (args.size() > 1) throw ValidationError("init-executor takes at most one admin address");
    std::string admin = args.empty() ? RequireAdminSigner(cfg, command)->Address() : args[0];
    return MakeInitializeExecutorRequest(cfg, authorizer.Address(), admin);
  }
  if (command == "set-admin") {
    if (args.size() != 1) throw ValidationError("set-admin takes exactly one address");
    return MakeSetAdminRequest(cfg, authorizer.Address(), *RequireAdminSigner(cfg, command), args[0], NowSeconds());
  }
  return MakeUpdateCallersRequest(cfg, authorizer.Address(), *RequireAdminSigner(cfg, command),
                                  ParseCallerChanges(args), NowSeconds());
}

static int RunDelegation(const std::string& command, const std::vector<std::string>& args, const DelegationConfig& cfg) {
  Signer authorizer(cfg.authorizer_private_key);
  Signer relayer(cfg.relayer_private_key);

  auto http = CreateCurlHttpClient();
  RpcClient rpc(*http, cfg.rpc_url, cfg.rpc_timeout_ms, cfg.auth_header);
  DelegationFlow flow(rpc, authorizer, relayer);

  DelegationRequest request = BuildRequest(command, args, cfg, authorizer);

  auto plan = flow.Prepare(request, cfg.chain_id);
  std::cout << "Chain ID:           " << plan.chain_id << std::endl;
  std::cout << "Authorizer address: " << plan.authorizer << std::endl;
  std::cout << "Relayer address:    " << plan.relayer << std::endl;
  std::cout << "Authorizer nonce:   " << plan.authorization_nonce << std::endl;
  std::cout << "Relayer nonce:      " << plan.relayer_nonce << std::endl;
  std::cout << "Authorization:      " << Eip7702::Describe(plan.authorization) << std::endl;
  std::cout << "Transaction to:     " << plan.tx.to << " data: " << Hex::FromBytes(plan.tx.data) << std::endl;

  if (ConfigManager::GetBoolOr("DRY_RUN", false)) {
    std::cout << "Raw tx (not sent):  " << plan.raw_tx << std::endl;
    return 0;
  }
  auto tx_hash = flow.Submit(plan);
  std::cout << "Raw tx sent, hash = " << tx_hash << std::endl;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { PrintUsage(); return 2; }
  const std::string command = argv[1];
  try {
    if (command == "auth-hash") return RunAuthHash(argc, argv);
    static const std::set<std::string> kCommands = {
      "delegate", "delegate-and-execute", "revoke", "init-executor", "set-admin", "update-callers", "simulate"
    };
    if (!kCommands.count(command)) {
      PrintUsage();
      return 2;
    }
    std::vector<std::string> args(argv + 2, argv + argc);

    ConfigManager::Initialize(".env");
    DelegationConfig cfg = LoadDelegationConfig();
    Logger::Initialize(cfg.log_file, cfg.log_level, true);
    Logger::Info("setcode " + command + " starting, endpoint " + cfg.rpc_url);

    int rc = command == "simulate" ? RunSimulation(cfg) : RunDelegation(command, args, cfg);
    Logger::Shutdown();
    return rc;
  } catch (const ExecutorRevert& e) {
    std::cerr << "executor reverted: " << e.what() << std::endl;
  } catch (const SubmissionError& e) {
    std::cerr << "submission failed: " << e.what() << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
  }
  Logger::Shutdown();
  return 1;
}
