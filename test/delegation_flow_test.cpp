#include "delegation/delegation_flow.hpp"
#include "config/delegation_config.hpp"
#include "node_connection/rpc_client.hpp"
#include "executor/executor_abi.hpp"
#include "abi/abi_encoder.hpp"
#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/signing.hpp"
#include "common/errors.hpp"
#include "fake_http_client.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

namespace {
  const std::string kDelegator = "0x" + testutil::Repeat("de", 20);
  const std::string kToken = "0x" + testutil::Repeat("70", 20);

  DelegationConfig SampleConfig() {
    DelegationConfig cfg;
    cfg.rpc_url = "http://localhost:8545";
    cfg.delegator_address = kDelegator;
    cfg.erc20_address = kToken;
    cfg.erc20_recipient_1 = "0x" + testutil::Repeat("01", 20);
    cfg.erc20_recipient_2 = "0x" + testutil::Repeat("02", 20);
    cfg.transfer_amount = 5;
    cfg.gas_limit = 400000;
    return cfg;
  }

  Bytes SelectorOf(const Bytes& data) { return Bytes(data.begin(), data.begin() + 4); }
}

class delegation_flow : public ::testing::Test {
protected:
  FakeHttpClient http;
  RpcClient rpc{http, "http://localhost:8545"};
  Signer authorizer{testutil::KeyHex(1)};
  Signer relayer{testutil::KeyHex(2)};
};

TEST_F(delegation_flow, sponsored_delegation) {
  DelegationFlow flow(rpc, authorizer, relayer);
  auto plan = flow.Sign(MakeDelegateRequest(SampleConfig()), 11155111, 4, 9);

  EXPECT_EQ(plan.authorization_nonce, 4u);
  EXPECT_EQ(plan.relayer_nonce, 9u);
  EXPECT_EQ(plan.authorization.address, kDelegator);
  EXPECT_EQ(Eip7702::RecoverAuthority(plan.authorization), testutil::kAddressOfKey1);

  auto decoded = Eip7702::DecodeSigned(Hex::ToBytes(plan.raw_tx));
  EXPECT_EQ(decoded.tx.nonce, 9u);
  EXPECT_EQ(decoded.tx.to, Hex::kZeroAddress);
  EXPECT_TRUE(decoded.tx.data.empty());
  EXPECT_EQ(decoded.tx.gas_limit, 400000u);
  ASSERT_EQ(decoded.tx.authorization_list.size(), 1u);
  EXPECT_EQ(decoded.tx.authorization_list[0], plan.authorization);
  EXPECT_EQ(Crypto::RecoverAddress(Eip7702::SigningHash(decoded.tx), decoded.signature), testutil::kAddressOfKey2);
}

TEST_F(delegation_flow, self_sponsored_authorization_uses_next_nonce) {
  DelegationFlow flow(rpc, relayer, relayer);
  auto plan = flow.Sign(MakeDelegateRequest(SampleConfig()), 1, 9, 9);
  EXPECT_EQ(plan.tx.nonce, 9u);
  EXPECT_EQ(plan.authorization_nonce, 10u);
  EXPECT_EQ(plan.authorization.nonce, 10u);
}

TEST_F(delegation_flow, prepare_queries_node) {
  http.Result("eth_chainId", "0xaa36a7");
  http.nonces[authorizer.Address()] = "0x2";
  http.nonces[relayer.Address()] = "0x7";
  DelegationFlow flow(rpc, authorizer, relayer);
  auto plan = flow.Prepare(MakeDelegateRequest(SampleConfig()));
  EXPECT_EQ(plan.chain_id, 11155111u);
  EXPECT_EQ(plan.authorization_nonce, 2u);
  EXPECT_EQ(plan.relayer_nonce, 7u);
  EXPECT_EQ(http.Count("eth_chainId"), 1u);

  auto fixed = flow.Prepare(MakeDelegateRequest(SampleConfig()), 31337ULL);
  EXPECT_EQ(fixed.chain_id, 31337u);
  EXPECT_EQ(http.Count("eth_chainId"), 1u);
}

TEST_F(delegation_flow, submit_broadcasts_raw_transaction) {
  DelegationFlow flow(rpc, authorizer, relayer);
  auto plan = flow.Sign(MakeRevokeRequest(SampleConfig()), 1, 0, 0);
  std::string hash = Hex::FromBytes(Eip7702::TransactionHash(Hex::ToBytes(plan.raw_tx)));
  http.Result("eth_sendRawTransaction", hash);
  EXPECT_EQ(flow.Submit(plan), hash);
  ASSERT_EQ(http.Count("eth_sendRawTransaction"), 1u);
  EXPECT_EQ(http.requests.back().body["params"][0], plan.raw_tx);

  http.Error("eth_sendRawTransaction", -32000, "already known");
  EXPECT_THROW(flow.Submit(plan), SubmissionError);
  EXPECT_EQ(http.Count("eth_sendRawTransaction"), 2u);
}

TEST(delegation_requests, revoke_authorizes_zero_address) {
  auto r = MakeRevokeRequest(SampleConfig());
  EXPECT_EQ(r.delegate_address, Hex::kZeroAddress);
  EXPECT_EQ(r.to, Hex::kZeroAddress);
  EXPECT_TRUE(r.data.empty());
}

TEST(delegation_requests, execute_with_batch_signer) {
  auto cfg = SampleConfig();
  cfg.batch_nonce = 77;
  Signer batch_signer(testutil::KeyHex(3));
  auto r = MakeDelegateAndExecuteRequest(cfg, testutil::kAddressOfKey1, &batch_signer, 1000);
  EXPECT_EQ(r.to, testutil::kAddressOfKey1);
  EXPECT_EQ(r.delegate_address, kDelegator);
  EXPECT_EQ(SelectorOf(r.data), Abi::Selector(ExecutorABI::kExecuteBatchSignature));

  SignedBatch expected;
  expected.calls = MakeTransferBatch(cfg);
  expected.nonce = 77;
  expected.deadline = 1000 + cfg.batch_ttl_seconds;
  expected.signature = batch_signer.SignExecutorDigest(ExecutorABI::BatchHash(expected.calls, 77, expected.deadline));
  EXPECT_EQ(r.data, ExecutorABI::BuildExecuteBatchCalldata(expected));
}

TEST(delegation_requests, unsigned_execute_requires_opt_in) {
  auto cfg = SampleConfig();
  EXPECT_THROW(MakeDelegateAndExecuteRequest(cfg, testutil::kAddressOfKey1, nullptr, 1000), ConfigError);
  cfg.allow_unsigned_batch = true;
  auto r = MakeDelegateAndExecuteRequest(cfg, testutil::kAddressOfKey1, nullptr, 1000);
  EXPECT_EQ(r.data, ExecutorABI::BuildExecuteBatchUnsignedCalldata(MakeTransferBatch(cfg)));
}

TEST(delegation_requests, transfer_batch_needs_token_config) {
  auto cfg = SampleConfig();
  cfg.erc20_recipient_2.reset();
  EXPECT_THROW(MakeTransferBatch(cfg), ConfigError);
}

TEST(executor_admin_requests, initialize_targets_authorizer_account) {
  auto cfg = SampleConfig();
  auto r = MakeInitializeExecutorRequest(cfg, testutil::kAddressOfKey1, "0x" + testutil::Repeat("AB", 20));
  EXPECT_EQ(r.to, testutil::kAddressOfKey1);
  EXPECT_EQ(r.delegate_address, kDelegator);
  EXPECT_EQ(r.gas_limit, 400000u);
  EXPECT_EQ(r.data, ExecutorABI::BuildInitializeCalldata("0x" + testutil::Repeat("ab", 20)));
  EXPECT_THROW(MakeInitializeExecutorRequest(cfg, testutil::kAddressOfKey1, "0x1234"), ValidationError);
}

TEST(executor_admin_requests, set_admin_is_signed_by_current_admin) {
  auto cfg = SampleConfig();
  cfg.batch_nonce = 12;
  Signer admin(testutil::KeyHex(4));
  const std::string next_admin = "0x" + testutil::Repeat("cd", 20);
  auto r = MakeSetAdminRequest(cfg, testutil::kAddressOfKey1, admin, next_admin, 2000);
  EXPECT_EQ(SelectorOf(r.data), Abi::Selector(ExecutorABI::kSetAdminSignature));

  AdminChange expected;
  expected.new_admin = next_admin;
  expected.nonce = 12;
  expected.deadline = 2000 + cfg.batch_ttl_seconds;
  expected.signature = admin.SignExecutorDigest(ExecutorABI::AdminChangeHash(next_admin, 12, expected.deadline));
  EXPECT_EQ(r.data, ExecutorABI::BuildSetAdminCalldata(expected));
  EXPECT_EQ(Signing::RecoverPrefixedDigestSigner(ExecutorABI::AdminChangeHash(next_admin, 12, expected.deadline),
                                                 expected.signature),
            admin.Address());
}

TEST(executor_admin_requests, update_callers_defaults_nonce_to_now) {
  auto cfg = SampleConfig();
  Signer admin(testutil::KeyHex(4));
  auto changes = ParseCallerChanges({"+" + std::string(testutil::kAddressOfKey2), "-0x" + testutil::Repeat("EE", 20)});
  ASSERT_EQ(changes.callers.size(), 2u);
  EXPECT_EQ(changes.callers[1], "0x" + testutil::Repeat("ee", 20));
  EXPECT_EQ(changes.is_adding, (std::vector<bool>{true, false}));

  auto r = MakeUpdateCallersRequest(cfg, testutil::kAddressOfKey1, admin, changes, 3000);
  CallerUpdate expected;
  expected.callers = changes.callers;
  expected.is_adding = changes.is_adding;
  expected.nonce = 3000;
  expected.deadline = 3000 + cfg.batch_ttl_seconds;
  expected.signature = admin.SignExecutorDigest(
    ExecutorABI::CallerUpdateHash(expected.callers, expected.is_adding, 3000, expected.deadline));
  EXPECT_EQ(r.data, ExecutorABI::BuildUpdateCallersCalldata(expected));
  EXPECT_EQ(r.to, testutil::kAddressOfKey1);
}

TEST(executor_admin_requests, caller_changes_need_sign_and_address) {
  EXPECT_THROW(ParseCallerChanges({}), ValidationError);
  EXPECT_THROW(ParseCallerChanges({std::string(testutil::kAddressOfKey2)}), ValidationError);
  EXPECT_THROW(ParseCallerChanges({"+0x1234"}), ValidationError);
  EXPECT_THROW(ParseCallerChanges({""}), ValidationError);
}

TEST_F(delegation_flow, admin_request_carries_authorization) {
  Signer admin(testutil::KeyHex(4));
  auto request = MakeInitializeExecutorRequest(SampleConfig(), authorizer.Address(), admin.Address());
  DelegationFlow flow(rpc, authorizer, relayer);
  auto plan = flow.Sign(request, 11155111, 1, 3);
  auto decoded = Eip7702::DecodeSigned(Hex::ToBytes(plan.raw_tx));
  EXPECT_EQ(decoded.tx.to, authorizer.Address());
  EXPECT_EQ(decoded.tx.data, ExecutorABI::BuildInitializeCalldata(admin.Address()));
  ASSERT_EQ(decoded.tx.authorization_list.size(), 1u);
  EXPECT_EQ(decoded.tx.authorization_list[0].address, kDelegator);
  EXPECT_EQ(Eip7702::RecoverAuthority(decoded.tx.authorization_list[0]), authorizer.Address());
}
