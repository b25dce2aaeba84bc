#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "executor/execution_host.hpp"
#include "executor/executor_types.hpp"

struct ExecutorOptions {
  // Enables ExecuteBatchUnsigned, which forwards calls for ANY invoker without a
  // signature check. Only for demonstrating the risk of ungated delegated code;
  // never enable it for an account holding value.
  bool allow_unsigned_batches = false;
};

// Signature-gated batch executor run as the delegated code of an EOA.
//
// Every public mutating operation is one atomic invocation: on any failure the
// executor's state, its event log and the host's side effects are restored to
// what they were before the call, and the failure is rethrown as ExecutorRevert.
// Malformed address arguments are rejected with EncodingError before the
// invocation starts.
// Check order for signed operations is: initialized, deadline, nonce, signer.
// The nonce is marked only after all checks pass, so a rejected request leaves
// it unused.
//
// Invocations are serialized by an internal mutex. Forwarded calls must not
// re-enter the same executor.
class BatchExecutor {
public:
  BatchExecutor(ExecutionHost& host, const std::string& self_address, ExecutorOptions options = ExecutorOptions());

  void Initialize(const std::string& admin);
  // Signer of AdminChangeHash (signed-message scheme) must be the current admin.
  void SetAdmin(const AdminChange& change);
  // Signer of CallerUpdateHash must be the current admin.
  void UpdateCallers(const CallerUpdate& update);
  // Signer of BatchHash must be an allowed caller. Returns each call's return data.
  std::vector<Bytes> ExecuteBatch(const SignedBatch& batch, const std::string& invoker);
  // Throws UnsignedBatchesDisabled unless options.allow_unsigned_batches is set.
  std::vector<Bytes> ExecuteBatchUnsigned(const Batch& calls, const std::string& invoker);

  Bytes GetBatchHash(const Batch& calls, unsigned long long nonce, unsigned long long deadline) const;
  Bytes GetAdminChangeHash(const std::string& new_admin, unsigned long long nonce, unsigned long long deadline) const;
  Bytes GetCallerUpdateHash(const std::vector<std::string>& callers, const std::vector<bool>& is_adding,
                            unsigned long long nonce, unsigned long long deadline) const;

  bool IsInitialized() const;
  std::string Admin() const;
  bool IsAllowedCaller(const std::string& address) const;
  bool IsNonceUsed(unsigned long long nonce) const;
  ExecutorState State() const;
  std::vector<ExecutorEvent> Events() const;
  const std::string& SelfAddress() const { return self_; }

private:
  ExecutionHost& host_;
  std::string self_;
  ExecutorOptions options_;
  mutable std::mutex mutex_;
  ExecutorState state_;
  std::vector<ExecutorEvent> events_;

  void RunAtomically(const char* operation, const std::function<void()>& body);
  void RequireInitialized() const;
  void CheckDeadlineAndNonce(unsigned long long deadline, unsigned long long nonce) const;
  std::string RecoverRequestSigner(const Bytes& digest, const Crypto::Signature& sig) const;
  std::vector<Bytes> ForwardCalls(const Batch& calls, unsigned long long& total_value);
};
