#include "executor/batch_executor.hpp"
#include "executor/executor_abi.hpp"
#include "crypto/signing.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

static bool ReturnedFalse(const Call& call, const Bytes& output) {
  return call.expects_bool_result && output.size() == 32 &&
         std::all_of(output.begin(), output.end(), [](unsigned char c){ return c == 0; });
}

BatchExecutor::BatchExecutor(ExecutionHost& host, const std::string& self_address, ExecutorOptions options)
  : host_(host), self_(Hex::NormalizeAddress(self_address)), options_(options) {
  if (options_.allow_unsigned_batches)
    Logger::Warning("executor " + self_ + " accepts UNSIGNED batches from any invoker");
}

void BatchExecutor::RunAtomically(const char* operation, const std::function<void()>& body) {
  std::lock_guard<std::mutex> lock(mutex_);
  ExecutorState saved_state = state_;
  size_t saved_events = events_.size();
  size_t snapshot = host_.Snapshot();
  try {
    body();
  } catch (const std::exception& e) {
    state_ = std::move(saved_state);
    events_.erase(events_.begin() + static_cast<std::ptrdiff_t>(saved_events), events_.end());
    host_.RevertToSnapshot(snapshot);
    Logger::Warning(std::string(operation) + " reverted: " + e.what());
    throw;
  }
  host_.Commit(snapshot);
}

void BatchExecutor::RequireInitialized() const {
  if (!state_.initialized) throw ExecutorRevert(ExecutorError::NotInitialized);
}

void BatchExecutor::CheckDeadlineAndNonce(unsigned long long deadline, unsigned long long nonce) const {
  unsigned long long now = host_.Timestamp();
  if (deadline < now)
    throw ExecutorRevert(ExecutorError::DeadlineExpired, "deadline " + std::to_string(deadline) + " < now " + std::to_string(now));
  if (state_.used_nonces.count(nonce))
    throw ExecutorRevert(ExecutorError::NonceAlreadyUsed, "nonce " + std::to_string(nonce));
}

std::string BatchExecutor::RecoverRequestSigner(const Bytes& digest, const Crypto::Signature& sig) const {
  try {
    return Signing::RecoverPrefixedDigestSigner(digest, sig);
  } catch (const RecoveryError& e) {
    throw ExecutorRevert(ExecutorError::InvalidSignature, e.what());
  }
}

void BatchExecutor::Initialize(const std::string& admin) {
  std::string normalized = Hex::NormalizeAddress(admin);
  RunAtomically("initialize", [&]{
    if (state_.initialized) throw ExecutorRevert(ExecutorError::AlreadyInitialized);
    state_.initialized = true;
    state_.admin = normalized;
    events_.push_back(AdminChangedEvent{Hex::kZeroAddress, normalized});
  });
  Logger::Info("executor " + self_ + " initialized, admin=" + normalized);
}

void BatchExecutor::SetAdmin(const AdminChange& change) {
  std::string new_admin = Hex::NormalizeAddress(change.new_admin);
  RunAtomically("setAdmin", [&]{
    RequireInitialized();
    CheckDeadlineAndNonce(change.deadline, change.nonce);
    auto digest = ExecutorABI::AdminChangeHash(new_admin, change.nonce, change.deadline);
    if (RecoverRequestSigner(digest, change.signature) != state_.admin)
      throw ExecutorRevert(ExecutorError::InvalidSignature, "admin change not signed by admin");
    state_.used_nonces.insert(change.nonce);
    events_.push_back(AdminChangedEvent{state_.admin, new_admin});
    state_.admin = new_admin;
  });
  Logger::Info("executor " + self_ + " admin changed to " + new_admin);
}

void BatchExecutor::UpdateCallers(const CallerUpdate& update) {
  std::vector<std::string> callers;
  callers.reserve(update.callers.size());
  for (const auto& c : update.callers) callers.push_back(Hex::NormalizeAddress(c));
  RunAtomically("updateCallers", [&]{
    RequireInitialized();
    if (callers.size() != update.is_adding.size())
      throw ExecutorRevert(ExecutorError::ArrayLengthMismatch,
                           std::to_string(callers.size()) + " callers, " + std::to_string(update.is_adding.size()) + " flags");
    CheckDeadlineAndNonce(update.deadline, update.nonce);
    auto digest = ExecutorABI::CallerUpdateHash(callers, update.is_adding, update.nonce, update.deadline);
    if (RecoverRequestSigner(digest, update.signature) != state_.admin)
      throw ExecutorRevert(ExecutorError::InvalidSignature, "caller update not signed by admin");
    state_.used_nonces.insert(update.nonce);
    for (size_t i = 0; i < callers.size(); ++i) {
      if (update.is_adding[i]) state_.allowed_callers.insert(callers[i]);
      else state_.allowed_callers.erase(callers[i]);
      events_.push_back(CallerUpdatedEvent{callers[i], update.is_adding[i]});
    }
  });
  Logger::Info("executor " + self_ + " updated " + std::to_string(update.callers.size()) + " caller(s)");
}

std::vector<Bytes> BatchExecutor::ForwardCalls(const Batch& calls, unsigned long long& total_value) {
  std::vector<Bytes> results;
  results.reserve(calls.size());
  total_value = 0;
  for (size_t i = 0; i < calls.size(); ++i) {
    auto r = host_.Invoke(self_, calls[i]);
    if (!r.success || ReturnedFalse(calls[i], r.output)) throw ExecutorRevert(i, r.output);
    total_value += calls[i].value;
    results.push_back(std::move(r.output));
  }
  return results;
}

std::vector<Bytes> BatchExecutor::ExecuteBatch(const SignedBatch& batch, const std::string& invoker) {
  std::string caller = Hex::NormalizeAddress(invoker);
  std::vector<Bytes> results;
  std::string signer;
  RunAtomically("executeBatch", [&]{
    RequireInitialized();
    CheckDeadlineAndNonce(batch.deadline, batch.nonce);
    auto digest = ExecutorABI::BatchHash(batch.calls, batch.nonce, batch.deadline);
    signer = RecoverRequestSigner(digest, batch.signature);
    if (!state_.allowed_callers.count(signer))
      throw ExecutorRevert(ExecutorError::NotAllowedCaller, signer);
    state_.used_nonces.insert(batch.nonce);
    unsigned long long total_value = 0;
    results = ForwardCalls(batch.calls, total_value);
    events_.push_back(BatchExecutedEvent{signer, caller, batch.calls, results, total_value});
  });
  Logger::Info("executor " + self_ + " executed " + std::to_string(batch.calls.size()) +
                   " call(s), nonce=" + std::to_string(batch.nonce) + " signer=" + signer);
  return results;
}

std::vector<Bytes> BatchExecutor::ExecuteBatchUnsigned(const Batch& calls, const std::string& invoker) {
  if (!options_.allow_unsigned_batches) throw ExecutorRevert(ExecutorError::UnsignedBatchesDisabled);
  std::string caller = Hex::NormalizeAddress(invoker);
  std::vector<Bytes> results;
  RunAtomically("executeBatchUnsigned", [&]{
    unsigned long long total_value = 0;
    results = ForwardCalls(calls, total_value);
    events_.push_back(BatchExecutedEvent{Hex::kZeroAddress, caller, calls, results, total_value});
  });
  Logger::Warning("executor " + self_ + " executed UNSIGNED batch of " + std::to_string(calls.size()) + " call(s) for " + caller);
  return results;
}

Bytes BatchExecutor::GetBatchHash(const Batch& calls, unsigned long long nonce, unsigned long long deadline) const {
  return ExecutorABI::BatchHash(calls, nonce, deadline);
}

Bytes BatchExecutor::GetAdminChangeHash(const std::string& new_admin, unsigned long long nonce, unsigned long long deadline) const {
  return ExecutorABI::AdminChangeHash(new_admin, nonce, deadline);
}

Bytes BatchExecutor::GetCallerUpdateHash(const std::vector<std::string>& callers, const std::vector<bool>& is_adding,
                                         unsigned long long nonce, unsigned long long deadline) const {
  return ExecutorABI::CallerUpdateHash(callers, is_adding, nonce, deadline);
}

bool BatchExecutor::IsInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.initialized;
}

std::string BatchExecutor::Admin() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.admin;
}

bool BatchExecutor::IsAllowedCaller(const std::string& address) const {
  std::string normalized = Hex::NormalizeAddress(address);
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.allowed_callers.count(normalized) > 0;
}

bool BatchExecutor::IsNonceUsed(unsigned long long nonce) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.used_nonces.count(nonce) > 0;
}

ExecutorState BatchExecutor::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::vector<ExecutorEvent> BatchExecutor::Events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}
