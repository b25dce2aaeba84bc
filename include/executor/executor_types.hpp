#pragma once
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "crypto/secp256k1.hpp"

// One forwarded sub-call.
struct Call {
  std::string target;
  unsigned long long value = 0; // wei
  Bytes data;
  // Set for calls whose return value is an ABI bool success flag (ERC-20 transfer,
  // approve, transferFrom). A single all-zero word from such a call fails the batch.
  // Not part of the signed call encoding.
  bool expects_bool_result = false;
};

// Ordered; index order is execution order.
using Batch = std::vector<Call>;

struct SignedBatch {
  Batch calls;
  unsigned long long nonce = 0;
  unsigned long long deadline = 0; // unix seconds, inclusive
  Crypto::Signature signature;
};

struct AdminChange {
  std::string new_admin;
  unsigned long long nonce = 0;
  unsigned long long deadline = 0;
  Crypto::Signature signature;
};

struct CallerUpdate {
  std::vector<std::string> callers;
  std::vector<bool> is_adding;
  unsigned long long nonce = 0;
  unsigned long long deadline = 0;
  Crypto::Signature signature;
};

// Persistent executor storage. used_nonces only ever grows.
struct ExecutorState {
  bool initialized = false;
  std::string admin;
  std::set<std::string> allowed_callers;
  std::set<unsigned long long> used_nonces;
};

struct AdminChangedEvent { std::string previous_admin; std::string new_admin; };
struct CallerUpdatedEvent { std::string caller; bool allowed = false; };
struct BatchExecutedEvent {
  std::string signer;   // zero address for unsigned batches
  std::string invoker;
  Batch calls;
  std::vector<Bytes> results;
  unsigned long long total_value = 0;
};
using ExecutorEvent = std::variant<AdminChangedEvent, CallerUpdatedEvent, BatchExecutedEvent>;

enum class ExecutorError {
  AlreadyInitialized,
  NotInitialized,
  DeadlineExpired,
  NonceAlreadyUsed,
  InvalidSignature,
  NotAllowedCaller,
  CallFailed,
  ArrayLengthMismatch,
  UnsignedBatchesDisabled
};

const char* ExecutorErrorName(ExecutorError code);

// Raised by every executor operation that aborts. By the time it propagates the
// invocation's effects have been rolled back.
class ExecutorRevert : public std::runtime_error {
public:
  explicit ExecutorRevert(ExecutorError code, const std::string& detail = std::string());
  // CallFailed only: index of the failing call and the data it returned.
  ExecutorRevert(size_t call_index, const Bytes& return_data);
  ExecutorError Code() const { return code_; }
  size_t CallIndex() const { return call_index_; }
  const Bytes& ReturnData() const { return return_data_; }
private:
  ExecutorError code_;
  size_t call_index_ = 0;
  Bytes return_data_;
};
