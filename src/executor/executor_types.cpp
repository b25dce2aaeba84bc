#include "executor/executor_types.hpp"

const char* ExecutorErrorName(ExecutorError code) {
  switch (code) {
    case ExecutorError::AlreadyInitialized: return "AlreadyInitialized";
    case ExecutorError::NotInitialized: return "NotInitialized";
    case ExecutorError::DeadlineExpired: return "DeadlineExpired";
    case ExecutorError::NonceAlreadyUsed: return "NonceAlreadyUsed";
    case ExecutorError::InvalidSignature: return "InvalidSignature";
    case ExecutorError::NotAllowedCaller: return "NotAllowedCaller";
    case ExecutorError::CallFailed: return "CallFailed";
    case ExecutorError::ArrayLengthMismatch: return "ArrayLengthMismatch";
    case ExecutorError::UnsignedBatchesDisabled: return "UnsignedBatchesDisabled";
  }
  return "Unknown";
}

static std::string RevertMessage(ExecutorError code, const std::string& detail) {
  std::string msg = ExecutorErrorName(code);
  if (!detail.empty()) msg += ": " + detail;
  return msg;
}

ExecutorRevert::ExecutorRevert(ExecutorError code, const std::string& detail)
  : std::runtime_error(RevertMessage(code, detail)), code_(code) {}

ExecutorRevert::ExecutorRevert(size_t call_index, const Bytes& return_data)
  : std::runtime_error(RevertMessage(ExecutorError::CallFailed, "call " + std::to_string(call_index) + " returned " + Hex::FromBytes(return_data))),
    code_(ExecutorError::CallFailed), call_index_(call_index), return_data_(return_data) {}
