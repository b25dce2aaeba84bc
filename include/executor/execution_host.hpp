#pragma once
#include <cstddef>
#include <string>
#include "executor/executor_types.hpp"

struct CallResult {
  bool success = false;
  Bytes output;
};

// The environment the executor runs in: clock, call forwarding and the atomic
// commit boundary. On-chain this is the EVM; in tests and dry runs it is LocalLedger.
class ExecutionHost {
public:
  virtual ~ExecutionHost() = default;
  // Current block timestamp, unix seconds.
  virtual unsigned long long Timestamp() const = 0;
  // Runs `call` with `context` (the delegated account) as sender, moving call.value
  // from context to call.target. Failures are reported through CallResult, not thrown.
  virtual CallResult Invoke(const std::string& context, const Call& call) = 0;
  // Opens a checkpoint. Every Snapshot must be closed by exactly one Commit or
  // RevertToSnapshot, innermost first.
  virtual size_t Snapshot() = 0;
  virtual void Commit(size_t snapshot_id) = 0;
  virtual void RevertToSnapshot(size_t snapshot_id) = 0;
};
