#pragma once
#include <string>

class RpcClient;

// Broadcasts signed raw transactions. Exactly one attempt per call; a rejection
// is rethrown as SubmissionError with the node's message and never retried.
class TransactionSubmitter {
public:
  explicit TransactionSubmitter(RpcClient& rpc) : rpc_(rpc) {}
  // Returns the transaction hash. Logs a warning if the node's hash differs from
  // keccak256 of the submitted bytes.
  std::string Submit(const std::string& raw_tx_hex);
private:
  RpcClient& rpc_;
};
