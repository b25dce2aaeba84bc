#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include "executor/execution_host.hpp"

// In-process ExecutionHost: native balances plus a set of ERC-20 style tokens.
// Used for dry runs of executor flows and by the test suite.
//
// Tokens understand transfer(address,uint256) and balanceOf(address) calldata.
// A failed transfer reverts, or returns an encoded `false` for tokens registered
// with returns_false_on_failure. Calls to an address marked reverting always fail.
// Calls to any other address succeed with empty output after moving value.
class LocalLedger : public ExecutionHost {
public:
  explicit LocalLedger(unsigned long long timestamp = 0) : timestamp_(timestamp) {}

  unsigned long long Timestamp() const override { return timestamp_; }
  CallResult Invoke(const std::string& context, const Call& call) override;
  size_t Snapshot() override;
  void Commit(size_t snapshot_id) override;
  void RevertToSnapshot(size_t snapshot_id) override;

  void SetTimestamp(unsigned long long ts) { timestamp_ = ts; }
  void SetBalance(const std::string& account, unsigned long long wei);
  unsigned long long BalanceOf(const std::string& account) const;
  void DeployToken(const std::string& token, bool returns_false_on_failure = false);
  void Mint(const std::string& token, const std::string& holder, unsigned long long amount);
  unsigned long long TokenBalanceOf(const std::string& token, const std::string& holder) const;
  void MarkReverting(const std::string& target);
  // Calls that completed successfully and were not rolled back, in order.
  const std::vector<Call>& CallLog() const { return world_.call_log; }

private:
  struct Token {
    bool returns_false_on_failure = false;
    std::map<std::string, unsigned long long> balances;
  };
  struct World {
    std::map<std::string, unsigned long long> balances;
    std::map<std::string, Token> tokens;
    std::vector<Call> call_log;
  };

  unsigned long long timestamp_;
  World world_;
  std::set<std::string> reverting_;
  std::vector<World> snapshots_;

  CallResult InvokeToken(Token& token, const std::string& sender, const Bytes& data);
};
