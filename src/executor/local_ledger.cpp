#include "executor/local_ledger.hpp"
#include "abi/abi_encoder.hpp"
#include "protocols/erc20.hpp"
#include "common/logger.hpp"
#include <stdexcept>

size_t LocalLedger::Snapshot() {
  snapshots_.push_back(world_);
  return snapshots_.size() - 1;
}

void LocalLedger::Commit(size_t snapshot_id) {
  if (snapshot_id + 1 != snapshots_.size()) throw std::logic_error("ledger: commit of non-innermost snapshot");
  snapshots_.pop_back();
}

void LocalLedger::RevertToSnapshot(size_t snapshot_id) {
  if (snapshot_id + 1 != snapshots_.size()) throw std::logic_error("ledger: revert of non-innermost snapshot");
  world_ = std::move(snapshots_.back());
  snapshots_.pop_back();
}

void LocalLedger::SetBalance(const std::string& account, unsigned long long wei) {
  world_.balances[Hex::NormalizeAddress(account)] = wei;
}

unsigned long long LocalLedger::BalanceOf(const std::string& account) const {
  auto it = world_.balances.find(Hex::NormalizeAddress(account));
  return it == world_.balances.end() ? 0ULL : it->second;
}

void LocalLedger::DeployToken(const std::string& token, bool returns_false_on_failure) {
  world_.tokens[Hex::NormalizeAddress(token)].returns_false_on_failure = returns_false_on_failure;
}

void LocalLedger::Mint(const std::string& token, const std::string& holder, unsigned long long amount) {
  auto it = world_.tokens.find(Hex::NormalizeAddress(token));
  if (it == world_.tokens.end()) throw std::invalid_argument("ledger: unknown token " + token);
  it->second.balances[Hex::NormalizeAddress(holder)] += amount;
}

unsigned long long LocalLedger::TokenBalanceOf(const std::string& token, const std::string& holder) const {
  auto it = world_.tokens.find(Hex::NormalizeAddress(token));
  if (it == world_.tokens.end()) return 0ULL;
  auto b = it->second.balances.find(Hex::NormalizeAddress(holder));
  return b == it->second.balances.end() ? 0ULL : b->second;
}

void LocalLedger::MarkReverting(const std::string& target) {
  reverting_.insert(Hex::NormalizeAddress(target));
}

CallResult LocalLedger::InvokeToken(Token& token, const std::string& sender, const Bytes& data) {
  CallResult r;
  if (auto t = ERC20::DecodeTransfer(data)) {
    auto& from = token.balances[sender];
    if (from < t->amount) {
      if (token.returns_false_on_failure) { r.success = true; r.output = Abi::EncodeBool(false); }
      return r;
    }
    from -= t->amount;
    token.balances[t->to] += t->amount;
    r.success = true;
    r.output = Abi::EncodeBool(true);
    return r;
  }
  if (auto owner = ERC20::DecodeBalanceOf(data)) {
    r.success = true;
    auto b = token.balances.find(*owner);
    r.output = Abi::EncodeUint256(b == token.balances.end() ? 0ULL : b->second);
    return r;
  }
  return r;
}

CallResult LocalLedger::Invoke(const std::string& context, const Call& call) {
  CallResult r;
  std::string sender = Hex::NormalizeAddress(context);
  std::string target = Hex::NormalizeAddress(call.target);
  if (reverting_.count(target)) {
    Logger::Debug("ledger: call to reverting target " + target);
    return r;
  }
  World before = world_;
  if (call.value > 0) {
    auto& from = world_.balances[sender];
    if (from < call.value) {
      world_ = std::move(before);
      return r;
    }
    from -= call.value;
    world_.balances[target] += call.value;
  }
  auto tok = world_.tokens.find(target);
  if (tok != world_.tokens.end()) {
    r = InvokeToken(tok->second, sender, call.data);
    if (!r.success) {
      world_ = std::move(before);
      return r;
    }
  } else {
    r.success = true;
  }
  world_.call_log.push_back(call);
  return r;
}
