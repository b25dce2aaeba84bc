#include "wallet/nonce_manager.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"

unsigned long long AuthorizationNonceFor(const std::string& authority, const std::string& sender,
                                         unsigned long long authority_nonce, unsigned long long sender_nonce) {
  if (Hex::NormalizeAddress(authority) == Hex::NormalizeAddress(sender)) return sender_nonce + 1;
  return authority_nonce;
}

NonceManager::NonceManager(RpcClient& rpc) : rpc_(rpc) {}

unsigned long long NonceManager::Slot(const std::string& address) {
  std::string key = Hex::NormalizeAddress(address);
  auto it = next_.find(key);
  if (it != next_.end()) return it->second;
  auto n = rpc_.EthGetTransactionCount(key, "pending");
  Logger::Debug("pending nonce for " + key + " = " + std::to_string(n));
  next_.emplace(key, n);
  return n;
}

unsigned long long NonceManager::Peek(const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return Slot(address);
}

unsigned long long NonceManager::AuthorizationNonce(const std::string& authority, const std::string& sender,
                                                    unsigned long long sender_nonce) {
  if (Hex::NormalizeAddress(authority) == Hex::NormalizeAddress(sender))
    return AuthorizationNonceFor(authority, sender, sender_nonce, sender_nonce);
  return AuthorizationNonceFor(authority, sender, Peek(authority), sender_nonce);
}
