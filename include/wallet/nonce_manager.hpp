#pragma once
#include <map>
#include <mutex>
#include <string>

class RpcClient;

// Account nonces for transactions and authorizations. The pending transaction
// count of each address is fetched from the node once and cached.
class NonceManager {
public:
  explicit NonceManager(RpcClient& rpc);
  // Next unused transaction nonce of `address`, without consuming it.
  unsigned long long Peek(const std::string& address);
  // Nonce the authority's authorization must carry in a transaction sent by
  // `sender` with nonce `sender_nonce`.
  unsigned long long AuthorizationNonce(const std::string& authority, const std::string& sender,
                                        unsigned long long sender_nonce);
private:
  RpcClient& rpc_;
  std::mutex mutex_;
  std::map<std::string, unsigned long long> next_;
  unsigned long long Slot(const std::string& address);
};

// The sender's nonce is incremented before the authorization list is processed,
// so a self-sponsored authorization must reference sender_nonce + 1.
unsigned long long AuthorizationNonceFor(const std::string& authority, const std::string& sender,
                                         unsigned long long authority_nonce, unsigned long long sender_nonce);
