#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

class HttpClient;

// The handful of JSON-RPC calls the delegation flow needs. Every call is one
// blocking request with the client's timeout; failures raise SubmissionError.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            int timeout_ms = 10000,
            const std::optional<std::string>& auth_header = std::nullopt);
  // Sends raw JSON-RPC payload and returns the raw response body.
  std::string Send(const std::string& json_payload);

  unsigned long long EthChainId();
  unsigned long long EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending");
  // Returns the transaction hash reported by the node.
  std::string EthSendRawTransaction(const std::string& raw_tx_hex);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
  unsigned long long next_id_ = 1;
  std::unordered_map<std::string, std::string> default_headers_;
  std::string BuildPayload(const std::string& method, const std::vector<std::string>& params);
  std::string Call(const std::string& method, const std::vector<std::string>& params);
};
