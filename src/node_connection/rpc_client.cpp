#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include "utils/json_rpc.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <string>
#include <vector>
#include <unordered_map>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare value is sent as Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     int timeout_ms,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url), timeout_ms_(timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::BuildPayload(const std::string& method, const std::vector<std::string>& params) {
  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["method"] = method;
  req["params"] = params;
  req["id"] = next_id_++;
  return req.dump();
}

std::string RpcClient::Send(const std::string& json_payload) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms_);
  if (resp.status == 0) {
    throw SubmissionError(resp.error.empty() ? "no response from " + endpoint_ : resp.error);
  }
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status));
    // nodes often put the JSON-RPC error in non-2xx bodies; surface it when present
    std::string detail = resp.body;
    try {
      auto reply = JsonRpcUtil::ParseReply(resp.body);
      if (reply.error) detail = JsonRpcUtil::FormatError(*reply.error);
    } catch (const SubmissionError&) {
      // not JSON-RPC; the raw body is the best detail available
    }
    throw SubmissionError("HTTP " + std::to_string(resp.status) + (detail.empty() ? "" : ": " + detail));
  }
  return resp.body;
}

std::string RpcClient::Call(const std::string& method, const std::vector<std::string>& params) {
  auto resp = Send(BuildPayload(method, params));
  try {
    return JsonRpcUtil::ExtractResult(resp);
  } catch (const SubmissionError& e) {
    Logger::Error(method + " failed: " + e.what());
    throw;
  }
}

unsigned long long RpcClient::EthChainId() {
  return Hex::ToUint(Call("eth_chainId", {}));
}

unsigned long long RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag) {
  return Hex::ToUint(Call("eth_getTransactionCount", {address, block_tag}));
}

std::string RpcClient::EthSendRawTransaction(const std::string& raw_tx_hex) {
  return Call("eth_sendRawTransaction", {raw_tx_hex});
}
