#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;     // 0 when no HTTP response was received
  std::string body;
  std::string error;   // transport error text when status == 0
};

// Transport used by RpcClient. One blocking POST per call, bounded by timeout_ms,
// never retried.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct CurlClientOptions {
  long connect_timeout_ms = 5000;
  // JSON-RPC replies larger than this abort the transfer.
  size_t max_response_bytes = 8 * 1024 * 1024;
  std::string user_agent = "setcode/0.1";
};

// libcurl client. TLS peer and host verification are always on.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const CurlClientOptions& options = CurlClientOptions());
