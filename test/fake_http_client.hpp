#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "net/http_client.hpp"

// Answers JSON-RPC requests from a per-method table and records every request.
class FakeHttpClient : public HttpClient {
public:
  struct Request {
    std::string url;
    nlohmann::json body;
    std::unordered_map<std::string, std::string> headers;
    int timeout_ms = 0;
  };

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    Request r{url, nlohmann::json::parse(body), headers, timeout_ms};
    requests.push_back(r);
    if (transport_down) return HttpResponse{0, "", "Couldn't connect to server"};
    std::string method = r.body["method"].get<std::string>();
    if (method == "eth_getTransactionCount") {
      auto n = nonces.find(r.body["params"][0].get<std::string>());
      if (n != nonces.end()) {
        nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", r.body["id"]}, {"result", n->second}};
        return HttpResponse{200, reply.dump(), ""};
      }
    }
    auto it = responses.find(method);
    if (it == responses.end()) return HttpResponse{404, "", ""};
    return it->second;
  }

  void Result(const std::string& method, const nlohmann::json& result) {
    nlohmann::json body = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", result}};
    responses[method] = HttpResponse{200, body.dump(), ""};
  }

  void Error(const std::string& method, int code, const std::string& message, long status = 200) {
    nlohmann::json body = {{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", code}, {"message", message}}}};
    responses[method] = HttpResponse{status, body.dump(), ""};
  }

  size_t Count(const std::string& method) const {
    size_t n = 0;
    for (const auto& r : requests) if (r.body["method"] == method) ++n;
    return n;
  }

  std::map<std::string, HttpResponse> responses;
  std::map<std::string, std::string> nonces;  // address -> hex quantity
  std::vector<Request> requests;
  bool transport_down = false;
};
