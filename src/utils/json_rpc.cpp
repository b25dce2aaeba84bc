#include "utils/json_rpc.hpp"
#include "common/errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace JsonRpcUtil {
  static RpcError ToRpcError(const json& err) {
    RpcError e;
    if (!err.is_object()) {
      e.message = err.dump();
      return e;
    }
    if (err.contains("code") && err["code"].is_number_integer()) e.code = err["code"].get<long long>();
    if (err.contains("message") && err["message"].is_string()) e.message = err["message"].get<std::string>();
    else e.message = err.dump();
    if (err.contains("data") && !err["data"].is_null())
      e.data = err["data"].is_string() ? err["data"].get<std::string>() : err["data"].dump();
    return e;
  }

  Reply ParseReply(const std::string& json_body) {
    json j;
    try {
      j = json::parse(json_body);
    } catch (const json::parse_error& e) {
      throw SubmissionError(std::string("malformed JSON-RPC response: ") + e.what());
    }
    if (!j.is_object()) throw SubmissionError("JSON-RPC response is not an object: " + json_body);
    Reply reply;
    if (j.contains("error") && !j["error"].is_null()) reply.error = ToRpcError(j["error"]);
    if (j.contains("result")) {
      const auto& r = j["result"];
      reply.result = r.is_string() ? r.get<std::string>() : r.dump();
    }
    return reply;
  }

  std::string FormatError(const RpcError& error) {
    std::string out = error.message + " (code " + std::to_string(error.code) + ")";
    if (!error.data.empty()) out += ": " + error.data;
    return out;
  }

  std::string ExtractResult(const std::string& json_body) {
    auto reply = ParseReply(json_body);
    if (reply.error) throw SubmissionError(FormatError(*reply.error));
    if (!reply.result) throw SubmissionError("JSON-RPC response has neither result nor error");
    return *reply.result;
  }
}
