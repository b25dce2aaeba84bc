#pragma once
#include <optional>
#include <string>

namespace JsonRpcUtil {
  struct RpcError {
    long long code = 0;
    std::string message;
    std::string data;  // revert payload or extra detail, raw JSON text when not a string
  };

  struct Reply {
    std::optional<std::string> result;  // string results verbatim, others as JSON text
    std::optional<RpcError> error;
  };

  // Throws SubmissionError if the body is not a JSON-RPC 2.0 reply object.
  Reply ParseReply(const std::string& json_body);
  // "message (code N)", followed by ": data" when the node attached data.
  std::string FormatError(const RpcError& error);
  // Result of a successful reply. Throws SubmissionError carrying FormatError
  // for error replies and for replies without a result.
  std::string ExtractResult(const std::string& json_body);
}
