#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
  struct EasyDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
  struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };
  using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
  using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

  struct Sink {
    std::string data;
    size_t limit = 0;
    bool overflow = false;
  };

  // Returning less than size * nmemb makes curl fail the transfer with CURLE_WRITE_ERROR.
  size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<Sink*>(userdata);
    size_t n = size * nmemb;
    if (sink->data.size() + n > sink->limit) {
      sink->overflow = true;
      return 0;
    }
    sink->data.append(ptr, n);
    return n;
  }

  std::once_flag g_curl_init;

  // scheme://host[:port] only; RPC URLs often carry an API key in the path.
  std::string Origin(const std::string& url) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos) return url;
    auto path = url.find('/', scheme + 3);
    return path == std::string::npos ? url : url.substr(0, path);
  }
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const CurlClientOptions& options) : options_(options) {
    // libcurl global state lives for the whole process
    std::call_once(g_curl_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    EasyHandle curl(curl_easy_init());
    if (!curl) {
      resp.error = "curl_easy_init failed";
      Logger::Error(resp.error);
      return resp;
    }
    HeaderList header_list;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
      if (!appended) {
        resp.error = "curl_slist_append failed";
        return resp;
      }
      header_list.release();
      header_list.reset(appended);
    }

    Sink sink;
    sink.limit = options_.max_response_bytes;
    char errbuf[CURL_ERROR_SIZE] = {0};
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    Logger::Debug("POST " + Origin(url) + " (" + std::to_string(body.size()) + " bytes)");
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
      if (sink.overflow)
        resp.error = "response from " + Origin(url) + " exceeds " + std::to_string(options_.max_response_bytes) + " bytes";
      else
        resp.error = std::string("request to ") + Origin(url) + " failed: " + (errbuf[0] ? errbuf : curl_easy_strerror(rc));
      Logger::Error(resp.error);
      return resp;
    }
    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    resp.status = code;
    resp.body = std::move(sink.data);
    return resp;
  }

private:
  CurlClientOptions options_;
};

std::unique_ptr<HttpClient> CreateCurlHttpClient(const CurlClientOptions& options) {
  return std::unique_ptr<HttpClient>(new CurlHttpClient(options));
}
