#pragma once
#include <memory>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  // Throws std::runtime_error on transport failure; HTTP error statuses are returned, not thrown.
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  long tcp_keepidle_s = 30;
  long tcp_keepintvl_s = 15;
  bool verify_tls = true;
};

// libcurl-backed client. One easy handle per request, safe to share across threads.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
