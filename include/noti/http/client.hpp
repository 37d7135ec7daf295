#pragma once

#include "noti/config/schema.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace noti::http {

struct HttpRequest {
  config::HttpMethod method = config::HttpMethod::Post;
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool is_success() const {
    return !network_error && status >= 200 && status < 300;
  }
};

/// Transport seam. Implementations must be safe to call from several threads
/// at once; the dispatcher shares one client across its fan-out.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request,
                                          std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse send(const HttpRequest &request, std::uint64_t timeout_ms) override;
};

} // namespace noti::http
