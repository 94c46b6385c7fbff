#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sato::net {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse head(const std::string &url, const HeaderMap &headers,
                                          std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HeaderMap &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse head(const std::string &url, const HeaderMap &headers,
                                  std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
};

} // namespace sato::net
