#ifndef HAUL_TRANSPORT_CURL_TRANSPORT_HPP_
#define HAUL_TRANSPORT_CURL_TRANSPORT_HPP_

#include <chrono>
#include <memory>
#include <string>

#include "Transport/RateLimiter.hpp"
#include "Transport/RetryExecutor.hpp"
#include "Transport/Transport.hpp"
#include "utils/sleeper.hpp"

namespace haul {

struct TransportConfig {
  double requestsPerSecond = 10.0;
  int maxRetries = 3;
  std::chrono::seconds connectTimeout{30};
  // Socket read timeout: abort when nothing arrives for this long.
  std::chrono::seconds readTimeout{300};
  // Whole-request limit; zero means none.
  std::chrono::seconds totalTimeout{0};
  // Empty: libcurl's http_proxy / https_proxy / no_proxy handling.
  std::string proxy;
  std::string userAgent =
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/124.0 Safari/537.36";
};

/**
 * @brief libcurl-backed Transport.
 *
 * One easy handle per request, so a single instance is shared by every
 * worker thread. All methods run through one RetryExecutor and therefore
 * share one RateLimiter budget.
 */
class CurlTransport : public Transport {
 public:
  explicit CurlTransport(TransportConfig config = TransportConfig(),
                         utils::Sleeper sleeper = nullptr);
  ~CurlTransport() override = default;

  HttpResponse get(const HttpRequest& request) override;
  HttpResponse head(const HttpRequest& request) override;
  HttpResponse post(const HttpRequest& request, const std::string& body,
                    const std::string& contentType) override;

  void downloadStream(const HttpRequest& request, const StreamOptions& options,
                      const StreamStartHandler& onStart,
                      const ChunkHandler& onChunk) override;

  const TransportConfig& config() const { return config_; }

 private:
  enum class Method { kGet, kHead, kPost };

  HttpResponse performOnce(Method method, const HttpRequest& request,
                           const std::string* body,
                           const std::string& contentType);
  HttpResponse streamOnce(const HttpRequest& request,
                          const StreamOptions& options,
                          const StreamStartHandler& onStart,
                          const ChunkHandler& onChunk);

  TransportConfig config_;
  std::shared_ptr<RateLimiter> limiter_;
  RetryExecutor retry_;
};

}  // namespace haul

#endif  // HAUL_TRANSPORT_CURL_TRANSPORT_HPP_
