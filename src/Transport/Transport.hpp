#ifndef HAUL_TRANSPORT_TRANSPORT_HPP_
#define HAUL_TRANSPORT_TRANSPORT_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace haul {

using Headers = std::map<std::string, std::string>;
using Cookies = std::map<std::string, std::string>;

struct HttpRequest {
  std::string url;
  Headers headers;
  Cookies cookies;
};

struct HttpResponse {
  long status = 0;
  Headers headers;  // 响应头名统一为小写
  std::string body;
  std::string effectiveUrl;

  // Case-insensitive lookup; empty when absent.
  std::string header(const std::string& name) const;
};

struct ProbeResult {
  uint64_t contentLength = 0;  // 0 = unknown
  bool acceptRanges = false;
  std::optional<std::string> contentDisposition;
};

struct StreamOptions {
  size_t chunkSize = 1024 * 1024;
  // Sends "Range: bytes=<rangeStart>-" when set.
  std::optional<uint64_t> rangeStart;
  // Longest gap allowed between arriving bytes; zero disables.
  std::chrono::milliseconds chunkTimeout{0};
};

// Delivered once, before the first chunk.
struct StreamStart {
  long status = 0;
  uint64_t contentLength = 0;  // of this response body, 0 if absent
};

struct StreamChunk {
  const char* data = nullptr;
  size_t size = 0;
  uint64_t bytesSoFar = 0;  // within this response
  uint64_t totalBytes = 0;  // Content-Length of this response, 0 if absent
};

using StreamStartHandler = std::function<void(const StreamStart&)>;
// Return false to stop the transfer early (e.g. on cancellation).
using ChunkHandler = std::function<bool(const StreamChunk&)>;

/**
 * @brief Rate-limited, retrying HTTP access used by the engine.
 *
 * Implementations raise HttpStatusError for permanent 4xx replies,
 * RateLimitedError / RetriesExhaustedError once their retry budget is
 * spent, ChunkTimeoutError when a stream stalls and StreamInterruptedError
 * when a stream breaks after bytes were already delivered.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  virtual HttpResponse get(const HttpRequest& request) = 0;
  virtual HttpResponse head(const HttpRequest& request) = 0;
  virtual HttpResponse post(const HttpRequest& request, const std::string& body,
                            const std::string& contentType) = 0;

  virtual void downloadStream(const HttpRequest& request,
                              const StreamOptions& options,
                              const StreamStartHandler& onStart,
                              const ChunkHandler& onChunk) = 0;

  // Size, range support and Content-Disposition from a HEAD request.
  virtual ProbeResult probe(const HttpRequest& request);

  std::string getText(const HttpRequest& request);
  // JSON bodies are passed through as text; parsing is the extractor's job.
  std::string getJson(const HttpRequest& request);
  std::string postJson(const HttpRequest& request, const std::string& json);
  std::string postForm(const HttpRequest& request, const std::string& form);

  static ProbeResult probeFromHeaders(const HttpResponse& response);
};

// 解析 Content-Disposition 中的文件名（filename* 优先）
std::optional<std::string> filenameFromContentDisposition(
    const std::string& header);

std::string percentDecode(const std::string& text);

}  // namespace haul

#endif  // HAUL_TRANSPORT_TRANSPORT_HPP_
