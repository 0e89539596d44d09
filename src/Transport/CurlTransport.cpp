#include "Transport/CurlTransport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <mutex>

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace haul {

namespace {

constexpr size_t kMaxErrorBody = 64 * 1024;

std::once_flag g_curlInitOnce;

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using SlistHandle = std::unique_ptr<curl_slist, SlistDeleter>;

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// 可重试的网络层错误
bool isTransient(CURLcode code) {
  switch (code) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_PARTIAL_FILE:
    case CURLE_GOT_NOTHING:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
      return true;
    default:
      return false;
  }
}

[[noreturn]] void throwCurlError(CURLcode code, const char* errbuf,
                                 const std::string& url) {
  std::string message = std::string(curl_easy_strerror(code));
  if (errbuf != nullptr && errbuf[0] != '\0') {
    message += ": ";
    message += errbuf;
  }
  message += " (" + url + ")";
  if (isTransient(code)) throw NetworkError(message);
  throw TransportError(message);
}

// Header state shared by plain requests and streams. A new status line
// (redirect hop, 100-continue) starts the header set over.
struct HeaderState {
  long status = 0;
  Headers headers;
};

size_t headerCallback(char* buffer, size_t size, size_t nitems,
                      void* userdata) {
  auto* state = static_cast<HeaderState*>(userdata);
  size_t total = size * nitems;
  std::string line(buffer, total);
  if (line.compare(0, 5, "HTTP/") == 0) {
    state->headers.clear();
    size_t sp = line.find(' ');
    if (sp != std::string::npos) {
      state->status = std::strtol(line.c_str() + sp + 1, nullptr, 10);
    }
    return total;
  }
  size_t colon = line.find(':');
  if (colon != std::string::npos) {
    state->headers[toLower(trim(line.substr(0, colon)))] =
        trim(line.substr(colon + 1));
  }
  return total;
}

size_t bodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

struct StreamState {
  HeaderState head;
  CURL* curl = nullptr;
  const StreamOptions* options = nullptr;
  const StreamStartHandler* onStart = nullptr;
  const ChunkHandler* onChunk = nullptr;

  long status = 0;
  bool started = false;
  bool stopped = false;
  bool stalled = false;
  uint64_t contentLength = 0;
  uint64_t delivered = 0;
  std::string buffer;
  std::string errorBody;
  std::exception_ptr error;

  curl_off_t lastNow = 0;
  std::chrono::steady_clock::time_point lastProgress =
      std::chrono::steady_clock::now();

  void begin() {
    started = true;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    std::string length = head.headers["content-length"];
    if (!length.empty()) {
      try {
        contentLength = std::stoull(length);
      } catch (const std::exception&) {
        contentLength = 0;
      }
    }
    if (*onStart) (*onStart)(StreamStart{status, contentLength});
  }

  // Hands `n` buffered bytes to the caller; false stops the transfer.
  bool flush(size_t n) {
    delivered += n;
    StreamChunk chunk{buffer.data(), n, delivered, contentLength};
    bool more = (*onChunk)(chunk);
    buffer.erase(0, n);
    return more;
  }
};

size_t streamCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* state = static_cast<StreamState*>(userdata);
  size_t total = size * nmemb;
  try {
    long code = 0;
    curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &code);
    if (code >= 400) {
      state->status = code;
      size_t room = kMaxErrorBody - std::min(kMaxErrorBody,
                                             state->errorBody.size());
      state->errorBody.append(ptr, std::min(room, total));
      return total;
    }
    if (!state->started) state->begin();

    state->buffer.append(ptr, total);
    const size_t chunkSize = std::max<size_t>(state->options->chunkSize, 1);
    while (state->buffer.size() >= chunkSize) {
      if (!state->flush(chunkSize)) {
        state->stopped = true;
        return 0;
      }
    }
    return total;
  } catch (...) {
    // Re-raised on the calling thread once curl_easy_perform returns.
    state->error = std::current_exception();
    return 0;
  }
}

int progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t dlnow,
                     curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  auto* state = static_cast<StreamState*>(clientp);
  auto now = std::chrono::steady_clock::now();
  if (dlnow != state->lastNow) {
    state->lastNow = dlnow;
    state->lastProgress = now;
    return 0;
  }
  if (state->options->chunkTimeout.count() > 0 &&
      now - state->lastProgress > state->options->chunkTimeout) {
    state->stalled = true;
    return 1;
  }
  return 0;
}

std::string cookieString(const Cookies& cookies) {
  std::string out;
  for (const auto& kv : cookies) {
    if (!out.empty()) out += "; ";
    out += kv.first + "=" + kv.second;
  }
  return out;
}

}  // namespace

CurlTransport::CurlTransport(TransportConfig config, utils::Sleeper sleeper)
    : config_(std::move(config)),
      limiter_(std::make_shared<RateLimiter>(config_.requestsPerSecond)),
      retry_(RetryConfig{config_.maxRetries, std::chrono::seconds(60),
                         std::chrono::seconds(60)},
             limiter_, std::move(sleeper)) {
  std::call_once(g_curlInitOnce, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      throw TransportError(std::string("curl_global_init failed: ") +
                           curl_easy_strerror(rc));
    }
  });
}

HttpResponse CurlTransport::get(const HttpRequest& request) {
  return retry_.execute("GET " + request.url, [&]() {
    return performOnce(Method::kGet, request, nullptr, "");
  });
}

HttpResponse CurlTransport::head(const HttpRequest& request) {
  return retry_.execute("HEAD " + request.url, [&]() {
    return performOnce(Method::kHead, request, nullptr, "");
  });
}

HttpResponse CurlTransport::post(const HttpRequest& request,
                                 const std::string& body,
                                 const std::string& contentType) {
  return retry_.execute("POST " + request.url, [&]() {
    return performOnce(Method::kPost, request, &body, contentType);
  });
}

void CurlTransport::downloadStream(const HttpRequest& request,
                                   const StreamOptions& options,
                                   const StreamStartHandler& onStart,
                                   const ChunkHandler& onChunk) {
  retry_.execute("GET " + request.url + " (stream)", [&]() {
    return streamOnce(request, options, onStart, onChunk);
  });
}

namespace {

// 通用选项：超时、代理、UA、请求头、Cookie
SlistHandle applyCommonOptions(CURL* curl, const TransportConfig& config,
                               const HttpRequest& request) {
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(config.connectTimeout.count() * 1000));
  if (config.readTimeout.count() > 0) {
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(config.readTimeout.count()));
  }
  if (config.totalTimeout.count() > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config.totalTimeout.count() * 1000));
  }
  if (!config.proxy.empty()) {
    curl_easy_setopt(curl, CURLOPT_PROXY, config.proxy.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_USERAGENT, config.userAgent.c_str());

  curl_slist* list = nullptr;
  list = curl_slist_append(list, "Accept: */*");
  list = curl_slist_append(list, "Accept-Language: en-US,en;q=0.9");
  for (const auto& kv : request.headers) {
    list = curl_slist_append(list, (kv.first + ": " + kv.second).c_str());
  }
  SlistHandle headers(list);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

  if (!request.cookies.empty()) {
    std::string cookies = cookieString(request.cookies);
    // libcurl copies string options
    curl_easy_setopt(curl, CURLOPT_COOKIE, cookies.c_str());
  }
  return headers;
}

}  // namespace

HttpResponse CurlTransport::performOnce(Method method,
                                        const HttpRequest& request,
                                        const std::string* body,
                                        const std::string& contentType) {
  CurlHandle curl(curl_easy_init());
  if (!curl) throw TransportError("curl_easy_init failed");

  HttpRequest req(request);
  if (method == Method::kPost && !contentType.empty()) {
    req.headers["Content-Type"] = contentType;
  }
  SlistHandle headers = applyCommonOptions(curl.get(), config_, req);

  HeaderState head;
  HttpResponse response;
  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &head);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, bodyCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  // 文本请求允许压缩；HEAD 探测必须拿到未压缩的 Content-Length
  if (method != Method::kHead) {
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
  }

  switch (method) {
    case Method::kHead:
      curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
      break;
    case Method::kPost:
      curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                       static_cast<curl_off_t>(body->size()));
      break;
    case Method::kGet:
      curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
      break;
  }

  LOG(DEBUG) << "curl " << (method == Method::kHead   ? "HEAD "
                            : method == Method::kPost ? "POST "
                                                      : "GET ")
             << request.url;
  CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) throwCurlError(rc, errbuf, request.url);

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  char* effective = nullptr;
  if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective) ==
          CURLE_OK &&
      effective != nullptr) {
    response.effectiveUrl = effective;
  }
  response.headers = std::move(head.headers);
  return response;
}

HttpResponse CurlTransport::streamOnce(const HttpRequest& request,
                                       const StreamOptions& options,
                                       const StreamStartHandler& onStart,
                                       const ChunkHandler& onChunk) {
  CurlHandle curl(curl_easy_init());
  if (!curl) throw TransportError("curl_easy_init failed");

  SlistHandle headers = applyCommonOptions(curl.get(), config_, request);

  StreamState state;
  state.curl = curl.get();
  state.options = &options;
  state.onStart = &onStart;
  state.onChunk = &onChunk;

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &state.head);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, streamCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
  curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, 256L * 1024L);

  std::string range;
  if (options.rangeStart) {
    range = std::to_string(*options.rangeStart) + "-";
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
  }

  LOG(DEBUG) << "curl stream GET " << request.url
             << (range.empty() ? "" : " range=" + range);
  CURLcode rc = curl_easy_perform(curl.get());

  if (state.error) std::rethrow_exception(state.error);
  if (state.stopped) return HttpResponse{state.status, state.head.headers, "",
                                         request.url};
  if (state.stalled) {
    std::string message = "No data received for " +
                          std::to_string(options.chunkTimeout.count()) +
                          "ms (" + request.url + ")";
    throw ChunkTimeoutError(message);
  }
  if (rc != CURLE_OK) {
    if (state.delivered > 0) {
      throw StreamInterruptedError(std::string(curl_easy_strerror(rc)) +
                                   " after " +
                                   std::to_string(state.delivered) +
                                   " bytes (" + request.url + ")");
    }
    throwCurlError(rc, errbuf, request.url);
  }

  HttpResponse response;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  response.headers = state.head.headers;
  response.effectiveUrl = request.url;
  if (response.status >= 400) {
    response.body = std::move(state.errorBody);
    return response;
  }

  // Empty bodies still announce their start.
  if (!state.started) state.begin();
  if (!state.buffer.empty()) state.flush(state.buffer.size());
  return response;
}

}  // namespace haul
