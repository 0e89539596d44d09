#include "Extractors/DirectLinkExtractor.hpp"

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace haul {

bool DirectLinkExtractor::canHandle(const std::string& url) const {
  UrlParts parts = parseUrl(url);
  return (parts.scheme == "http" || parts.scheme == "https") &&
         !parts.host.empty();
}

std::string DirectLinkExtractor::filenameFromUrl(const std::string& url) {
  std::string path = parseUrl(url).path;
  while (!path.empty() && path.back() == '/') path.pop_back();
  size_t slash = path.rfind('/');
  std::string last =
      slash == std::string::npos ? path : path.substr(slash + 1);
  return percentDecode(last);
}

std::vector<FileInfo> DirectLinkExtractor::extract(
    const std::string& url, const std::optional<std::string>& /*password*/) {
  validateUrlScheme(url);

  ProbeResult probe;
  try {
    probe = transport_.probe(HttpRequest{url, {}, {}});
  } catch (const HttpStatusError& e) {
    if (e.status() == 404 || e.status() == 410) {
      throw NotFoundError("File not found: " + url);
    }
    if (e.status() != 405 && e.status() != 501) throw;
    LOG(DEBUG) << "HEAD not allowed for " << url << ", size unknown";
  }

  FileInfo info;
  info.url = url;
  info.directUrl = url;
  info.size = probe.contentLength;
  info.extractorName = kName;
  if (probe.contentDisposition) {
    if (auto name = filenameFromContentDisposition(*probe.contentDisposition)) {
      info.filename = *name;
    }
  }
  if (info.filename.empty()) info.filename = filenameFromUrl(url);
  if (info.filename.empty()) info.filename = "download";

  LOG(INFO) << "Direct link " << info.filename << " (" << info.size
            << " bytes)";
  return {info};
}

}  // namespace haul
