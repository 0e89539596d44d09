#ifndef HAUL_EXTRACTORS_EXTRACTOR_HPP_
#define HAUL_EXTRACTORS_EXTRACTOR_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Downloader/DownloadTypes.hpp"

namespace haul {

struct FolderInfo {
  std::string url;
  std::string name;
  std::vector<FileInfo> files;
  std::vector<FolderInfo> subfolders;
};

/**
 * @brief Turns a share URL into downloadable FileInfo records.
 *
 * Implementations raise NotFoundError, PasswordRequiredError or
 * InvalidUrlError; the engine passes those to its caller untouched.
 */
class Extractor {
 public:
  virtual ~Extractor() = default;

  // Stable registry key, e.g. "direct".
  virtual std::string name() const = 0;
  virtual bool canHandle(const std::string& url) const = 0;
  virtual std::vector<FileInfo> extract(
      const std::string& url,
      const std::optional<std::string>& password = std::nullopt) = 0;

  // Hosts without folder support return nullopt.
  virtual std::optional<FolderInfo> extractFolder(
      const std::string& url,
      const std::optional<std::string>& password = std::nullopt);
};

struct UrlParts {
  std::string scheme;  // lowercase
  std::string host;    // lowercase, no userinfo or port
  std::string path;    // without query / fragment, may be empty
};

UrlParts parseUrl(const std::string& url);

// Throws InvalidUrlError unless the URL is http(s) with a host.
void validateUrlScheme(const std::string& url);

// "1.5 GB", "700 Mo", "12K" -> bytes (binary multiples); 0 if no number.
uint64_t parseSizeString(const std::string& text);

}  // namespace haul

#endif  // HAUL_EXTRACTORS_EXTRACTOR_HPP_
