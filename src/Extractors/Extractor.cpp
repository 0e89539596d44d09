#include "Extractors/Extractor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "utils/errors.hpp"

namespace haul {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

std::optional<FolderInfo> Extractor::extractFolder(
    const std::string& /*url*/, const std::optional<std::string>& /*password*/) {
  return std::nullopt;
}

UrlParts parseUrl(const std::string& url) {
  UrlParts parts;
  size_t sep = url.find("://");
  if (sep == std::string::npos) return parts;
  parts.scheme = toLower(url.substr(0, sep));

  size_t hostStart = sep + 3;
  size_t hostEnd = url.find_first_of("/?#", hostStart);
  std::string authority = url.substr(
      hostStart,
      hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);
  size_t at = authority.rfind('@');
  if (at != std::string::npos) authority = authority.substr(at + 1);
  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    parts.host = toLower(authority.substr(0, close == std::string::npos
                                                 ? std::string::npos
                                                 : close + 1));
  } else {
    parts.host = toLower(authority.substr(0, authority.find(':')));
  }

  if (hostEnd != std::string::npos && url[hostEnd] == '/') {
    size_t pathEnd = url.find_first_of("?#", hostEnd);
    parts.path = url.substr(hostEnd, pathEnd == std::string::npos
                                         ? std::string::npos
                                         : pathEnd - hostEnd);
  }
  return parts;
}

void validateUrlScheme(const std::string& url) {
  UrlParts parts = parseUrl(url);
  if (parts.scheme != "http" && parts.scheme != "https") {
    throw InvalidUrlError("Invalid URL scheme: '" + parts.scheme +
                          "'. Only http/https allowed.");
  }
  if (parts.host.empty()) throw InvalidUrlError("Invalid URL: missing host");
}

uint64_t parseSizeString(const std::string& text) {
  static const std::regex kSize(R"(([\d.]+)\s*(KB|MB|GB|TB|Ko|Mo|Go|To|K|M|G|T|B)?)",
                                std::regex::icase);
  std::smatch match;
  if (!std::regex_search(text, match, kSize)) return 0;

  double value = 0.0;
  try {
    value = std::stod(match[1].str());
  } catch (const std::exception&) {
    return 0;
  }
  std::string unit = match[2].matched ? toLower(match[2].str()) : "b";
  // 法语单位 "octet"
  if (unit.size() == 2 && unit[1] == 'o') unit[1] = 'b';

  uint64_t multiplier = 1;
  switch (unit[0]) {
    case 'k':
      multiplier = 1ULL << 10;
      break;
    case 'm':
      multiplier = 1ULL << 20;
      break;
    case 'g':
      multiplier = 1ULL << 30;
      break;
    case 't':
      multiplier = 1ULL << 40;
      break;
    default:
      break;
  }
  return static_cast<uint64_t>(value * static_cast<double>(multiplier));
}

}  // namespace haul
