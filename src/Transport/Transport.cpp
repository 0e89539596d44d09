#include "Transport/Transport.hpp"

#include <algorithm>
#include <cctype>

namespace haul {

namespace {

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

std::string unquote(const std::string& s) {
  if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(toLower(name));
  return it == headers.end() ? std::string() : it->second;
}

ProbeResult Transport::probe(const HttpRequest& request) {
  return probeFromHeaders(head(request));
}

std::string Transport::getText(const HttpRequest& request) {
  return get(request).body;
}

std::string Transport::getJson(const HttpRequest& request) {
  HttpRequest req(request);
  req.headers.emplace("Accept", "application/json");
  return get(req).body;
}

std::string Transport::postJson(const HttpRequest& request,
                                const std::string& json) {
  HttpRequest req(request);
  req.headers.emplace("Accept", "application/json");
  return post(req, json, "application/json").body;
}

std::string Transport::postForm(const HttpRequest& request,
                                const std::string& form) {
  return post(request, form, "application/x-www-form-urlencoded").body;
}

ProbeResult Transport::probeFromHeaders(const HttpResponse& response) {
  ProbeResult result;
  std::string length = response.header("content-length");
  if (!length.empty()) {
    try {
      result.contentLength = std::stoull(length);
    } catch (const std::exception&) {
      result.contentLength = 0;
    }
  }
  result.acceptRanges = toLower(trim(response.header("accept-ranges"))) == "bytes";
  std::string disposition = response.header("content-disposition");
  if (!disposition.empty()) result.contentDisposition = disposition;
  return result;
}

std::optional<std::string> filenameFromContentDisposition(
    const std::string& header) {
  std::optional<std::string> plain;
  size_t pos = 0;
  while (pos < header.size()) {
    size_t end = header.find(';', pos);
    if (end == std::string::npos) end = header.size();
    std::string part = trim(header.substr(pos, end - pos));
    pos = end + 1;

    size_t eq = part.find('=');
    if (eq == std::string::npos) continue;
    std::string key = toLower(trim(part.substr(0, eq)));
    std::string value = trim(part.substr(eq + 1));

    if (key == "filename*") {
      // RFC 5987: charset'lang'percent-encoded
      size_t quote = value.find('\'');
      size_t second =
          quote == std::string::npos ? quote : value.find('\'', quote + 1);
      if (second != std::string::npos) {
        std::string decoded = percentDecode(unquote(value.substr(second + 1)));
        if (!decoded.empty()) return decoded;
      }
    } else if (key == "filename") {
      plain = unquote(value);
    }
  }
  if (plain && plain->empty()) return std::nullopt;
  return plain;
}

std::string percentDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = hexValue(text[i + 1]);
      int lo = hexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

}  // namespace haul
