#include "utils/sanitize.hpp"

namespace haul {
namespace utils {

namespace {

bool isIllegalChar(unsigned char c) {
  switch (c) {
    case ':':
    case '*':
    case '?':
    case '"':
    case '<':
    case '>':
    case '|':
      return true;
    default:
      return c < 0x20 || c == 0x7f;
  }
}

// UTF-8 continuation bytes look like 10xxxxxx
bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

}  // namespace

std::string sanitizeFilename(const std::string& filename) {
  std::string out;
  out.reserve(filename.size());

  for (std::size_t i = 0; i < filename.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(filename[i]);
    if (c == '\0') continue;

    if (c == '.' && i + 1 < filename.size() && filename[i + 1] == '.') {
      // ".." 及更长的点序列整体替换
      while (i + 1 < filename.size() && filename[i + 1] == '.') ++i;
      out.push_back('_');
      continue;
    }
    if (c == '/' || c == '\\' || isIllegalChar(c)) {
      out.push_back('_');
      continue;
    }
    out.push_back(static_cast<char>(c));
  }

  if (out == ".") out = "_";

  if (out.size() > kMaxFilenameLength) {
    std::size_t cut = kMaxFilenameLength;
    while (cut > 0 && isContinuationByte(static_cast<unsigned char>(out[cut]))) {
      --cut;
    }
    out.resize(cut);
  }
  return out;
}

}  // namespace utils
}  // namespace haul
