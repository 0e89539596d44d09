#include "Crypto/Checksum.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

#include "utils/errors.hpp"

namespace haul {

namespace {

constexpr size_t kReadBlock = 1024 * 1024;

const EVP_MD* digestFor(const std::string& algorithm) {
  const std::string name = normalizeAlgorithm(algorithm);
  if (name == "md5") return EVP_md5();
  if (name == "sha1") return EVP_sha1();
  if (name == "sha224") return EVP_sha224();
  if (name == "sha256") return EVP_sha256();
  if (name == "sha384") return EVP_sha384();
  if (name == "sha512") return EVP_sha512();
  return nullptr;
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx newContext(const EVP_MD* md) {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    throw HaulError("EVP_DigestInit_ex failed");
  }
  return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
    throw HaulError("EVP_DigestFinal_ex failed");
  }
  static const char* kHex = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0f]);
  }
  return hex;
}

}  // namespace

std::string normalizeAlgorithm(const std::string& algorithm) {
  std::string out;
  out.reserve(algorithm.size());
  for (unsigned char c : algorithm) {
    if (c == '-' || c == '_' || std::isspace(c)) continue;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

bool isSupportedAlgorithm(const std::string& algorithm) {
  return digestFor(algorithm) != nullptr;
}

std::optional<std::string> bufferDigest(const std::string& data,
                                        const std::string& algorithm) {
  const EVP_MD* md = digestFor(algorithm);
  if (md == nullptr) return std::nullopt;
  MdCtx ctx = newContext(md);
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw HaulError("EVP_DigestUpdate failed");
  }
  return finish(ctx.get());
}

std::optional<std::string> fileDigest(const std::filesystem::path& path,
                                      const std::string& algorithm) {
  const EVP_MD* md = digestFor(algorithm);
  if (md == nullptr) return std::nullopt;

  std::ifstream in(path, std::ios::binary);
  if (!in) throw HaulError("Cannot open file for checksum: " + path.string());

  MdCtx ctx = newContext(md);
  std::vector<char> block(kReadBlock);
  while (in) {
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), block.data(),
                                  static_cast<size_t>(n)) != 1) {
      throw HaulError("EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) throw HaulError("Read error while hashing " + path.string());
  return finish(ctx.get());
}

bool digestEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  return std::equal(a.begin(), a.end(), b.begin(),
                    [](unsigned char x, unsigned char y) {
                      return std::tolower(x) == std::tolower(y);
                    });
}

}  // namespace haul
