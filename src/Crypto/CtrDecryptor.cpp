#include "Crypto/CtrDecryptor.hpp"

#include <openssl/err.h>

#include <algorithm>
#include <cstring>

#include "utils/errors.hpp"

namespace haul {

namespace {

const EVP_CIPHER* cipherForKey(size_t keyLength) {
  switch (keyLength) {
    case 16:
      return EVP_aes_128_ctr();
    case 24:
      return EVP_aes_192_ctr();
    case 32:
      return EVP_aes_256_ctr();
    default:
      return nullptr;
  }
}

std::string opensslError(const std::string& what) {
  unsigned long code = ERR_get_error();
  if (code == 0) return what;
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return what + ": " + buf;
}

}  // namespace

CtrDecryptor::CtrDecryptor(const std::string& key, const std::string& iv,
                           uint64_t byteOffset)
    : ctx_(EVP_CIPHER_CTX_new()), position_(byteOffset) {
  const EVP_CIPHER* cipher = cipherForKey(key.size());
  if (cipher == nullptr) {
    throw DecryptionError("Unsupported AES key length: " +
                          std::to_string(key.size()) + " bytes");
  }
  if (iv.size() != kBlockSize) {
    throw DecryptionError("CTR IV must be 16 bytes, got " +
                          std::to_string(iv.size()));
  }
  if (!ctx_) throw DecryptionError("EVP_CIPHER_CTX_new failed");

  std::string counter = counterBlock(iv, byteOffset / kBlockSize);
  if (EVP_DecryptInit_ex(ctx_.get(), cipher, nullptr,
                         reinterpret_cast<const unsigned char*>(key.data()),
                         reinterpret_cast<const unsigned char*>(
                             counter.data())) != 1) {
    throw DecryptionError(opensslError("EVP_DecryptInit_ex failed"));
  }

  // 丢弃块内偏移之前的密钥流
  size_t skip = static_cast<size_t>(byteOffset % kBlockSize);
  if (skip > 0) {
    unsigned char zeros[kBlockSize] = {0};
    unsigned char sink[kBlockSize * 2];
    int outLen = 0;
    if (EVP_DecryptUpdate(ctx_.get(), sink, &outLen, zeros,
                          static_cast<int>(skip)) != 1) {
      throw DecryptionError(opensslError("EVP_DecryptUpdate failed"));
    }
  }
}

CtrDecryptor::~CtrDecryptor() = default;

void CtrDecryptor::update(char* data, size_t size) {
  if (size == 0) return;
  out_.resize(size + kBlockSize);
  size_t done = 0;
  while (done < size) {
    // EVP takes int lengths
    int n = static_cast<int>(std::min<size_t>(size - done, 1 << 30));
    int outLen = 0;
    if (EVP_DecryptUpdate(ctx_.get(), out_.data(), &outLen,
                          reinterpret_cast<const unsigned char*>(data + done),
                          n) != 1) {
      throw DecryptionError(opensslError("EVP_DecryptUpdate failed"));
    }
    std::memcpy(data + done, out_.data(), static_cast<size_t>(outLen));
    done += static_cast<size_t>(n);
  }
  position_ += size;
}

std::string CtrDecryptor::update(const std::string& data) {
  std::string out(data);
  update(&out[0], out.size());
  return out;
}

std::string CtrDecryptor::counterBlock(const std::string& iv,
                                       uint64_t blockIndex) {
  std::string counter(iv);
  uint64_t carry = blockIndex;
  for (size_t i = counter.size(); i-- > 0 && carry != 0;) {
    uint64_t sum = static_cast<unsigned char>(counter[i]) + (carry & 0xff);
    counter[i] = static_cast<char>(sum & 0xff);
    carry = (carry >> 8) + (sum >> 8);
  }
  return counter;
}

}  // namespace haul
