#ifndef HAUL_CRYPTO_CTR_DECRYPTOR_HPP_
#define HAUL_CRYPTO_CTR_DECRYPTOR_HPP_

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace haul {

/**
 * @brief AES-CTR keystream positioned at an arbitrary byte offset.
 *
 * The counter for byte offset N is iv + N / 16 (128-bit big-endian add),
 * and the first N % 16 keystream bytes of that block are discarded. A
 * decryptor built at offset N therefore produces exactly the bytes a
 * decryptor built at 0 would produce after consuming N bytes, which is what
 * keeps resumed encrypted downloads correct.
 *
 * Key length selects AES-128/192/256; the IV must be one block.
 * Throws DecryptionError on unusable key material.
 */
class CtrDecryptor {
 public:
  static constexpr size_t kBlockSize = 16;

  CtrDecryptor(const std::string& key, const std::string& iv,
               uint64_t byteOffset = 0);
  ~CtrDecryptor();
  CtrDecryptor(const CtrDecryptor&) = delete;
  CtrDecryptor& operator=(const CtrDecryptor&) = delete;

  // 原地解密
  void update(char* data, size_t size);
  std::string update(const std::string& data);

  uint64_t position() const { return position_; }

  static std::string counterBlock(const std::string& iv, uint64_t blockIndex);

 private:
  struct CtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> ctx_;
  std::vector<unsigned char> out_;
  uint64_t position_;
};

}  // namespace haul

#endif  // HAUL_CRYPTO_CTR_DECRYPTOR_HPP_
