#ifndef HAUL_CRYPTO_CHECKSUM_HPP_
#define HAUL_CRYPTO_CHECKSUM_HPP_

#include <filesystem>
#include <optional>
#include <string>

namespace haul {

// "SHA-256", "sha_256", "Sha256" -> "sha256"
std::string normalizeAlgorithm(const std::string& algorithm);

// md5, sha1, sha224, sha256, sha384, sha512
bool isSupportedAlgorithm(const std::string& algorithm);

// Lowercase hex digest; nullopt for an algorithm we cannot verify.
std::optional<std::string> bufferDigest(const std::string& data,
                                        const std::string& algorithm);

// Streams the file through the digest. Throws HaulError when the file
// cannot be read.
std::optional<std::string> fileDigest(const std::filesystem::path& path,
                                      const std::string& algorithm);

bool digestEquals(const std::string& a, const std::string& b);

}  // namespace haul

#endif  // HAUL_CRYPTO_CHECKSUM_HPP_
