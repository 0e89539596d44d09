#pragma once

#include <cstddef>
#include <string>

namespace haul {
namespace utils {

constexpr std::size_t kMaxFilenameLength = 255;

/**
 * @brief Makes a remote-supplied filename safe to join to a local directory.
 *
 * Removes NUL bytes, turns path separators and ".." runs into '_', replaces
 * characters that are illegal on common filesystems, and truncates to 255
 * bytes on a UTF-8 boundary. Ordinary names come back unchanged; an empty
 * input yields an empty string.
 */
std::string sanitizeFilename(const std::string& filename);

}  // namespace utils
}  // namespace haul
