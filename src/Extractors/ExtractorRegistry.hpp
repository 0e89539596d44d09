#ifndef HAUL_EXTRACTORS_EXTRACTOR_REGISTRY_HPP_
#define HAUL_EXTRACTORS_EXTRACTOR_REGISTRY_HPP_

#include <memory>
#include <string>
#include <vector>

#include "Extractors/Extractor.hpp"

namespace haul {

/**
 * @brief Owns the extractors known to this process.
 *
 * Built once at startup and handed to the manager by reference. URL lookup
 * walks extractors in registration order, so catch-all extractors go last.
 */
class ExtractorRegistry {
 public:
  ExtractorRegistry() = default;
  ExtractorRegistry(const ExtractorRegistry&) = delete;
  ExtractorRegistry& operator=(const ExtractorRegistry&) = delete;

  // Throws RegistrationError on a duplicate name.
  Extractor& add(std::unique_ptr<Extractor> extractor);

  Extractor* get(const std::string& name) const;
  Extractor* forUrl(const std::string& url) const;
  std::vector<std::string> names() const;
  size_t size() const { return extractors_.size(); }

 private:
  std::vector<std::unique_ptr<Extractor>> extractors_;
};

}  // namespace haul

#endif  // HAUL_EXTRACTORS_EXTRACTOR_REGISTRY_HPP_
