#ifndef HAUL_EXTRACTORS_DIRECT_LINK_EXTRACTOR_HPP_
#define HAUL_EXTRACTORS_DIRECT_LINK_EXTRACTOR_HPP_

#include "Extractors/Extractor.hpp"
#include "Transport/Transport.hpp"

namespace haul {

// Fallback for plain http(s) links: one file, named by Content-Disposition
// or by the last path segment.
class DirectLinkExtractor : public Extractor {
 public:
  static constexpr const char* kName = "direct";

  explicit DirectLinkExtractor(Transport& transport) : transport_(transport) {}

  std::string name() const override { return kName; }
  bool canHandle(const std::string& url) const override;
  std::vector<FileInfo> extract(
      const std::string& url,
      const std::optional<std::string>& password = std::nullopt) override;

  static std::string filenameFromUrl(const std::string& url);

 private:
  Transport& transport_;
};

}  // namespace haul

#endif  // HAUL_EXTRACTORS_DIRECT_LINK_EXTRACTOR_HPP_
