#include "Extractors/ExtractorRegistry.hpp"

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace haul {

Extractor& ExtractorRegistry::add(std::unique_ptr<Extractor> extractor) {
  if (!extractor) throw RegistrationError("Cannot register a null extractor");
  const std::string name = extractor->name();
  if (get(name) != nullptr) {
    throw RegistrationError("Extractor '" + name + "' is already registered");
  }
  LOG(DEBUG) << "Registered extractor " << name;
  extractors_.push_back(std::move(extractor));
  return *extractors_.back();
}

Extractor* ExtractorRegistry::get(const std::string& name) const {
  for (const auto& e : extractors_) {
    if (e->name() == name) return e.get();
  }
  return nullptr;
}

Extractor* ExtractorRegistry::forUrl(const std::string& url) const {
  for (const auto& e : extractors_) {
    if (e->canHandle(url)) return e.get();
  }
  return nullptr;
}

std::vector<std::string> ExtractorRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(extractors_.size());
  for (const auto& e : extractors_) out.push_back(e->name());
  return out;
}

}  // namespace haul
