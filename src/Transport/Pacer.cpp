#include "Transport/Pacer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>
#include <regex>
#include <vector>

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace haul {

namespace {

// At most this many non-digit characters may sit between "wait" and the
// number, so a stray year further down the page is not taken as a wait.
constexpr size_t kMaxWaitGap = 64;

std::mt19937_64& rng() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

std::string toLower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

const std::vector<std::regex>& floodPatterns() {
  static const std::vector<std::regex> patterns = {
      std::regex(R"(ip\s*(?:address)?\s*(?:has\s+been\s+)?lock)"),
      std::regex(R"(too\s+many\s+(?:connection|download|request))"),
      std::regex(R"(download\s+limit\s+(?:reached|exceeded))"),
      std::regex(R"(flood\s+control)"),
      std::regex(R"(request\s+limit)"),
      std::regex(R"(rate\s+limit)"),
      std::regex(R"(wait\s+(?:before|until))"),
  };
  return patterns;
}

// Parses "<keyword><non-digits><number>[ unit]" starting right after the
// keyword at `pos`. Returns seconds.
std::optional<double> numberAfter(const std::string& lower, size_t pos) {
  size_t i = pos;
  size_t gap = 0;
  while (i < lower.size() && !std::isdigit(static_cast<unsigned char>(lower[i]))) {
    if (++gap > kMaxWaitGap) return std::nullopt;
    ++i;
  }
  if (gap == 0 || i >= lower.size()) return std::nullopt;

  size_t start = i;
  while (i < lower.size() && std::isdigit(static_cast<unsigned char>(lower[i])) &&
         i - start < 9) {
    ++i;
  }
  double value = std::stod(lower.substr(start, i - start));

  while (i < lower.size() && std::isspace(static_cast<unsigned char>(lower[i]))) {
    ++i;
  }
  if (lower.compare(i, 3, "min") == 0) value *= 60;
  return value;
}

}  // namespace

Pacer::Pacer(PacerConfig config, utils::Sleeper sleeper)
    : config_(config),
      sleeper_(sleeper ? std::move(sleeper) : utils::defaultSleeper()) {
  config_.jitter = std::clamp(config_.jitter, 0.0, 1.0);
}

Pacer::Pacer(const Pacer& other)
    : config_(other.config_),
      sleeper_(other.sleeper_),
      attempt_(other.attempt_.load()) {}

Pacer& Pacer::operator=(const Pacer& other) {
  if (this != &other) {
    config_ = other.config_;
    sleeper_ = other.sleeper_;
    attempt_.store(other.attempt_.load());
  }
  return *this;
}

std::chrono::milliseconds Pacer::backoff(int attempt) const {
  attempt = std::max(attempt, 0);
  double base = static_cast<double>(config_.minBackoff.count()) *
                std::pow(2.0, std::min(attempt, 62));
  double capped =
      std::min(base, static_cast<double>(config_.maxBackoff.count()));
  std::uniform_real_distribution<double> dist(1.0 - config_.jitter,
                                              1.0 + config_.jitter);
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(capped * dist(rng()))));
}

std::chrono::milliseconds Pacer::nextBackoff() const {
  return backoff(attempt_.load());
}

void Pacer::sleep() {
  int attempt = attempt_.fetch_add(1);
  auto delay = backoff(attempt);
  LOG(DEBUG) << "Pacer sleeping " << delay.count() << "ms (attempt "
             << attempt + 1 << ")";
  sleeper_(delay);
}

void Pacer::reset() { attempt_.store(0); }

int Pacer::attemptCount() const { return attempt_.load(); }

bool Pacer::detectFloodOrLock(const std::string& body) {
  std::string lower = toLower(body);
  for (const auto& pattern : floodPatterns()) {
    if (std::regex_search(lower, pattern)) {
      LOG(WARN) << "Flood/IP-lock detected in response";
      return true;
    }
  }
  return false;
}

std::optional<double> Pacer::parseWaitTime(const std::string& body) {
  // Covers "Please wait 30 seconds", "must wait 2 minutes", "countdown: 60",
  // "wait_time=45" and "var wait = 60;".
  std::string lower = toLower(body);
  static const char* const kKeywords[] = {"wait", "countdown"};

  size_t from = 0;
  while (from < lower.size()) {
    size_t best = std::string::npos;
    size_t bestLen = 0;
    for (const char* kw : kKeywords) {
      size_t p = lower.find(kw, from);
      if (p < best) {
        best = p;
        bestLen = std::char_traits<char>::length(kw);
      }
    }
    if (best == std::string::npos) break;

    auto value = numberAfter(lower, best + bestLen);
    if (value) {
      LOG(INFO) << "Parsed wait time: " << *value << "s from page";
      return value;
    }
    from = best + bestLen;
  }
  return std::nullopt;
}

void Pacer::handleFloodLock() {
  LOG(WARN) << "Flood/IP-lock detected, sleeping "
            << config_.floodSleep.count() / 1000.0 << "s";
  sleeper_(config_.floodSleep);
}

bool Pacer::waitIfRequested(const std::string& body,
                            std::chrono::seconds maxAcceptable) {
  auto wait = parseWaitTime(body);
  if (!wait) return false;

  if (*wait <= 0) {
    LOG(WARN) << "Ignoring non-positive wait time " << *wait << "s";
    return false;
  }
  if (*wait > static_cast<double>(maxAcceptable.count())) {
    throw WaitTooLongError(*wait, static_cast<double>(maxAcceptable.count()));
  }

  LOG(INFO) << "Waiting " << *wait << "s as required by server";
  sleeper_(std::chrono::milliseconds(
      static_cast<int64_t>((*wait + 1.0) * 1000.0)));
  return true;
}

bool Pacer::handleHostileResponse(const std::string& body) {
  if (detectFloodOrLock(body)) {
    handleFloodLock();
    return true;
  }
  return waitIfRequested(body);
}

}  // namespace haul
