#ifndef HAUL_UTILS_ERRORS_HPP_
#define HAUL_UTILS_ERRORS_HPP_

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace haul {

class HaulError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// ---- extraction -----------------------------------------------------------

class ExtractorError : public HaulError {
 public:
  explicit ExtractorError(const std::string& message, int statusCode = 0)
      : HaulError(message), statusCode_(statusCode) {}

  int statusCode() const { return statusCode_; }

 private:
  int statusCode_;
};

class NotFoundError : public ExtractorError {
 public:
  explicit NotFoundError(const std::string& message = "Content not found")
      : ExtractorError(message, 404) {}
};

class PasswordRequiredError : public ExtractorError {
 public:
  explicit PasswordRequiredError(
      const std::string& message = "Password required")
      : ExtractorError(message) {}
};

class InvalidUrlError : public ExtractorError {
 public:
  explicit InvalidUrlError(const std::string& message = "Invalid URL")
      : ExtractorError(message) {}
};

class RegistrationError : public HaulError {
 public:
  using HaulError::HaulError;
};

// ---- transport ------------------------------------------------------------

class TransportError : public HaulError {
 public:
  using HaulError::HaulError;
};

// Connection reset, DNS failure, socket timeout. Retried by RetryExecutor.
class NetworkError : public TransportError {
 public:
  using TransportError::TransportError;
};

// 4xx other than 429. Never retried.
class HttpStatusError : public TransportError {
 public:
  HttpStatusError(long status, std::string body)
      : TransportError(std::to_string(status) + " " + reasonPhrase(status)),
        status_(status),
        body_(std::move(body)) {}

  long status() const { return status_; }
  const std::string& body() const { return body_; }

  static const char* reasonPhrase(long status) {
    switch (status) {
      case 400:
        return "Bad Request";
      case 401:
        return "Unauthorized";
      case 403:
        return "Forbidden";
      case 404:
        return "Not Found";
      case 405:
        return "Method Not Allowed";
      case 410:
        return "Gone";
      case 416:
        return "Range Not Satisfiable";
      case 429:
        return "Too Many Requests";
      default:
        return status >= 500 ? "Server Error" : "Client Error";
    }
  }

 private:
  long status_;
  std::string body_;
};

class RateLimitedError : public TransportError {
 public:
  RateLimitedError(const std::string& message,
                   std::optional<int> retryAfterSeconds)
      : TransportError(message), retryAfter_(retryAfterSeconds) {}

  std::optional<int> retryAfter() const { return retryAfter_; }

 private:
  std::optional<int> retryAfter_;
};

class RetriesExhaustedError : public TransportError {
 public:
  using TransportError::TransportError;
};

// No bytes arrived within the per-chunk timeout.
class ChunkTimeoutError : public TransportError {
 public:
  using TransportError::TransportError;
};

// The stream broke after some bytes were already handed to the caller.
class StreamInterruptedError : public TransportError {
 public:
  using TransportError::TransportError;
};

// ---- policy ---------------------------------------------------------------

class WaitTooLongError : public HaulError {
 public:
  WaitTooLongError(double waitSeconds, double maxSeconds)
      : HaulError("Server requested wait of " +
                  std::to_string(static_cast<int64_t>(waitSeconds)) +
                  "s exceeds limit of " +
                  std::to_string(static_cast<int64_t>(maxSeconds)) + "s"),
        waitSeconds_(waitSeconds),
        maxSeconds_(maxSeconds) {}

  double waitSeconds() const { return waitSeconds_; }
  double maxSeconds() const { return maxSeconds_; }

 private:
  double waitSeconds_;
  double maxSeconds_;
};

// ---- transfer -------------------------------------------------------------

class InsufficientDiskSpaceError : public HaulError {
 public:
  InsufficientDiskSpaceError(uint64_t required, uint64_t available)
      : HaulError("Insufficient disk space: need " + std::to_string(required) +
                  " bytes, " + std::to_string(available) + " available"),
        required_(required),
        available_(available) {}

  uint64_t required() const { return required_; }
  uint64_t available() const { return available_; }

 private:
  uint64_t required_;
  uint64_t available_;
};

class ChecksumMismatchError : public HaulError {
 public:
  ChecksumMismatchError(std::string expected, std::string actual,
                        std::string algorithm)
      : HaulError("Checksum mismatch (" + algorithm + "): expected " +
                  expected + ", got " + actual),
        expected_(std::move(expected)),
        actual_(std::move(actual)),
        algorithm_(std::move(algorithm)) {}

  const std::string& expected() const { return expected_; }
  const std::string& actual() const { return actual_; }
  const std::string& algorithm() const { return algorithm_; }

 private:
  std::string expected_;
  std::string actual_;
  std::string algorithm_;
};

class DecryptionError : public HaulError {
 public:
  using HaulError::HaulError;
};

// ---- storage --------------------------------------------------------------

class RegistryError : public HaulError {
 public:
  using HaulError::HaulError;
};

}  // namespace haul

#endif  // HAUL_UTILS_ERRORS_HPP_
