#pragma once

#include <stdexcept>
#include <string>

namespace nyayacpp {

// Invalid settings or missing credentials. Fatal and never retried.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// An embedding or generation provider call failed.
class ProviderError : public std::runtime_error {
 public:
  explicit ProviderError(const std::string& message) : std::runtime_error(message) {}
};

// Timeout or rate limiting. Eligible for one bounded retry.
class ProviderTransientError : public ProviderError {
 public:
  explicit ProviderTransientError(const std::string& message) : ProviderError(message) {}
};

// Malformed case record; the record is skipped and reported.
class DataValidationError : public std::runtime_error {
 public:
  explicit DataValidationError(const std::string& message) : std::runtime_error(message) {}
};

class DimensionMismatchError : public std::runtime_error {
 public:
  explicit DimensionMismatchError(const std::string& message) : std::runtime_error(message) {}
};

// Raised by query answering when neither generation nor embedding providers could be reached.
class ProviderUnavailableError : public std::runtime_error {
 public:
  explicit ProviderUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace nyayacpp
