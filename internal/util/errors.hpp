#pragma once

#include <stdexcept>
#include <string>

namespace meshgraph::util {

/*
  Central error types.

  Per-event failures (network, payload, storage write) are contained by the
  listener; StorageUnavailable and Configuration errors terminate the process.
*/

class TransientNetworkError : public std::runtime_error {
 public:
  explicit TransientNetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedPayloadError : public std::runtime_error {
 public:
  explicit MalformedPayloadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageWriteError : public std::runtime_error {
 public:
  explicit StorageWriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageUnavailableError : public std::runtime_error {
 public:
  explicit StorageUnavailableError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace meshgraph::util
