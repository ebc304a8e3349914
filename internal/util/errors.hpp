#pragma once

#include <stdexcept>
#include <string>

namespace trailwatch::util {

/*
  Central error types.

  Only setup paths throw these; the classification pipeline logs and
  continues instead.
*/

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WatchError : public std::runtime_error {
 public:
  explicit WatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace trailwatch::util
