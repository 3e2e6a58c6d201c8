#pragma once

#include <stdexcept>
#include <string>

namespace typelog::util {

/*
  Central error types.

  Store backends report write failures as db::Result codes, which the
  collection layer turns into StoreError. Failures with no Result channel
  (begin, commit, reads) are thrown as StoreError by the backend itself.
  Nothing here is retried internally.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace typelog::util
