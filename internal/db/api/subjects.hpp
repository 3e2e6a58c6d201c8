#pragma once

#include <string>

namespace typelog::db {

/*
  Subject (row key) helpers.

  Subjects are '/'-separated paths compared bytewise. The rows strictly
  beneath `prefix` are exactly those in the open interval
  (prefix + "/", prefix + "0"), because '0' is the byte following '/'.
*/

inline std::string ChildLowerBound(const std::string& prefix) {
  return prefix + "/";
}

inline std::string ChildUpperBound(const std::string& prefix) {
  return prefix + "0";
}

inline bool IsChildSubject(const std::string& subject, const std::string& prefix) {
  return subject.size() > prefix.size() + 1 && subject.compare(0, prefix.size(), prefix) == 0 && subject[prefix.size()] == '/';
}

} // namespace typelog::db
