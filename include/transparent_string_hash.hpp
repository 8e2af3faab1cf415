#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace httpload {

// Hasher enabling heterogeneous lookup with std::string_view and C strings
struct TransparentStringHash {
  using is_transparent = void;

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

template <typename Value>
using StringMap =
    std::unordered_map<std::string, Value, TransparentStringHash,
                       std::equal_to<>>;

using StringSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

// Key/value pairs attached to a single log line
using LogContext = StringMap<std::string>;

} // namespace httpload
