#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace Utils {
// Number of Unicode code points in a UTF-8 string. Continuation bytes are not
// counted, so malformed input still yields a value no larger than size().
size_t utf8_length(std::string_view text);

std::string to_lower_ascii(std::string_view text);

std::string base64_encode(std::string_view data);

// Resident set size of this process in bytes, read from /proc/self/statm.
// Empty where procfs is unavailable.
std::optional<size_t> resident_memory_bytes();

// Creates the parent directory of `filepath` if it does not exist yet.
bool create_directory_for_file(const std::string &filepath);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  if constexpr (std::is_floating_point_v<T>) {
    // std::from_chars for floating point is not available on every standard
    // library this builds with.
    try {
      size_t consumed = 0;
      std::string owned{s};
      double value = std::stod(owned, &consumed);
      if (consumed != owned.size())
        return std::nullopt;
      return static_cast<T>(value);
    } catch (const std::exception &) {
      return std::nullopt;
    }
  } else {
    T value;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

    if (ec == std::errc() && ptr == s.data() + s.size())
      return value;
    return std::nullopt;
  }
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
