#include "utils/utils.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#if defined(__linux__)
#include <unistd.h>
#endif

namespace Utils {
std::optional<size_t> resident_memory_bytes() {
#if defined(__linux__)
  std::ifstream statm("/proc/self/statm");
  long long size = 0, resident = 0;
  if (!(statm >> size >> resident))
    return std::nullopt;
  const long page_size = sysconf(_SC_PAGESIZE);
  if (page_size <= 0)
    return std::nullopt;
  return static_cast<size_t>(resident) * static_cast<size_t>(page_size);
#else
  return std::nullopt;
#endif
}

size_t utf8_length(std::string_view text) {
  size_t count = 0;
  for (unsigned char c : text)
    if ((c & 0xC0) != 0x80)
      ++count;
  return count;
}

std::string to_lower_ascii(std::string_view text) {
  std::string lowered{text};
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) {
                   return c < 0x80 ? static_cast<char>(std::tolower(c))
                                   : static_cast<char>(c);
                 });
  return lowered;
}

std::string base64_encode(std::string_view data) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  while (i + 2 < data.size()) {
    uint32_t triple = (static_cast<uint8_t>(data[i]) << 16) |
                      (static_cast<uint8_t>(data[i + 1]) << 8) |
                      static_cast<uint8_t>(data[i + 2]);
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    encoded.push_back(kAlphabet[triple & 0x3F]);
    i += 3;
  }

  size_t remaining = data.size() - i;
  if (remaining == 1) {
    uint32_t triple = static_cast<uint8_t>(data[i]) << 16;
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    encoded.append("==");
  } else if (remaining == 2) {
    uint32_t triple = (static_cast<uint8_t>(data[i]) << 16) |
                      (static_cast<uint8_t>(data[i + 1]) << 8);
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    encoded.push_back('=');
  }
  return encoded;
}

bool create_directory_for_file(const std::string &filepath) {
  std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}
} // namespace Utils
