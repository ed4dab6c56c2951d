/**
 * @file string_utils.cpp
 * @brief Name normalization helpers
 */

#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>

namespace tastemix::utils {

std::string Trim(std::string_view str) {
  auto is_space = [](char chr) { return std::isspace(static_cast<unsigned char>(chr)) != 0; };
  size_t begin = 0;
  while (begin < str.size() && is_space(str[begin])) {
    ++begin;
  }
  size_t end = str.size();
  while (end > begin && is_space(str[end - 1])) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

std::string ToLower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return result;
}

}  // namespace tastemix::utils
