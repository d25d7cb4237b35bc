#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace qrapi {

std::string to_string(ErrorCorrection level) {
  switch (level) {
    case ErrorCorrection::Low:
      return "L";
    case ErrorCorrection::Medium:
      return "M";
    case ErrorCorrection::Quartile:
      return "Q";
    case ErrorCorrection::High:
      return "H";
  }
  return "M";
}

ErrorCorrection error_correction_from_string(const std::string &str) {
  auto upper = trim(str);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  if (upper == "L") return ErrorCorrection::Low;
  if (upper == "M") return ErrorCorrection::Medium;
  if (upper == "Q") return ErrorCorrection::Quartile;
  if (upper == "H") return ErrorCorrection::High;
  return ErrorCorrection::Medium;
}

std::string trim(const std::string &str) {
  const char *whitespace = " \t\r\n\f\v";
  auto begin = str.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = str.find_last_not_of(whitespace);
  return str.substr(begin, end - begin + 1);
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

}  // namespace qrapi
