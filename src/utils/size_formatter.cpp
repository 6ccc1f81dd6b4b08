#include "size_formatter.hpp"

#include <iomanip>
#include <sstream>

namespace utils {

namespace {
const char* const kUnits[] = {"B", "KB", "MB", "GB"};
}  // namespace

std::string formatSize(double bytes, int decimalPlaces) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(decimalPlaces);
  for (const char* unit : kUnits) {
    if (bytes < 1024) {
      oss << bytes << unit;
      return oss.str();
    }
    bytes /= 1024;
  }
  oss << bytes << "TB";
  return oss.str();
}

}  // namespace utils
