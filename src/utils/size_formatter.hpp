#ifndef SIZE_FORMATTER_HPP_
#define SIZE_FORMATTER_HPP_

#include <string>

namespace utils {

/**
 * @brief 字节数转为可读字符串，如 1536 -> "1.50KB"
 *
 * 依次按 1024 进位 B/KB/MB/GB，仍不小于 1024 时直接以 TB 表示。
 * 负数输入未定义。
 */
std::string formatSize(double bytes, int decimalPlaces = 2);

}  // namespace utils

#endif  // SIZE_FORMATTER_HPP_
