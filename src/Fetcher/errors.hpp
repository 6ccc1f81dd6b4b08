#ifndef FETCHER_ERRORS_HPP_
#define FETCHER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace fetcher {

// 认证被拒绝或凭据缺失
class AuthError : public std::runtime_error {
 public:
  explicit AuthError(const std::string& what) : std::runtime_error(what) {}
};

// 传输过程中的网络或远端错误
class TransferError : public std::runtime_error {
 public:
  explicit TransferError(const std::string& what) : std::runtime_error(what) {}
};

// 传输报告成功但预期的归档文件不存在
class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

// 读取或写出归档成员失败
class ExtractionError : public std::runtime_error {
 public:
  explicit ExtractionError(const std::string& what)
      : std::runtime_error(what) {}
};

// 配置（凭据文件等）无法解析
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace fetcher

#endif  // FETCHER_ERRORS_HPP_
