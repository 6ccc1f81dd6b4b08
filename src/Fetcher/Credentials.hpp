#ifndef CREDENTIALS_HPP_
#define CREDENTIALS_HPP_

#include <string>

namespace fetcher {

struct Credentials {
  std::string username;
  std::string key;

  bool empty() const { return username.empty() || key.empty(); }
};

// 凭据来源，按优先级：命令行 > 环境变量 > kaggle.json
struct CredentialSources {
  std::string flagUsername;
  std::string flagKey;
  std::string envUsername;
  std::string envKey;
  std::string configPath;
};

// 读取 kaggle.json，格式 {"username": "...", "key": "..."}
// 文件无法解析或缺字段时抛出 ConfigError
Credentials loadCredentialsFile(const std::string& path);

// 所有来源都没有凭据时返回空 Credentials，由 authenticate() 报告
Credentials resolveCredentials(const CredentialSources& sources);

// $HOME/.kaggle/kaggle.json，home 为空时返回空串
std::string defaultCredentialsPath(const char* home);

}  // namespace fetcher

#endif  // CREDENTIALS_HPP_
