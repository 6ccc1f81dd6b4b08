#ifndef KAGGLE_CLIENT_HPP_
#define KAGGLE_CLIENT_HPP_

#include <string>
#include <vector>

#include "Credentials.hpp"
#include "TransferClient.hpp"

namespace fetcher {

struct KaggleClientOptions {
  std::string apiBaseUrl;
  std::string userAgent;
  long connectTimeoutSeconds;
  KaggleClientOptions()
      : apiBaseUrl("https://www.kaggle.com/api/v1"),
        userAgent("dataset-fetcher/1.0"),
        connectTimeoutSeconds(30) {}
};

// Kaggle 竞赛数据下载（libcurl），输出命名为 <目录>/<名称>.zip
class KaggleClient : public TransferClient {
 public:
  explicit KaggleClient(Credentials credentials,
                        KaggleClientOptions options = KaggleClientOptions());
  ~KaggleClient() override;

  void authenticate() override;

  std::string archivePathFor(const std::string& resourceId,
                             const std::string& destinationDir) const override;
  std::string filePathFor(const std::string& fileName,
                          const std::string& destinationDir) const override;

  std::string fetchAll(const std::string& resourceId,
                       const std::string& destinationDir) override;
  std::string fetchFile(const std::string& resourceId,
                        const std::string& fileName,
                        const std::string& destinationDir) override;

 private:
  // endpoint 后依次拼接转义后的路径参数，下载到 outputPath
  void download(const std::string& endpoint,
                const std::vector<std::string>& pathParams,
                const std::string& outputPath);

  Credentials credentials_;
  KaggleClientOptions options_;
  bool authenticated_;
};

}  // namespace fetcher

#endif  // KAGGLE_CLIENT_HPP_
