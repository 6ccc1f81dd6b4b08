#ifndef TRANSFER_CLIENT_HPP_
#define TRANSFER_CLIENT_HPP_

#include <string>

namespace fetcher {

/**
 * @brief 数据源客户端接口
 *
 * fetch 调用是阻塞且不透明的，没有进度回调；调用方只能通过观察
 * archivePathFor()/filePathFor() 给出的输出路径来推断进度。
 * fetch 返回实际写出的路径，调用方以返回值为准。
 */
class TransferClient {
 public:
  virtual ~TransferClient() = default;

  // 凭据缺失或被拒绝时抛出 AuthError
  virtual void authenticate() = 0;

  virtual std::string archivePathFor(
      const std::string& resourceId,
      const std::string& destinationDir) const = 0;
  virtual std::string filePathFor(const std::string& fileName,
                                  const std::string& destinationDir) const = 0;

  // 下载资源的全部文件，失败时抛出 TransferError（401/403 为 AuthError）
  virtual std::string fetchAll(const std::string& resourceId,
                               const std::string& destinationDir) = 0;
  virtual std::string fetchFile(const std::string& resourceId,
                                const std::string& fileName,
                                const std::string& destinationDir) = 0;
};

}  // namespace fetcher

#endif  // TRANSFER_CLIENT_HPP_
