#ifndef DOWNLOAD_ORCHESTRATOR_HPP_
#define DOWNLOAD_ORCHESTRATOR_HPP_

#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "GrowthMonitor.hpp"
#include "TransferClient.hpp"

namespace fetcher {

struct TransferResult {
  std::optional<std::string> archivePath;
  bool succeeded = false;
};

struct OrchestratorOptions {
  MonitorOptions monitor;
  // 传输结束后等待监控线程自行退出的上限，超时则取消
  std::chrono::milliseconds joinTimeout;
  OrchestratorOptions() : joinTimeout(std::chrono::milliseconds(2000)) {}
};

// 在后台线程监控输出文件的同时执行阻塞的传输调用
class DownloadOrchestrator {
 public:
  DownloadOrchestrator(ProgressListener& listener, std::ostream& out,
                       OrchestratorOptions options = OrchestratorOptions());

  TransferResult downloadAll(TransferClient& client,
                             const std::string& resourceId,
                             const std::string& destinationDir);
  TransferResult downloadOne(TransferClient& client,
                             const std::string& resourceId,
                             const std::string& fileName,
                             const std::string& destinationDir);

 private:
  TransferResult runMonitored(const std::string& expectedPath,
                              const std::function<std::string()>& transfer);

  ProgressListener& listener_;
  std::ostream& out_;
  OrchestratorOptions options_;
};

}  // namespace fetcher

#endif  // DOWNLOAD_ORCHESTRATOR_HPP_
