#include "DownloadOrchestrator.hpp"

#include <future>

#include "cancellation_token.hpp"
#include "logger.hpp"

namespace fetcher {

namespace {

// 有界等待，超时后取消并回收线程，不留下游离的监控线程
MonitorOutcome stopMonitor(std::future<MonitorOutcome>& monitor,
                           utils::CancellationToken& token,
                           std::chrono::milliseconds timeout) {
  if (monitor.wait_for(timeout) == std::future_status::timeout) {
    LOG(WARN) << "Progress monitor still running after " << timeout.count()
              << "ms, cancelling";
    token.cancel();
  }
  return monitor.get();
}

}  // namespace

DownloadOrchestrator::DownloadOrchestrator(ProgressListener& listener,
                                           std::ostream& out,
                                           OrchestratorOptions options)
    : listener_(listener), out_(out), options_(options) {}

TransferResult DownloadOrchestrator::downloadAll(
    TransferClient& client, const std::string& resourceId,
    const std::string& destinationDir) {
  out_ << "\n🚀 Starting download of all files from " << resourceId << "..."
       << std::endl;
  std::string expected = client.archivePathFor(resourceId, destinationDir);
  return runMonitored(expected, [&client, &resourceId, &destinationDir]() {
    return client.fetchAll(resourceId, destinationDir);
  });
}

TransferResult DownloadOrchestrator::downloadOne(
    TransferClient& client, const std::string& resourceId,
    const std::string& fileName, const std::string& destinationDir) {
  out_ << "\n🚀 Starting download of " << fileName << "..." << std::endl;
  std::string expected = client.filePathFor(fileName, destinationDir);
  return runMonitored(
      expected, [&client, &resourceId, &fileName, &destinationDir]() {
        return client.fetchFile(resourceId, fileName, destinationDir);
      });
}

TransferResult DownloadOrchestrator::runMonitored(
    const std::string& expectedPath,
    const std::function<std::string()>& transfer) {
  utils::CancellationToken token;
  GrowthMonitor monitor(listener_, options_.monitor);
  std::future<MonitorOutcome> monitorTask =
      std::async(std::launch::async, [&monitor, &token, &expectedPath]() {
        return monitor.run(expectedPath, token);
      });

  std::string actualPath;
  try {
    actualPath = transfer();
  } catch (const std::exception& e) {
    // 包括 AuthError：认证被拒同样只是一次失败的下载
    token.cancel();
    stopMonitor(monitorTask, token, options_.joinTimeout);
    LOG(ERROR) << "Transfer of " << expectedPath << " failed: " << e.what();
    out_ << "\n❌ Download failed: " << e.what() << std::endl;
    return TransferResult();
  } catch (...) {
    // 未知异常原样抛出，但先回收监控线程
    token.cancel();
    stopMonitor(monitorTask, token, options_.joinTimeout);
    LOG(ERROR) << "Transfer of " << expectedPath
               << " failed with an unknown exception";
    throw;
  }

  MonitorOutcome outcome =
      stopMonitor(monitorTask, token, options_.joinTimeout);
  LOG(INFO) << "Transfer returned " << actualPath << ", monitor "
            << toString(outcome);
  if (actualPath != expectedPath) {
    LOG(WARN) << "Transfer wrote " << actualPath << " but " << expectedPath
              << " was monitored";
  }

  TransferResult result;
  result.archivePath = actualPath;
  result.succeeded = true;
  return result;
}

}  // namespace fetcher
