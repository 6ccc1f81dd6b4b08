#ifndef CONSOLE_REPORTER_HPP_
#define CONSOLE_REPORTER_HPP_

#include <mutex>
#include <ostream>
#include <string>

#include "ArchiveExpander.hpp"
#include "GrowthMonitor.hpp"

namespace fetcher {

// 下载进度刷新同一行；解压进度画一条进度条
class ConsoleReporter : public ProgressListener, public ExtractionListener {
 public:
  explicit ConsoleReporter(std::ostream& out, int barWidth = 30);

  void onProgress(const ProgressSample& sample,
                  std::optional<double> bytesPerSecond) override;
  void onMonitorError(const std::string& path,
                      const std::string& message) override;
  void onMonitorFinished(MonitorOutcome outcome) override;

  void onExtractionStarted(const std::string& archiveName,
                           std::uint64_t totalBytes,
                           std::size_t memberCount) override;
  void onMemberExtracted(const ArchiveMember& member,
                         std::uint64_t processedBytes,
                         std::uint64_t totalBytes) override;
  void onExtractionFinished(std::uint64_t totalBytes) override;

 private:
  void drawBar(std::uint64_t processed, std::uint64_t total);

  std::ostream& out_;
  int barWidth_;
  bool progressLineOpen_;
  std::mutex mutex_;
};

}  // namespace fetcher

#endif  // CONSOLE_REPORTER_HPP_
