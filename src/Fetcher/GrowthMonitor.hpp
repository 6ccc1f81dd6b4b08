#ifndef GROWTH_MONITOR_HPP_
#define GROWTH_MONITOR_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "cancellation_token.hpp"

namespace fetcher {

struct ProgressSample {
  std::uint64_t byteCount;
  double timestampSeconds;  // 距监控开始的秒数
};

enum class MonitorOutcome {
  kNotStarted,  // 目标文件始终不存在
  kStalled,     // 连续两次大小不变
  kVanished,    // 监控中途文件被删除或改名
  kShrunk,      // 文件变小，不再是追加写
  kCancelled,
  kFailed,      // 其它读取错误
};

const char* toString(MonitorOutcome outcome);

class ProgressListener {
 public:
  virtual ~ProgressListener() = default;

  // bytesPerSecond 为空表示耗时为 0，速度尚在计算
  virtual void onProgress(const ProgressSample& sample,
                          std::optional<double> bytesPerSecond) = 0;
  virtual void onMonitorError(const std::string& path,
                              const std::string& message) = 0;
  // 仅在目标文件出现、监控真正开始后调用
  virtual void onMonitorFinished(MonitorOutcome outcome) = 0;
};

struct MonitorOptions {
  std::chrono::milliseconds pollInterval;
  // 目标文件尚未创建时最多等待多久；0 表示立即返回
  std::chrono::milliseconds startGrace;
  MonitorOptions()
      : pollInterval(std::chrono::milliseconds(500)),
        startGrace(std::chrono::milliseconds(0)) {}
};

/**
 * @brief 通过轮询文件大小推断下载进度
 *
 * 下载调用没有进度回调，只能从外部观察输出文件的增长。大小连续两次
 * 不变（间隔 2 x pollInterval）即认为写入已停止。这只是给界面用的
 * 启发式判断：网络停顿超过该间隔同样会结束监控，下载是否成功以
 * 传输调用的结果为准。
 *
 * run() 在调用线程上阻塞执行，每次休眠都可被 token 打断。
 */
class GrowthMonitor {
 public:
  GrowthMonitor(ProgressListener& listener,
                MonitorOptions options = MonitorOptions());

  MonitorOutcome run(const std::string& path,
                     const utils::CancellationToken& token);

 private:
  struct MonitorState {
    std::string targetPath;
    std::chrono::milliseconds pollInterval;
    std::uint64_t lastSize;
    std::chrono::steady_clock::time_point startTime;
  };

  MonitorOutcome poll(MonitorState& state,
                      const utils::CancellationToken& token);
  bool waitForCreation(const std::string& path,
                       const utils::CancellationToken& token);

  ProgressListener& listener_;
  MonitorOptions options_;
};

}  // namespace fetcher

#endif  // GROWTH_MONITOR_HPP_
