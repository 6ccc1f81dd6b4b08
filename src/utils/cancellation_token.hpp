#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace utils {

// 协作式取消标记：后台线程在每次休眠时检查，cancel() 立即唤醒所有等待者
class CancellationToken {
 public:
  CancellationToken();
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel();
  bool isCancelled() const;

  // 等待 timeout，期间被取消则提前返回 true
  bool waitFor(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_;
};

}  // namespace utils
