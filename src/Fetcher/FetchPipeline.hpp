#ifndef FETCH_PIPELINE_HPP_
#define FETCH_PIPELINE_HPP_

#include <ostream>
#include <string>

#include "ArchiveExpander.hpp"
#include "DownloadOrchestrator.hpp"
#include "GrowthMonitor.hpp"
#include "TransferClient.hpp"

namespace fetcher {

struct PipelineOptions {
  std::string resourceId;
  std::string destinationDir;
  std::string fileName;  // 为空时下载全部文件
  OrchestratorOptions orchestrator;
};

/**
 * @brief 完整流程：认证、下载、解压、删除归档、列出目录
 *
 * 认证或下载失败只打印状态并跳过解压；解压失败（ExtractionError）
 * 向上抛出，半解压的数据集不可用。
 * 返回归档是否已下载并解压。
 */
class FetchPipeline {
 public:
  FetchPipeline(TransferClient& client, ProgressListener& progress,
                ExtractionListener& extraction, std::ostream& out);

  bool run(const PipelineOptions& options);

 private:
  void expandAndRemove(const std::string& archivePath,
                       const std::string& destinationDir);

  TransferClient& client_;
  ProgressListener& progress_;
  ExtractionListener& extraction_;
  std::ostream& out_;
};

// 归档不存在时抛出 NotFoundError
void requireArchive(const TransferResult& result);

}  // namespace fetcher

#endif  // FETCH_PIPELINE_HPP_
