#include "KaggleClient.hpp"

#include <curl/curl.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "logger.hpp"

namespace fetcher {

namespace {

struct CurlDeleter {
  void operator()(CURL* curl) const {
    if (curl) curl_easy_cleanup(curl);
  }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

// 下载目标文件在收到第一段成功响应体时才创建，
// 连接/重定向/TLS 握手期间磁盘上不存在该文件
struct ArchiveSink {
  CURL* curl;
  std::string path;
  std::ofstream file;
  bool opened;
  bool openFailed;
};

// 写入回调，写失败时返回 0 让 curl 以 CURLE_WRITE_ERROR 中止
size_t write_data(void* ptr, size_t size, size_t nmemb, void* userdata) {
  ArchiveSink* sink = static_cast<ArchiveSink*>(userdata);
  size_t bytes = size * nmemb;
  if (!sink->opened) {
    long status = 0;
    curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &status);
    // 错误响应体不是归档，丢弃
    if (status >= 400) return bytes;
    sink->file.open(sink->path, std::ios::binary | std::ios::trunc);
    if (!sink->file) {
      sink->openFailed = true;
      return 0;
    }
    sink->opened = true;
  }
  sink->file.write(static_cast<char*>(ptr), bytes);
  return sink->file.good() ? bytes : 0;
}

std::string escape(CURL* curl, const std::string& text) {
  char* escaped =
      curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
  if (escaped == nullptr) {
    throw TransferError("Failed to URL-encode: " + text);
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

}  // namespace

KaggleClient::KaggleClient(Credentials credentials, KaggleClientOptions options)
    : credentials_(std::move(credentials)),
      options_(std::move(options)),
      authenticated_(false) {}

KaggleClient::~KaggleClient() {}

void KaggleClient::authenticate() {
  if (credentials_.empty()) {
    throw AuthError(
        "Missing Kaggle credentials: set --kaggle_username/--kaggle_key, "
        "KAGGLE_USERNAME/KAGGLE_KEY or ~/.kaggle/kaggle.json");
  }
  authenticated_ = true;
  LOG(INFO) << "Authenticated as " << credentials_.username;
}

std::string KaggleClient::archivePathFor(
    const std::string& resourceId, const std::string& destinationDir) const {
  return (std::filesystem::path(destinationDir) / (resourceId + ".zip"))
      .string();
}

std::string KaggleClient::filePathFor(const std::string& fileName,
                                      const std::string& destinationDir) const {
  return (std::filesystem::path(destinationDir) / (fileName + ".zip")).string();
}

std::string KaggleClient::fetchAll(const std::string& resourceId,
                                   const std::string& destinationDir) {
  std::string output = archivePathFor(resourceId, destinationDir);
  download("/competitions/data/download-all", {resourceId}, output);
  return output;
}

std::string KaggleClient::fetchFile(const std::string& resourceId,
                                    const std::string& fileName,
                                    const std::string& destinationDir) {
  std::string output = filePathFor(fileName, destinationDir);
  download("/competitions/data/download", {resourceId, fileName}, output);
  return output;
}

void KaggleClient::download(const std::string& endpoint,
                            const std::vector<std::string>& pathParams,
                            const std::string& outputPath) {
  if (!authenticated_) {
    throw AuthError("Client is not authenticated");
  }

  CurlHandle curl(curl_easy_init());
  if (!curl) throw TransferError("curl_easy_init failed");

  std::string url = options_.apiBaseUrl + endpoint;
  for (const auto& param : pathParams) {
    url += "/" + escape(curl.get(), param);
  }

  ArchiveSink sink{curl.get(), outputPath, std::ofstream(), false, false};
  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
  curl_easy_setopt(curl.get(), CURLOPT_USERNAME, credentials_.username.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, credentials_.key.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   options_.connectTimeoutSeconds);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

  LOG(INFO) << "GET " << url << " -> " << outputPath;
  CURLcode res = curl_easy_perform(curl.get());
  if (sink.opened) sink.file.close();
  if (sink.openFailed) {
    LOG(ERROR) << "Failed to open output file: " << outputPath;
    throw TransferError("Failed to open output file: " + outputPath);
  }
  if (res != CURLE_OK) {
    LOG(ERROR) << "Transfer failed: " << curl_easy_strerror(res) << " "
               << errbuf;
    throw TransferError(errbuf[0] != '\0' ? std::string(errbuf)
                                          : curl_easy_strerror(res));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status == 401 || status == 403) {
    throw AuthError("Kaggle rejected credentials (HTTP " +
                    std::to_string(status) + ")");
  }
  if (status >= 400) {
    throw TransferError("HTTP " + std::to_string(status) + " from " + url);
  }
  if (sink.opened && !sink.file) {
    throw TransferError("Failed to write output file: " + outputPath);
  }
  if (!sink.opened) {
    LOG(WARN) << "Empty response body from " << url << ", nothing written";
  }
  LOG(INFO) << "Transfer finished with HTTP " << status;
}

}  // namespace fetcher
