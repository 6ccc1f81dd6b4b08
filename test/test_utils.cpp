#include "test_utils.hpp"

#include <minizip/zip.h>
#include <unistd.h>

#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fetcher::test {

namespace {
std::atomic<int> dir_counter{0};
}  // namespace

TempDir::TempDir() {
  std::ostringstream name;
  name << "dataset_fetcher_test_" << ::getpid() << "_" << dir_counter++;
  path_ = std::filesystem::temp_directory_path() / name.str();
  std::filesystem::remove_all(path_);
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::string TempDir::file(const std::string& name) const {
  return (path_ / name).string();
}

void writeZip(const std::string& path, const std::vector<ZipEntry>& entries,
              bool compress) {
  zipFile zf = zipOpen64(path.c_str(), APPEND_STATUS_CREATE);
  if (zf == nullptr) throw std::runtime_error("zipOpen64 failed: " + path);
  for (const auto& entry : entries) {
    zip_fileinfo info = {};
    int rc = zipOpenNewFileInZip64(zf, entry.name.c_str(), &info, nullptr, 0,
                                   nullptr, 0, nullptr,
                                   compress ? Z_DEFLATED : 0,
                                   compress ? Z_DEFAULT_COMPRESSION : 0, 0);
    if (rc != ZIP_OK) {
      zipClose(zf, nullptr);
      throw std::runtime_error("zipOpenNewFileInZip64 failed: " + entry.name);
    }
    if (!entry.data.empty()) {
      rc = zipWriteInFileInZip(zf, entry.data.data(),
                               static_cast<unsigned>(entry.data.size()));
    }
    int closeRc = zipCloseFileInZip(zf);
    if (rc != ZIP_OK || closeRc != ZIP_OK) {
      zipClose(zf, nullptr);
      throw std::runtime_error("zipWriteInFileInZip failed: " + entry.name);
    }
  }
  if (zipClose(zf, nullptr) != ZIP_OK) {
    throw std::runtime_error("zipClose failed: " + path);
  }
}

std::string makeContent(std::size_t size, char seed) {
  std::string data(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<char>(seed + (i * 31 + i / 7) % 61);
  }
  return data;
}

std::string readFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(ifs),
                     std::istreambuf_iterator<char>());
}

void writeFile(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

void appendFile(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::app);
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

}  // namespace fetcher::test
