#include "load/local_load_file_downloader.h"
#include "core/logger.h"
#include "load/load_error.h"
#include <atomic>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long long> downloadSequence{0};

fs::path makeDownloadDirectory(const std::string &workRoot,
                               const std::string &tableName) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::path(workRoot) /
                 (tableName + "_" + std::to_string(stamp) + "_" +
                  std::to_string(downloadSequence.fetch_add(1)));
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw LoadError(LoadStage::DOWNLOAD_LOAD_FILES,
                    "Could not create download directory " + dir.string() +
                        ": " + ec.message());
  }
  return dir;
}
} // namespace

LocalLoadFileDownloader::LocalLoadFileDownloader(const IUploadJob &uploadJob,
                                                 std::string objectStoreRoot,
                                                 std::string workRoot)
    : uploadJob_(uploadJob), objectStoreRoot_(std::move(objectStoreRoot)),
      workRoot_(workRoot.empty()
                    ? (fs::temp_directory_path() / "warehouse_loader").string()
                    : std::move(workRoot)) {}

std::vector<std::string>
LocalLoadFileDownloader::download(const LoadContext &ctx,
                                  const std::string &tableName) {
  std::vector<std::string> localPaths;
  auto refs = uploadJob_.getLoadFiles(tableName);
  if (refs.empty())
    return localPaths;

  fs::path dir = makeDownloadDirectory(workRoot_, tableName);
  size_t index = 0;
  for (const auto &ref : refs) {
    ctx.throwIfDone();

    fs::path source = fs::path(objectStoreRoot_) / ref.location;
    fs::path target =
        dir / (std::to_string(index++) + "_" + source.filename().string());

    std::error_code ec;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      std::string reason = ec.message();
      fs::remove_all(dir, ec);
      throw LoadError(LoadStage::DOWNLOAD_LOAD_FILES,
                      "Error downloading load file " + source.string() +
                          " for table " + tableName + ": " + reason);
    }
    localPaths.push_back(target.string());
  }

  Logger::debug(LogCategory::LOAD, "LocalLoadFileDownloader",
                "Downloaded " + std::to_string(localPaths.size()) +
                    " load files for table " + tableName + " into " +
                    dir.string());
  return localPaths;
}
