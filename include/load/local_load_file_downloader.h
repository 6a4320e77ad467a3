#ifndef LOCAL_LOAD_FILE_DOWNLOADER_H
#define LOCAL_LOAD_FILE_DOWNLOADER_H

#include "load/load_file_source.h"
#include <string>
#include <vector>

// Object storage mounted as a local directory. Each file is copied into a
// fresh per-call directory under workRoot so concurrent loads of the same
// table never share local files.
class LocalLoadFileDownloader : public ILoadFileDownloader {
public:
  LocalLoadFileDownloader(const IUploadJob &uploadJob,
                          std::string objectStoreRoot, std::string workRoot);

  // Throws LoadError staged load_files_download.
  std::vector<std::string> download(const LoadContext &ctx,
                                    const std::string &tableName) override;

private:
  const IUploadJob &uploadJob_;
  std::string objectStoreRoot_;
  std::string workRoot_;
};

#endif
