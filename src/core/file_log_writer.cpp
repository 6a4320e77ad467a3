#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles), bytesWritten_(0) {
  std::error_code ec;
  auto existing = std::filesystem::file_size(fileName_, ec);
  if (!ec) {
    bytesWritten_ = static_cast<size_t>(existing);
  }
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  if (bytesWritten_ >= maxFileSize_) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << line << '\n';
  bytesWritten_ += line.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Shifts name.(i) to name.(i+1), dropping the oldest backup, then reopens a
// fresh file under the original name.
void FileLogWriter::rotateUnlocked() {
  if (file_.is_open()) {
    file_.close();
  }

  std::error_code ec;
  std::filesystem::remove(fileName_ + "." + std::to_string(maxBackupFiles_),
                          ec);
  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string oldFile = fileName_ + "." + std::to_string(i);
    if (std::filesystem::exists(oldFile, ec)) {
      std::filesystem::rename(oldFile,
                              fileName_ + "." + std::to_string(i + 1), ec);
    }
  }

  if (std::filesystem::exists(fileName_, ec)) {
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  }

  file_.open(fileName_, std::ios::app);
  bytesWritten_ = 0;
}
