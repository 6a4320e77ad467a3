#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

// Append-only log file that rolls over to name.1 .. name.N once it reaches
// maxFileSize bytes. The size is tracked from the bytes written, starting at
// the size the file already had when opened.
class FileLogWriter {
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  size_t bytesWritten_;
  mutable std::mutex mutex_;

  void rotateUnlocked();

public:
  explicit FileLogWriter(const std::string &fileName,
                         size_t maxFileSize = 10 * 1024 * 1024,
                         int maxBackupFiles = 5);
  ~FileLogWriter() { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const std::string &line);
  void flush();
  void close();
  bool isOpen() const;
};

#endif
