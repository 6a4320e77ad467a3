#ifndef ROW_STREAM_DECODER_H
#define ROW_STREAM_DECODER_H

#include "load/sql_executor.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

// Single-pass reader over one gzip-compressed, comma-delimited, header-less
// row file. Rows are produced one at a time; blank or whitespace-only fields
// come back as NULL.
//
// Failures are LoadErrors staged as load_files_opening (missing or unreadable
// file), load_files_gzip_reading (not gzip or corrupt stream),
// load_files_csv_reading (malformed quoting) or csv_column_count_mismatch.
class RowStreamDecoder {
public:
  RowStreamDecoder(const std::string &filePath, size_t expectedColumns,
                   const std::string &tableName);

  RowStreamDecoder(const RowStreamDecoder &) = delete;
  RowStreamDecoder &operator=(const RowStreamDecoder &) = delete;

  // Returns false once the file is exhausted.
  bool next(SqlRow &row);

  size_t rowsProcessed() const { return rowsProcessed_; }
  const std::string &filePath() const { return filePath_; }

private:
  struct GzCloser {
    void operator()(gzFile_s *file) const {
      if (file)
        gzclose(file);
    }
  };

  static constexpr int END_OF_FILE = -1;
  static constexpr size_t BUFFER_SIZE = 64 * 1024;

  std::string filePath_;
  size_t expectedColumns_;
  std::string tableName_;
  std::unique_ptr<gzFile_s, GzCloser> file_;
  std::vector<char> buffer_;
  size_t bufferPos_ = 0;
  size_t bufferLen_ = 0;
  bool exhausted_ = false;
  size_t line_ = 1;
  size_t rowsProcessed_ = 0;
  std::vector<std::string> fields_;

  bool fill();
  int rawChar();
  int peekRawChar();
  int readChar();
  int readField(std::string &field, int c);
  bool readRecord();
  [[noreturn]] void csvError(const std::string &reason) const;
};

#endif
