#include "load/row_stream_decoder.h"
#include "load/load_error.h"
#include "utils/string_utils.h"
#include <filesystem>

namespace fs = std::filesystem;

RowStreamDecoder::RowStreamDecoder(const std::string &filePath,
                                   size_t expectedColumns,
                                   const std::string &tableName)
    : filePath_(filePath), expectedColumns_(expectedColumns),
      tableName_(tableName), buffer_(BUFFER_SIZE) {
  std::error_code ec;
  if (!fs::is_regular_file(filePath_, ec)) {
    throw LoadError(LoadStage::OPEN_LOAD_FILES,
                    "Error opening load file " + filePath_ + " for table " +
                        tableName_ + ": no such file");
  }
  auto size = fs::file_size(filePath_, ec);
  if (ec) {
    throw LoadError(LoadStage::OPEN_LOAD_FILES,
                    "Error opening load file " + filePath_ + ": " +
                        ec.message());
  }

  file_.reset(gzopen(filePath_.c_str(), "rb"));
  if (!file_) {
    throw LoadError(LoadStage::OPEN_LOAD_FILES,
                    "Error opening load file " + filePath_ + " for table " +
                        tableName_);
  }

  if (size == 0) {
    throw LoadError(LoadStage::READ_GZIP_LOAD_FILES,
                    "Error reading load file " + filePath_ +
                        " using gzip: unexpected EOF");
  }

  // gzdirect() only answers reliably after the first read.
  fill();
  if (gzdirect(file_.get())) {
    throw LoadError(LoadStage::READ_GZIP_LOAD_FILES,
                    "Error reading load file " + filePath_ +
                        " using gzip: invalid header");
  }
}

bool RowStreamDecoder::fill() {
  if (exhausted_)
    return false;

  int n = gzread(file_.get(), buffer_.data(),
                 static_cast<unsigned>(buffer_.size()));
  if (n < 0) {
    int errnum = 0;
    const char *message = gzerror(file_.get(), &errnum);
    throw LoadError(LoadStage::READ_GZIP_LOAD_FILES,
                    "Error reading load file " + filePath_ +
                        " using gzip: " + (message ? message : "unknown"));
  }
  bufferPos_ = 0;
  bufferLen_ = static_cast<size_t>(n);
  if (n == 0) {
    int errnum = Z_OK;
    const char *message = gzerror(file_.get(), &errnum);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
      throw LoadError(LoadStage::READ_GZIP_LOAD_FILES,
                      "Error reading load file " + filePath_ +
                          " using gzip: " + (message ? message : "unknown"));
    }
    exhausted_ = true;
    return false;
  }
  return true;
}

int RowStreamDecoder::rawChar() {
  if (bufferPos_ >= bufferLen_ && !fill())
    return END_OF_FILE;
  return static_cast<unsigned char>(buffer_[bufferPos_++]);
}

int RowStreamDecoder::peekRawChar() {
  if (bufferPos_ >= bufferLen_ && !fill())
    return END_OF_FILE;
  return static_cast<unsigned char>(buffer_[bufferPos_]);
}

// \r\n is folded into \n.
int RowStreamDecoder::readChar() {
  int c = rawChar();
  if (c == '\r' && peekRawChar() == '\n') {
    c = rawChar();
  }
  if (c == '\n')
    ++line_;
  return c;
}

void RowStreamDecoder::csvError(const std::string &reason) const {
  throw LoadError(LoadStage::READ_CSV_LOAD_FILES,
                  "Error reading CSV load file " + filePath_ + " for table " +
                      tableName_ + ": parse error on line " +
                      std::to_string(line_) + ": " + reason);
}

// Reads one field whose first character is c. Returns the terminator: ',',
// '\n' or END_OF_FILE.
int RowStreamDecoder::readField(std::string &field, int c) {
  field.clear();

  if (c != '"') {
    while (c != ',' && c != '\n' && c != END_OF_FILE) {
      if (c == '"')
        csvError("bare \" in non-quoted-field");
      field += static_cast<char>(c);
      c = readChar();
    }
    return c;
  }

  while (true) {
    c = readChar();
    if (c == END_OF_FILE)
      csvError("extraneous or missing \" in quoted-field");
    if (c != '"') {
      field += static_cast<char>(c);
      continue;
    }

    int next = readChar();
    if (next == '"') {
      field += '"';
    } else if (next == ',' || next == '\n' || next == END_OF_FILE) {
      return next;
    } else {
      csvError("extraneous or missing \" in quoted-field");
    }
  }
}

bool RowStreamDecoder::readRecord() {
  fields_.clear();

  int c = readChar();
  while (c == '\n')
    c = readChar();
  if (c == END_OF_FILE)
    return false;

  std::string field;
  while (true) {
    int terminator = readField(field, c);
    fields_.push_back(field);
    if (terminator != ',')
      return true;
    c = readChar();
  }
}

bool RowStreamDecoder::next(SqlRow &row) {
  if (!readRecord())
    return false;

  if (fields_.size() != expectedColumns_) {
    throw LoadError(
        LoadStage::CSV_COLUMN_COUNT_MISMATCH,
        "load file CSV columns for a row mismatch number found in upload "
        "schema. Columns in CSV row: " +
            std::to_string(fields_.size()) + ", Columns in upload schema of "
            "table-" + tableName_ + ": " + std::to_string(expectedColumns_) +
            ". Processed rows in csv file until mismatch: " +
            std::to_string(rowsProcessed_));
  }

  row.clear();
  row.reserve(fields_.size());
  for (auto &value : fields_) {
    if (StringUtils::isBlank(value)) {
      row.emplace_back(std::nullopt);
    } else {
      row.emplace_back(std::move(value));
    }
  }
  ++rowsProcessed_;
  return true;
}
