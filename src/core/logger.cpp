#include "core/logger.h"
#include <algorithm>
#include <cctype>

// Static member initialization for Logger. fileWriter_ is optional and only
// created when initialize() receives a log file path; console output goes to
// stderr so stdout stays free for command results.
std::unique_ptr<FileLogWriter> Logger::fileWriter_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::showThreadId = false;
bool Logger::consoleEnabled = true;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

// Sets the logger configuration to default values: INFO level, console on,
// no thread ids.
void Logger::setDefaultConfig() {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = LogLevel::INFO;
  showThreadId = false;
  consoleEnabled = true;
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts "DEBUG", "INFO", "WARN"/"WARNING", "ERROR", "FATAL"/"CRITICAL" in
// any case. Unknown or empty strings leave the current level unchanged.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

void Logger::setShowThreadId(bool enabled) {
  std::lock_guard<std::mutex> lock(configMutex);
  showThreadId = enabled;
}

void Logger::setConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(configMutex);
  consoleEnabled = enabled;
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}

// Initializes the Logger. When logFilePath is non-empty a rotating file writer
// is attached in addition to stderr. A file that cannot be opened is reported
// on stderr and logging continues on the console only.
void Logger::initialize(const std::string &logFilePath) {
  std::lock_guard<std::mutex> lock(logMutex);

  if (logFilePath.empty()) {
    fileWriter_.reset();
    return;
  }

  fileWriter_ = std::make_unique<FileLogWriter>(logFilePath);
  if (!fileWriter_->isOpen()) {
    std::cerr << "Warning: could not open log file '" << logFilePath
              << "'. Logging to stderr only." << std::endl;
    fileWriter_.reset();
  }
}
