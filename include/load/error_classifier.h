#ifndef ERROR_CLASSIFIER_H
#define ERROR_CLASSIFIER_H

#include <regex>
#include <string>
#include <vector>

enum class JobErrorType {
  UNKNOWN,
  RESOURCE_NOT_FOUND,
  PERMISSION,
  COLUMN_COUNT
};

struct JobError {
  JobErrorType type;
  std::string pattern;
  std::regex format;
};

// Ordered failure-text classifier. Entries overlap, so the first match wins
// and the order of errorMappings() must not change.
class ErrorClassifier {
public:
  static const std::vector<JobError> &errorMappings();
  static JobErrorType classify(const std::string &errorText);
  static std::string typeToString(JobErrorType type);
};

#endif
