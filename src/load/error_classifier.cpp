#include "load/error_classifier.h"

namespace {
JobError makeError(JobErrorType type, const std::string &pattern) {
  return JobError{type, pattern, std::regex(pattern, std::regex::ECMAScript)};
}

// Each pattern accepts both libpq server/client wording and the "pq: "
// prefixed wording of drivers that wrap the same server messages.
std::vector<JobError> buildMappings() {
  return {
      makeError(JobErrorType::RESOURCE_NOT_FOUND,
                R"((dial tcp: lookup .*: no such host|could not translate host name .* to address))"),
      makeError(JobErrorType::PERMISSION,
                R"((dial tcp .* connect: connection refused|connection to server .*failed: Connection refused|could not connect to server: Connection refused))"),
      makeError(JobErrorType::RESOURCE_NOT_FOUND,
                R"(database .* does not exist)"),
      makeError(JobErrorType::RESOURCE_NOT_FOUND,
                R"(the database system is starting up)"),
      makeError(JobErrorType::RESOURCE_NOT_FOUND,
                R"(the database system is shutting down)"),
      makeError(JobErrorType::RESOURCE_NOT_FOUND,
                R"(relation .* does not exist)"),
      makeError(JobErrorType::RESOURCE_NOT_FOUND,
                R"(cannot set transaction read-write mode during recovery)"),
      makeError(JobErrorType::COLUMN_COUNT,
                R"(tables can have at most 1600 columns)"),
      makeError(JobErrorType::PERMISSION,
                R"(password authentication failed for user)"),
      makeError(JobErrorType::PERMISSION, R"(permission denied)"),
  };
}
} // namespace

const std::vector<JobError> &ErrorClassifier::errorMappings() {
  static const std::vector<JobError> mappings = buildMappings();
  return mappings;
}

JobErrorType ErrorClassifier::classify(const std::string &errorText) {
  for (const auto &mapping : errorMappings()) {
    if (std::regex_search(errorText, mapping.format)) {
      return mapping.type;
    }
  }
  return JobErrorType::UNKNOWN;
}

std::string ErrorClassifier::typeToString(JobErrorType type) {
  switch (type) {
  case JobErrorType::RESOURCE_NOT_FOUND:
    return "resource_not_found";
  case JobErrorType::PERMISSION:
    return "permission_error";
  case JobErrorType::COLUMN_COUNT:
    return "column_count";
  case JobErrorType::UNKNOWN:
  default:
    return "unknown";
  }
}
