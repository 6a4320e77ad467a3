#ifndef LOAD_TAGS_H
#define LOAD_TAGS_H

#include <map>
#include <string>

// Telemetry dimensions attached to every load attempt. Not used for
// correctness decisions.
struct LoadTags {
  std::string workspaceId;
  std::string schemaNamespace;
  std::string destinationId;
  std::string tableName;
  std::string stage;

  std::map<std::string, std::string> toMap() const {
    std::map<std::string, std::string> tags = {
        {"workspaceId", workspaceId},
        {"namespace", schemaNamespace},
        {"destinationId", destinationId},
        {"tableName", tableName}};
    if (!stage.empty()) {
      tags["stage"] = stage;
    }
    return tags;
  }

  std::string toString() const {
    std::string result;
    for (const auto &[key, value] : toMap()) {
      if (!result.empty())
        result += " ";
      result += key + "=" + value;
    }
    return result;
  }
};

#endif
