#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline bool isBlank(std::string_view str) {
  return std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::vector<std::string> &values,
                     const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

inline std::string join(const std::vector<std::string> &parts,
                        std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += separator;
    result += parts[i];
  }
  return result;
}

// Double-quotes a SQL identifier, doubling embedded quotes.
inline std::string quoteIdentifier(std::string_view identifier) {
  std::string quoted = "\"";
  for (char c : identifier) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

inline std::string qualifiedName(std::string_view schema,
                                 std::string_view table) {
  return quoteIdentifier(schema) + "." + quoteIdentifier(table);
}

inline std::string quoteAndJoin(const std::vector<std::string> &identifiers) {
  std::vector<std::string> quoted;
  quoted.reserve(identifiers.size());
  for (const auto &identifier : identifiers)
    quoted.push_back(quoteIdentifier(identifier));
  return join(quoted, ",");
}

// Escapes LIKE wildcards so the value matches literally.
inline std::string escapeLikePattern(std::string_view value) {
  std::string escaped;
  for (char c : value) {
    if (c == '_' || c == '%' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  return escaped;
}

} // namespace StringUtils

#endif
