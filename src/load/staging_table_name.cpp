#include "load/staging_table_name.h"
#include "utils/string_utils.h"
#include <atomic>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace {
std::mutex rngMutex;
std::atomic<unsigned long long> sequence{0};

std::string randomSuffix() {
  static std::mt19937_64 rng{std::random_device{}()};
  unsigned long long value;
  {
    std::lock_guard<std::mutex> lock(rngMutex);
    value = rng();
  }
  // Mixing in a process-wide sequence keeps two names generated in the same
  // process distinct even if the generator repeats.
  value ^= (sequence.fetch_add(1) + 1) * 0x9E3779B97F4A7C15ULL;

  std::ostringstream ss;
  ss << std::hex << std::setw(WarehouseDefaults::STAGING_SUFFIX_LENGTH)
     << std::setfill('0') << value;
  return ss.str();
}
} // namespace

namespace StagingTableName {

std::string prefix(const std::string &provider) {
  return std::string(WarehouseDefaults::STAGING_TABLE_PREFIX) +
         StringUtils::toLower(provider) + "_";
}

std::string generate(const std::string &provider, const std::string &tableName,
                     size_t limit) {
  std::string head = prefix(provider);
  size_t fixedLength = head.size() + 1 + WarehouseDefaults::STAGING_SUFFIX_LENGTH;
  if (fixedLength >= limit) {
    throw std::invalid_argument("Staging table name limit " +
                                std::to_string(limit) +
                                " is too small for provider " + provider);
  }

  std::string body = tableName.substr(0, limit - fixedLength);
  return head + body + "_" + randomSuffix();
}

bool isStagingTable(const std::string &provider, const std::string &name) {
  return StringUtils::startsWith(name, prefix(provider));
}

} // namespace StagingTableName
