#include "load/load_stats.h"
#include "core/logger.h"

std::map<std::pair<std::string, LoadStats::TagSet>, long long>
    LoadStats::counters_;
std::mutex LoadStats::mutex_;

void LoadStats::count(const std::string &name, const TagSet &tags,
                      long long delta) {
  long long value;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    value = (counters_[{name, tags}] += delta);
  }

  std::string tagString;
  for (const auto &[key, tagValue] : tags) {
    tagString += " " + key + "=" + tagValue;
  }
  Logger::debug(LogCategory::METRICS, "LoadStats",
                name + tagString + " -> " + std::to_string(value));
}

long long LoadStats::get(const std::string &name, const TagSet &tags) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find({name, tags});
  return it == counters_.end() ? 0 : it->second;
}

long long LoadStats::total(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  long long sum = 0;
  for (const auto &[key, value] : counters_) {
    if (key.first == name)
      sum += value;
  }
  return sum;
}

void LoadStats::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
}
