#ifndef LOAD_STATS_H
#define LOAD_STATS_H

#include <map>
#include <mutex>
#include <string>

// Process-wide counters keyed by metric name and tag set.
class LoadStats {
private:
  using TagSet = std::map<std::string, std::string>;

  static std::map<std::pair<std::string, TagSet>, long long> counters_;
  static std::mutex mutex_;

public:
  static void count(const std::string &name, const TagSet &tags,
                    long long delta = 1);
  static long long get(const std::string &name, const TagSet &tags);
  static long long total(const std::string &name);
  static void reset();
};

#endif
