#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <mutex>
#include <string>

// Connection settings for the destination warehouse. Loaded once at startup
// from config.json or POSTGRES_* environment variables.
class DatabaseConfig {
private:
  static std::string postgres_host_;
  static std::string postgres_db_;
  static std::string postgres_user_;
  static std::string postgres_password_;
  static std::string postgres_port_;
  static std::string postgres_sslmode_;
  static int connect_timeout_seconds_;
  static bool initialized_;
  static std::mutex configMutex_;

  static std::string escapeConnectionParam(const std::string &param);
  static void loadFromEnvUnlocked();
  static std::string buildConnectionStringUnlocked(bool maskPassword);

public:
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromEnv();
  static void setForTesting(const std::string &host, const std::string &db,
                            const std::string &user,
                            const std::string &password,
                            const std::string &port);

  static std::string getPostgresHost() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_host_;
  }
  static std::string getPostgresDB() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_db_;
  }
  static std::string getPostgresUser() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_user_;
  }
  static std::string getPostgresPassword() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_password_;
  }
  static std::string getPostgresPort() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_port_;
  }
  static std::string getPostgresSSLMode() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_sslmode_;
  }

  static std::string getPostgresConnectionString() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return buildConnectionStringUnlocked(false);
  }

  static std::string getPostgresConnectionStringForLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return buildConnectionStringUnlocked(true);
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
