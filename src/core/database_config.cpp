#include "core/database_config.h"
#include "core/logger.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Defaults used when neither config.json nor the environment provide a value.
std::string DatabaseConfig::postgres_host_ = "localhost";
std::string DatabaseConfig::postgres_db_ = "warehouse";
std::string DatabaseConfig::postgres_user_ = "postgres";
std::string DatabaseConfig::postgres_password_ = "";
std::string DatabaseConfig::postgres_port_ = "5432";
std::string DatabaseConfig::postgres_sslmode_ = "disable";
int DatabaseConfig::connect_timeout_seconds_ = 0;
bool DatabaseConfig::initialized_ = false;
std::mutex DatabaseConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::atoi(portStr.c_str());
  if (portNum > 0 && portNum <= 65535) {
    targetPort = portStr;
    return true;
  }
  return false;
}

bool isKnownSSLMode(const std::string &mode) {
  return mode == "disable" || mode == "allow" || mode == "prefer" ||
         mode == "require" || mode == "verify-ca" || mode == "verify-full";
}
} // namespace

// Quotes a libpq keyword/value parameter when it contains characters that
// would otherwise break the key=value syntax.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  if (!param.empty() &&
      param.find_first_of(" '\\") == std::string::npos) {
    return param;
  }

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

std::string DatabaseConfig::buildConnectionStringUnlocked(bool maskPassword) {
  std::string connStr =
      "host=" + escapeConnectionParam(postgres_host_) +
      " dbname=" + escapeConnectionParam(postgres_db_) +
      " user=" + escapeConnectionParam(postgres_user_) + " password=" +
      (maskPassword ? std::string("***")
                    : escapeConnectionParam(postgres_password_)) +
      " port=" + escapeConnectionParam(postgres_port_) +
      " sslmode=" + escapeConnectionParam(postgres_sslmode_);
  if (connect_timeout_seconds_ > 0) {
    connStr += " connect_timeout=" + std::to_string(connect_timeout_seconds_);
  }
  return connStr;
}

// Loads warehouse credentials from the "database.postgres" object of a JSON
// config file (host, port, database, user, password, sslmode,
// connect_timeout). Missing keys keep their defaults. An unreadable or
// malformed file falls back to the environment.
void DatabaseConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
    loadFromEnv();
    return;
  }

  try {
    json config;
    configFile >> config;

    std::lock_guard<std::mutex> lock(configMutex_);
    if (config.contains("database") &&
        config["database"].contains("postgres")) {
      const auto &pgConfig = config["database"]["postgres"];

      if (pgConfig.contains("host")) {
        std::string host = pgConfig["host"].get<std::string>();
        if (!host.empty())
          postgres_host_ = host;
      }
      if (pgConfig.contains("port")) {
        std::string port = pgConfig["port"].is_number()
                               ? std::to_string(pgConfig["port"].get<int>())
                               : pgConfig["port"].get<std::string>();
        if (!validateAndSetPort(port, postgres_port_) && !port.empty()) {
          Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                          "Invalid port number: " + port +
                              ", using default: " + postgres_port_);
        }
      }
      if (pgConfig.contains("database")) {
        std::string db = pgConfig["database"].get<std::string>();
        if (!db.empty())
          postgres_db_ = db;
      }
      if (pgConfig.contains("user")) {
        std::string user = pgConfig["user"].get<std::string>();
        if (!user.empty())
          postgres_user_ = user;
      }
      if (pgConfig.contains("password"))
        postgres_password_ = pgConfig["password"].get<std::string>();
      if (pgConfig.contains("sslmode")) {
        std::string mode = pgConfig["sslmode"].get<std::string>();
        if (isKnownSSLMode(mode)) {
          postgres_sslmode_ = mode;
        } else {
          Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                          "Unknown sslmode '" + mode + "', keeping " +
                              postgres_sslmode_);
        }
      }
      if (pgConfig.contains("connect_timeout")) {
        int timeout = pgConfig["connect_timeout"].get<int>();
        if (timeout >= 0)
          connect_timeout_seconds_ = timeout;
      }
    }

    initialized_ = true;
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "DatabaseConfig",
                  "Error loading config from file: " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnv();
  }
}

void DatabaseConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

// Reads POSTGRES_HOST, POSTGRES_PORT, POSTGRES_DB, POSTGRES_USER,
// POSTGRES_PASSWORD and POSTGRES_SSLMODE. Unset variables keep the current
// value.
void DatabaseConfig::loadFromEnvUnlocked() {
  const char *host = std::getenv("POSTGRES_HOST");
  const char *port = std::getenv("POSTGRES_PORT");
  const char *db = std::getenv("POSTGRES_DB");
  const char *user = std::getenv("POSTGRES_USER");
  const char *password = std::getenv("POSTGRES_PASSWORD");
  const char *sslmode = std::getenv("POSTGRES_SSLMODE");

  if (host && strlen(host) > 0)
    postgres_host_ = host;
  if (port && strlen(port) > 0) {
    std::string portStr(port);
    if (!validateAndSetPort(portStr, postgres_port_)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid port number: " + portStr +
                          ", using default: " + postgres_port_);
    }
  }
  if (db && strlen(db) > 0)
    postgres_db_ = db;
  if (user && strlen(user) > 0)
    postgres_user_ = user;
  if (password)
    postgres_password_ = password;
  if (sslmode && isKnownSSLMode(sslmode))
    postgres_sslmode_ = sslmode;

  if (postgres_password_.empty()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "POSTGRES_PASSWORD not set in config.json or environment. "
                    "Warehouse connections may fail.");
  }

  initialized_ = true;
}

void DatabaseConfig::setForTesting(const std::string &host,
                                   const std::string &db,
                                   const std::string &user,
                                   const std::string &password,
                                   const std::string &port) {
  std::lock_guard<std::mutex> lock(configMutex_);
  postgres_host_ = host;
  postgres_db_ = db;
  postgres_user_ = user;
  postgres_password_ = password;
  postgres_port_ = port;
  initialized_ = true;
}
