#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Model Settings
constexpr const char *MODEL_COEFFICIENTS_PATH = "coefficients_path";
constexpr const char *MODEL_LOW_RISK_THRESHOLD = "low_risk_threshold";
constexpr const char *MODEL_HIGH_RISK_THRESHOLD = "high_risk_threshold";
constexpr const char *MODEL_REJECT_UNKNOWN_FIELDS = "reject_unknown_fields";

// Server Settings
constexpr const char *SERVER_ENABLED = "enabled";
constexpr const char *SERVER_HOST = "host";
constexpr const char *SERVER_PORT = "port";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ModelConfig {
  // Empty means the builtin coefficient table
  std::string coefficients_path;
  double low_risk_threshold = 0.15;
  double high_risk_threshold = 0.50;
  bool reject_unknown_fields = false;
};

struct ServerConfig {
  bool enabled = false;
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct AppConfig {
  ModelConfig model;
  ServerConfig server;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_model_config(const ModelConfig &config,
                           std::vector<std::string> &errors);
bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
