#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.web", LogComponent::IO_WEB},
    {"model.validation", LogComponent::MODEL_VALIDATION},
    {"model.scoring", LogComponent::MODEL_SCORING},
    {"model.lifecycle", LogComponent::MODEL_LIFECYCLE},
    {"service", LogComponent::SERVICE}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

bool validate_model_config(const ModelConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (!std::isfinite(config.low_risk_threshold) ||
      config.low_risk_threshold <= 0.0 || config.low_risk_threshold >= 1.0) {
    errors.push_back("Model low risk threshold must be strictly between 0 "
                     "and 1");
    valid = false;
  }

  if (!std::isfinite(config.high_risk_threshold) ||
      config.high_risk_threshold <= 0.0 || config.high_risk_threshold >= 1.0) {
    errors.push_back("Model high risk threshold must be strictly between 0 "
                     "and 1");
    valid = false;
  }

  if (config.low_risk_threshold >= config.high_risk_threshold) {
    errors.push_back(
        "Model low risk threshold must be less than high risk threshold");
    valid = false;
  }

  return valid;
}

bool validate_server_config(const ServerConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 1 || config.port > 65535) {
    errors.push_back("Server port must be between 1 and 65535");
    valid = false;
  }

  if (config.host.empty()) {
    errors.push_back("Server host cannot be empty");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_model_config(config.model, errors))
    valid = false;

  if (!validate_server_config(config.server, errors))
    valid = false;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    if (current_section.empty()) {
      config.custom_settings[key] = value;

    } else if (current_section == "Model") {
      if (key == Keys::MODEL_COEFFICIENTS_PATH)
        config.model.coefficients_path = value;
      else if (key == Keys::MODEL_LOW_RISK_THRESHOLD)
        config.model.low_risk_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.model.low_risk_threshold);
      else if (key == Keys::MODEL_HIGH_RISK_THRESHOLD)
        config.model.high_risk_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.model.high_risk_threshold);
      else if (key == Keys::MODEL_REJECT_UNKNOWN_FIELDS)
        config.model.reject_unknown_fields = string_to_bool(value);
      else
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown key '" << key << "' in [Model]" << std::endl;

    } else if (current_section == "Server") {
      if (key == Keys::SERVER_ENABLED)
        config.server.enabled = string_to_bool(value);
      else if (key == Keys::SERVER_HOST)
        config.server.host = value;
      else if (key == Keys::SERVER_PORT)
        config.server.port = Utils::string_to_number<int>(value).value_or(
            config.server.port);
      else
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown key '" << key << "' in [Server]"
                  << std::endl;

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "model.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map)
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
        }
      }
    }
  }

  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors)
      std::cerr << "  - " << error << std::endl;
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
