#include "core/config.hpp"
#include "core/logger.hpp"
#include "io/web/web_server.hpp"
#include "models/coefficient_table.hpp"
#include "models/feature_validator.hpp"
#include "models/stemi_model.hpp"
#include "service/prediction_service.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

// Global atomic flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

std::shared_ptr<const CoefficientTable>
build_coefficient_table(const Config::ModelConfig &model_config) {
  if (model_config.coefficients_path.empty()) {
    LOG(LogLevel::INFO, LogComponent::MODEL_LIFECYCLE,
        "No coefficients_path configured; using the builtin table.");
    return std::make_shared<const CoefficientTable>(
        CoefficientTable::builtin());
  }
  return load_coefficient_table(model_config.coefficients_path);
}

// One JSON request per input line, one JSON response per output line.
int run_batch(const PredictionService &service) {
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Batch mode: reading one JSON request per line from stdin.");
  std::string line;
  uint64_t processed = 0;
  while (!g_shutdown_requested && std::getline(std::cin, line)) {
    if (Utils::trim_copy(line).empty())
      continue;
    ServiceResponse response = service.handle_predict(line);
    nlohmann::json out = {{"status", response.status},
                          {"body", response.body}};
    std::cout << out.dump() << '\n';
    processed++;
  }
  std::cout.flush();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Batch mode finished after " << processed << " request(s).");
  return 0;
}

int run_server(const Config::ServerConfig &server_config,
               const PredictionService &service,
               const std::string &coefficients_version) {
  WebServer web_server(server_config.host, server_config.port, service,
                       coefficients_version);
  web_server.start();

  while (!g_shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (!web_server.is_running()) {
      LOG(LogLevel::FATAL, LogComponent::CORE,
          "Web server exited unexpectedly. Shutting down.");
      return 1;
    }
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Shutdown requested. Stopping web server...");
  web_server.stop();
  return 0;
}

int main(int argc, char *argv[]) {
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  if (!config_manager.load_configuration(config_file_to_load))
    std::cerr << "Continuing with default configuration." << std::endl;

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "STEMI Detector starting up...");
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  // --- Initialize Model ---
  std::shared_ptr<const StemiModel> model;
  try {
    auto coefficients = build_coefficient_table(current_config->model);
    model = std::make_shared<const StemiModel>(
        coefficients, RiskThresholds{current_config->model.low_risk_threshold,
                                     current_config->model.high_risk_threshold});
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::MODEL_LIFECYCLE,
        "Failed to initialize model: " << e.what());
    return 1;
  }

  PredictionService service(
      model, FeatureValidator(current_config->model.reject_unknown_fields));

  int exit_code = 0;
  if (current_config->server.enabled)
    exit_code = run_server(current_config->server, service,
                           model->coefficients().version);
  else
    exit_code = run_batch(service);

  LOG(LogLevel::INFO, LogComponent::CORE, "STEMI Detector shut down.");
  return exit_code;
}
