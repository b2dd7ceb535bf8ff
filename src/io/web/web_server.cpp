#include "web_server.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <utility>

WebServer::WebServer(const std::string &host, int port,
                     const PredictionService &prediction_service,
                     std::string coefficients_version)
    : host_(host), port_(port), prediction_service_(prediction_service),
      coefficients_version_(std::move(coefficients_version)) {
  server_ = std::make_unique<httplib::Server>();

  server_->Post("/api/predict", [this](const httplib::Request &req,
                                       httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "WebServer: Received prediction request from " << req.remote_addr);
    ServiceResponse response = prediction_service_.handle_predict(req.body);
    res.status = response.status;
    res.set_content(response.body.dump(), "application/json");
  });

  server_->Get("/health",
               [this](const httplib::Request &, httplib::Response &res) {
                 nlohmann::json j = {
                     {"status", "ok"},
                     {"coefficientsVersion", coefficients_version_}};
                 res.set_content(j.dump(), "application/json");
               });

  server_->Get("/metrics", [](const httplib::Request &req,
                              httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "WebServer: Received request for /metrics from " << req.remote_addr);
    res.set_content(MetricsRegistry::instance().serialize(),
                    "text/plain; version=0.0.4");
  });

  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  running_ = true;
  server_thread_ = std::thread(&WebServer::run, this);

  // httplib ignores stop() until listen() is accepting, so do not hand
  // control back before then. run() clears running_ if listen() fails.
  while (running_ && !server_->is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

void WebServer::stop() {
  if (server_)
    server_->stop();

  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped.");
  }
  running_ = false;
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server starting on a background thread...");
  if (!server_->listen(host_.c_str(), port_)) {
    LOG(LogLevel::FATAL, LogComponent::IO_WEB,
        "Web server failed to listen on " << host_ << ":" << port_);
  }
  running_ = false;
}
