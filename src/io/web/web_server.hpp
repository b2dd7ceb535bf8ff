#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "service/prediction_service.hpp"

#include <atomic>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

class WebServer {
public:
  WebServer(const std::string &host, int port,
            const PredictionService &prediction_service,
            std::string coefficients_version);
  ~WebServer();

  // Returns once the listener is accepting connections, or has failed to
  // bind (is_running() is then false).
  void start();
  void stop();
  bool is_running() const { return running_; }

private:
  void run();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  std::string host_;
  int port_;
  const PredictionService &prediction_service_;
  std::string coefficients_version_;
};

#endif // WEB_SERVER_HPP
