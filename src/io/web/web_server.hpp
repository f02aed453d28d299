#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "io/web/model_service.hpp"

#include <httplib.h>

#include <atomic>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <string>
#include <thread>

class WebServer {
public:
  WebServer(const Config::AppConfig &config, ModelService &service,
            MetricsRegistry &metrics_registry, prometheus::Gauge &memory_gauge);
  ~WebServer();

  void start();
  void stop();

private:
  void run();
  void monitor_memory();
  void register_routes();
  // Writes a ServiceResponse and records the request metrics
  void respond(const std::string &endpoint, const ServiceResponse &response,
               httplib::Response &res,
               std::chrono::steady_clock::time_point started);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::thread memory_monitor_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::string host_;
  int port_;
  bool metrics_enabled_;
  std::string metrics_path_;
  ModelService &service_;
  MetricsRegistry &metrics_registry_;
  prometheus::Gauge &memory_gauge_;
  prometheus::Family<prometheus::Counter> &requests_family_;
  prometheus::Family<prometheus::Histogram> &latency_family_;
};

#endif // WEB_SERVER_HPP
