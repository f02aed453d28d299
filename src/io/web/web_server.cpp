#include "io/web/web_server.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <optional>

namespace {
std::optional<std::string> query_param(const httplib::Request &req,
                                       const char *name) {
  if (!req.has_param(name))
    return std::nullopt;
  return req.get_param_value(name);
}

// An empty body means "use the defaults"
nlohmann::json parse_body(const httplib::Request &req) {
  if (req.body.empty())
    return nlohmann::json::object();
  return nlohmann::json::parse(req.body);
}

ServiceResponse bad_json(const std::string &what) {
  return {400,
          {{"success", false}, {"error", "Request body is not valid JSON: " + what}}};
}
} // namespace

WebServer::WebServer(const Config::AppConfig &config, ModelService &service,
                     MetricsRegistry &metrics_registry,
                     prometheus::Gauge &memory_gauge)
    : host_(config.server.host), port_(config.server.port),
      metrics_enabled_(config.prometheus.enabled),
      metrics_path_(config.prometheus.metrics_path), service_(service),
      metrics_registry_(metrics_registry), memory_gauge_(memory_gauge),
      requests_family_(metrics_registry.create_counter_family(
          "charactle_ml_http_requests_total",
          "HTTP requests handled, by endpoint and status code")),
      latency_family_(metrics_registry.create_histogram_family(
          "charactle_ml_http_request_duration_seconds",
          "Time spent handling HTTP requests, by endpoint")) {
  server_ = std::make_unique<httplib::Server>();
  register_routes();

  LOG(LogLevel::INFO, LogComponent::IO_SERVER,
      "Web server initialized for " << host_ << ":" << port_);
}

void WebServer::respond(const std::string &endpoint,
                        const ServiceResponse &response, httplib::Response &res,
                        std::chrono::steady_clock::time_point started) {
  res.status = response.status;
  res.set_content(response.body.dump(), "application/json");

  const double elapsed = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - started)
                             .count();
  requests_family_
      .Add({{"endpoint", endpoint}, {"status", std::to_string(response.status)}})
      .Increment();
  latency_family_.Add({{"endpoint", endpoint}}, MetricsRegistry::latency_buckets())
      .Observe(elapsed);

  LOG(LogLevel::DEBUG, LogComponent::IO_SERVER,
      "WebServer: " << endpoint << " -> " << response.status << " in "
                    << elapsed * 1000.0 << " ms");
}

void WebServer::register_routes() {
  using Clock = std::chrono::steady_clock;

  server_->Get("/health", [this](const httplib::Request &,
                                 httplib::Response &res) {
    auto started = Clock::now();
    respond("health", service_.health(), res, started);
  });

  server_->Post("/train-dt", [this](const httplib::Request &req,
                                    httplib::Response &res) {
    auto started = Clock::now();
    LOG(LogLevel::INFO, LogComponent::IO_SERVER,
        "WebServer: training requested by " << req.remote_addr);
    try {
      respond("train-dt", service_.train(parse_body(req)), res, started);
    } catch (const nlohmann::json::parse_error &e) {
      respond("train-dt", bad_json(e.what()), res, started);
    }
  });

  server_->Post("/predict-dt", [this](const httplib::Request &req,
                                      httplib::Response &res) {
    auto started = Clock::now();
    try {
      respond("predict-dt", service_.predict(parse_body(req)), res, started);
    } catch (const nlohmann::json::parse_error &e) {
      respond("predict-dt", bad_json(e.what()), res, started);
    }
  });

  server_->Post("/predict-difficulty-dt", [this](const httplib::Request &req,
                                                 httplib::Response &res) {
    auto started = Clock::now();
    try {
      respond("predict-difficulty-dt",
              service_.predict_difficulty(parse_body(req)), res, started);
    } catch (const nlohmann::json::parse_error &e) {
      respond("predict-difficulty-dt", bad_json(e.what()), res, started);
    }
  });

  server_->Get("/dt-feature-importance", [this](const httplib::Request &req,
                                                httplib::Response &res) {
    auto started = Clock::now();
    respond("dt-feature-importance",
            service_.feature_importance(query_param(req, "top_n")), res,
            started);
  });

  server_->Get("/dt-rules", [this](const httplib::Request &req,
                                   httplib::Response &res) {
    auto started = Clock::now();
    respond("dt-rules", service_.rules(query_param(req, "max_depth")), res,
            started);
  });

  server_->Get("/dt-visualize", [this](const httplib::Request &req,
                                       httplib::Response &res) {
    auto started = Clock::now();
    respond("dt-visualize",
            service_.visualize(query_param(req, "tree_type"),
                               query_param(req, "max_depth")),
            res, started);
  });

  server_->Get("/dt-info", [this](const httplib::Request &,
                                  httplib::Response &res) {
    auto started = Clock::now();
    respond("dt-info", service_.info(), res, started);
  });

  if (metrics_enabled_) {
    server_->Get(metrics_path_, [this](const httplib::Request &req,
                                       httplib::Response &res) {
      LOG(LogLevel::DEBUG, LogComponent::IO_SERVER,
          "WebServer: Received request for " << metrics_path_ << " from "
                                             << req.remote_addr);
      res.set_content(metrics_registry_.serialize(),
                      "text/plain; version=0.0.4");
    });
  }
}

WebServer::~WebServer() {
  if (server_thread_.joinable() || memory_monitor_thread_.joinable())
    stop();
}

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  server_thread_ = std::thread(&WebServer::run, this);
  memory_monitor_thread_ = std::thread(&WebServer::monitor_memory, this);
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();

  if (server_thread_.joinable())
    server_thread_.join();
  if (memory_monitor_thread_.joinable())
    memory_monitor_thread_.join();

  LOG(LogLevel::INFO, LogComponent::IO_SERVER, "Web server stopped");
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_SERVER,
      "Web server listening on " << host_ << ":" << port_);
  if (!server_->listen(host_.c_str(), port_)) {
    LOG(LogLevel::FATAL, LogComponent::IO_SERVER,
        "Web server failed to listen on " << host_ << ":" << port_);
  }
}

void WebServer::monitor_memory() {
  while (!shutdown_flag_) {
    if (auto resident = Utils::resident_memory_bytes())
      memory_gauge_.Set(static_cast<double>(*resident));

    for (int i = 0; i < 150; ++i) {
      if (shutdown_flag_)
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}
