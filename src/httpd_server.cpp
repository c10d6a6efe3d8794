//
//  httpd_server.cpp
//  uttt-httpd - HTTP server implementation
//
//  Connect / events / poll / disconnect endpoints over cpp-httplib
//

#include "httpd_server.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>
#include <random>
#include <unistd.h>

namespace uttt::httpd {

namespace {

json identity_to_json(const Identity& identity) {
    return {
        {"id", identity.id},
        {"name", identity.name},
        {"kind", std::string(identity_kind_to_string(identity.kind))}
    };
}

} // namespace

HttpServer::HttpServer(const HttpDaemonConfig& config)
    : config_(config),
      seed_(config.seed.value_or(std::random_device{}())),
      hub_(seed_),
      pool_(static_cast<size_t>(config.threads)),
      store_(config.data_dir),
      recorder_(store_),
      accounts_(seed_ + 1),
      registry_(RoomServices{hub_, presence_, clock_, &recorder_, &pool_,
                             std::chrono::milliseconds(config.ai_budget_ms)},
                seed_ + 2),
      router_(registry_, hub_),
      server_(std::make_unique<httplib::Server>()) {

    server_->new_task_queue = [] { return new httplib::ThreadPool(HTTP_WORKER_THREADS); };
    setup_middleware();
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_.load()) {
        return true;
    }

    if (auto initialized = store_.initialize(); !initialized) {
        log::error("Cannot open data directory {}: {}", config_.data_dir,
                   store_error_to_string(initialized.error()));
        return false;
    }

    if (config_.accounts_file) {
        auto loaded = accounts_.load_file(*config_.accounts_file);
        if (!loaded) {
            log::error("Cannot load accounts from {}: {}", *config_.accounts_file,
                       account_error_to_string(loaded.error()));
            return false;
        }
        log::info("Loaded {} accounts from {}", *loaded, *config_.accounts_file);
    }

    if (config_.verbose) {
        server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            log::debug("{} {} -> {}", req.method, req.path, res.status);
        });
    }

    if (!server_->bind_to_port(config_.host, config_.port)) {
        log::error("Failed to bind to {}:{}", config_.host, config_.port);
        return false;
    }

    running_.store(true);
    server_thread_ = std::thread([this]() {
        try {
            server_->listen_after_bind();
        } catch (const std::exception& e) {
            log::error("Server error: {}", e.what());
        }
        running_.store(false);
        maintenance_cv_.notify_all();
    });
    maintenance_thread_ = std::thread([this]() { maintenance_loop(); });

    log::info("Listening on {}:{}", config_.host, config_.port);
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    maintenance_cv_.notify_all();
    hub_.wake_all();

    if (server_->is_running()) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

void HttpServer::maintenance_loop() {
    auto interval = std::chrono::milliseconds(config_.sweep_ms > 0 ? config_.sweep_ms : 1000);

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        try {
            registry_.sweep(config_.sweep_ms > 0);
            auto reaped = hub_.reap_idle(ConnectionHub::Clock::now(),
                                         std::chrono::milliseconds(config_.idle_ms));
            for (const auto& connection : reaped) {
                router_.disconnect(connection);
            }
        } catch (const std::exception& e) {
            log::error("Maintenance pass failed: {}", e.what());
        }
    }
}

void HttpServer::setup_middleware() {
    // CORS headers, and JSON bodies only
    server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");

        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        if (req.method == "POST") {
            auto content_type = req.get_header_value("Content-Type");
            if (content_type.find("application/json") == std::string::npos) {
                send_error(res, "Content-Type must be application/json", 400);
                return httplib::Server::HandlerResponse::Handled;
            }
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });
}

void HttpServer::setup_routes() {
    server_->Post("/uttt/v1/connect", [this](const httplib::Request& req, httplib::Response& res) {
        handle_connect(req, res);
    });

    server_->Post("/uttt/v1/events", [this](const httplib::Request& req, httplib::Response& res) {
        handle_event(req, res);
    });

    server_->Get("/uttt/v1/poll", [this](const httplib::Request& req, httplib::Response& res) {
        handle_poll(req, res);
    });

    server_->Post("/uttt/v1/disconnect", [this](const httplib::Request& req, httplib::Response& res) {
        handle_disconnect(req, res);
    });

    server_->Get("/uttt/v1/status", [this](const httplib::Request& req, httplib::Response& res) {
        handle_status(req, res);
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status": "ok", "service": "uttt-httpd"})", "application/json");
    });

    server_->set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 404) {
            handle_not_found(req, res);
        }
    });
}

void HttpServer::handle_connect(const httplib::Request& req, httplib::Response& res) {
    try {
        json request_json = json::parse(req.body);
        if (!request_json.is_object()) {
            send_error(res, "Request body must be a JSON object", 400);
            return;
        }

        Identity identity;
        if (request_json.value("guest", false)) {
            identity = accounts_.create_guest();
        } else if (request_json.contains("user") && request_json["user"].is_string()) {
            auto found = accounts_.find(request_json["user"].get<std::string>());
            if (!found) {
                send_error(res, "Unknown user", 404);
                return;
            }
            identity = *found;
        } else {
            send_error(res, "Expected 'user' or 'guest'", 400);
            return;
        }

        json response_json;
        response_json["connection"] = hub_.connect(identity);
        response_json["identity"] = identity_to_json(identity);
        res.set_content(response_json.dump(), "application/json");

    } catch (const json::exception& e) {
        send_error(res, std::format("Invalid JSON: {}", e.what()), 400);
    } catch (const std::exception& e) {
        send_error(res, std::format("Server error: {}", e.what()), 500);
    }
}

void HttpServer::handle_event(const httplib::Request& req, httplib::Response& res) {
    try {
        json request_json = json::parse(req.body);
        if (!request_json.is_object() || !request_json.contains("connection") ||
            !request_json["connection"].is_string()) {
            send_error(res, "Missing or invalid 'connection'", 400);
            return;
        }
        if (!request_json.contains("event") || !request_json["event"].is_string()) {
            send_error(res, "Missing or invalid 'event'", 400);
            return;
        }

        auto connection = request_json["connection"].get<std::string>();
        auto identity = hub_.identity_of(connection);
        if (!identity) {
            send_error(res, "Unknown connection", 404);
            return;
        }

        json data = request_json.contains("data") ? request_json["data"] : json(nullptr);
        router_.dispatch(connection, *identity, request_json["event"].get<std::string>(), data);

        res.set_content(R"({"accepted": true})", "application/json");

    } catch (const json::parse_error& e) {
        send_error(res, std::format("Invalid JSON: {}", e.what()), 400);
    } catch (const std::exception& e) {
        send_error(res, std::format("Server error: {}", e.what()), 500);
    }
}

void HttpServer::handle_poll(const httplib::Request& req, httplib::Response& res) {
    if (!req.has_param("connection")) {
        send_error(res, "Missing 'connection' parameter", 400);
        return;
    }

    int wait_ms = DEFAULT_POLL_WAIT_MS;
    if (req.has_param("wait_ms")) {
        try {
            wait_ms = std::clamp(std::stoi(req.get_param_value("wait_ms")), 0, MAX_POLL_WAIT_MS);
        } catch (const std::logic_error&) {
            send_error(res, "Invalid 'wait_ms' parameter", 400);
            return;
        }
    }

    auto events = hub_.poll(req.get_param_value("connection"), std::chrono::milliseconds(wait_ms));
    if (!events) {
        send_error(res, "Unknown connection", 404);
        return;
    }

    json response_json;
    response_json["events"] = std::move(*events);
    res.set_content(response_json.dump(), "application/json");
}

void HttpServer::handle_disconnect(const httplib::Request& req, httplib::Response& res) {
    try {
        json request_json = json::parse(req.body);
        if (!request_json.is_object() || !request_json.contains("connection") ||
            !request_json["connection"].is_string()) {
            send_error(res, "Missing or invalid 'connection'", 400);
            return;
        }

        auto connection = request_json["connection"].get<std::string>();
        bool was_open = hub_.disconnect(connection);
        router_.disconnect(connection);

        json response_json;
        response_json["disconnected"] = was_open;
        res.set_content(response_json.dump(), "application/json");

    } catch (const json::parse_error& e) {
        send_error(res, std::format("Invalid JSON: {}", e.what()), 400);
    } catch (const std::exception& e) {
        send_error(res, std::format("Server error: {}", e.what()), 500);
    }
}

void HttpServer::handle_status(const httplib::Request&, httplib::Response& res) {
    try {
        json status_response;
        status_response["status"] = "healthy";
        status_response["service"] = "uttt-httpd";
        status_response["version"] = std::string(GAME_VERSION);
        status_response["config"]["threads"] = config_.threads;
        status_response["config"]["ai_budget_ms"] = config_.ai_budget_ms;
        status_response["config"]["sweep_ms"] = config_.sweep_ms;
        status_response["config"]["idle_ms"] = config_.idle_ms;
        status_response["metrics"] = get_system_metrics();
        status_response["rooms"] = registry_.summaries();

        res.set_content(status_response.dump(2), "application/json");

    } catch (const std::exception& e) {
        send_error(res, std::format("Failed to get system metrics: {}", e.what()), 500);
    }
}

void HttpServer::handle_not_found(const httplib::Request& req, httplib::Response& res) {
    send_error(res, std::format("Endpoint not found: {} {}", req.method, req.path), 404);
}

json HttpServer::get_system_metrics() const {
    json metrics;

    double loadavg[3];
    if (getloadavg(loadavg, 3) != -1) {
        metrics["load_average"]["1min"] = loadavg[0];
        metrics["load_average"]["5min"] = loadavg[1];
        metrics["load_average"]["15min"] = loadavg[2];
    }

    metrics["process"]["pid"] = getpid();
    metrics["process"]["ai_workers"] = pool_.size();
    metrics["process"]["ai_tasks_pending"] = pool_.pending();
    metrics["system"]["cpu_cores"] = std::thread::hardware_concurrency();

    metrics["connections"] = hub_.size();
    metrics["rooms"] = registry_.size();
    metrics["seated_identities"] = presence_.size();
    return metrics;
}

json HttpServer::create_error_response(const std::string& error, int code) const {
    json error_response;
    error_response["error"] = error;
    error_response["code"] = code;
    error_response["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return error_response;
}

void HttpServer::send_error(httplib::Response& res, const std::string& error, int code) const {
    res.status = code;
    res.set_content(create_error_response(error, code).dump(), "application/json");
}

} // namespace uttt::httpd
