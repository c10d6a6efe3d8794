//
//  httpd_server.hpp
//  uttt-httpd - HTTP server implementation
//
//  Long-poll JSON transport in front of the room registry
//

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "account_directory.hpp"
#include "connection_hub.hpp"
#include "event_router.hpp"
#include "httpd_cli.hpp"
#include "match_recorder.hpp"
#include "presence.hpp"
#include "room_registry.hpp"
#include "timer.hpp"
#include "util/thread_pool.hpp"

namespace uttt::httpd {

using json = nlohmann::json;

// Worker threads serving HTTP requests; long polls hold one each
inline constexpr size_t HTTP_WORKER_THREADS = 64;
inline constexpr int DEFAULT_POLL_WAIT_MS = 25000;
inline constexpr int MAX_POLL_WAIT_MS = 30000;

class HttpServer {
public:
    explicit HttpServer(const HttpDaemonConfig& config);
    ~HttpServer();

    /**
     * Loads accounts and player records, then starts listening and the
     * maintenance thread.
     * @return false if persistence could not be initialized or the socket
     *         could not be bound
     */
    bool start();
    void stop();

    bool is_running() const { return running_.load(); }

private:
    void setup_routes();
    void setup_middleware();

    // Route handlers
    void handle_connect(const httplib::Request& req, httplib::Response& res);
    void handle_event(const httplib::Request& req, httplib::Response& res);
    void handle_poll(const httplib::Request& req, httplib::Response& res);
    void handle_disconnect(const httplib::Request& req, httplib::Response& res);
    void handle_status(const httplib::Request& req, httplib::Response& res);
    void handle_not_found(const httplib::Request& req, httplib::Response& res);

    /**
     * Periodic timeout sweep, abandoned-room cleanup and idle connection
     * reaping.
     */
    void maintenance_loop();

    // Utility methods
    json get_system_metrics() const;
    json create_error_response(const std::string& error, int code = 400) const;
    void send_error(httplib::Response& res, const std::string& error, int code) const;

    HttpDaemonConfig config_;
    uint64_t seed_;

    SystemTimeSource clock_;
    PresenceTracker presence_;
    ConnectionHub hub_;
    ThreadPool pool_;
    JsonFileMatchStore store_;
    MatchRecorder recorder_;
    InMemoryAccountDirectory accounts_;
    RoomRegistry registry_;
    EventRouter router_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    std::thread maintenance_thread_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
};

} // namespace uttt::httpd
