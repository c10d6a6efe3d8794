//
//  connection_hub.hpp
//  uttt-httpd - Long-poll connections and their outbound queues
//
//  Rooms push server events through the MessageSink interface; HTTP poll
//  requests drain them.
//

#pragma once

#include "player.hpp"
#include "protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace uttt::httpd {

// Oldest events are dropped past this many undelivered ones
inline constexpr size_t MAX_QUEUED_EVENTS = 1000;

class ConnectionHub : public MessageSink {
public:
    using Clock = std::chrono::steady_clock;

    explicit ConnectionHub(uint64_t seed = std::random_device{}());

    /**
     * Opens a connection for `identity`.
     * @return the new connection id
     */
    ConnectionId connect(const Identity& identity);

    void send(const ConnectionId& connection, const ServerEvent& event) override;

    /**
     * Drains queued events, waiting up to `wait` for the first one.
     * @return nullopt for unknown connections
     */
    std::optional<std::vector<json>> poll(const ConnectionId& connection, std::chrono::milliseconds wait);

    /**
     * Forgets the connection and wakes any pending poll.
     * @return false if it was not open
     */
    bool disconnect(const ConnectionId& connection);

    /**
     * Removes connections not polled since `now - idle`. Connections with a
     * poll in progress are never removed.
     * @return the removed connection ids
     */
    std::vector<ConnectionId> reap_idle(Clock::time_point now, std::chrono::milliseconds idle);

    std::optional<Identity> identity_of(const ConnectionId& connection) const;
    size_t size() const;

    /**
     * Wakes every pending poll, used on shutdown.
     */
    void wake_all();

private:
    struct Connection {
        Identity identity;
        std::deque<json> queue;
        Clock::time_point last_seen;
        int waiting = 0;
    };

    ConnectionId generate_id();

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::unordered_map<ConnectionId, Connection> connections_;
    std::mt19937_64 rng_;
    bool stopping_ = false;
};

} // namespace uttt::httpd
