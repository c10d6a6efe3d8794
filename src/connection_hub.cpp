//
//  connection_hub.cpp
//  uttt-httpd - Connection hub implementation
//

#include "connection_hub.hpp"
#include "util/log.hpp"

#include <format>

namespace uttt::httpd {

ConnectionHub::ConnectionHub(uint64_t seed) : rng_(seed) {}

ConnectionId ConnectionHub::generate_id() {
    std::uniform_int_distribution<uint64_t> dist;
    ConnectionId id;
    do {
        id = std::format("{:016x}", dist(rng_));
    } while (connections_.contains(id));
    return id;
}

ConnectionId ConnectionHub::connect(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = generate_id();
    connections_.emplace(id, Connection{identity, {}, Clock::now()});
    log::debug("Connection {} opened for {}", id, identity.name);
    return id;
}

void ConnectionHub::send(const ConnectionId& connection, const ServerEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return;
        }
        auto& queue = it->second.queue;
        if (queue.size() >= MAX_QUEUED_EVENTS) {
            log::warn("Connection {} is not draining, dropping oldest event", connection);
            queue.pop_front();
        }
        queue.push_back(event.to_json());
    }
    ready_.notify_all();
}

std::optional<std::vector<json>> ConnectionHub::poll(const ConnectionId& connection,
                                                     std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = connections_.find(connection);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    it->second.last_seen = Clock::now();
    ++it->second.waiting;

    ready_.wait_for(lock, wait, [&] {
        auto current = connections_.find(connection);
        return stopping_ || current == connections_.end() || !current->second.queue.empty();
    });

    // The connection may have been reaped while waiting
    it = connections_.find(connection);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    --it->second.waiting;

    std::vector<json> drained(std::make_move_iterator(it->second.queue.begin()),
                              std::make_move_iterator(it->second.queue.end()));
    it->second.queue.clear();
    it->second.last_seen = Clock::now();
    return drained;
}

bool ConnectionHub::disconnect(const ConnectionId& connection) {
    size_t erased;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        erased = connections_.erase(connection);
    }
    ready_.notify_all();
    if (erased) {
        log::debug("Connection {} closed", connection);
    }
    return erased > 0;
}

std::vector<ConnectionId> ConnectionHub::reap_idle(Clock::time_point now, std::chrono::milliseconds idle) {
    std::vector<ConnectionId> reaped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            // A client blocked in poll is live however long the wait
            if (it->second.waiting == 0 && now - it->second.last_seen > idle) {
                reaped.push_back(it->first);
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (!reaped.empty()) {
        ready_.notify_all();
        log::info("Reaped {} idle connection(s)", reaped.size());
    }
    return reaped;
}

std::optional<Identity> ConnectionHub::identity_of(const ConnectionId& connection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second.identity;
}

size_t ConnectionHub::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionHub::wake_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    ready_.notify_all();
}

} // namespace uttt::httpd
