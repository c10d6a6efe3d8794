//
//  event_router.hpp
//  uttt - Dispatches client events to rooms
//
//  Tracks which rooms each connection has joined so an implicit disconnect
//  reaches all of them.
//

#pragma once

#include "protocol.hpp"
#include "room_registry.hpp"

#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace uttt {

class EventRouter {
public:
    EventRouter(RoomRegistry& registry, MessageSink& sink);

    /**
     * Parses and routes one event from `connection`. Malformed events are
     * dropped; events naming an unknown room get `invalid`.
     */
    void dispatch(const ConnectionId& connection, const Identity& identity,
                  std::string_view name, const json& data);

    /**
     * Routes an already parsed event.
     */
    void dispatch(const ConnectionId& connection, const Identity& identity, const ClientEvent& event);

    /**
     * Implicit disconnect for every room the connection joined.
     */
    void disconnect(const ConnectionId& connection);

    std::set<std::string> rooms_of(const ConnectionId& connection) const;

private:
    void handle_create(const ConnectionId& connection, const Identity& identity, const CreateEvent& event);
    void handle_join(const ConnectionId& connection, const Identity& identity, const JoinEvent& event);
    void route(const ConnectionId& connection, RoomSession& room, const ClientEvent& event);
    void forget_if_closed(const std::shared_ptr<RoomSession>& room);

    RoomRegistry& registry_;
    MessageSink& sink_;

    mutable std::mutex mutex_;
    std::unordered_map<ConnectionId, std::set<std::string>> memberships_;
};

} // namespace uttt
