//
//  event_router.cpp
//  uttt - Event dispatch implementation
//

#include "event_router.hpp"
#include "util/log.hpp"

#include <type_traits>

namespace uttt {

EventRouter::EventRouter(RoomRegistry& registry, MessageSink& sink)
    : registry_(registry), sink_(sink) {}

void EventRouter::dispatch(const ConnectionId& connection, const Identity& identity,
                           std::string_view name, const json& data) {
    auto event = parse_client_event(name, data);
    if (!event) {
        log::debug("Dropping '{}' from {}: {}", name, connection, protocol_error_to_string(event.error()));
        return;
    }
    dispatch(connection, identity, *event);
}

void EventRouter::dispatch(const ConnectionId& connection, const Identity& identity, const ClientEvent& event) {
    if (const auto* create = std::get_if<CreateEvent>(&event)) {
        handle_create(connection, identity, *create);
        return;
    }
    if (const auto* join = std::get_if<JoinEvent>(&event)) {
        handle_join(connection, identity, *join);
        return;
    }

    auto code = event_room(event);
    auto room = code ? registry_.find(*code) : nullptr;
    if (!room || room->is_closed()) {
        sink_.send(connection, events::invalid());
        return;
    }
    if (!room->has_member(connection)) {
        log::debug("Dropping event from {}: not in room {}", connection, *code);
        return;
    }

    route(connection, *room, event);
    forget_if_closed(room);
}

void EventRouter::handle_create(const ConnectionId& connection, const Identity& identity,
                                const CreateEvent& event) {
    auto room = registry_.create(identity, event);
    if (!room) {
        if (room.error() == RegistryError::AlreadyInGame) {
            sink_.send(connection, events::already_in_game(registry_error_to_string(room.error())));
        } else {
            log::error("Cannot create room for {}: {}", identity.name, registry_error_to_string(room.error()));
            sink_.send(connection, events::invalid());
        }
        return;
    }
    sink_.send(connection, events::created((*room)->code()));
}

void EventRouter::handle_join(const ConnectionId& connection, const Identity& identity, const JoinEvent& event) {
    auto room = registry_.find(event.room);
    // Guest rooms and registered rooms never mix
    if (!room || room->is_closed() || room->is_guest_room() != identity.is_guest()) {
        sink_.send(connection, events::invalid());
        return;
    }

    auto result = room->join(connection, identity);
    if (result == JoinResult::Seated || result == JoinResult::Reconnected || result == JoinResult::Spectating) {
        std::lock_guard<std::mutex> lock(mutex_);
        memberships_[connection].insert(event.room);
    }
    forget_if_closed(room);
}

void EventRouter::route(const ConnectionId& connection, RoomSession& room, const ClientEvent& event) {
    std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ClaimSlotEvent>) {
            room.claim_slot(connection);
        } else if constexpr (std::is_same_v<T, DropToSpectatorEvent>) {
            room.drop_to_spectator(connection);
        } else if constexpr (std::is_same_v<T, ReadyEvent>) {
            room.ready(connection);
        } else if constexpr (std::is_same_v<T, MoveEvent>) {
            room.move(connection, e.board, e.cell);
        } else if constexpr (std::is_same_v<T, TimeoutEvent>) {
            room.timeout(connection);
        } else if constexpr (std::is_same_v<T, RematchEvent>) {
            room.rematch(connection);
        } else if constexpr (std::is_same_v<T, LeavePostGameEvent>) {
            room.leave_post_game(connection);
            std::lock_guard<std::mutex> lock(mutex_);
            memberships_[connection].erase(room.code());
        } else if constexpr (std::is_same_v<T, LeavePreGameEvent>) {
            room.leave_pre_game(connection);
            if (!room.has_member(connection)) {
                std::lock_guard<std::mutex> lock(mutex_);
                memberships_[connection].erase(room.code());
            }
        } else if constexpr (std::is_same_v<T, UpdateSettingsEvent>) {
            room.update_settings(connection, e);
        } else if constexpr (std::is_same_v<T, ChatEvent>) {
            room.chat(connection, e.message);
        } else if constexpr (std::is_same_v<T, ResignEvent>) {
            room.resign(connection, e.seat);
        } else if constexpr (std::is_same_v<T, TakebackRequestEvent>) {
            room.takeback_request(connection);
        } else if constexpr (std::is_same_v<T, TakebackResponseEvent>) {
            room.takeback_response(connection, e.accepted);
        }
    }, event);
}

void EventRouter::disconnect(const ConnectionId& connection) {
    std::set<std::string> codes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memberships_.find(connection);
        if (it == memberships_.end()) {
            return;
        }
        codes = std::move(it->second);
        memberships_.erase(it);
    }

    for (const auto& code : codes) {
        if (auto room = registry_.find(code)) {
            room->disconnect(connection);
            forget_if_closed(room);
        }
    }
}

std::set<std::string> EventRouter::rooms_of(const ConnectionId& connection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = memberships_.find(connection);
    return it == memberships_.end() ? std::set<std::string>{} : it->second;
}

void EventRouter::forget_if_closed(const std::shared_ptr<RoomSession>& room) {
    if (room->is_closed()) {
        registry_.remove(room->code());
    }
}

} // namespace uttt
