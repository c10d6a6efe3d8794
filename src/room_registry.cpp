//
//  room_registry.cpp
//  uttt - Room registry implementation
//

#include "room_registry.hpp"
#include "util/log.hpp"

#include <format>

namespace uttt {

const char* registry_error_to_string(RegistryError error) {
    switch (error) {
        case RegistryError::AlreadyInGame:
            return "You are already in another game.";
        case RegistryError::NoFreeCode:
            return "No free room code";
        default:
            return "Unknown error";
    }
}

RoomRegistry::RoomRegistry(RoomServices services, uint64_t seed)
    : services_(services), rng_(seed) {}

std::string RoomRegistry::generate_code() {
    std::uniform_int_distribution<int> digits(0, 99999);
    return std::format("{:05}", digits(rng_));
}

std::expected<std::shared_ptr<RoomSession>, RegistryError>
RoomRegistry::create(const Identity& creator, const CreateEvent& request) {
    if (!services_.presence.available_for(creator.id, "")) {
        return std::unexpected(RegistryError::AlreadyInGame);
    }

    RoomSettings settings;
    settings.ai = request.ai;
    settings.ranked = request.ranked && !request.ai && !creator.is_guest();
    if (request.difficulty) {
        settings.ai_difficulty = *request.difficulty;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // A handful of collisions at most while the registry is sparse
    for (int attempt = 0; attempt < 100; ++attempt) {
        auto code = generate_code();
        if (rooms_.contains(code)) {
            continue;
        }
        auto room = std::make_shared<RoomSession>(code, creator.is_guest(), settings, services_, rng_());
        rooms_.emplace(code, room);
        log::info("Room {}: created by {}{}{}", code, creator.name,
                  settings.ai ? std::format(" vs AI ({})", difficulty_to_string(settings.ai_difficulty)) : "",
                  settings.ranked ? ", ranked" : "");
        return room;
    }
    return std::unexpected(RegistryError::NoFreeCode);
}

std::shared_ptr<RoomSession> RoomRegistry::find(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(code);
    return it == rooms_.end() ? nullptr : it->second;
}

void RoomRegistry::remove(const std::string& code) {
    std::lock_guard<std::mutex> lock(mutex_);
    rooms_.erase(code);
}

size_t RoomRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

size_t RoomRegistry::sweep(bool timeouts) {
    std::vector<std::shared_ptr<RoomSession>> rooms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rooms.reserve(rooms_.size());
        for (const auto& [code, room] : rooms_) {
            rooms.push_back(room);
        }
    }

    double now = services_.clock.now();
    std::vector<std::string> dead;
    for (const auto& room : rooms) {
        if (timeouts) {
            room->sweep();
        }
        if (room->is_abandoned(now)) {
            log::info("Room {}: abandoned", room->code());
            room->close();
        }
        if (room->is_closed()) {
            dead.push_back(room->code());
        }
    }

    if (!dead.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& code : dead) {
            rooms_.erase(code);
        }
    }
    return dead.size();
}

json RoomRegistry::summaries() const {
    std::vector<std::shared_ptr<RoomSession>> rooms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [code, room] : rooms_) {
            rooms.push_back(room);
        }
    }

    json list = json::array();
    for (const auto& room : rooms) {
        list.push_back(room->summary());
    }
    return list;
}

} // namespace uttt
