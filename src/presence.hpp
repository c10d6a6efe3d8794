//
//  presence.hpp
//  uttt - Which room each identity is currently seated in
//
//  An identity holds a seat in at most one active room at a time
//

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace uttt {

class PresenceTracker {
public:
    /**
     * Binds `identity` to `room`.
     * @return false if the identity is already bound to a different room
     */
    bool claim(const std::string& identity, const std::string& room) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = rooms_.try_emplace(identity, room);
        return inserted || it->second == room;
    }

    /**
     * Drops the binding, but only if it still points at `room`.
     */
    void release(const std::string& identity, const std::string& room) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rooms_.find(identity);
        if (it != rooms_.end() && it->second == room) {
            rooms_.erase(it);
        }
    }

    std::optional<std::string> room_of(const std::string& identity) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rooms_.find(identity);
        if (it == rooms_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * True when the identity is free or already bound to `room`.
     */
    bool available_for(const std::string& identity, const std::string& room) const {
        auto current = room_of(identity);
        return !current || *current == room;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rooms_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> rooms_;
};

} // namespace uttt
