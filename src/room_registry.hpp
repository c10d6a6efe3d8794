//
//  room_registry.hpp
//  uttt - Live rooms keyed by their 5-digit code
//

#pragma once

#include "room.hpp"

#include <expected>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace uttt {

enum class RegistryError {
    AlreadyInGame,
    NoFreeCode
};

const char* registry_error_to_string(RegistryError error);

inline constexpr int ROOM_CODE_DIGITS = 5;

class RoomRegistry {
public:
    RoomRegistry(RoomServices services, uint64_t seed);

    /**
     * Opens a room for `creator`. The room inherits the creator's guest
     * status. The creator is not seated until it joins.
     */
    std::expected<std::shared_ptr<RoomSession>, RegistryError> create(const Identity& creator,
                                                                       const CreateEvent& request);

    std::shared_ptr<RoomSession> find(const std::string& code) const;
    void remove(const std::string& code);
    size_t size() const;

    /**
     * Drops closed or abandoned rooms, first running every room's timeout
     * sweep when `timeouts` is set. Room locks are taken without the
     * registry lock held.
     * @return number of rooms removed
     */
    size_t sweep(bool timeouts = true);

    json summaries() const;

    PresenceTracker& presence() noexcept { return services_.presence; }
    const RoomServices& services() const noexcept { return services_; }

private:
    std::string generate_code();

    RoomServices services_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RoomSession>> rooms_;
    Rng rng_;
};

} // namespace uttt
