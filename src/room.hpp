//
//  room.hpp
//  uttt - One room's session: seats, spectators, chat, readiness, rematch
//
//  Every public method takes the room mutex, so all mutations of a room
//  and its game are linearized. AI turns run inside that serialized step.
//

#pragma once

#include "uttt.hpp"
#include "game.hpp"
#include "player.hpp"
#include "presence.hpp"
#include "protocol.hpp"
#include "timer.hpp"

#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uttt {

class MatchRecorder;
class ThreadPool;

//===============================================================================
// ROOM TYPES
//===============================================================================

enum class RoomPhase : uint8_t {
    Lobby,           // fewer than two seats filled
    AwaitingStart,   // both seats filled, waiting for readiness
    InProgress,
    Terminal,        // winner or draw, rematch negotiation
    Closed
};

constexpr std::string_view room_phase_to_string(RoomPhase phase) noexcept {
    switch (phase) {
        case RoomPhase::AwaitingStart: return "awaiting_start";
        case RoomPhase::InProgress: return "in_progress";
        case RoomPhase::Terminal: return "terminal";
        case RoomPhase::Closed: return "closed";
        default: return "lobby";
    }
}

struct RoomSettings {
    TimerConfig timer{};
    bool ranked = false;
    bool ai = false;
    Difficulty ai_difficulty = Difficulty::Medium;
    AiSeatOrder ai_seat_order = AiSeatOrder::HumanFirst;
    FirstPlayerChoice first_player = FirstPlayerChoice::Host;
};

json room_settings_to_json(const RoomSettings& settings);

struct ChatEntry {
    std::string author;
    std::string text;
    bool spectator = false;
    std::optional<Player> seat;
};

json chat_entry_to_json(const ChatEntry& entry);

/**
 * A live connection inside the room. seat is empty for spectators.
 */
struct RoomMember {
    ConnectionId connection;
    Identity identity;
    std::optional<Player> seat;
};

/**
 * Collaborators shared by every room. All references outlive the rooms.
 */
struct RoomServices {
    MessageSink& sink;
    PresenceTracker& presence;
    const TimeSource& clock;
    MatchRecorder* recorder = nullptr;
    ThreadPool* pool = nullptr;
    std::chrono::milliseconds ai_budget{2500};
};

enum class JoinResult {
    Seated,
    Reconnected,
    Spectating,
    AlreadyInGame,
    Invalid         // room already closed
};

// Rooms without any connection are dropped after this long idle
inline constexpr double ABANDONED_ROOM_SECONDS = 600.0;

//===============================================================================
// ROOM SESSION
//===============================================================================

class RoomSession {
public:
    RoomSession(std::string code, bool guest_room, RoomSettings settings,
                RoomServices services, uint64_t seed);

    RoomSession(const RoomSession&) = delete;
    RoomSession& operator=(const RoomSession&) = delete;

    //===========================================================================
    // CLIENT EVENTS
    //===========================================================================

    JoinResult join(const ConnectionId& connection, const Identity& identity);
    void claim_slot(const ConnectionId& connection);
    void drop_to_spectator(const ConnectionId& connection);
    void ready(const ConnectionId& connection);
    void move(const ConnectionId& connection, int board, int cell);
    void timeout(const ConnectionId& connection);
    void rematch(const ConnectionId& connection);
    void leave_post_game(const ConnectionId& connection);
    void leave_pre_game(const ConnectionId& connection);
    void update_settings(const ConnectionId& connection, const UpdateSettingsEvent& update);
    void chat(const ConnectionId& connection, std::string_view message);
    void resign(const ConnectionId& connection, Player seat);
    void takeback_request(const ConnectionId& connection);
    void takeback_response(const ConnectionId& connection, bool accepted);

    /**
     * Implicit disconnect of one connection.
     */
    void disconnect(const ConnectionId& connection);

    /**
     * Server-side timeout check. Applies the same decision a client
     * timeout signal would, once the grace window has also passed.
     * @return true if a timeout was applied
     */
    bool sweep();

    /**
     * Tears the room down and releases every seated identity.
     */
    void close();

    //===========================================================================
    // QUERIES
    //===========================================================================

    const std::string& code() const noexcept { return code_; }
    bool is_guest_room() const noexcept { return guest_room_; }

    RoomPhase phase() const;
    bool is_closed() const;

    /**
     * True when nobody is connected and the room has been idle for
     * ABANDONED_ROOM_SECONDS.
     */
    bool is_abandoned(double now) const;

    bool has_member(const ConnectionId& connection) const;
    Game game() const;
    RoomSettings settings() const;
    std::optional<Identity> seat_identity(Player seat) const;
    std::optional<std::string> host_id() const;
    std::vector<ChatEntry> chat_log() const;

    /**
     * Full state payload as broadcast to clients.
     */
    json state() const;

    /**
     * gameStatus payload for one connection.
     */
    json status_for(const ConnectionId& connection) const;

    json summary() const;

private:
    //===========================================================================
    // LOCKED HELPERS (caller holds mutex_)
    //===========================================================================

    RoomPhase phase_locked() const;
    RoomMember* find_member(const ConnectionId& connection);
    const RoomMember* find_member(const ConnectionId& connection) const;
    bool identity_connected(const std::string& id) const;
    std::optional<Player> seat_of_identity(const std::string& id) const;
    int filled_seats() const;
    int human_seats() const;
    bool is_ai_seat(Player seat) const;
    std::optional<Player> ai_seat() const;

    void send(const ConnectionId& connection, const ServerEvent& event);
    void send_to_identity(const std::string& id, const ServerEvent& event);
    void broadcast(const ServerEvent& event);
    void broadcast_state();
    void broadcast_status();
    void broadcast_spectators();
    void announce_seats();

    json state_locked() const;
    json status_locked(const RoomMember& member) const;
    json player_json(Player seat) const;

    void bind_seat(Player seat, const Identity& identity);
    void vacate_seat(Player seat);
    void remove_member(const ConnectionId& connection);
    void bind_ai_seat();

    void start_game();
    void apply_first_player_policy();
    void swap_seats();
    void restore_canonical_seats();

    /**
     * Post-move bookkeeping: clock, termination, AI reply.
     * @param yield Broadcast the human's move before the AI thinks
     */
    void after_move(bool yield);
    void play_ai_turn();
    void handle_expiry();
    void finish_game();
    void record_result();
    void close_room();
    void touch();

    //===========================================================================
    // STATE
    //===========================================================================

    mutable std::mutex mutex_;

    const std::string code_;
    const bool guest_room_;
    RoomServices services_;
    Rng rng_;

    Game game_;
    RoomSettings settings_;
    MoveClock clock_;
    std::array<std::optional<Identity>, 2> seats_{};
    std::optional<std::string> host_id_;
    std::vector<RoomMember> members_;
    std::vector<ChatEntry> chat_log_;
    std::optional<ComputerPlayer> computer_;

    std::array<bool, 2> ready_{};
    std::array<bool, 2> rematch_ready_{};
    bool rematch_declined_ = false;
    bool recorded_ = false;
    bool closed_ = false;
    std::optional<Player> takeback_requester_;
    double last_activity_ = 0.0;
};

} // namespace uttt
