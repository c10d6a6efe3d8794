//
//  protocol.hpp
//  uttt - Client and server events, JSON encoding of game state
//
//  Client events are parsed into a std::variant; anything malformed is
//  reported as a ProtocolError and dropped by the caller
//

#pragma once

#include "uttt.hpp"
#include "game.hpp"
#include "timer.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace uttt {

using json = nlohmann::json;

using ConnectionId = std::string;

inline constexpr size_t MAX_CHAT_LENGTH = 500;

//===============================================================================
// ROOM SETTINGS VOCABULARY
//===============================================================================

enum class FirstPlayerChoice : uint8_t {
    Host,
    Joiner,
    Random
};

enum class AiSeatOrder : uint8_t {
    HumanFirst,
    AiFirst,
    Random
};

constexpr std::string_view first_player_choice_to_string(FirstPlayerChoice choice) noexcept {
    switch (choice) {
        case FirstPlayerChoice::Joiner: return "joiner";
        case FirstPlayerChoice::Random: return "random";
        default: return "host";
    }
}

constexpr std::optional<FirstPlayerChoice> first_player_choice_from_string(std::string_view text) noexcept {
    if (text == "host") return FirstPlayerChoice::Host;
    if (text == "joiner") return FirstPlayerChoice::Joiner;
    if (text == "random") return FirstPlayerChoice::Random;
    return std::nullopt;
}

constexpr std::string_view ai_seat_order_to_string(AiSeatOrder order) noexcept {
    switch (order) {
        case AiSeatOrder::AiFirst: return "ai_first";
        case AiSeatOrder::Random: return "random";
        default: return "human_first";
    }
}

constexpr std::optional<AiSeatOrder> ai_seat_order_from_string(std::string_view text) noexcept {
    if (text == "human_first") return AiSeatOrder::HumanFirst;
    if (text == "ai_first") return AiSeatOrder::AiFirst;
    if (text == "random") return AiSeatOrder::Random;
    return std::nullopt;
}

//===============================================================================
// CLIENT EVENTS
//===============================================================================

struct CreateEvent {
    bool ai = false;
    bool ranked = false;
    std::optional<Difficulty> difficulty;
};

struct JoinEvent { std::string room; };
struct ClaimSlotEvent { std::string room; };
struct DropToSpectatorEvent { std::string room; };
struct ReadyEvent { std::string room; };

struct MoveEvent {
    std::string room;
    int board = NO_BOARD;
    int cell = NO_BOARD;
};

struct TimeoutEvent { std::string room; };
struct RematchEvent { std::string room; };
struct LeavePostGameEvent { std::string room; };
struct LeavePreGameEvent { std::string room; };

/**
 * Host settings change. Absent fields are left alone.
 */
struct UpdateSettingsEvent {
    std::string room;
    std::optional<TimerMode> timer_type;
    std::optional<int> move_timeout;
    std::optional<int> game_time_each;
    std::optional<int> game_increment;
    std::optional<ExpiryPolicy> timeout_action;
    std::optional<Difficulty> ai_difficulty;
    std::optional<AiSeatOrder> ai_seat_order;
    std::optional<FirstPlayerChoice> first_player_choice;
    std::optional<bool> ranked;
};

struct ChatEvent {
    std::string room;
    std::string message;
};

struct ResignEvent {
    std::string room;
    Player seat = Player::Empty;
};

struct TakebackRequestEvent { std::string room; };

struct TakebackResponseEvent {
    std::string room;
    bool accepted = false;
};

using ClientEvent = std::variant<
    CreateEvent, JoinEvent, ClaimSlotEvent, DropToSpectatorEvent, ReadyEvent,
    MoveEvent, TimeoutEvent, RematchEvent, LeavePostGameEvent, LeavePreGameEvent,
    UpdateSettingsEvent, ChatEvent, ResignEvent, TakebackRequestEvent,
    TakebackResponseEvent>;

enum class ProtocolError {
    UnknownEvent,
    MissingField,
    InvalidField
};

const char* protocol_error_to_string(ProtocolError error);

/**
 * Parses one tagged client event.
 * @param name Event tag, e.g. "move"
 * @param data Payload object; null is accepted for events without fields
 */
std::expected<ClientEvent, ProtocolError> parse_client_event(std::string_view name, const json& data);

/**
 * Room code named by any event except create.
 */
std::optional<std::string> event_room(const ClientEvent& event);

/**
 * Number of UTF-8 encoded characters in text.
 */
size_t utf8_length(std::string_view text);

/**
 * Trims surrounding whitespace; empty when nothing is left or the result
 * is longer than MAX_CHAT_LENGTH characters.
 */
std::optional<std::string> sanitize_chat(std::string_view message);

//===============================================================================
// SERVER EVENTS
//===============================================================================

struct ServerEvent {
    std::string type;
    json data;

    json to_json() const { return {{"event", type}, {"data", data}}; }
};

/**
 * Delivery channel to connected clients. Implementations must not call
 * back into rooms from send().
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void send(const ConnectionId& connection, const ServerEvent& event) = 0;
};

namespace events {

ServerEvent created(const std::string& room);
ServerEvent assign(Player seat);
ServerEvent spectator();
ServerEvent invalid();
ServerEvent already_in_game(std::string_view error);
ServerEvent rematch_agreed();
ServerEvent takeback_requested(const std::string& requester_name);
ServerEvent takeback_declined();

} // namespace events

//===============================================================================
// GAME STATE ENCODING
//===============================================================================

/**
 * Engine state: boards, winners, boardWinLines, player, forced, gameWinner,
 * gameWinLine, endReason, started, lastMove, moveHistory.
 */
json game_to_json(const Game& game);

json move_to_json(const Move& move);

} // namespace uttt
