//
//  protocol.cpp
//  uttt - Event parsing and state encoding
//

#include "protocol.hpp"

#include <cstdint>
#include <format>
#include <limits>

namespace uttt {

const char* protocol_error_to_string(ProtocolError error) {
    switch (error) {
        case ProtocolError::UnknownEvent:
            return "Unknown event";
        case ProtocolError::MissingField:
            return "Missing required field";
        case ProtocolError::InvalidField:
            return "Invalid field value";
        default:
            return "Unknown error";
    }
}

//===============================================================================
// FIELD HELPERS
//===============================================================================

namespace {

std::expected<std::string, ProtocolError> room_field(const json& data) {
    if (!data.is_object() || !data.contains("room")) {
        return std::unexpected(ProtocolError::MissingField);
    }
    const auto& room = data["room"];
    if (room.is_string()) {
        return room.get<std::string>();
    }
    // Codes are digits, so some clients send them as numbers
    if (room.is_number_integer()) {
        auto code = room.get<int64_t>();
        if (code >= 0 && code <= 99999) {
            return std::format("{:05}", code);
        }
    }
    return std::unexpected(ProtocolError::InvalidField);
}

std::expected<int, ProtocolError> int_field(const json& data, const char* name) {
    if (!data.contains(name)) {
        return std::unexpected(ProtocolError::MissingField);
    }
    const auto& value = data[name];
    if (!value.is_number_integer()) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    if (value.is_number_unsigned()) {
        auto wide = value.get<uint64_t>();
        if (wide > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return std::unexpected(ProtocolError::InvalidField);
        }
        return static_cast<int>(wide);
    }
    auto wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    return static_cast<int>(wide);
}

std::expected<std::optional<int>, ProtocolError> optional_int(const json& data, const char* name) {
    if (!data.contains(name) || data[name].is_null()) {
        return std::optional<int>{};
    }
    auto value = int_field(data, name);
    if (!value) return std::unexpected(value.error());
    return std::optional<int>{*value};
}

bool flag(const json& data, const char* name) {
    return data.is_object() && data.contains(name) && data[name].is_boolean() && data[name].get<bool>();
}

template<typename T, typename Parse>
std::expected<std::optional<T>, ProtocolError> optional_enum(const json& data, const char* name, Parse parse) {
    if (!data.contains(name) || data[name].is_null()) {
        return std::optional<T>{};
    }
    if (!data[name].is_string()) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    auto parsed = parse(data[name].get<std::string>());
    if (!parsed) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    return std::optional<T>{*parsed};
}

std::optional<ExpiryPolicy> expiry_policy_from_string(std::string_view text) {
    if (text == "forfeit") return ExpiryPolicy::Forfeit;
    if (text == "random") return ExpiryPolicy::RandomMove;
    return std::nullopt;
}

template<typename Event>
std::expected<ClientEvent, ProtocolError> room_only(const json& data) {
    auto room = room_field(data);
    if (!room) return std::unexpected(room.error());
    return Event{*room};
}

std::expected<ClientEvent, ProtocolError> parse_settings(const json& data) {
    auto room = room_field(data);
    if (!room) return std::unexpected(room.error());

    UpdateSettingsEvent update;
    update.room = *room;

    auto timer_type = optional_enum<TimerMode>(data, "timerType", timer_mode_from_string);
    auto move_timeout = optional_int(data, "moveTimeout");
    auto game_time = optional_int(data, "gameTimeEach");
    auto increment = optional_int(data, "gameIncrement");
    auto action = optional_enum<ExpiryPolicy>(data, "timeoutAction", expiry_policy_from_string);
    auto difficulty = optional_enum<Difficulty>(data, "aiDifficulty", difficulty_from_string);
    auto seat_order = optional_enum<AiSeatOrder>(data, "aiSeatOrder", ai_seat_order_from_string);
    auto first = optional_enum<FirstPlayerChoice>(data, "firstPlayerChoice", first_player_choice_from_string);

    if (!timer_type || !move_timeout || !game_time || !increment ||
        !action || !difficulty || !seat_order || !first) {
        return std::unexpected(ProtocolError::InvalidField);
    }

    update.timer_type = *timer_type;
    update.move_timeout = *move_timeout;
    update.game_time_each = *game_time;
    update.game_increment = *increment;
    update.timeout_action = *action;
    update.ai_difficulty = *difficulty;
    update.ai_seat_order = *seat_order;
    update.first_player_choice = *first;

    if (data.contains("ranked")) {
        if (!data["ranked"].is_boolean()) {
            return std::unexpected(ProtocolError::InvalidField);
        }
        update.ranked = data["ranked"].get<bool>();
    }
    return update;
}

} // namespace

//===============================================================================
// CLIENT EVENT PARSING
//===============================================================================

std::expected<ClientEvent, ProtocolError> parse_client_event(std::string_view name, const json& data) {
    if (!data.is_null() && !data.is_object()) {
        return std::unexpected(ProtocolError::InvalidField);
    }

    if (name == "create") {
        CreateEvent create;
        create.ai = flag(data, "ai");
        create.ranked = flag(data, "ranked");
        if (data.is_object()) {
            auto difficulty = optional_enum<Difficulty>(data, "difficulty", difficulty_from_string);
            if (!difficulty) return std::unexpected(difficulty.error());
            create.difficulty = *difficulty;
        }
        return create;
    }
    if (name == "join") return room_only<JoinEvent>(data);
    if (name == "claimSlot") return room_only<ClaimSlotEvent>(data);
    if (name == "dropToSpectator") return room_only<DropToSpectatorEvent>(data);
    if (name == "ready") return room_only<ReadyEvent>(data);
    if (name == "timeout") return room_only<TimeoutEvent>(data);
    if (name == "rematch") return room_only<RematchEvent>(data);
    if (name == "leavePostGame") return room_only<LeavePostGameEvent>(data);
    if (name == "leavePreGame") return room_only<LeavePreGameEvent>(data);
    if (name == "takebackRequest") return room_only<TakebackRequestEvent>(data);

    if (name == "move") {
        auto room = room_field(data);
        if (!room) return std::unexpected(room.error());
        auto board = int_field(data, "board");
        if (!board) return std::unexpected(board.error());
        auto cell = int_field(data, "cell");
        if (!cell) return std::unexpected(cell.error());
        return MoveEvent{*room, *board, *cell};
    }

    if (name == "updateSettings") {
        return parse_settings(data);
    }

    if (name == "chat") {
        auto room = room_field(data);
        if (!room) return std::unexpected(room.error());
        if (!data.contains("message")) return std::unexpected(ProtocolError::MissingField);
        if (!data["message"].is_string()) return std::unexpected(ProtocolError::InvalidField);
        return ChatEvent{*room, data["message"].get<std::string>()};
    }

    if (name == "resign") {
        auto room = room_field(data);
        if (!room) return std::unexpected(room.error());
        // Older clients send "symbol"
        const char* key = data.contains("seat") ? "seat" : "symbol";
        if (!data.contains(key)) return std::unexpected(ProtocolError::MissingField);
        if (!data[key].is_string()) return std::unexpected(ProtocolError::InvalidField);
        auto seat = player_from_string(data[key].get<std::string>());
        if (!seat) return std::unexpected(ProtocolError::InvalidField);
        return ResignEvent{*room, *seat};
    }

    if (name == "takebackResponse") {
        auto room = room_field(data);
        if (!room) return std::unexpected(room.error());
        if (!data.contains("accepted")) return std::unexpected(ProtocolError::MissingField);
        if (!data["accepted"].is_boolean()) return std::unexpected(ProtocolError::InvalidField);
        return TakebackResponseEvent{*room, data["accepted"].get<bool>()};
    }

    return std::unexpected(ProtocolError::UnknownEvent);
}

std::optional<std::string> event_room(const ClientEvent& event) {
    return std::visit([](const auto& e) -> std::optional<std::string> {
        if constexpr (std::is_same_v<std::decay_t<decltype(e)>, CreateEvent>) {
            return std::nullopt;
        } else {
            return e.room;
        }
    }, event);
}

size_t utf8_length(std::string_view text) {
    // Continuation bytes (10xxxxxx) do not start a character
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::optional<std::string> sanitize_chat(std::string_view message) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto first = message.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto last = message.find_last_not_of(whitespace);
    auto trimmed = message.substr(first, last - first + 1);
    if (utf8_length(trimmed) > MAX_CHAT_LENGTH) {
        return std::nullopt;
    }
    return std::string(trimmed);
}

//===============================================================================
// SERVER EVENTS
//===============================================================================

namespace events {

ServerEvent created(const std::string& room) { return {"created", {{"room", room}}}; }
ServerEvent assign(Player seat) { return {"assign", {{"seat", std::string(player_to_string(seat))}}}; }
ServerEvent spectator() { return {"spectator", json::object()}; }
ServerEvent invalid() { return {"invalid", json::object()}; }

ServerEvent already_in_game(std::string_view error) {
    return {"alreadyInGame", {{"error", std::string(error)}}};
}

ServerEvent rematch_agreed() { return {"rematchAgreed", json::object()}; }

ServerEvent takeback_requested(const std::string& requester_name) {
    return {"takebackRequested", {{"requesterName", requester_name}}};
}

ServerEvent takeback_declined() { return {"takebackDeclined", json::object()}; }

} // namespace events

//===============================================================================
// GAME STATE ENCODING
//===============================================================================

namespace {

json line_to_json(const std::optional<Line>& line) {
    if (!line) return nullptr;
    return json::array({(*line)[0], (*line)[1], (*line)[2]});
}

json result_to_json(Result result) {
    if (result == Result::Open) return nullptr;
    return std::string(result_to_string(result));
}

} // namespace

json move_to_json(const Move& move) {
    return {
        {"board", move.board},
        {"cell", move.cell},
        {"player", std::string(player_to_string(move.player))}
    };
}

json game_to_json(const Game& game) {
    json boards = json::array();
    json winners = json::array();
    json win_lines = json::array();
    for (int b = 0; b < NUM_BOARDS; ++b) {
        json cells = json::array();
        for (int c = 0; c < BOARD_CELLS; ++c) {
            Player p = game.cell(b, c);
            cells.push_back(p == Player::Empty ? json(nullptr) : json(std::string(player_to_string(p))));
        }
        boards.push_back(std::move(cells));
        winners.push_back(result_to_json(game.mini_winner(b)));
        win_lines.push_back(line_to_json(game.mini_win_line(b)));
    }

    json history = json::array();
    for (const auto& move : game.history()) {
        history.push_back(move_to_json(move));
    }

    json state;
    state["boards"] = std::move(boards);
    state["winners"] = std::move(winners);
    state["boardWinLines"] = std::move(win_lines);
    state["player"] = std::string(player_to_string(game.current_player()));
    state["forced"] = game.forced_board() ? json(*game.forced_board()) : json(nullptr);
    state["gameWinner"] = result_to_json(game.winner());
    state["gameWinLine"] = line_to_json(game.win_line());
    state["endReason"] = game.is_over() ? json(end_reason_to_string(game.end_reason())) : json(nullptr);
    state["started"] = game.started();
    state["lastMove"] = game.last_move() ? move_to_json(*game.last_move()) : json(nullptr);
    state["moveHistory"] = std::move(history);
    return state;
}

} // namespace uttt
