//
//  uttt.hpp
//  uttt - Core types and constants for Ultimate Tic-Tac-Toe
//
//  Shared by the engine, the AI search and the room coordinator
//

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace uttt {

//===============================================================================
// GAME METADATA
//===============================================================================

inline constexpr std::string_view GAME_NAME = "Ultimate Tic-Tac-Toe";
inline constexpr std::string_view GAME_VERSION = "1.0.0";
inline constexpr std::string_view SERVICE_NAME = "uttt-httpd";
inline constexpr std::string_view GAME_DESCRIPTION =
    "Nine tic-tac-toe boards played as one: win three mini-boards in a row";

//===============================================================================
// BOARD GEOMETRY
//===============================================================================

inline constexpr int NUM_BOARDS = 9;
inline constexpr int BOARD_CELLS = 9;
inline constexpr int TOTAL_CELLS = NUM_BOARDS * BOARD_CELLS;
inline constexpr int CENTER = 4;
inline constexpr int NO_BOARD = -1;

using Line = std::array<int, 3>;

// Three rows, three columns, two diagonals
inline constexpr std::array<Line, 8> WIN_LINES = {{
    {0, 1, 2}, {3, 4, 5}, {6, 7, 8},
    {0, 3, 6}, {1, 4, 7}, {2, 5, 8},
    {0, 4, 8}, {2, 4, 6}
}};

// Center first, then corners, then edges
inline constexpr std::array<int, 9> BOARD_PREFERENCE = {4, 0, 2, 6, 8, 1, 3, 5, 7};

constexpr bool is_corner(int index) noexcept {
    return index == 0 || index == 2 || index == 6 || index == 8;
}

constexpr bool is_edge(int index) noexcept {
    return index == 1 || index == 3 || index == 5 || index == 7;
}

constexpr bool is_valid_index(int index) noexcept {
    return index >= 0 && index < 9;
}

//===============================================================================
// PLAYERS AND OUTCOMES
//===============================================================================

// Cell contents and seat identity. X always moves first.
enum class Player : int8_t {
    Empty = 0,
    Cross = 1,
    Naught = -1
};

// Resolution of a mini-board or of the whole match.
// Cross and Naught share their numeric values with Player.
enum class Result : int8_t {
    Open = 0,
    Cross = 1,
    Naught = -1,
    Draw = 2
};

enum class Difficulty : uint8_t {
    Easy,
    Medium,
    Hard
};

constexpr Player other_player(Player player) noexcept {
    return (player == Player::Cross) ? Player::Naught : Player::Cross;
}

constexpr Result result_for(Player player) noexcept {
    return static_cast<Result>(static_cast<int8_t>(player));
}

constexpr bool is_win(Result result) noexcept {
    return result == Result::Cross || result == Result::Naught;
}

// Only meaningful when is_win(result)
constexpr Player winner_of(Result result) noexcept {
    return static_cast<Player>(static_cast<int8_t>(result));
}

// 0 for X, 1 for O; used to index per-seat arrays
constexpr int seat_index(Player player) noexcept {
    return player == Player::Cross ? 0 : 1;
}

constexpr Player seat_player(int index) noexcept {
    return index == 0 ? Player::Cross : Player::Naught;
}

//===============================================================================
// STRING CONVERSIONS (wire format)
//===============================================================================

constexpr std::string_view player_to_string(Player player) noexcept {
    switch (player) {
        case Player::Cross: return "X";
        case Player::Naught: return "O";
        default: return "";
    }
}

constexpr std::string_view result_to_string(Result result) noexcept {
    switch (result) {
        case Result::Cross: return "X";
        case Result::Naught: return "O";
        case Result::Draw: return "D";
        default: return "";
    }
}

constexpr std::string_view difficulty_to_string(Difficulty difficulty) noexcept {
    switch (difficulty) {
        case Difficulty::Easy: return "easy";
        case Difficulty::Hard: return "hard";
        default: return "medium";
    }
}

constexpr std::optional<Player> player_from_string(std::string_view text) noexcept {
    if (text == "X" || text == "x") return Player::Cross;
    if (text == "O" || text == "o") return Player::Naught;
    return std::nullopt;
}

constexpr std::optional<Difficulty> difficulty_from_string(std::string_view text) noexcept {
    if (text == "easy") return Difficulty::Easy;
    if (text == "medium") return Difficulty::Medium;
    if (text == "hard") return Difficulty::Hard;
    return std::nullopt;
}

//===============================================================================
// RESULT TYPES
//===============================================================================

template<typename T>
using Expected = std::expected<T, std::string>;

} // namespace uttt
