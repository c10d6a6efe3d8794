//
//  game.hpp
//  uttt - Game engine: board state, legality, win detection, undo
//
//  A pure state machine for one Ultimate Tic-Tac-Toe match
//

#pragma once

#include "uttt.hpp"

#include <array>
#include <optional>
#include <vector>

namespace uttt {

//===============================================================================
// GAME TYPES
//===============================================================================

/**
 * One placed mark. The history of a game is an ordered list of these.
 */
struct Move {
    int board = NO_BOARD;
    int cell = NO_BOARD;
    Player player = Player::Empty;

    constexpr bool operator==(const Move&) const = default;
};

/**
 * Why the match ended.
 */
enum class EndReason : uint8_t {
    None,
    MetaLine,     // three mini-boards in a row
    Majority,     // all boards decided, more mini-boards won
    Draw,         // all boards decided, equal mini-board counts
    Resignation,
    Timeout
};

using MiniBoard = std::array<Player, BOARD_CELLS>;

/**
 * Checks one 3x3 grid of marks.
 * @param line Receives the winning line when a player owns one
 * @return Cross/Naught for a line win, Draw when full, Open otherwise
 */
Result evaluate_mini_board(const MiniBoard& cells, std::optional<Line>* line = nullptr) noexcept;

/**
 * Checks the meta board of mini-board outcomes. Drawn mini-boards count for
 * nobody; when every board is decided without a line, the side holding more
 * mini-boards wins and equal counts draw.
 */
Result evaluate_meta_board(const std::array<Result, NUM_BOARDS>& winners,
                           std::optional<Line>* line = nullptr,
                           EndReason* reason = nullptr) noexcept;

//===============================================================================
// GAME CLASS
//===============================================================================

class Game {
public:
    Game();

    /**
     * Marks the match as started. Moves are rejected until then.
     */
    void start() noexcept { started_ = true; }

    /**
     * Places the current player's mark at (board, cell).
     * @return false with no mutation if the move is not legal
     */
    bool make_move(int board, int cell);

    /**
     * Concession: the opposing seat wins regardless of current state.
     */
    void resign(Player loser);

    /**
     * Clock forfeit. Same effect as resign, recorded as a timeout.
     */
    void forfeit_on_time(Player loser);

    /**
     * Takes back the last move by replaying the remaining history.
     * @return false if there is nothing to undo or the match is over
     */
    bool undo_last_move();

    /**
     * Every (board, cell) the current player may play, board-major order.
     */
    [[nodiscard]] std::vector<Move> valid_moves() const;

    [[nodiscard]] bool is_legal(int board, int cell) const noexcept;

    //===============================================================================
    // ACCESSORS
    //===============================================================================

    [[nodiscard]] Player cell(int board, int cell) const noexcept { return boards_[board][cell]; }
    [[nodiscard]] const MiniBoard& mini_board(int board) const noexcept { return boards_[board]; }
    [[nodiscard]] const std::array<MiniBoard, NUM_BOARDS>& boards() const noexcept { return boards_; }
    [[nodiscard]] Result mini_winner(int board) const noexcept { return mini_winners_[board]; }
    [[nodiscard]] const std::array<Result, NUM_BOARDS>& mini_winners() const noexcept { return mini_winners_; }
    [[nodiscard]] const std::optional<Line>& mini_win_line(int board) const noexcept { return mini_win_lines_[board]; }
    [[nodiscard]] Player current_player() const noexcept { return current_player_; }
    [[nodiscard]] std::optional<int> forced_board() const noexcept { return forced_board_; }
    [[nodiscard]] Result winner() const noexcept { return winner_; }
    [[nodiscard]] const std::optional<Line>& win_line() const noexcept { return win_line_; }
    [[nodiscard]] EndReason end_reason() const noexcept { return end_reason_; }
    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] bool is_over() const noexcept { return winner_ != Result::Open; }
    [[nodiscard]] const std::optional<Move>& last_move() const noexcept { return last_move_; }
    [[nodiscard]] const std::vector<Move>& history() const noexcept { return history_; }
    [[nodiscard]] int occupied_cells() const noexcept;

    bool operator==(const Game&) const = default;

private:
    void place(int board, int cell);
    void forfeit(Player loser, EndReason reason);

    std::array<MiniBoard, NUM_BOARDS> boards_{};
    std::array<Result, NUM_BOARDS> mini_winners_{};
    std::array<std::optional<Line>, NUM_BOARDS> mini_win_lines_{};
    Player current_player_ = Player::Cross;
    std::optional<int> forced_board_;
    Result winner_ = Result::Open;
    std::optional<Line> win_line_;
    EndReason end_reason_ = EndReason::None;
    bool started_ = false;
    std::optional<Move> last_move_;
    std::vector<Move> history_;
};

const char* end_reason_to_string(EndReason reason);

} // namespace uttt
