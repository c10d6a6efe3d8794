//
//  ai.hpp
//  uttt - AI module: random, greedy and iterative-deepening search
//
//  Handles AI move selection, alpha-beta search and move ordering
//

#pragma once

#include "uttt.hpp"
#include "game.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace uttt {

class ThreadPool;

using Rng = std::mt19937_64;

//===============================================================================
// AI CONSTANTS
//===============================================================================

inline constexpr int WIN_SCORE = 1'000'000;
inline constexpr int LOSE_SCORE = -1'000'000;
inline constexpr int MAX_SEARCH_DEPTH = 24;
inline constexpr int MAX_KILLER_MOVES = 2;

// Root moves whose minimax value is within this margin of the best may be
// re-ranked by rollouts
inline constexpr int ROLLOUT_MARGIN = 150;

//===============================================================================
// SEARCH BOARD
//===============================================================================

struct Cell {
    int8_t board;
    int8_t cell;

    constexpr bool operator==(const Cell&) const = default;
};

using MoveList = std::array<Cell, TOTAL_CELLS>;

/**
 * Fixed-size copy of the engine state used inside search. No history and no
 * heap storage, so copying it is a flat memcpy.
 */
struct SearchBoard {
    std::array<MiniBoard, NUM_BOARDS> cells{};
    std::array<Result, NUM_BOARDS> minis{};
    Player to_move = Player::Cross;
    int8_t forced = NO_BOARD;
    Result winner = Result::Open;

    static SearchBoard from_game(const Game& game) noexcept;

    /**
     * Fills `out` with the legal moves.
     * @return Number of moves written
     */
    int legal_moves(MoveList& out) const noexcept;

    /**
     * Plays for the side to move. The caller guarantees legality.
     */
    void play(int board, int cell) noexcept;

    [[nodiscard]] bool is_over() const noexcept { return winner != Result::Open; }
};

//===============================================================================
// SEARCH API
//===============================================================================

struct SearchOptions {
    std::chrono::milliseconds budget{2500};
    ThreadPool* pool = nullptr;     // rollout workers, optional
    double rollout_share = 0.3;     // part of the budget kept for rollouts
};

/**
 * Result of a move search. board/cell are NO_BOARD when no move exists.
 */
struct AiMove {
    int board = NO_BOARD;
    int cell = NO_BOARD;
    int depth_reached = 0;
    int64_t positions_evaluated = 0;
    int64_t rollouts = 0;
    double elapsed = 0.0;
    int score = 0;

    [[nodiscard]] bool valid() const noexcept { return board != NO_BOARD; }

    static AiMove none() { return {}; }
    static AiMove at(int board, int cell) {
        AiMove move;
        move.board = board;
        move.cell = cell;
        return move;
    }
};

/**
 * Picks a move for the side to move in `game` without touching it.
 * Always returns a legal move when one exists.
 */
AiMove select_move(const Game& game, Difficulty difficulty,
                   const SearchOptions& options, Rng& rng);

/**
 * Uniformly random legal move.
 */
AiMove find_random_move(const Game& game, Rng& rng);

/**
 * Single-ply greedy choice: win, block, mini-board win, mini-board block,
 * center cells, corners, then random.
 */
AiMove find_greedy_move(const Game& game, Rng& rng);

/**
 * Iterative-deepening alpha-beta bounded by options.budget, followed by a
 * rollout refinement over near-equal root candidates.
 */
AiMove find_best_ai_move(const Game& game, const SearchOptions& options, Rng& rng);

//===============================================================================
// EVALUATION AND MOVE ORDERING
//===============================================================================

/**
 * Static evaluation from the point of view of `ai`. Positive is good for `ai`.
 * @param ply Distance from the root, used to prefer faster wins
 */
[[nodiscard]] int evaluate_position(const SearchBoard& board, Player ai, int ply = 0) noexcept;

/**
 * Ordering priority for trying `move` first. Higher is tried earlier.
 */
[[nodiscard]] int move_ordering_score(const SearchBoard& board, Cell move) noexcept;

/**
 * True when `who` placing a mark at `move` wins the whole match.
 */
[[nodiscard]] bool is_winning_move(const SearchBoard& board, Cell move, Player who) noexcept;

/**
 * True when `who` placing a mark at `move` resolves that mini-board in their favor.
 */
[[nodiscard]] bool wins_mini_board(const SearchBoard& board, Cell move, Player who) noexcept;

/**
 * Minimax with alpha-beta pruning to a fixed depth, no deadline.
 * Exposed for tests; the timed search lives in find_best_ai_move.
 */
int minimax(const SearchBoard& board, int depth, int alpha, int beta, Player ai);

//===============================================================================
// TAUNTS
//===============================================================================

/**
 * Occasionally returns a difficulty-flavored line for the AI to post in chat.
 */
std::optional<std::string> maybe_taunt(Difficulty difficulty, Rng& rng);

} // namespace uttt
