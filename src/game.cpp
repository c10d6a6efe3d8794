//
//  game.cpp
//  uttt - Game engine implementation
//
//  Move validation, mini/meta board resolution and history replay
//

#include "game.hpp"

#include <algorithm>

namespace uttt {

//===============================================================================
// LINE CHECKS
//===============================================================================

Result evaluate_mini_board(const MiniBoard& cells, std::optional<Line>* line) noexcept {
    for (const auto& candidate : WIN_LINES) {
        Player first = cells[candidate[0]];
        if (first != Player::Empty &&
            first == cells[candidate[1]] &&
            first == cells[candidate[2]]) {
            if (line) *line = candidate;
            return result_for(first);
        }
    }

    if (std::ranges::none_of(cells, [](Player p) { return p == Player::Empty; })) {
        return Result::Draw;
    }
    return Result::Open;
}

Result evaluate_meta_board(const std::array<Result, NUM_BOARDS>& winners,
                           std::optional<Line>* line, EndReason* reason) noexcept {
    for (const auto& candidate : WIN_LINES) {
        Result first = winners[candidate[0]];
        if (is_win(first) &&
            first == winners[candidate[1]] &&
            first == winners[candidate[2]]) {
            if (line) *line = candidate;
            if (reason) *reason = EndReason::MetaLine;
            return first;
        }
    }

    if (std::ranges::any_of(winners, [](Result r) { return r == Result::Open; })) {
        return Result::Open;
    }

    // Every mini-board decided, no line: majority of won boards decides
    auto crosses = std::ranges::count(winners, Result::Cross);
    auto naughts = std::ranges::count(winners, Result::Naught);
    if (crosses != naughts) {
        if (reason) *reason = EndReason::Majority;
        return crosses > naughts ? Result::Cross : Result::Naught;
    }
    if (reason) *reason = EndReason::Draw;
    return Result::Draw;
}

const char* end_reason_to_string(EndReason reason) {
    switch (reason) {
        case EndReason::MetaLine:
            return "line";
        case EndReason::Majority:
            return "majority";
        case EndReason::Draw:
            return "draw";
        case EndReason::Resignation:
            return "resignation";
        case EndReason::Timeout:
            return "timeout";
        default:
            return "";
    }
}

//===============================================================================
// GAME
//===============================================================================

Game::Game() {
    for (auto& board : boards_) {
        board.fill(Player::Empty);
    }
    mini_winners_.fill(Result::Open);
    history_.reserve(TOTAL_CELLS);
}

bool Game::is_legal(int board, int cell) const noexcept {
    if (!started_ || is_over()) return false;
    if (!is_valid_index(board) || !is_valid_index(cell)) return false;
    if (mini_winners_[board] != Result::Open) return false;
    if (forced_board_ && *forced_board_ != board) return false;
    return boards_[board][cell] == Player::Empty;
}

bool Game::make_move(int board, int cell) {
    if (!is_legal(board, cell)) {
        return false;
    }
    place(board, cell);
    return true;
}

void Game::place(int board, int cell) {
    Player player = current_player_;
    boards_[board][cell] = player;
    last_move_ = Move{board, cell, player};
    history_.push_back(*last_move_);

    if (mini_winners_[board] == Result::Open) {
        std::optional<Line> line;
        Result resolved = evaluate_mini_board(boards_[board], &line);
        if (resolved != Result::Open) {
            mini_winners_[board] = resolved;
            mini_win_lines_[board] = line;
        }
    }

    EndReason reason = EndReason::None;
    std::optional<Line> meta_line;
    winner_ = evaluate_meta_board(mini_winners_, &meta_line, &reason);
    win_line_ = meta_line;
    end_reason_ = winner_ == Result::Open ? EndReason::None : reason;

    // The cell index names the next board, unless that board is already decided
    if (mini_winners_[cell] == Result::Open) {
        forced_board_ = cell;
    } else {
        forced_board_.reset();
    }
    current_player_ = other_player(player);
}

void Game::resign(Player loser) {
    forfeit(loser, EndReason::Resignation);
}

void Game::forfeit_on_time(Player loser) {
    forfeit(loser, EndReason::Timeout);
}

void Game::forfeit(Player loser, EndReason reason) {
    winner_ = result_for(other_player(loser));
    win_line_.reset();
    end_reason_ = reason;
}

bool Game::undo_last_move() {
    if (history_.empty() || is_over()) {
        return false;
    }

    std::vector<Move> replay(history_.begin(), history_.end() - 1);
    bool was_started = started_;

    *this = Game();
    started_ = was_started;
    for (const auto& move : replay) {
        place(move.board, move.cell);
    }
    return true;
}

std::vector<Move> Game::valid_moves() const {
    std::vector<Move> moves;
    if (!started_ || is_over()) {
        return moves;
    }

    moves.reserve(TOTAL_CELLS);
    for (int board = 0; board < NUM_BOARDS; ++board) {
        if (forced_board_ && *forced_board_ != board) continue;
        if (mini_winners_[board] != Result::Open) continue;
        for (int cell = 0; cell < BOARD_CELLS; ++cell) {
            if (boards_[board][cell] == Player::Empty) {
                moves.push_back({board, cell, current_player_});
            }
        }
    }
    return moves;
}

int Game::occupied_cells() const noexcept {
    int count = 0;
    for (const auto& board : boards_) {
        count += static_cast<int>(std::ranges::count_if(board, [](Player p) { return p != Player::Empty; }));
    }
    return count;
}

} // namespace uttt
