//
//  ai.cpp
//  uttt - AI module for move selection and minimax search
//
//  Handles AI move finding, alpha-beta search and move prioritization
//

#include "ai.hpp"
#include "ai_parallel.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cmath>
#include <span>
#include <vector>

namespace uttt {

namespace {

using SteadyClock = std::chrono::steady_clock;

//===============================================================================
// AI CONSTANTS AND STRUCTURES
//===============================================================================

constexpr int INF = WIN_SCORE * 2;

// Strategic value of owning each mini-board: center >> corners >> edges
constexpr std::array<int, 9> META_VALUE = {6, 3, 6, 3, 10, 3, 6, 3, 6};

// Cell weight inside a mini-board: center > corners > edges
constexpr std::array<int, 9> CELL_VALUE = {3, 2, 3, 2, 4, 2, 3, 2, 3};

// Cost of sending the opponent to board i. Edges are slightly good for us.
constexpr std::array<int, 9> SEND_PENALTY = {60, -20, 60, -20, 200, -20, 60, -20, 60};

// Opponent gets to pick any open board
constexpr int FREE_MOVE_PENALTY = 700;

constexpr double EASY_INSTINCT_CHANCE = 0.15;
constexpr double MEDIUM_RANDOM_CHANCE = 0.5;
constexpr size_t MAX_ROLLOUT_CANDIDATES = 4;
constexpr int64_t MIN_ROLLOUTS_PER_CANDIDATE = 24;
constexpr double ROLLOUT_SWITCH_EDGE = 0.05;

struct ScoredMove {
    Cell move;
    int score;
};

struct SearchContext {
    Player ai = Player::Cross;
    SteadyClock::time_point deadline{};
    bool timed = false;
    bool timed_out = false;
    int64_t nodes = 0;
    std::array<std::array<Cell, MAX_KILLER_MOVES>, MAX_SEARCH_DEPTH + 1> killers{};

    SearchContext() {
        for (auto& slot : killers) {
            slot.fill(Cell{NO_BOARD, NO_BOARD});
        }
    }
};

AiMove to_ai_move(Cell cell) {
    return AiMove::at(cell.board, cell.cell);
}

//===============================================================================
// HEURISTIC HELPERS
//===============================================================================

/**
 * Score one open mini-board: two-in-a-row threats plus positional cells.
 */
int mini_board_score(const MiniBoard& cells, Player ai, Player opp) noexcept {
    int score = 0;
    for (const auto& line : WIN_LINES) {
        int mine = 0;
        int theirs = 0;
        for (int index : line) {
            if (cells[index] == ai) ++mine;
            else if (cells[index] == opp) ++theirs;
        }
        if (mine > 0 && theirs == 0) {
            score += mine == 1 ? 10 : 100;
        } else if (theirs > 0 && mine == 0) {
            score -= theirs == 1 ? 12 : 120;   // defend slightly more
        }
    }
    for (int i = 0; i < BOARD_CELLS; ++i) {
        if (cells[i] == ai) score += CELL_VALUE[i];
        else if (cells[i] == opp) score -= CELL_VALUE[i];
    }
    return score;
}

void remember_killer(SearchContext& ctx, int ply, Cell move) {
    if (ply > MAX_SEARCH_DEPTH) return;
    auto& slot = ctx.killers[ply];
    if (slot[0] == move) return;
    slot[1] = slot[0];
    slot[0] = move;
}

bool is_killer(const SearchContext& ctx, int ply, Cell move) {
    if (ply > MAX_SEARCH_DEPTH) return false;
    const auto& slot = ctx.killers[ply];
    return slot[0] == move || slot[1] == move;
}

/**
 * Sorts moves so that wins, blocks and strong positional moves come first.
 */
int order_moves(const SearchContext& ctx, const SearchBoard& board, MoveList& moves,
                int count, int ply, std::array<ScoredMove, TOTAL_CELLS>& out) {
    for (int i = 0; i < count; ++i) {
        int score = move_ordering_score(board, moves[i]);
        if (is_killer(ctx, ply, moves[i])) {
            score += 500;
        }
        out[i] = {moves[i], score};
    }
    std::stable_sort(out.begin(), out.begin() + count,
                     [](const ScoredMove& a, const ScoredMove& b) { return a.score > b.score; });
    return count;
}

//===============================================================================
// ALPHA-BETA
//===============================================================================

int alphabeta(SearchContext& ctx, const SearchBoard& board, int depth,
              int alpha, int beta, int ply) {
    ++ctx.nodes;
    if (ctx.timed && (ctx.nodes & 127) == 0 && SteadyClock::now() >= ctx.deadline) {
        ctx.timed_out = true;
    }
    if (ctx.timed_out) {
        return 0;
    }

    if (board.is_over() || depth == 0) {
        return evaluate_position(board, ctx.ai, ply);
    }

    MoveList moves;
    int count = board.legal_moves(moves);
    if (count == 0) {
        return evaluate_position(board, ctx.ai, ply);
    }

    std::array<ScoredMove, TOTAL_CELLS> ordered;
    order_moves(ctx, board, moves, count, ply, ordered);

    bool maximizing = board.to_move == ctx.ai;
    int best = maximizing ? -INF : INF;

    for (int i = 0; i < count; ++i) {
        SearchBoard child = board;
        child.play(ordered[i].move.board, ordered[i].move.cell);
        int value = alphabeta(ctx, child, depth - 1, alpha, beta, ply + 1);
        if (ctx.timed_out) {
            return 0;
        }

        if (maximizing) {
            best = std::max(best, value);
            alpha = std::max(alpha, best);
        } else {
            best = std::min(best, value);
            beta = std::min(beta, best);
        }
        if (beta <= alpha) {
            remember_killer(ctx, ply, ordered[i].move);
            break;
        }
    }
    return best;
}

/**
 * One root iteration. Later moves are searched against a lowered alpha so
 * every move within ROLLOUT_MARGIN of the best gets an exact value.
 * @return false if the deadline interrupted the iteration
 */
bool search_root(SearchContext& ctx, const SearchBoard& root, int depth,
                 std::span<ScoredMove> roots) {
    int best = -INF;
    for (auto& entry : roots) {
        SearchBoard child = root;
        child.play(entry.move.board, entry.move.cell);
        int window = best == -INF ? -INF : best - ROLLOUT_MARGIN - 1;
        int value = alphabeta(ctx, child, depth - 1, window, INF, 1);
        if (ctx.timed_out) {
            return false;
        }
        entry.score = value;
        best = std::max(best, value);
    }
    std::stable_sort(roots.begin(), roots.end(),
                     [](const ScoredMove& a, const ScoredMove& b) { return a.score > b.score; });
    return true;
}

//===============================================================================
// ROLLOUT REFINEMENT
//===============================================================================

void refine_with_rollouts(const SearchBoard& root, std::span<const ScoredMove> roots,
                          SteadyClock::time_point deadline, const SearchOptions& options,
                          Rng& rng, AiMove& result) {
    if (roots.size() < 2 || std::abs(roots[0].score) >= WIN_SCORE / 2) {
        return;
    }

    std::vector<SearchBoard> children;
    std::vector<Cell> candidates;
    for (const auto& entry : roots) {
        if (candidates.size() >= MAX_ROLLOUT_CANDIDATES) break;
        if (entry.score < roots[0].score - ROLLOUT_MARGIN) break;
        SearchBoard child = root;
        child.play(entry.move.board, entry.move.cell);
        children.push_back(child);
        candidates.push_back(entry.move);
    }
    if (candidates.size() < 2) {
        return;
    }

    ParallelRollouts rollouts(options.pool);
    auto stats = rollouts.run(children, root.to_move, deadline, rng);

    size_t chosen = 0;
    for (size_t i = 0; i < stats.size(); ++i) {
        result.rollouts += stats[i].playouts;
    }
    if (stats[0].playouts < MIN_ROLLOUTS_PER_CANDIDATE) {
        return;
    }
    for (size_t i = 1; i < stats.size(); ++i) {
        if (stats[i].playouts < MIN_ROLLOUTS_PER_CANDIDATE) continue;
        if (stats[i].rate() > stats[chosen].rate() + ROLLOUT_SWITCH_EDGE) {
            chosen = i;
        }
    }
    if (chosen != 0) {
        log::debug("rollouts prefer {}/{} over {}/{} ({:.2f} vs {:.2f})",
                   candidates[chosen].board, candidates[chosen].cell,
                   candidates[0].board, candidates[0].cell,
                   stats[chosen].rate(), stats[0].rate());
        result.board = candidates[chosen].board;
        result.cell = candidates[chosen].cell;
        result.score = roots[chosen].score;
    }
}

template<typename T>
T pick(const std::vector<T>& items, Rng& rng) {
    std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

bool chance(double probability, Rng& rng) {
    std::bernoulli_distribution dist(probability);
    return dist(rng);
}

} // namespace

//===============================================================================
// SEARCH BOARD
//===============================================================================

SearchBoard SearchBoard::from_game(const Game& game) noexcept {
    SearchBoard board;
    board.cells = game.boards();
    board.minis = game.mini_winners();
    board.to_move = game.current_player();
    board.forced = static_cast<int8_t>(game.forced_board().value_or(NO_BOARD));
    board.winner = game.winner();
    return board;
}

int SearchBoard::legal_moves(MoveList& out) const noexcept {
    if (is_over()) {
        return 0;
    }
    int count = 0;
    for (int board = 0; board < NUM_BOARDS; ++board) {
        if (forced != NO_BOARD && forced != board) continue;
        if (minis[board] != Result::Open) continue;
        for (int cell = 0; cell < BOARD_CELLS; ++cell) {
            if (cells[board][cell] == Player::Empty) {
                out[count++] = Cell{static_cast<int8_t>(board), static_cast<int8_t>(cell)};
            }
        }
    }
    return count;
}

void SearchBoard::play(int board, int cell) noexcept {
    Player player = to_move;
    cells[board][cell] = player;
    if (minis[board] == Result::Open) {
        minis[board] = evaluate_mini_board(cells[board]);
    }
    winner = evaluate_meta_board(minis);
    forced = minis[cell] == Result::Open ? static_cast<int8_t>(cell) : static_cast<int8_t>(NO_BOARD);
    to_move = other_player(player);
}

//===============================================================================
// EVALUATION
//===============================================================================

int evaluate_position(const SearchBoard& board, Player ai, int ply) noexcept {
    Player opp = other_player(ai);

    if (board.winner == result_for(ai)) return WIN_SCORE - ply;
    if (board.winner == result_for(opp)) return LOSE_SCORE + ply;
    if (board.winner == Result::Draw) return 0;

    int score = 0;

    // Meta-board lines: two boards in a row outweighs everything positional
    for (const auto& line : WIN_LINES) {
        int mine = 0;
        int theirs = 0;
        bool dead = false;
        for (int index : line) {
            Result r = board.minis[index];
            if (r == result_for(ai)) ++mine;
            else if (r == result_for(opp)) ++theirs;
            else if (r == Result::Draw) dead = true;
        }
        if (dead) continue;
        int importance = (line[0] == CENTER || line[1] == CENTER || line[2] == CENTER) ? 2 : 1;
        if (mine > 0 && theirs == 0) {
            score += importance * (mine == 1 ? 500 : 4000);
        } else if (theirs > 0 && mine == 0) {
            score -= importance * (theirs == 1 ? 600 : 5000);
        }
    }

    // Mini-board control weighted by board position
    for (int i = 0; i < NUM_BOARDS; ++i) {
        int value = META_VALUE[i];
        Result r = board.minis[i];
        if (r == result_for(ai)) {
            score += value * 80;
        } else if (r == result_for(opp)) {
            score -= value * 95;
        } else if (r == Result::Open) {
            score += mini_board_score(board.cells[i], ai, opp) * value / 6;
        }
    }

    // Where the side to move has been sent
    int destination = board.forced == NO_BOARD ? FREE_MOVE_PENALTY : SEND_PENALTY[board.forced];
    score += board.to_move == ai ? destination : -destination;

    return score;
}

bool is_winning_move(const SearchBoard& board, Cell move, Player who) noexcept {
    SearchBoard after = board;
    after.to_move = who;
    after.play(move.board, move.cell);
    return after.winner == result_for(who);
}

bool wins_mini_board(const SearchBoard& board, Cell move, Player who) noexcept {
    MiniBoard cells = board.cells[move.board];
    cells[move.cell] = who;
    return evaluate_mini_board(cells) == result_for(who);
}

int move_ordering_score(const SearchBoard& board, Cell move) noexcept {
    Player current = board.to_move;
    Player opp = other_player(current);

    SearchBoard after = board;
    after.play(move.board, move.cell);
    if (after.winner == result_for(current)) {
        return 1'000'000;
    }

    int score = 0;
    if (is_winning_move(board, move, opp)) {
        score += 80'000;
    }
    if (wins_mini_board(board, move, current)) {
        score += 3000 * META_VALUE[move.board];
    }
    if (wins_mini_board(board, move, opp)) {
        score += 2000 * META_VALUE[move.board];
    }
    if (!after.is_over()) {
        if (after.forced == NO_BOARD) {
            score -= 5000;
        } else {
            score -= SEND_PENALTY[after.forced] * 20;
        }
    }
    score += META_VALUE[move.board] * 30;
    score += CELL_VALUE[move.cell] * 10;
    return score;
}

int minimax(const SearchBoard& board, int depth, int alpha, int beta, Player ai) {
    SearchContext ctx;
    ctx.ai = ai;
    return alphabeta(ctx, board, depth, alpha, beta, 0);
}

//===============================================================================
// MOVE FINDING
//===============================================================================

AiMove find_random_move(const Game& game, Rng& rng) {
    auto moves = game.valid_moves();
    if (moves.empty()) {
        return AiMove::none();
    }
    Move move = pick(moves, rng);
    return AiMove::at(move.board, move.cell);
}

AiMove find_greedy_move(const Game& game, Rng& rng) {
    auto valid = game.valid_moves();
    if (valid.empty()) {
        return AiMove::none();
    }

    SearchBoard board = SearchBoard::from_game(game);
    Player ai = board.to_move;
    Player opp = other_player(ai);
    auto as_cell = [](const Move& m) {
        return Cell{static_cast<int8_t>(m.board), static_cast<int8_t>(m.cell)};
    };

    // Win the match
    for (const auto& m : valid) {
        if (is_winning_move(board, as_cell(m), ai)) return AiMove::at(m.board, m.cell);
    }
    // Block the opponent's match win
    for (const auto& m : valid) {
        if (is_winning_move(board, as_cell(m), opp)) return AiMove::at(m.board, m.cell);
    }
    // Win a mini-board, center board first, then corners, then edges
    for (int preferred : BOARD_PREFERENCE) {
        for (const auto& m : valid) {
            if (m.board == preferred && wins_mini_board(board, as_cell(m), ai)) {
                return AiMove::at(m.board, m.cell);
            }
        }
    }
    // Block a mini-board, same order
    for (int preferred : BOARD_PREFERENCE) {
        for (const auto& m : valid) {
            if (m.board == preferred && wins_mini_board(board, as_cell(m), opp)) {
                return AiMove::at(m.board, m.cell);
            }
        }
    }
    // Center cell of the center board, then of a corner board
    for (int preferred : BOARD_PREFERENCE) {
        if (is_edge(preferred)) break;
        for (const auto& m : valid) {
            if (m.board == preferred && m.cell == CENTER) return AiMove::at(m.board, m.cell);
        }
    }
    std::vector<Move> corners;
    for (const auto& m : valid) {
        if (is_corner(m.cell)) corners.push_back(m);
    }
    if (!corners.empty()) {
        Move m = pick(corners, rng);
        return AiMove::at(m.board, m.cell);
    }
    Move m = pick(valid, rng);
    return AiMove::at(m.board, m.cell);
}

AiMove find_best_ai_move(const Game& game, const SearchOptions& options, Rng& rng) {
    auto start = SteadyClock::now();
    SearchBoard root = SearchBoard::from_game(game);

    MoveList moves;
    int count = root.legal_moves(moves);
    if (count == 0) {
        return AiMove::none();
    }

    AiMove result = to_ai_move(moves[0]);
    if (count == 1) {
        return result;
    }

    Player ai = root.to_move;
    Player opp = other_player(ai);

    // Instant win
    for (int i = 0; i < count; ++i) {
        if (is_winning_move(root, moves[i], ai)) {
            result = to_ai_move(moves[i]);
            result.score = WIN_SCORE;
            return result;
        }
    }

    SearchContext ctx;
    ctx.ai = ai;
    ctx.timed = true;

    std::array<ScoredMove, TOTAL_CELLS> roots;
    order_moves(ctx, root, moves, count, 0, roots);
    result = to_ai_move(roots[0].move);

    // Instant block stays the answer if no search depth completes
    for (int i = 0; i < count; ++i) {
        if (is_winning_move(root, moves[i], opp)) {
            result = to_ai_move(moves[i]);
            break;
        }
    }

    auto search_budget = std::chrono::duration_cast<SteadyClock::duration>(
        options.budget * (1.0 - std::clamp(options.rollout_share, 0.0, 0.9)));
    auto final_deadline = start + options.budget;
    ctx.deadline = start + search_budget;

    std::span<ScoredMove> root_span(roots.data(), static_cast<size_t>(count));
    int empty_cells = TOTAL_CELLS;
    for (const auto& mini : root.cells) {
        empty_cells -= static_cast<int>(std::ranges::count_if(mini, [](Player p) { return p != Player::Empty; }));
    }

    try {
        for (int depth = 1; depth <= MAX_SEARCH_DEPTH; ++depth) {
            if (SteadyClock::now() >= ctx.deadline) {
                break;
            }
            std::array<ScoredMove, TOTAL_CELLS> attempt = roots;
            std::span<ScoredMove> attempt_span(attempt.data(), static_cast<size_t>(count));
            if (!search_root(ctx, root, depth, attempt_span)) {
                break;
            }

            // Only fully completed depths replace the answer
            roots = attempt;
            result.board = roots[0].move.board;
            result.cell = roots[0].move.cell;
            result.score = roots[0].score;
            result.depth_reached = depth;

            if (roots[0].score >= WIN_SCORE - MAX_SEARCH_DEPTH - 1 ||
                roots[0].score <= LOSE_SCORE + MAX_SEARCH_DEPTH + 1 ||
                depth >= empty_cells) {
                break;
            }
        }

        if (result.depth_reached > 0 && SteadyClock::now() < final_deadline) {
            refine_with_rollouts(root, root_span, final_deadline, options, rng, result);
        }
    } catch (const std::exception& e) {
        log::warn("AI search failed, keeping best move so far: {}", e.what());
    }

    result.positions_evaluated = ctx.nodes;
    return result;
}

AiMove select_move(const Game& game, Difficulty difficulty,
                   const SearchOptions& options, Rng& rng) {
    auto start = SteadyClock::now();
    AiMove move;

    switch (difficulty) {
        case Difficulty::Easy: {
            move = find_random_move(game, rng);
            if (move.valid() && chance(EASY_INSTINCT_CHANCE, rng)) {
                SearchBoard board = SearchBoard::from_game(game);
                for (const auto& m : game.valid_moves()) {
                    Cell cell{static_cast<int8_t>(m.board), static_cast<int8_t>(m.cell)};
                    if (is_winning_move(board, cell, board.to_move)) {
                        move = AiMove::at(m.board, m.cell);
                        break;
                    }
                }
            }
            break;
        }
        case Difficulty::Medium:
            move = chance(MEDIUM_RANDOM_CHANCE, rng) ? find_random_move(game, rng)
                                                    : find_greedy_move(game, rng);
            break;
        case Difficulty::Hard:
            move = find_best_ai_move(game, options, rng);
            break;
    }

    if (move.valid() && !game.is_legal(move.board, move.cell)) {
        log::error("AI produced illegal move {}/{}, falling back to random", move.board, move.cell);
        move = find_random_move(game, rng);
    }

    move.elapsed = std::chrono::duration<double>(SteadyClock::now() - start).count();
    return move;
}

//===============================================================================
// TAUNTS
//===============================================================================

std::optional<std::string> maybe_taunt(Difficulty difficulty, Rng& rng) {
    static const std::vector<std::string> easy_lines = {
        "beep boop, was that a good one?",
        "i am still reading the rules...",
        "oops. i meant to do that.",
        "my circuits feel a bit dizzy",
        "honestly i just picked one",
        "is it my turn again already?",
    };
    static const std::vector<std::string> medium_lines = {
        "calculated.",
        "i see what you are planning.",
        "that will not work twice.",
        "bold move. let us see.",
        "closer. still not close enough.",
        "you are sending me where now?",
    };
    static const std::vector<std::string> hard_lines = {
        "i saw this position four moves ago.",
        "every branch ends the same way.",
        "resistance is a rounding error.",
        "was that the plan? really?",
        "you played well. i played better.",
        "the center board was never yours.",
    };

    double probability = 0.3;
    const std::vector<std::string>* lines = &medium_lines;
    switch (difficulty) {
        case Difficulty::Easy:
            probability = 0.5;
            lines = &easy_lines;
            break;
        case Difficulty::Medium:
            probability = 0.3;
            lines = &medium_lines;
            break;
        case Difficulty::Hard:
            probability = 0.35;
            lines = &hard_lines;
            break;
    }

    if (!chance(probability, rng)) {
        return std::nullopt;
    }
    return pick(*lines, rng);
}

} // namespace uttt
