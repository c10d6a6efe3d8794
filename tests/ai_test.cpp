//
//  ai_test.cpp
//  uttt tests - Move selection, search and rollouts
//

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <random>
#include <vector>

#include "ai.hpp"
#include "ai_parallel.hpp"
#include "player.hpp"
#include "util/thread_pool.hpp"

using namespace uttt;
using namespace std::chrono_literals;

namespace {

using MoveSeq = std::vector<std::pair<int, int>>;

// X to move in board 4; (4, 1) completes the top row of board 4 and the
// 2-4-6 meta diagonal. No other move wins.
const MoveSeq WIN_IN_ONE = {
    {2, 3}, {3, 4}, {4, 2}, {2, 1}, {1, 5}, {5, 2}, {2, 4}, {4, 6}, {6, 4}, {4, 7},
    {7, 8}, {8, 1}, {1, 6}, {6, 6}, {6, 8}, {8, 4}, {4, 0}, {0, 6}, {6, 7}, {7, 7},
    {7, 3}, {3, 6}, {6, 2}, {2, 2}, {2, 5}, {5, 6}, {6, 1}, {1, 4}
};

// X to move in board 2. Cells 4, 5 and 6 send O to a board where O wins
// the match at once; cells 0, 1, 2 and 8 do not.
const MoveSeq AVOID_LOSS = {
    {7, 3}, {3, 0}, {0, 7}, {7, 2}, {2, 7}, {7, 0}, {0, 4}, {4, 8}, {8, 0}, {0, 6},
    {6, 5}, {5, 6}, {6, 3}, {3, 5}, {5, 5}, {5, 4}, {4, 7}, {7, 7}, {7, 4}, {4, 1},
    {1, 5}, {5, 2}, {2, 3}, {3, 6}, {6, 7}, {7, 6}, {6, 4}, {4, 5}, {4, 4}, {4, 3},
    {3, 4}, {4, 2}
};

} // namespace

class AiTest : public ::testing::Test {
protected:
    void SetUp() override {
        game_.start();
    }

    void play(const MoveSeq& moves) {
        for (auto [board, cell] : moves) {
            ASSERT_TRUE(game_.make_move(board, cell)) << "move " << board << "/" << cell;
        }
    }

    SearchOptions fast_options() {
        SearchOptions options;
        options.budget = 300ms;
        return options;
    }

    Game game_;
    Rng rng_{42};
};

TEST_F(AiTest, SearchBoardMirrorsGame) {
    play({{0, 4}, {4, 8}});
    SearchBoard board = SearchBoard::from_game(game_);

    EXPECT_EQ(board.to_move, Player::Cross);
    EXPECT_EQ(board.forced, 8);
    EXPECT_EQ(board.cells[0][4], Player::Cross);
    EXPECT_EQ(board.cells[4][8], Player::Naught);

    MoveList moves;
    EXPECT_EQ(board.legal_moves(moves), 9);
    EXPECT_EQ(moves[0], (Cell{8, 0}));
}

TEST_F(AiTest, SearchBoardPlayMatchesEngine) {
    play({{0, 4}, {4, 0}, {0, 8}, {8, 0}});
    SearchBoard board = SearchBoard::from_game(game_);
    board.play(0, 0);
    ASSERT_TRUE(game_.make_move(0, 0));

    EXPECT_EQ(board.minis[0], Result::Cross);
    EXPECT_EQ(board.forced, NO_BOARD);
    EXPECT_EQ(board.to_move, Player::Naught);
    EXPECT_EQ(SearchBoard::from_game(game_).minis, board.minis);
}

TEST_F(AiTest, WinningMoveDetection) {
    play(WIN_IN_ONE);
    SearchBoard board = SearchBoard::from_game(game_);

    EXPECT_TRUE(is_winning_move(board, {4, 1}, Player::Cross));
    EXPECT_TRUE(wins_mini_board(board, {4, 1}, Player::Cross));
    EXPECT_FALSE(is_winning_move(board, {4, 3}, Player::Cross));
}

TEST_F(AiTest, EvaluationFavorsDecidedWinner) {
    play(WIN_IN_ONE);
    SearchBoard board = SearchBoard::from_game(game_);
    board.play(4, 1);

    ASSERT_EQ(board.winner, Result::Cross);
    EXPECT_EQ(evaluate_position(board, Player::Cross, 1), WIN_SCORE - 1);
    EXPECT_EQ(evaluate_position(board, Player::Naught, 1), LOSE_SCORE + 1);
}

TEST_F(AiTest, MinimaxSeesWinInOne) {
    play(WIN_IN_ONE);
    SearchBoard board = SearchBoard::from_game(game_);

    int score = minimax(board, 2, LOSE_SCORE * 2, WIN_SCORE * 2, Player::Cross);
    EXPECT_GE(score, WIN_SCORE - MAX_SEARCH_DEPTH);
}

TEST_F(AiTest, MoveOrderingPrefersWinningMove) {
    play(WIN_IN_ONE);
    SearchBoard board = SearchBoard::from_game(game_);

    int winning = move_ordering_score(board, {4, 1});
    for (int cell : {3, 4, 5, 8}) {
        if (board.cells[4][cell] == Player::Empty) {
            EXPECT_GT(winning, move_ordering_score(board, {4, static_cast<int8_t>(cell)}));
        }
    }
}

TEST_F(AiTest, HardTakesImmediateWin) {
    play(WIN_IN_ONE);
    AiMove move = select_move(game_, Difficulty::Hard, fast_options(), rng_);

    EXPECT_EQ(move.board, 4);
    EXPECT_EQ(move.cell, 1);
}

TEST_F(AiTest, GreedyTakesImmediateWin) {
    play(WIN_IN_ONE);
    AiMove move = find_greedy_move(game_, rng_);

    EXPECT_EQ(move.board, 4);
    EXPECT_EQ(move.cell, 1);
}

TEST_F(AiTest, HardAvoidsSendingIntoLoss) {
    play(AVOID_LOSS);
    ASSERT_EQ(game_.current_player(), Player::Cross);

    for (uint64_t seed : {1u, 2u, 3u}) {
        Rng rng(seed);
        AiMove move = select_move(game_, Difficulty::Hard, fast_options(), rng);
        ASSERT_TRUE(game_.is_legal(move.board, move.cell));
        EXPECT_EQ(move.board, 2);
        EXPECT_TRUE(move.cell == 0 || move.cell == 1 || move.cell == 2 || move.cell == 8)
            << "cell " << move.cell;
        EXPECT_GE(move.depth_reached, 2);
    }
}

TEST_F(AiTest, HardUsesThreadPoolForRollouts) {
    ThreadPool pool(2);
    SearchOptions options = fast_options();
    options.pool = &pool;

    AiMove move = select_move(game_, Difficulty::Hard, options, rng_);
    ASSERT_TRUE(move.valid());
    EXPECT_TRUE(game_.is_legal(move.board, move.cell));
    EXPECT_GT(move.positions_evaluated, 0);
}

TEST_F(AiTest, EveryDifficultyReturnsLegalMoves) {
    play({{4, 4}, {4, 0}});

    for (auto difficulty : {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard}) {
        for (int i = 0; i < 5; ++i) {
            AiMove move = select_move(game_, difficulty, fast_options(), rng_);
            ASSERT_TRUE(move.valid());
            EXPECT_TRUE(game_.is_legal(move.board, move.cell))
                << difficulty_to_string(difficulty) << " " << move.board << "/" << move.cell;
        }
    }
}

TEST_F(AiTest, RandomMidGameStatesGetLegalMoves) {
    constexpr size_t STATE_COUNT = 1000;
    constexpr size_t SINGLE_MOVE_STATES = 20;

    Rng source(2024);
    std::vector<Game> states;
    std::vector<Game> single_move;

    // Random playouts, keeping one open position per game plus any
    // position that leaves exactly one legal move
    for (int games = 0; games < 5000 && (states.size() < STATE_COUNT ||
                                         single_move.size() < SINGLE_MOVE_STATES); ++games) {
        Game game;
        game.start();
        std::uniform_int_distribution<int> stop_at(0, 70);
        int keep_ply = stop_at(source);
        for (int ply = 0; !game.is_over(); ++ply) {
            auto moves = game.valid_moves();
            if (moves.size() == 1 && single_move.size() < SINGLE_MOVE_STATES) {
                single_move.push_back(game);
            }
            if (ply == keep_ply && states.size() < STATE_COUNT) {
                states.push_back(game);
            }
            AiMove move = find_random_move(game, source);
            ASSERT_TRUE(game.make_move(move.board, move.cell));
        }
    }
    ASSERT_GE(states.size(), STATE_COUNT);
    ASSERT_FALSE(single_move.empty());
    states.insert(states.end(), single_move.begin(), single_move.end());

    SearchOptions options;
    options.budget = 5ms;
    for (const auto& state : states) {
        auto legal = state.valid_moves();
        ASSERT_FALSE(legal.empty());
        for (auto difficulty : {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard}) {
            AiMove move = select_move(state, difficulty, options, rng_);
            ASSERT_TRUE(move.valid()) << difficulty_to_string(difficulty);
            bool listed = std::ranges::any_of(legal, [&](const Move& m) {
                return m.board == move.board && m.cell == move.cell;
            });
            EXPECT_TRUE(listed) << difficulty_to_string(difficulty) << " "
                                << move.board << "/" << move.cell;
        }
    }
}

TEST_F(AiTest, NoMoveWhenGameOver) {
    game_.resign(Player::Naught);
    EXPECT_FALSE(select_move(game_, Difficulty::Hard, fast_options(), rng_).valid());
    EXPECT_FALSE(find_random_move(game_, rng_).valid());
}

TEST_F(AiTest, SearchRespectsBudget) {
    SearchOptions options;
    options.budget = 200ms;

    auto start = std::chrono::steady_clock::now();
    AiMove move = select_move(game_, Difficulty::Hard, options, rng_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(move.valid());
    EXPECT_LT(elapsed, 1500ms);
}

TEST_F(AiTest, RolloutsPlayToCompletion) {
    SearchBoard board = SearchBoard::from_game(game_);
    for (int i = 0; i < 20; ++i) {
        Result result = ParallelRollouts::playout(board, rng_);
        EXPECT_NE(result, Result::Open);
    }
}

TEST_F(AiTest, RolloutsTallyEveryChild) {
    play({{4, 4}});
    SearchBoard root = SearchBoard::from_game(game_);
    std::vector<SearchBoard> children;
    for (int cell : {0, 4, 8}) {
        SearchBoard child = root;
        child.play(4, cell);
        children.push_back(child);
    }

    ThreadPool pool(2);
    ParallelRollouts rollouts(&pool);
    auto stats = rollouts.run(children, Player::Naught,
                              std::chrono::steady_clock::now() + 100ms, rng_);

    ASSERT_EQ(stats.size(), 3u);
    for (const auto& s : stats) {
        EXPECT_GT(s.playouts, 0);
        EXPECT_LE(s.wins + s.draws, s.playouts);
        EXPECT_GE(s.rate(), 0.0);
        EXPECT_LE(s.rate(), 1.0);
    }
}

TEST_F(AiTest, TauntsComeFromDifficultyLists) {
    int lines = 0;
    for (int i = 0; i < 200; ++i) {
        if (auto line = maybe_taunt(Difficulty::Medium, rng_)) {
            EXPECT_FALSE(line->empty());
            ++lines;
        }
    }
    // Medium taunts about 30% of the time
    EXPECT_GT(lines, 20);
    EXPECT_LT(lines, 120);
}

TEST_F(AiTest, ComputerPlayerIdentity) {
    ComputerPlayer easy(Difficulty::Easy);
    Identity identity = easy.identity();
    EXPECT_EQ(identity.id, AI_IDENTITY);
    EXPECT_EQ(identity.name, "AI Plato");
    EXPECT_TRUE(identity.is_computer());

    easy.set_difficulty(Difficulty::Hard);
    EXPECT_EQ(easy.identity().name, "AI Archimedes");
    EXPECT_EQ(ComputerPlayer::classical_name(Difficulty::Medium), "Socrates");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
