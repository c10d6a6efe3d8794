//
//  ai_parallel.cpp
//  uttt - Monte-Carlo rollout implementation
//
//  Rounds of fixed-size playout batches, one task per candidate per round
//

#include "ai_parallel.hpp"
#include "util/log.hpp"

#include <future>

namespace uttt {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Playouts per candidate per round; keeps candidates level when workers are scarce
constexpr int64_t PLAYOUTS_PER_BATCH = 32;

} // namespace

Result ParallelRollouts::playout(SearchBoard board, Rng& rng) {
    MoveList moves;
    while (!board.is_over()) {
        int count = board.legal_moves(moves);
        if (count == 0) {
            break;
        }
        std::uniform_int_distribution<int> dist(0, count - 1);
        const Cell& move = moves[dist(rng)];
        board.play(move.board, move.cell);
    }
    return board.winner;
}

RolloutStats ParallelRollouts::run_child(const SearchBoard& child, Player mover,
                                         SteadyClock::time_point deadline,
                                         uint64_t seed, int64_t max_playouts) {
    Rng rng(seed);
    RolloutStats stats;
    while (stats.playouts < max_playouts && SteadyClock::now() < deadline) {
        Result result = playout(child, rng);
        ++stats.playouts;
        if (result == result_for(mover)) {
            ++stats.wins;
        } else if (result == Result::Draw || result == Result::Open) {
            ++stats.draws;
        }
    }
    return stats;
}

std::vector<RolloutStats> ParallelRollouts::run(const std::vector<SearchBoard>& children,
                                                Player mover,
                                                SteadyClock::time_point deadline, Rng& rng) {
    std::vector<RolloutStats> totals(children.size());
    if (children.empty()) {
        return totals;
    }

    while (SteadyClock::now() < deadline) {
        if (pool_ == nullptr) {
            for (size_t i = 0; i < children.size(); ++i) {
                totals[i] += run_child(children[i], mover, deadline, rng(), PLAYOUTS_PER_BATCH);
            }
            continue;
        }

        std::vector<std::future<RolloutStats>> futures;
        futures.reserve(children.size());
        for (size_t i = 0; i < children.size(); ++i) {
            const SearchBoard& child = children[i];
            uint64_t seed = rng();
            futures.push_back(pool_->enqueue([&child, mover, deadline, seed]() {
                return run_child(child, mover, deadline, seed, PLAYOUTS_PER_BATCH);
            }));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            totals[i] += futures[i].get();
        }
    }

    int64_t total = 0;
    for (const auto& stats : totals) {
        total += stats.playouts;
    }
    log::debug("rollouts: {} playouts over {} candidates ({} workers)", total, children.size(),
               pool_ ? pool_->size() : 1);
    return totals;
}

} // namespace uttt
