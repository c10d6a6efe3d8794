//
//  ai_parallel.hpp
//  uttt - Monte-Carlo rollouts over root candidates, spread across a thread pool
//
//  Root-parallel: every task owns a copy of one candidate position and its own RNG
//

#pragma once

#include "ai.hpp"
#include "util/thread_pool.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace uttt {

/**
 * Playout tally for one root candidate, from the point of view of the
 * player who made the candidate move.
 */
struct RolloutStats {
    int64_t playouts = 0;
    int64_t wins = 0;
    int64_t draws = 0;

    /**
     * Win rate with draws counted as half a win. 0.5 when nothing was played.
     */
    [[nodiscard]] double rate() const noexcept {
        if (playouts == 0) return 0.5;
        return (static_cast<double>(wins) + 0.5 * static_cast<double>(draws)) /
               static_cast<double>(playouts);
    }

    RolloutStats& operator+=(const RolloutStats& other) noexcept {
        playouts += other.playouts;
        wins += other.wins;
        draws += other.draws;
        return *this;
    }
};

class ParallelRollouts {
public:
    /**
     * @param pool Worker pool, or nullptr to run on the calling thread
     */
    explicit ParallelRollouts(ThreadPool* pool) : pool_(pool) {}

    /**
     * Plays random games from each child position until the deadline.
     * @param children Positions after each candidate move
     * @param mover Player who made the candidate moves
     * @return One tally per child, same order
     */
    std::vector<RolloutStats> run(const std::vector<SearchBoard>& children, Player mover,
                                  std::chrono::steady_clock::time_point deadline, Rng& rng);

    /**
     * Single random playout to the end of the match.
     * @return Final match result
     */
    static Result playout(SearchBoard board, Rng& rng);

private:
    static RolloutStats run_child(const SearchBoard& child, Player mover,
                                  std::chrono::steady_clock::time_point deadline,
                                  uint64_t seed, int64_t max_playouts);

    ThreadPool* pool_;
};

} // namespace uttt
