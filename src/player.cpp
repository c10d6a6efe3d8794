//
//  player.cpp
//  uttt - Computer player implementation
//

#include "player.hpp"
#include "util/log.hpp"

#include <format>

namespace uttt {

AiMove ComputerPlayer::make_move(const Game& game, const SearchOptions& options, Rng& rng) const {
    AiMove move = select_move(game, difficulty_, options, rng);

    if (move.valid()) {
        log::debug("{} ({}) plays {}/{} depth={} positions={} rollouts={} in {:.3f}s",
                   classical_name(difficulty_), difficulty_to_string(difficulty_),
                   move.board, move.cell, move.depth_reached, move.positions_evaluated,
                   move.rollouts, move.elapsed);
    }
    return move;
}

Identity ComputerPlayer::identity() const {
    return Identity{std::string(AI_IDENTITY),
                    std::format("AI {}", classical_name(difficulty_)),
                    IdentityKind::Computer};
}

std::string ComputerPlayer::classical_name(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:
            return "Plato";
        case Difficulty::Medium:
            return "Socrates";
        case Difficulty::Hard:
            return "Archimedes";
    }
    return "Computer";
}

} // namespace uttt
