//
//  player.hpp
//  uttt - Seat occupants: registered users, guests and the computer
//
//  Identity is what a seat is bound to; ComputerPlayer drives the AI seat
//

#pragma once

#include "uttt.hpp"
#include "ai.hpp"

#include <string>

namespace uttt {

//===============================================================================
// IDENTITY
//===============================================================================

enum class IdentityKind : uint8_t {
    Registered,
    Guest,
    Computer
};

// Identity id reserved for the AI seat
inline constexpr std::string_view AI_IDENTITY = "AI";

/**
 * Who a seat or connection belongs to. Reconnects match on id.
 */
struct Identity {
    std::string id;
    std::string name;
    IdentityKind kind = IdentityKind::Registered;

    [[nodiscard]] bool is_guest() const noexcept { return kind == IdentityKind::Guest; }
    [[nodiscard]] bool is_computer() const noexcept { return kind == IdentityKind::Computer; }
    [[nodiscard]] bool is_registered() const noexcept { return kind == IdentityKind::Registered; }

    bool operator==(const Identity&) const = default;
};

constexpr std::string_view identity_kind_to_string(IdentityKind kind) noexcept {
    switch (kind) {
        case IdentityKind::Guest: return "guest";
        case IdentityKind::Computer: return "computer";
        default: return "registered";
    }
}

//===============================================================================
// COMPUTER PLAYER
//===============================================================================

/**
 * The AI seat. Holds the difficulty and turns a game snapshot into a move.
 */
class ComputerPlayer {
public:
    explicit ComputerPlayer(Difficulty difficulty = Difficulty::Medium)
        : difficulty_(difficulty) {}

    /**
     * Picks a move for the side to move without mutating `game`.
     */
    AiMove make_move(const Game& game, const SearchOptions& options, Rng& rng) const;

    /**
     * Chat line to post after a move, or nothing.
     */
    std::optional<std::string> taunt(Rng& rng) const { return maybe_taunt(difficulty_, rng); }

    [[nodiscard]] Identity identity() const;

    Difficulty difficulty() const { return difficulty_; }
    void set_difficulty(Difficulty difficulty) { difficulty_ = difficulty; }

    /**
     * Classical display name for each difficulty level.
     */
    static std::string classical_name(Difficulty difficulty);

private:
    Difficulty difficulty_;
};

} // namespace uttt
