//
//  timer.hpp
//  uttt - Move deadlines: per-move countdown or per-seat chess clock
//
//  All times are seconds since the Unix epoch as doubles, the same value
//  clients receive in the state payload
//

#pragma once

#include "uttt.hpp"

#include <array>
#include <chrono>
#include <optional>

namespace uttt {

//===============================================================================
// TIMER CONFIGURATION
//===============================================================================

enum class TimerMode : uint8_t {
    PerMove,
    GameClock,
    Untimed
};

// What happens when a per-move deadline passes
enum class ExpiryPolicy : uint8_t {
    Forfeit,
    RandomMove     // casual per-move games only
};

inline constexpr int DEFAULT_MOVE_SECONDS = 30;
inline constexpr int DEFAULT_CLOCK_SECONDS = 300;
inline constexpr int DEFAULT_INCREMENT_SECONDS = 0;

inline constexpr int MIN_MOVE_SECONDS = 5;
inline constexpr int MAX_MOVE_SECONDS = 300;
inline constexpr int MIN_CLOCK_SECONDS = 30;
inline constexpr int MAX_CLOCK_SECONDS = 3600;
inline constexpr int MAX_INCREMENT_SECONDS = 60;

// A move arriving this long after the deadline still counts
inline constexpr double LATE_MOVE_GRACE_SECONDS = 2.0;

// A client timeout signal this long before the deadline is still honored
inline constexpr double EARLY_TIMEOUT_TOLERANCE_SECONDS = 1.0;

struct TimerConfig {
    TimerMode mode = TimerMode::PerMove;
    int move_seconds = DEFAULT_MOVE_SECONDS;            // 0 = untimed
    int clock_seconds = DEFAULT_CLOCK_SECONDS;
    int increment_seconds = DEFAULT_INCREMENT_SECONDS;
    ExpiryPolicy expiry = ExpiryPolicy::Forfeit;

    bool operator==(const TimerConfig&) const = default;
};

constexpr bool is_valid_move_seconds(int seconds) noexcept {
    return seconds == 0 || (seconds >= MIN_MOVE_SECONDS && seconds <= MAX_MOVE_SECONDS);
}

constexpr bool is_valid_clock_seconds(int seconds) noexcept {
    return seconds >= MIN_CLOCK_SECONDS && seconds <= MAX_CLOCK_SECONDS;
}

constexpr bool is_valid_increment_seconds(int seconds) noexcept {
    return seconds >= 0 && seconds <= MAX_INCREMENT_SECONDS;
}

constexpr std::string_view timer_mode_to_string(TimerMode mode) noexcept {
    switch (mode) {
        case TimerMode::GameClock: return "game";
        case TimerMode::Untimed: return "none";
        default: return "move";
    }
}

constexpr std::optional<TimerMode> timer_mode_from_string(std::string_view text) noexcept {
    if (text == "move") return TimerMode::PerMove;
    if (text == "game") return TimerMode::GameClock;
    if (text == "none") return TimerMode::Untimed;
    return std::nullopt;
}

constexpr std::string_view expiry_policy_to_string(ExpiryPolicy policy) noexcept {
    return policy == ExpiryPolicy::RandomMove ? "random" : "forfeit";
}

//===============================================================================
// TIME SOURCES
//===============================================================================

class TimeSource {
public:
    virtual ~TimeSource() = default;

    /**
     * Current wall-clock time in seconds since the epoch.
     */
    virtual double now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    double now() const override {
        return std::chrono::duration<double>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * Clock that only moves when told to. Used by tests.
 */
class ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(double start = 1'700'000'000.0) : now_(start) {}

    double now() const override { return now_; }
    void set(double seconds) { now_ = seconds; }
    void advance(double seconds) { now_ += seconds; }

private:
    double now_;
};

//===============================================================================
// MOVE CLOCK
//===============================================================================

/**
 * Tracks the deadline for the seat to move and, in game-clock mode, each
 * seat's remaining pool.
 */
class MoveClock {
public:
    MoveClock() = default;
    explicit MoveClock(const TimerConfig& config) { configure(config); }

    /**
     * Applies new settings and refills both pools. Stops any running turn.
     */
    void configure(const TimerConfig& config);

    /**
     * Starts `seat`'s turn at `now` and computes its deadline.
     */
    void start_turn(Player seat, double now);

    /**
     * Books the move that ended the running turn: deducts the elapsed time
     * from the mover's pool (floored at zero) and adds the increment.
     */
    void on_move(double now);

    /**
     * Stops the running turn without booking time (match over, takeback).
     */
    void stop();

    /**
     * Whether a move submitted at `now` is on time, grace window included.
     */
    [[nodiscard]] bool accepts_move(double now) const noexcept;

    /**
     * Whether a client timeout signal at `now` should be honored.
     */
    [[nodiscard]] bool timeout_due(double now) const noexcept;

    /**
     * Whether the deadline has passed beyond the grace window. Used by the
     * server-side sweep so it never preempts a move that would be accepted.
     */
    [[nodiscard]] bool expired(double now) const noexcept;

    /**
     * Remaining seconds for `seat` at `now`, counting the running turn.
     */
    [[nodiscard]] double remaining(Player seat, double now) const noexcept;

    [[nodiscard]] bool timed() const noexcept;
    [[nodiscard]] const TimerConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::optional<double> deadline() const noexcept { return deadline_; }
    [[nodiscard]] std::optional<Player> running() const noexcept { return running_; }

    /**
     * Length of a full turn in seconds, 0 when untimed or on a game clock.
     */
    [[nodiscard]] int timeout_duration() const noexcept;

private:
    TimerConfig config_{};
    std::array<double, 2> pools_{};
    std::optional<Player> running_;
    double turn_started_ = 0.0;
    std::optional<double> deadline_;
};

} // namespace uttt
