//
//  timer.cpp
//  uttt - Move deadline bookkeeping
//

#include "timer.hpp"

#include <algorithm>

namespace uttt {

void MoveClock::configure(const TimerConfig& config) {
    config_ = config;
    pools_.fill(static_cast<double>(config_.clock_seconds));
    stop();
}

bool MoveClock::timed() const noexcept {
    switch (config_.mode) {
        case TimerMode::PerMove:
            return config_.move_seconds > 0;
        case TimerMode::GameClock:
            return true;
        default:
            return false;
    }
}

int MoveClock::timeout_duration() const noexcept {
    return config_.mode == TimerMode::PerMove ? config_.move_seconds : 0;
}

void MoveClock::start_turn(Player seat, double now) {
    running_ = seat;
    turn_started_ = now;

    if (!timed()) {
        deadline_.reset();
    } else if (config_.mode == TimerMode::PerMove) {
        deadline_ = now + config_.move_seconds;
    } else {
        deadline_ = now + pools_[seat_index(seat)];
    }
}

void MoveClock::on_move(double now) {
    if (!running_) {
        return;
    }
    if (config_.mode == TimerMode::GameClock) {
        double& pool = pools_[seat_index(*running_)];
        pool = std::max(0.0, pool - (now - turn_started_));
        pool += config_.increment_seconds;
    }
    stop();
}

void MoveClock::stop() {
    running_.reset();
    deadline_.reset();
}

bool MoveClock::accepts_move(double now) const noexcept {
    return !deadline_ || now <= *deadline_ + LATE_MOVE_GRACE_SECONDS;
}

bool MoveClock::timeout_due(double now) const noexcept {
    return deadline_ && now >= *deadline_ - EARLY_TIMEOUT_TOLERANCE_SECONDS;
}

bool MoveClock::expired(double now) const noexcept {
    return deadline_ && now > *deadline_ + LATE_MOVE_GRACE_SECONDS;
}

double MoveClock::remaining(Player seat, double now) const noexcept {
    if (config_.mode == TimerMode::PerMove) {
        if (running_ == seat && deadline_) {
            return std::max(0.0, *deadline_ - now);
        }
        return static_cast<double>(config_.move_seconds);
    }

    double pool = pools_[seat_index(seat)];
    if (running_ == seat) {
        pool -= now - turn_started_;
    }
    return std::max(0.0, pool);
}

} // namespace uttt
