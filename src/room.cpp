//
//  room.cpp
//  uttt - Room session state machine
//
//  Lobby -> AwaitingStart -> InProgress -> Terminal -> (rematch | closed)
//

#include "room.hpp"
#include "ai.hpp"
#include "match_recorder.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <format>

namespace uttt {

//===============================================================================
// JSON HELPERS
//===============================================================================

json room_settings_to_json(const RoomSettings& settings) {
    return {
        {"timerType", std::string(timer_mode_to_string(settings.timer.mode))},
        {"moveTimeout", settings.timer.move_seconds},
        {"gameTimeEach", settings.timer.clock_seconds},
        {"gameIncrement", settings.timer.increment_seconds},
        {"timeoutAction", std::string(expiry_policy_to_string(settings.timer.expiry))},
        {"ranked", settings.ranked},
        {"ai", settings.ai},
        {"aiDifficulty", std::string(difficulty_to_string(settings.ai_difficulty))},
        {"aiSeatOrder", std::string(ai_seat_order_to_string(settings.ai_seat_order))},
        {"firstPlayerChoice", std::string(first_player_choice_to_string(settings.first_player))}
    };
}

json chat_entry_to_json(const ChatEntry& entry) {
    return {
        {"author", entry.author},
        {"text", entry.text},
        {"isSpectator", entry.spectator},
        {"seat", entry.seat ? json(std::string(player_to_string(*entry.seat))) : json(nullptr)}
    };
}

//===============================================================================
// CONSTRUCTION
//===============================================================================

RoomSession::RoomSession(std::string code, bool guest_room, RoomSettings settings,
                         RoomServices services, uint64_t seed)
    : code_(std::move(code)), guest_room_(guest_room), services_(services), rng_(seed),
      settings_(settings) {
    if (guest_room_ || settings_.ai) {
        settings_.ranked = false;
    }
    if (settings_.ai) {
        computer_.emplace(settings_.ai_difficulty);
    }
    clock_.configure(settings_.timer);
    last_activity_ = services_.clock.now();
}

//===============================================================================
// LOCKED HELPERS
//===============================================================================

RoomPhase RoomSession::phase_locked() const {
    if (closed_) return RoomPhase::Closed;
    if (game_.is_over()) return RoomPhase::Terminal;
    if (game_.started()) return RoomPhase::InProgress;
    if (filled_seats() == 2) return RoomPhase::AwaitingStart;
    return RoomPhase::Lobby;
}

RoomMember* RoomSession::find_member(const ConnectionId& connection) {
    auto it = std::ranges::find(members_, connection, &RoomMember::connection);
    return it == members_.end() ? nullptr : &*it;
}

const RoomMember* RoomSession::find_member(const ConnectionId& connection) const {
    auto it = std::ranges::find(members_, connection, &RoomMember::connection);
    return it == members_.end() ? nullptr : &*it;
}

bool RoomSession::identity_connected(const std::string& id) const {
    return std::ranges::any_of(members_, [&](const RoomMember& m) { return m.identity.id == id; });
}

std::optional<Player> RoomSession::seat_of_identity(const std::string& id) const {
    for (int i = 0; i < 2; ++i) {
        if (seats_[i] && seats_[i]->id == id) {
            return seat_player(i);
        }
    }
    return std::nullopt;
}

int RoomSession::filled_seats() const {
    return static_cast<int>(std::ranges::count_if(seats_, [](const auto& s) { return s.has_value(); }));
}

int RoomSession::human_seats() const {
    return static_cast<int>(std::ranges::count_if(seats_, [](const auto& s) {
        return s.has_value() && !s->is_computer();
    }));
}

bool RoomSession::is_ai_seat(Player seat) const {
    const auto& occupant = seats_[seat_index(seat)];
    return occupant && occupant->is_computer();
}

std::optional<Player> RoomSession::ai_seat() const {
    for (int i = 0; i < 2; ++i) {
        if (seats_[i] && seats_[i]->is_computer()) {
            return seat_player(i);
        }
    }
    return std::nullopt;
}

void RoomSession::touch() {
    last_activity_ = services_.clock.now();
}

//===============================================================================
// MESSAGING
//===============================================================================

void RoomSession::send(const ConnectionId& connection, const ServerEvent& event) {
    services_.sink.send(connection, event);
}

void RoomSession::send_to_identity(const std::string& id, const ServerEvent& event) {
    for (const auto& member : members_) {
        if (member.identity.id == id) {
            send(member.connection, event);
        }
    }
}

void RoomSession::broadcast(const ServerEvent& event) {
    for (const auto& member : members_) {
        send(member.connection, event);
    }
}

void RoomSession::broadcast_state() {
    broadcast({"state", state_locked()});
}

void RoomSession::broadcast_status() {
    for (const auto& member : members_) {
        send(member.connection, {"gameStatus", status_locked(member)});
    }
}

void RoomSession::broadcast_spectators() {
    json names = json::array();
    for (const auto& member : members_) {
        if (!member.seat) {
            names.push_back(member.identity.name);
        }
    }
    broadcast({"spectatorList", {{"spectators", names}}});
}

void RoomSession::announce_seats() {
    for (const auto& member : members_) {
        if (member.seat) {
            send(member.connection, events::assign(*member.seat));
        }
    }
}

//===============================================================================
// STATE PAYLOADS
//===============================================================================

json RoomSession::player_json(Player seat) const {
    const auto& occupant = seats_[seat_index(seat)];
    if (!occupant) {
        return nullptr;
    }

    json player;
    player["name"] = occupant->name;
    player["kind"] = std::string(identity_kind_to_string(occupant->kind));
    player["host"] = host_id_ && *host_id_ == occupant->id;
    player["connected"] = occupant->is_computer() || identity_connected(occupant->id);

    if (services_.recorder) {
        if (auto stats = services_.recorder->stats_for(*occupant)) {
            player["rating"] = stats->rating;
            player["streak"] = stats->win_streak;
            player["bestStreak"] = stats->best_streak;
        }
    }
    return player;
}

json RoomSession::state_locked() const {
    double now = services_.clock.now();
    json state = game_to_json(game_);

    state["room"] = code_;
    state["phase"] = std::string(room_phase_to_string(phase_locked()));
    state["moveDeadline"] = clock_.deadline() ? json(*clock_.deadline()) : json(nullptr);
    state["moveTimeout"] = clock_.timeout_duration();
    state["serverTime"] = now;
    state["isAI"] = settings_.ai;
    state["aiDifficulty"] = settings_.ai
        ? json(std::string(difficulty_to_string(settings_.ai_difficulty))) : json(nullptr);
    state["ranked"] = settings_.ranked;
    state["timerType"] = std::string(timer_mode_to_string(settings_.timer.mode));
    if (settings_.timer.mode == TimerMode::GameClock) {
        state["clocks"] = {
            {"X", clock_.remaining(Player::Cross, now)},
            {"O", clock_.remaining(Player::Naught, now)}
        };
    } else {
        state["clocks"] = nullptr;
    }
    state["gameIncrement"] = settings_.timer.increment_seconds;
    state["settings"] = room_settings_to_json(settings_);
    state["players"] = {{"X", player_json(Player::Cross)}, {"O", player_json(Player::Naught)}};
    state["takebackPending"] = takeback_requester_
        ? json(std::string(player_to_string(*takeback_requester_))) : json(nullptr);
    state["rematchDeclined"] = rematch_declined_;
    return state;
}

json RoomSession::status_locked(const RoomMember& member) const {
    json status;
    json names = json::object();
    for (int i = 0; i < 2; ++i) {
        std::string key(player_to_string(seat_player(i)));
        names[key] = seats_[i] ? json(seats_[i]->name) : json(nullptr);
    }
    status["players"] = std::move(names);
    status["seat"] = member.seat ? std::string(player_to_string(*member.seat)) : std::string("spectator");

    if (!game_.started()) {
        if (filled_seats() < 2) {
            status["text"] = "Waiting for an opponent...";
            status["button_action"] = "hidden";
        } else if (!member.seat) {
            status["text"] = "Waiting for players to start...";
            status["button_action"] = "hidden";
        } else if (ready_[seat_index(*member.seat)]) {
            status["text"] = "Waiting for opponent to start...";
            status["button_action"] = "waiting";
        } else {
            status["text"] = "Opponent has joined! Click start when ready.";
            status["button_action"] = "start";
        }
    } else if (game_.is_over()) {
        Result winner = game_.winner();
        if (winner == Result::Draw) {
            status["text"] = "Draw!";
        } else {
            auto side = player_to_string(winner_of(winner));
            switch (game_.end_reason()) {
                case EndReason::Resignation:
                    status["text"] = std::format("{} wins by resignation!", side);
                    break;
                case EndReason::Timeout:
                    status["text"] = std::format("{} wins on time!", side);
                    break;
                case EndReason::Majority:
                    status["text"] = std::format("{} wins on majority!", side);
                    break;
                default:
                    status["text"] = std::format("{} wins!", side);
                    break;
            }
        }
        status["button_action"] = "hidden";

        if (!member.seat) {
            status["button_rematch"] = "hidden";
        } else if (rematch_declined_) {
            status["button_rematch"] = "declined";
        } else if (rematch_ready_[seat_index(*member.seat)]) {
            status["button_rematch"] = "waiting";
        } else if (std::ranges::any_of(rematch_ready_, [](bool r) { return r; })) {
            status["button_rematch"] = "prompted";
        } else {
            status["button_rematch"] = "rematch";
        }
    } else {
        status["text"] = std::format("Turn: {}", player_to_string(game_.current_player()));
        status["button_action"] = member.seat ? "resign" : "hidden";
    }
    return status;
}

//===============================================================================
// SEATS
//===============================================================================

void RoomSession::bind_seat(Player seat, const Identity& identity) {
    seats_[seat_index(seat)] = identity;
}

void RoomSession::bind_ai_seat() {
    if (!computer_ || ai_seat()) {
        return;
    }
    for (int i = 0; i < 2; ++i) {
        if (!seats_[i]) {
            seats_[i] = computer_->identity();
            return;
        }
    }
}

void RoomSession::vacate_seat(Player seat) {
    int index = seat_index(seat);
    if (!seats_[index]) {
        return;
    }

    std::string id = seats_[index]->id;
    seats_[index].reset();
    ready_.fill(false);
    services_.presence.release(id, code_);
    for (auto& member : members_) {
        if (member.identity.id == id) {
            member.seat.reset();
        }
    }

    if (!host_id_ || *host_id_ != id) {
        return;
    }

    // Settings control moves to the remaining human, who takes seat X
    host_id_.reset();
    int other = 1 - index;
    if (seats_[other] && !seats_[other]->is_computer()) {
        host_id_ = seats_[other]->id;
        if (other == 1) {
            seats_[0] = std::move(seats_[1]);
            seats_[1].reset();
            for (auto& member : members_) {
                if (member.identity.id == *host_id_) {
                    member.seat = Player::Cross;
                    send(member.connection, events::assign(Player::Cross));
                }
            }
        }
        log::info("Room {}: host moved to {}", code_, seats_[0]->name);
    }
}

void RoomSession::swap_seats() {
    std::swap(seats_[0], seats_[1]);
    std::swap(ready_[0], ready_[1]);
    for (auto& member : members_) {
        if (member.seat) {
            member.seat = seat_of_identity(member.identity.id);
        }
    }
}

void RoomSession::restore_canonical_seats() {
    bool swapped = false;
    if (computer_) {
        swapped = seats_[0] && seats_[0]->is_computer();
    } else if (host_id_) {
        swapped = seats_[1] && seats_[1]->id == *host_id_;
    }
    if (swapped) {
        swap_seats();
    }
}

void RoomSession::apply_first_player_policy() {
    restore_canonical_seats();

    std::bernoulli_distribution coin(0.5);
    bool swap = false;
    if (computer_) {
        switch (settings_.ai_seat_order) {
            case AiSeatOrder::HumanFirst: swap = false; break;
            case AiSeatOrder::AiFirst: swap = true; break;
            case AiSeatOrder::Random: swap = coin(rng_); break;
        }
    } else {
        switch (settings_.first_player) {
            case FirstPlayerChoice::Host: swap = false; break;
            case FirstPlayerChoice::Joiner: swap = true; break;
            case FirstPlayerChoice::Random: swap = coin(rng_); break;
        }
    }
    if (swap) {
        swap_seats();
    }
}

void RoomSession::remove_member(const ConnectionId& connection) {
    auto it = std::ranges::find(members_, connection, &RoomMember::connection);
    if (it == members_.end()) {
        return;
    }

    RoomMember member = *it;
    members_.erase(it);

    if (member.seat && !identity_connected(member.identity.id)) {
        if (!game_.started()) {
            vacate_seat(*member.seat);
        } else if (game_.is_over()) {
            rematch_declined_ = true;
        }
    }

    bool human_connected = std::ranges::any_of(members_, [](const RoomMember& m) {
        return m.seat.has_value();
    });
    if (human_seats() == 0 || (game_.is_over() && !human_connected)) {
        close_room();
    }
}

void RoomSession::close_room() {
    if (closed_) {
        return;
    }
    closed_ = true;
    clock_.stop();
    for (const auto& seat : seats_) {
        if (seat && !seat->is_computer()) {
            services_.presence.release(seat->id, code_);
        }
    }
    if (!members_.empty()) {
        broadcast_state();
    }
    log::info("Room {}: closed", code_);
}

//===============================================================================
// GAME FLOW
//===============================================================================

void RoomSession::start_game() {
    apply_first_player_policy();

    game_ = Game();
    game_.start();
    clock_.configure(settings_.timer);
    rematch_ready_.fill(false);
    takeback_requester_.reset();

    log::info("Room {}: started, {} (X) vs {} (O)", code_, seats_[0]->name, seats_[1]->name);
    announce_seats();

    double now = services_.clock.now();
    clock_.start_turn(Player::Cross, now);
    if (is_ai_seat(Player::Cross)) {
        play_ai_turn();
    }
}

void RoomSession::after_move(bool yield) {
    if (game_.is_over()) {
        finish_game();
        return;
    }

    clock_.start_turn(game_.current_player(), services_.clock.now());
    if (is_ai_seat(game_.current_player())) {
        if (yield) {
            broadcast_state();
            broadcast_status();
        }
        play_ai_turn();
    }
}

void RoomSession::play_ai_turn() {
    Player seat = game_.current_player();
    if (!computer_ || !is_ai_seat(seat) || game_.is_over()) {
        return;
    }

    SearchOptions options;
    options.budget = services_.ai_budget;
    options.pool = services_.pool;

    AiMove move = computer_->make_move(game_, options, rng_);
    if (!move.valid() || !game_.make_move(move.board, move.cell)) {
        log::error("Room {}: AI returned no usable move, playing randomly", code_);
        move = find_random_move(game_, rng_);
        if (!move.valid() || !game_.make_move(move.board, move.cell)) {
            return;
        }
    }

    double now = services_.clock.now();
    clock_.on_move(now);

    if (auto line = computer_->taunt(rng_)) {
        ChatEntry entry{seats_[seat_index(seat)]->name, *line, false, seat};
        chat_log_.push_back(entry);
        broadcast({"chatMessage", chat_entry_to_json(entry)});
    }

    if (game_.is_over()) {
        finish_game();
    } else {
        clock_.start_turn(game_.current_player(), now);
    }
}

void RoomSession::handle_expiry() {
    Player seat = game_.current_player();
    const auto& timer = settings_.timer;
    bool auto_move = timer.mode == TimerMode::PerMove &&
                     timer.expiry == ExpiryPolicy::RandomMove &&
                     !settings_.ranked;

    if (auto_move) {
        AiMove move = find_random_move(game_, rng_);
        if (move.valid() && game_.make_move(move.board, move.cell)) {
            log::info("Room {}: {} timed out, random move {}/{}", code_,
                      player_to_string(seat), move.board, move.cell);
            takeback_requester_.reset();
            clock_.on_move(services_.clock.now());
            after_move(false);
            return;
        }
    }

    log::info("Room {}: {} forfeits on time", code_, player_to_string(seat));
    game_.forfeit_on_time(seat);
    finish_game();
}

void RoomSession::finish_game() {
    clock_.stop();
    takeback_requester_.reset();
    rematch_ready_.fill(false);

    log::info("Room {}: finished, result {} ({})", code_, result_to_string(game_.winner()),
              end_reason_to_string(game_.end_reason()));

    if (!recorded_) {
        recorded_ = true;
        record_result();
    }

    // Seats stay bound for the rematch, but the identities may join elsewhere
    for (const auto& seat : seats_) {
        if (seat && !seat->is_computer()) {
            services_.presence.release(seat->id, code_);
        }
    }
}

void RoomSession::record_result() {
    if (!services_.recorder) {
        return;
    }

    MatchReport report;
    report.room = code_;
    report.x = seats_[0];
    report.o = seats_[1];
    report.outcome = game_.winner();
    report.reason = game_.end_reason();
    report.ranked = settings_.ranked;
    report.moves = game_.history();

    auto result = services_.recorder->record_result(report);
    if (!result) {
        log::error("Room {}: failed to record match: {}", code_, store_error_to_string(result.error()));
    }
}

//===============================================================================
// CLIENT EVENTS
//===============================================================================

JoinResult RoomSession::join(const ConnectionId& connection, const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        send(connection, events::invalid());
        return JoinResult::Invalid;
    }
    touch();

    // Same connection joining twice replaces its record
    std::erase_if(members_, [&](const RoomMember& m) { return m.connection == connection; });

    JoinResult result;
    if (auto held = seat_of_identity(identity.id)) {
        // Reconnect: the held seat comes back, stale records for it go
        std::erase_if(members_, [&](const RoomMember& m) { return m.identity.id == identity.id; });
        members_.push_back({connection, identity, held});
        send(connection, events::assign(*held));
        result = JoinResult::Reconnected;
        log::info("Room {}: {} reconnected as {}", code_, identity.name, player_to_string(*held));
    } else if (!services_.presence.available_for(identity.id, code_)) {
        send(connection, events::already_in_game("You are already in another game."));
        return JoinResult::AlreadyInGame;
    } else if (!game_.started() && filled_seats() < 2) {
        if (!services_.presence.claim(identity.id, code_)) {
            send(connection, events::already_in_game("You are already in another game."));
            return JoinResult::AlreadyInGame;
        }
        Player seat = seats_[0] ? Player::Naught : Player::Cross;
        bind_seat(seat, identity);
        members_.push_back({connection, identity, seat});
        if (!host_id_) {
            host_id_ = identity.id;
        }
        send(connection, events::assign(seat));
        bind_ai_seat();
        result = JoinResult::Seated;
        log::info("Room {}: {} seated as {}", code_, identity.name, player_to_string(seat));
    } else {
        members_.push_back({connection, identity, std::nullopt});
        send(connection, events::spectator());
        result = JoinResult::Spectating;
    }

    if (!chat_log_.empty()) {
        json history = json::array();
        for (const auto& entry : chat_log_) {
            history.push_back(chat_entry_to_json(entry));
        }
        send(connection, {"chatHistory", {{"history", history}}});
    }

    broadcast_state();
    broadcast_status();
    broadcast_spectators();
    return result;
}

void RoomSession::claim_slot(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    RoomMember* member = find_member(connection);
    if (closed_ || !member || member->seat || game_.started() || filled_seats() >= 2) {
        return;
    }
    if (!services_.presence.claim(member->identity.id, code_)) {
        send(connection, events::already_in_game("You are already in another game."));
        return;
    }
    touch();

    Player seat = seats_[0] ? Player::Naught : Player::Cross;
    bind_seat(seat, member->identity);
    if (!host_id_) {
        host_id_ = member->identity.id;
    }
    for (auto& m : members_) {
        if (m.identity.id == member->identity.id) {
            m.seat = seat;
            send(m.connection, events::assign(seat));
        }
    }
    bind_ai_seat();

    broadcast_state();
    broadcast_status();
    broadcast_spectators();
}

void RoomSession::drop_to_spectator(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    RoomMember* member = find_member(connection);
    if (closed_ || !member || !member->seat || game_.started()) {
        return;
    }
    touch();

    std::string id = member->identity.id;
    vacate_seat(*member->seat);
    send_to_identity(id, events::spectator());

    broadcast_state();
    broadcast_status();
    broadcast_spectators();
}

void RoomSession::ready(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    RoomMember* member = find_member(connection);
    if (closed_ || !member || !member->seat || game_.started()) {
        return;
    }
    touch();

    ready_[seat_index(*member->seat)] = true;
    if (auto ai = ai_seat()) {
        ready_[seat_index(*ai)] = true;
    }

    if (filled_seats() == 2 && ready_[0] && ready_[1]) {
        start_game();
        broadcast_state();
    }
    broadcast_status();
}

void RoomSession::move(const ConnectionId& connection, int board, int cell) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member || !member->seat) {
        return;
    }
    if (!game_.started() || game_.is_over() || *member->seat != game_.current_player()) {
        return;
    }

    double now = services_.clock.now();
    if (!clock_.accepts_move(now)) {
        log::debug("Room {}: late move from {} ignored", code_, member->identity.name);
        return;
    }
    if (!game_.make_move(board, cell)) {
        return;
    }
    touch();

    takeback_requester_.reset();
    clock_.on_move(now);
    after_move(true);

    broadcast_state();
    broadcast_status();
}

void RoomSession::timeout(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !find_member(connection)) {
        return;
    }
    if (!game_.started() || game_.is_over()) {
        return;
    }
    if (!clock_.timeout_due(services_.clock.now())) {
        return;
    }
    touch();

    handle_expiry();
    broadcast_state();
    broadcast_status();
}

bool RoomSession::sweep() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !game_.started() || game_.is_over()) {
        return false;
    }
    if (!clock_.expired(services_.clock.now())) {
        return false;
    }

    handle_expiry();
    broadcast_state();
    broadcast_status();
    return true;
}

void RoomSession::rematch(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member || !member->seat || !game_.is_over() || rematch_declined_) {
        return;
    }
    touch();

    rematch_ready_[seat_index(*member->seat)] = true;
    if (auto ai = ai_seat()) {
        rematch_ready_[seat_index(*ai)] = true;
    }

    if (rematch_ready_[0] && rematch_ready_[1]) {
        bool free = std::ranges::all_of(seats_, [&](const auto& seat) {
            return !seat || seat->is_computer() || services_.presence.available_for(seat->id, code_);
        });

        if (!free) {
            rematch_declined_ = true;
        } else {
            for (const auto& seat : seats_) {
                if (seat && !seat->is_computer()) {
                    services_.presence.claim(seat->id, code_);
                }
            }

            restore_canonical_seats();
            game_ = Game();
            clock_.configure(settings_.timer);
            ready_.fill(false);
            rematch_ready_.fill(false);
            recorded_ = false;
            takeback_requester_.reset();

            log::info("Room {}: rematch agreed", code_);
            broadcast(events::rematch_agreed());
            announce_seats();
            broadcast_state();
        }
    }
    broadcast_status();
}

void RoomSession::leave_post_game(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !find_member(connection) || !game_.is_over()) {
        return;
    }
    touch();

    rematch_declined_ = true;
    remove_member(connection);
    if (!closed_) {
        broadcast_status();
        broadcast_spectators();
    }
}

void RoomSession::leave_pre_game(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !find_member(connection) || game_.started()) {
        return;
    }
    touch();

    remove_member(connection);
    if (!closed_) {
        broadcast_state();
        broadcast_status();
        broadcast_spectators();
    }
}

void RoomSession::update_settings(const ConnectionId& connection, const UpdateSettingsEvent& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member || !host_id_ || member->identity.id != *host_id_ || game_.started()) {
        return;
    }
    touch();

    TimerConfig timer = settings_.timer;
    if (update.timer_type) {
        timer.mode = *update.timer_type;
    }
    if (update.move_timeout && is_valid_move_seconds(*update.move_timeout)) {
        timer.move_seconds = *update.move_timeout;
    }
    if (update.game_time_each && is_valid_clock_seconds(*update.game_time_each)) {
        timer.clock_seconds = *update.game_time_each;
    }
    if (update.game_increment && is_valid_increment_seconds(*update.game_increment)) {
        timer.increment_seconds = *update.game_increment;
    }
    if (update.timeout_action) {
        timer.expiry = *update.timeout_action;
    }
    settings_.timer = timer;
    clock_.configure(timer);

    if (computer_) {
        if (update.ai_difficulty) {
            settings_.ai_difficulty = *update.ai_difficulty;
            computer_->set_difficulty(*update.ai_difficulty);
            if (auto ai = ai_seat()) {
                seats_[seat_index(*ai)] = computer_->identity();
            }
        }
        if (update.ai_seat_order) {
            settings_.ai_seat_order = *update.ai_seat_order;
        }
    } else {
        if (update.first_player_choice) {
            settings_.first_player = *update.first_player_choice;
        }
        // Ranked play needs two registered humans
        if (update.ranked && (!*update.ranked || !guest_room_)) {
            settings_.ranked = *update.ranked;
        }
    }

    // The other side has to confirm the new settings
    for (int i = 0; i < 2; ++i) {
        if (seats_[i] && !seats_[i]->is_computer() && seats_[i]->id != *host_id_) {
            ready_[i] = false;
        }
    }

    broadcast({"settingsUpdated", room_settings_to_json(settings_)});
    broadcast_state();
    broadcast_status();
}

void RoomSession::chat(const ConnectionId& connection, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member) {
        return;
    }
    auto text = sanitize_chat(message);
    if (!text) {
        return;
    }
    touch();

    ChatEntry entry{member->identity.name, *text, !member->seat.has_value(), member->seat};
    chat_log_.push_back(entry);
    broadcast({"chatMessage", chat_entry_to_json(entry)});
}

void RoomSession::resign(const ConnectionId& connection, Player seat) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member || member->seat != seat) {
        return;
    }
    if (!game_.started() || game_.is_over()) {
        return;
    }
    touch();

    log::info("Room {}: {} resigns", code_, player_to_string(seat));
    game_.resign(seat);
    finish_game();
    broadcast_state();
    broadcast_status();
}

void RoomSession::takeback_request(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member || !member->seat || computer_ || settings_.ranked) {
        return;
    }
    if (!game_.started() || game_.is_over() || takeback_requester_) {
        return;
    }
    Player seat = *member->seat;
    bool has_moved = std::ranges::any_of(game_.history(), [seat](const Move& m) { return m.player == seat; });
    if (!has_moved) {
        return;
    }
    touch();

    takeback_requester_ = seat;
    ServerEvent request = events::takeback_requested(member->identity.name);
    std::string requester_id = member->identity.id;
    for (const auto& m : members_) {
        if (m.identity.id != requester_id) {
            send(m.connection, request);
        }
    }
}

void RoomSession::takeback_response(const ConnectionId& connection, bool accepted) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (closed_ || !member || !member->seat || !takeback_requester_) {
        return;
    }
    if (*member->seat == *takeback_requester_ || !game_.started() || game_.is_over()) {
        return;
    }
    touch();

    Player requester = *takeback_requester_;
    takeback_requester_.reset();
    const auto& requester_seat = seats_[seat_index(requester)];

    if (!accepted) {
        if (requester_seat) {
            send_to_identity(requester_seat->id, events::takeback_declined());
        }
        return;
    }

    // Back to the requester's turn: one ply if they just moved, two otherwise
    int undone = 0;
    while (undone < 2 && game_.undo_last_move()) {
        ++undone;
        if (game_.current_player() == requester) {
            break;
        }
    }
    log::info("Room {}: takeback for {} ({} plies)", code_, player_to_string(requester), undone);

    clock_.stop();
    clock_.start_turn(game_.current_player(), services_.clock.now());
    broadcast_state();
    broadcast_status();
}

void RoomSession::disconnect(const ConnectionId& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !find_member(connection)) {
        return;
    }
    touch();

    remove_member(connection);
    if (!closed_) {
        broadcast_state();
        broadcast_status();
        broadcast_spectators();
    }
}

void RoomSession::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_room();
}

//===============================================================================
// QUERIES
//===============================================================================

RoomPhase RoomSession::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_locked();
}

bool RoomSession::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool RoomSession::is_abandoned(double now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.empty() && now - last_activity_ > ABANDONED_ROOM_SECONDS;
}

bool RoomSession::has_member(const ConnectionId& connection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_member(connection) != nullptr;
}

Game RoomSession::game() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return game_;
}

RoomSettings RoomSession::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

std::optional<Identity> RoomSession::seat_identity(Player seat) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seats_[seat_index(seat)];
}

std::optional<std::string> RoomSession::host_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return host_id_;
}

std::vector<ChatEntry> RoomSession::chat_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chat_log_;
}

json RoomSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_locked();
}

json RoomSession::status_for(const ConnectionId& connection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const RoomMember* member = find_member(connection);
    if (!member) {
        return nullptr;
    }
    return status_locked(*member);
}

json RoomSession::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto spectators = std::ranges::count_if(members_, [](const RoomMember& m) { return !m.seat; });
    return {
        {"room", code_},
        {"phase", std::string(room_phase_to_string(phase_locked()))},
        {"guest", guest_room_},
        {"ai", settings_.ai},
        {"ranked", settings_.ranked},
        {"seats", filled_seats()},
        {"members", members_.size()},
        {"spectators", spectators}
    };
}

} // namespace uttt
