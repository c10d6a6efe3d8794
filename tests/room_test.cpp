//
//  room_test.cpp
//  uttt tests - Room session lifecycle
//
//  Seating, readiness, moves under the clock, rematch, takeback, chat and
//  the AI seat, driven through a recording sink and a manual clock
//

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "match_recorder.hpp"
#include "room.hpp"

using namespace uttt;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public MessageSink {
public:
    void send(const ConnectionId& connection, const ServerEvent& event) override {
        sent.emplace_back(connection, event);
    }

    std::vector<json> events_for(const ConnectionId& connection, std::string_view type) const {
        std::vector<json> found;
        for (const auto& [to, event] : sent) {
            if (to == connection && event.type == type) {
                found.push_back(event.data);
            }
        }
        return found;
    }

    bool received(const ConnectionId& connection, std::string_view type) const {
        return !events_for(connection, type).empty();
    }

    json last(const ConnectionId& connection, std::string_view type) const {
        auto found = events_for(connection, type);
        return found.empty() ? json(nullptr) : found.back();
    }

    void clear() { sent.clear(); }

    std::vector<std::pair<ConnectionId, ServerEvent>> sent;
};

} // namespace

class RoomTest : public ::testing::Test {
protected:
    static constexpr double T0 = 1'700'000'000.0;

    std::unique_ptr<RoomSession> make_room(RoomSettings settings = {}, bool guest = false,
                                           std::string code = "10001") {
        return std::make_unique<RoomSession>(std::move(code), guest, settings, services_, 7);
    }

    // alice on c1 takes X, bob on c2 takes O
    void seat_both(RoomSession& room) {
        ASSERT_EQ(room.join("c1", alice_), JoinResult::Seated);
        ASSERT_EQ(room.join("c2", bob_), JoinResult::Seated);
    }

    void start(RoomSession& room) {
        seat_both(room);
        room.ready("c1");
        room.ready("c2");
        ASSERT_EQ(room.phase(), RoomPhase::InProgress);
    }

    RecordingSink sink_;
    PresenceTracker presence_;
    ManualTimeSource clock_{T0};
    InMemoryMatchStore store_;
    MatchRecorder recorder_{store_};
    RoomServices services_{sink_, presence_, clock_, &recorder_, nullptr, 50ms};

    Identity alice_{"alice", "Alice", IdentityKind::Registered};
    Identity bob_{"bob", "Bob", IdentityKind::Registered};
    Identity carol_{"carol", "Carol", IdentityKind::Registered};
};

//===============================================================================
// SEATING
//===============================================================================

TEST_F(RoomTest, FirstJoinersTakeSeatsThenSpectate) {
    auto room = make_room();
    seat_both(*room);
    EXPECT_EQ(room->join("c3", carol_), JoinResult::Spectating);

    EXPECT_EQ(sink_.last("c1", "assign")["seat"], "X");
    EXPECT_EQ(sink_.last("c2", "assign")["seat"], "O");
    EXPECT_TRUE(sink_.received("c3", "spectator"));
    EXPECT_EQ(sink_.last("c1", "spectatorList")["spectators"], json::array({"Carol"}));

    EXPECT_EQ(room->phase(), RoomPhase::AwaitingStart);
    EXPECT_EQ(room->host_id(), "alice");
    EXPECT_EQ(presence_.room_of("alice"), "10001");
    EXPECT_FALSE(presence_.room_of("carol").has_value());
}

TEST_F(RoomTest, StatusTextFollowsReadiness) {
    auto room = make_room();
    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);
    EXPECT_EQ(room->status_for("c1")["text"], "Waiting for an opponent...");

    ASSERT_EQ(room->join("c2", bob_), JoinResult::Seated);
    EXPECT_EQ(room->status_for("c1")["text"], "Opponent has joined! Click start when ready.");
    EXPECT_EQ(room->status_for("c1")["button_action"], "start");

    room->ready("c1");
    EXPECT_EQ(room->phase(), RoomPhase::AwaitingStart);
    EXPECT_EQ(room->status_for("c1")["text"], "Waiting for opponent to start...");
    EXPECT_EQ(room->status_for("c1")["button_action"], "waiting");

    room->ready("c2");
    auto status = room->status_for("c2");
    EXPECT_EQ(status["text"], "Turn: X");
    EXPECT_EQ(status["button_action"], "resign");
    EXPECT_EQ(status["players"]["O"], "Bob");
}

TEST_F(RoomTest, DropAndClaimSeat) {
    auto room = make_room();
    seat_both(*room);
    ASSERT_EQ(room->join("c3", carol_), JoinResult::Spectating);

    room->drop_to_spectator("c2");
    EXPECT_FALSE(room->seat_identity(Player::Naught).has_value());
    EXPECT_TRUE(sink_.received("c2", "spectator"));
    EXPECT_FALSE(presence_.room_of("bob").has_value());

    room->claim_slot("c3");
    ASSERT_TRUE(room->seat_identity(Player::Naught).has_value());
    EXPECT_EQ(room->seat_identity(Player::Naught)->id, "carol");
    EXPECT_EQ(sink_.last("c3", "assign")["seat"], "O");

    // Both seats are taken again
    room->claim_slot("c2");
    EXPECT_EQ(room->seat_identity(Player::Naught)->id, "carol");
}

TEST_F(RoomTest, HostLeavingBeforeStartHandsOverSeatX) {
    auto room = make_room();
    seat_both(*room);

    room->leave_pre_game("c1");
    EXPECT_FALSE(room->has_member("c1"));
    ASSERT_TRUE(room->seat_identity(Player::Cross).has_value());
    EXPECT_EQ(room->seat_identity(Player::Cross)->id, "bob");
    EXPECT_FALSE(room->seat_identity(Player::Naught).has_value());
    EXPECT_EQ(room->host_id(), "bob");
    EXPECT_EQ(sink_.last("c2", "assign")["seat"], "X");
    EXPECT_EQ(room->phase(), RoomPhase::Lobby);
}

TEST_F(RoomTest, LastMemberLeavingClosesRoom) {
    auto room = make_room();
    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);

    room->leave_pre_game("c1");
    EXPECT_TRUE(room->is_closed());
    EXPECT_FALSE(presence_.room_of("alice").has_value());
    EXPECT_EQ(room->join("c1", alice_), JoinResult::Invalid);
    EXPECT_TRUE(sink_.received("c1", "invalid"));
}

TEST_F(RoomTest, SpectatorDoesNotKeepSeatlessRoomOpen) {
    auto room = make_room();
    seat_both(*room);
    ASSERT_EQ(room->join("c3", carol_), JoinResult::Spectating);

    room->leave_pre_game("c1");
    EXPECT_FALSE(room->is_closed());

    room->disconnect("c2");
    EXPECT_TRUE(room->is_closed());
    EXPECT_TRUE(room->has_member("c3"));
    EXPECT_EQ(sink_.last("c3", "state")["phase"], "closed");
    EXPECT_FALSE(presence_.room_of("alice").has_value());
    EXPECT_FALSE(presence_.room_of("bob").has_value());
}

TEST_F(RoomTest, AiRoomClosesWhenHumanLeavesBeforeStart) {
    RoomSettings settings;
    settings.ai = true;
    auto room = make_room(settings);
    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);
    ASSERT_EQ(room->join("c3", carol_), JoinResult::Spectating);

    room->leave_pre_game("c1");
    EXPECT_TRUE(room->is_closed());
    EXPECT_FALSE(presence_.room_of("alice").has_value());
}

TEST_F(RoomTest, PresenceBlocksSecondRoom) {
    auto first = make_room();
    auto second = make_room({}, false, "20002");
    ASSERT_EQ(first->join("c1", alice_), JoinResult::Seated);

    EXPECT_EQ(second->join("c9", alice_), JoinResult::AlreadyInGame);
    EXPECT_EQ(sink_.last("c9", "alreadyInGame")["error"], "You are already in another game.");
    EXPECT_FALSE(second->has_member("c9"));

    // Seated identities are bound to the room they sit in
    ASSERT_EQ(second->join("c5", bob_), JoinResult::Seated);
    ASSERT_EQ(second->join("c6", carol_), JoinResult::Seated);
    EXPECT_EQ(first->join("c7", bob_), JoinResult::AlreadyInGame);
}

TEST_F(RoomTest, ReconnectRestoresHeldSeat) {
    auto room = make_room();
    start(*room);
    room->move("c1", 4, 4);

    room->disconnect("c1");
    EXPECT_FALSE(room->is_closed());
    EXPECT_EQ(room->seat_identity(Player::Cross)->id, "alice");
    EXPECT_EQ(room->state()["players"]["X"]["connected"], false);

    sink_.clear();
    EXPECT_EQ(room->join("c4", alice_), JoinResult::Reconnected);
    EXPECT_EQ(sink_.last("c4", "assign")["seat"], "X");
    EXPECT_EQ(room->state()["players"]["X"]["connected"], true);
    EXPECT_EQ(room->game().history().size(), 1u);
}

TEST_F(RoomTest, AbandonedOnlyWhenEmptyAndIdle) {
    auto room = make_room();
    clock_.advance(ABANDONED_ROOM_SECONDS + 1);
    EXPECT_TRUE(room->is_abandoned(clock_.now()));

    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);
    clock_.advance(ABANDONED_ROOM_SECONDS + 1);
    EXPECT_FALSE(room->is_abandoned(clock_.now()));
}

//===============================================================================
// PLAY
//===============================================================================

TEST_F(RoomTest, OnlyTheSeatToMoveMayMove) {
    auto room = make_room();
    start(*room);
    ASSERT_EQ(room->join("c3", carol_), JoinResult::Spectating);

    room->move("c2", 4, 4);
    room->move("c3", 4, 4);
    EXPECT_TRUE(room->game().history().empty());

    room->move("c1", 4, 4);
    room->move("c2", 0, 0);  // must play in board 4
    auto game = room->game();
    ASSERT_EQ(game.history().size(), 1u);
    EXPECT_EQ(game.current_player(), Player::Naught);

    auto state = room->state();
    EXPECT_EQ(state["phase"], "in_progress");
    EXPECT_EQ(state["forced"], 4);
    EXPECT_EQ(state["lastMove"]["player"], "X");
    EXPECT_DOUBLE_EQ(state["moveDeadline"].get<double>(), T0 + 30);
}

TEST_F(RoomTest, LateMoveBeyondGraceIgnored) {
    auto room = make_room();
    start(*room);

    clock_.advance(32.5);
    room->move("c1", 4, 4);
    EXPECT_TRUE(room->game().history().empty());
}

TEST_F(RoomTest, MoveInsideGraceAccepted) {
    auto room = make_room();
    start(*room);

    clock_.advance(31.5);
    room->move("c1", 4, 4);
    EXPECT_EQ(room->game().history().size(), 1u);
}

TEST_F(RoomTest, EarlyTimeoutSignalIgnored) {
    auto room = make_room();
    start(*room);

    clock_.advance(10);
    room->timeout("c2");
    EXPECT_EQ(room->phase(), RoomPhase::InProgress);
}

TEST_F(RoomTest, TimeoutForfeitsAndRecords) {
    auto room = make_room();
    start(*room);

    clock_.advance(29.5);
    room->timeout("c2");

    auto game = room->game();
    EXPECT_TRUE(game.is_over());
    EXPECT_EQ(game.winner(), Result::Naught);
    EXPECT_EQ(game.end_reason(), EndReason::Timeout);
    EXPECT_EQ(room->status_for("c1")["text"], "O wins on time!");
    EXPECT_EQ(store_.matches().size(), 1u);
    EXPECT_FALSE(presence_.room_of("alice").has_value());
}

TEST_F(RoomTest, CasualPerMoveExpiryPlaysRandomMove) {
    auto room = make_room();
    seat_both(*room);

    UpdateSettingsEvent update;
    update.timeout_action = ExpiryPolicy::RandomMove;
    room->update_settings("c1", update);
    room->ready("c1");
    room->ready("c2");

    clock_.advance(31);
    room->timeout("c2");

    auto game = room->game();
    EXPECT_FALSE(game.is_over());
    ASSERT_EQ(game.history().size(), 1u);
    EXPECT_EQ(game.history()[0].player, Player::Cross);
    EXPECT_EQ(game.current_player(), Player::Naught);
}

TEST_F(RoomTest, RankedExpiryAlwaysForfeits) {
    RoomSettings settings;
    settings.ranked = true;
    settings.timer.expiry = ExpiryPolicy::RandomMove;
    auto room = make_room(settings);
    start(*room);

    clock_.advance(31);
    room->timeout("c2");
    EXPECT_EQ(room->game().end_reason(), EndReason::Timeout);
}

TEST_F(RoomTest, SweepWaitsForGraceThenForfeits) {
    auto room = make_room();
    start(*room);

    clock_.advance(31);
    EXPECT_FALSE(room->sweep());
    clock_.advance(1.5);
    EXPECT_TRUE(room->sweep());
    EXPECT_EQ(room->game().winner(), Result::Naught);
    EXPECT_FALSE(room->sweep());
}

TEST_F(RoomTest, UntimedRoomNeverSweeps) {
    RoomSettings settings;
    settings.timer.mode = TimerMode::Untimed;
    auto room = make_room(settings);
    start(*room);

    clock_.advance(100000);
    EXPECT_FALSE(room->sweep());
    EXPECT_TRUE(room->state()["moveDeadline"].is_null());
}

TEST_F(RoomTest, ResignRecordedOnce) {
    auto room = make_room();
    start(*room);

    room->resign("c1", Player::Naught);  // not alice's seat
    EXPECT_EQ(room->phase(), RoomPhase::InProgress);

    room->resign("c2", Player::Naught);
    room->resign("c1", Player::Cross);
    EXPECT_EQ(room->game().winner(), Result::Cross);
    EXPECT_EQ(room->game().end_reason(), EndReason::Resignation);
    EXPECT_EQ(room->status_for("c2")["text"], "X wins by resignation!");

    ASSERT_EQ(store_.matches().size(), 1u);
    EXPECT_EQ(store_.matches()[0].winner_id, "alice");
    EXPECT_FALSE(store_.matches()[0].ranked);
}

TEST_F(RoomTest, RankedResultUpdatesRatings) {
    RoomSettings settings;
    settings.ranked = true;
    auto room = make_room(settings);
    start(*room);

    room->resign("c2", Player::Naught);
    EXPECT_EQ(recorder_.stats_for(alice_)->rating, 1216);
    EXPECT_EQ(recorder_.stats_for(bob_)->rating, 1184);

    auto players = room->state()["players"];
    EXPECT_EQ(players["X"]["rating"], 1216);
    EXPECT_EQ(players["X"]["streak"], 1);
}

TEST_F(RoomTest, GuestAndAiRoomsNeverRanked) {
    RoomSettings settings;
    settings.ranked = true;
    EXPECT_FALSE(make_room(settings, true)->settings().ranked);

    settings.ai = true;
    EXPECT_FALSE(make_room(settings)->settings().ranked);
}

//===============================================================================
// SETTINGS AND FIRST PLAYER
//===============================================================================

TEST_F(RoomTest, HostOnlySettingsUpdate) {
    auto room = make_room();
    seat_both(*room);

    UpdateSettingsEvent update;
    update.timer_type = TimerMode::GameClock;
    update.game_time_each = 120;
    update.move_timeout = 3;  // out of range, ignored
    room->update_settings("c2", update);
    EXPECT_EQ(room->settings().timer.mode, TimerMode::PerMove);

    room->update_settings("c1", update);
    auto settings = room->settings();
    EXPECT_EQ(settings.timer.mode, TimerMode::GameClock);
    EXPECT_EQ(settings.timer.clock_seconds, 120);
    EXPECT_EQ(settings.timer.move_seconds, DEFAULT_MOVE_SECONDS);
    EXPECT_EQ(sink_.last("c2", "settingsUpdated")["timerType"], "game");

    room->ready("c1");
    room->ready("c2");
    auto state = room->state();
    EXPECT_DOUBLE_EQ(state["clocks"]["X"].get<double>(), 120.0);
    EXPECT_EQ(state["timerType"], "game");
}

TEST_F(RoomTest, SettingsChangeClearsOpponentReadiness) {
    auto room = make_room();
    seat_both(*room);
    room->ready("c2");

    UpdateSettingsEvent update;
    update.move_timeout = 60;
    room->update_settings("c1", update);
    room->ready("c1");

    EXPECT_EQ(room->phase(), RoomPhase::AwaitingStart);
    room->ready("c2");
    EXPECT_EQ(room->phase(), RoomPhase::InProgress);
    EXPECT_DOUBLE_EQ(room->state()["moveDeadline"].get<double>(), T0 + 60);
}

TEST_F(RoomTest, SettingsChangeKeepsHostReadiness) {
    auto room = make_room();
    seat_both(*room);
    room->ready("c1");

    UpdateSettingsEvent update;
    update.move_timeout = 45;
    room->update_settings("c1", update);

    room->ready("c2");
    EXPECT_EQ(room->phase(), RoomPhase::InProgress);
}

TEST_F(RoomTest, JoinerFirstSwapsSeatsAtStart) {
    auto room = make_room();
    seat_both(*room);

    UpdateSettingsEvent update;
    update.first_player_choice = FirstPlayerChoice::Joiner;
    room->update_settings("c1", update);
    room->ready("c1");
    room->ready("c2");

    EXPECT_EQ(room->seat_identity(Player::Cross)->id, "bob");
    EXPECT_EQ(sink_.last("c2", "assign")["seat"], "X");
    EXPECT_EQ(sink_.last("c1", "assign")["seat"], "O");
    EXPECT_EQ(room->host_id(), "alice");

    room->move("c2", 4, 4);
    EXPECT_EQ(room->game().history().size(), 1u);
}

//===============================================================================
// POST-GAME
//===============================================================================

TEST_F(RoomTest, RematchNeedsBothSeats) {
    auto room = make_room();
    start(*room);
    room->resign("c2", Player::Naught);

    room->rematch("c1");
    EXPECT_EQ(room->phase(), RoomPhase::Terminal);
    EXPECT_EQ(room->status_for("c1")["button_rematch"], "waiting");
    EXPECT_EQ(room->status_for("c2")["button_rematch"], "prompted");

    room->rematch("c2");
    EXPECT_TRUE(sink_.received("c1", "rematchAgreed"));
    EXPECT_EQ(room->phase(), RoomPhase::AwaitingStart);
    EXPECT_EQ(presence_.room_of("bob"), "10001");

    room->ready("c1");
    room->ready("c2");
    room->resign("c1", Player::Cross);
    EXPECT_EQ(store_.matches().size(), 2u);
}

TEST_F(RoomTest, RematchDeclinedWhenSeatBusyElsewhere) {
    auto room = make_room();
    start(*room);
    room->resign("c2", Player::Naught);

    auto other = make_room({}, false, "20002");
    ASSERT_EQ(other->join("c8", alice_), JoinResult::Seated);

    room->rematch("c1");
    room->rematch("c2");
    EXPECT_EQ(room->phase(), RoomPhase::Terminal);
    EXPECT_FALSE(sink_.received("c1", "rematchAgreed"));
    EXPECT_EQ(room->status_for("c2")["button_rematch"], "declined");
}

TEST_F(RoomTest, LeavingAfterGameDeclinesRematch) {
    auto room = make_room();
    start(*room);
    room->resign("c2", Player::Naught);

    room->leave_post_game("c2");
    EXPECT_FALSE(room->has_member("c2"));
    EXPECT_EQ(room->status_for("c1")["button_rematch"], "declined");
    EXPECT_TRUE(room->state()["rematchDeclined"].get<bool>());

    room->rematch("c1");
    EXPECT_EQ(room->phase(), RoomPhase::Terminal);

    room->disconnect("c1");
    EXPECT_TRUE(room->is_closed());
}

//===============================================================================
// TAKEBACK
//===============================================================================

TEST_F(RoomTest, TakebackRightAfterOwnMoveUndoesOnePly) {
    auto room = make_room();
    start(*room);
    room->move("c1", 4, 4);

    room->takeback_request("c1");
    EXPECT_EQ(sink_.last("c2", "takebackRequested")["requesterName"], "Alice");
    EXPECT_FALSE(sink_.received("c1", "takebackRequested"));
    EXPECT_EQ(room->state()["takebackPending"], "X");

    room->takeback_response("c2", true);
    auto game = room->game();
    EXPECT_TRUE(game.history().empty());
    EXPECT_EQ(game.current_player(), Player::Cross);
    EXPECT_TRUE(room->state()["takebackPending"].is_null());
}

TEST_F(RoomTest, TakebackAfterReplyUndoesTwoPlies) {
    auto room = make_room();
    start(*room);
    room->move("c1", 4, 4);
    room->move("c2", 4, 0);
    room->move("c1", 0, 8);

    room->takeback_request("c2");
    room->takeback_response("c1", true);

    auto game = room->game();
    ASSERT_EQ(game.history().size(), 1u);
    EXPECT_EQ(game.current_player(), Player::Naught);
    EXPECT_EQ(*game.forced_board(), 4);
}

TEST_F(RoomTest, DeclinedTakebackLeavesBoard) {
    auto room = make_room();
    start(*room);
    room->move("c1", 4, 4);

    room->takeback_request("c1");
    room->takeback_response("c1", true);  // requester cannot answer
    EXPECT_EQ(room->game().history().size(), 1u);

    room->takeback_response("c2", false);
    EXPECT_TRUE(sink_.received("c1", "takebackDeclined"));
    EXPECT_EQ(room->game().history().size(), 1u);
}

TEST_F(RoomTest, TakebackRefusedInRankedRooms) {
    RoomSettings settings;
    settings.ranked = true;
    auto room = make_room(settings);
    start(*room);
    room->move("c1", 4, 4);

    room->takeback_request("c1");
    EXPECT_FALSE(sink_.received("c2", "takebackRequested"));
}

//===============================================================================
// CHAT
//===============================================================================

TEST_F(RoomTest, ChatIsTrimmedAndReplayedToLateJoiners) {
    auto room = make_room();
    seat_both(*room);

    room->chat("c1", "   good luck  ");
    room->chat("c1", "   ");
    room->chat("c2", std::string(MAX_CHAT_LENGTH + 1, 'x'));

    auto messages = sink_.events_for("c2", "chatMessage");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["text"], "good luck");
    EXPECT_EQ(messages[0]["author"], "Alice");
    EXPECT_EQ(messages[0]["seat"], "X");
    EXPECT_FALSE(messages[0]["isSpectator"].get<bool>());

    ASSERT_EQ(room->join("c3", carol_), JoinResult::Spectating);
    auto history = sink_.last("c3", "chatHistory")["history"];
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0]["text"], "good luck");

    room->chat("c3", "hi all");
    EXPECT_TRUE(room->chat_log().back().spectator);
    EXPECT_EQ(room->chat_log().size(), 2u);
}

//===============================================================================
// AI ROOMS
//===============================================================================

TEST_F(RoomTest, AiTakesRemainingSeatAndReplies) {
    RoomSettings settings;
    settings.ai = true;
    settings.ai_difficulty = Difficulty::Easy;
    auto room = make_room(settings);

    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);
    auto ai = room->seat_identity(Player::Naught);
    ASSERT_TRUE(ai.has_value());
    EXPECT_TRUE(ai->is_computer());
    EXPECT_EQ(room->phase(), RoomPhase::AwaitingStart);

    room->ready("c1");
    ASSERT_EQ(room->phase(), RoomPhase::InProgress);

    room->move("c1", 4, 4);
    auto game = room->game();
    ASSERT_EQ(game.history().size(), 2u);
    EXPECT_EQ(game.history()[1].player, Player::Naught);
    EXPECT_EQ(game.history()[1].board, 4);
    EXPECT_EQ(game.current_player(), Player::Cross);
    EXPECT_TRUE(room->state()["isAI"].get<bool>());
    EXPECT_EQ(room->state()["aiDifficulty"], "easy");
}

TEST_F(RoomTest, AiFirstOrderLetsComputerOpen) {
    RoomSettings settings;
    settings.ai = true;
    settings.ai_seat_order = AiSeatOrder::AiFirst;
    settings.ai_difficulty = Difficulty::Easy;
    auto room = make_room(settings);

    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);
    room->ready("c1");

    EXPECT_TRUE(room->seat_identity(Player::Cross)->is_computer());
    EXPECT_EQ(sink_.last("c1", "assign")["seat"], "O");
    auto game = room->game();
    ASSERT_EQ(game.history().size(), 1u);
    EXPECT_EQ(game.current_player(), Player::Naught);
}

TEST_F(RoomTest, AiMatchesAreNotRecorded) {
    RoomSettings settings;
    settings.ai = true;
    settings.ai_difficulty = Difficulty::Easy;
    auto room = make_room(settings);

    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);
    room->ready("c1");
    room->takeback_request("c1");
    room->resign("c1", Player::Cross);

    EXPECT_EQ(room->game().winner(), Result::Naught);
    EXPECT_EQ(store_.write_count(), 0u);
    EXPECT_FALSE(sink_.received("c1", "takebackRequested"));
}

TEST_F(RoomTest, AiDifficultyChangeRenamesSeat) {
    RoomSettings settings;
    settings.ai = true;
    settings.ai_difficulty = Difficulty::Easy;
    auto room = make_room(settings);
    ASSERT_EQ(room->join("c1", alice_), JoinResult::Seated);

    UpdateSettingsEvent update;
    update.ai_difficulty = Difficulty::Hard;
    room->update_settings("c1", update);

    EXPECT_EQ(room->settings().ai_difficulty, Difficulty::Hard);
    EXPECT_EQ(room->seat_identity(Player::Naught)->name, "AI Archimedes");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
