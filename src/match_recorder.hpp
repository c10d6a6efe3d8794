//
//  match_recorder.hpp
//  uttt - Match results, Elo rating exchange and win streaks
//
//  MatchStore is the persistence seam; a JSON file store and an in-memory
//  store are provided
//

#pragma once

#include "uttt.hpp"
#include "game.hpp"
#include "player.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace uttt {

using json = nlohmann::json;

//===============================================================================
// RECORDS
//===============================================================================

inline constexpr int DEFAULT_RATING = 1200;
inline constexpr int RATING_K_FACTOR = 32;

struct PlayerRecord {
    std::string id;
    int rating = DEFAULT_RATING;
    int win_streak = 0;
    int best_streak = 0;

    bool operator==(const PlayerRecord&) const = default;
};

/**
 * Write-once record of one finished two-human match.
 */
struct MatchRecord {
    std::string room;
    std::string x_id;
    std::string o_id;
    std::optional<std::string> winner_id;     // empty on a draw
    bool draw = false;
    bool ranked = false;
    EndReason reason = EndReason::None;
    std::vector<Move> moves;
    std::chrono::system_clock::time_point played_at{};
};

enum class StoreError {
    DirectoryCreationFailed,
    FileReadFailed,
    FileWriteFailed,
    JsonParseFailed,
    JsonSerializationFailed
};

const char* store_error_to_string(StoreError error);

//===============================================================================
// STORES
//===============================================================================

class MatchStore {
public:
    virtual ~MatchStore() = default;

    /**
     * @return The stored record, or a fresh default record for unknown ids
     */
    virtual std::expected<PlayerRecord, StoreError> load_player(const std::string& id) = 0;
    virtual std::expected<void, StoreError> save_players(const std::vector<PlayerRecord>& records) = 0;
    virtual std::expected<void, StoreError> append_match(const MatchRecord& record) = 0;
};

class InMemoryMatchStore : public MatchStore {
public:
    std::expected<PlayerRecord, StoreError> load_player(const std::string& id) override;
    std::expected<void, StoreError> save_players(const std::vector<PlayerRecord>& records) override;
    std::expected<void, StoreError> append_match(const MatchRecord& record) override;

    /**
     * Makes every later write fail with FileWriteFailed.
     */
    void fail_writes(bool fail) { fail_writes_ = fail; }

    std::vector<MatchRecord> matches() const;
    size_t write_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PlayerRecord> players_;
    std::vector<MatchRecord> matches_;
    size_t writes_ = 0;
    bool fail_writes_ = false;
};

/**
 * Persists players to <dir>/players.json and each match to
 * <dir>/matches/<timestamp>-<room>.json.
 */
class JsonFileMatchStore : public MatchStore {
public:
    explicit JsonFileMatchStore(std::filesystem::path directory);

    /**
     * Creates the directories and loads players.json if present.
     */
    std::expected<void, StoreError> initialize();

    std::expected<PlayerRecord, StoreError> load_player(const std::string& id) override;
    std::expected<void, StoreError> save_players(const std::vector<PlayerRecord>& records) override;
    std::expected<void, StoreError> append_match(const MatchRecord& record) override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::expected<void, StoreError> write_json_file(const std::filesystem::path& path, const json& data);

    std::filesystem::path directory_;
    std::mutex mutex_;
    std::unordered_map<std::string, PlayerRecord> players_;
};

json player_record_to_json(const PlayerRecord& record);
json match_record_to_json(const MatchRecord& record);

//===============================================================================
// RECORDER
//===============================================================================

/**
 * Everything the recorder needs to know about a finished match.
 */
struct MatchReport {
    std::string room;
    std::optional<Identity> x;
    std::optional<Identity> o;
    Result outcome = Result::Open;
    EndReason reason = EndReason::None;
    bool ranked = false;
    std::vector<Move> moves;
};

struct RecordSummary {
    bool recorded = false;
    bool rated = false;
    PlayerRecord x;
    PlayerRecord o;
};

class MatchRecorder {
public:
    explicit MatchRecorder(MatchStore& store) : store_(store) {}

    /**
     * Persists a finished match. Guests, the AI seat and half-empty rooms
     * are skipped and return a summary with recorded == false.
     * Ranked decisive results exchange rating; streaks update on every
     * recorded decisive result; draws leave streaks unchanged.
     */
    std::expected<RecordSummary, StoreError> record_result(const MatchReport& report);

    /**
     * Rating and streak for display. Guests and the AI have none.
     */
    std::optional<PlayerRecord> stats_for(const Identity& identity);

    [[nodiscard]] static bool is_recordable(const MatchReport& report) noexcept;

    /**
     * Elo exchange with K = 32, rounded, floored at zero.
     * @return {new winner rating, new loser rating}
     */
    static std::pair<int, int> exchange_ratings(int winner_rating, int loser_rating);

private:
    MatchStore& store_;
    std::mutex mutex_;
};

} // namespace uttt
