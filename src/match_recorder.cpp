//
//  match_recorder.cpp
//  uttt - Match recording and JSON persistence
//

#include "match_recorder.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>

namespace uttt {

const char* store_error_to_string(StoreError error) {
    switch (error) {
        case StoreError::DirectoryCreationFailed:
            return "Failed to create data directory";
        case StoreError::FileReadFailed:
            return "Failed to read JSON file";
        case StoreError::FileWriteFailed:
            return "Failed to write JSON file";
        case StoreError::JsonParseFailed:
            return "Failed to parse JSON data";
        case StoreError::JsonSerializationFailed:
            return "Failed to serialize JSON data";
        default:
            return "Unknown error";
    }
}

//===============================================================================
// JSON CONVERSION
//===============================================================================

namespace {

std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(when));
}

PlayerRecord player_record_from_json(const json& data) {
    PlayerRecord record;
    record.id = data.at("id").get<std::string>();
    record.rating = data.value("rating", DEFAULT_RATING);
    record.win_streak = data.value("win_streak", 0);
    record.best_streak = data.value("best_streak", 0);
    return record;
}

} // namespace

json player_record_to_json(const PlayerRecord& record) {
    return {
        {"id", record.id},
        {"rating", record.rating},
        {"win_streak", record.win_streak},
        {"best_streak", record.best_streak}
    };
}

json match_record_to_json(const MatchRecord& record) {
    json moves = json::array();
    for (const auto& move : record.moves) {
        moves.push_back({
            {"board", move.board},
            {"cell", move.cell},
            {"player", std::string(player_to_string(move.player))}
        });
    }

    return {
        {"version", "1.0"},
        {"room", record.room},
        {"players", {{"X", record.x_id}, {"O", record.o_id}}},
        {"winner", record.winner_id ? json(*record.winner_id) : json(nullptr)},
        {"draw", record.draw},
        {"ranked", record.ranked},
        {"reason", end_reason_to_string(record.reason)},
        {"played_at", iso_timestamp(record.played_at)},
        {"moves", moves}
    };
}

//===============================================================================
// IN-MEMORY STORE
//===============================================================================

std::expected<PlayerRecord, StoreError> InMemoryMatchStore::load_player(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(id);
    if (it == players_.end()) {
        return PlayerRecord{id};
    }
    return it->second;
}

std::expected<void, StoreError> InMemoryMatchStore::save_players(const std::vector<PlayerRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
        return std::unexpected(StoreError::FileWriteFailed);
    }
    for (const auto& record : records) {
        players_[record.id] = record;
    }
    ++writes_;
    return {};
}

std::expected<void, StoreError> InMemoryMatchStore::append_match(const MatchRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
        return std::unexpected(StoreError::FileWriteFailed);
    }
    matches_.push_back(record);
    ++writes_;
    return {};
}

std::vector<MatchRecord> InMemoryMatchStore::matches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return matches_;
}

size_t InMemoryMatchStore::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

//===============================================================================
// JSON FILE STORE
//===============================================================================

JsonFileMatchStore::JsonFileMatchStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::expected<void, StoreError> JsonFileMatchStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        std::filesystem::create_directories(directory_ / "matches");
    } catch (const std::filesystem::filesystem_error& e) {
        log::error("Cannot create {}: {}", directory_.string(), e.what());
        return std::unexpected(StoreError::DirectoryCreationFailed);
    }

    auto players_path = directory_ / "players.json";
    if (!std::filesystem::exists(players_path)) {
        return {};
    }

    std::ifstream file(players_path);
    if (!file.is_open()) {
        return std::unexpected(StoreError::FileReadFailed);
    }

    try {
        json data = json::parse(file);
        for (const auto& entry : data.at("players")) {
            auto record = player_record_from_json(entry);
            players_[record.id] = record;
        }
    } catch (const json::exception& e) {
        log::error("Cannot parse {}: {}", players_path.string(), e.what());
        return std::unexpected(StoreError::JsonParseFailed);
    }

    log::info("Loaded {} player records from {}", players_.size(), players_path.string());
    return {};
}

std::expected<PlayerRecord, StoreError> JsonFileMatchStore::load_player(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(id);
    if (it == players_.end()) {
        return PlayerRecord{id};
    }
    return it->second;
}

std::expected<void, StoreError> JsonFileMatchStore::save_players(const std::vector<PlayerRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto updated = players_;
    for (const auto& record : records) {
        updated[record.id] = record;
    }

    json data;
    try {
        json list = json::array();
        for (const auto& [id, record] : updated) {
            list.push_back(player_record_to_json(record));
        }
        data["version"] = "1.0";
        data["players"] = std::move(list);
    } catch (const json::exception& e) {
        log::error("Cannot serialize player records: {}", e.what());
        return std::unexpected(StoreError::JsonSerializationFailed);
    }

    auto result = write_json_file(directory_ / "players.json", data);
    if (result) {
        players_ = std::move(updated);
    }
    return result;
}

std::expected<void, StoreError> JsonFileMatchStore::append_match(const MatchRecord& record) {
    auto stamp = std::format("{:%Y%m%d-%H%M%S}",
                             std::chrono::floor<std::chrono::seconds>(record.played_at));
    auto matches_dir = directory_ / "matches";

    json data;
    try {
        data = match_record_to_json(record);
    } catch (const json::exception& e) {
        log::error("Cannot serialize match {}: {}", record.room, e.what());
        return std::unexpected(StoreError::JsonSerializationFailed);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Match files are write-once: a repeated room and second gets a numeric suffix
    auto path = matches_dir / std::format("{}-{}.json", stamp, record.room);
    std::error_code ec;
    for (int suffix = 1; std::filesystem::exists(path, ec) || ec; ++suffix) {
        if (ec) {
            log::error("Cannot inspect {}: {}", path.string(), ec.message());
            return std::unexpected(StoreError::FileWriteFailed);
        }
        path = matches_dir / std::format("{}-{}-{}.json", stamp, record.room, suffix);
    }
    return write_json_file(path, data);
}

std::expected<void, StoreError> JsonFileMatchStore::write_json_file(const std::filesystem::path& path,
                                                                     const json& data) {
    auto temp = path;
    temp += ".tmp";

    {
        std::ofstream file(temp);
        if (!file.is_open()) {
            log::error("Cannot open file for writing: {}", temp.string());
            return std::unexpected(StoreError::FileWriteFailed);
        }
        file << data.dump(2) << std::endl;
        if (file.fail()) {
            log::error("Failed to write to file: {}", temp.string());
            return std::unexpected(StoreError::FileWriteFailed);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        log::error("Failed to move {} into place: {}", path.string(), ec.message());
        return std::unexpected(StoreError::FileWriteFailed);
    }
    return {};
}

//===============================================================================
// RECORDER
//===============================================================================

bool MatchRecorder::is_recordable(const MatchReport& report) noexcept {
    if (!report.x || !report.o) {
        return false;
    }
    if (!report.x->is_registered() || !report.o->is_registered()) {
        return false;
    }
    return report.x->id != report.o->id && report.outcome != Result::Open;
}

std::pair<int, int> MatchRecorder::exchange_ratings(int winner_rating, int loser_rating) {
    double expected_winner = 1.0 / (1.0 + std::pow(10.0, (loser_rating - winner_rating) / 400.0));
    double expected_loser = 1.0 - expected_winner;

    int winner = static_cast<int>(std::lround(winner_rating + RATING_K_FACTOR * (1.0 - expected_winner)));
    int loser = static_cast<int>(std::lround(loser_rating + RATING_K_FACTOR * (0.0 - expected_loser)));
    return {std::max(0, winner), std::max(0, loser)};
}

std::expected<RecordSummary, StoreError> MatchRecorder::record_result(const MatchReport& report) {
    RecordSummary summary;
    if (!is_recordable(report)) {
        log::debug("Room {}: match not recorded (guest, AI or empty seat)", report.room);
        return summary;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto x = store_.load_player(report.x->id);
    if (!x) return std::unexpected(x.error());
    auto o = store_.load_player(report.o->id);
    if (!o) return std::unexpected(o.error());

    MatchRecord record;
    record.room = report.room;
    record.x_id = report.x->id;
    record.o_id = report.o->id;
    record.draw = report.outcome == Result::Draw;
    record.ranked = report.ranked;
    record.reason = report.reason;
    record.moves = report.moves;
    record.played_at = std::chrono::system_clock::now();

    summary.x = *x;
    summary.o = *o;

    if (is_win(report.outcome)) {
        bool x_won = report.outcome == Result::Cross;
        PlayerRecord& winner = x_won ? summary.x : summary.o;
        PlayerRecord& loser = x_won ? summary.o : summary.x;
        record.winner_id = winner.id;

        if (report.ranked) {
            auto [w, l] = exchange_ratings(winner.rating, loser.rating);
            winner.rating = w;
            loser.rating = l;
            summary.rated = true;
        }
        winner.win_streak += 1;
        winner.best_streak = std::max(winner.best_streak, winner.win_streak);
        loser.win_streak = 0;
    }

    if (auto appended = store_.append_match(record); !appended) {
        return std::unexpected(appended.error());
    }
    if (is_win(report.outcome)) {
        if (auto saved = store_.save_players({summary.x, summary.o}); !saved) {
            return std::unexpected(saved.error());
        }
    }

    summary.recorded = true;
    log::info("Room {}: recorded {} vs {}, {} ({}){}", report.room, record.x_id, record.o_id,
              record.winner_id.value_or("draw"), end_reason_to_string(report.reason),
              summary.rated ? " ranked" : "");
    return summary;
}

std::optional<PlayerRecord> MatchRecorder::stats_for(const Identity& identity) {
    if (!identity.is_registered()) {
        return std::nullopt;
    }
    auto record = store_.load_player(identity.id);
    if (!record) {
        log::warn("Cannot load stats for {}: {}", identity.id, store_error_to_string(record.error()));
        return std::nullopt;
    }
    return *record;
}

} // namespace uttt
