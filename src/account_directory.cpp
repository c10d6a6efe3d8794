//
//  account_directory.cpp
//  uttt - Identity provider implementation
//

#include "account_directory.hpp"
#include "util/log.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace uttt {

const char* account_error_to_string(AccountError error) {
    switch (error) {
        case AccountError::FileReadFailed:
            return "Failed to read accounts file";
        case AccountError::JsonParseFailed:
            return "Failed to parse accounts file";
        case AccountError::InvalidEntry:
            return "Account entry needs a non-empty id and name";
        default:
            return "Unknown error";
    }
}

InMemoryAccountDirectory::InMemoryAccountDirectory(uint64_t seed) : rng_(seed) {}

std::expected<size_t, AccountError> InMemoryAccountDirectory::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(AccountError::FileReadFailed);
    }

    std::unordered_map<std::string, std::string> loaded;
    try {
        auto data = nlohmann::json::parse(file);
        for (const auto& user : data.at("users")) {
            auto id = user.at("id").get<std::string>();
            auto name = user.value("name", id);
            // The computer seat's id is reserved
            if (id.empty() || name.empty() || id == AI_IDENTITY) {
                return std::unexpected(AccountError::InvalidEntry);
            }
            loaded[id] = name;
        }
    } catch (const nlohmann::json::exception& e) {
        log::error("Cannot parse {}: {}", path.string(), e.what());
        return std::unexpected(AccountError::JsonParseFailed);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, name] : loaded) {
        names_[id] = std::move(name);
    }
    return loaded.size();
}

void InMemoryAccountDirectory::add(const std::string& id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    names_[id] = name;
}

std::optional<Identity> InMemoryAccountDirectory::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = names_.find(id);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return Identity{it->first, it->second, IdentityKind::Registered};
}

Identity InMemoryAccountDirectory::create_guest() {
    static constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<size_t> dist(0, alphabet.size() - 1);
    std::string id;
    id.reserve(GUEST_ID_LENGTH);
    for (size_t i = 0; i < GUEST_ID_LENGTH; ++i) {
        id.push_back(alphabet[dist(rng_)]);
    }
    return Identity{id, "Guest_" + id.substr(0, GUEST_NAME_PREFIX), IdentityKind::Guest};
}

size_t InMemoryAccountDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return names_.size();
}

} // namespace uttt
