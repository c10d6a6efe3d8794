//
//  account_directory.hpp
//  uttt - Identity provider: registered accounts and guest identities
//

#pragma once

#include "player.hpp"

#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace uttt {

enum class AccountError {
    FileReadFailed,
    JsonParseFailed,
    InvalidEntry
};

const char* account_error_to_string(AccountError error);

inline constexpr size_t GUEST_ID_LENGTH = 10;
inline constexpr size_t GUEST_NAME_PREFIX = 5;

class AccountDirectory {
public:
    virtual ~AccountDirectory() = default;

    /**
     * Resolves a registered account id to its identity.
     */
    virtual std::optional<Identity> find(const std::string& id) const = 0;

    /**
     * Mints a new guest identity: 10 characters of A-Z0-9, shown as
     * Guest_<first 5>.
     */
    virtual Identity create_guest() = 0;
};

class InMemoryAccountDirectory : public AccountDirectory {
public:
    explicit InMemoryAccountDirectory(uint64_t seed = std::random_device{}());

    /**
     * Loads {"users": [{"id": ..., "name": ...}]}. Existing entries with the
     * same id are replaced.
     */
    std::expected<size_t, AccountError> load_file(const std::filesystem::path& path);

    void add(const std::string& id, const std::string& name);

    std::optional<Identity> find(const std::string& id) const override;
    Identity create_guest() override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> names_;
    std::mt19937_64 rng_;
};

} // namespace uttt
