#pragma once
/**
 * @file kv_store.hpp
 * @brief Small key/value persistence used for session state and the robot directory.
 *
 * @details
 * Values are opaque strings (callers store JSON text or plain tokens).
 * Each key is independent: a failed or torn write of one key never touches
 * another. Keys used by the library:
 *
 *   paired_robots         JSON array of StoredRobotRecord
 *   robot_base_url        last chosen base URL
 *   robot_control_token   control token (secret)
 *   robot_session_id      session id
 *   active_robot_id       robot id of the current session, if paired
 *   device_id             per-installation identifier
 *
 * Implementations:
 *   FileStore    one file per key under a directory, `<dir>/<key>.json`,
 *                written via temp file + rename.
 *   MemoryStore  process-local map, for tests and ephemeral runs.
 */

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace rovy {

namespace keys {
constexpr const char* PAIRED_ROBOTS   = "paired_robots";
constexpr const char* BASE_URL        = "robot_base_url";
constexpr const char* CONTROL_TOKEN   = "robot_control_token";
constexpr const char* SESSION_ID      = "robot_session_id";
constexpr const char* ACTIVE_ROBOT_ID = "active_robot_id";
constexpr const char* DEVICE_ID       = "device_id";
} // namespace keys

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// Value for key, or nullopt when absent or unreadable.
    virtual std::optional<std::string> get(const std::string& key) = 0;
    /// Returns false when the value could not be persisted.
    virtual bool put(const std::string& key, const std::string& value) = 0;
    /// Removing an absent key succeeds.
    virtual bool erase(const std::string& key) = 0;
};

class FileStore : public KeyValueStore {
public:
    explicit FileStore(std::filesystem::path dir);

    std::optional<std::string> get(const std::string& key) override;
    bool put(const std::string& key, const std::string& value) override;
    bool erase(const std::string& key) override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path dir_;
    std::mutex mu_;
};

class MemoryStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    bool put(const std::string& key, const std::string& value) override;
    bool erase(const std::string& key) override;

    /// Test hook: make every subsequent put() fail.
    void set_read_only(bool ro) { read_only_ = ro; }
    size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
    bool read_only_ = false;
    std::mutex mu_;
};

} // namespace rovy
