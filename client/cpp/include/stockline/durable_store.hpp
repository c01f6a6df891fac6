#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace stockline {

/**
 * Key/value storage that survives a restart.
 *
 * put() either stores the whole value or throws StorageError; there is no
 * partially written state visible to get().
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;

    /**
     * @throws StorageError when the quota would be exceeded or the write fails
     */
    virtual void put(const std::string& key, const std::string& value) = 0;

    virtual void erase(const std::string& key) = 0;

    /// Bytes currently held across all keys.
    virtual size_t usage_bytes() const = 0;

    /// Bytes this store is allowed to hold.
    virtual size_t capacity_bytes() const = 0;
};

/**
 * One file per key under a directory. Writes go to a temporary file that is
 * fsynced and renamed over the target; the directory is fsynced after the
 * rename.
 */
class FileStore : public DurableStore {
public:
    FileStore(std::filesystem::path directory, size_t capacity_bytes);

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void erase(const std::string& key) override;
    size_t usage_bytes() const override;
    size_t capacity_bytes() const override { return capacity_; }

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path directory_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<std::string, size_t> sizes_;
};

/**
 * Process-local store with the same quota rule as FileStore.
 */
class MemoryStore : public DurableStore {
public:
    explicit MemoryStore(size_t capacity_bytes = 5 * 1024 * 1024)
        : capacity_(capacity_bytes) {}

    std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void erase(const std::string& key) override;
    size_t usage_bytes() const override;
    size_t capacity_bytes() const override { return capacity_; }

    void set_capacity(size_t capacity_bytes);

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

} // namespace stockline
