#include "stockline/durable_store.hpp"
#include "stockline/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace stockline {

namespace fs = std::filesystem;

namespace {

// Keys look like "cache/items"; flatten them into file names.
std::string file_name_for(const std::string& key) {
    std::string name;
    name.reserve(key.size() + 5);
    for (char c : key) {
        name.push_back(c == '/' ? '.' : c);
    }
    return name + ".json";
}

std::string key_for(const std::string& file_name) {
    std::string key = file_name.substr(0, file_name.size() - 5);
    for (auto& c : key) {
        if (c == '.') c = '/';
    }
    return key;
}

void check_quota(size_t used, size_t replaced, size_t incoming, size_t capacity,
                 const std::string& key) {
    if (used - replaced + incoming > capacity) {
        throw StorageError("Storage quota exceeded writing " + key + " (" +
                           std::to_string(used - replaced + incoming) + " of " +
                           std::to_string(capacity) + " bytes)");
    }
}

std::string errno_text() {
    return std::strerror(errno);
}

// Writes the whole buffer and forces it to disk before returning.
void write_synced(const fs::path& path, const std::string& value) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("Cannot open " + path.string() + ": " + errno_text());
    }

    const char* data = value.data();
    size_t left = value.size();
    while (left > 0) {
        ssize_t written = ::write(fd, data, left);
        if (written < 0) {
            if (errno == EINTR) continue;
            auto reason = errno_text();
            ::close(fd);
            throw StorageError("Write failed for " + path.string() + ": " + reason);
        }
        data += written;
        left -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        auto reason = errno_text();
        ::close(fd);
        throw StorageError("Sync failed for " + path.string() + ": " + reason);
    }
    if (::close(fd) != 0) {
        throw StorageError("Close failed for " + path.string() + ": " + errno_text());
    }
}

// Makes a completed rename durable.
void sync_directory(const fs::path& directory) {
    int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw StorageError("Cannot open " + directory.string() + ": " + errno_text());
    }
    int rc = ::fsync(fd);
    auto reason = rc != 0 ? errno_text() : std::string();
    ::close(fd);
    if (rc != 0) {
        throw StorageError("Sync failed for " + directory.string() + ": " + reason);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FileStore
// ---------------------------------------------------------------------------

FileStore::FileStore(fs::path directory, size_t capacity_bytes)
    : directory_(std::move(directory)), capacity_(capacity_bytes) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StorageError("Cannot create " + directory_.string() + ": " + ec.message());
    }

    for (const auto& entry : fs::directory_iterator(directory_)) {
        if (!entry.is_regular_file()) continue;
        auto name = entry.path().filename().string();
        if (name.size() <= 5 || name.compare(name.size() - 5, 5, ".json") != 0) continue;
        sizes_[key_for(name)] = static_cast<size_t>(entry.file_size());
    }
}

fs::path FileStore::path_for(const std::string& key) const {
    return directory_ / file_name_for(key);
}

std::optional<std::string> FileStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path_for(key), std::ios::binary);
    if (!in) return std::nullopt;

    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void FileStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = sizes_.find(key);
    size_t replaced = existing != sizes_.end() ? existing->second : 0;
    size_t used = 0;
    for (const auto& [_, size] : sizes_) used += size;
    check_quota(used, replaced, value.size(), capacity_, key);

    auto target = path_for(key);
    auto temp = target;
    temp += ".tmp";
    std::error_code ec;
    try {
        write_synced(temp, value);
    } catch (const StorageError&) {
        fs::remove(temp, ec);
        throw;
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw StorageError("Cannot replace " + target.string());
    }
    sizes_[key] = value.size();
    sync_directory(directory_);
}

void FileStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        throw StorageError("Cannot remove " + path_for(key).string() + ": " + ec.message());
    }
    sizes_.erase(key);
}

size_t FileStore::usage_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t used = 0;
    for (const auto& [_, size] : sizes_) used += size;
    return used;
}

// ---------------------------------------------------------------------------
// MemoryStore
// ---------------------------------------------------------------------------

std::optional<std::string> MemoryStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = values_.find(key);
    size_t replaced = existing != values_.end() ? existing->second.size() : 0;
    size_t used = 0;
    for (const auto& [_, stored] : values_) used += stored.size();
    check_quota(used, replaced, value.size(), capacity_, key);
    values_[key] = value;
}

void MemoryStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

size_t MemoryStore::usage_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t used = 0;
    for (const auto& [_, stored] : values_) used += stored.size();
    return used;
}

void MemoryStore::set_capacity(size_t capacity_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity_bytes;
}

} // namespace stockline
