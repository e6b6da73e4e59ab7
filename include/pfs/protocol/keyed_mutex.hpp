#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pfs::protocol {

/**
 * @brief One mutex per string key, created on demand.
 *
 * An entry lives only while some Guard references it, so the map does not grow with the
 * number of conversations ever seen.
 */
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class KeyedMutex;
        Guard(KeyedMutex* owner, std::string key) noexcept
            : owner_(owner), key_(std::move(key)) {}

        KeyedMutex* owner_;
        std::string key_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    [[nodiscard]] Guard Lock(const std::string& key);

    /// Number of keys currently held or waited on.
    [[nodiscard]] size_t ActiveKeys() const;

private:
    struct Entry {
        std::mutex mutex;
        size_t references = 0;
    };

    void Release(const std::string& key) noexcept;

    mutable std::mutex entries_lock_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}
