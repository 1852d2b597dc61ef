#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace engram {

/**
 * One mutex per key, created on first use and dropped when the last holder or
 * waiter for the key releases it. Holders of the same key serialize; different
 * keys proceed independently. Each store owns its own instance.
 */
class KeyedMutex {
public:
    class Lock {
    public:
        Lock(KeyedMutex* owner, std::string key, std::shared_ptr<std::mutex> mutex);
        Lock(Lock&& other) noexcept;
        Lock& operator=(Lock&& other) noexcept;
        ~Lock();

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        void release();

        KeyedMutex* owner_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    Lock acquire(const std::string& key);

    size_t key_count() const;

private:
    void release(const std::string& key, std::shared_ptr<std::mutex>& mutex);

    mutable std::mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace engram
