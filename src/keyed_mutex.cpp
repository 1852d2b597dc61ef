#include "engram/keyed_mutex.hpp"

namespace engram {

KeyedMutex::Lock::Lock(KeyedMutex* owner, std::string key, std::shared_ptr<std::mutex> mutex)
    : owner_(owner)
    , key_(std::move(key))
    , mutex_(std::move(mutex))
    , lock_(*mutex_) {}

KeyedMutex::Lock::Lock(Lock&& other) noexcept
    : owner_(other.owner_)
    , key_(std::move(other.key_))
    , mutex_(std::move(other.mutex_))
    , lock_(std::move(other.lock_)) {
    other.owner_ = nullptr;
}

KeyedMutex::Lock& KeyedMutex::Lock::operator=(Lock&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        key_ = std::move(other.key_);
        mutex_ = std::move(other.mutex_);
        lock_ = std::move(other.lock_);
        other.owner_ = nullptr;
    }
    return *this;
}

KeyedMutex::Lock::~Lock() {
    release();
}

void KeyedMutex::Lock::release() {
    if (owner_ == nullptr) {
        return;
    }
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    owner_->release(key_, mutex_);
    owner_ = nullptr;
}

KeyedMutex::Lock KeyedMutex::acquire(const std::string& key) {
    std::shared_ptr<std::mutex> mutex;
    {
        std::lock_guard<std::mutex> guard(registry_mutex_);
        auto& slot = mutexes_[key];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        mutex = slot;
    }
    // Registry lock is released before blocking on the key.
    return Lock(this, key, std::move(mutex));
}

void KeyedMutex::release(const std::string& key, std::shared_ptr<std::mutex>& mutex) {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    // Waiters copy the pointer under the registry lock, so a count of two
    // (the map and this holder) means nobody else holds or waits on the key.
    auto it = mutexes_.find(key);
    if (it != mutexes_.end() && it->second == mutex && mutex.use_count() == 2) {
        mutexes_.erase(it);
    }
    mutex.reset();
}

size_t KeyedMutex::key_count() const {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    return mutexes_.size();
}

} // namespace engram
