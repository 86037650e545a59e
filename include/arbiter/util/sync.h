// ARBITER - Synchronization Primitives
// Copyright (c) 2024 ARBITER Developers
// MIT License

#ifndef ARBITER_UTIL_SYNC_H
#define ARBITER_UTIL_SYNC_H

#include <atomic>
#include <mutex>
#include <thread>

namespace arbiter {
namespace util {

/**
 * Mutex that refuses re-entry from the thread already holding it.
 *
 * Other threads block until the holder releases. A holder that calls back
 * into a guarded entry point (for example from an external callback) gets
 * a failed TryEnter instead of a deadlock or a nested mutation.
 */
class NonReentrantMutex {
public:
    NonReentrantMutex() = default;

    NonReentrantMutex(const NonReentrantMutex&) = delete;
    NonReentrantMutex& operator=(const NonReentrantMutex&) = delete;

    /// Acquire; false if the calling thread already holds the mutex
    bool TryEnter() {
        if (HeldByCurrentThread()) {
            return false;
        }
        mutex_.lock();
        owner_.store(std::this_thread::get_id());
        return true;
    }

    void Leave() {
        owner_.store(std::thread::id());
        mutex_.unlock();
    }

    bool HeldByCurrentThread() const {
        return owner_.load() == std::this_thread::get_id();
    }

private:
    std::mutex mutex_;
    std::atomic<std::thread::id> owner_{};
};

/**
 * RAII holder for NonReentrantMutex. When entered() is false the calling
 * thread already holds the mutex: mutating callers must fail, read-only
 * callers may proceed.
 */
class NonReentrantGuard {
public:
    explicit NonReentrantGuard(NonReentrantMutex& mutex)
        : mutex_(mutex), entered_(mutex.TryEnter()) {}

    ~NonReentrantGuard() {
        if (entered_) {
            mutex_.Leave();
        }
    }

    NonReentrantGuard(const NonReentrantGuard&) = delete;
    NonReentrantGuard& operator=(const NonReentrantGuard&) = delete;

    /// False when the acquisition was refused as re-entrant
    bool entered() const { return entered_; }

private:
    NonReentrantMutex& mutex_;
    bool entered_;
};

} // namespace util
} // namespace arbiter

#endif // ARBITER_UTIL_SYNC_H
