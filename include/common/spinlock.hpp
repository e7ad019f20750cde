#pragma once
#include <atomic>
#include <thread>

namespace knntune {

    // Busy-waiting lock for the tuner's result list.
    // Each critical section is a single push_back, so spinning beats parking a thread.
    // Satisfies BasicLockable, so std::lock_guard<SpinLock> works.
    class SpinLock {
    public:
        void lock() {
            while (flag_.test_and_set(std::memory_order_acquire)) {
                #if defined(__x86_64__) || defined(__i386__)
                    __builtin_ia32_pause();
                #else
                    std::this_thread::yield();
                #endif
            }
        }

        bool try_lock() {
            return !flag_.test_and_set(std::memory_order_acquire);
        }

        void unlock() {
            flag_.clear(std::memory_order_release);
        }

    private:
        std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
    };

} // namespace knntune
