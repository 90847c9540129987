#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace calcrun {

// Bounds the number of sandboxed processes alive at once
class ExecutionGate {
public:
    explicit ExecutionGate(int max_concurrent);

    // Held for the lifetime of one run; releases its slot on destruction
    class Slot {
    public:
        explicit Slot(ExecutionGate& gate);
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        // Time spent waiting for the slot
        std::chrono::steady_clock::duration waited() const { return waited_; }

    private:
        ExecutionGate& gate_;
        std::chrono::steady_clock::duration waited_;
    };

    void acquire();
    void release();

    // Non-blocking acquire
    bool try_acquire();

    int active() const;
    int capacity() const { return max_concurrent_; }

private:
    int max_concurrent_;
    int active_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable slot_free_;
};

} // namespace calcrun
