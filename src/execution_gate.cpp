#include "execution_gate.h"
#include <algorithm>

namespace calcrun {

ExecutionGate::ExecutionGate(int max_concurrent) : max_concurrent_(std::max(1, max_concurrent)) {}

void ExecutionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    slot_free_.wait(lock, [this] { return active_ < max_concurrent_; });
    ++active_;
}

bool ExecutionGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ >= max_concurrent_) {
        return false;
    }
    ++active_;
    return true;
}

void ExecutionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) --active_;
    }
    slot_free_.notify_one();
}

int ExecutionGate::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

ExecutionGate::Slot::Slot(ExecutionGate& gate) : gate_(gate) {
    auto start = std::chrono::steady_clock::now();
    gate_.acquire();
    waited_ = std::chrono::steady_clock::now() - start;
}

ExecutionGate::Slot::~Slot() {
    gate_.release();
}

} // namespace calcrun
