#pragma once

#include <atomic>
#include <memory>

namespace bulbs::core {

/**
 * @brief Shared cancel flag handed to a dispatch.
 *
 * Copies share the same flag, so the front-end keeps one copy and cancels
 * from any thread (e.g. a signal-watching thread) while workers poll theirs.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace bulbs::core
