/*
 * Cooperative cancellation - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <atomic>
#include <memory>

namespace shellbridge {

// Shared between the caller and the run(s) it started. Checked by the
// executor at each wait step; triggering it takes the grace-kill path.
class CancellationToken {
public:
    void cancel() noexcept { m_cancelled.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    static std::shared_ptr<CancellationToken> create() { return std::make_shared<CancellationToken>(); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace shellbridge
