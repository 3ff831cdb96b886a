/*
 * Process-wide shutdown - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <shellbridge/exec/executor.hpp>
#include <shellbridge/log/logger.hpp>
#include <atomic>

namespace shellbridge {

// Runs the shutdown sequence once: executor (admissions closed, in-flight
// runs cancelled, tracked processes signalled), then the logger's final
// flush. The host calls shutdown() from its own signal handling.
class ShutdownCoordinator {
public:
    ShutdownCoordinator(Executor& executor, Logger& logger) : m_executor(executor), m_logger(logger) {}

    // True only for the call that performed the shutdown.
    bool shutdown();
    bool done() const { return m_done.load(); }

private:
    Executor& m_executor;
    Logger& m_logger;
    std::atomic<bool> m_done{false};
};

} // namespace shellbridge
