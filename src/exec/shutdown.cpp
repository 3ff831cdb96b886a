/*
 * Process-wide shutdown - ShellBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellbridge/exec/shutdown.hpp>

namespace shellbridge {

bool ShutdownCoordinator::shutdown() {
    if (m_done.exchange(true)) return false;
    m_executor.shutdown();
    m_logger.dispose();
    return true;
}

} // namespace shellbridge
